#include "parallel_runner.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

namespace workflow {

namespace {
const std::string &chunk_id_of(const ChunkTask &task) {
  return std::visit(
      [](const auto &chunk) -> const std::string & { return chunk.chunk_id; },
      task);
}
} // namespace

ParallelRunner::ParallelRunner(
    std::shared_ptr<const routing::ChunkRouter> router, VariableConfigs configs,
    RunnerOptions options, storage::CheckpointStore *store)
    : router_(std::move(router)), configs_(std::move(configs)),
      options_(options), store_(store) {
  if (options_.worker_threads == 0)
    throw core::ConfigurationError("parallel runner needs at least one worker");
  if (options_.checkpoint_interval_chunks > 0 && !store_)
    throw core::ConfigurationError(
        "periodic checkpoints requested without a checkpoint store");
}

ParallelRunner::~ParallelRunner() {
  if (started_ && !stopped_) {
    cancel();
    stop_workers();
  }
}

void ParallelRunner::restore(const storage::CheckpointRecord &record) {
  if (started_)
    throw std::logic_error("restore() must be called before start()");
  restored_ = record.accumulators;
  restored_completed_ = record.completed_chunk_ids;
  known_chunks_.insert(restored_completed_.begin(), restored_completed_.end());
  LOG(LogLevel::INFO, LogComponent::WORKFLOW,
      "Resuming from checkpoint #" << record.sequence_number << " with "
                                   << restored_completed_.size()
                                   << " completed chunks");
}

void ParallelRunner::start() {
  if (started_)
    throw std::logic_error("runner already started");
  started_ = true;

  for (size_t i = 0; i < options_.worker_threads; ++i) {
    auto worker = std::make_unique<Worker>();
    worker->processor = std::make_unique<ChunkProcessor>(router_, configs_);
    workers_.push_back(std::move(worker));
  }
  for (auto &worker : workers_) {
    Worker *w = worker.get();
    w->thread = std::thread([this, w] { worker_loop(*w); });
  }

  LOG(LogLevel::INFO, LogComponent::WORKFLOW,
      "Started " << workers_.size() << " workers");
}

bool ParallelRunner::submit(GridChunk chunk) {
  std::string chunk_id = chunk.chunk_id;
  return enqueue(chunk_id, ChunkTask(std::move(chunk)));
}

bool ParallelRunner::submit(StationChunk chunk) {
  std::string chunk_id = chunk.chunk_id;
  return enqueue(chunk_id, ChunkTask(std::move(chunk)));
}

bool ParallelRunner::enqueue(const std::string &chunk_id, ChunkTask task) {
  if (!started_ || stopped_)
    throw std::logic_error("submit() outside of a running pool");
  if (cancelled_)
    return false;

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!known_chunks_.insert(chunk_id).second) {
      ++stats_.skipped;
      LOG(LogLevel::DEBUG, LogComponent::WORKFLOW,
          "Chunk " << chunk_id << " already completed or queued, skipping");
      return false;
    }
    ++pending_;
    ++stats_.submitted;
  }

  if (!queue_.push(std::move(task))) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    --pending_;
    --stats_.submitted;
    known_chunks_.erase(chunk_id);
    idle_cv_.notify_all();
    return false;
  }

  if (options_.checkpoint_interval_chunks > 0 &&
      ++since_checkpoint_ >= options_.checkpoint_interval_chunks) {
    // The chunk is already queued; a failed periodic save must not look like
    // a rejected submission. The next interval tries again.
    try {
      checkpoint();
    } catch (const std::runtime_error &e) {
      since_checkpoint_ = 0;
      LOG(LogLevel::ERROR, LogComponent::WORKFLOW,
          "Periodic checkpoint failed: " << e.what());
      std::lock_guard<std::mutex> lock(state_mutex_);
      ++stats_.checkpoints_failed;
      last_checkpoint_error_ = e.what();
    }
  }
  return true;
}

void ParallelRunner::worker_loop(Worker &worker) {
  ChunkTask task;
  while (queue_.wait_and_pop(task)) {
    const std::string &chunk_id = chunk_id_of(task);
    ChunkStats chunk_stats;
    bool processed = false;
    std::optional<std::string> error;

    try {
      processed = std::visit(
          [&](const auto &chunk) {
            return worker.processor->process(chunk, &chunk_stats);
          },
          task);
    } catch (const core::VerificationError &e) {
      error = e.what();
    } catch (const std::exception &e) {
      error = std::string("unexpected error: ") + e.what();
    }

    if (error) {
      LOG(LogLevel::ERROR, LogComponent::WORKFLOW,
          "Chunk " << chunk_id << " failed: " << *error);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (error) {
      ++stats_.failed;
      failures_.push_back({chunk_id, *error});
    } else if (processed) {
      ++stats_.processed;
      stats_.samples_accepted += chunk_stats.accepted;
      stats_.samples_rejected += chunk_stats.rejected;
    } else {
      ++stats_.skipped;
    }
    if (--pending_ == 0)
      idle_cv_.notify_all();
  }
}

void ParallelRunner::wait_idle() {
  std::unique_lock<std::mutex> lock(state_mutex_);
  idle_cv_.wait(lock, [this] { return pending_ == 0; });
}

uint64_t ParallelRunner::checkpoint() {
  if (!store_)
    throw std::logic_error("checkpoint() without a checkpoint store");

  wait_idle();

  accumulation::AccumulatorSet snapshot = restored_;
  std::set<std::string> completed = restored_completed_;
  for (const auto &worker : workers_) {
    snapshot.merge_from(worker->processor->accumulators());
    const auto &done = worker->processor->completed_chunks();
    completed.insert(done.begin(), done.end());
  }

  uint64_t sequence = store_->save(snapshot, completed);
  since_checkpoint_ = 0;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++stats_.checkpoints_written;
  }
  return sequence;
}

void ParallelRunner::cancel() {
  cancelled_ = true;
  size_t dropped = queue_.clear();

  std::lock_guard<std::mutex> lock(state_mutex_);
  pending_ -= dropped;
  stats_.cancelled += dropped;
  if (pending_ == 0)
    idle_cv_.notify_all();

  LOG(LogLevel::WARN, LogComponent::WORKFLOW,
      "Run cancelled, " << dropped << " queued chunks dropped");
}

void ParallelRunner::stop_workers() {
  queue_.shutdown();
  for (auto &worker : workers_) {
    if (worker->thread.joinable())
      worker->thread.join();
  }
  stopped_ = true;
}

accumulation::AccumulatorSet ParallelRunner::finish() {
  if (!started_)
    throw std::logic_error("finish() before start()");
  if (!stopped_)
    stop_workers();

  std::vector<accumulation::AccumulatorSet> sets;
  sets.reserve(workers_.size() + 1);
  sets.push_back(restored_);
  for (const auto &worker : workers_)
    sets.push_back(worker->processor->accumulators());

  auto result = accumulation::merge_sets(sets, options_.merge_strategy);

  const RunStats final_stats = stats();
  LOG(LogLevel::INFO, LogComponent::WORKFLOW,
      "Run finished: processed=" << final_stats.processed
                                 << " skipped=" << final_stats.skipped
                                 << " failed=" << final_stats.failed
                                 << " accumulators=" << result.size());
  return result;
}

RunStats ParallelRunner::stats() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return stats_;
}

std::optional<std::string> ParallelRunner::last_checkpoint_error() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return last_checkpoint_error_;
}

std::vector<ChunkFailure> ParallelRunner::failures() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return failures_;
}

std::set<std::string> ParallelRunner::completed_chunks() {
  wait_idle();
  std::set<std::string> completed = restored_completed_;
  for (const auto &worker : workers_) {
    const auto &done = worker->processor->completed_chunks();
    completed.insert(done.begin(), done.end());
  }
  return completed;
}

} // namespace workflow
