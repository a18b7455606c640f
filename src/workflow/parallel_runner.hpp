#ifndef PARALLEL_RUNNER_HPP
#define PARALLEL_RUNNER_HPP

#include "accumulation/accumulator_set.hpp"
#include "accumulation/merger.hpp"
#include "chunk_processor.hpp"
#include "storage/checkpoint_store.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace workflow {

using ChunkTask = std::variant<GridChunk, StationChunk>;

struct RunnerOptions {
  size_t worker_threads = 4;
  // Save a checkpoint after this many submitted chunks, 0 disables
  uint64_t checkpoint_interval_chunks = 0;
  accumulation::MergeStrategy merge_strategy =
      accumulation::MergeStrategy::SEQUENTIAL;
};

struct RunStats {
  uint64_t submitted = 0;
  uint64_t processed = 0;
  uint64_t skipped = 0;
  uint64_t failed = 0;
  uint64_t cancelled = 0;
  uint64_t samples_accepted = 0;
  uint64_t samples_rejected = 0;
  uint64_t checkpoints_written = 0;
  uint64_t checkpoints_failed = 0;
};

struct ChunkFailure {
  std::string chunk_id;
  std::string message;
};

/**
 * Fixed pool of workers, each folding chunks into its own ChunkProcessor.
 *
 * `submit`, `checkpoint`, `cancel` and `finish` are meant to be driven from
 * one controlling thread. A checkpoint first waits until no chunk is queued
 * or in flight, so it holds exactly the chunks completed so far. A chunk that
 * fails validation is recorded in `failures()` and left out of the completed
 * set; the run goes on.
 */
class ParallelRunner {
public:
  // `store` may be null when no checkpoints are wanted; it must outlive the
  // runner otherwise.
  ParallelRunner(std::shared_ptr<const routing::ChunkRouter> router,
                 VariableConfigs configs, RunnerOptions options,
                 storage::CheckpointStore *store = nullptr);
  ~ParallelRunner();

  ParallelRunner(const ParallelRunner &) = delete;
  ParallelRunner &operator=(const ParallelRunner &) = delete;

  // Seeds the run with a loaded checkpoint. Only valid before start().
  void restore(const storage::CheckpointRecord &record);

  void start();

  // Returns false when the chunk id is already completed or submitted, or
  // the run was cancelled.
  bool submit(GridChunk chunk);
  bool submit(StationChunk chunk);

  // Blocks until every submitted chunk has been processed
  void wait_idle();

  // Quiesces the workers and saves the combined state. Returns the sequence
  // number. Throws std::logic_error without a store and std::runtime_error
  // when the save fails. Periodic checkpoints taken by submit() record a
  // failure in stats() and last_checkpoint_error() instead.
  uint64_t checkpoint();

  // Drops queued chunks; chunks already in flight still complete.
  void cancel();

  // Waits for the workers to drain the queue, joins them and reduces every
  // worker set (plus the restored one) with the merger.
  accumulation::AccumulatorSet finish();

  RunStats stats() const;
  std::vector<ChunkFailure> failures() const;
  std::optional<std::string> last_checkpoint_error() const;

  // Waits for idle workers first
  std::set<std::string> completed_chunks();

private:
  struct Worker {
    std::unique_ptr<ChunkProcessor> processor;
    std::thread thread;
  };

  bool enqueue(const std::string &chunk_id, ChunkTask task);
  void worker_loop(Worker &worker);
  void stop_workers();

  std::shared_ptr<const routing::ChunkRouter> router_;
  VariableConfigs configs_;
  RunnerOptions options_;
  storage::CheckpointStore *store_;

  accumulation::AccumulatorSet restored_;
  std::set<std::string> restored_completed_;
  std::set<std::string> known_chunks_;

  ThreadSafeQueue<ChunkTask> queue_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::atomic<bool> cancelled_{false};
  bool started_ = false;
  bool stopped_ = false;
  uint64_t since_checkpoint_ = 0;

  mutable std::mutex state_mutex_;
  std::condition_variable idle_cv_;
  size_t pending_ = 0;
  RunStats stats_;
  std::vector<ChunkFailure> failures_;
  std::optional<std::string> last_checkpoint_error_;
};

} // namespace workflow

#endif // PARALLEL_RUNNER_HPP
