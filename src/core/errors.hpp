#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace core {

// Base class for every failure the verification engine reports to its caller.
// Missing samples and undefined metrics are not errors and never land here.
class VerificationError : public std::runtime_error {
public:
  explicit VerificationError(const std::string &what)
      : std::runtime_error(what) {}
};

// A forecast/observation/probability batch whose lengths disagree. The batch
// is rejected as a whole and no accumulator state is touched.
class ShapeMismatchError : public VerificationError {
public:
  explicit ShapeMismatchError(const std::string &what)
      : VerificationError(what) {}
};

// Accumulator or run setup that cannot work, e.g. probabilities supplied to
// an accumulator without probability bins.
class ConfigurationError : public VerificationError {
public:
  explicit ConfigurationError(const std::string &what)
      : VerificationError(what) {}
};

// Two accumulators under the same key whose identity or configuration
// differ. Indicates a corrupted run; the merge step must abort.
class IncompatibleAccumulatorError : public VerificationError {
public:
  explicit IncompatibleAccumulatorError(const std::string &what)
      : VerificationError(what) {}
};

// A persisted snapshot that fails integrity validation.
class CheckpointCorruptError : public VerificationError {
public:
  explicit CheckpointCorruptError(const std::string &what)
      : VerificationError(what) {}
};

} // namespace core

#endif // ERRORS_HPP
