#pragma once
#include <stdexcept>
#include <string>

namespace core {

// Base for failures that callers must tell apart from an empty result.
class DeclutterError : public std::runtime_error {
public:
  explicit DeclutterError(const std::string& msg) : std::runtime_error(msg) {}
};

// Input that cannot be processed at all (e.g. k > 0 on zero points).
class InvalidInputError : public DeclutterError {
public:
  explicit InvalidInputError(const std::string& msg) : DeclutterError(msg) {}
};

// A partition worker threw; the whole run is abandoned.
class WorkerFailureError : public DeclutterError {
public:
  WorkerFailureError(size_t partition, const std::string& msg)
    : DeclutterError("partition " + std::to_string(partition) + ": " + msg), partition_(partition) {}
  size_t partition() const { return partition_; }
private:
  size_t partition_;
};

// export requested for a key that was never written to the store.
class NoCachedDataError : public DeclutterError {
public:
  explicit NoCachedDataError(const std::string& key)
    : DeclutterError("no cached data for " + key), key_(key) {}
  const std::string& key() const { return key_; }
private:
  std::string key_;
};

} // namespace core
