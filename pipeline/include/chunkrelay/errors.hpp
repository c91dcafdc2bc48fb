#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace chunkrelay {

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

// Remote-imposed pacing. Always replayed after wait(), never an item failure.
class ThrottleError : public Error {
  public:
    ThrottleError(std::chrono::seconds wait, const std::string &msg)
        : Error(msg), wait_(wait) {}

    std::chrono::seconds wait() const noexcept { return wait_; }

  private:
    std::chrono::seconds wait_;
};

class TransientError : public Error {
  public:
    explicit TransientError(const std::string &msg) : Error(msg) {}
};

class FatalError : public Error {
  public:
    explicit FatalError(const std::string &msg) : Error(msg) {}
};

class PartUploadFailed : public Error {
  public:
    PartUploadFailed(std::size_t index, const std::string &reason)
        : Error("part " + std::to_string(index) + " upload failed: " + reason), index_(index) {}

    std::size_t index() const noexcept { return index_; }

  private:
    std::size_t index_;
};

class IncompleteSession : public Error {
  public:
    IncompleteSession(std::size_t acknowledged, std::size_t total)
        : Error("upload session incomplete: " + std::to_string(acknowledged) + "/" +
                std::to_string(total) + " parts acknowledged"),
          acknowledged_(acknowledged), total_(total) {}

    std::size_t acknowledged() const noexcept { return acknowledged_; }
    std::size_t total() const noexcept { return total_; }

  private:
    std::size_t acknowledged_;
    std::size_t total_;
};

class CheckpointError : public Error {
  public:
    explicit CheckpointError(const std::string &msg) : Error(msg) {}
};

class ConfigError : public Error {
  public:
    explicit ConfigError(const std::string &msg) : Error(msg) {}
};

} // namespace chunkrelay
