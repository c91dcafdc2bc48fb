#pragma once

#include "chunkrelay/chunk_source.hpp"
#include "chunkrelay/content_hash.hpp"
#include "chunkrelay/errors.hpp"
#include "chunkrelay/remote_client.hpp"
#include "chunkrelay/throttle_retry.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chunkrelay {

// Re-uploads one object's parts on a pool of at most `concurrency` workers and
// reassembles them into a RemoteObjectHandle. schedule() holds the caller back
// only while `concurrency` parts are already outstanding, which caps buffered
// payload at concurrency * chunk size.
class UploadSession {
  public:
    UploadSession(RemoteClient &client, ThrottleRetryHandler &retry, std::size_t total_parts,
                  std::size_t concurrency, std::string session_id = new_session_id());
    ~UploadSession();

    UploadSession(const UploadSession &) = delete;
    UploadSession &operator=(const UploadSession &) = delete;

    // Throws PartUploadFailed once any part has failed, so the caller stops
    // reading the object.
    void schedule(std::size_t index, std::vector<char> bytes);

    // Throws PartUploadFailed for the first part that could not be delivered.
    void await_completion();

    RemoteObjectHandle finalize(const std::string &display_name) const;

    const std::string &session_id() const noexcept { return session_id_; }

    std::size_t total_parts() const noexcept { return total_parts_; }

    std::size_t parts_acknowledged() const;

    std::string content_hash_hex() const { return hash_.hex(); }

    static std::string new_session_id();

  private:
    void worker_thread();
    void upload(const ChunkTask &task);
    void shutdown();

    RemoteClient &client_;
    ThrottleRetryHandler &retry_;
    std::string session_id_;
    std::size_t total_parts_;
    std::size_t concurrency_;
    ContentHash hash_;
    std::size_t next_index_{0};

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable progress_cv_;
    std::deque<ChunkTask> queue_;
    std::size_t outstanding_{0};
    std::size_t acknowledged_{0};
    std::optional<PartUploadFailed> failure_;
    bool stop_{false};
    std::vector<std::thread> threads_;
};

} // namespace chunkrelay
