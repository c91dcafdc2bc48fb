#include "chunkrelay/upload_session.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace chunkrelay {

UploadSession::UploadSession(RemoteClient &client, ThrottleRetryHandler &retry, std::size_t total_parts,
                             std::size_t concurrency, std::string session_id)
    : client_(client), retry_(retry), session_id_(std::move(session_id)), total_parts_(total_parts),
      concurrency_(concurrency) {
    if (concurrency_ == 0) {
        throw std::invalid_argument("concurrency must be > 0");
    }
    if (total_parts_ == 0) {
        throw std::invalid_argument("upload session needs at least one part");
    }
    const auto workers = std::min(concurrency_, total_parts_);
    threads_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        threads_.emplace_back(&UploadSession::worker_thread, this);
    }
}

UploadSession::~UploadSession() { shutdown(); }

std::string UploadSession::new_session_id() {
    boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

void UploadSession::schedule(std::size_t index, std::vector<char> bytes) {
    if (index != next_index_ || index >= total_parts_) {
        throw std::invalid_argument("part " + std::to_string(index) + " scheduled out of order (expected " +
                                    std::to_string(next_index_) + " of " + std::to_string(total_parts_) + ")");
    }
    hash_.update(bytes);
    ++next_index_;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        progress_cv_.wait(lock, [&] { return failure_ || outstanding_ < concurrency_; });
        if (failure_) {
            throw *failure_;
        }
        queue_.push_back(ChunkTask{index, std::move(bytes)});
        ++outstanding_;
    }
    work_cv_.notify_one();
}

void UploadSession::await_completion() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        progress_cv_.wait(lock, [&] { return failure_ || outstanding_ == 0; });
    }
    shutdown();
    std::lock_guard<std::mutex> lock(mutex_);
    if (failure_) {
        throw *failure_;
    }
}

RemoteObjectHandle UploadSession::finalize(const std::string &display_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (acknowledged_ != total_parts_) {
        throw IncompleteSession(acknowledged_, total_parts_);
    }
    return RemoteObjectHandle(session_id_, total_parts_, display_name, hash_.hex());
}

std::size_t UploadSession::parts_acknowledged() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acknowledged_;
}

void UploadSession::worker_thread() {
    while (true) {
        ChunkTask task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [&] { return stop_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        upload(task);
    }
}

void UploadSession::upload(const ChunkTask &task) {
    std::optional<std::string> error;
    try {
        retry_.run_with_retries("part " + std::to_string(task.index) + " of session " + session_id_, [&] {
            client_.upload_part(session_id_, task.index, total_parts_, task.data);
        });
    } catch (const std::exception &e) {
        error = e.what();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --outstanding_;
        if (!error) {
            ++acknowledged_;
        } else if (!failure_) {
            std::cerr << "session " << session_id_ << ": part " << task.index << " failed: " << *error
                      << std::endl;
            failure_.emplace(task.index, *error);
            outstanding_ -= queue_.size();
            queue_.clear();
        }
    }
    progress_cv_.notify_all();
}

void UploadSession::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        outstanding_ -= queue_.size();
        queue_.clear();
    }
    work_cv_.notify_all();
    for (auto &thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace chunkrelay
