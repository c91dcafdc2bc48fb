#include "chunkrelay/checkpoint.hpp"

#include "chunkrelay/errors.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>

namespace chunkrelay {

namespace {

std::string describe_errno(const std::string &what, const std::filesystem::path &path) {
    std::ostringstream oss;
    oss << what << " '" << path.string() << "': " << std::strerror(errno);
    return oss.str();
}

void write_all(int fd, const std::string &data, const std::filesystem::path &path) {
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t rc = ::write(fd, data.data() + written, data.size() - written);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw CheckpointError(describe_errno("checkpoint write failed", path));
        }
        written += static_cast<std::size_t>(rc);
    }
}

void sync_directory(const std::filesystem::path &dir) {
    int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        throw CheckpointError(describe_errno("failed to open checkpoint directory", dir));
    }
    int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        throw CheckpointError(describe_errno("failed to sync checkpoint directory", dir));
    }
}

} // namespace

Checkpoint::Checkpoint(std::filesystem::path path) : path_(std::move(path)) {
    if (path_.empty()) {
        throw std::invalid_argument("checkpoint path must not be empty");
    }
}

std::optional<ItemId> Checkpoint::load() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        if (ec) {
            throw CheckpointError("failed to stat checkpoint '" + path_.string() + "': " + ec.message());
        }
        last_.reset();
        return std::nullopt;
    }
    std::ifstream file(path_);
    if (!file) {
        throw CheckpointError("failed to open checkpoint '" + path_.string() + "'");
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    const auto first = content.find_first_not_of(" \t\r\n");
    const auto last = content.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) {
        throw CheckpointError("checkpoint '" + path_.string() + "' is empty");
    }
    const auto digits = content.substr(first, last - first + 1);
    std::size_t parsed = 0;
    ItemId id = 0;
    try {
        id = std::stoll(digits, &parsed);
    } catch (const std::exception &) {
        parsed = 0;
    }
    if (parsed != digits.size() || id < 0) {
        throw CheckpointError("checkpoint '" + path_.string() + "' is malformed: " + digits);
    }
    last_ = id;
    return last_;
}

void Checkpoint::save(ItemId id) {
    if (last_ && id < *last_) {
        throw CheckpointError("checkpoint would move backwards from " + std::to_string(*last_) + " to " +
                              std::to_string(id));
    }
    auto temp = path_;
    temp += ".tmp";
    int fd = ::open(temp.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        throw CheckpointError(describe_errno("failed to open checkpoint", temp));
    }
    try {
        write_all(fd, std::to_string(id) + "\n", temp);
        if (::fsync(fd) != 0) {
            throw CheckpointError(describe_errno("failed to sync checkpoint", temp));
        }
    } catch (const CheckpointError &) {
        ::close(fd);
        throw;
    }
    if (::close(fd) != 0) {
        throw CheckpointError(describe_errno("failed to close checkpoint", temp));
    }
    if (::rename(temp.c_str(), path_.c_str()) != 0) {
        throw CheckpointError(describe_errno("failed to replace checkpoint", path_));
    }
    sync_directory(path_.parent_path());
    last_ = id;
}

} // namespace chunkrelay
