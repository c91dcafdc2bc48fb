#include "chunkrelay/local_client.hpp"

#include "chunkrelay/content_hash.hpp"
#include "chunkrelay/errors.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace chunkrelay {

namespace {

std::string describe_errno(const std::string &what, const std::filesystem::path &path) {
    std::ostringstream oss;
    oss << what << " '" << path.string() << "': " << std::strerror(errno);
    return oss.str();
}

std::vector<std::string> split(const std::string &text, char separator, std::size_t max_fields) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (fields.size() + 1 < max_fields) {
        const auto pos = text.find(separator, start);
        if (pos == std::string::npos) {
            break;
        }
        fields.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    fields.push_back(text.substr(start));
    return fields;
}

std::optional<std::string> field_value(const std::string &field) {
    if (field.empty() || field == "-") {
        return std::nullopt;
    }
    return field;
}

std::string single_line(std::string text) {
    std::replace_if(
        text.begin(), text.end(), [](char c) { return c == '\t' || c == '\n' || c == '\r'; }, ' ');
    return text;
}

std::string safe_file_name(std::string name) {
    std::replace(name.begin(), name.end(), '/', '_');
    return single_line(std::move(name));
}

std::string crc_of_file(const std::filesystem::path &path, std::size_t buffer_size) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FatalError("failed to open assembled object '" + path.string() + "'");
    }
    ContentHash hash;
    std::vector<char> buffer(buffer_size);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read = file.gcount();
        if (read <= 0) {
            break;
        }
        hash.update(buffer.data(), static_cast<std::size_t>(read));
    }
    return hash.hex();
}

void write_file(const std::filesystem::path &path, const std::vector<char> &data) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.flush();
    if (!file) {
        throw FatalError("failed to write '" + path.string() + "'");
    }
}

std::size_t count_lines(const std::filesystem::path &path) {
    std::ifstream file(path);
    std::size_t lines = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty()) {
            ++lines;
        }
    }
    return lines;
}

void append_line(const std::filesystem::path &path, const std::string &line) {
    std::ofstream file(path, std::ios::app);
    file << line << '\n';
    file.flush();
    if (!file) {
        throw FatalError("failed to append to '" + path.string() + "'");
    }
}

// Parses the manifest one line at a time; ids must ascend.
class ManifestCursor : public ItemCursor {
  public:
    ManifestCursor(std::filesystem::path manifest, std::filesystem::path chat_dir, ItemId min_id)
        : manifest_(std::move(manifest)), chat_dir_(std::move(chat_dir)), file_(manifest_), min_id_(min_id) {
        if (!file_) {
            throw FatalError("failed to open manifest '" + manifest_.string() + "'");
        }
    }

    std::optional<Item> next() override {
        std::string line;
        while (std::getline(file_, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty() || line.front() == '#') {
                continue;
            }
            auto item = parse_manifest_line(line, chat_dir_);
            if (last_id_ && item.id <= *last_id_) {
                throw FatalError("manifest '" + manifest_.string() + "' is not in ascending id order at item " +
                                 std::to_string(item.id));
            }
            last_id_ = item.id;
            if (item.id > min_id_) {
                return item;
            }
        }
        if (file_.bad()) {
            throw FatalError("failed to read manifest '" + manifest_.string() + "'");
        }
        return std::nullopt;
    }

  private:
    std::filesystem::path manifest_;
    std::filesystem::path chat_dir_;
    std::ifstream file_;
    ItemId min_id_;
    std::optional<ItemId> last_id_;
};

class FileChunkStream : public ChunkStream {
  public:
    FileChunkStream(const std::filesystem::path &path, std::size_t chunk_size)
        : path_(path), file_(path, std::ios::binary), chunk_size_(chunk_size) {
        if (!file_) {
            throw FatalError("failed to open media '" + path.string() + "'");
        }
    }

    std::optional<std::vector<char>> next_chunk() override {
        std::vector<char> buffer(chunk_size_);
        file_.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (file_.bad()) {
            throw FatalError("read failed on media '" + path_.string() + "'");
        }
        buffer.resize(static_cast<std::size_t>(file_.gcount()));
        if (buffer.empty()) {
            return std::nullopt;
        }
        return buffer;
    }

  private:
    std::filesystem::path path_;
    std::ifstream file_;
    std::size_t chunk_size_;
};

} // namespace

Item parse_manifest_line(const std::string &line, const std::filesystem::path &chat_dir) {
    const auto fields = split(line, '\t', 7);
    if (fields.size() < 6) {
        throw FatalError("manifest line has " + std::to_string(fields.size()) + " fields: " + line);
    }
    Item item;
    std::size_t parsed = 0;
    try {
        item.id = std::stoll(fields[0], &parsed);
    } catch (const std::exception &) {
        parsed = 0;
    }
    if (parsed == 0 || parsed != fields[0].size() || item.id <= 0) {
        throw FatalError("manifest line has invalid id: " + line);
    }
    item.topic = field_value(fields[1]);
    MediaKind declared = MediaKind::None;
    try {
        declared = media_kind_from_string(fields[2]);
    } catch (const std::invalid_argument &e) {
        throw FatalError(std::string(e.what()) + " in manifest line: " + line);
    }
    if (fields.size() > 6) {
        item.text = field_value(fields[6]);
    }
    if (auto file = field_value(fields[3])) {
        const auto path = chat_dir / *file;
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec) {
            std::cerr << "item " << item.id << ": media '" << path.string() << "' unavailable: " << ec.message()
                      << std::endl;
        }
        std::vector<std::pair<std::string, std::string>> attributes;
        if (auto packed = field_value(fields[5])) {
            for (const auto &pair : split(*packed, ';', std::string::npos)) {
                const auto eq = pair.find('=');
                if (eq == std::string::npos) {
                    attributes.emplace_back(pair, "");
                } else {
                    attributes.emplace_back(pair.substr(0, eq), pair.substr(eq + 1));
                }
            }
        }
        item.media = make_media_descriptor(item.id, ec ? 0 : size, path.filename().string(),
                                           field_value(fields[4]).value_or(""), std::move(attributes));
        item.media_ref = path.string();
    }
    item.kind = classify(item.text, item.media, declared);
    return item;
}

LocalDirectoryClient::LocalDirectoryClient(std::filesystem::path source_root, std::filesystem::path dest_root,
                                           std::size_t chunk_size_bytes)
    : source_root_(std::move(source_root)), dest_root_(std::move(dest_root)), chunk_size_bytes_(chunk_size_bytes) {
    if (chunk_size_bytes_ == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
    std::filesystem::create_directories(dest_root_ / ".sessions");
}

std::unique_ptr<ItemCursor> LocalDirectoryClient::iterate_items(const ContainerId &container, ItemId min_id) {
    const auto dir = source_root_ / container;
    return std::make_unique<ManifestCursor>(dir / "manifest.tsv", dir, min_id);
}

std::vector<char> LocalDirectoryClient::read_small_object(const Item &item) {
    if (item.media_ref.empty()) {
        throw FatalError("item " + std::to_string(item.id) + " has no media");
    }
    std::ifstream file(item.media_ref, std::ios::binary);
    if (!file) {
        throw FatalError("failed to open media '" + item.media_ref + "'");
    }
    std::vector<char> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw FatalError("read failed on media '" + item.media_ref + "'");
    }
    return data;
}

std::unique_ptr<ChunkStream> LocalDirectoryClient::open_chunk_stream(const Item &item, std::size_t chunk_size) {
    if (item.media_ref.empty()) {
        throw FatalError("item " + std::to_string(item.id) + " has no media");
    }
    return std::make_unique<FileChunkStream>(item.media_ref, chunk_size);
}

void LocalDirectoryClient::upload_part(const std::string &session_id, std::size_t index, std::size_t total_parts,
                                       const std::vector<char> &bytes) {
    if (index >= total_parts || bytes.size() > chunk_size_bytes_) {
        throw FatalError("part " + std::to_string(index) + "/" + std::to_string(total_parts) + " of " +
                         std::to_string(bytes.size()) + " bytes rejected");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = session_parts_.emplace(session_id, total_parts).first;
        if (it->second != total_parts) {
            throw FatalError("session " + session_id + " declared " + std::to_string(it->second) +
                             " parts, got " + std::to_string(total_parts));
        }
    }
    const auto path = session_file(session_id);
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY, 0644);
    if (fd < 0) {
        throw FatalError(describe_errno("failed to open session file", path));
    }
    const auto offset = static_cast<off_t>(index) * static_cast<off_t>(chunk_size_bytes_);
    std::size_t written = 0;
    while (written < bytes.size()) {
        ssize_t rc = ::pwrite(fd, bytes.data() + written, bytes.size() - written,
                              offset + static_cast<off_t>(written));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int error = errno;
            const auto message = describe_errno("pwrite failed on", path);
            ::close(fd);
            if (error == EAGAIN) {
                throw TransientError(message);
            }
            throw FatalError(message);
        }
        written += static_cast<std::size_t>(rc);
    }
    if (::close(fd) != 0) {
        throw FatalError(describe_errno("failed to close session file", path));
    }
}

ItemId LocalDirectoryClient::send(const SendRequest &request) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto dir = chat_dir(request.container);
    const auto files_dir = dir / "files";
    std::filesystem::create_directories(files_dir);
    const auto message_id = next_message_id(request.container);

    std::string stored = "-";
    if (!std::holds_alternative<std::monostate>(request.body)) {
        stored = store_media(files_dir, message_id, request).filename().string();
    }
    std::ostringstream record;
    record << message_id << '\t' << request.reply_to.value_or("-") << '\t' << to_string(request.kind) << '\t'
           << stored << '\t' << (request.caption.empty() ? "-" : single_line(request.caption));
    append_line(dir / "messages.tsv", record.str());
    last_message_ids_[request.container] = message_id;
    return message_id;
}

void LocalDirectoryClient::discard_session(const std::string &session_id) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    session_parts_.erase(session_id);
    const auto path = session_file(session_id);
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        std::cerr << "failed to remove session file '" << path.string() << "': " << ec.message() << std::endl;
    }
}

ContainerId LocalDirectoryClient::create_topic(const ContainerId &container, const std::string &title) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto dir = chat_dir(container);
    std::filesystem::create_directories(dir);
    const auto topics = dir / "topics.tsv";
    const auto id = std::to_string(count_lines(topics) + 1);
    append_line(topics, id + '\t' + single_line(title));
    return id;
}

std::filesystem::path LocalDirectoryClient::session_file(const std::string &session_id) const {
    return dest_root_ / ".sessions" / (safe_file_name(session_id) + ".part");
}

std::filesystem::path LocalDirectoryClient::chat_dir(const ContainerId &container) const {
    return dest_root_ / safe_file_name(container);
}

ItemId LocalDirectoryClient::next_message_id(const ContainerId &container) {
    auto it = last_message_ids_.find(container);
    if (it == last_message_ids_.end()) {
        const auto existing = count_lines(chat_dir(container) / "messages.tsv");
        it = last_message_ids_.emplace(container, static_cast<ItemId>(existing)).first;
    }
    return it->second + 1;
}

std::filesystem::path LocalDirectoryClient::store_media(const std::filesystem::path &files_dir, ItemId message_id,
                                                        const SendRequest &request) {
    const auto name = request.media ? request.media->display_name : "file_" + std::to_string(message_id);
    const auto target = files_dir / (std::to_string(message_id) + "_" + safe_file_name(name));
    if (const auto *inline_bytes = std::get_if<std::vector<char>>(&request.body)) {
        write_file(target, *inline_bytes);
        return target;
    }
    const auto &handle = std::get<RemoteObjectHandle>(request.body);
    auto it = session_parts_.find(handle.session_id());
    if (it == session_parts_.end() || it->second != handle.total_parts()) {
        throw FatalError("unknown upload session " + handle.session_id());
    }
    const auto assembled = session_file(handle.session_id());
    const auto crc = crc_of_file(assembled, chunk_size_bytes_);
    if (crc != handle.content_hash_hex()) {
        throw FatalError("session " + handle.session_id() + " content hash mismatch: " + crc + " != " +
                         handle.content_hash_hex());
    }
    std::error_code ec;
    std::filesystem::rename(assembled, target, ec);
    if (ec) {
        throw FatalError("failed to move '" + assembled.string() + "': " + ec.message());
    }
    session_parts_.erase(it);
    return target;
}

} // namespace chunkrelay
