#pragma once

#include "chunkrelay/remote_client.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkrelay {

// RemoteClient over two directory trees.
//
// Source: <source_root>/<chat>/manifest.tsv, one item per line:
//   id  topic  kind  file  mime  attributes  text
// tab separated, `-` for an empty field, attributes as `k=v;k=v`, media file
// paths relative to the chat directory. Ids must ascend; lines are parsed as
// the cursor advances.
//
// Destination: <dest_root>/<chat>/messages.tsv records every sent message,
// media lands in <dest_root>/<chat>/files/, topics in topics.tsv. Parts of an
// upload session are written at index * chunk_size of
// <dest_root>/.sessions/<session>.part until the session is sent or
// discarded.
class LocalDirectoryClient : public RemoteClient {
  public:
    LocalDirectoryClient(std::filesystem::path source_root, std::filesystem::path dest_root,
                         std::size_t chunk_size_bytes);

    std::unique_ptr<ItemCursor> iterate_items(const ContainerId &container, ItemId min_id) override;

    std::vector<char> read_small_object(const Item &item) override;

    std::unique_ptr<ChunkStream> open_chunk_stream(const Item &item, std::size_t chunk_size) override;

    void upload_part(const std::string &session_id, std::size_t index, std::size_t total_parts,
                     const std::vector<char> &bytes) override;

    ItemId send(const SendRequest &request) override;

    ContainerId create_topic(const ContainerId &container, const std::string &title) override;

    void discard_session(const std::string &session_id) noexcept override;

    std::filesystem::path session_file(const std::string &session_id) const;

  private:
    std::filesystem::path chat_dir(const ContainerId &container) const;
    ItemId next_message_id(const ContainerId &container);
    std::filesystem::path store_media(const std::filesystem::path &files_dir, ItemId message_id,
                                      const SendRequest &request);

    std::filesystem::path source_root_;
    std::filesystem::path dest_root_;
    std::size_t chunk_size_bytes_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::size_t> session_parts_;
    std::unordered_map<ContainerId, ItemId> last_message_ids_;
};

Item parse_manifest_line(const std::string &line, const std::filesystem::path &chat_dir);

} // namespace chunkrelay
