#pragma once

#include "chunkrelay/item.hpp"

#include <filesystem>
#include <optional>

namespace chunkrelay {

// Durable id of the last item whose transfer concluded. The file holds one
// decimal integer; a missing file means nothing has been processed yet.
class Checkpoint {
  public:
    explicit Checkpoint(std::filesystem::path path);

    std::optional<ItemId> load();

    // Atomically replaces the file. Refuses to move backwards.
    void save(ItemId id);

    std::optional<ItemId> last() const noexcept { return last_; }

    const std::filesystem::path &path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
    std::optional<ItemId> last_;
};

} // namespace chunkrelay
