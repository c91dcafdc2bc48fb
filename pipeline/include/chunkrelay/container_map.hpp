#pragma once

#include "chunkrelay/item.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <unordered_map>

namespace chunkrelay {

// Source -> destination organizational container ids, persisted as
// `source<TAB>destination` lines. New pairs are appended.
class ContainerMap {
  public:
    explicit ContainerMap(std::filesystem::path path);

    void load();

    std::optional<ContainerId> find(const ContainerId &source) const;

    void put(const ContainerId &source, const ContainerId &destination);

    std::size_t size() const noexcept { return entries_.size(); }

  private:
    std::filesystem::path path_;
    std::unordered_map<ContainerId, ContainerId> entries_;
};

} // namespace chunkrelay
