#include "chunkrelay/container_map.hpp"

#include "chunkrelay/errors.hpp"

#include <fstream>
#include <string>

namespace chunkrelay {

namespace {

bool valid_field(const std::string &value) {
    return !value.empty() && value.find_first_of("\t\r\n") == std::string::npos;
}

} // namespace

ContainerMap::ContainerMap(std::filesystem::path path) : path_(std::move(path)) {}

void ContainerMap::load() {
    entries_.clear();
    if (!std::filesystem::exists(path_)) {
        return;
    }
    std::ifstream file(path_);
    if (!file) {
        throw Error("failed to open container map '" + path_.string() + "'");
    }
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }
        const auto tab = line.find('\t');
        if (tab == std::string::npos || tab == 0 || tab + 1 == line.size()) {
            throw Error("container map '" + path_.string() + "' line " + std::to_string(line_number) +
                        " is malformed");
        }
        entries_[line.substr(0, tab)] = line.substr(tab + 1);
    }
    if (file.bad()) {
        throw Error("failed to read container map '" + path_.string() + "'");
    }
}

std::optional<ContainerId> ContainerMap::find(const ContainerId &source) const {
    auto it = entries_.find(source);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ContainerMap::put(const ContainerId &source, const ContainerId &destination) {
    if (!valid_field(source) || !valid_field(destination)) {
        throw std::invalid_argument("container ids must be non-empty and free of tabs and newlines");
    }
    std::ofstream file(path_, std::ios::app);
    file << source << '\t' << destination << '\n';
    file.flush();
    if (!file) {
        throw Error("failed to append to container map '" + path_.string() + "'");
    }
    entries_[source] = destination;
}

} // namespace chunkrelay
