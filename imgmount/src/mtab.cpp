#include "imgmount/mtab.hpp"
#include "imgmount/executor.hpp"
#include "imgmount/string_utils.hpp"

#include <algorithm>  // for find_if, any_of

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace imgmount::mtab {

auto parse_mount_output(std::string_view mount_output) noexcept -> std::vector<MTabEntry> {
    std::vector<MTabEntry> entries{};

    for (auto&& line : utils::make_split_view(mount_output)) {
        const auto& columns = utils::split_columns(line);
        // e.g format: <device> on <mountpoint> ...
        if (columns.size() >= 3 && columns[1] == "on"sv) {
            entries.emplace_back(MTabEntry{.device = std::string{columns[0]}, .mountpoint = std::string{columns[2]}});
        }
    }
    return entries;
}

auto get_mount_point(const std::vector<MTabEntry>& entries, std::string_view device) noexcept -> std::optional<std::string> {
    auto it = std::ranges::find_if(entries, [device](auto&& entry) { return entry.device == device; });
    if (it != std::ranges::end(entries)) {
        return it->mountpoint;
    }
    return std::nullopt;
}

auto is_mounted(const std::vector<MTabEntry>& entries, std::string_view path) noexcept -> bool {
    return std::ranges::any_of(entries, [path](auto&& entry) {
        return entry.device == path || entry.mountpoint == path;
    });
}

auto query_mounts(Executor& executor) noexcept -> std::optional<std::vector<MTabEntry>> {
    const auto& mount = executor.run("mount"sv, false);
    if (!mount.success()) {
        spdlog::error("Failed to query mounted filesystems: {}", mount.output);
        return std::nullopt;
    }
    return mtab::parse_mount_output(mount.output);
}

}  // namespace imgmount::mtab
