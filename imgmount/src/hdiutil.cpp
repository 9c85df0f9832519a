#include "imgmount/hdiutil.hpp"
#include "imgmount/plist.hpp"
#include "imgmount/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace imgmount::hdiutil {

auto is_whole_disk(std::string_view imageinfo_output) noexcept -> bool {
    return imageinfo_output.contains("whole disk"sv);
}

auto parse_image_partitions(std::string_view imageinfo_output) noexcept -> std::optional<std::vector<VolumeChoice>> {
    const auto& imageinfo = plist::parse(imageinfo_output);
    if (!imageinfo) {
        spdlog::error("Failed to parse hdiutil imageinfo output: {}", imageinfo.error());
        return std::nullopt;
    }

    const auto* partition_map = imageinfo->find("partitions"sv);
    if (partition_map == nullptr) {
        spdlog::error("hdiutil imageinfo output has no partition map");
        return std::nullopt;
    }
    const auto* block_size_node = partition_map->find("block-size"sv);
    const auto* partitions      = partition_map->find("partitions"sv);
    const auto& block_size      = (block_size_node != nullptr) ? block_size_node->as_integer() : std::nullopt;
    if (!block_size || partitions == nullptr || partitions->type != plist::NodeType::Array) {
        spdlog::error("hdiutil imageinfo output has a malformed partition map");
        return std::nullopt;
    }

    std::vector<VolumeChoice> choices{};
    for (const auto& partition : partitions->children) {
        const auto* number_node = partition.find("partition-number"sv);
        const auto* length_node = partition.find("partition-length"sv);
        if (number_node == nullptr || length_node == nullptr) {
            continue;
        }
        const auto& number = number_node->as_integer();
        const auto& length = length_node->as_integer();
        if (!number || !length) {
            continue;
        }

        const auto size_mb = (*length * *block_size) / 1000000;
        const auto& size   = fmt::format(FMT_COMPILE("{} MB"), size_mb);

        std::optional<std::string> filesystem{};
        if (const auto* hint = partition.find("partition-hint"sv); hint != nullptr && hint->as_string()) {
            filesystem = std::string{*hint->as_string()};
        }

        choices.emplace_back(VolumeChoice{
            .label          = fmt::format(FMT_COMPILE("Partition {}, with size {}"), *number, size),
            .device_or_name = std::to_string(*number),
            .size           = size,
            .filesystem     = std::move(filesystem),
        });
    }
    return choices;
}

auto parse_system_entities(std::string_view attach_output) noexcept -> std::optional<std::vector<SystemEntity>> {
    const auto& attach_info = plist::parse(attach_output);
    if (!attach_info) {
        spdlog::error("Failed to parse hdiutil attach output: {}", attach_info.error());
        return std::nullopt;
    }

    const auto* entities_node = attach_info->find("system-entities"sv);
    if (entities_node == nullptr || entities_node->type != plist::NodeType::Array) {
        spdlog::error("hdiutil attach output has no system entities");
        return std::nullopt;
    }

    std::vector<SystemEntity> entities{};
    for (const auto& entity_node : entities_node->children) {
        const auto* dev_entry = entity_node.find("dev-entry"sv);
        if (dev_entry == nullptr || !dev_entry->as_string()) {
            continue;
        }

        SystemEntity entity{.dev_entry = std::string{*dev_entry->as_string()}};
        if (const auto* mount_point = entity_node.find("mount-point"sv); mount_point != nullptr && mount_point->as_string()) {
            entity.mount_point = std::string{*mount_point->as_string()};
        }
        entities.emplace_back(std::move(entity));
    }
    return entities;
}

auto select_mounted_entity(const std::vector<SystemEntity>& entities) noexcept -> std::optional<SystemEntity> {
    if (entities.empty()) {
        return std::nullopt;
    }
    return (entities.size() > 1) ? entities[1] : entities[0];
}

auto find_partition_entity(const std::vector<SystemEntity>& entities, std::string_view partition_number) noexcept -> std::optional<SystemEntity> {
    for (const auto& entity : entities) {
        // /dev/disk5s2 -> 2
        const std::string_view dev_entry{entity.dev_entry};
        const auto slice_pos = dev_entry.rfind('s');
        if (slice_pos == std::string_view::npos || dev_entry.substr(slice_pos + 1) != partition_number) {
            continue;
        }
        // hdiutil mounts every mountable partition of the image
        if (entity.mount_point) {
            return entity;
        }
    }
    return std::nullopt;
}

auto parse_diskutil_disks(std::string_view diskutil_output) noexcept -> std::vector<std::string> {
    std::vector<std::string> disks{};
    for (auto&& line : utils::make_split_view(diskutil_output)) {
        const auto& columns = utils::split_columns(line);
        if (!columns.empty() && columns[0].starts_with("/dev/"sv)) {
            disks.emplace_back(columns[0]);
        }
    }
    return disks;
}

auto run(Executor& executor, std::string_view options) noexcept -> CommandResult {
    const auto& cmd = fmt::format(FMT_COMPILE("hdiutil {}"), options);

    auto result = executor.run(cmd, true);
    if (result.success() && !result.output.contains("Resource temporarily unavailable"sv)) {
        return result;
    }

    spdlog::warn("Attempting to fix hdiutil resource error...");
    // Detach every disk, the system disk will refuse and that's fine
    const auto& diskutil = executor.run("diskutil list"sv, false);
    for (const auto& disk : hdiutil::parse_diskutil_disks(diskutil.output)) {
        spdlog::warn("Attempting to detach {}...", disk);
        if (!executor.run(fmt::format(FMT_COMPILE("hdiutil detach {}"), disk), true).success()) {
            spdlog::debug("Couldn't detach {}, ignoring", disk);
        }
    }

    return executor.run(cmd, true);
}

}  // namespace imgmount::hdiutil
