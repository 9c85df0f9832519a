#ifndef HDIUTIL_HPP
#define HDIUTIL_HPP

#include "imgmount/container.hpp"
#include "imgmount/executor.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace imgmount::hdiutil {

/// @brief An entry of "system-entities" in `hdiutil attach -plist` output.
struct SystemEntity {
    /// e.g /dev/disk5s1
    std::string dev_entry{};
    /// Set only when macOS mounted a filesystem for this entity.
    std::optional<std::string> mount_point{};
};

/// @brief Whether `hdiutil imageinfo -plist` describes an image without a partition map.
auto is_whole_disk(std::string_view imageinfo_output) noexcept -> bool;

/// @brief Builds choices from the partition map in `hdiutil imageinfo -plist` output.
///
/// Entries without a partition number (free space, the map itself) are skipped.
/// @return Unsorted choices, std::nullopt when the plist is malformed.
auto parse_image_partitions(std::string_view imageinfo_output) noexcept -> std::optional<std::vector<VolumeChoice>>;

/// @brief Parses "system-entities" of `hdiutil attach -plist` output.
/// @return The entities in reported order, std::nullopt when the plist is malformed.
auto parse_system_entities(std::string_view attach_output) noexcept -> std::optional<std::vector<SystemEntity>>;

/// @brief Picks the entity a single-partition image got mounted as.
///
/// hdiutil reports the whole disk first, the filesystem second.
auto select_mounted_entity(const std::vector<SystemEntity>& entities) noexcept -> std::optional<SystemEntity>;

/// @brief Finds the mounted entity of a partition, by partition number.
/// @param entities Entities from parse_system_entities.
/// @param partition_number e.g "2" matches /dev/disk5s2.
/// @return The entity, std::nullopt when it wasn't found or macOS couldn't mount its filesystem.
auto find_partition_entity(const std::vector<SystemEntity>& entities, std::string_view partition_number) noexcept -> std::optional<SystemEntity>;

/// @brief Lists /dev nodes printed by `diskutil list`.
auto parse_diskutil_disks(std::string_view diskutil_output) noexcept -> std::vector<std::string>;

/// @brief Runs hdiutil, recovering from a busy image once.
///
/// On failure (commonly "Resource temporarily unavailable") every disk from
/// `diskutil list` is detached, ignoring errors, and the command is retried.
/// @param options Everything after `hdiutil`.
auto run(Executor& executor, std::string_view options) noexcept -> CommandResult;

}  // namespace imgmount::hdiutil

#endif  // HDIUTIL_HPP
