#ifndef BLOCK_DEVICES_HPP
#define BLOCK_DEVICES_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace imgmount::disk {

/// @brief Represents a block device with its properties.
struct BlockDevice {
    /// Device name (e.g., loop0, loop0p1, sdb1).
    std::string name;
    /// Filesystem type (e.g., ext4, LVM2_member).
    std::optional<std::string> fstype;
    /// Human readable size as reported by lsblk (e.g., 100M).
    std::string size;
    /// Partitions and mappings on top of this device.
    std::vector<BlockDevice> children;
};

/// @brief Parses the output of `lsblk -J`.
/// @param lsblk_output Raw output, diagnostic lines starting with "lsblk:" are skipped.
/// @return A vector of top-level BlockDevice objects, std::nullopt if the JSON is malformed.
auto parse_lsblk_json(std::string_view lsblk_output) noexcept -> std::optional<std::vector<BlockDevice>>;

/// @brief Finds a top-level block device by its name.
/// @param devices A vector of BlockDevice objects.
/// @param device_name Either a bare name (loop0) or a device node (/dev/sdb).
/// @return The matching device, std::nullopt otherwise.
auto find_device_by_name(const std::vector<BlockDevice>& devices, std::string_view device_name) noexcept -> std::optional<BlockDevice>;

}  // namespace imgmount::disk

#endif  // BLOCK_DEVICES_HPP
