#ifndef MTAB_HPP
#define MTAB_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace imgmount {
class Executor;
}  // namespace imgmount

namespace imgmount::mtab {

struct MTabEntry {
    std::string device{};
    std::string mountpoint{};
};

// Parse the output of mount(8), e.g
// `/dev/sda1 on /boot type vfat (rw)` or `/dev/disk2s1 on /Volumes/X (hfs, local)`
auto parse_mount_output(std::string_view mount_output) noexcept -> std::vector<MTabEntry>;

// Get the mount point a device is mounted at
auto get_mount_point(const std::vector<MTabEntry>& entries, std::string_view device) noexcept -> std::optional<std::string>;

// Whether the path is mounted, either as device or as mount point
auto is_mounted(const std::vector<MTabEntry>& entries, std::string_view path) noexcept -> bool;

// Run mount(8) and parse the current mount table
auto query_mounts(Executor& executor) noexcept -> std::optional<std::vector<MTabEntry>>;

}  // namespace imgmount::mtab

#endif  // MTAB_HPP
