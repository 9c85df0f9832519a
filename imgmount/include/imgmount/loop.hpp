#ifndef LOOP_HPP
#define LOOP_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace imgmount {
class Executor;
}  // namespace imgmount

namespace imgmount::loop {

/// @brief Extracts the loop device from `kpartx -av` output.
///
/// kpartx only reports the partition mappings, e.g
/// `add map loop1p1 (253:0): 0 251904 linear 7:1 2048`.
/// @param kpartx_output Raw kpartx output.
/// @return The loop device name without /dev/ (e.g loop1), std::nullopt when nothing was mapped.
auto parse_kpartx_loop_device(std::string_view kpartx_output) noexcept -> std::optional<std::string>;

/// @brief Maps the partitions of an image through a loop device (kpartx -av) and rescans partitions.
/// @return The loop device name (e.g loop1), std::nullopt when kpartx failed or mapped nothing.
auto map_partitions(Executor& executor, std::string_view image_path) noexcept -> std::optional<std::string>;

/// @brief Removes partition mappings and the loop device created by map_partitions (kpartx -d).
auto unmap_partitions(Executor& executor, std::string_view image_path) noexcept -> bool;

/// @brief Binds a file to the first free loop device (losetup -f --show).
/// @return The loop device node (e.g /dev/loop3), std::nullopt on failure.
auto attach(Executor& executor, std::string_view image_path) noexcept -> std::optional<std::string>;

/// @brief Releases a loop device (losetup -d).
auto detach(Executor& executor, std::string_view loop_device) noexcept -> bool;

}  // namespace imgmount::loop

#endif  // LOOP_HPP
