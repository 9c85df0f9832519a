#ifndef CONTAINER_HPP
#define CONTAINER_HPP

#include <cstdint>      // for uint8_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace imgmount {

/// Host platform semantics to follow.
enum class Platform : std::uint8_t {
    Linux,
    MacOS
};

/// Type of a container found while descending into an output file.
enum class ContainerKind : std::uint8_t {
    Partition,
    Device,
    LVM,
    LUKS
};

/// @brief The thing being mounted.
struct OutputContainer {
    /// Filesystem path of the image, or a device node.
    std::string path;
    Platform platform{Platform::Linux};
};

/// @brief One level of materialized kernel state.
struct Layer {
    ContainerKind kind{ContainerKind::Partition};
    /// The image/device this layer was created for.
    std::string device_name;
    /// Loop device, or hdiutil disk node, that was attached for this layer.
    std::optional<std::string> attached_device{};
    /// Volume group activated for this layer.
    std::optional<std::string> volume_group{};
};

/// Outermost layer first, innermost last.
using LayerStack = std::vector<Layer>;

/// @brief State of the (single) outstanding mount.
struct MountState {
    /// Set only when a filesystem is mounted.
    std::optional<std::string> mount_point{};
    LayerStack layers{};

    [[nodiscard]] bool empty() const noexcept {
        return !mount_point.has_value() && layers.empty();
    }
    void reset() noexcept {
        mount_point.reset();
        layers.clear();
    }
};

/// @brief A candidate child volume, presented to the user.
struct VolumeChoice {
    std::string label;
    /// Device node to mount on Linux, partition number on macOS.
    std::string device_or_name;
    std::string size;
    std::optional<std::string> filesystem{};
};

/// Converts ContainerKind to string.
[[nodiscard]] auto container_kind_to_string(ContainerKind kind) noexcept -> std::string_view;

/// Converts Platform to string.
[[nodiscard]] auto platform_to_string(Platform platform) noexcept -> std::string_view;

/// @brief Converts a string ("linux", "macos") to Platform.
/// @return The Platform or std::nullopt if invalid.
[[nodiscard]] auto platform_from_string(std::string_view platform_str) noexcept -> std::optional<Platform>;

/// Platform the library was built for.
[[nodiscard]] constexpr auto host_platform() noexcept -> Platform {
#ifdef __APPLE__
    return Platform::MacOS;
#else
    return Platform::Linux;
#endif
}

/// @brief Container kind of a child volume that has to be descended into rather than mounted.
/// @param choice The selected child volume.
/// @return LVM for LVM physical volumes, LUKS for LUKS containers, std::nullopt for plain filesystems.
[[nodiscard]] auto nested_container_kind(const VolumeChoice& choice) noexcept -> std::optional<ContainerKind>;

/// Sorts choices by label, tools don't report children in a stable order.
void sort_choices(std::vector<VolumeChoice>& choices) noexcept;

}  // namespace imgmount

#endif  // CONTAINER_HPP
