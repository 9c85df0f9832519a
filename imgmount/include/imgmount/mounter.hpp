#ifndef MOUNTER_HPP
#define MOUNTER_HPP

#include "imgmount/container.hpp"
#include "imgmount/errors.hpp"

#include <expected>     // for expected
#include <memory>       // for unique_ptr
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace imgmount {

class Executor;
class Selector;

/// @brief What the innermost layer resolved to.
struct LeafMount {
    /// The output file/device the mount was started for.
    std::string_view image_path;
    /// Device of the innermost layer.
    std::string_view device;
    /// Child volume the user picked, unset when the layer is a partition itself.
    std::optional<VolumeChoice> choice{};
};

/// @brief Platform specific steps of mounting and unmounting an output container.
///
/// Implementations record every kernel handle they create on the layer they
/// were given, retire_layer releases exactly those.
class Mounter {
 public:
    virtual ~Mounter() = default;

    [[nodiscard]] virtual auto platform() const noexcept -> Platform = 0;

    /// @brief Determines the type of the container at path.
    virtual auto classify(std::string_view path) noexcept -> std::expected<ContainerKind, MountError> = 0;

    /// @brief Lists the child volumes of a Device, LVM or LUKS layer.
    /// @param layer The innermost layer, receives the handles attached to list it.
    /// @return Unsorted choices, possibly empty. EnumerationFailure when a listing tool failed.
    virtual auto list_children(Layer& layer) noexcept -> std::expected<std::vector<VolumeChoice>, MountError> = 0;

    /// @brief Mounts the final filesystem read-only.
    /// @param leaf What to mount.
    /// @param layers The stack built so far, attached images are recorded on the outermost layer.
    /// @return The mount point.
    virtual auto mount_leaf(const LeafMount& leaf, LayerStack& layers) noexcept -> std::expected<std::string, MountError> = 0;

    /// @brief Unmounts the filesystem at mount_point, succeeds when it's already gone.
    virtual auto unmount_filesystem(std::string_view mount_point) noexcept -> std::expected<void, MountError> = 0;

    /// @brief Releases what was materialized for the layer.
    virtual auto retire_layer(const Layer& layer) noexcept -> std::expected<void, MountError> = 0;
};

/// @brief Creates the mounter of the given platform.
/// @param platform Host semantics to follow.
/// @param executor Runs the OS tools, must outlive the mounter.
/// @param selector Asks for the container type when probing is inconclusive, must outlive the mounter.
/// @param mount_root Directory receiving mount points, Linux only.
auto make_mounter(Platform platform, Executor& executor, Selector& selector, std::string mount_root) noexcept -> std::unique_ptr<Mounter>;

}  // namespace imgmount

#endif  // MOUNTER_HPP
