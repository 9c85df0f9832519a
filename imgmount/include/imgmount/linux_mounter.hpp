#ifndef LINUX_MOUNTER_HPP
#define LINUX_MOUNTER_HPP

#include "imgmount/mounter.hpp"

namespace imgmount {

/// @brief Mounts through kpartx, losetup, LVM and mount(8).
class LinuxMounter final : public Mounter {
 public:
    LinuxMounter(Executor& executor, Selector& selector, std::string mount_root) noexcept;

    [[nodiscard]] auto platform() const noexcept -> Platform override {
        return Platform::Linux;
    }

    auto classify(std::string_view path) noexcept -> std::expected<ContainerKind, MountError> override;
    auto list_children(Layer& layer) noexcept -> std::expected<std::vector<VolumeChoice>, MountError> override;
    auto mount_leaf(const LeafMount& leaf, LayerStack& layers) noexcept -> std::expected<std::string, MountError> override;
    auto unmount_filesystem(std::string_view mount_point) noexcept -> std::expected<void, MountError> override;
    auto retire_layer(const Layer& layer) noexcept -> std::expected<void, MountError> override;

    /// @brief Mount point of an output file, <mount_root>/<file name>.
    [[nodiscard]] auto mount_point_for(std::string_view image_path) const noexcept -> std::string;

 private:
    auto list_device_partitions(Layer& layer) noexcept -> std::expected<std::vector<VolumeChoice>, MountError>;
    auto list_logical_volumes(Layer& layer) noexcept -> std::expected<std::vector<VolumeChoice>, MountError>;

    Executor& m_executor;
    Selector& m_selector;
    std::string m_mount_root;
};

}  // namespace imgmount

#endif  // LINUX_MOUNTER_HPP
