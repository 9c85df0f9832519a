#ifndef MAC_MOUNTER_HPP
#define MAC_MOUNTER_HPP

#include "imgmount/mounter.hpp"

namespace imgmount {

/// @brief Mounts through hdiutil and diskutil.
///
/// macOS decides where images get mounted, and can't look into LVM or LUKS.
class MacMounter final : public Mounter {
 public:
    explicit MacMounter(Executor& executor) noexcept;

    [[nodiscard]] auto platform() const noexcept -> Platform override {
        return Platform::MacOS;
    }

    auto classify(std::string_view path) noexcept -> std::expected<ContainerKind, MountError> override;
    auto list_children(Layer& layer) noexcept -> std::expected<std::vector<VolumeChoice>, MountError> override;
    auto mount_leaf(const LeafMount& leaf, LayerStack& layers) noexcept -> std::expected<std::string, MountError> override;
    auto unmount_filesystem(std::string_view mount_point) noexcept -> std::expected<void, MountError> override;
    auto retire_layer(const Layer& layer) noexcept -> std::expected<void, MountError> override;

 private:
    Executor& m_executor;
};

}  // namespace imgmount

#endif  // MAC_MOUNTER_HPP
