#include "imgmount/mac_mounter.hpp"
#include "imgmount/classifier.hpp"
#include "imgmount/executor.hpp"
#include "imgmount/hdiutil.hpp"
#include "imgmount/mount.hpp"

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace imgmount {

MacMounter::MacMounter(Executor& executor) noexcept
  : m_executor(executor) { }

auto MacMounter::classify(std::string_view path) noexcept -> std::expected<ContainerKind, MountError> {
    return classifier::classify_macos(m_executor, path);
}

auto MacMounter::list_children(Layer& layer) noexcept -> std::expected<std::vector<VolumeChoice>, MountError> {
    if (layer.kind != ContainerKind::Device) {
        spdlog::warn("{} containers are not supported on macOS", container_kind_to_string(layer.kind));
        return std::vector<VolumeChoice>{};
    }

    const auto& imageinfo = hdiutil::run(m_executor, fmt::format(FMT_COMPILE("imageinfo {} -plist"), layer.device_name));
    if (!imageinfo.success()) {
        spdlog::error("hdiutil failed to read {}: {}", layer.device_name, imageinfo.output);
        return std::unexpected(MountError::EnumerationFailure);
    }

    auto choices = hdiutil::parse_image_partitions(imageinfo.output);
    if (!choices) {
        return std::unexpected(MountError::EnumerationFailure);
    }
    return std::move(*choices);
}

auto MacMounter::mount_leaf(const LeafMount& leaf, LayerStack& layers) noexcept -> std::expected<std::string, MountError> {
    // hdiutil attaches the whole image and mounts every partition it can
    const auto& attach = hdiutil::run(m_executor, fmt::format(FMT_COMPILE("attach {} -readonly -plist"), leaf.image_path));
    if (!attach.success()) {
        spdlog::error("hdiutil failed to attach {}: {}", leaf.image_path, attach.output);
        return std::unexpected(MountError::MountCommandFailure);
    }

    const auto& entities = hdiutil::parse_system_entities(attach.output);
    if (!entities || entities->empty()) {
        spdlog::error("hdiutil didn't report the disk it attached {} as", leaf.image_path);
        return std::unexpected(MountError::MountCommandFailure);
    }
    // Record the image disk first, so it's detached even if our filesystem wasn't mounted
    if (!layers.empty()) {
        layers.front().attached_device = entities->front().dev_entry;
    }

    const auto& mounted = leaf.choice
        ? hdiutil::find_partition_entity(*entities, leaf.choice->device_or_name)
        : hdiutil::select_mounted_entity(*entities);
    if (!mounted || !mounted->mount_point) {
        spdlog::error("The filesystem of {} is either not supported by macOS, or it is damaged", leaf.image_path);
        return std::unexpected(MountError::MountCommandFailure);
    }

    spdlog::info("{} is mounted at {}", mounted->dev_entry, *mounted->mount_point);
    return *mounted->mount_point;
}

auto MacMounter::unmount_filesystem(std::string_view mount_point) noexcept -> std::expected<void, MountError> {
    if (!mount::umount(m_executor, Platform::MacOS, mount_point)) {
        return std::unexpected(MountError::TeardownFailure);
    }
    return {};
}

auto MacMounter::retire_layer(const Layer& layer) noexcept -> std::expected<void, MountError> {
    if (!layer.attached_device) {
        return {};
    }

    const auto& detach = m_executor.run(fmt::format(FMT_COMPILE("hdiutil detach {}"), *layer.attached_device), true);
    if (!detach.success()) {
        spdlog::error("Failed to detach {}: {}", *layer.attached_device, detach.output);
        return std::unexpected(MountError::TeardownFailure);
    }
    spdlog::info("Detached {}", *layer.attached_device);
    return {};
}

}  // namespace imgmount
