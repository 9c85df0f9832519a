#include "imgmount/linux_mounter.hpp"
#include "imgmount/block_devices.hpp"
#include "imgmount/classifier.hpp"
#include "imgmount/executor.hpp"
#include "imgmount/io_utils.hpp"
#include "imgmount/loop.hpp"
#include "imgmount/lvm.hpp"
#include "imgmount/mount.hpp"
#include "imgmount/mtab.hpp"

#include <filesystem>  // for path, create_directories
#include <utility>     // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace imgmount {

LinuxMounter::LinuxMounter(Executor& executor, Selector& selector, std::string mount_root) noexcept
  : m_executor(executor), m_selector(selector), m_mount_root(std::move(mount_root)) { }

auto LinuxMounter::classify(std::string_view path) noexcept -> std::expected<ContainerKind, MountError> {
    return classifier::classify_linux(m_executor, m_selector, path);
}

auto LinuxMounter::list_children(Layer& layer) noexcept -> std::expected<std::vector<VolumeChoice>, MountError> {
    switch (layer.kind) {
    case ContainerKind::Device:
        return list_device_partitions(layer);
    case ContainerKind::LVM:
        return list_logical_volumes(layer);
    case ContainerKind::LUKS:
        // TODO: unlock LUKS containers with cryptsetup open and list the mapping
        spdlog::warn("Listing volumes of LUKS containers is not supported yet");
        return std::vector<VolumeChoice>{};
    case ContainerKind::Partition:
        break;
    }
    return std::vector<VolumeChoice>{};
}

auto LinuxMounter::list_device_partitions(Layer& layer) noexcept -> std::expected<std::vector<VolumeChoice>, MountError> {
    const bool using_loop_device = !utils::is_block_device(layer.device_name);

    std::string target_device{layer.device_name};
    if (using_loop_device) {
        // kpartx may map some partitions before failing, so the mapping must be pulled down either way
        layer.attached_device = layer.device_name;

        auto loop_device = loop::map_partitions(m_executor, layer.device_name);
        if (!loop_device) {
            return std::unexpected(MountError::EnumerationFailure);
        }
        layer.attached_device = *loop_device;
        target_device         = std::move(*loop_device);
    }

    const auto& lsblk = m_executor.run("lsblk -J -o NAME,FSTYPE,SIZE"sv, true);
    if (!lsblk.success()) {
        spdlog::error("Failed to run lsblk: {}", lsblk.output);
        return std::unexpected(MountError::EnumerationFailure);
    }
    const auto& devices = disk::parse_lsblk_json(lsblk.output);
    if (!devices) {
        return std::unexpected(MountError::EnumerationFailure);
    }

    std::vector<VolumeChoice> choices{};
    const auto& device = disk::find_device_by_name(*devices, target_device);
    if (!device) {
        spdlog::warn("lsblk doesn't know about {}", target_device);
        return choices;
    }

    for (const auto& partition : device->children) {
        const auto& node = using_loop_device
            ? fmt::format(FMT_COMPILE("/dev/mapper/{}"), partition.name)
            : fmt::format(FMT_COMPILE("/dev/{}"), partition.name);

        choices.emplace_back(VolumeChoice{
            .label          = fmt::format(FMT_COMPILE("Partition {}, Filesystem: {}, Size: {}"), partition.name, partition.fstype.value_or("None"), partition.size),
            .device_or_name = node,
            .size           = partition.size,
            .filesystem     = partition.fstype,
        });
    }
    return choices;
}

auto LinuxMounter::list_logical_volumes(Layer& layer) noexcept -> std::expected<std::vector<VolumeChoice>, MountError> {
    std::string pv_device{layer.device_name};
    if (!utils::is_block_device(layer.device_name)) {
        auto loop_device = loop::attach(m_executor, layer.device_name);
        if (!loop_device) {
            return std::unexpected(MountError::EnumerationFailure);
        }
        layer.attached_device = *loop_device;
        pv_device             = std::move(*loop_device);
    }

    auto volume_group = lvm::query_volume_group(m_executor, pv_device);
    if (!volume_group) {
        return std::unexpected(MountError::EnumerationFailure);
    }
    // Deactivating an inactive group is harmless, record it before trying
    layer.volume_group = *volume_group;
    if (!lvm::activate_volume_group(m_executor, *volume_group)) {
        return std::unexpected(MountError::EnumerationFailure);
    }

    const auto& logical_volumes = lvm::list_logical_volumes(m_executor, *volume_group);
    if (!logical_volumes) {
        return std::unexpected(MountError::EnumerationFailure);
    }

    std::vector<VolumeChoice> choices{};
    for (const auto& logical_volume : *logical_volumes) {
        choices.emplace_back(VolumeChoice{
            .label          = fmt::format(FMT_COMPILE("Volume {}, Size: {}"), logical_volume.name, logical_volume.size),
            .device_or_name = fmt::format(FMT_COMPILE("/dev/{}/{}"), logical_volume.volume_group, logical_volume.name),
            .size           = logical_volume.size,
        });
    }
    return choices;
}

auto LinuxMounter::mount_point_for(std::string_view image_path) const noexcept -> std::string {
    auto file_name = fs::path{image_path}.filename();
    if (file_name.empty()) {
        file_name = fs::path{image_path}.parent_path().filename();
    }
    return (fs::path{m_mount_root} / file_name).string();
}

auto LinuxMounter::mount_leaf(const LeafMount& leaf, LayerStack& /*layers*/) noexcept -> std::expected<std::string, MountError> {
    const std::string_view device = leaf.choice ? std::string_view{leaf.choice->device_or_name} : leaf.device;
    const auto& mount_dir         = mount_point_for(leaf.image_path);

    const auto& mtab_entries = mtab::query_mounts(m_executor);
    if (!mtab_entries) {
        return std::unexpected(MountError::MountCommandFailure);
    }

    // There is a partition mounted here. Check if it's ours.
    if (mtab::get_mount_point(*mtab_entries, device) == mount_dir) {
        spdlog::debug("{} was already mounted at {}. Continuing...", device, mount_dir);
        return mount_dir;
    }
    if (mtab::is_mounted(*mtab_entries, mount_dir)) {
        spdlog::warn("Unmounting filesystem in the way at {}...", mount_dir);
        if (!mount::umount(m_executor, Platform::Linux, mount_dir)) {
            spdlog::error("Couldn't unmount {}, preventing the mounting of {}!", mount_dir, device);
            return std::unexpected(MountError::MountCommandFailure);
        }
    }

    std::error_code err{};
    if (utils::is_dry_run()) {
        spdlog::info("Dry run, not creating mount point {}", mount_dir);
    } else if (fs::create_directories(mount_dir, err); err) {
        spdlog::error("Failed to create mount point {}: {}", mount_dir, err.message());
        return std::unexpected(MountError::MountCommandFailure);
    }

    if (!mount::mount_readonly(m_executor, device, mount_dir)) {
        return std::unexpected(MountError::MountCommandFailure);
    }
    return mount_dir;
}

auto LinuxMounter::unmount_filesystem(std::string_view mount_point) noexcept -> std::expected<void, MountError> {
    if (!mount::umount(m_executor, Platform::Linux, mount_point)) {
        return std::unexpected(MountError::TeardownFailure);
    }
    return {};
}

auto LinuxMounter::retire_layer(const Layer& layer) noexcept -> std::expected<void, MountError> {
    switch (layer.kind) {
    case ContainerKind::Device:
        if (layer.attached_device && !loop::unmap_partitions(m_executor, layer.device_name)) {
            return std::unexpected(MountError::TeardownFailure);
        }
        break;
    case ContainerKind::LVM:
        if (layer.volume_group && !lvm::deactivate_volume_group(m_executor, *layer.volume_group)) {
            return std::unexpected(MountError::TeardownFailure);
        }
        if (layer.attached_device && !loop::detach(m_executor, *layer.attached_device)) {
            return std::unexpected(MountError::TeardownFailure);
        }
        break;
    case ContainerKind::Partition:
    case ContainerKind::LUKS:
        break;
    }
    return {};
}

}  // namespace imgmount
