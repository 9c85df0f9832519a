#include "imgmount/mount.hpp"
#include "imgmount/executor.hpp"
#include "imgmount/mtab.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace imgmount::mount {

auto mount_readonly(Executor& executor, std::string_view device, std::string_view mount_dir) noexcept -> bool {
    spdlog::info("Mounting {} at {}...", device, mount_dir);
    const auto& mount = executor.run(fmt::format(FMT_COMPILE("mount -r {} {}"), device, mount_dir), true);
    if (!mount.success()) {
        spdlog::error("Failed to mount {}: {}", device, mount.output);
        return false;
    }
    return true;
}

auto umount(Executor& executor, Platform platform, std::string_view path) noexcept -> bool {
    const auto& mtab_entries = mtab::query_mounts(executor);
    if (!mtab_entries) {
        return false;
    }
    if (!mtab::is_mounted(*mtab_entries, mount::mount_table_path(platform, path))) {
        spdlog::info("{} was not mounted. Continuing...", path);
        return true;
    }

    const auto& umount_cmd = (platform == Platform::MacOS)
        ? fmt::format(FMT_COMPILE("diskutil umount {}"), path)
        : fmt::format(FMT_COMPILE("umount {}"), path);
    const auto& umount = executor.run(umount_cmd, true);
    if (!umount.success()) {
        spdlog::error("Failed to umount {}: {}", path, umount.output);
        return false;
    }
    spdlog::info("Unmounted {}", path);
    return true;
}

auto mount_table_path(Platform platform, std::string_view path) noexcept -> std::string {
    if (platform == Platform::MacOS && path.starts_with("/tmp"sv)) {
        return fmt::format(FMT_COMPILE("/private{}"), path);
    }
    return std::string{path};
}

}  // namespace imgmount::mount
