#ifndef MOUNT_HPP
#define MOUNT_HPP

#include "imgmount/container.hpp"

#include <string>       // for string
#include <string_view>  // for string_view

namespace imgmount {
class Executor;
}  // namespace imgmount

namespace imgmount::mount {

// Mount device read-only at mount_dir
auto mount_readonly(Executor& executor, std::string_view device, std::string_view mount_dir) noexcept -> bool;

// Umount the device or mount point, does nothing if it isn't mounted
auto umount(Executor& executor, Platform platform, std::string_view path) noexcept -> bool;

// macOS reports /tmp as /private/tmp in the mount table
auto mount_table_path(Platform platform, std::string_view path) noexcept -> std::string;

}  // namespace imgmount::mount

#endif  // MOUNT_HPP
