#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <string_view>  // for string_view

namespace imgmount::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

// DIRTY_CMD_RUN=1, commands are logged instead of run
auto is_dry_run() noexcept -> bool;

// Whether the current process already runs with an effective uid of 0
auto is_root() noexcept -> bool;

// Block devices are either already under /dev or are block special files
auto is_block_device(std::string_view path) noexcept -> bool;

}  // namespace imgmount::utils

#endif  // IO_UTILS_HPP
