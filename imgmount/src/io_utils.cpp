#include "imgmount/io_utils.hpp"

#include <unistd.h>  // for geteuid

#include <cstdlib>     // for getenv
#include <filesystem>  // for is_block_file

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace imgmount::utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto is_dry_run() noexcept -> bool {
    return safe_getenv("DIRTY_CMD_RUN") == "1"sv;
}

auto is_root() noexcept -> bool {
    return geteuid() == 0;
}

auto is_block_device(std::string_view path) noexcept -> bool {
    if (path.starts_with("/dev/")) {
        return true;
    }
    std::error_code err{};
    return fs::is_block_file(fs::path{path}, err);
}

}  // namespace imgmount::utils
