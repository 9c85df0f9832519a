#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include "imgmount/container.hpp"

#include <cstdint>      // for int32_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace cli {

/// Used when no --config is given, missing file means defaults.
inline constexpr std::string_view DEFAULT_CONFIG_PATH = "/etc/imgmount.json";

/// Front end configuration.
struct AppConfig {
    // Engine
    std::string mount_root{"/tmp/imgmount"};
    std::int32_t max_nesting_depth{4};
    imgmount::Platform platform{imgmount::host_platform()};

    // Privileged commands
    std::string elevation_command{"pkexec"};
    std::int32_t elevation_retries{2};

    // Logging
    std::string log_file{"/tmp/imgmount.log"};
    std::string log_level{"debug"};
};

/// Parsed command line.
struct CommandLine {
    std::optional<std::string> config_path{};
    bool dry_run{false};
    bool show_help{false};
    std::string target{};
};

/// Parses configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return AppConfig on success, or error string on failure.
[[nodiscard]] auto parse_app_config(std::string_view json_content) noexcept
    -> std::expected<AppConfig, std::string>;

/// @brief Reads and parses the configuration file.
/// @param config_path Explicit path, must exist. The default path may be absent.
[[nodiscard]] auto load_app_config(const std::optional<std::string>& config_path) noexcept
    -> std::expected<AppConfig, std::string>;

/// Parses `imgmount-cli [--config <file>] [--dry-run] <image-or-device>`.
[[nodiscard]] auto parse_command_line(int argc, char* const* argv) noexcept
    -> std::expected<CommandLine, std::string>;

/// Usage text printed for --help and bad arguments.
[[nodiscard]] auto usage() noexcept -> std::string_view;

}  // namespace cli

#endif  // APP_CONFIG_HPP
