#include "app_config.hpp"

#include <getopt.h>  // for getopt_long, option

#include <algorithm>    // for any_of
#include <array>        // for array
#include <expected>     // for expected, unexpected
#include <fstream>      // for ifstream
#include <utility>      // for move
#include <string_view>  // for string_view

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

constexpr std::array LOG_LEVELS{"trace"sv, "debug"sv, "info"sv, "warn"sv, "error"sv};

auto read_string(const rapidjson::Document& doc, const char* key, std::string& value) noexcept -> std::expected<void, std::string> {
    if (!doc.HasMember(key)) {
        return {};
    }
    if (!doc[key].IsString()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}' must be a string"), key));
    }
    value = doc[key].GetString();
    return {};
}

auto validate_config(const rapidjson::Document& doc) noexcept -> std::expected<cli::AppConfig, std::string> {
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    cli::AppConfig config{};

    if (auto res = read_string(doc, "mount_root", config.mount_root); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (config.mount_root.empty()) {
        return std::unexpected("'mount_root' must not be empty");
    }

    // Parse max_nesting_depth (optional, at least one layer)
    if (doc.HasMember("max_nesting_depth")) {
        if (!doc["max_nesting_depth"].IsInt() || doc["max_nesting_depth"].GetInt() < 1) {
            return std::unexpected("'max_nesting_depth' must be a positive integer");
        }
        config.max_nesting_depth = doc["max_nesting_depth"].GetInt();
    }

    // Parse platform (optional, defaults to the build host)
    if (doc.HasMember("platform")) {
        if (!doc["platform"].IsString()) {
            return std::unexpected("'platform' must be a string");
        }
        const auto& platform_str = std::string_view{doc["platform"].GetString()};
        auto platform            = imgmount::platform_from_string(platform_str);
        if (!platform) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid platform '{}'. Valid platforms: linux, macos"), platform_str));
        }
        config.platform = *platform;
    }

    if (auto res = read_string(doc, "elevation_command", config.elevation_command); !res) {
        return std::unexpected(std::move(res.error()));
    }

    if (doc.HasMember("elevation_retries")) {
        if (!doc["elevation_retries"].IsInt() || doc["elevation_retries"].GetInt() < 0) {
            return std::unexpected("'elevation_retries' must be a non-negative integer");
        }
        config.elevation_retries = doc["elevation_retries"].GetInt();
    }

    if (auto res = read_string(doc, "log_file", config.log_file); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (auto res = read_string(doc, "log_level", config.log_level); !res) {
        return std::unexpected(std::move(res.error()));
    }
    if (!std::ranges::any_of(LOG_LEVELS, [&](auto&& level) { return level == config.log_level; })) {
        return std::unexpected(fmt::format(FMT_COMPILE("Invalid log_level '{}'. Valid levels: trace, debug, info, warn, error"), config.log_level));
    }

    return config;
}

}  // namespace

namespace cli {

auto parse_app_config(std::string_view json_content) noexcept
    -> std::expected<AppConfig, std::string> {
    if (json_content.empty()) {
        return AppConfig{};
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}"), doc.GetErrorOffset()));
    }
    return validate_config(doc);
}

auto load_app_config(const std::optional<std::string>& config_path) noexcept
    -> std::expected<AppConfig, std::string> {
    const auto& file_path = config_path.value_or(std::string{DEFAULT_CONFIG_PATH});

    std::ifstream ifs{file_path};
    if (!ifs.is_open()) {
        if (!config_path) {
            return AppConfig{};
        }
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to open config '{}'"), file_path));
    }

    rapidjson::IStreamWrapper isw{ifs};
    rapidjson::Document doc;
    doc.ParseStream(isw);
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("'{}': JSON parse error at offset {}"), file_path, doc.GetErrorOffset()));
    }
    return validate_config(doc);
}

auto parse_command_line(int argc, char* const* argv) noexcept
    -> std::expected<CommandLine, std::string> {
    static constexpr std::array<option, 4> long_options{{
        {"config", required_argument, nullptr, 'c'},
        {"dry-run", no_argument, nullptr, 'n'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    }};

    CommandLine cmdline{};

    // reset getopt, it keeps its state between calls
    optind = 0;
    opterr = 0;

    int opt{};
    while ((opt = getopt_long(argc, argv, "c:nh", long_options.data(), nullptr)) != -1) {
        switch (opt) {
        case 'c':
            cmdline.config_path = optarg;
            break;
        case 'n':
            cmdline.dry_run = true;
            break;
        case 'h':
            cmdline.show_help = true;
            return cmdline;
        default:
            return std::unexpected(fmt::format(FMT_COMPILE("Unknown or incomplete option '{}'"), argv[optind - 1]));
        }
    }

    if (optind + 1 != argc) {
        return std::unexpected("Expected exactly one image or device to mount");
    }
    cmdline.target = argv[optind];
    return cmdline;
}

auto usage() noexcept -> std::string_view {
    return "Usage: imgmount-cli [--config <file>] [--dry-run] <image-or-device>\n"
           "\n"
           "  -c, --config <file>  read settings from <file> (default /etc/imgmount.json)\n"
           "  -n, --dry-run        log commands instead of running them\n"
           "  -h, --help           show this help\n"sv;
}

}  // namespace cli
