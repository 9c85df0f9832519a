#include "app_config.hpp"  // for load_app_config, parse_command_line
#include "tui.hpp"         // for MenuSelector, DialogNotifier
#include "widgets.hpp"     // for unmount_dialog, unmounted_dialog

#include "imgmount/executor.hpp"
#include "imgmount/logger.hpp"
#include "imgmount/mount_engine.hpp"

#include <cstddef>  // for size_t
#include <cstdlib>  // for setenv

#include <chrono>  // for seconds

#include <fmt/core.h>

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for level
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

int main(int argc, char** argv) {
    const auto& cmdline = cli::parse_command_line(argc, argv);
    if (!cmdline) {
        fmt::print(stderr, "{}\n\n{}", cmdline.error(), cli::usage());
        return 1;
    }
    if (cmdline->show_help) {
        fmt::print("{}", cli::usage());
        return 0;
    }

    // Commands are only logged from now on.
    if (cmdline->dry_run) {
        ::setenv("DIRTY_CMD_RUN", "1", 1);
    }

    const auto& config = cli::load_app_config(cmdline->config_path);
    if (!config) {
        fmt::print(stderr, "Invalid configuration: {}\n", config.error());
        return 1;
    }

    // Initialize logger.
    auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("imgmount_logger", config->log_file);
    imgmount::logger::set_logger(logger);
    spdlog::set_pattern("[%r][%^---%L---%$] %v");
    spdlog::set_level(spdlog::level::from_str(config->log_level));
    spdlog::flush_every(std::chrono::seconds(5));

    spdlog::info("Mounting '{}' ({}, dry run: {})", cmdline->target, imgmount::platform_to_string(config->platform), cmdline->dry_run);

    imgmount::ShellExecutor executor{config->elevation_command, config->elevation_retries};
    tui::MenuSelector selector{};
    tui::DialogNotifier notifier{};

    const imgmount::EngineConfig engine_config{
        .mount_root        = config->mount_root,
        .max_nesting_depth = static_cast<std::size_t>(config->max_nesting_depth),
        .platform          = config->platform,
    };
    imgmount::MountEngine engine{engine_config, executor, selector, notifier};
    imgmount::MountState state{};

    const auto& mount_point = engine.mount({.path = cmdline->target, .platform = config->platform}, state);
    if (!mount_point) {
        spdlog::error("Mounting '{}' failed: {}", cmdline->target, imgmount::mount_error_to_string(mount_point.error()));
        spdlog::shutdown();
        return 1;
    }

    while (!tui::widgets::unmount_dialog(*mount_point)) {
        spdlog::debug("Keeping '{}' mounted", *mount_point);
    }

    if (const auto& unmounted = engine.unmount(state); !unmounted) {
        spdlog::error("Unmounting '{}' failed: {}", *mount_point, imgmount::mount_error_to_string(unmounted.error()));
        spdlog::shutdown();
        return 1;
    }
    tui::widgets::unmounted_dialog(cmdline->target);

    spdlog::shutdown();
}
