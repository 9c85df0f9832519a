#include "imgmount/loop.hpp"
#include "imgmount/executor.hpp"
#include "imgmount/string_utils.hpp"

#include <algorithm>  // for all_of
#include <cctype>     // for isdigit

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace imgmount::loop {

auto parse_kpartx_loop_device(std::string_view kpartx_output) noexcept -> std::optional<std::string> {
    for (auto&& line : utils::make_split_view(kpartx_output)) {
        const auto& columns = utils::split_columns(line);
        if (columns.size() < 3 || columns[0] != "add"sv || columns[1] != "map"sv) {
            continue;
        }

        // loop1p1 -> loop1
        const auto mapping  = columns[2];
        const auto part_pos = mapping.rfind('p');
        if (part_pos == std::string_view::npos || part_pos + 1 == mapping.size()) {
            continue;
        }
        const auto is_digit    = [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; };
        const auto loop_device = mapping.substr(0, part_pos);
        const auto part_number = mapping.substr(part_pos + 1);
        if (loop_device.empty() || !is_digit(loop_device.back()) || !std::ranges::all_of(part_number, is_digit)) {
            continue;
        }
        return std::string{loop_device};
    }
    return std::nullopt;
}

auto map_partitions(Executor& executor, std::string_view image_path) noexcept -> std::optional<std::string> {
    spdlog::info("Creating loop device for {}...", image_path);
    const auto& kpartx = executor.run(fmt::format(FMT_COMPILE("kpartx -av {}"), image_path), true);
    if (!kpartx.success()) {
        spdlog::error("kpartx failed to map {}: {}", image_path, kpartx.output);
        return std::nullopt;
    }

    // make sure the new loop device has been searched
    if (!executor.run("partprobe"sv, true).success()) {
        spdlog::warn("partprobe reported an error, partitions may be missing");
    }

    auto loop_device = loop::parse_kpartx_loop_device(kpartx.output);
    if (!loop_device) {
        spdlog::error("kpartx didn't map any partitions of {}", image_path);
    }
    return loop_device;
}

auto unmap_partitions(Executor& executor, std::string_view image_path) noexcept -> bool {
    // This doesn't fail when the mapping is already gone
    if (!executor.run(fmt::format(FMT_COMPILE("kpartx -d {}"), image_path), true).success()) {
        spdlog::error("Failed to pull down the loop device of {}", image_path);
        return false;
    }
    spdlog::info("Pulled down the loop device of {}", image_path);
    return true;
}

auto attach(Executor& executor, std::string_view image_path) noexcept -> std::optional<std::string> {
    const auto& losetup = executor.run(fmt::format(FMT_COMPILE("losetup -f --show {}"), image_path), true);
    const auto loop_device = utils::trim(losetup.output);
    if (!losetup.success() || !loop_device.starts_with("/dev/loop"sv)) {
        spdlog::error("Failed to attach {} as loop device: {}", image_path, losetup.output);
        return std::nullopt;
    }
    return std::string{loop_device};
}

auto detach(Executor& executor, std::string_view loop_device) noexcept -> bool {
    if (!executor.run(fmt::format(FMT_COMPILE("losetup -d {}"), loop_device), true).success()) {
        spdlog::error("Failed to detach loop device {}", loop_device);
        return false;
    }
    return true;
}

}  // namespace imgmount::loop
