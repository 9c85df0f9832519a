#include "imgmount/lvm.hpp"
#include "imgmount/executor.hpp"
#include "imgmount/string_utils.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace imgmount::lvm {

auto find_volume_group(std::string_view pvs_output, std::string_view pv_device) noexcept -> std::optional<std::string> {
    for (auto&& line : utils::make_split_view(pvs_output)) {
        const auto& columns = utils::split_columns(line);
        if (columns.size() >= 2 && columns[0] == pv_device) {
            return std::string{columns[1]};
        }
    }
    return std::nullopt;
}

auto parse_logical_volumes(std::string_view lvs_output, std::string_view volume_group) noexcept -> std::vector<LogicalVolume> {
    std::vector<LogicalVolume> volumes{};
    for (auto&& line : utils::make_split_view(lvs_output)) {
        const auto& columns = utils::split_columns(line);
        // e.g format: <lv_name> <vg_name> <lv_size>
        if (columns.size() >= 3 && columns[1] == volume_group) {
            volumes.emplace_back(LogicalVolume{
                .name         = std::string{columns[0]},
                .volume_group = std::string{columns[1]},
                .size         = std::string{columns[2]},
            });
        }
    }
    return volumes;
}

auto query_volume_group(Executor& executor, std::string_view pv_device) noexcept -> std::optional<std::string> {
    const auto& pvs = executor.run("pvs --noheadings -o pv_name,vg_name"sv, true);
    if (!pvs.success()) {
        spdlog::error("Failed to list physical volumes: {}", pvs.output);
        return std::nullopt;
    }
    auto volume_group = lvm::find_volume_group(pvs.output, pv_device);
    if (!volume_group) {
        spdlog::error("No volume group found for physical volume {}", pv_device);
    }
    return volume_group;
}

auto list_logical_volumes(Executor& executor, std::string_view volume_group) noexcept -> std::optional<std::vector<LogicalVolume>> {
    const auto& lvs = executor.run("lvs --noheadings --units m -o lv_name,vg_name,lv_size"sv, true);
    if (!lvs.success()) {
        spdlog::error("Failed to list logical volumes: {}", lvs.output);
        return std::nullopt;
    }
    return lvm::parse_logical_volumes(lvs.output, volume_group);
}

auto activate_volume_group(Executor& executor, std::string_view volume_group) noexcept -> bool {
    if (!executor.run(fmt::format(FMT_COMPILE("vgchange -a y {}"), volume_group), true).success()) {
        spdlog::error("Failed to activate volume group {}", volume_group);
        return false;
    }
    spdlog::info("Volume group {} activated", volume_group);
    return true;
}

auto deactivate_volume_group(Executor& executor, std::string_view volume_group) noexcept -> bool {
    if (!executor.run(fmt::format(FMT_COMPILE("vgchange -a n {}"), volume_group), true).success()) {
        spdlog::error("Failed to deactivate volume group {}", volume_group);
        return false;
    }
    spdlog::info("Volume group {} deactivated", volume_group);
    return true;
}

}  // namespace imgmount::lvm
