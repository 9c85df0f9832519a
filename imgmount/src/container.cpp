#include "imgmount/container.hpp"

#include <algorithm>  // for sort

using namespace std::string_view_literals;

namespace imgmount {

auto container_kind_to_string(ContainerKind kind) noexcept -> std::string_view {
    switch (kind) {
    case ContainerKind::Partition:
        return "Partition"sv;
    case ContainerKind::Device:
        return "Device"sv;
    case ContainerKind::LVM:
        return "LVM"sv;
    case ContainerKind::LUKS:
        return "LUKS"sv;
    }
    return "unknown"sv;
}

auto platform_to_string(Platform platform) noexcept -> std::string_view {
    switch (platform) {
    case Platform::Linux:
        return "linux"sv;
    case Platform::MacOS:
        return "macos"sv;
    }
    return "unknown"sv;
}

auto platform_from_string(std::string_view platform_str) noexcept -> std::optional<Platform> {
    if (platform_str == "linux"sv) {
        return Platform::Linux;
    }
    if (platform_str == "macos"sv) {
        return Platform::MacOS;
    }
    return std::nullopt;
}

auto nested_container_kind(const VolumeChoice& choice) noexcept -> std::optional<ContainerKind> {
    if (!choice.filesystem) {
        return std::nullopt;
    }
    const auto& fstype = *choice.filesystem;
    if (fstype == "LVM2_member"sv) {
        return ContainerKind::LVM;
    }
    if (fstype == "crypto_LUKS"sv) {
        return ContainerKind::LUKS;
    }
    return std::nullopt;
}

void sort_choices(std::vector<VolumeChoice>& choices) noexcept {
    std::ranges::sort(choices, {}, &VolumeChoice::label);
}

}  // namespace imgmount
