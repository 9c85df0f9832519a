#include "imgmount/classifier.hpp"
#include "imgmount/collaborators.hpp"
#include "imgmount/executor.hpp"
#include "imgmount/hdiutil.hpp"
#include "imgmount/io_utils.hpp"
#include "imgmount/string_utils.hpp"

#include <algorithm>  // for find
#include <string>     // for string
#include <vector>     // for vector

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// partition table types known to parted
constexpr std::array<std::string_view, 10> PARTITION_TABLE_TYPES{
    "msdos"sv, "gpt"sv, "mac"sv, "pc98"sv, "sun"sv, "dvh"sv, "bsd"sv, "amiga"sv, "aix"sv, "atari"sv};

// Returns the n-th ':' separated field, keeping empty fields
auto get_field(std::string_view line, std::size_t index) noexcept -> std::optional<std::string_view> {
    for (std::size_t i = 0; i < index; ++i) {
        const auto sep_pos = line.find(':');
        if (sep_pos == std::string_view::npos) {
            return std::nullopt;
        }
        line.remove_prefix(sep_pos + 1);
    }
    return line.substr(0, line.find(':'));
}

}  // namespace

namespace imgmount::classifier {

auto parse_parted_output(std::string_view parted_output) noexcept -> std::optional<ContainerKind> {
    // errors from parted can end up in the output as well
    std::optional<std::string_view> disk_line{};
    for (auto&& line : utils::make_split_view(parted_output)) {
        const auto trimmed = utils::trim(line);
        if (trimmed.ends_with(';') && !trimmed.contains("BYT;"sv)) {
            disk_line = trimmed;
            break;
        }
    }
    if (!disk_line) {
        return std::nullopt;
    }

    const auto table_type = get_field(*disk_line, 5);
    if (!table_type) {
        return std::nullopt;
    }
    if (*table_type == "loop"sv) {
        return ContainerKind::Partition;
    }
    if (std::ranges::find(PARTITION_TABLE_TYPES, *table_type) != PARTITION_TABLE_TYPES.end()) {
        return ContainerKind::Device;
    }
    return std::nullopt;
}

auto container_kind_from_choice(std::string_view choice) noexcept -> std::optional<ContainerKind> {
    if (choice == CONTAINER_KIND_CHOICES[0]) {
        return ContainerKind::Partition;
    }
    if (choice == CONTAINER_KIND_CHOICES[1]) {
        return ContainerKind::Device;
    }
    if (choice == CONTAINER_KIND_CHOICES[2]) {
        return ContainerKind::LUKS;
    }
    if (choice == CONTAINER_KIND_CHOICES[3]) {
        return ContainerKind::LVM;
    }
    return std::nullopt;
}

auto classify_linux(Executor& executor, Selector& selector, std::string_view path) noexcept -> std::expected<ContainerKind, MountError> {
    spdlog::info("Determining the type of {}...", path);

    const auto& parted = executor.run(fmt::format(FMT_COMPILE("parted -m {} print"), path), true);
    if (!parted.success()) {
        spdlog::error("parted failed to read {}: {}", path, parted.output);
        return std::unexpected(MountError::ClassificationFailure);
    }
    if (auto kind = classifier::parse_parted_output(parted.output); kind) {
        spdlog::info("{} is a {}", path, container_kind_to_string(*kind));
        return *kind;
    }

    // parted didn't help, check for LUKS and LVM containers
    if (utils::is_dry_run()) {
        spdlog::info("Dry run, skipping the LUKS and LVM checks of {}", path);
    } else if (executor.run(fmt::format(FMT_COMPILE("cryptsetup isLuks {}"), path), true).success()) {
        spdlog::info("{} is a LUKS container", path);
        return ContainerKind::LUKS;
    } else if (const auto& file_info = executor.run(fmt::format(FMT_COMPILE("file -s {}"), path), true);
               file_info.success() && file_info.output.contains("LVM"sv)) {
        spdlog::info("{} is a LVM container", path);
        return ContainerKind::LVM;
    }

    spdlog::debug("Couldn't determine the type of {}, asking the user...", path);
    const std::vector<std::string> choices{CONTAINER_KIND_CHOICES.begin(), CONTAINER_KIND_CHOICES.end()};
    const auto& answer = selector.choose(CONTAINER_KIND_PROMPT, choices);
    if (!answer) {
        spdlog::info("User didn't tell the type of {}", path);
        return std::unexpected(MountError::ClassificationFailure);
    }

    const auto kind = classifier::container_kind_from_choice(*answer);
    if (!kind) {
        spdlog::error("Unknown container type answer: '{}'", *answer);
        return std::unexpected(MountError::ClassificationFailure);
    }
    return *kind;
}

auto classify_macos(Executor& executor, std::string_view path) noexcept -> std::expected<ContainerKind, MountError> {
    spdlog::info("Determining the type of {}...", path);

    const auto& imageinfo = hdiutil::run(executor, fmt::format(FMT_COMPILE("imageinfo {} -plist"), path));
    if (!imageinfo.success()) {
        spdlog::error("hdiutil failed to read {}: {}", path, imageinfo.output);
        return std::unexpected(MountError::ClassificationFailure);
    }

    const auto kind = hdiutil::is_whole_disk(imageinfo.output) ? ContainerKind::Partition : ContainerKind::Device;
    spdlog::info("{} is a {}", path, container_kind_to_string(kind));
    return kind;
}

}  // namespace imgmount::classifier
