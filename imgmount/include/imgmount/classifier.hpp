#ifndef CLASSIFIER_HPP
#define CLASSIFIER_HPP

#include "imgmount/container.hpp"
#include "imgmount/errors.hpp"

#include <array>        // for array
#include <expected>     // for expected
#include <optional>     // for optional
#include <string_view>  // for string_view

namespace imgmount {
class Executor;
class Selector;
}  // namespace imgmount

namespace imgmount::classifier {

/// Question asked when probing could not tell what the container is.
inline constexpr std::string_view CONTAINER_KIND_PROMPT = "What type of file/device did you recover from?";

/// Answers offered for CONTAINER_KIND_PROMPT.
inline constexpr std::array<std::string_view, 4> CONTAINER_KIND_CHOICES{
    "Partition (single file system or CD/DVD image)",
    "Device (multiple partitions)",
    "LUKS (encrypted storage) Container",
    "LVM Container",
};

/// @brief Reads the partition table type from `parted -m <path> print` output.
///
/// The first line ending with `;` that isn't the `BYT;` header describes the
/// disk, its 6th field is the table type.
/// @return Partition for `loop`, Device for a known partition table, std::nullopt otherwise.
auto parse_parted_output(std::string_view parted_output) noexcept -> std::optional<ContainerKind>;

/// @brief Maps an answer of CONTAINER_KIND_CHOICES back to the container kind.
auto container_kind_from_choice(std::string_view choice) noexcept -> std::optional<ContainerKind>;

/// @brief Determines the container type with parted, cryptsetup and file.
///
/// Asks the user when the checks are inconclusive.
/// @return The container kind, ClassificationFailure when parted fails or the user declines.
auto classify_linux(Executor& executor, Selector& selector, std::string_view path) noexcept -> std::expected<ContainerKind, MountError>;

/// @brief Determines the container type with `hdiutil imageinfo`.
/// @return Partition for an image without a partition map, Device otherwise.
auto classify_macos(Executor& executor, std::string_view path) noexcept -> std::expected<ContainerKind, MountError>;

}  // namespace imgmount::classifier

#endif  // CLASSIFIER_HPP
