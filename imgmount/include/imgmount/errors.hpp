#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>      // for uint8_t
#include <string_view>  // for string_view

namespace imgmount {

/// Why a mount or unmount did not complete.
enum class MountError : std::uint8_t {
    /// Probing tools failed, or the user declined to name the container type.
    ClassificationFailure,
    /// Child volume listing was malformed or empty.
    EnumerationFailure,
    /// The final mount/attach call failed.
    MountCommandFailure,
    /// A retirement step failed, kernel state is left behind.
    TeardownFailure,
    /// The user backed out of a selection.
    UserCancelled,
    /// Another mount is still outstanding in the given state.
    Busy
};

/// Converts MountError to string.
[[nodiscard]] auto mount_error_to_string(MountError error) noexcept -> std::string_view;

/// @brief Human readable explanation of the error, suitable for an error dialog.
[[nodiscard]] auto describe_mount_error(MountError error) noexcept -> std::string_view;

}  // namespace imgmount

#endif  // ERRORS_HPP
