#ifndef MOUNT_ENGINE_HPP
#define MOUNT_ENGINE_HPP

#include "imgmount/container.hpp"
#include "imgmount/errors.hpp"
#include "imgmount/mounter.hpp"

#include <cstddef>      // for size_t
#include <expected>     // for expected
#include <memory>       // for unique_ptr
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace imgmount {

class Executor;
class Notifier;
class Selector;

/// Question asked when a container holds several volumes.
inline constexpr std::string_view VOLUME_SELECTION_PROMPT = "Please select which partition you wish to mount.";

struct EngineConfig {
    /// Directory receiving mount points, Linux only.
    std::string mount_root{"/tmp/imgmount"};
    /// How many layers a mount may stack before giving up.
    std::size_t max_nesting_depth{4};
    Platform platform{host_platform()};
};

/// @brief Mounts output containers of unknown structure, and unwinds them again.
///
/// Classifies the container, lets the user pick a child volume while descending
/// through devices and volume groups, then mounts the final filesystem read-only.
/// Every layer materialized on the way is recorded in the caller's MountState.
class MountEngine {
 public:
    MountEngine(std::unique_ptr<Mounter> mounter, Selector& selector, Notifier& notifier, std::size_t max_nesting_depth = 4) noexcept;
    MountEngine(const EngineConfig& config, Executor& executor, Selector& selector, Notifier& notifier) noexcept;

    /// @brief Mount the container.
    /// @param container The output file or device.
    /// @param state Must be empty, holds the layers and the mount point on success.
    /// @return The mount point. On failure the state is torn down again,
    ///         unless the teardown itself failed (TeardownFailure).
    auto mount(const OutputContainer& container, MountState& state) noexcept -> std::expected<std::string, MountError>;

    /// @brief Unmount the filesystem and retire every layer, innermost first.
    ///
    /// Does nothing on an empty state. Layers are removed from the state as
    /// they are retired, so a failed unmount can be retried.
    auto unmount(MountState& state) noexcept -> std::expected<void, MountError>;

 private:
    auto descend(std::string_view image_path, const std::string& device, std::optional<ContainerKind> known_kind, std::size_t depth, MountState& state) noexcept -> std::expected<std::string, MountError>;
    auto retire_layers(MountState& state) noexcept -> std::expected<void, MountError>;
    auto fail(MountError error) noexcept -> std::unexpected<MountError>;

    std::unique_ptr<Mounter> m_mounter;
    Selector& m_selector;
    Notifier& m_notifier;
    std::size_t m_max_nesting_depth;
};

}  // namespace imgmount

#endif  // MOUNT_ENGINE_HPP
