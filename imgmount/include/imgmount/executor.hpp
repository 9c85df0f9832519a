#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include "imgmount/io_utils.hpp"

#include <cstdint>      // for int32_t
#include <string>       // for string
#include <string_view>  // for string_view

namespace imgmount {

/// @brief Outcome of a finished external command.
struct CommandResult {
    /// Exit code of the command, -1 when it could not be started.
    std::int32_t exit_code{};
    /// Captured stdout and stderr, combined.
    std::string output{};

    [[nodiscard]] constexpr bool success() const noexcept {
        return exit_code == 0;
    }
};

/// @brief Runs shell commands on behalf of the engine.
///
/// Elevation, credential prompts and retrying of a dismissed prompt are the
/// executor's business. The engine only looks at the exit code and output.
class Executor {
 public:
    virtual ~Executor() = default;

    /// @brief Run a command and wait for it to exit.
    /// @param command The full shell command line.
    /// @param elevated Whether the command needs root privileges.
    /// @return The exit code and combined output.
    virtual auto run(std::string_view command, bool elevated) noexcept -> CommandResult = 0;
};

/// @brief Executor backed by popen(3).
class ShellExecutor final : public Executor {
 public:
    /// Tells whether the process already has root privileges.
    using RootCheck = bool (*)() noexcept;

    /// @param elevation_command Helper prefixed to elevated commands when not root (e.g pkexec), empty to never elevate.
    /// @param elevation_retries How many more times to try when the helper reports a dismissed or refused prompt.
    /// @param is_root Decides whether the helper is needed.
    explicit ShellExecutor(std::string elevation_command = "pkexec", std::int32_t elevation_retries = 2, RootCheck is_root = utils::is_root) noexcept;

    auto run(std::string_view command, bool elevated) noexcept -> CommandResult override;

 private:
    std::string m_elevation_command;
    std::int32_t m_elevation_retries;
    RootCheck m_is_root;
};

}  // namespace imgmount

#endif  // EXECUTOR_HPP
