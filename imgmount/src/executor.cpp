#include "imgmount/executor.hpp"
#include "imgmount/io_utils.hpp"

#include <sys/wait.h>  // for WEXITSTATUS, WIFEXITED

#include <cstdio>  // for feof, fgets, pclose, popen

#include <array>    // for array
#include <memory>   // for unique_ptr
#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

// pkexec: 126 - the authorization dialog was dismissed, 127 - not authorized.
// sh also exits with 127 when the command itself is missing, asking again won't help then.
bool is_elevation_failure(const imgmount::CommandResult& result) noexcept {
    if (result.exit_code == 126) {
        return true;
    }
    return result.exit_code == 127 && !result.output.contains("not found"sv);
}

auto shell_quote(std::string_view str) noexcept -> std::string {
    std::string quoted{"'"};
    for (const char ch : str) {
        if (ch == '\'') {
            quoted += R"('\'')";
        } else {
            quoted += ch;
        }
    }
    quoted += '\'';
    return quoted;
}

auto run_pipe(const std::string& cmdline) noexcept -> imgmount::CommandResult {
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmdline.c_str(), "r"), pclose);
    if (!pipe) {
        spdlog::error("popen failed! '{}'", cmdline);
        return {.exit_code = -1, .output = {}};
    }

    std::string result{};
    std::array<char, 512> buffer{};
    while (!feof(pipe.get())) {
        if (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
            result += buffer.data();
        }
    }

    // the exit status is only available from pclose
    const auto status = pclose(pipe.release());
    if (status == -1) {
        spdlog::error("pclose failed! '{}'", cmdline);
        return {.exit_code = -1, .output = std::move(result)};
    }
    const std::int32_t exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return {.exit_code = exit_code, .output = std::move(result)};
}

}  // namespace

namespace imgmount {

ShellExecutor::ShellExecutor(std::string elevation_command, std::int32_t elevation_retries, RootCheck is_root) noexcept
  : m_elevation_command(std::move(elevation_command)), m_elevation_retries(elevation_retries), m_is_root(is_root) { }

auto ShellExecutor::run(std::string_view command, bool elevated) noexcept -> CommandResult {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;

    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec] cmd := '{}' (elevated: {})", command, elevated);
    }
    if (utils::is_dry_run()) {
        spdlog::info("[dry run] '{}' (elevated: {})", command, elevated);
        return {};
    }

    const bool use_helper = elevated && !m_elevation_command.empty() && !m_is_root();
    const auto& cmdline   = use_helper
          ? fmt::format(FMT_COMPILE("{} env LC_ALL=C sh -c {} 2>&1"), m_elevation_command, shell_quote(command))
          : fmt::format(FMT_COMPILE("LC_ALL=C sh -c {} 2>&1"), shell_quote(command));

    auto result = run_pipe(cmdline);
    for (std::int32_t attempt = 0; use_helper && is_elevation_failure(result) && attempt < m_elevation_retries; ++attempt) {
        spdlog::warn("[exec] elevation via '{}' failed with {}, asking again", m_elevation_command, result.exit_code);
        result = run_pipe(cmdline);
    }

    spdlog::debug("[exec] '{}': return value: {}, output: \"{}\"", command, result.exit_code, result.output);
    return result;
}

}  // namespace imgmount
