#ifndef TUI_HPP
#define TUI_HPP

#include "imgmount/collaborators.hpp"

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace tui {

/// Lets the user pick a volume, or the container type, from a fullscreen menu.
class MenuSelector final : public imgmount::Selector {
 public:
    auto choose(std::string_view prompt, const std::vector<std::string>& options) noexcept -> std::optional<std::string> override;
};

/// Shows engine errors in a dialog, and logs them.
class DialogNotifier final : public imgmount::Notifier {
 public:
    void report_error(std::string_view message) noexcept override;
};

}  // namespace tui

#endif  // TUI_HPP
