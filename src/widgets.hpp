#ifndef WIDGETS_HPP
#define WIDGETS_HPP

#include <functional>   // for function
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <ftxui/component/component_base.hpp>  // for Component
#include <ftxui/dom/elements.hpp>              // for Element

namespace tui {

inline constexpr std::string_view APP_TITLE = "imgmount - output container mounter";

namespace widgets {
    struct ButtonSpec {
        std::string label;
        std::function<void()> on_click;
    };

    /// Buttons side by side, in the given order.
    auto button_row(const std::vector<ButtonSpec>& buttons) noexcept -> ftxui::Component;

    /// Application title on top, body and buttons in a box centered below it.
    auto dialog_frame(const ftxui::Element& body, const ftxui::Component& buttons) noexcept -> ftxui::Element;

    /// Word-wrapped text, one paragraph per line of content.
    auto wrapped_text(std::string_view content) noexcept -> ftxui::Element;

    /// Shows why mounting or unmounting failed and waits for OK.
    void error_dialog(std::string_view error_message) noexcept;

    /// Shows where the container is mounted.
    /// @return true once the user wants it unmounted.
    bool unmount_dialog(std::string_view mount_point) noexcept;

    /// Confirms the container was unmounted and every device detached.
    void unmounted_dialog(std::string_view target) noexcept;
}  // namespace widgets
}  // namespace tui

#endif  // WIDGETS_HPP
