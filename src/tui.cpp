#include "tui.hpp"
#include "widgets.hpp"

#include <cstddef>  // for size_t

#include <spdlog/spdlog.h>

#include <ftxui/component/component.hpp>           // for Menu, Renderer, Vertical
#include <ftxui/component/component_options.hpp>   // for MenuOption
#include <ftxui/component/screen_interactive.hpp>  // for ScreenInteractive
#include <ftxui/dom/elements.hpp>                  // for vbox, frame, separator

using namespace ftxui;

namespace tui {

auto MenuSelector::choose(std::string_view prompt, const std::vector<std::string>& options) noexcept -> std::optional<std::string> {
    if (options.empty()) {
        return std::nullopt;
    }

    auto screen = ScreenInteractive::Fullscreen();
    int selected{};
    bool picked{};
    const auto pick = [&] {
        picked = true;
        screen.ExitLoopClosure()();
    };

    auto menu_option     = MenuOption::Vertical();
    menu_option.on_enter = pick;
    auto menu            = Menu(&options, &selected, menu_option);
    auto buttons         = widgets::button_row({{"Select", pick}, {"Cancel", screen.ExitLoopClosure()}});
    auto layout          = Container::Vertical({menu, buttons});

    auto renderer = Renderer(layout, [&] {
        return widgets::dialog_frame(vbox({
                                         widgets::wrapped_text(prompt),
                                         separator(),
                                         menu->Render() | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 15),
                                     }),
            buttons);
    });
    screen.Loop(renderer);

    if (!picked) {
        spdlog::info("'{}' was cancelled", prompt);
        return std::nullopt;
    }
    const auto& choice = options[static_cast<std::size_t>(selected)];
    spdlog::info("'{}': picked '{}'", prompt, choice);
    return choice;
}

void DialogNotifier::report_error(std::string_view message) noexcept {
    spdlog::error("{}", message);
    widgets::error_dialog(message);
}

}  // namespace tui
