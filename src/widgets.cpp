#include "widgets.hpp"

#include "imgmount/string_utils.hpp"  // for make_split_view

#include <utility>  // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <ftxui/component/component.hpp>           // for Button, Renderer, Horizontal
#include <ftxui/component/component_options.hpp>   // for ButtonOption
#include <ftxui/component/screen_interactive.hpp>  // for ScreenInteractive
#include <ftxui/dom/elements.hpp>                  // for paragraph, vbox, border

using namespace ftxui;

namespace {

constexpr auto DIALOG_WIDTH = 72;

// Runs a dialog until one of its buttons exits the loop.
void show_dialog(ScreenInteractive& screen, const Component& buttons, const std::function<Element()>& body) noexcept {
    auto renderer = Renderer(buttons, [&] {
        return tui::widgets::dialog_frame(body(), buttons);
    });
    screen.Loop(renderer);
}

}  // namespace

namespace tui::widgets {

auto button_row(const std::vector<ButtonSpec>& buttons) noexcept -> Component {
    Components row{};
    for (const auto& button : buttons) {
        if (!row.empty()) {
            row.emplace_back(Renderer([] { return text("   "); }));
        }
        row.emplace_back(Button(button.label, button.on_click, ButtonOption::Ascii()));
    }
    return Container::Horizontal(std::move(row));
}

auto dialog_frame(const Element& body, const Component& buttons) noexcept -> Element {
    auto box = vbox({
        body,
        separator(),
        buttons->Render() | hcenter,
    });

    return vbox({
        text(std::string{APP_TITLE}) | bold,
        filler(),
        box | border | size(WIDTH, LESS_THAN, DIALOG_WIDTH) | center,
        filler(),
    });
}

auto wrapped_text(std::string_view content) noexcept -> Element {
    Elements lines{};
    for (auto&& line : imgmount::utils::make_split_view(content)) {
        lines.emplace_back(paragraph(std::string{line}));
    }
    return vbox(std::move(lines));
}

void error_dialog(std::string_view error_message) noexcept {
    auto screen  = ScreenInteractive::Fullscreen();
    auto buttons = button_row({{"OK", screen.ExitLoopClosure()}});

    show_dialog(screen, buttons, [&] {
        return vbox({
            text("Something went wrong") | bold | color(Color::Red),
            separator(),
            wrapped_text(error_message),
        });
    });
}

bool unmount_dialog(std::string_view mount_point) noexcept {
    auto screen = ScreenInteractive::Fullscreen();

    bool unmount{};
    auto buttons = button_row({
        {"Unmount", [&] {
             unmount = true;
             screen.ExitLoopClosure()();
         }},
        {"Not yet", screen.ExitLoopClosure()},
    });

    show_dialog(screen, buttons, [&] {
        return vbox({
            text("The output container is mounted read-only at"),
            text(std::string{mount_point}) | bold | hcenter,
            separator(),
            paragraph("Copy the files you need, then choose Unmount to detach every device that was set up for it."),
        });
    });
    return unmount;
}

void unmounted_dialog(std::string_view target) noexcept {
    auto screen  = ScreenInteractive::Fullscreen();
    auto buttons = button_row({{"OK", screen.ExitLoopClosure()}});

    show_dialog(screen, buttons, [&] {
        return wrapped_text(fmt::format(FMT_COMPILE("{} has been unmounted.\nAll loop devices and volume groups set up for it are released."), target));
    });
}

}  // namespace tui::widgets
