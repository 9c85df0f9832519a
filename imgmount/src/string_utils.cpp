#include "imgmount/string_utils.hpp"

#include <cctype>  // for isspace

namespace imgmount::utils {

auto make_multiline_view(std::string_view str, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    return lines;
}

auto split_columns(std::string_view line) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> columns{};

    std::size_t pos{};
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        const auto start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        if (pos > start) {
            columns.emplace_back(line.substr(start, pos - start));
        }
    }
    return columns;
}

auto trim(std::string_view str) noexcept -> std::string_view {
    const auto is_space = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };

    while (!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

auto join(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    return lines | std::ranges::views::join_with(delim) | std::ranges::to<std::string>();
}

}  // namespace imgmount::utils
