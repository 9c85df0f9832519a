#include "imgmount/plist.hpp"

#include <cctype>    // for isspace
#include <charconv>  // for from_chars
#include <utility>   // for move, pair

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

using imgmount::plist::Node;
using imgmount::plist::NodeType;

constexpr std::size_t MAX_NESTING = 64;

struct Tag {
    std::string_view name{};
    bool closing{};
    bool self_closing{};
};

auto decode_entities(std::string_view text) noexcept -> std::string {
    std::string decoded{};
    decoded.reserve(text.size());

    while (!text.empty()) {
        const auto amp_pos = text.find('&');
        decoded += text.substr(0, amp_pos);
        if (amp_pos == std::string_view::npos) {
            break;
        }
        text.remove_prefix(amp_pos);

        static constexpr std::pair<std::string_view, char> entities[] = {
            {"&amp;"sv, '&'}, {"&lt;"sv, '<'}, {"&gt;"sv, '>'}, {"&quot;"sv, '"'}, {"&apos;"sv, '\''}};
        bool replaced{};
        for (const auto& [entity, ch] : entities) {
            if (text.starts_with(entity)) {
                decoded += ch;
                text.remove_prefix(entity.size());
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            decoded += '&';
            text.remove_prefix(1);
        }
    }
    return decoded;
}

class Parser final {
 public:
    explicit Parser(std::string_view input) noexcept : m_input(input) { }

    auto parse_document() noexcept -> std::expected<Node, std::string> {
        const auto plist_pos = m_input.find("<plist"sv);
        if (plist_pos == std::string_view::npos) {
            return std::unexpected("no <plist> element");
        }
        m_pos = plist_pos;

        auto root_tag = read_tag();
        if (!root_tag) {
            return std::unexpected(std::move(root_tag.error()));
        }
        if (root_tag->self_closing) {
            return std::unexpected("empty <plist> element");
        }

        auto root = parse_value(0);
        if (!root) {
            return root;
        }

        skip_misc();
        auto end_tag = read_tag();
        if (!end_tag || !end_tag->closing || end_tag->name != "plist"sv) {
            return std::unexpected("expected </plist>");
        }
        return root;
    }

 private:
    std::string_view m_input;
    std::size_t m_pos{};

    void skip_whitespace() noexcept {
        while (m_pos < m_input.size() && std::isspace(static_cast<unsigned char>(m_input[m_pos]))) {
            ++m_pos;
        }
    }

    // whitespace, comments, declarations
    void skip_misc() noexcept {
        while (true) {
            skip_whitespace();
            const auto rest = m_input.substr(m_pos);
            std::string_view terminator{};
            if (rest.starts_with("<!--"sv)) {
                terminator = "-->"sv;
            } else if (rest.starts_with("<?"sv)) {
                terminator = "?>"sv;
            } else if (rest.starts_with("<!"sv)) {
                terminator = ">"sv;
            } else {
                return;
            }
            const auto end_pos = m_input.find(terminator, m_pos);
            m_pos              = (end_pos == std::string_view::npos) ? m_input.size() : end_pos + terminator.size();
        }
    }

    [[nodiscard]] auto peek_closing(std::string_view name) const noexcept -> bool {
        const auto rest = m_input.substr(m_pos);
        return rest.starts_with("</"sv) && rest.substr(2).starts_with(name);
    }

    auto read_tag() noexcept -> std::expected<Tag, std::string> {
        if (m_pos >= m_input.size() || m_input[m_pos] != '<') {
            return std::unexpected(fmt::format(FMT_COMPILE("expected tag at offset {}"), m_pos));
        }
        const auto end_pos = m_input.find('>', m_pos);
        if (end_pos == std::string_view::npos) {
            return std::unexpected(fmt::format(FMT_COMPILE("unterminated tag at offset {}"), m_pos));
        }

        auto body = m_input.substr(m_pos + 1, end_pos - m_pos - 1);
        m_pos     = end_pos + 1;

        Tag tag{};
        if (body.starts_with('/')) {
            tag.closing = true;
            body.remove_prefix(1);
        }
        if (body.ends_with('/')) {
            tag.self_closing = true;
            body.remove_suffix(1);
        }
        const auto name_end = body.find_first_of(" \t\r\n"sv);
        tag.name            = body.substr(0, name_end);
        return tag;
    }

    auto read_text(std::string_view name) noexcept -> std::expected<std::string, std::string> {
        const auto& closing = fmt::format(FMT_COMPILE("</{}>"), name);
        const auto end_pos  = m_input.find(closing, m_pos);
        if (end_pos == std::string_view::npos) {
            return std::unexpected(fmt::format(FMT_COMPILE("missing {}"), closing));
        }
        auto text = decode_entities(m_input.substr(m_pos, end_pos - m_pos));
        m_pos     = end_pos + closing.size();
        return text;
    }

    auto parse_value(std::size_t depth) noexcept -> std::expected<Node, std::string> {
        if (depth > MAX_NESTING) {
            return std::unexpected("plist nested too deep");
        }

        skip_misc();
        auto tag = read_tag();
        if (!tag) {
            return std::unexpected(std::move(tag.error()));
        }
        if (tag->closing) {
            return std::unexpected(fmt::format(FMT_COMPILE("unexpected </{}>"), tag->name));
        }

        if (tag->name == "dict"sv) {
            return parse_dict(*tag, depth);
        }
        if (tag->name == "array"sv) {
            return parse_array(*tag, depth);
        }
        if (tag->name == "true"sv || tag->name == "false"sv) {
            return Node{.type = NodeType::Boolean, .value = std::string{tag->name}};
        }

        NodeType type{};
        if (tag->name == "string"sv) {
            type = NodeType::String;
        } else if (tag->name == "integer"sv) {
            type = NodeType::Integer;
        } else if (tag->name == "real"sv) {
            type = NodeType::Real;
        } else if (tag->name == "data"sv) {
            type = NodeType::Data;
        } else if (tag->name == "date"sv) {
            type = NodeType::Date;
        } else {
            return std::unexpected(fmt::format(FMT_COMPILE("unknown element <{}>"), tag->name));
        }

        if (tag->self_closing) {
            return Node{.type = type};
        }
        auto text = read_text(tag->name);
        if (!text) {
            return std::unexpected(std::move(text.error()));
        }
        return Node{.type = type, .value = std::move(*text)};
    }

    auto parse_dict(const Tag& tag, std::size_t depth) noexcept -> std::expected<Node, std::string> {
        Node dict{.type = NodeType::Dict};
        if (tag.self_closing) {
            return dict;
        }

        while (true) {
            skip_misc();
            if (m_pos >= m_input.size()) {
                return std::unexpected("missing </dict>");
            }
            if (peek_closing("dict"sv)) {
                auto end_tag = read_tag();
                if (!end_tag) {
                    return std::unexpected(std::move(end_tag.error()));
                }
                return dict;
            }

            auto key_tag = read_tag();
            if (!key_tag) {
                return std::unexpected(std::move(key_tag.error()));
            }
            if (key_tag->closing || key_tag->name != "key"sv) {
                return std::unexpected(fmt::format(FMT_COMPILE("expected <key> in dict, got <{}>"), key_tag->name));
            }
            std::string key{};
            if (!key_tag->self_closing) {
                auto key_text = read_text("key"sv);
                if (!key_text) {
                    return std::unexpected(std::move(key_text.error()));
                }
                key = std::move(*key_text);
            }

            auto value = parse_value(depth + 1);
            if (!value) {
                return value;
            }
            dict.keys.emplace_back(std::move(key));
            dict.children.emplace_back(std::move(*value));
        }
    }

    auto parse_array(const Tag& tag, std::size_t depth) noexcept -> std::expected<Node, std::string> {
        Node array{.type = NodeType::Array};
        if (tag.self_closing) {
            return array;
        }

        while (true) {
            skip_misc();
            if (m_pos >= m_input.size()) {
                return std::unexpected("missing </array>");
            }
            if (peek_closing("array"sv)) {
                auto end_tag = read_tag();
                if (!end_tag) {
                    return std::unexpected(std::move(end_tag.error()));
                }
                return array;
            }

            auto item = parse_value(depth + 1);
            if (!item) {
                return item;
            }
            array.children.emplace_back(std::move(*item));
        }
    }
};

}  // namespace

namespace imgmount::plist {

auto Node::find(std::string_view key) const noexcept -> const Node* {
    if (type != NodeType::Dict) {
        return nullptr;
    }
    for (std::size_t i = 0; i < keys.size() && i < children.size(); ++i) {
        if (keys[i] == key) {
            return &children[i];
        }
    }
    return nullptr;
}

auto Node::as_integer() const noexcept -> std::optional<std::int64_t> {
    if (type != NodeType::Integer) {
        return std::nullopt;
    }
    std::int64_t result{};
    const auto* first = value.data();
    const auto* last  = value.data() + value.size();
    auto [ptr, ec]    = std::from_chars(first, last, result);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return result;
}

auto Node::as_string() const noexcept -> std::optional<std::string_view> {
    if (type != NodeType::String) {
        return std::nullopt;
    }
    return std::string_view{value};
}

auto parse(std::string_view xml) noexcept -> std::expected<Node, std::string> {
    return Parser{xml}.parse_document();
}

}  // namespace imgmount::plist
