#ifndef PLIST_HPP
#define PLIST_HPP

#include <cstdint>      // for int64_t, uint8_t
#include <expected>     // for expected
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace imgmount::plist {

enum class NodeType : std::uint8_t {
    String,
    Integer,
    Real,
    Boolean,
    Data,
    Date,
    Array,
    Dict
};

/// @brief A value of an XML property list, as printed by `hdiutil ... -plist`.
struct Node {
    NodeType type{NodeType::String};
    /// Text of scalar values, "true"/"false" for booleans.
    std::string value{};
    /// Keys of a dict, parallel to children.
    std::vector<std::string> keys{};
    /// Array items or dict values.
    std::vector<Node> children{};

    /// @brief Looks up a key of a dict.
    /// @return The value, nullptr when this is not a dict or the key is missing.
    [[nodiscard]] auto find(std::string_view key) const noexcept -> const Node*;

    [[nodiscard]] auto as_integer() const noexcept -> std::optional<std::int64_t>;
    [[nodiscard]] auto as_string() const noexcept -> std::optional<std::string_view>;
};

/// @brief Parses an XML property list document.
/// @param xml The document, text before the <?xml?> declaration is tolerated.
/// @return The root value, or a description of what is malformed.
[[nodiscard]] auto parse(std::string_view xml) noexcept -> std::expected<Node, std::string>;

}  // namespace imgmount::plist

#endif  // PLIST_HPP
