#ifndef COLLABORATORS_HPP
#define COLLABORATORS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace imgmount {

/// @brief Asks the user to pick one of several options.
class Selector {
 public:
    virtual ~Selector() = default;

    /// @brief Block until the user picks an option.
    /// @param prompt Question shown above the options.
    /// @param options Options, in presentation order.
    /// @return The selected option, or std::nullopt when the user cancelled.
    virtual auto choose(std::string_view prompt, const std::vector<std::string>& options) noexcept -> std::optional<std::string> = 0;
};

/// @brief Tells the user something went wrong.
class Notifier {
 public:
    virtual ~Notifier() = default;

    virtual void report_error(std::string_view message) noexcept = 0;
};

}  // namespace imgmount

#endif  // COLLABORATORS_HPP
