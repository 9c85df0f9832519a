#ifndef LVM_HPP
#define LVM_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace imgmount {
class Executor;
}  // namespace imgmount

namespace imgmount::lvm {

struct LogicalVolume {
    std::string name{};
    std::string volume_group{};
    std::string size{};
};

// Find the volume group owning a physical volume,
// in the output of `pvs --noheadings -o pv_name,vg_name`
auto find_volume_group(std::string_view pvs_output, std::string_view pv_device) noexcept -> std::optional<std::string>;

// Parse `lvs --noheadings --units m -o lv_name,vg_name,lv_size`, keeping volumes of the given group
auto parse_logical_volumes(std::string_view lvs_output, std::string_view volume_group) noexcept -> std::vector<LogicalVolume>;

// Query the volume group owning a physical volume
auto query_volume_group(Executor& executor, std::string_view pv_device) noexcept -> std::optional<std::string>;

// List logical volumes of a volume group, std::nullopt when lvs fails
auto list_logical_volumes(Executor& executor, std::string_view volume_group) noexcept -> std::optional<std::vector<LogicalVolume>>;

// vgchange -a y
auto activate_volume_group(Executor& executor, std::string_view volume_group) noexcept -> bool;

// vgchange -a n
auto deactivate_volume_group(Executor& executor, std::string_view volume_group) noexcept -> bool;

}  // namespace imgmount::lvm

#endif  // LVM_HPP
