#include "imgmount/block_devices.hpp"
#include "imgmount/string_utils.hpp"

#include <algorithm>  // for find_if
#include <ranges>     // for ranges::*
#include <utility>    // for make_optional, move

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using BlockDevice = imgmount::disk::BlockDevice;

/// Constructs a BlockDevice (and its children) from a RapidJSON object.
auto get_blockdevice_from_json(const rapidjson::Value& doc) -> BlockDevice {
    auto device = BlockDevice{};
    if (doc.HasMember("name") && doc["name"].IsString()) {
        device.name = doc["name"].GetString();
    }
    if (doc.HasMember("fstype") && doc["fstype"].IsString()) {
        device.fstype = doc["fstype"].GetString();
    }
    if (doc.HasMember("size")) {
        // string without -b, number with it
        if (doc["size"].IsString()) {
            device.size = doc["size"].GetString();
        } else if (doc["size"].IsUint64()) {
            device.size = std::to_string(doc["size"].GetUint64());
        }
    }

    if (doc.HasMember("children") && doc["children"].IsArray()) {
        for (const auto& child_json : doc["children"].GetArray()) {
            if (child_json.IsObject()) {
                device.children.emplace_back(get_blockdevice_from_json(child_json));
            }
        }
    }
    return device;
}

}  // namespace

namespace imgmount::disk {

auto parse_lsblk_json(std::string_view lsblk_output) noexcept -> std::optional<std::vector<BlockDevice>> {
    // lsblk complains about devices it can't open on the same stream
    std::vector<std::string> cleaned_lines{};
    for (auto&& line : utils::make_split_view(lsblk_output)) {
        if (!line.starts_with("lsblk:")) {
            cleaned_lines.emplace_back(line);
        }
    }
    const auto& json_output = utils::join(cleaned_lines);

    rapidjson::Document document;
    document.Parse(json_output.data(), json_output.size());
    if (document.HasParseError()) {
        spdlog::error("Failed to parse lsblk output: {}", rapidjson::GetParseError_En(document.GetParseError()));
        return std::nullopt;
    }
    if (!document.IsObject() || !document.HasMember("blockdevices") || !document["blockdevices"].IsArray()) {
        spdlog::error("Failed to parse lsblk output: missing 'blockdevices' array");
        return std::nullopt;
    }

    std::vector<BlockDevice> block_devices{};
    for (const auto& device_json : document["blockdevices"].GetArray()) {
        if (device_json.IsObject()) {
            block_devices.emplace_back(get_blockdevice_from_json(device_json));
        }
    }
    return std::make_optional<std::vector<BlockDevice>>(std::move(block_devices));
}

auto find_device_by_name(const std::vector<BlockDevice>& devices, std::string_view device_name) noexcept -> std::optional<BlockDevice> {
    auto it = std::ranges::find_if(devices, [device_name](auto&& dev) {
        return dev.name == device_name || "/dev/" + dev.name == device_name;
    });
    if (it != std::ranges::end(devices)) {
        return std::make_optional<BlockDevice>(*it);
    }
    return std::nullopt;
}

}  // namespace imgmount::disk
