#include "imgmount/mount_engine.hpp"
#include "imgmount/collaborators.hpp"

#include <algorithm>  // for find
#include <ranges>     // for ranges::*
#include <utility>    // for move
#include <vector>     // for vector

#include <spdlog/spdlog.h>

namespace imgmount {

MountEngine::MountEngine(std::unique_ptr<Mounter> mounter, Selector& selector, Notifier& notifier, std::size_t max_nesting_depth) noexcept
  : m_mounter(std::move(mounter)), m_selector(selector), m_notifier(notifier), m_max_nesting_depth(max_nesting_depth) { }

MountEngine::MountEngine(const EngineConfig& config, Executor& executor, Selector& selector, Notifier& notifier) noexcept
  : MountEngine(make_mounter(config.platform, executor, selector, config.mount_root), selector, notifier, config.max_nesting_depth) { }

auto MountEngine::fail(MountError error) noexcept -> std::unexpected<MountError> {
    if (error != MountError::UserCancelled) {
        m_notifier.report_error(describe_mount_error(error));
    }
    return std::unexpected(error);
}

auto MountEngine::mount(const OutputContainer& container, MountState& state) noexcept -> std::expected<std::string, MountError> {
    if (!state.empty()) {
        spdlog::error("Can't mount {}: another output file is still mounted", container.path);
        return fail(MountError::Busy);
    }
    if (container.platform != m_mounter->platform()) {
        spdlog::error("Can't mount {} with {} semantics, the engine was set up for {}", container.path,
            platform_to_string(container.platform), platform_to_string(m_mounter->platform()));
        return fail(MountError::ClassificationFailure);
    }

    spdlog::info("Mounting {}...", container.path);
    auto mount_point = descend(container.path, container.path, std::nullopt, 0, state);

    // Partition tables of partially recovered images are often unreadable
    if (!mount_point && mount_point.error() == MountError::EnumerationFailure) {
        spdlog::warn("Couldn't find any partitions in {}, trying to mount it as a partition...", container.path);
        if (auto retired = retire_layers(state); !retired) {
            return fail(retired.error());
        }
        mount_point = descend(container.path, container.path, ContainerKind::Partition, 0, state);
        if (!mount_point) {
            mount_point = std::unexpected(MountError::EnumerationFailure);
        }
    }

    if (!mount_point) {
        spdlog::debug("Mounting {} failed ({}). Cleaning up...", container.path, mount_error_to_string(mount_point.error()));
        if (auto retired = retire_layers(state); !retired) {
            return fail(retired.error());
        }
        return fail(mount_point.error());
    }

    state.mount_point = *mount_point;
    spdlog::info("Success! {} is mounted at {}", container.path, *mount_point);
    return mount_point;
}

auto MountEngine::descend(std::string_view image_path, const std::string& device, std::optional<ContainerKind> known_kind, std::size_t depth, MountState& state) noexcept -> std::expected<std::string, MountError> {
    if (depth >= m_max_nesting_depth) {
        spdlog::error("{} is nested more than {} containers deep", device, m_max_nesting_depth);
        return std::unexpected(MountError::ClassificationFailure);
    }

    ContainerKind kind{};
    if (known_kind) {
        kind = *known_kind;
    } else {
        const auto& classified = m_mounter->classify(device);
        if (!classified) {
            return std::unexpected(classified.error());
        }
        kind = *classified;
    }

    state.layers.emplace_back(Layer{.kind = kind, .device_name = device});
    if (kind == ContainerKind::Partition) {
        return m_mounter->mount_leaf(LeafMount{.image_path = image_path, .device = device}, state.layers);
    }

    spdlog::debug("{} isn't a partition! Getting list of contained volumes...", device);
    auto choices = m_mounter->list_children(state.layers.back());
    if (!choices) {
        return std::unexpected(choices.error());
    }
    if (choices->empty()) {
        spdlog::error("Couldn't find any partitions to mount in {}", device);
        return std::unexpected(MountError::EnumerationFailure);
    }
    sort_choices(*choices);

    const auto& labels = *choices
        | std::views::transform(&VolumeChoice::label)
        | std::ranges::to<std::vector<std::string>>();
    const auto& answer = m_selector.choose(VOLUME_SELECTION_PROMPT, labels);
    if (!answer) {
        spdlog::debug("User cancelled operation. Cleaning up...");
        return std::unexpected(MountError::UserCancelled);
    }

    auto selected = std::ranges::find(*choices, *answer, &VolumeChoice::label);
    if (selected == std::ranges::end(*choices)) {
        spdlog::error("'{}' isn't one of the volumes offered", *answer);
        return std::unexpected(MountError::UserCancelled);
    }

    if (const auto nested_kind = nested_container_kind(*selected); nested_kind) {
        spdlog::info("{} is a {} container, looking inside...", selected->device_or_name, container_kind_to_string(*nested_kind));
        return descend(image_path, selected->device_or_name, nested_kind, depth + 1, state);
    }

    spdlog::info("Mounting {} of {}...", selected->device_or_name, device);
    return m_mounter->mount_leaf(LeafMount{.image_path = image_path, .device = device, .choice = *selected}, state.layers);
}

auto MountEngine::retire_layers(MountState& state) noexcept -> std::expected<void, MountError> {
    // innermost first, otherwise the outer layers are still busy
    while (!state.layers.empty()) {
        const auto& layer = state.layers.back();
        spdlog::debug("Retiring {} layer of {}...", container_kind_to_string(layer.kind), layer.device_name);
        if (auto retired = m_mounter->retire_layer(layer); !retired) {
            spdlog::error("Couldn't retire the {} layer of {}, {} layer(s) left", container_kind_to_string(layer.kind), layer.device_name, state.layers.size());
            return retired;
        }
        state.layers.pop_back();
    }
    return {};
}

auto MountEngine::unmount(MountState& state) noexcept -> std::expected<void, MountError> {
    if (state.empty()) {
        spdlog::debug("Nothing is mounted");
        return {};
    }
    spdlog::info("Attempting to unmount output file...");

    if (state.mount_point) {
        if (auto unmounted = m_mounter->unmount_filesystem(*state.mount_point); !unmounted) {
            spdlog::error("Error unmounting {}! It seems to be in use", *state.mount_point);
            return fail(unmounted.error());
        }
        state.mount_point.reset();
    }

    if (auto retired = retire_layers(state); !retired) {
        return fail(retired.error());
    }
    state.reset();
    spdlog::info("Output file unmounted");
    return {};
}

}  // namespace imgmount
