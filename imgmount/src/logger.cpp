#include "imgmount/logger.hpp"

#include <utility>  // for move

#include <spdlog/sinks/callback_sink.h>

namespace imgmount::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

void set_null_logger() noexcept {
    auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
        // noop
    });
    logger::set_logger(std::make_shared<spdlog::logger>("default", callback_sink));
}

}  // namespace imgmount::logger
