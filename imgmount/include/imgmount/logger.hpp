#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>  // for shared_ptr

#include <spdlog/spdlog.h>

namespace imgmount::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

// Install a logger which drops every message, used by tests
void set_null_logger() noexcept;

}  // namespace imgmount::logger

#endif  // LOGGER_HPP
