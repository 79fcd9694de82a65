// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace kestrel::log {

/**
 * @brief Initialize the logging system
 *
 * Calling it again only changes the level of the existing logger.
 *
 * @param level Log level (trace, debug, info, warn, error, critical)
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Get the default logger
 *
 * @return std::shared_ptr<spdlog::logger> The logger instance
 */
std::shared_ptr<spdlog::logger> get_logger();

} // namespace kestrel::log

// Convenience macros
#define KESTREL_LOG_TRACE(...) ::kestrel::log::get_logger()->trace(__VA_ARGS__)
#define KESTREL_LOG_DEBUG(...) ::kestrel::log::get_logger()->debug(__VA_ARGS__)
#define KESTREL_LOG_INFO(...)  ::kestrel::log::get_logger()->info(__VA_ARGS__)
#define KESTREL_LOG_WARN(...)  ::kestrel::log::get_logger()->warn(__VA_ARGS__)
#define KESTREL_LOG_ERROR(...) ::kestrel::log::get_logger()->error(__VA_ARGS__)
#define KESTREL_LOG_CRITICAL(...) ::kestrel::log::get_logger()->critical(__VA_ARGS__)
