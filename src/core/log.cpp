// kestrel - engine post-processing and animation blending layer
// Copyright (c) 2025 kestrel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#include "kestrel/core/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace kestrel::log
{

static std::shared_ptr<spdlog::logger> s_logger;

void init(spdlog::level::level_enum level)
{
    if (s_logger)
    {
        s_logger->set_level(level);
        return;
    }

    s_logger = spdlog::get("kestrel");
    if (!s_logger)
    {
        s_logger = spdlog::stdout_color_mt("kestrel");
    }
    s_logger->set_level(level);
    s_logger->set_pattern("[%T] [%^%l%$] %v");

    s_logger->debug("kestrel logging system initialized");
}

std::shared_ptr<spdlog::logger> get_logger()
{
    if (!s_logger)
    {
        init();
    }
    return s_logger;
}

} // namespace kestrel::log
