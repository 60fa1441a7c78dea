#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace st::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the `strict_types` logger configured from the --log_* flags.
/// Without a call to init() messages go to spdlog's default stderr logger.
void init();

void shutdown();

void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace st::log
