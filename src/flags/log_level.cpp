// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.
#include "flags/log_level.hpp"

#include "utils/enum.hpp"
#include "utils/logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <array>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

using namespace std::string_view_literals;

inline constexpr std::array log_level_mappings{
    std::pair{"TRACE"sv, spdlog::level::trace}, std::pair{"DEBUG"sv, spdlog::level::debug},
    std::pair{"INFO"sv, spdlog::level::info},   std::pair{"WARNING"sv, spdlog::level::warn},
    std::pair{"ERROR"sv, spdlog::level::err},   std::pair{"CRITICAL"sv, spdlog::level::critical}};

bool dyneq::flags::ValidLogLevel(std::string_view value) {
  if (const auto result = dyneq::utils::IsValidEnumValueString(value, log_level_mappings); !result.has_value()) {
    switch (result.error()) {
      case dyneq::utils::ValidationError::EmptyValue: {
        spdlog::warn("Log level cannot be empty.");
        break;
      }
      case dyneq::utils::ValidationError::InvalidValue: {
        spdlog::warn("Invalid value for log level. Allowed values: {}",
                     dyneq::utils::GetAllowedEnumValuesString(log_level_mappings));
        break;
      }
    }
    return false;
  }

  return true;
}

std::optional<spdlog::level::level_enum> dyneq::flags::LogLevelToEnum(std::string_view value) {
  return dyneq::utils::StringToEnum<spdlog::level::level_enum>(value, log_level_mappings);
}

spdlog::level::level_enum dyneq::flags::ParseLogLevel() {
  const char *env = std::getenv(kLogLevelEnv.data());
  std::string_view level = env != nullptr ? std::string_view{env} : kDefaultLogLevel;
  if (!ValidLogLevel(level)) {
    level = kDefaultLogLevel;
  }
  const auto log_level = LogLevelToEnum(level);
  DYNEQ_ASSERT(log_level, "Invalid log level {}", level);
  return *log_level;
}

void dyneq::flags::InitializeLogger() { InitializeLogger(ParseLogLevel()); }

void dyneq::flags::InitializeLogger(spdlog::level::level_enum log_level) {
  auto logger = std::make_shared<spdlog::logger>("dyneq_log", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  logger->set_level(log_level);
  logger->flush_on(spdlog::level::trace);
  spdlog::set_default_logger(std::move(logger));
}
