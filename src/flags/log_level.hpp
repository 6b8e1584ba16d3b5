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
#pragma once

#include <spdlog/common.h>
#include <optional>
#include <string_view>

namespace dyneq::flags {

/// Environment variable holding the minimum log level.
inline constexpr std::string_view kLogLevelEnv = "DYNEQ_LOG_LEVEL";
inline constexpr std::string_view kDefaultLogLevel = "WARNING";

bool ValidLogLevel(std::string_view value);
std::optional<spdlog::level::level_enum> LogLevelToEnum(std::string_view value);

/// Reads the level from `DYNEQ_LOG_LEVEL`, falling back to WARNING when it is
/// unset or invalid.
spdlog::level::level_enum ParseLogLevel();

void InitializeLogger();
void InitializeLogger(spdlog::level::level_enum log_level);

}  // namespace dyneq::flags
