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

/**
 * @file
 */
#pragma once

#include <optional>
#include <string>

#include "utils/type_info_ref.hpp"

namespace dyneq::utils {

/**
 * Converts a mangled name to a human-readable name using abi::__cxa_demangle.
 * Returns nullopt if the conversion failed.
 */
std::optional<std::string> Demangle(const char *mangled_name);

/// Human readable name of the type, falls back to the mangled name.
std::string TypeName(TypeInfoRef type);

}  // namespace dyneq::utils
