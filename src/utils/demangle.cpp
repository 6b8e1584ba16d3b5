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

#include "utils/demangle.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <memory>

namespace dyneq::utils {

std::optional<std::string> Demangle(const char *mangled_name) {
  int status{0};
  std::unique_ptr<char, decltype(&std::free)> type_name{abi::__cxa_demangle(mangled_name, nullptr, nullptr, &status),
                                                        &std::free};
  if (status != 0 || !type_name) return std::nullopt;
  return std::string{type_name.get()};
}

std::string TypeName(TypeInfoRef type) {
  const char *mangled = type.get().name();
  return Demangle(mangled).value_or(mangled);
}

}  // namespace dyneq::utils
