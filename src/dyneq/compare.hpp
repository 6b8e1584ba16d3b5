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

#include <concepts>
#include <type_traits>

#include "dyneq/dyn_eq.hpp"
#include "utils/demangle.hpp"
#include "utils/logging.hpp"
#include "utils/type_info_ref.hpp"

namespace dyneq {

namespace detail {

/// Shared body of every operator emitted by `DYNEQ_EQ_INTERFACE`.
inline bool Compare(const DynEq &lhs, const DynEq &rhs) {
#ifdef DYNEQ_UNCHECKED_FAST_PATH
  if (const auto same = SameType::Check(lhs, rhs)) return same->Equal();
#else
  if (utils::IsSameType(lhs.DynType(), rhs.DynType())) return lhs.DynEqual(rhs.Erase());
#endif
  if (spdlog::should_log(spdlog::level::trace)) {
    SPDLOG_TRACE("dyneq: {} and {} are different concrete types", utils::TypeName(lhs.DynType()),
                 utils::TypeName(rhs.DynType()));
  }
  return false;
}

// Found when no `DynEqTotal` was generated for a handle.
template <typename H>
void DynEqTotal(const H *) = delete;

template <typename H>
concept DeclaredTotal = requires(const H *handle) {
  { DynEqTotal(handle) } -> std::same_as<std::true_type>;
};

}  // namespace detail

/// A handle whose `operator==` was generated by `DYNEQ_EQ_INTERFACE` and is
/// therefore an equivalence relation.
template <typename H>
concept TotalEq = std::equality_comparable<H> && detail::DeclaredTotal<H>;

}  // namespace dyneq
