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

/// @file
/// Thread-safety markers carried by dyneq handles.
///
/// A concrete type opts into a marker by deriving from the tag class. A handle
/// such as `Ref<Shape, MarkerSet::kThreadShared>` can only be created from
/// objects whose static type carries every marker of the set. The markers add
/// no synchronization; they only restrict which objects a handle may refer to.
#pragma once

#include <concepts>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace dyneq {

/// The object may be transferred to, and destroyed on, another thread.
struct ThreadMovable {};

/// The object may be read from several threads at once.
struct ThreadShared {};

enum class MarkerSet : uint8_t {
  kNone = 0,
  kThreadMovable = 1U << 0U,
  kThreadShared = 1U << 1U,
  kThreadMovableShared = kThreadMovable | kThreadShared,
};

constexpr MarkerSet operator|(MarkerSet lhs, MarkerSet rhs) noexcept {
  return static_cast<MarkerSet>(std::to_underlying(lhs) | std::to_underlying(rhs));
}

/// True if every marker of `wanted` is also in `have`.
constexpr bool Includes(MarkerSet have, MarkerSet wanted) noexcept {
  return (std::to_underlying(have) & std::to_underlying(wanted)) == std::to_underlying(wanted);
}

template <typename T>
constexpr MarkerSet MarkersOf() noexcept {
  auto markers = MarkerSet::kNone;
  if constexpr (std::derived_from<T, ThreadMovable>) markers = markers | MarkerSet::kThreadMovable;
  if constexpr (std::derived_from<T, ThreadShared>) markers = markers | MarkerSet::kThreadShared;
  return markers;
}

template <typename T, MarkerSet M>
concept SatisfiesMarkers = Includes(MarkersOf<std::remove_cv_t<T>>(), M);

}  // namespace dyneq
