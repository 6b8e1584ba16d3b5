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
#include <memory>

#include "dyneq/dyn_eq.hpp"
#include "dyneq/markers.hpp"

namespace dyneq {

template <typename I, MarkerSet M>
class Box;

/// Non-owning handle to an object implementing the interface `I`.
///
/// Equality operators for `Ref<I, M>` are generated by `DYNEQ_EQ_INTERFACE(I)`.
/// The referred object must outlive the handle.
template <typename I, MarkerSet M = MarkerSet::kNone>
class Ref {
  static_assert(std::derived_from<I, DynEq>, "dyneq::Ref requires an interface derived from dyneq::DynEq");

 public:
  using interface_type = I;
  static constexpr MarkerSet kMarkers = M;

  template <typename T>
  requires std::derived_from<T, I> && SatisfiesMarkers<T, M>
  explicit Ref(const T &value) noexcept : ptr_(std::addressof(value)) {}

  template <typename T>
  requires std::derived_from<T, I>
  Ref(const T &&) = delete;

  /// Drops markers, e.g. `Ref<I, kThreadMovableShared>` to `Ref<I, kThreadShared>`.
  template <MarkerSet N>
  requires(N != M && Includes(N, M))
  explicit Ref(const Ref<I, N> &other) noexcept : ptr_(other.get()) {}

  const I &operator*() const noexcept { return *ptr_; }
  const I *operator->() const noexcept { return ptr_; }
  const I *get() const noexcept { return ptr_; }

  ErasedRef Erase() const noexcept { return ptr_->Erase(); }

 private:
  template <typename, MarkerSet>
  friend class Box;

  struct Borrowed {};

  // Used by Box, whose markers were checked when the object was created.
  Ref(const I *ptr, Borrowed /*tag*/) noexcept : ptr_(ptr) {}

  const I *ptr_;
};

}  // namespace dyneq
