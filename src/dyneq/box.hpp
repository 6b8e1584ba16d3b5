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
#include <utility>

#include "dyneq/concrete.hpp"
#include "dyneq/dyn_eq.hpp"
#include "dyneq/markers.hpp"
#include "dyneq/ref.hpp"
#include "utils/logging.hpp"

namespace dyneq {

/// Owning handle to an object implementing the interface `I`.
///
/// A `Box` is only empty after it has been moved from. Equality operators for
/// `Box<I, M>`, and between `Box<I, M>` and `Ref<I, M>`, are generated by
/// `DYNEQ_EQ_INTERFACE(I)`, so aggregates holding a `Box` can default their
/// own `operator==`.
template <typename I, MarkerSet M = MarkerSet::kNone>
class Box {
  static_assert(std::derived_from<I, DynEq>, "dyneq::Box requires an interface derived from dyneq::DynEq");

 public:
  using interface_type = I;
  static constexpr MarkerSet kMarkers = M;

  /// Allocates a `Concrete<T>` constructed from `args`.
  template <typename T, typename... Args>
  requires std::derived_from<T, I> && SatisfiesMarkers<T, M> && Eligible<T>
  static Box Make(Args &&...args) {
    return Box{std::make_unique<Concrete<T>>(std::forward<Args>(args)...)};
  }

  Box(const Box &) = delete;
  Box &operator=(const Box &) = delete;
  Box(Box &&) noexcept = default;
  Box &operator=(Box &&) noexcept = default;
  ~Box() = default;

  /// Drops markers, e.g. `Box<I, kThreadMovableShared>` to `Box<I, kThreadMovable>`.
  template <MarkerSet N>
  requires(N != M && Includes(N, M))
  explicit Box(Box<I, N> &&other) noexcept : ptr_(std::move(other.ptr_)) {}

  const I &operator*() const {
    DYNEQ_ASSERT(ptr_, "Dereferencing an empty dyneq::Box");
    return *ptr_;
  }

  I &operator*() {
    DYNEQ_ASSERT(ptr_, "Dereferencing an empty dyneq::Box");
    return *ptr_;
  }

  const I *operator->() const { return &**this; }
  I *operator->() { return &**this; }

  const I *get() const noexcept { return ptr_.get(); }
  explicit operator bool() const noexcept { return ptr_ != nullptr; }

  Ref<I, M> AsRef() const & { return Ref<I, M>{&**this, typename Ref<I, M>::Borrowed{}}; }
  // The object would be destroyed with the temporary Box.
  Ref<I, M> AsRef() const && = delete;

 private:
  template <typename, MarkerSet>
  friend class Box;

  explicit Box(std::unique_ptr<I> ptr) noexcept : ptr_(std::move(ptr)) {}

  std::unique_ptr<I> ptr_;
};

}  // namespace dyneq
