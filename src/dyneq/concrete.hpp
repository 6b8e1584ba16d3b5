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

#include <memory>
#include <typeinfo>
#include <utility>

#include "dyneq/dyn_eq.hpp"
#include "dyneq/erased_ref.hpp"
#include "utils/demangle.hpp"
#include "utils/logging.hpp"

namespace dyneq {

/// An object of type `T` carrying the runtime equality capability.
///
/// The capability compares through `T`'s own `operator==`, so two objects
/// are equal iff both are exactly `T` and equal as `T`. `T` must not default
/// its `operator==` in a way that compares the interface subobject through a
/// dyneq handle.
template <Eligible T>
class Concrete final : public T {
 public:
  template <typename... Args>
  explicit Concrete(Args &&...args) : T(std::forward<Args>(args)...) {}

  const T &Value() const noexcept { return *this; }
  T &Value() noexcept { return *this; }

 private:
  using Seal = DynEq::Seal;

  utils::TypeInfoRef DoDynType(Seal /*seal*/) const noexcept final { return typeid(T); }

  const void *DoDynAddress(Seal /*seal*/) const noexcept final { return std::addressof(Value()); }

  bool DoDynEqual(ErasedRef other, Seal /*seal*/) const final {
    const auto *rhs = other.Downcast<T>();
    if (rhs == nullptr) return false;
    return Value() == *rhs;
  }

  bool DoDynEqualUnchecked(const void *other, Seal /*seal*/) const final {
    DDYNEQ_ASSERT(other != nullptr, "Unchecked comparison of {} against nothing", utils::TypeName(typeid(T)));
    return Value() == *static_cast<const T *>(other);
  }
};

}  // namespace dyneq
