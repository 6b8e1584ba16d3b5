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
#include <typeinfo>

#include <fmt/format.h>

#include "utils/demangle.hpp"
#include "utils/exceptions.hpp"
#include "utils/type_info_ref.hpp"

namespace dyneq {

class DynEq;

/// Thrown by `ErasedRef::As` when the erased object is not of the requested type.
class BadErasedCast final : public utils::BasicException {
 public:
  BadErasedCast(utils::TypeInfoRef actual, utils::TypeInfoRef requested)
      : utils::BasicException("Cannot cast an erased {} to {}", utils::TypeName(actual), utils::TypeName(requested)) {}

  SPECIALIZE_GET_EXCEPTION_NAME(BadErasedCast)
};

/// Non-owning, type-erased view of a concrete object.
///
/// Keeps only what is needed to recover the object: the runtime identity of
/// its concrete type and its address. The address always points at the
/// concrete subobject, so a downcast to the recorded type is a `static_cast`
/// from `const void *`.
class ErasedRef {
 public:
  /// Erases `value` under its static type. Objects deriving from `DynEq` are
  /// erased under their dynamic type instead.
  template <typename T>
  static ErasedRef Of(const T &value) noexcept {
    if constexpr (std::derived_from<T, DynEq>) {
      return value.Erase();
    } else {
      return ErasedRef{typeid(T), std::addressof(value)};
    }
  }

  utils::TypeInfoRef Type() const noexcept { return type_; }
  const void *Address() const noexcept { return ptr_; }

  template <typename T>
  bool Is() const noexcept {
    return type_.get() == typeid(T);
  }

  /// Returns `nullptr` if the erased object is not a `T`.
  template <typename T>
  const T *Downcast() const noexcept {
    if (!Is<T>()) return nullptr;
    return static_cast<const T *>(ptr_);
  }

  /// @throw BadErasedCast if the erased object is not a `T`.
  template <typename T>
  const T &As() const {
    if (const auto *value = Downcast<T>()) return *value;
    throw BadErasedCast(type_, typeid(T));
  }

 private:
  friend class DynEq;

  ErasedRef(utils::TypeInfoRef type, const void *ptr) noexcept : type_(type), ptr_(ptr) {}

  utils::TypeInfoRef type_;
  const void *ptr_;
};

}  // namespace dyneq

template <>
class fmt::formatter<dyneq::ErasedRef> {
 public:
  constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }
  template <typename Context>
  auto format(dyneq::ErasedRef const &ref, Context &ctx) const {
    return fmt::format_to(ctx.out(), "{}@{}", dyneq::utils::TypeName(ref.Type()), ref.Address());
  }
};
