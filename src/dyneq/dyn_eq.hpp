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
/// Runtime equality capability for interface types.
///
/// An interface becomes comparable by deriving virtually from `DynEq`:
///
/// @code
/// struct Shape : virtual dyneq::DynEq {
///   virtual double Area() const = 0;
/// };
/// DYNEQ_EQ_INTERFACE(Shape);
///
/// struct Named : virtual dyneq::DynEq {
///   virtual std::string Name() const = 0;
/// };
/// DYNEQ_EQ_INTERFACE(Named);
///
/// struct Circle : Shape, Named {
///   explicit Circle(double radius) : radius(radius) {}
///   double Area() const override { return 3.14159 * radius * radius; }
///   std::string Name() const override { return "circle"; }
///   friend bool operator==(const Circle &lhs, const Circle &rhs) { return lhs.radius == rhs.radius; }
///   double radius;
/// };
///
/// dyneq::Concrete<Circle> circle{1.0};
/// @endcode
///
/// The base must be virtual: a type implementing several interfaces needs a
/// single `DynEq` subobject, otherwise `Eligible` rejects it.
///
/// The virtual functions of `DynEq` are sealed: they take a `DynEq::Seal`
/// which only `Concrete<T>` can name, so `Circle` itself stays abstract and the
/// capability is only ever implemented by `Concrete`. `Concrete<T>` in turn
/// requires `T` to have its own `operator==`, and it must be written by hand.
/// A defaulted `operator==` compares the base subobjects too and is deleted,
/// because neither `DynEq` nor the interface has an `operator==`.
#pragma once

#include <concepts>
#include <optional>
#include <type_traits>

#include "dyneq/erased_ref.hpp"
#include "utils/type_info_ref.hpp"

namespace dyneq {

class DynEq;

/// Types for which `Concrete<T>` can implement the capability.
template <typename T>
concept Eligible = std::is_class_v<T> && !std::is_final_v<T> && std::derived_from<T, DynEq> &&
                   std::equality_comparable<T>;

template <Eligible T>
class Concrete;

class SameType;

class DynEq {
  class Seal {
    friend class DynEq;
    Seal() = default;
  };

 public:
  virtual ~DynEq() = default;

  /// Identity of the concrete type behind this object.
  utils::TypeInfoRef DynType() const noexcept { return DoDynType(Seal{}); }

  ErasedRef Erase() const noexcept { return ErasedRef{DoDynType(Seal{}), DoDynAddress(Seal{})}; }

  /// Compares with an erased object. Returns false if `other` is not of the
  /// same concrete type, otherwise the result of the native `operator==`.
  bool DynEqual(ErasedRef other) const { return DoDynEqual(other, Seal{}); }

 protected:
  DynEq() = default;
  DynEq(const DynEq &) = default;
  DynEq(DynEq &&) = default;
  DynEq &operator=(const DynEq &) = default;
  DynEq &operator=(DynEq &&) = default;

 private:
  template <Eligible T>
  friend class Concrete;
  friend class SameType;

  bool DynEqualUnchecked(const DynEq &other) const { return DoDynEqualUnchecked(other.DoDynAddress(Seal{}), Seal{}); }

  virtual utils::TypeInfoRef DoDynType(Seal) const noexcept = 0;
  virtual const void *DoDynAddress(Seal) const noexcept = 0;
  virtual bool DoDynEqual(ErasedRef other, Seal) const = 0;
  // `other` must point at an object of the same concrete type.
  virtual bool DoDynEqualUnchecked(const void *other, Seal) const = 0;
};

/// Proof that two objects share a concrete type.
///
/// Only `Check` creates one, so `Equal` can compare without downcasting again.
/// Holds references to both operands; must not outlive them.
class SameType {
 public:
  static std::optional<SameType> Check(const DynEq &lhs, const DynEq &rhs) noexcept {
    if (!utils::IsSameType(lhs.DynType(), rhs.DynType())) return std::nullopt;
    return SameType{lhs, rhs};
  }

  // The proof would refer to a destroyed operand.
  static std::optional<SameType> Check(const DynEq &&lhs, const DynEq &rhs) = delete;
  static std::optional<SameType> Check(const DynEq &lhs, const DynEq &&rhs) = delete;
  static std::optional<SameType> Check(const DynEq &&lhs, const DynEq &&rhs) = delete;

  bool Equal() const { return lhs_->DynEqualUnchecked(*rhs_); }

 private:
  SameType(const DynEq &lhs, const DynEq &rhs) noexcept : lhs_(&lhs), rhs_(&rhs) {}

  const DynEq *lhs_;
  const DynEq *rhs_;
};

}  // namespace dyneq
