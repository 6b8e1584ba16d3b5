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
/// `DYNEQ_EQ_INTERFACE` generates the equality operators of an interface.
///
/// Invoke it once, in the namespace of the interface, so the operators are
/// found by argument dependent lookup:
///
/// @code
/// DYNEQ_EQ_INTERFACE(Shape);
/// DYNEQ_EQ_INTERFACE((typename R) Source<R>);
/// DYNEQ_EQ_INTERFACE((typename K, typename V) (requires std::regular<K>) Table<K, V>);
/// @endcode
///
/// An optional leading group holds the template parameters, an optional second
/// group the `requires` clause. For each marker set `M` the expansion defines
///
///   * `operator==(const Ref<I, M> &, const Ref<I, M> &)`,
///   * with `DYNEQ_ENABLE_BOX`, `operator==` for `Box<I, M>` against a `Box<I, M>`
///     and against a `Ref<I, M>`,
///   * `DynEqTotal(const H *)` for every handle `H` above, which makes
///     `dyneq::TotalEq<H>` hold.
///
/// `!=` and the reversed mixed comparisons come from rewritten candidates.
#pragma once

#include <type_traits>

#include <boost/preprocessor/control/iif.hpp>
#include <boost/preprocessor/punctuation/is_begin_parens.hpp>
#include <boost/preprocessor/punctuation/remove_parens.hpp>
#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/tuple/elem.hpp>

#include "dyneq/compare.hpp"
#include "dyneq/concrete.hpp"
#include "dyneq/dyn_eq.hpp"
#include "dyneq/expander.hpp"
#include "dyneq/markers.hpp"
#include "dyneq/ref.hpp"
#ifdef DYNEQ_ENABLE_BOX
#include "dyneq/box.hpp"
#endif

#define DYNEQ_EQ_INTERFACE(...)                                                                            \
  DYNEQ_DETAIL_VALIDATE(#__VA_ARGS__)                                                                      \
  BOOST_PP_IIF(BOOST_PP_IS_BEGIN_PARENS(__VA_ARGS__), DYNEQ_DETAIL_GENERICS, DYNEQ_DETAIL_PATH)(__VA_ARGS__) \
  static_assert(::dyneq::expander::Parse(#__VA_ARGS__).ok(), "DYNEQ_EQ_INTERFACE(" #__VA_ARGS__ ") is malformed")

// Splitting of leading parenthesised groups.
#define DYNEQ_DETAIL_EAT(...)
#define DYNEQ_DETAIL_KEEP(...) (__VA_ARGS__),
#define DYNEQ_DETAIL_HEAD(...) DYNEQ_DETAIL_HEAD_I(DYNEQ_DETAIL_KEEP __VA_ARGS__)
#define DYNEQ_DETAIL_HEAD_I(...) DYNEQ_DETAIL_HEAD_II(__VA_ARGS__)
#define DYNEQ_DETAIL_HEAD_II(head, ...) head

// BEGIN -> PATH: plain interface, the operators are inline functions.
#define DYNEQ_DETAIL_PATH(...) DYNEQ_DETAIL_IMPL((inline), (__VA_ARGS__))

// BEGIN -> GENERICS: the first group holds the template parameters.
#define DYNEQ_DETAIL_GENERICS(...) \
  DYNEQ_DETAIL_BOUND_OR_PATH(DYNEQ_DETAIL_HEAD(__VA_ARGS__), DYNEQ_DETAIL_EAT __VA_ARGS__)

#define DYNEQ_DETAIL_BOUND_OR_PATH(generics, ...)                                             \
  BOOST_PP_IIF(BOOST_PP_IS_BEGIN_PARENS(__VA_ARGS__), DYNEQ_DETAIL_BOUND, DYNEQ_DETAIL_UNBOUND) \
  (generics, __VA_ARGS__)

#define DYNEQ_DETAIL_UNBOUND(generics, ...) \
  DYNEQ_DETAIL_IMPL((template <BOOST_PP_REMOVE_PARENS(generics)>), (__VA_ARGS__))

// GENERICS -> BOUND: the second group is the requires clause.
#define DYNEQ_DETAIL_BOUND(generics, ...)                                                                          \
  DYNEQ_DETAIL_IMPL((template <BOOST_PP_REMOVE_PARENS(generics)> BOOST_PP_REMOVE_PARENS(DYNEQ_DETAIL_HEAD(__VA_ARGS__))), \
                    (DYNEQ_DETAIL_EAT __VA_ARGS__))

#define DYNEQ_DETAIL_MARKER_SETS                                                                         \
  (::dyneq::MarkerSet::kNone)(::dyneq::MarkerSet::kThreadMovable)(::dyneq::MarkerSet::kThreadShared)( \
      ::dyneq::MarkerSet::kThreadMovableShared)

// IMPL: one copy of the operators per marker set.
#define DYNEQ_DETAIL_IMPL(prefix, path) \
  BOOST_PP_SEQ_FOR_EACH(DYNEQ_DETAIL_IMPL_MARKERS, (prefix, path), DYNEQ_DETAIL_MARKER_SETS)

#define DYNEQ_DETAIL_PREFIX_OF(data) BOOST_PP_REMOVE_PARENS(BOOST_PP_TUPLE_ELEM(0, data))
#define DYNEQ_DETAIL_PATH_OF(data) BOOST_PP_REMOVE_PARENS(BOOST_PP_TUPLE_ELEM(1, data))

#define DYNEQ_DETAIL_IMPL_MARKERS(r, data, markers)                                                           \
  DYNEQ_DETAIL_PREFIX_OF(data) bool operator==(const ::dyneq::Ref<DYNEQ_DETAIL_PATH_OF(data), markers> &lhs,  \
                                               const ::dyneq::Ref<DYNEQ_DETAIL_PATH_OF(data), markers> &rhs) { \
    return ::dyneq::detail::Compare(*lhs, *rhs);                                                              \
  }                                                                                                           \
  DYNEQ_DETAIL_PREFIX_OF(data)                                                                                \
  constexpr ::std::true_type DynEqTotal(const ::dyneq::Ref<DYNEQ_DETAIL_PATH_OF(data), markers> *) noexcept { \
    return {};                                                                                                \
  }                                                                                                           \
  DYNEQ_DETAIL_IMPL_BOX(data, markers)

#ifdef DYNEQ_ENABLE_BOX
#define DYNEQ_DETAIL_IMPL_BOX(data, markers)                                                                  \
  DYNEQ_DETAIL_PREFIX_OF(data) bool operator==(const ::dyneq::Box<DYNEQ_DETAIL_PATH_OF(data), markers> &lhs,  \
                                               const ::dyneq::Box<DYNEQ_DETAIL_PATH_OF(data), markers> &rhs) { \
    return ::dyneq::detail::Compare(*lhs, *rhs);                                                              \
  }                                                                                                           \
  DYNEQ_DETAIL_PREFIX_OF(data) bool operator==(const ::dyneq::Box<DYNEQ_DETAIL_PATH_OF(data), markers> &lhs,  \
                                               const ::dyneq::Ref<DYNEQ_DETAIL_PATH_OF(data), markers> &rhs) { \
    return ::dyneq::detail::Compare(*lhs, *rhs);                                                              \
  }                                                                                                           \
  DYNEQ_DETAIL_PREFIX_OF(data)                                                                                \
  constexpr ::std::true_type DynEqTotal(const ::dyneq::Box<DYNEQ_DETAIL_PATH_OF(data), markers> *) noexcept { \
    return {};                                                                                                \
  }
#else
#define DYNEQ_DETAIL_IMPL_BOX(data, markers)
#endif

// One static_assert per error so the message names the problem.
#define DYNEQ_DETAIL_EXPECT_NOT(text, code)                                                                 \
  static_assert(::dyneq::expander::Parse(text).error != ::dyneq::expander::ParseError::code,              \
                "DYNEQ_EQ_INTERFACE(" text "): "                                                          \
                DYNEQ_DETAIL_MESSAGE_##code);

#define DYNEQ_DETAIL_MESSAGE_kEmptyInvocation "expected an interface path"
#define DYNEQ_DETAIL_MESSAGE_kUnbalancedGenerics "unbalanced brackets in the generic parameter list"
#define DYNEQ_DETAIL_MESSAGE_kEmptyGenerics "empty generic parameter list"
#define DYNEQ_DETAIL_MESSAGE_kUnbalancedBound "unbalanced brackets in the bound"
#define DYNEQ_DETAIL_MESSAGE_kBoundWithoutRequires "a bound must start with 'requires'"
#define DYNEQ_DETAIL_MESSAGE_kEmptyPath "expected an interface path after the generic parameter list"
#define DYNEQ_DETAIL_MESSAGE_kUnbalancedPath "unbalanced '<' '>' in the interface path"
#define DYNEQ_DETAIL_MESSAGE_kInvalidPath "the interface path is not a qualified name"
#define DYNEQ_DETAIL_MESSAGE_kBoundInPath "bounds go in a parenthesised group before the path"

#define DYNEQ_DETAIL_VALIDATE(text)                          \
  DYNEQ_DETAIL_EXPECT_NOT(text, kEmptyInvocation)            \
  DYNEQ_DETAIL_EXPECT_NOT(text, kUnbalancedGenerics)         \
  DYNEQ_DETAIL_EXPECT_NOT(text, kEmptyGenerics)              \
  DYNEQ_DETAIL_EXPECT_NOT(text, kUnbalancedBound)            \
  DYNEQ_DETAIL_EXPECT_NOT(text, kBoundWithoutRequires)       \
  DYNEQ_DETAIL_EXPECT_NOT(text, kEmptyPath)                  \
  DYNEQ_DETAIL_EXPECT_NOT(text, kUnbalancedPath)             \
  DYNEQ_DETAIL_EXPECT_NOT(text, kInvalidPath)                \
  DYNEQ_DETAIL_EXPECT_NOT(text, kBoundInPath)
