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

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "dyneq/eq_interface.hpp"
#include "dyneq_test_types.hpp"

using dyneq::Concrete;
using dyneq::MarkerSet;
using dyneq::Ref;
using dyneq::TotalEq;
using dyneq::test::A;
using dyneq::test::B;
using dyneq::test::Label;
using dyneq::test::MyTrait;
using dyneq::test::Named;
using dyneq::test::Number;
using dyneq::test::Tagged;

namespace dyneq::test {

// Generic interface with a bound on its parameter.
template <typename T>
struct Source : virtual DynEq {
  virtual T Next() const = 0;
};

DYNEQ_EQ_INTERFACE((typename T) (requires std::integral<T>) Source<T>);

template <typename T>
struct Constant : Source<T> {
  explicit Constant(T value) : value(value) {}
  T Next() const override { return value; }
  friend bool operator==(const Constant &lhs, const Constant &rhs) { return lhs.value == rhs.value; }
  T value;
};

template <typename T>
struct Counter : Source<T> {
  explicit Counter(T start) : start(start) {}
  T Next() const override { return start + 1; }
  friend bool operator==(const Counter &lhs, const Counter &rhs) { return lhs.start == rhs.start; }
  T start;
};

// Several generic parameters, no bound.
template <typename K, typename V>
struct Entry : virtual DynEq {
  virtual K Key() const = 0;
  virtual V Mapped() const = 0;
};

DYNEQ_EQ_INTERFACE((typename K, typename V) Entry<K, V>);

template <typename K, typename V>
struct Pair : Entry<K, V> {
  Pair(K key, V mapped) : key(std::move(key)), mapped(std::move(mapped)) {}
  K Key() const override { return key; }
  V Mapped() const override { return mapped; }
  friend bool operator==(const Pair &lhs, const Pair &rhs) { return lhs.key == rhs.key && lhs.mapped == rhs.mapped; }
  K key;
  V mapped;
};

namespace shapes {

struct Shape : virtual DynEq {
  virtual double Area() const = 0;
};

// Globally qualified path, invoked in the interface's namespace.
DYNEQ_EQ_INTERFACE(::dyneq::test::shapes::Shape);

struct Square : Shape {
  explicit Square(double side) : side(side) {}
  double Area() const override { return side * side; }
  friend bool operator==(const Square &lhs, const Square &rhs) { return lhs.side == rhs.side; }
  double side;
};

}  // namespace shapes

// Derives the capability but was never expanded.
struct Unexpanded : virtual DynEq {};

}  // namespace dyneq::test

namespace {

using dyneq::test::Constant;
using dyneq::test::Counter;
using dyneq::test::Pair;
using dyneq::test::Source;

// Aggregate whose equality is defaulted over an interface-typed field.
struct View {
  std::string name;
  Ref<MyTrait> value;

  bool operator==(const View &) const = default;
};

}  // namespace

static_assert(TotalEq<Ref<MyTrait>>);
static_assert(TotalEq<Ref<MyTrait, MarkerSet::kThreadMovable>>);
static_assert(TotalEq<Ref<MyTrait, MarkerSet::kThreadShared>>);
static_assert(TotalEq<Ref<MyTrait, MarkerSet::kThreadMovableShared>>);
static_assert(TotalEq<Ref<Source<int>>>);
static_assert(TotalEq<Ref<Source<long>, MarkerSet::kThreadShared>>);
static_assert(!TotalEq<Ref<Source<double>>>);
static_assert(!std::equality_comparable<Ref<Source<double>>>);
static_assert(TotalEq<Ref<dyneq::test::Entry<std::string, int>>>);
static_assert(TotalEq<Ref<dyneq::test::shapes::Shape, MarkerSet::kThreadMovable>>);
static_assert(!TotalEq<Ref<dyneq::test::Unexpanded>>);
static_assert(std::equality_comparable<View>);
static_assert(dyneq::Eligible<Tagged>);
static_assert(TotalEq<Ref<Named>>);

// Handles are only built explicitly, from lvalues carrying the requested markers.
static_assert(std::is_constructible_v<Ref<MyTrait>, const Concrete<A> &>);
static_assert(!std::is_convertible_v<const Concrete<A> &, Ref<MyTrait>>);
static_assert(!std::is_constructible_v<Ref<MyTrait>, Concrete<A>>);
static_assert(!std::is_constructible_v<Ref<MyTrait, MarkerSet::kThreadShared>, const Concrete<A> &>);
static_assert(std::is_constructible_v<Ref<MyTrait, MarkerSet::kThreadShared>,
                                      const Concrete<Number<0, dyneq::ThreadShared>> &>);
static_assert(!std::is_constructible_v<Ref<MyTrait, MarkerSet::kThreadMovableShared>,
                                       const Concrete<Number<0, dyneq::ThreadShared>> &>);

// Markers can be dropped but never added.
static_assert(std::is_constructible_v<Ref<MyTrait, MarkerSet::kThreadShared>,
                                      const Ref<MyTrait, MarkerSet::kThreadMovableShared> &>);
static_assert(std::is_constructible_v<Ref<MyTrait>, const Ref<MyTrait, MarkerSet::kThreadMovable> &>);
static_assert(!std::is_constructible_v<Ref<MyTrait, MarkerSet::kThreadMovable>,
                                       const Ref<MyTrait, MarkerSet::kThreadShared> &>);
static_assert(!std::is_constructible_v<Ref<MyTrait, MarkerSet::kThreadShared>, const Ref<MyTrait> &>);

TEST(DynEqInterface, SameTypeSameValue) {
  const Concrete<A> lhs{5};
  const Concrete<A> rhs{5};
  EXPECT_TRUE(Ref<MyTrait>{lhs} == Ref<MyTrait>{rhs});
  EXPECT_FALSE(Ref<MyTrait>{lhs} != Ref<MyTrait>{rhs});
}

TEST(DynEqInterface, SameTypeDifferentValue) {
  const Concrete<A> lhs{5};
  const Concrete<A> rhs{10};
  EXPECT_FALSE(Ref<MyTrait>{lhs} == Ref<MyTrait>{rhs});
  EXPECT_TRUE(Ref<MyTrait>{lhs} != Ref<MyTrait>{rhs});
}

TEST(DynEqInterface, DifferentTypeSameValue) {
  const Concrete<A> lhs{5};
  const Concrete<B> rhs{5};
  EXPECT_FALSE(Ref<MyTrait>{lhs} == Ref<MyTrait>{rhs});
  EXPECT_TRUE(Ref<MyTrait>{lhs} != Ref<MyTrait>{rhs});
}

TEST(DynEqInterface, DifferentTypeDifferentValue) {
  const Concrete<A> lhs{5};
  const Concrete<B> rhs{10};
  EXPECT_FALSE(Ref<MyTrait>{lhs} == Ref<MyTrait>{rhs});
}

TEST(DynEqInterface, AggregateField) {
  const Concrete<A> five{5};
  const Concrete<A> other_five{5};
  const Concrete<A> ten{10};
  const Concrete<B> b_five{5};

  EXPECT_EQ((View{"x", Ref<MyTrait>{five}}), (View{"x", Ref<MyTrait>{other_five}}));
  EXPECT_NE((View{"x", Ref<MyTrait>{five}}), (View{"x", Ref<MyTrait>{ten}}));
  EXPECT_NE((View{"x", Ref<MyTrait>{five}}), (View{"x", Ref<MyTrait>{b_five}}));
  EXPECT_NE((View{"x", Ref<MyTrait>{five}}), (View{"y", Ref<MyTrait>{other_five}}));
}

TEST(DynEqInterface, HeterogeneousContainer) {
  const Concrete<A> a{1};
  const Concrete<B> b{1};
  const Concrete<Label> label{"one"};
  const Concrete<A> a_copy{1};
  const Concrete<Label> label_copy{"one"};

  const std::vector<Ref<MyTrait>> values{Ref<MyTrait>{a}, Ref<MyTrait>{b}, Ref<MyTrait>{label}};
  const std::vector<Ref<MyTrait>> same{Ref<MyTrait>{a_copy}, Ref<MyTrait>{b}, Ref<MyTrait>{label_copy}};
  const std::vector<Ref<MyTrait>> swapped{Ref<MyTrait>{b}, Ref<MyTrait>{a}, Ref<MyTrait>{label}};

  EXPECT_TRUE(values == same);
  EXPECT_FALSE(values == swapped);
}

TEST(DynEqInterface, DroppedMarkersKeepEquality) {
  using Both = Number<0, dyneq::ThreadMovable, dyneq::ThreadShared>;
  const Concrete<Both> lhs{3};
  const Concrete<Both> rhs{3};
  const Ref<MyTrait, MarkerSet::kThreadMovableShared> both{lhs};
  const Ref<MyTrait, MarkerSet::kThreadShared> shared{both};
  const Ref<MyTrait> plain{both};

  EXPECT_TRUE(shared == (Ref<MyTrait, MarkerSet::kThreadShared>{rhs}));
  EXPECT_TRUE(plain == Ref<MyTrait>{rhs});
  EXPECT_EQ(plain.get(), both.get());
}

TEST(DynEqInterface, GenericInterface) {
  const Concrete<Constant<int>> one{1};
  const Concrete<Constant<int>> other_one{1};
  const Concrete<Constant<int>> two{2};
  const Concrete<Counter<int>> counter{1};

  EXPECT_TRUE(Ref<Source<int>>{one} == Ref<Source<int>>{other_one});
  EXPECT_FALSE(Ref<Source<int>>{one} == Ref<Source<int>>{two});
  EXPECT_FALSE(Ref<Source<int>>{one} == Ref<Source<int>>{counter});
  EXPECT_EQ(Ref<Source<int>>{counter}->Next(), 2);
}

TEST(DynEqInterface, GenericInterfaceSeveralParameters) {
  const Concrete<Pair<std::string, int>> lhs{"a", 1};
  const Concrete<Pair<std::string, int>> rhs{"a", 1};
  const Concrete<Pair<std::string, int>> other{"a", 2};
  using Handle = Ref<dyneq::test::Entry<std::string, int>>;

  EXPECT_TRUE(Handle{lhs} == Handle{rhs});
  EXPECT_TRUE(Handle{lhs} != Handle{other});
}

TEST(DynEqInterface, QualifiedInterfacePath) {
  using dyneq::test::shapes::Shape;
  using dyneq::test::shapes::Square;
  const Concrete<Square> lhs{2.0};
  const Concrete<Square> rhs{2.0};
  EXPECT_TRUE(Ref<Shape>{lhs} == Ref<Shape>{rhs});
  EXPECT_DOUBLE_EQ(Ref<Shape>{lhs}->Area(), 4.0);
}

TEST(DynEqInterface, SeveralInterfaces) {
  const Concrete<Tagged> lhs{1, "one"};
  const Concrete<Tagged> same{1, "one"};
  const Concrete<Tagged> other_value{2, "one"};
  const Concrete<Tagged> other_name{1, "uno"};
  const Concrete<dyneq::test::Anonymous> anonymous{};

  EXPECT_TRUE(Ref<MyTrait>{lhs} == Ref<MyTrait>{same});
  EXPECT_TRUE(Ref<Named>{lhs} == Ref<Named>{same});
  EXPECT_FALSE(Ref<MyTrait>{lhs} == Ref<MyTrait>{other_value});
  EXPECT_FALSE(Ref<Named>{lhs} == Ref<Named>{other_value});
  EXPECT_FALSE(Ref<Named>{lhs} == Ref<Named>{other_name});
  EXPECT_FALSE(Ref<Named>{lhs} == Ref<Named>{anonymous});

  // Both views of one object share its DynEq subobject.
  const MyTrait &as_trait = lhs;
  const Named &as_named = lhs;
  EXPECT_TRUE(as_trait.DynType().get() == as_named.DynType().get());
  EXPECT_EQ(as_trait.Erase().Address(), as_named.Erase().Address());
  EXPECT_EQ(Ref<Named>{lhs}->Name(), "one");
  EXPECT_EQ(Ref<MyTrait>{lhs}->Get(), 1);
}

template <typename T>
class DynEqInterfaceMarkers : public ::testing::Test {};

TYPED_TEST_SUITE(DynEqInterfaceMarkers, dyneq::test::MarkerCases);

TYPED_TEST(DynEqInterfaceMarkers, Scenarios) {
  constexpr auto kMarkers = TypeParam::kMarkers;
  using First = typename TypeParam::template Type<0>;
  using Second = typename TypeParam::template Type<1>;
  using Handle = Ref<MyTrait, kMarkers>;

  static_assert(TotalEq<Handle>);
  static_assert(std::same_as<typename Handle::interface_type, MyTrait>);

  const Concrete<First> a5{5};
  const Concrete<First> other_a5{5};
  const Concrete<First> a10{10};
  const Concrete<Second> b5{5};
  const Concrete<Second> b10{10};

  EXPECT_TRUE(Handle{a5} == Handle{other_a5});
  EXPECT_FALSE(Handle{a5} == Handle{a10});
  EXPECT_FALSE(Handle{a5} == Handle{b5});
  EXPECT_FALSE(Handle{a5} == Handle{b10});
  EXPECT_TRUE(Handle{b5} != Handle{a5});
}
