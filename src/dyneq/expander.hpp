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
/// Compile-time parser for `DYNEQ_EQ_INTERFACE` invocations.
///
/// The macro splits its arguments with the preprocessor, which only knows about
/// parentheses. This parser walks the stringized invocation through the same
/// states and additionally checks what the preprocessor cannot: balanced angle
/// brackets, a non-empty generic list, a bound introduced by `requires` and a
/// well-formed interface path. Its result feeds `static_assert`s in the macro.
///
/// Grammar of an invocation:
///
///   invocation := [ '(' generics ')' [ '(' 'requires' bound ')' ] ] path
///   path       := [ '::' ] name { '::' name }
///   name       := identifier [ '<' template-arguments '>' ]
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace dyneq::expander {

enum class State : uint8_t { kBegin, kGenerics, kBound, kPath, kImpl };

enum class ParseError : uint8_t {
  kNone,
  kEmptyInvocation,
  kUnbalancedGenerics,
  kEmptyGenerics,
  kUnbalancedBound,
  kBoundWithoutRequires,
  kEmptyPath,
  kUnbalancedPath,
  kInvalidPath,
  kBoundInPath,
};

struct Invocation {
  std::string_view generics;
  std::string_view bound;
  std::string_view path;
  /// Last state entered. `kImpl` means the whole invocation was accepted.
  State state{State::kBegin};
  ParseError error{ParseError::kNone};

  constexpr bool ok() const noexcept { return error == ParseError::kNone; }
  constexpr bool generic() const noexcept { return !generics.empty(); }
};

constexpr std::string_view ErrorMessage(ParseError error) noexcept {
  switch (error) {
    case ParseError::kNone:
      return "no error";
    case ParseError::kEmptyInvocation:
      return "expected an interface path";
    case ParseError::kUnbalancedGenerics:
      return "unbalanced brackets in the generic parameter list";
    case ParseError::kEmptyGenerics:
      return "empty generic parameter list";
    case ParseError::kUnbalancedBound:
      return "unbalanced brackets in the bound";
    case ParseError::kBoundWithoutRequires:
      return "a bound must start with 'requires'";
    case ParseError::kEmptyPath:
      return "expected an interface path after the generic parameter list";
    case ParseError::kUnbalancedPath:
      return "unbalanced '<' '>' in the interface path";
    case ParseError::kInvalidPath:
      return "the interface path is not a qualified name";
    case ParseError::kBoundInPath:
      return "bounds go in a parenthesised group before the path";
  }
  return "unknown error";
}

namespace detail {

constexpr bool IsSpace(char c) noexcept { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

constexpr bool IsIdentifierStart(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

constexpr bool IsIdentifierChar(char c) noexcept { return IsIdentifierStart(c) || (c >= '0' && c <= '9'); }

constexpr std::string_view TrimLeft(std::string_view text) noexcept {
  std::size_t begin = 0;
  while (begin < text.size() && IsSpace(text[begin])) ++begin;
  return text.substr(begin);
}

constexpr std::string_view Trim(std::string_view text) noexcept {
  text = TrimLeft(text);
  std::size_t end = text.size();
  while (end > 0 && IsSpace(text[end - 1])) --end;
  return text.substr(0, end);
}

struct Group {
  std::string_view inner;
  std::string_view rest;
  bool balanced{false};
};

/// Splits `text`, which starts with '(', at the matching ')'. With
/// `track_angles`, '<' and '>' directly inside the group must balance too.
/// Nested parentheses hide angle brackets, so `(1 > 0)` is fine.
constexpr Group ScanGroup(std::string_view text, bool track_angles) noexcept {
  int parens = 0;
  int angles = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '(') {
      ++parens;
    } else if (c == ')') {
      if (--parens == 0) {
        return {.inner = text.substr(1, i - 1), .rest = text.substr(i + 1), .balanced = angles == 0};
      }
    } else if (track_angles && parens == 1) {
      if (c == '<') {
        ++angles;
      } else if (c == '>' && (i == 0 || text[i - 1] != '-')) {
        if (--angles < 0) return {.balanced = false};
      }
    }
  }
  return {.balanced = false};
}

constexpr bool StartsWithKeyword(std::string_view text, std::string_view keyword) noexcept {
  if (text.substr(0, keyword.size()) != keyword) return false;
  return text.size() == keyword.size() || !IsIdentifierChar(text[keyword.size()]);
}

/// Validates a qualified name such as `::ns::Reader<std::vector<int>>`.
constexpr ParseError CheckPath(std::string_view path) noexcept {
  enum class Expect : uint8_t { kName, kSeparator };
  auto expect = Expect::kName;
  int angles = 0;
  int parens = 0;
  std::size_t i = 0;
  // A leading '::' names the global namespace.
  if (path.substr(0, 2) == "::") i = 2;
  while (i < path.size()) {
    const char c = path[i];
    if (angles > 0) {
      // Template arguments may hold any expression, only track nesting.
      if (c == '(') {
        ++parens;
      } else if (c == ')') {
        if (--parens < 0) return ParseError::kUnbalancedPath;
      } else if (parens == 0 && c == '<') {
        ++angles;
      } else if (parens == 0 && c == '>') {
        --angles;
      }
      ++i;
      continue;
    }
    if (IsSpace(c)) {
      ++i;
      continue;
    }
    if (expect == Expect::kName) {
      if (!IsIdentifierStart(c)) return ParseError::kInvalidPath;
      const auto rest = path.substr(i);
      if (StartsWithKeyword(rest, "requires") || StartsWithKeyword(rest, "where")) return ParseError::kBoundInPath;
      while (i < path.size() && IsIdentifierChar(path[i])) ++i;
      expect = Expect::kSeparator;
      continue;
    }
    // Expect::kSeparator
    if (IsIdentifierStart(c)) {
      const auto rest = path.substr(i);
      if (StartsWithKeyword(rest, "requires") || StartsWithKeyword(rest, "where")) return ParseError::kBoundInPath;
      return ParseError::kInvalidPath;
    }
    if (c == '<') {
      ++angles;
      ++i;
      continue;
    }
    if (c == '>') return ParseError::kUnbalancedPath;
    if (path.substr(i, 2) == "::") {
      expect = Expect::kName;
      i += 2;
      continue;
    }
    return ParseError::kInvalidPath;
  }
  if (angles != 0 || parens != 0) return ParseError::kUnbalancedPath;
  if (expect == Expect::kName) return ParseError::kInvalidPath;
  return ParseError::kNone;
}

}  // namespace detail

/// Runs the BEGIN -> GENERICS -> BOUND -> PATH -> IMPL state machine over the
/// stringized arguments of `DYNEQ_EQ_INTERFACE`.
constexpr Invocation Parse(std::string_view text) noexcept {
  Invocation invocation;
  auto fail = [&invocation](ParseError error) {
    invocation.error = error;
    return invocation;
  };

  text = detail::Trim(text);
  if (text.empty()) return fail(ParseError::kEmptyInvocation);

  // BEGIN
  if (text.front() == '(') {
    invocation.state = State::kGenerics;
    const auto generics = detail::ScanGroup(text, /*track_angles=*/true);
    if (!generics.balanced) return fail(ParseError::kUnbalancedGenerics);
    invocation.generics = detail::Trim(generics.inner);
    if (invocation.generics.empty()) return fail(ParseError::kEmptyGenerics);
    text = detail::TrimLeft(generics.rest);

    if (!text.empty() && text.front() == '(') {
      invocation.state = State::kBound;
      const auto bound = detail::ScanGroup(text, /*track_angles=*/false);
      if (!bound.balanced) return fail(ParseError::kUnbalancedBound);
      invocation.bound = detail::Trim(bound.inner);
      if (!detail::StartsWithKeyword(invocation.bound, "requires")) return fail(ParseError::kBoundWithoutRequires);
      text = detail::TrimLeft(bound.rest);
    }
  }

  invocation.state = State::kPath;
  invocation.path = detail::Trim(text);
  if (invocation.path.empty()) return fail(ParseError::kEmptyPath);
  if (const auto error = detail::CheckPath(invocation.path); error != ParseError::kNone) return fail(error);

  invocation.state = State::kImpl;
  return invocation;
}

}  // namespace dyneq::expander
