// Copyright 2023 Matt Rudary

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at

//     http://www.apache.org/licenses/LICENSE-2.0

// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <fmt/format.h>

#include <string_view>

/** Declares an enum class together with functions naming its values.
 *
 * # Usage
 * Define a list macro taking two arguments, `DECLARE` and `X`, that
 * expands into `DECLARE(VALUE, X)` for each enumerator, then pass the
 * enum's name and the list macro to `QSEMA_ENUM_WITH_TEXT`:
 *
 *     #define SEVERITY_LIST(DECLARE, X) \
 *         DECLARE(Error, X)             \
 *         DECLARE(Warning, X)
 *     QSEMA_ENUM_WITH_TEXT(Severity, SEVERITY_LIST)
 *
 * This produces `enum class Severity { Error, Warning }`, a template
 *
 *     template <Severity VAL> constexpr const char* SeverityText()
 *
 * and a function
 *
 *     constexpr const char* SeverityText(Severity val);
 *
 * both of which return the enumerator's name.
 */
#define QSEMA_ENUM_WITH_TEXT(Name, LIST)                        \
  enum class Name { LIST(QSEMA_ENUM_WITH_TEXT_ENTRY, unused) }; \
  template <Name VAL>                                           \
  constexpr const char* Name##Text() = delete;                  \
  LIST(QSEMA_ENUM_WITH_TEXT_FUNC, Name)                         \
  constexpr const char* Name##Text(Name val) {                  \
    switch (val) { LIST(QSEMA_ENUM_WITH_TEXT_CASE, Name) }      \
    return nullptr;                                             \
  }

/**
 * Defines a fmt::formatter for an enum declared with QSEMA_ENUM_WITH_TEXT.
 *
 * Must be used outside of any namespace.
 */
#define QSEMA_ENUM_WITH_TEXT_FORMATTER(Name)                            \
  template <>                                                           \
  struct fmt::formatter<Name> : formatter<std::string_view> {           \
    template <typename FormatContext>                                   \
    auto format(Name val, FormatContext& ctx) const {                   \
      return formatter<std::string_view>::format(Name##Text(val), ctx); \
    }                                                                   \
  };

#define QSEMA_ENUM_WITH_TEXT_ENTRY(N, X) N,

#define QSEMA_ENUM_WITH_TEXT_FUNC(N, X)   \
  template <>                             \
  constexpr const char* X##Text<X::N>() { \
    return #N;                            \
  }

#define QSEMA_ENUM_WITH_TEXT_CASE(N, X) \
  case X::N:                            \
    return X##Text<X::N>();
