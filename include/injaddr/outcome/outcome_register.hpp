/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

/**
 * Registration of error enums as std::error_code sources.
 *
 * Header side:
 *   enum class MyError { FIRST = 1, SECOND };
 *   OUTCOME_HPP_DECLARE_ERROR(my::ns, MyError);
 *
 * Source side:
 *   OUTCOME_CPP_DEFINE_CATEGORY(my::ns, MyError, e) {
 *     switch (e) { ... }
 *     return "Unknown error";
 *   }
 *
 * Both macros must be used at global scope. Enum may be nested in a class
 * (e.g. `Codec::Error`); the name is then resolved relative to the namespace.
 */
namespace injaddr::outcome_detail {

  template <typename Enum>
  class Category final : public std::error_category {
   public:
    const char *name() const noexcept override {
      return typeName();
    }

    std::string message(int code) const override {
      return toString(static_cast<Enum>(code));
    }

    /// Qualified enum name as spelled in OUTCOME_CPP_DEFINE_CATEGORY
    static const char *typeName() noexcept;

    static std::string toString(Enum e);

    static const Category &get() {
      static const Category instance{};
      return instance;
    }
  };

}  // namespace injaddr::outcome_detail

#define OUTCOME_HPP_DECLARE_ERROR(Namespace, Enum)                    \
  namespace std {                                                     \
    template <>                                                       \
    struct is_error_code_enum<Namespace::Enum> : std::true_type {};   \
  }                                                                   \
  namespace Namespace {                                               \
    std::error_code make_error_code(Enum e);                          \
  }

#define OUTCOME_CPP_DEFINE_CATEGORY(Namespace, Enum, Name)                    \
  template <>                                                                 \
  const char *                                                                \
  injaddr::outcome_detail::Category<Namespace::Enum>::typeName() noexcept {   \
    return #Namespace "::" #Enum;                                             \
  }                                                                           \
  template <>                                                                 \
  std::string injaddr::outcome_detail::Category<Namespace::Enum>::toString(   \
      Namespace::Enum);                                                       \
  std::error_code Namespace::make_error_code(Namespace::Enum e) {             \
    return {static_cast<int>(e),                                              \
            injaddr::outcome_detail::Category<Namespace::Enum>::get()};       \
  }                                                                           \
  template <>                                                                 \
  std::string injaddr::outcome_detail::Category<Namespace::Enum>::toString(   \
      Namespace::Enum Name)
