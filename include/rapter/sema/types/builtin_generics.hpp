// rapter/sema/types/builtin_generics.hpp - Builtin parametric sum types
//
// Closed registry of the generic families the language ships with:
//   Option<T>    : Some(T), None
//   Result<T, E> : Ok(T), Err(E)
//
#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "rapter/sema/types/type.hpp"

namespace rapter
{

/// One alternative of a builtin generic.
struct BuiltinVariant
{
  std::string_view name;
  bool has_value = false;
  /// Index into the family's type parameters supplying the payload type
  size_t param_index = 0;
};

/// Description of one builtin generic family. Immutable.
struct BuiltinGenericType
{
  std::string_view name;
  std::vector<std::string_view> type_params;
  std::vector<BuiltinVariant> variants;

  [[nodiscard]] size_t arity() const noexcept { return type_params.size(); }

  /// nullptr when the family has no such variant
  [[nodiscard]] const BuiltinVariant * find_variant(std::string_view variant) const;
};

/// Checked failure of BuiltinGenerics::substitute().
struct ArityMismatch
{
  std::string_view family;
  size_t expected = 0;
  size_t actual = 0;
};

/// Either the instantiated type or the arity failure.
class SubstituteResult
{
public:
  SubstituteResult(const Type * type) : type_(type) {}  // NOLINT(google-explicit-constructor)
  SubstituteResult(ArityMismatch error) : error_(error) {}  // NOLINT(google-explicit-constructor)

  [[nodiscard]] bool ok() const noexcept { return type_ != nullptr; }
  explicit operator bool() const noexcept { return ok(); }

  [[nodiscard]] const Type * type() const noexcept { return type_; }
  [[nodiscard]] const ArityMismatch & error() const noexcept { return error_; }

private:
  const Type * type_ = nullptr;
  ArityMismatch error_;
};

/**
 * Lookup and substitution service for Option and Result.
 *
 * Stateless apart from the two family descriptors; instantiated types are
 * created through the caller's TypeContext.
 */
class BuiltinGenerics
{
public:
  static constexpr std::string_view k_option = "Option";
  static constexpr std::string_view k_result = "Result";

  /// The shared registry.
  static const BuiltinGenerics & instance();

  [[nodiscard]] bool is_builtin(std::string_view name) const;

  /// nullptr when `name` is not a builtin family
  [[nodiscard]] const BuiltinGenericType * lookup(std::string_view name) const;

  /// Instantiate `family` with `args`. Fails when args.size() != arity.
  [[nodiscard]] SubstituteResult substitute(
    TypeContext & types, std::string_view family, const std::vector<const Type *> & args) const;

  /**
   * Payload type of `variant` for the instantiation `args`.
   *
   * @return std::nullopt for value-less or unknown variants
   */
  [[nodiscard]] std::optional<const Type *> variant_value_type(
    std::string_view family, std::string_view variant,
    gsl::span<const Type * const> args) const;

  /// Variant names in declaration order.
  [[nodiscard]] std::vector<std::string_view> variant_names(std::string_view family) const;

private:
  BuiltinGenerics();

  BuiltinGenericType option_;
  BuiltinGenericType result_;
};

}  // namespace rapter
