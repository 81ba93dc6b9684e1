// rapter/sema/types/builtin_generics.cpp - Builtin generic registry
//
#include "rapter/sema/types/builtin_generics.hpp"

namespace rapter
{

const BuiltinVariant * BuiltinGenericType::find_variant(std::string_view variant) const
{
  for (const auto & v : variants) {
    if (v.name == variant) return &v;
  }
  return nullptr;
}

BuiltinGenerics::BuiltinGenerics()
{
  option_.name = k_option;
  option_.type_params = {"T"};
  option_.variants = {{"Some", true, 0}, {"None", false, 0}};

  result_.name = k_result;
  result_.type_params = {"T", "E"};
  result_.variants = {{"Ok", true, 0}, {"Err", true, 1}};
}

const BuiltinGenerics & BuiltinGenerics::instance()
{
  static const BuiltinGenerics registry;
  return registry;
}

bool BuiltinGenerics::is_builtin(std::string_view name) const { return lookup(name) != nullptr; }

const BuiltinGenericType * BuiltinGenerics::lookup(std::string_view name) const
{
  if (name == k_option) return &option_;
  if (name == k_result) return &result_;
  return nullptr;
}

SubstituteResult BuiltinGenerics::substitute(
  TypeContext & types, std::string_view family, const std::vector<const Type *> & args) const
{
  const BuiltinGenericType * desc = lookup(family);
  if (!desc) {
    return ArityMismatch{family, 0, args.size()};
  }
  if (args.size() != desc->arity()) {
    return ArityMismatch{desc->name, desc->arity(), args.size()};
  }
  return types.get_generic_type(desc->name, args);
}

std::optional<const Type *> BuiltinGenerics::variant_value_type(
  std::string_view family, std::string_view variant, gsl::span<const Type * const> args) const
{
  const BuiltinGenericType * desc = lookup(family);
  if (!desc) return std::nullopt;

  const BuiltinVariant * v = desc->find_variant(variant);
  if (!v || !v->has_value) return std::nullopt;
  if (v->param_index >= args.size()) return std::nullopt;
  return args[v->param_index];
}

std::vector<std::string_view> BuiltinGenerics::variant_names(std::string_view family) const
{
  std::vector<std::string_view> names;
  if (const BuiltinGenericType * desc = lookup(family)) {
    for (const auto & v : desc->variants) {
      names.push_back(v.name);
    }
  }
  return names;
}

}  // namespace rapter
