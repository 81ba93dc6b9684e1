// rapter/sema/types/method_table.cpp - Capability table for builtin methods
//
#include "rapter/sema/types/method_table.hpp"

#include <algorithm>

namespace rapter
{

std::string_view to_string(Capability cap)
{
  switch (cap) {
    case Capability::SupportsLength:
      return "SupportsLength";
    case Capability::SupportsSubstring:
      return "SupportsSubstring";
    case Capability::SupportsContains:
      return "SupportsContains";
    case Capability::SupportsTrim:
      return "SupportsTrim";
    case Capability::SupportsSplit:
      return "SupportsSplit";
    case Capability::SupportsPush:
      return "SupportsPush";
    case Capability::SupportsPop:
      return "SupportsPop";
  }
  return "<unknown>";
}

MethodTable::MethodTable()
{
  using C = Capability;
  using P = MethodParam;
  using M = BuiltinMethod;

  // string receivers
  entries_.push_back({"length", true, {M::StringLength, C::SupportsLength, {}, false}});
  entries_.push_back(
    {"substring", true, {M::StringSubstring, C::SupportsSubstring, {P::Int, P::Int}, false}});
  entries_.push_back({"contains", true, {M::StringContains, C::SupportsContains, {P::String}, false}});
  entries_.push_back({"trim", true, {M::StringTrim, C::SupportsTrim, {}, false}});
  entries_.push_back({"split", true, {M::StringSplit, C::SupportsSplit, {P::StringOrChar}, false}});

  // DynamicArray[T] receivers
  entries_.push_back({"length", false, {M::ArrayLength, C::SupportsLength, {}, false}});
  entries_.push_back({"push", false, {M::ArrayPush, C::SupportsPush, {P::Element}, true}});
  entries_.push_back({"pop", false, {M::ArrayPop, C::SupportsPop, {}, true}});
}

const MethodTable & MethodTable::instance()
{
  static const MethodTable table;
  return table;
}

std::vector<Capability> MethodTable::capabilities_of(const Type * receiver) const
{
  if (!receiver) return {};
  if (receiver->is_string()) {
    return {
      Capability::SupportsLength, Capability::SupportsSubstring, Capability::SupportsContains,
      Capability::SupportsTrim, Capability::SupportsSplit};
  }
  if (receiver->kind == TypeKind::DynamicArray) {
    return {Capability::SupportsLength, Capability::SupportsPush, Capability::SupportsPop};
  }
  return {};
}

bool MethodTable::has_capability(const Type * receiver, Capability cap) const
{
  const auto caps = capabilities_of(receiver);
  return std::find(caps.begin(), caps.end(), cap) != caps.end();
}

std::optional<Capability> MethodTable::capability_for(std::string_view method) const
{
  for (const auto & e : entries_) {
    if (e.name == method) return e.sig.capability;
  }
  return std::nullopt;
}

const MethodSignature * MethodTable::resolve(const Type * receiver, std::string_view method) const
{
  if (!receiver) return nullptr;
  const bool is_string = receiver->is_string();
  const bool is_vec = receiver->kind == TypeKind::DynamicArray;
  if (!is_string && !is_vec) return nullptr;

  for (const auto & e : entries_) {
    if (e.name != method || e.on_string != is_string) continue;
    if (!has_capability(receiver, e.sig.capability)) return nullptr;
    return &e.sig;
  }
  return nullptr;
}

const Type * MethodTable::result_type(
  TypeContext & types, const MethodSignature & sig, const Type * receiver) const
{
  switch (sig.method) {
    case BuiltinMethod::StringLength:
    case BuiltinMethod::ArrayLength:
      return types.int_type();
    case BuiltinMethod::StringSubstring:
    case BuiltinMethod::StringTrim:
      return types.string_type();
    case BuiltinMethod::StringContains:
      return types.bool_type();
    case BuiltinMethod::StringSplit:
      return types.get_dynamic_array_type(types.string_type());
    case BuiltinMethod::ArrayPush:
      return types.void_type();
    case BuiltinMethod::ArrayPop:
      return receiver ? receiver->element_type : nullptr;
    case BuiltinMethod::None:
      break;
  }
  return nullptr;
}

}  // namespace rapter
