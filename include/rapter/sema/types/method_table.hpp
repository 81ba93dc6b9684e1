// rapter/sema/types/method_table.hpp - Capability table for builtin methods
//
// Receiver types advertise capabilities; each method name maps to the
// capability it requires. Method calls are resolved once, at check time, to a
// BuiltinMethod tag that the code generator dispatches on.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "rapter/ast/ast_enums.hpp"
#include "rapter/sema/types/type.hpp"

namespace rapter
{

enum class Capability : uint8_t {
  SupportsLength,
  SupportsSubstring,
  SupportsContains,
  SupportsTrim,
  SupportsSplit,
  SupportsPush,
  SupportsPop,
};

[[nodiscard]] std::string_view to_string(Capability cap);

/// Parameter shape of a builtin method.
enum class MethodParam : uint8_t {
  Int,
  String,
  StringOrChar,
  Element,  ///< element type of the receiver
};

struct MethodSignature
{
  BuiltinMethod method = BuiltinMethod::None;
  Capability capability = Capability::SupportsLength;
  std::vector<MethodParam> params;
  /// Push and pop mutate the receiver in place
  bool mutates_receiver = false;
};

class MethodTable
{
public:
  static const MethodTable & instance();

  /// Capabilities exposed by a receiver type (empty for unsupported receivers).
  [[nodiscard]] std::vector<Capability> capabilities_of(const Type * receiver) const;

  [[nodiscard]] bool has_capability(const Type * receiver, Capability cap) const;

  /// Known method names, independent of receiver (nullopt otherwise).
  [[nodiscard]] std::optional<Capability> capability_for(std::string_view method) const;

  /**
   * Resolve `receiver.method` to a signature.
   *
   * @return nullptr when the receiver lacks the required capability
   */
  [[nodiscard]] const MethodSignature * resolve(
    const Type * receiver, std::string_view method) const;

  /**
   * Result type of a resolved method call.
   */
  [[nodiscard]] const Type * result_type(
    TypeContext & types, const MethodSignature & sig, const Type * receiver) const;

private:
  MethodTable();

  struct Entry
  {
    std::string_view name;
    bool on_string;
    MethodSignature sig;
  };
  std::vector<Entry> entries_;
};

}  // namespace rapter
