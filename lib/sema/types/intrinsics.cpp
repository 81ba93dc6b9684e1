// rapter/sema/types/intrinsics.cpp - Intrinsic allowlist
//
#include "rapter/sema/types/intrinsics.hpp"

#include <algorithm>
#include <iterator>

namespace rapter
{

namespace
{

constexpr std::string_view k_intrinsics[] = {
  // memory allocation
  "malloc", "free", "realloc", "calloc",
  // strings
  "strlen", "strcmp", "strncmp", "strcpy", "strncpy", "strcat", "strncat", "strchr", "strstr",
  "strdup",
  // raw memory
  "memcpy", "memmove", "memset", "memcmp",
  // stdio
  "printf", "fprintf", "sprintf", "snprintf", "scanf", "fscanf", "sscanf", "puts", "fputs",
  "putchar", "getchar", "fopen", "fclose", "fread", "fwrite", "fseek", "ftell", "rewind",
  // math
  "abs", "labs", "sqrt", "pow", "sin", "cos", "tan", "floor", "ceil", "round",
  // conversion
  "atoi", "atol", "atof", "strtol", "strtod",
  // ctype
  "isspace", "isdigit", "isalpha", "isalnum", "toupper", "tolower", "exit",
};

constexpr std::string_view k_runtime_helpers[] = {
  "rapter_substring", "rapter_trim",      "rapter_split",     "rapter_contains",
  "rapter_concat",    "rapter_pop_index", "rapter_read_all",  "rapter_write_all",
  "rapter_get_argc",  "rapter_get_argv",
};

}  // namespace

bool is_intrinsic(std::string_view name) noexcept
{
  return std::find(std::begin(k_intrinsics), std::end(k_intrinsics), name) != std::end(k_intrinsics);
}

bool is_runtime_helper(std::string_view name) noexcept
{
  return std::find(std::begin(k_runtime_helpers), std::end(k_runtime_helpers), name) !=
         std::end(k_runtime_helpers);
}

}  // namespace rapter
