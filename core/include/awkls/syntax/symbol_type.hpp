// awkls/syntax/symbol_type.hpp - Symbol taxonomy shared by the parser and the document model
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace awkls
{

/**
 * Kind of a symbol occurrence.
 *
 * The first four values are use types. Each has a definition-flavored
 * counterpart at a fixed offset, used for the usage recorded at a
 * declaration site.
 */
enum class SymbolType : uint8_t {
  Func,
  GlobalVariable,
  LocalVariable,
  Parameter,
  DefineFunc,
  DefineGlobalVariable,
  DefineLocalVariable,
  DefineParameter,
};

inline constexpr size_t k_symbol_type_count = 8;
inline constexpr uint8_t k_define_type_offset = 4;

[[nodiscard]] constexpr bool is_define_type(SymbolType t) noexcept
{
  return static_cast<uint8_t>(t) >= static_cast<uint8_t>(SymbolType::DefineFunc);
}

[[nodiscard]] constexpr SymbolType to_define_type(SymbolType t) noexcept
{
  return is_define_type(t) ? t
                           : static_cast<SymbolType>(static_cast<uint8_t>(t) + k_define_type_offset);
}

[[nodiscard]] constexpr SymbolType from_define_type(SymbolType t) noexcept
{
  return is_define_type(t) ? static_cast<SymbolType>(static_cast<uint8_t>(t) - k_define_type_offset)
                           : t;
}

[[nodiscard]] constexpr size_t index_of(SymbolType t) noexcept { return static_cast<size_t>(t); }

[[nodiscard]] constexpr std::string_view to_string(SymbolType t) noexcept
{
  switch (t) {
    case SymbolType::Func:
      return "function";
    case SymbolType::GlobalVariable:
      return "global variable";
    case SymbolType::LocalVariable:
      return "local variable";
    case SymbolType::Parameter:
      return "parameter";
    case SymbolType::DefineFunc:
      return "function definition";
    case SymbolType::DefineGlobalVariable:
      return "global variable definition";
    case SymbolType::DefineLocalVariable:
      return "local variable definition";
    case SymbolType::DefineParameter:
      return "parameter definition";
  }
  return "";
}

}  // namespace awkls
