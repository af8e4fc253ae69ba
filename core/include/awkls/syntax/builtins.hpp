// awkls/syntax/builtins.hpp - Built-in functions and variables of awk and gawk
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace awkls::syntax
{

/// Allowed argument count of a callable
struct ArityRange
{
  uint32_t min = 0;
  std::optional<uint32_t> max;  ///< nullopt: unbounded

  [[nodiscard]] bool accepts(uint32_t n) const noexcept { return n >= min && (!max || n <= *max); }
};

struct BuiltinSymbol
{
  std::string name;
  bool posix = true;        ///< available in strict (POSIX awk) mode
  bool is_function = true;  ///< false for built-in variables
  std::vector<std::string> parameters;
  std::optional<uint32_t> first_optional;  ///< index of the first optional parameter
  bool variadic = false;                   ///< the last parameter may repeat
  std::string description;

  [[nodiscard]] ArityRange arity() const noexcept;

  /// "name(a,b[,c])" for functions; empty for variables
  [[nodiscard]] std::string signature() const;
};

/// Look up a built-in function or variable by name
[[nodiscard]] const BuiltinSymbol * find_builtin(std::string_view name);

[[nodiscard]] const BuiltinSymbol * find_builtin_function(std::string_view name);
[[nodiscard]] const BuiltinSymbol * find_builtin_variable(std::string_view name);

[[nodiscard]] const std::vector<BuiltinSymbol> & all_builtins();

}  // namespace awkls::syntax
