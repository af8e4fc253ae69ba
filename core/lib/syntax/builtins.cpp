// awkls/syntax/builtins.cpp - Built-in table
#include "awkls/syntax/builtins.hpp"

#include <algorithm>

namespace awkls::syntax
{

namespace
{

BuiltinSymbol fn(
  std::string name, bool posix, std::vector<std::string> params,
  std::optional<uint32_t> first_optional, std::string description, bool variadic = false)
{
  BuiltinSymbol b;
  b.name = std::move(name);
  b.posix = posix;
  b.is_function = true;
  b.parameters = std::move(params);
  b.first_optional = first_optional;
  b.variadic = variadic;
  b.description = std::move(description);
  return b;
}

BuiltinSymbol var(std::string name, bool posix, std::string description)
{
  BuiltinSymbol b;
  b.name = std::move(name);
  b.posix = posix;
  b.is_function = false;
  b.description = std::move(description);
  return b;
}

std::vector<BuiltinSymbol> build_table()
{
  constexpr bool k_posix = true;
  constexpr bool k_gawk = false;
  const std::optional<uint32_t> none;

  return {
    // String functions
    fn("length", k_posix, {"s"}, 0U, "length of s, or of $0 when omitted"),
    fn("substr", k_posix, {"s", "m", "n"}, 2U, "substring of s starting at m, at most n characters"),
    fn("index", k_posix, {"s", "t"}, none, "position of t in s, or 0"),
    fn("split", k_posix, {"s", "a", "fs", "seps"}, 2U, "split s into array a on fs; returns count"),
    fn("sub", k_posix, {"regexp", "repl", "target"}, 2U, "replace first match of regexp in target"),
    fn("gsub", k_posix, {"regexp", "repl", "target"}, 2U, "replace all matches of regexp in target"),
    fn("match", k_posix, {"s", "regexp", "arr"}, 2U, "position of regexp in s; sets RSTART and RLENGTH"),
    fn("sprintf", k_posix, {"format", "expr"}, 1U, "format arguments according to format", true),
    fn("tolower", k_posix, {"s"}, none, "s in lower case"),
    fn("toupper", k_posix, {"s"}, none, "s in upper case"),
    // Arithmetic
    fn("sin", k_posix, {"x"}, none, "sine of x (radians)"),
    fn("cos", k_posix, {"x"}, none, "cosine of x (radians)"),
    fn("atan2", k_posix, {"y", "x"}, none, "arctangent of y/x"),
    fn("exp", k_posix, {"x"}, none, "exponential of x"),
    fn("log", k_posix, {"x"}, none, "natural logarithm of x"),
    fn("sqrt", k_posix, {"x"}, none, "square root of x"),
    fn("int", k_posix, {"x"}, none, "x truncated to an integer"),
    fn("rand", k_posix, {}, none, "random number in [0, 1)"),
    fn("srand", k_posix, {"seed"}, 0U, "seed the random generator; returns the previous seed"),
    // I/O and system
    fn("system", k_posix, {"cmd"}, none, "run cmd; returns its exit status"),
    fn("close", k_posix, {"file", "how"}, 1U, "close a file, pipe or coprocess"),
    fn("fflush", k_posix, {"file"}, 0U, "flush output buffers"),
    // gawk extensions
    fn("gensub", k_gawk, {"regexp", "repl", "how", "target"}, 3U, "general substitution; returns the result"),
    fn("patsplit", k_gawk, {"s", "a", "fieldpat", "seps"}, 2U, "split s into a on fields matching fieldpat"),
    fn("strftime", k_gawk, {"format", "timestamp", "utc"}, 0U, "format a timestamp"),
    fn("systime", k_gawk, {}, none, "current time in seconds since the epoch"),
    fn("mktime", k_gawk, {"datespec", "utc"}, 1U, "convert \"YYYY MM DD HH MM SS\" to a timestamp"),
    fn("asort", k_gawk, {"source", "dest", "how"}, 1U, "sort array values; returns the count"),
    fn("asorti", k_gawk, {"source", "dest", "how"}, 1U, "sort array indices; returns the count"),
    fn("and", k_gawk, {"v1", "v2"}, 2U, "bitwise and", true),
    fn("or", k_gawk, {"v1", "v2"}, 2U, "bitwise or", true),
    fn("xor", k_gawk, {"v1", "v2"}, 2U, "bitwise exclusive or", true),
    fn("lshift", k_gawk, {"val", "count"}, none, "val shifted left by count bits"),
    fn("rshift", k_gawk, {"val", "count"}, none, "val shifted right by count bits"),
    fn("compl", k_gawk, {"val"}, none, "bitwise complement"),
    fn("strtonum", k_gawk, {"str"}, none, "numeric value of str, accepting octal and hex"),
    fn("isarray", k_gawk, {"x"}, none, "1 if x is an array"),
    fn("typeof", k_gawk, {"x", "arr"}, 1U, "type of x as a string"),
    fn("bindtextdomain", k_gawk, {"directory", "domain"}, 1U, "set the message catalog directory"),
    fn("dcgettext", k_gawk, {"string", "domain", "category"}, 1U, "translation of string"),
    fn("dcngettext", k_gawk, {"string1", "string2", "number", "domain", "category"}, 3U,
       "plural-aware translation"),

    // Variables
    var("NR", k_posix, "number of input records read so far"),
    var("NF", k_posix, "number of fields in the current record"),
    var("FS", k_posix, "input field separator"),
    var("OFS", k_posix, "output field separator"),
    var("ORS", k_posix, "output record separator"),
    var("RS", k_posix, "input record separator"),
    var("FILENAME", k_posix, "name of the current input file"),
    var("FNR", k_posix, "record number in the current file"),
    var("SUBSEP", k_posix, "separator for multiple array subscripts"),
    var("RSTART", k_posix, "start of the string matched by match()"),
    var("RLENGTH", k_posix, "length of the string matched by match()"),
    var("CONVFMT", k_posix, "conversion format for numbers"),
    var("OFMT", k_posix, "output format for numbers"),
    var("ENVIRON", k_posix, "array of environment variables"),
    var("ARGC", k_posix, "number of command line arguments"),
    var("ARGV", k_posix, "array of command line arguments"),
    var("ARGIND", k_gawk, "index in ARGV of the current file"),
    var("BINMODE", k_gawk, "binary mode for I/O on non-POSIX systems"),
    var("ERRNO", k_gawk, "description of the last system error"),
    var("FIELDWIDTHS", k_gawk, "fixed field widths"),
    var("FPAT", k_gawk, "regular expression describing field contents"),
    var("IGNORECASE", k_gawk, "case-insensitive matching when nonzero"),
    var("LINT", k_gawk, "dynamic control of lint warnings"),
    var("PROCINFO", k_gawk, "array with information about the running program"),
    var("RT", k_gawk, "text that matched RS"),
    var("TEXTDOMAIN", k_gawk, "text domain for translations"),
    var("SYMTAB", k_gawk, "array of global variables"),
    var("FUNCTAB", k_gawk, "array of defined functions"),
    var("ROUNDMODE", k_gawk, "rounding mode for arbitrary precision arithmetic"),
    var("PREC", k_gawk, "working precision for arbitrary precision arithmetic"),
  };
}

}  // namespace

ArityRange BuiltinSymbol::arity() const noexcept
{
  const auto n = static_cast<uint32_t>(parameters.size());
  ArityRange r;
  r.min = first_optional.value_or(n);
  if (!variadic) {
    r.max = n;
  }
  return r;
}

std::string BuiltinSymbol::signature() const
{
  if (!is_function) {
    return {};
  }
  std::string out = name + "(";
  const size_t required = first_optional.value_or(parameters.size());
  for (size_t i = 0; i < parameters.size(); ++i) {
    if (i == required) {
      out += "[";
    }
    if (i > 0) {
      out += ",";
    }
    out += parameters[i];
  }
  if (variadic) {
    out += ",...";
  }
  if (required < parameters.size()) {
    out += "]";
  }
  out += ")";
  return out;
}

const std::vector<BuiltinSymbol> & all_builtins()
{
  static const std::vector<BuiltinSymbol> table = build_table();
  return table;
}

const BuiltinSymbol * find_builtin(std::string_view name)
{
  const auto & table = all_builtins();
  auto it = std::find_if(
    table.begin(), table.end(), [&](const BuiltinSymbol & b) { return b.name == name; });
  return it == table.end() ? nullptr : &*it;
}

const BuiltinSymbol * find_builtin_function(std::string_view name)
{
  const BuiltinSymbol * b = find_builtin(name);
  return (b != nullptr && b->is_function) ? b : nullptr;
}

const BuiltinSymbol * find_builtin_variable(std::string_view name)
{
  const BuiltinSymbol * b = find_builtin(name);
  return (b != nullptr && !b->is_function) ? b : nullptr;
}

}  // namespace awkls::syntax
