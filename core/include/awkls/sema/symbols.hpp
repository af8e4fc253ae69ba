// awkls/sema/symbols.hpp - Symbol definitions, usages and call parameter usages
#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "awkls/basic/source_manager.hpp"
#include "awkls/syntax/symbol_type.hpp"

namespace awkls
{

class Document;

// ============================================================================
// SymbolDefinition
// ============================================================================

/**
 * A declaration site of a function, parameter, local or global variable.
 *
 * Owned by exactly one Document. A function definition owns the definitions
 * of its parameters and locals; `scope` of those points back at it.
 */
class SymbolDefinition
{
public:
  SymbolDefinition(
    const Document * document, std::string name, SymbolType type, Position position,
    std::string doc_comment, const SymbolDefinition * scope = nullptr, bool implicit = false);

  SymbolDefinition(const SymbolDefinition &) = delete;
  SymbolDefinition & operator=(const SymbolDefinition &) = delete;

  [[nodiscard]] const Document * document() const noexcept { return document_; }
  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] SymbolType type() const noexcept { return type_; }
  [[nodiscard]] Position position() const noexcept { return position_; }
  [[nodiscard]] const std::string & doc_comment() const noexcept { return doc_comment_; }
  [[nodiscard]] const SymbolDefinition * scope() const noexcept { return scope_; }

  /// True for the definition synthesized at a global variable's first use
  [[nodiscard]] bool is_implicit() const noexcept { return implicit_; }

  [[nodiscard]] Range name_range() const noexcept
  {
    return make_range(position_, static_cast<uint32_t>(name_.size()));
  }

  // Function members
  SymbolDefinition * add_parameter(std::unique_ptr<SymbolDefinition> def);
  SymbolDefinition * add_local(std::unique_ptr<SymbolDefinition> def);

  [[nodiscard]] const std::vector<std::unique_ptr<SymbolDefinition>> & parameters() const noexcept
  {
    return parameters_;
  }
  [[nodiscard]] const std::vector<std::unique_ptr<SymbolDefinition>> & locals() const noexcept
  {
    return locals_;
  }

  /// "f(a, b)" for functions, the bare name otherwise
  [[nodiscard]] std::string signature() const;

  /// Structural equality: name, document identity, position, type and doc comment
  [[nodiscard]] bool operator==(const SymbolDefinition & other) const noexcept;
  [[nodiscard]] bool operator!=(const SymbolDefinition & other) const noexcept
  {
    return !(*this == other);
  }

private:
  const Document * document_;
  std::string name_;
  SymbolType type_;
  Position position_;
  std::string doc_comment_;
  const SymbolDefinition * scope_;
  bool implicit_;

  std::vector<std::unique_ptr<SymbolDefinition>> parameters_;
  std::vector<std::unique_ptr<SymbolDefinition>> locals_;
};

// ============================================================================
// SymbolUsage
// ============================================================================

/// One occurrence of a name. Document usage lists are in text order.
struct SymbolUsage
{
  std::string name;
  SymbolType type = SymbolType::GlobalVariable;
  Position position;

  [[nodiscard]] Range range() const noexcept
  {
    return make_range(position, static_cast<uint32_t>(name.size()));
  }

  [[nodiscard]] bool operator==(const SymbolUsage & other) const noexcept
  {
    return name == other.name && type == other.type && position == other.position;
  }
};

// ============================================================================
// ParameterUsage
// ============================================================================

/// Index marking the boundary of the whole call rather than of one argument
inline constexpr int32_t k_call_boundary_index = -1;

/**
 * A boundary in a call's argument list.
 *
 * `parameter` is the 0-based argument index, or k_call_boundary_index for
 * the opening (start = true, at the callee name) and closing (at ')')
 * boundary of the call itself.
 */
struct ParameterUsage
{
  std::string function;
  int32_t parameter = k_call_boundary_index;
  bool start = true;
  Position position;

  [[nodiscard]] bool is_call_boundary() const noexcept
  {
    return parameter == k_call_boundary_index;
  }

  [[nodiscard]] bool operator==(const ParameterUsage & other) const noexcept
  {
    return function == other.function && parameter == other.parameter && start == other.start &&
           position == other.position;
  }
};

}  // namespace awkls
