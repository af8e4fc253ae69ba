// awkls/syntax/expr_tree.hpp - Lightweight expression tree
//
// The parser builds this tree only to recognise structural patterns such as
// the `name in array` clause of a for loop or the target of an assignment.
// Nothing is evaluated.
//
#pragma once

#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

#include "awkls/basic/source_manager.hpp"

namespace awkls::syntax
{

enum class ExprKind : uint8_t {
  Missing,  // placeholder after a syntax error
  Literal,
  Regex,
  Variable,
  ArrayElement,  // name[subscripts]
  Field,         // $expr
  Grouping,      // (expr)
  List,          // (expr, expr, ...)
  Membership,    // expr in array
  Call,
  Unary,
  Binary,
  Concatenation,
  Assignment,
  Conditional,
  IncDec,
  Getline,
};

struct ExprNode
{
  ExprKind kind = ExprKind::Missing;
  std::string_view text;  ///< variable/function name or operator spelling
  Position position;
  std::vector<std::unique_ptr<ExprNode>> children;

  [[nodiscard]] const ExprNode * child(size_t i) const noexcept
  {
    return i < children.size() ? children[i].get() : nullptr;
  }
};

using ExprPtr = std::unique_ptr<ExprNode>;

[[nodiscard]] ExprPtr make_expr(ExprKind kind, std::string_view text, Position position);
[[nodiscard]] ExprPtr make_expr(
  ExprKind kind, std::string_view text, Position position, ExprPtr lhs, ExprPtr rhs = nullptr);

/// True for expressions that may appear on the left of an assignment
[[nodiscard]] bool is_lvalue(const ExprNode & e) noexcept;

/// True for an unparenthesized `expr in array`
[[nodiscard]] bool is_membership(const ExprNode & e) noexcept;

/// True for the `name in array` shape required by `for (name in array)`
[[nodiscard]] bool is_for_in_clause(const ExprNode & e) noexcept;

}  // namespace awkls::syntax
