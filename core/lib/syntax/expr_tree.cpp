// awkls/syntax/expr_tree.cpp - Lightweight expression tree
#include "awkls/syntax/expr_tree.hpp"

namespace awkls::syntax
{

ExprPtr make_expr(ExprKind kind, std::string_view text, Position position)
{
  auto e = std::make_unique<ExprNode>();
  e->kind = kind;
  e->text = text;
  e->position = position;
  return e;
}

ExprPtr make_expr(
  ExprKind kind, std::string_view text, Position position, ExprPtr lhs, ExprPtr rhs)
{
  auto e = make_expr(kind, text, position);
  if (lhs) {
    e->children.push_back(std::move(lhs));
  }
  if (rhs) {
    e->children.push_back(std::move(rhs));
  }
  return e;
}

bool is_lvalue(const ExprNode & e) noexcept
{
  return e.kind == ExprKind::Variable || e.kind == ExprKind::ArrayElement ||
         e.kind == ExprKind::Field;
}

bool is_membership(const ExprNode & e) noexcept { return e.kind == ExprKind::Membership; }

bool is_for_in_clause(const ExprNode & e) noexcept
{
  if (!is_membership(e)) {
    return false;
  }
  const ExprNode * element = e.child(0);
  return element != nullptr && element->kind == ExprKind::Variable;
}

}  // namespace awkls::syntax
