// awkls/sema/symbols.cpp - Symbol model implementation
#include "awkls/sema/symbols.hpp"

#include <utility>

namespace awkls
{

SymbolDefinition::SymbolDefinition(
  const Document * document, std::string name, SymbolType type, Position position,
  std::string doc_comment, const SymbolDefinition * scope, bool implicit)
: document_(document),
  name_(std::move(name)),
  type_(type),
  position_(position),
  doc_comment_(std::move(doc_comment)),
  scope_(scope),
  implicit_(implicit)
{
}

SymbolDefinition * SymbolDefinition::add_parameter(std::unique_ptr<SymbolDefinition> def)
{
  parameters_.push_back(std::move(def));
  return parameters_.back().get();
}

SymbolDefinition * SymbolDefinition::add_local(std::unique_ptr<SymbolDefinition> def)
{
  locals_.push_back(std::move(def));
  return locals_.back().get();
}

std::string SymbolDefinition::signature() const
{
  if (type_ != SymbolType::Func) {
    return name_;
  }
  std::string out = name_ + "(";
  for (size_t i = 0; i < parameters_.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += parameters_[i]->name();
  }
  out += ")";
  return out;
}

bool SymbolDefinition::operator==(const SymbolDefinition & other) const noexcept
{
  return name_ == other.name_ && document_ == other.document_ && position_ == other.position_ &&
         type_ == other.type_ && doc_comment_ == other.doc_comment_;
}

}  // namespace awkls
