// tests/unit/syntax/test_symbol_type.cpp - Unit tests for the symbol taxonomy
//
// The headers under test come first so that each one must compile on its own.
#include "awkls/syntax/symbol_type.hpp"
#include "awkls/syntax/parse_events.hpp"

#include <gtest/gtest.h>

using namespace awkls;

TEST(SyntaxSymbolType, DefineTypesSitAtFixedOffset)
{
  EXPECT_EQ(to_define_type(SymbolType::Parameter), SymbolType::DefineParameter);
  EXPECT_EQ(from_define_type(SymbolType::DefineFunc), SymbolType::Func);
  EXPECT_EQ(to_define_type(SymbolType::DefineLocalVariable), SymbolType::DefineLocalVariable);
  EXPECT_TRUE(is_define_type(SymbolType::DefineGlobalVariable));
  EXPECT_FALSE(is_define_type(SymbolType::GlobalVariable));
  EXPECT_EQ(index_of(SymbolType::DefineParameter) + 1, k_symbol_type_count);
}

TEST(SyntaxSymbolType, Names)
{
  EXPECT_EQ(to_string(SymbolType::LocalVariable), "local variable");
  EXPECT_EQ(syntax::to_string(syntax::MessageCategory::Include), "include");
}
