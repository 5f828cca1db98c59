#pragma once

#include <optional>
#include <string_view>

#include "internal/expr/predicate.hpp"

namespace opentimeline::expr {

/*
  Boolean tag expression parser.

  Grammar, lowest precedence first:

    expr    := and_expr ( OR and_expr )*
    and_expr:= not_expr ( AND not_expr )*
    not_expr:= NOT not_expr | primary
    primary := '(' expr ')' | leaf
    leaf    := IDENT '=' STRING
             | IDENT '!=' STRING
             | IDENT EXISTS
             | IDENT NOT EXISTS
             | STRING

  AND, OR, NOT and EXISTS are case-insensitive and reserved. Identifiers
  start with a letter or '_' and continue with letters, digits, '_', '-',
  '.' or ':'; they are case-sensitive. Strings use double quotes and JSON
  escapes (\" \\ \/ \b \f \n \r \t \uXXXX).

  Empty or whitespace-only input returns std::nullopt: the expression
  matches nothing. Malformed input throws util::ParseError carrying the
  0-based byte offset of the problem.
*/
std::optional<Predicate> Parse(std::string_view expression);

} // namespace opentimeline::expr
