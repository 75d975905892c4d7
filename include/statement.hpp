#pragma once

#include "database/row.hpp"

#include <stdexcept>
#include <string>
#include <variant>

struct InsertStatement
{
  Row row;
};

struct SelectStatement
{
};

using Statement = std::variant<InsertStatement, SelectStatement>;

class ParseError : public std::runtime_error
{
public:
  enum class Kind
  {
    UnrecognizedStatement,
    SyntaxError,
    StringTooLong,
    NullByte,
  };

  ParseError(Kind kind, const std::string &message)
      : std::runtime_error(message), m_kind(kind)
  {
  }

  Kind kind() const noexcept { return m_kind; }

private:
  Kind m_kind;
};
