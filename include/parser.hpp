#pragma once
#include "scanner.hpp"
#include "statement.hpp"

#include <vector>

/*
statement      -> insert | select
insert         -> "insert" id value value
select         -> "select"
id             -> NUMBER (fits in an unsigned 32 bit integer)
value          -> WORD | STRING | NUMBER | "insert" | "select"
*/

class Parser
{
public:
  Parser(Scanner &scanner) : m_scanner(scanner) {}
  // throws ParseError when the statement is not valid
  Statement parse();

private:
  [[noreturn]] void error(ParseError::Kind kind, const Token &t, const char *msg);
  Statement insert();
  Statement select();
  u32 id(const Token &t);
  std::string value(const Token &t, std::size_t maxSize);

  Scanner m_scanner;
  std::vector<Token> m_tokens;
};
