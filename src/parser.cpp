#include <charconv>
#include <limits>
#include <sstream>

#include "parser.hpp"

void Parser::error(ParseError::Kind kind, const Token &t, const char *msg)
{
  std::ostringstream ss;
  ss << t << " " << msg;
  throw ParseError(kind, ss.str());
}

Statement Parser::parse()
{
  m_tokens.clear();
  for (const Token &t : m_scanner)
  {
    m_tokens.push_back(t);
  }

  if (m_tokens.empty())
  {
    error(ParseError::Kind::UnrecognizedStatement, Token(), "Expected a statement");
  }

  const Token &keyword = m_tokens.front();
  if (keyword.is(Token::Kind::Insert))
  {
    return insert();
  }
  if (keyword.is(Token::Kind::Select))
  {
    return select();
  }

  error(ParseError::Kind::UnrecognizedStatement, keyword, "Unknown statement keyword");
}

Statement Parser::insert()
{
  if (m_tokens.size() != 4)
  {
    error(ParseError::Kind::SyntaxError, m_tokens.back(), "Expected 'insert' id username email");
  }

  InsertStatement s;
  s.row.id = id(m_tokens[1]);
  s.row.username = value(m_tokens[2], COLUMN_USERNAME_SIZE);
  s.row.email = value(m_tokens[3], COLUMN_EMAIL_SIZE);
  return s;
}

Statement Parser::select()
{
  if (m_tokens.size() != 1)
  {
    error(ParseError::Kind::SyntaxError, m_tokens[1], "Unexpected token after 'select'");
  }
  return SelectStatement{};
}

u32 Parser::id(const Token &t)
{
  if (!t.is(Token::Kind::Number))
  {
    error(ParseError::Kind::SyntaxError, t, "Expected a positive integer id");
  }

  const std::string_view lexeme = t.lexeme();
  u64 v = 0;
  const auto [end, ec] = std::from_chars(lexeme.data(), lexeme.data() + lexeme.size(), v);
  if (ec != std::errc() || end != lexeme.data() + lexeme.size() ||
      v > std::numeric_limits<u32>::max())
  {
    error(ParseError::Kind::SyntaxError, t, "Id does not fit in 32 bits");
  }
  return static_cast<u32>(v);
}

std::string Parser::value(const Token &t, std::size_t maxSize)
{
  if (!t.isOneOf(Token::Kind::Word, Token::Kind::String, Token::Kind::Number,
                 Token::Kind::Insert, Token::Kind::Select))
  {
    error(ParseError::Kind::SyntaxError, t, "Expected a value");
  }

  const std::string_view lexeme = t.lexeme();
  // columns are null padded on disk so a null would cut the value short
  if (lexeme.find('\0') != std::string_view::npos)
  {
    error(ParseError::Kind::NullByte, t, "Value contains a null byte");
  }
  if (lexeme.size() > maxSize)
  {
    error(ParseError::Kind::StringTooLong, t, "Value is longer than its column");
  }
  return std::string(lexeme);
}
