#include "scanner.hpp"

#include <algorithm>

char Scanner::get() noexcept
{
  m_col++;
  return *m_start++;
}

Token Scanner::next() noexcept
{
  return nextToken();
}

Token Scanner::nextToken() noexcept
{
  while (!atEnd() && isWhiteSpace(peek()))
  {
    get();
  }

  const int startCol = m_col;
  if (atEnd())
  {
    return Token(Token::Kind::End, m_end, std::size_t(0), startCol);
  }

  const char c = peek();
  if (c == '\'' || c == '"')
  {
    return quotedString(c, startCol);
  }

  // everything up to the next whitespace, emails and the like contain punctuation
  const char *tokenStart = m_start;
  while (!atEnd() && !isWhiteSpace(peek()))
  {
    get();
  }

  return wordOrReserved(tokenStart, m_start, startCol);
}

Token Scanner::quotedString(char quote, int col) noexcept
{
  // dont include the quotes in the token
  get();
  const char *tokenStart = m_start;
  while (!atEnd() && peek() != quote)
  {
    get();
  }

  if (atEnd())
  {
    // unterminated string
    m_hadError = true;
    return Token(Token::Kind::Unexpected, tokenStart - 1, m_start, col);
  }

  Token token = Token(Token::Kind::String, tokenStart, m_start, col);
  get(); // consume the end quote
  return token;
}

struct ReservedIdentifier
{
  const char *str;
  Token::Kind kind;
};
inline constexpr ReservedIdentifier reserved[] = {
#define RESERVED_true(str, kind) {str, Token::Kind::kind},
#define RESERVED_false(str, kind) // empty
#define X(kind, str, is_kw) RESERVED_##is_kw(str, kind)
#include "token_list.hpp"
#undef X
#undef RESERVED_true
#undef RESERVED_false
};

Token Scanner::wordOrReserved(const char *start, const char *end, int col) const noexcept
{
  std::string_view lexeme = std::string_view(start, end - start);
  const size_t nReserved = sizeof(reserved) / sizeof(reserved[0]);
  for (size_t i = 0; i < nReserved; i++)
  {
    if (lexeme.compare(reserved[i].str) == 0)
    {
      return Token(reserved[i].kind, start, end, col);
    }
  }

  const bool numeric = std::all_of(lexeme.begin(), lexeme.end(), [](char c) {
    return c >= '0' && c <= '9';
  });
  if (numeric)
  {
    return Token(Token::Kind::Number, start, end, col);
  }

  return Token(Token::Kind::Word, start, end, col);
}

bool Scanner::isWhiteSpace(char c) const noexcept { return c > 0 && c <= ' '; }

Scanner::iterator Scanner::begin() { return iterator(this); }
Scanner::iterator Scanner::end() { return iterator(); }

Scanner::iterator::iterator(Scanner *scanner) : m_scanner(scanner), m_isEnd(false), m_cached()
{
  if (!scanner)
  {
    m_isEnd = true;
    return;
  }

  m_cached = scanner->next();
  if (m_cached.is(Token::Kind::End))
  {
    m_isEnd = true;
  }
}

Scanner::iterator& Scanner::iterator::operator++()
{
    if (m_isEnd || !m_scanner)
    {
      return *this;
    }

    m_cached = m_scanner->next();
    if (m_cached.is(Token::Kind::End))
    {
      m_isEnd = true;
    }

    return *this;
}

Scanner::iterator Scanner::iterator::operator++(int)
{
  iterator tmp = *this;
  ++(*this);
  return tmp;
}
