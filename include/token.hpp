#pragma once

#include <string_view>
#include <iostream>

struct Token
{
  enum class Kind
  {
    #define X(kind, str, is_kw) kind,
#include "token_list.hpp"
    #undef X
  };

  Token() noexcept : m_kind(Token::Kind::End), m_lexeme() {}

  bool operator==(const Token& b) const { return kind() == b.kind() && lexeme() == b.lexeme(); }

  Token(Kind kind, const char *start, std::size_t len, int col = 0) noexcept
      : m_kind(kind), m_lexeme(start, len), m_col(col)
  {
  }
  Token(Kind kind, const char *start, const char *end, int col = 0) noexcept
      : m_kind(kind), m_lexeme(start, end - start), m_col(col)
  {
  }

  Kind kind() const noexcept { return m_kind; }

  bool is(Kind kind) const noexcept { return m_kind == kind; }
  bool isOneOf(Kind k1, Kind k2) const noexcept
  {
    return m_kind == k1 || m_kind == k2;
  }

  template <typename... Ts>
  bool isOneOf(Kind k1, Kind k2, Ts... ks) const noexcept
  {
    return is(k1) || isOneOf(k2, ks...);
  }

  std::string_view lexeme() const noexcept { return m_lexeme; }
  int col() const noexcept { return m_col; }
  const char* toString() const;

private:
  Kind m_kind;
  std::string_view m_lexeme;
  int m_col = 0;
};

std::ostream &operator<<(std::ostream &os, const Token &t);
std::ostream &operator<<(std::ostream &os, const Token::Kind &kind);
