#pragma once

#include "token.hpp"

#include <iterator>

// splits a statement into whitespace separated tokens
// the input is not null terminated so embedded nulls reach the parser
class Scanner
{
public:
  Scanner(std::string_view input) noexcept
      : m_start(input.data()), m_end(input.data() + input.size()) {}
  Scanner(const char *input) noexcept : Scanner(std::string_view(input)) {}

  Token next() noexcept;
  bool hadError() const noexcept { return m_hadError; }

  struct iterator;
  iterator begin();
  iterator end();

private:
  Token nextToken() noexcept;
  bool atEnd() const noexcept { return m_start >= m_end; }
  char peek() const noexcept { return *m_start; }
  char get() noexcept;
  Token wordOrReserved(const char *start, const char *end, int col) const noexcept;
  Token quotedString(char quote, int col) noexcept;

  bool isWhiteSpace(char c) const noexcept;
  const char *m_start;
  const char *m_end;

  bool m_hadError = false;
  int m_col = 0;
};

struct Scanner::iterator
{
  using iterator_category = std::input_iterator_tag;
  using difference_type = std::ptrdiff_t;
  using value_type = Token;
  using pointer = const Token *;
  using reference = const Token &;

  explicit iterator(Scanner *scanner);
  iterator() : m_scanner(nullptr), m_isEnd(true), m_cached() {}

  reference operator*() const
  {
    return m_cached;
  }
  pointer operator->() const
  {
    return &m_cached;
  }
  iterator &operator++();
  iterator operator++(int);
  friend bool operator==(const iterator &a, const iterator &b)
  {
    if (a.m_isEnd && b.m_isEnd)
    {
      return true;
    }

    return a.m_scanner == b.m_scanner && a.m_cached == b.m_cached && a.m_isEnd == b.m_isEnd;
  }
  friend bool operator!=(const iterator &a, const iterator &b)
  {
    return !(a == b);
  }

private:
  Scanner *m_scanner;
  bool m_isEnd = false;
  Token m_cached;
};
