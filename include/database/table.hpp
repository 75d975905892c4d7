#pragma once

#include "pager.hpp"
#include "row.hpp"

#include <iterator>

enum class InsertResult
{
  Success,
  TableFull,
};

// a flat, append only sequence of rows stored ROWS_PER_PAGE to a page
class Table
{
public:
  explicit Table(std::iostream &stream);

  Table(const Table &) = delete;
  Table &operator=(const Table &) = delete;

  u32 nRows() const noexcept { return m_nRows; }
  Pager &pager() noexcept { return m_pager; }

  // the bytes of a row inside its (now cached) page
  RowSpan rowSlot(u32 rowNum);
  [[nodiscard]] InsertResult insert(const Row &row);
  Row rowAt(u32 rowNum);

  // write every cached page back, the last page only up to its last row
  void flush();

  struct iterator;
  iterator begin();
  iterator end();

private:
  Pager m_pager;
  u32 m_nRows = 0;
};

// walks the rows in order, decoding each one as it is reached
struct Table::iterator
{
  using iterator_category = std::input_iterator_tag;
  using difference_type = std::ptrdiff_t;
  using value_type = Row;
  using pointer = const Row *;
  using reference = const Row &;

  iterator(Table *table, u32 rowNum);
  iterator() : m_table(nullptr), m_rowNum(0), m_isEnd(true), m_cached() {}

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

    return a.m_table == b.m_table && a.m_rowNum == b.m_rowNum && a.m_isEnd == b.m_isEnd;
  }
  friend bool operator!=(const iterator &a, const iterator &b)
  {
    return !(a == b);
  }

private:
  void load();

  Table *m_table;
  u32 m_rowNum;
  bool m_isEnd = false;
  Row m_cached;
};
