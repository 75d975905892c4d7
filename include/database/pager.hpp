#pragma once

#include "layout.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <sstream>
#include <stdexcept>

struct Page
{
  std::array<std::byte, PAGE_SIZE> buf = {static_cast<std::byte>(0)};
};

class PageError : public std::runtime_error
{
private:
  PageId m_id;

  static std::string format(PageId id, const char *message)
  {
    std::ostringstream ss;
    ss << "Page " << id << ": " << message;
    return ss.str();
  }

public:
  PageError(PageId id, const char *message)
      : std::runtime_error(format(id, message)), m_id(id)
  {
  }

  inline PageId id() const noexcept
  {
    return m_id;
  }
};

// the page (or row within it) is past what the table can hold
class PageOutOfRange : public PageError
{
public:
  using PageError::PageError;
};

// seeking, reading or writing the backing stream failed
class PageIOError : public PageError
{
public:
  using PageError::PageError;
};

// manages the pages for the table
// keeps a cache that is only written back when flushed, pages are never evicted
class Pager
{
public:
  explicit Pager(std::iostream &stream);

  Pager(const Pager &) = delete;
  Pager &operator=(const Pager &) = delete;

  // size of the stream when opened, grown by flushes past its end
  u64 fileLength() const noexcept { return m_fileLength; }
  // a short last page counts as a page
  u32 nPagesOnDisk() const noexcept;

  Page &getPage(PageId pageNum);
  // write the first `size` bytes of a cached page back to the stream
  void flushPage(PageId pageNum, u32 size);
  void releasePage(PageId pageNum) noexcept;
  bool isCached(PageId pageNum) const noexcept;

private:
  std::iostream &m_stream;
  // our cache for the pages, indexed by page number
  std::array<std::unique_ptr<Page>, TABLE_MAX_PAGES> m_pages;
  u64 m_fileLength;
};
