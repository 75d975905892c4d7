#include "database/pager.hpp"

Pager::Pager(std::iostream &stream)
: m_stream(stream), m_pages() {
  if (!m_stream)
  {
    throw std::runtime_error("Failed to open database file.");
  }

  m_stream.seekg(0, std::ios::end);
  const std::streamoff size = m_stream.tellg();
  if (!m_stream || size < 0)
  {
    throw std::runtime_error("Failed to get size of database file.");
  }
  m_fileLength = static_cast<u64>(size);
}

u32 Pager::nPagesOnDisk() const noexcept
{
  u64 nPages = m_fileLength / PAGE_SIZE;
  if (m_fileLength % PAGE_SIZE != 0)
  {
    // the last page was saved partially
    nPages++;
  }
  return static_cast<u32>(nPages);
}

Page &Pager::getPage(PageId pageNum)
{
  if (pageNum >= TABLE_MAX_PAGES)
  {
    throw PageOutOfRange(pageNum, "Tried to fetch page number out of bounds");
  }

  if (m_pages[pageNum])
  {
    return *m_pages[pageNum];
  }

  // cache miss, the page starts zeroed and is loaded from disk if it exists there
  auto page = std::make_unique<Page>();
  if (pageNum < nPagesOnDisk())
  {
    m_stream.clear();
    if (!m_stream.seekg(static_cast<std::streamoff>(pageNum) * PAGE_SIZE))
    {
      throw PageIOError(pageNum, "Failed in seeking to read");
    }

    m_stream.read(reinterpret_cast<char *>(page->buf.data()), page->buf.size());
    if (m_stream.bad() || (!m_stream && !m_stream.eof()))
    {
      throw PageIOError(pageNum, "Failed to read");
    }
    // a short read of the last page leaves the rest zeroed
    m_stream.clear();
  }

  m_pages[pageNum] = std::move(page);
  return *m_pages[pageNum];
}

void Pager::flushPage(PageId pageNum, u32 size)
{
  if (pageNum >= TABLE_MAX_PAGES || size > PAGE_SIZE)
  {
    throw PageOutOfRange(pageNum, "Tried to flush outside of the page bounds");
  }

  if (!m_pages[pageNum])
  {
    return;
  }

  m_stream.clear();
  if (!m_stream.seekp(static_cast<std::streamoff>(pageNum) * PAGE_SIZE))
  {
    throw PageIOError(pageNum, "Failed in seeking to flush");
  }
  if (!m_stream.write(reinterpret_cast<const char *>(m_pages[pageNum]->buf.data()), size))
  {
    throw PageIOError(pageNum, "Failed to flush");
  }
  if (!m_stream.flush())
  {
    throw PageIOError(pageNum, "Failed to flush");
  }

  // a released page has to be read back from the stream, so it must know the file grew
  const u64 end = static_cast<u64>(pageNum) * PAGE_SIZE + size;
  if (end > m_fileLength)
  {
    m_fileLength = end;
  }
}

void Pager::releasePage(PageId pageNum) noexcept
{
  if (pageNum < TABLE_MAX_PAGES)
  {
    m_pages[pageNum].reset();
  }
}

bool Pager::isCached(PageId pageNum) const noexcept
{
  return pageNum < TABLE_MAX_PAGES && m_pages[pageNum] != nullptr;
}
