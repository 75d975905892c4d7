#include "database/table.hpp"

// rows are packed from the start of each page and a page only ends partially
// when it is the last one, so whole pages and the remainder count separately
static u32 rowsInFile(u64 fileLength)
{
  const u64 fullPages = fileLength / PAGE_SIZE;
  const u64 remainder = fileLength % PAGE_SIZE;
  const u64 rows = fullPages * ROWS_PER_PAGE + remainder / ROW_SIZE;
  return rows > TABLE_MAX_ROWS ? TABLE_MAX_ROWS : static_cast<u32>(rows);
}

Table::Table(std::iostream &stream)
: m_pager(stream)
{
  m_nRows = rowsInFile(m_pager.fileLength());
}

RowSpan Table::rowSlot(u32 rowNum)
{
  const PageId pageNum = rowNum / ROWS_PER_PAGE;
  Page &page = m_pager.getPage(pageNum);
  const u32 rowOffset = rowNum % ROWS_PER_PAGE;
  const u32 byteOffset = rowOffset * ROW_SIZE;
  return RowSpan(page.buf.data() + byteOffset, ROW_SIZE);
}

InsertResult Table::insert(const Row &row)
{
  if (m_nRows >= TABLE_MAX_ROWS)
  {
    return InsertResult::TableFull;
  }

  serialiseRow(row, rowSlot(m_nRows));
  m_nRows++;
  return InsertResult::Success;
}

Row Table::rowAt(u32 rowNum)
{
  if (rowNum >= m_nRows)
  {
    throw PageOutOfRange(rowNum / ROWS_PER_PAGE, "Tried to read a row past the end of the table");
  }
  return deserialiseRow(rowSlot(rowNum));
}

void Table::flush()
{
  const u32 nFullPages = m_nRows / ROWS_PER_PAGE;
  for (PageId i = 0; i < nFullPages; i++)
  {
    if (!m_pager.isCached(i))
      continue;
    m_pager.flushPage(i, PAGE_SIZE);
    m_pager.releasePage(i);
  }

  // never write the unused tail of the last page
  const u32 nAdditionalRows = m_nRows % ROWS_PER_PAGE;
  if (nAdditionalRows > 0)
  {
    const PageId pageNum = nFullPages;
    if (m_pager.isCached(pageNum))
    {
      m_pager.flushPage(pageNum, nAdditionalRows * ROW_SIZE);
      m_pager.releasePage(pageNum);
    }
  }
}

Table::iterator Table::begin() { return iterator(this, 0); }
Table::iterator Table::end() { return iterator(); }

Table::iterator::iterator(Table *table, u32 rowNum)
: m_table(table), m_rowNum(rowNum), m_isEnd(false), m_cached()
{
  load();
}

void Table::iterator::load()
{
  if (!m_table || m_rowNum >= m_table->nRows())
  {
    m_isEnd = true;
    return;
  }

  m_cached = m_table->rowAt(m_rowNum);
}

Table::iterator &Table::iterator::operator++()
{
  if (m_isEnd)
  {
    return *this;
  }

  m_rowNum++;
  load();
  return *this;
}

Table::iterator Table::iterator::operator++(int)
{
  iterator tmp = *this;
  ++(*this);
  return tmp;
}
