#pragma once

#include <sstream>
#include <string>

#include "database/table.hpp"

// a string backed stream where seeking into one page fails, in the directions given by `which`
class FailingPageBuf : public std::stringbuf
{
public:
  FailingPageBuf(const std::string &contents, PageId failing, std::ios::openmode which)
      : std::stringbuf(contents, std::ios::in | std::ios::out | std::ios::binary),
        m_failing(failing), m_which(which)
  {
  }

protected:
  pos_type seekpos(pos_type pos, std::ios::openmode which) override
  {
    const off_type off = pos;
    const off_type start = static_cast<off_type>(m_failing) * PAGE_SIZE;
    if ((which & m_which) && off >= start && off < start + PAGE_SIZE)
    {
      return pos_type(off_type(-1));
    }
    return std::stringbuf::seekpos(pos, which);
  }

private:
  PageId m_failing;
  std::ios::openmode m_which;
};

// the bytes of a flushed table holding rows 0..n-1, each made by `makeRow`
template <typename F>
std::string tableBytes(u32 n, F makeRow)
{
  std::stringstream ss;
  Table t = Table(ss);
  for (u32 i = 0; i < n; i++)
  {
    if (t.insert(makeRow(i)) != InsertResult::Success)
    {
      break;
    }
  }
  t.flush();
  return ss.str();
}
