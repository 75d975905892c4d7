#pragma once

#include <iostream>
#include <cstdint>
#include <array>

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// the on-disk format is little endian regardless of the host
inline bool writeLittleu32(std::ostream &out, u32 v)
{
  unsigned char buf[] = {
      static_cast<unsigned char>((v >> 0) & 0xFF),
      static_cast<unsigned char>((v >> 8) & 0xFF),
      static_cast<unsigned char>((v >> 16) & 0xFF),
      static_cast<unsigned char>((v >> 24) & 0xFF),
  };

  if (!out.write(reinterpret_cast<const char *>(buf), 4))
    return false;
  return true;
}

inline bool readLittleu32(std::istream &in, u32 &v)
{
  std::array<unsigned char, 4> buf;
  in.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (!in)
    return false;

  v = (static_cast<u32>(buf[0])) |
      (static_cast<u32>(buf[1]) << 8) |
      (static_cast<u32>(buf[2]) << 16) |
      (static_cast<u32>(buf[3]) << 24);
  return true;
}

// write `width` bytes: as much of `data` as fits, then zeros
inline bool writePadded(std::ostream &out, const char *data, std::size_t len, std::size_t width)
{
  const std::size_t n = len < width ? len : width;
  if (!out.write(data, static_cast<std::streamsize>(n)))
    return false;

  for (std::size_t i = n; i < width; i++)
  {
    if (!out.put('\0'))
      return false;
  }
  return true;
}

// stream over a fixed region of memory, used to (de)serialise straight into a page
class membuf : public std::streambuf
{
public:
  membuf(char *data, std::size_t N)
  {
    setg(data, data, data + N);
    setp(data, data + N);
  }
};
