#include "database/row.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

// read a zero padded column, the value ends at the first null or fills the column
template <std::size_t N>
static bool readColumn(std::istream &stream, std::string &out)
{
  std::array<char, N> buf;
  if (!stream.read(buf.data(), static_cast<std::streamsize>(buf.size())))
    return false;

  const auto end = std::find(buf.begin(), buf.end(), '\0');
  out.assign(buf.begin(), end);
  return true;
}

bool Row::serialise(std::ostream &stream) const noexcept
{
  if (!writeLittleu32(stream, id))
    return false;
  if (!writePadded(stream, username.data(), username.size(), USERNAME_SIZE))
    return false;
  if (!writePadded(stream, email.data(), email.size(), EMAIL_SIZE))
    return false;
  return true;
}

bool Row::deserialise(std::istream &stream)
{
  if (!readLittleu32(stream, id))
    return false;
  if (!readColumn<USERNAME_SIZE>(stream, username))
    return false;
  if (!readColumn<EMAIL_SIZE>(stream, email))
    return false;
  return true;
}

void serialiseRow(const Row &row, RowSpan slot)
{
  membuf buf(reinterpret_cast<char *>(slot.data()), slot.size());
  std::ostream out(&buf);

  if (!row.serialise(out))
  {
    throw std::runtime_error("Failed to serialise row");
  }
}

Row deserialiseRow(RowSpan slot)
{
  membuf buf(reinterpret_cast<char *>(slot.data()), slot.size());
  std::istream in(&buf);

  Row row;
  if (!row.deserialise(in))
  {
    throw std::runtime_error("Failed to deserialise row");
  }
  return row;
}

std::ostream &operator<<(std::ostream &os, const Row &row)
{
  return os << "(" << row.id << ", " << row.username << ", " << row.email << ")";
}
