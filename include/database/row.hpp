#pragma once

#include "layout.hpp"

#include <cstddef>
#include <span>
#include <string>

// a single record of the table, the shape is fixed at compile time
struct Row
{
  u32 id = 0;
  std::string username;
  std::string email;

  // writes exactly ROW_SIZE bytes, truncating strings that do not fit their column
  bool serialise(std::ostream &stream) const noexcept;
  // the columns are allocated as strings, so this may throw std::bad_alloc
  bool deserialise(std::istream &stream);

  bool operator==(const Row &b) const = default;
};

using RowSpan = std::span<std::byte, ROW_SIZE>;

void serialiseRow(const Row &row, RowSpan slot);
Row deserialiseRow(RowSpan slot);

// e.g. (1, user1, person1@example.com)
std::ostream &operator<<(std::ostream &os, const Row &row);
