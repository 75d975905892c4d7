#pragma once

#include "table.hpp"

#include <filesystem>
#include <fstream>

// owns the database file and the table stored in it
// the file is opened on construction and flushed then closed exactly once,
// by close() or otherwise by the destructor
class Database
{
public:
  explicit Database(const std::filesystem::path &path);
  ~Database();

  Database(const Database &) = delete;
  Database &operator=(const Database &) = delete;

  Table &table() noexcept { return m_table; }
  bool isOpen() const noexcept { return !m_closed; }

  void close();

private:
  std::fstream m_file;
  Table m_table;
  bool m_closed = false;
};
