#include "database/database.hpp"

#include <iostream>

static std::fstream openFile(const std::filesystem::path &path)
{
  const auto mode = std::ios::in | std::ios::out | std::ios::binary;
  std::fstream f(path, mode);
  if (!f.is_open() && !std::filesystem::exists(path))
  {
    // in|out will not create the file, so make an empty one first
    // app never truncates, should the file appear in the meantime
    std::ofstream create(path, std::ios::out | std::ios::app | std::ios::binary);
    if (!create)
    {
      throw std::runtime_error("Failed to create database file.");
    }
    create.close();
    f.open(path, mode);
  }

  if (!f.is_open())
  {
    throw std::runtime_error("Failed to open database file.");
  }
  return f;
}

Database::Database(const std::filesystem::path &path)
: m_file(openFile(path)), m_table(m_file)
{
}

Database::~Database()
{
  if (m_closed)
    return;

  try
  {
    close();
  }
  catch (std::exception &e)
  {
    std::cerr << "Failed to close database: " << e.what() << std::endl;
  }
}

void Database::close()
{
  if (m_closed)
    return;
  // a failed shutdown is not attempted again
  m_closed = true;

  m_table.flush();

  m_file.clear();
  m_file.close();
  if (!m_file)
  {
    throw std::runtime_error("Failed to close database file.");
  }

  for (PageId i = 0; i < TABLE_MAX_PAGES; i++)
  {
    m_table.pager().releasePage(i);
  }
}
