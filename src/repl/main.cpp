#include "database/database.hpp"
#include "repl.hpp"

#include <iostream>

int main(int argc, char **argv)
{
  if (argc < 2)
  {
    std::cerr << "Usage: pagedb <database file>" << std::endl;
    return 1;
  }

  try
  {
    Database db(argv[1]);
    runRepl(std::cin, std::cout, db.table());
    db.close();
  }
  catch (std::exception &e)
  {
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
