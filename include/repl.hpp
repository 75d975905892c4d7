#pragma once

#include "database/table.hpp"
#include "statement.hpp"

#include <iostream>
#include <string_view>

enum class MetaCommandResult
{
  Exit,
  Unrecognized,
};

enum class ExecuteResult
{
  Success,
  TableFull,
};

MetaCommandResult doMetaCommand(std::string_view command);
ExecuteResult executeStatement(const Statement &statement, Table &table, std::ostream &out);

// read commands from `in` until `+quit` or the end of input
void runRepl(std::istream &in, std::ostream &out, Table &table);
