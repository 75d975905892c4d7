#include "repl.hpp"
#include "parser.hpp"

#include <string>

static void printPrompt(std::ostream &out)
{
  out << "pagedb > " << std::flush;
}

static std::string_view trim(std::string_view s)
{
  const auto isSpace = [](char c) { return c > 0 && c <= ' '; };
  while (!s.empty() && isSpace(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && isSpace(s.back()))
    s.remove_suffix(1);
  return s;
}

MetaCommandResult doMetaCommand(std::string_view command)
{
  if (command == "+quit")
  {
    return MetaCommandResult::Exit;
  }
  return MetaCommandResult::Unrecognized;
}

ExecuteResult executeStatement(const Statement &statement, Table &table, std::ostream &out)
{
  if (const InsertStatement *insert = std::get_if<InsertStatement>(&statement); insert != nullptr)
  {
    if (table.insert(insert->row) == InsertResult::TableFull)
    {
      return ExecuteResult::TableFull;
    }
    return ExecuteResult::Success;
  }

  // a row that cannot be read is reported and the rest are still listed
  for (u32 i = 0; i < table.nRows(); i++)
  {
    try
    {
      out << table.rowAt(i) << "\n";
    }
    catch (PageError &e)
    {
      out << "Error reading row " << i << ": " << e.what() << "\n";
    }
  }
  return ExecuteResult::Success;
}

static const char *parseErrorMessage(ParseError::Kind kind)
{
  switch (kind)
  {
  case ParseError::Kind::UnrecognizedStatement:
    return "Unrecognized keyword at start of";
  case ParseError::Kind::SyntaxError:
    return "Syntax error. Could not parse statement.";
  case ParseError::Kind::StringTooLong:
    return "String is too long.";
  case ParseError::Kind::NullByte:
    return "String contains a null byte.";
  }
  return "Could not parse statement.";
}

void runRepl(std::istream &in, std::ostream &out, Table &table)
{
  std::string input;

  while (true)
  {
    printPrompt(out);
    if (!std::getline(in, input))
    {
      break;
    }

    const std::string_view command = trim(input);
    if (command.empty())
    {
      continue;
    }

    if (command.front() == '+')
    {
      if (doMetaCommand(command) == MetaCommandResult::Exit)
      {
        break;
      }
      out << "Unrecognized command " << command << "." << std::endl;
      continue;
    }

    Scanner scanner = Scanner(command);
    Parser parser = Parser(scanner);
    Statement statement;
    try
    {
      statement = parser.parse();
    }
    catch (ParseError &e)
    {
      if (e.kind() == ParseError::Kind::UnrecognizedStatement)
      {
        out << parseErrorMessage(e.kind()) << " " << command << "." << std::endl;
      }
      else
      {
        out << parseErrorMessage(e.kind()) << std::endl;
      }
      continue;
    }

    try
    {
      switch (executeStatement(statement, table, out))
      {
      case ExecuteResult::Success:
        out << "Executed." << std::endl;
        break;
      case ExecuteResult::TableFull:
        out << "Error: Table full." << std::endl;
        break;
      }
    }
    catch (PageError &e)
    {
      // the statement failed but the session carries on
      out << "Error: " << e.what() << std::endl;
    }
  }
}
