#include <gtest/gtest.h>

#include "parser.hpp"

namespace {
Statement parse(std::string_view input)
{
  Scanner scanner = Scanner(input);
  Parser parser = Parser(scanner);
  return parser.parse();
}

ParseError::Kind parseErrorKind(std::string_view input)
{
  try
  {
    parse(input);
  }
  catch (ParseError &e)
  {
    return e.kind();
  }
  ADD_FAILURE() << "expected a parse error for '" << input << "'";
  return ParseError::Kind::SyntaxError;
}
}

TEST(Parser, Insert) {
  Statement s = parse("insert 1 user1 person1@example.com");
  const InsertStatement *insert = std::get_if<InsertStatement>(&s);
  ASSERT_NE(nullptr, insert);
  EXPECT_EQ((Row{1, "user1", "person1@example.com"}), insert->row);
}

TEST(Parser, InsertQuotedAndKeywordValues) {
  Statement s = parse("insert 4294967295 'jo smith' select");
  const InsertStatement *insert = std::get_if<InsertStatement>(&s);
  ASSERT_NE(nullptr, insert);
  EXPECT_EQ(4294967295u, insert->row.id);
  EXPECT_EQ("jo smith", insert->row.username);
  EXPECT_EQ("select", insert->row.email);
}

TEST(Parser, Select) {
  Statement s = parse("select");
  EXPECT_TRUE(std::holds_alternative<SelectStatement>(s));
}

TEST(Parser, MaximumLengths) {
  const std::string username(COLUMN_USERNAME_SIZE, 'a');
  const std::string email(COLUMN_EMAIL_SIZE, 'b');
  Statement s = parse("insert 1 " + username + " " + email);
  const InsertStatement *insert = std::get_if<InsertStatement>(&s);
  ASSERT_NE(nullptr, insert);
  EXPECT_EQ(username, insert->row.username);
  EXPECT_EQ(email, insert->row.email);
}

TEST(Parser, Unrecognized) {
  EXPECT_EQ(ParseError::Kind::UnrecognizedStatement, parseErrorKind("update 1"));
  EXPECT_EQ(ParseError::Kind::UnrecognizedStatement, parseErrorKind("selectx"));
  EXPECT_EQ(ParseError::Kind::UnrecognizedStatement, parseErrorKind(""));
}

TEST(Parser, SyntaxErrors) {
  EXPECT_EQ(ParseError::Kind::SyntaxError, parseErrorKind("insert"));
  EXPECT_EQ(ParseError::Kind::SyntaxError, parseErrorKind("insert 1 user1"));
  EXPECT_EQ(ParseError::Kind::SyntaxError, parseErrorKind("insert 1 a b c"));
  EXPECT_EQ(ParseError::Kind::SyntaxError, parseErrorKind("insert abc a b"));
  EXPECT_EQ(ParseError::Kind::SyntaxError, parseErrorKind("insert 'a b' user1 b"));
  EXPECT_EQ(ParseError::Kind::SyntaxError, parseErrorKind("insert 1 'open b"));
  EXPECT_EQ(ParseError::Kind::SyntaxError, parseErrorKind("select *"));
}

TEST(Parser, IdRange) {
  EXPECT_EQ(ParseError::Kind::SyntaxError, parseErrorKind("insert -1 a b"));
  EXPECT_EQ(ParseError::Kind::SyntaxError, parseErrorKind("insert 4294967296 a b"));
  EXPECT_EQ(ParseError::Kind::SyntaxError, parseErrorKind("insert 99999999999999999999999 a b"));
}

TEST(Parser, StringTooLong) {
  const std::string username(COLUMN_USERNAME_SIZE + 1, 'a');
  const std::string email(COLUMN_EMAIL_SIZE + 1, 'b');
  EXPECT_EQ(ParseError::Kind::StringTooLong, parseErrorKind("insert 1 " + username + " b"));
  EXPECT_EQ(ParseError::Kind::StringTooLong, parseErrorKind("insert 1 a " + email));
}

TEST(Parser, NullByte) {
  const std::string input("insert 1 a\0b c", 14);
  EXPECT_EQ(ParseError::Kind::NullByte, parseErrorKind(input));
}
