#include <gtest/gtest.h>
#include <scanner.hpp>
#include <string>
#include <vector>


static std::vector<Token> scanAll(const std::string& source) {
    Scanner scanner(MapView(source.c_str(), source.size()));
    std::vector<Token> ret;
    while (true) {
        Token t = scanner.next();
        ret.push_back(t);
        if (t.type == Token::END) {
            return ret;
        }
    }
}


TEST(Scanner, Punctuation) {
    std::vector<Token> tokens = scanAll("( ) { } [ ] ; ,");
    std::vector<Token::Type> expected = {Token::L_PAREN, Token::R_PAREN, Token::L_BLOCK, Token::R_BLOCK,
        Token::ARR_START, Token::ARR_END, Token::EXPR_END, Token::ARR_SEP, Token::END};
    ASSERT_EQ(tokens.size(), expected.size());
    for (size_t i = 0; i < expected.size(); i ++) {
        EXPECT_EQ(tokens[i].type, expected[i]) << "token " << i;
    }
}

TEST(Scanner, AssignmentAndEquality) {
    std::vector<Token> tokens = scanAll("x = y == z");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[1].type, Token::ASSIGN);
    EXPECT_EQ(tokens[3].type, Token::OPERATOR);
    EXPECT_EQ(tokens[3].content, "==");
}

TEST(Scanner, CommentsAndLines) {
    std::vector<Token> tokens = scanAll("a # ignored ( ] \"\nb\n\n  c");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].content, "a");
    EXPECT_EQ(tokens[0].line, 1);
    EXPECT_EQ(tokens[1].content, "b");
    EXPECT_EQ(tokens[1].line, 2);
    EXPECT_EQ(tokens[2].content, "c");
    EXPECT_EQ(tokens[2].line, 4);
}

TEST(Scanner, CommentRunningToEnd) {
    std::vector<Token> tokens = scanAll("a # no newline after this");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].content, "a");
    EXPECT_EQ(tokens[1].type, Token::END);
}

TEST(Scanner, IdentifiersAreLettersOnly) {
    std::vector<Token> tokens = scanAll("abc12 while");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].type, Token::IDENTIFIER);
    EXPECT_EQ(tokens[0].content, "abc");
    EXPECT_EQ(tokens[1].type, Token::NUMBER_LITERAL);
    EXPECT_EQ(tokens[1].content, "12");
    EXPECT_EQ(tokens[2].type, Token::IDENTIFIER); // keywords are the parser's business
    EXPECT_EQ(tokens[2].content, "while");
}

TEST(Scanner, SecondPointEndsNumber) {
    std::vector<Token> tokens = scanAll("1.2.3");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].content, "1.2");
    EXPECT_EQ(tokens[1].type, Token::OPERATOR);
    EXPECT_EQ(tokens[1].content, ".");
    EXPECT_EQ(tokens[2].type, Token::NUMBER_LITERAL);
    EXPECT_EQ(tokens[2].content, "3");
}

TEST(Scanner, Strings) {
    std::vector<Token> tokens = scanAll("\"hello # world\" \"\"");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, Token::STRING_LITERAL);
    EXPECT_EQ(tokens[0].content, "hello # world");
    EXPECT_EQ(tokens[1].type, Token::STRING_LITERAL);
    EXPECT_EQ(tokens[1].content, "");
}

TEST(Scanner, UnterminatedStringIsAnOperator) {
    std::vector<Token> tokens = scanAll("\"abc\nx");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, Token::OPERATOR);
    EXPECT_EQ(tokens[0].content, "\"abc");
    EXPECT_EQ(tokens[1].content, "x");
    EXPECT_EQ(tokens[1].line, 2);
}

TEST(Scanner, UnknownCharacters) {
    std::vector<Token> tokens = scanAll("$ @");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].type, Token::OPERATOR);
    EXPECT_EQ(tokens[0].content, "$");
    EXPECT_EQ(tokens[1].content, "@");
}

TEST(Scanner, EndRepeats) {
    Scanner scanner(MapView("", 0));
    EXPECT_EQ(scanner.next().type, Token::END);
    EXPECT_EQ(scanner.next().type, Token::END);
}

TEST(Scanner, Describe) {
    Token t(Token::IDENTIFIER, "foo", 3);
    EXPECT_EQ(t.describe(), "IDENTIFIER 'foo'");
    Token end(Token::END, "", 3);
    EXPECT_EQ(end.describe(), "end of input");
}
