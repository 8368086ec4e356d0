#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "repl.hpp"

class ReplTest : public ::testing::Test {
   protected:
    std::ostringstream out;
    std::ostringstream err;
    ReplSession session{out, err};
};

TEST_F(ReplTest, StatePersistsAcrossLines) {
    EXPECT_EQ(session.feed_line("var a = 40;"), ReplSession::Status::COMPLETE);
    EXPECT_EQ(session.feed_line("print a + 2;"), ReplSession::Status::COMPLETE);
    EXPECT_EQ(out.str(), "42\n");
}

TEST_F(ReplTest, BareExpressionIsPrinted) {
    session.feed_line("1 + 2");
    session.feed_line("\"str\";");
    EXPECT_EQ(out.str(), "3\nstr\n");
}

TEST_F(ReplTest, AssignmentEchoesValue) {
    session.feed_line("var x;");
    session.feed_line("x = 5");
    EXPECT_EQ(out.str(), "5\n");
}

TEST_F(ReplTest, OpenBraceWaitsForMoreInput) {
    EXPECT_EQ(session.feed_line("fun twice(n) {"), ReplSession::Status::NEED_MORE);
    EXPECT_TRUE(session.has_pending_input());
    EXPECT_STREQ(session.prompt(), "... ");
    EXPECT_EQ(session.feed_line("  return n * 2;"), ReplSession::Status::NEED_MORE);
    EXPECT_EQ(session.feed_line("}"), ReplSession::Status::COMPLETE);
    EXPECT_FALSE(session.has_pending_input());
    EXPECT_STREQ(session.prompt(), "> ");

    session.feed_line("twice(21)");
    EXPECT_EQ(out.str(), "42\n");
}

TEST_F(ReplTest, BraceInsideStringDoesNotContinue) {
    EXPECT_EQ(session.feed_line("print \"{\";"), ReplSession::Status::COMPLETE);
    EXPECT_EQ(out.str(), "{\n");
}

TEST_F(ReplTest, ErrorsDoNotEndTheSession) {
    session.feed_line("print undefinedThing;");
    EXPECT_NE(err.str().find("Undefined variable 'undefinedThing'."), std::string::npos);

    session.feed_line("print (;");
    EXPECT_TRUE(session.reporter().had_error());

    session.feed_line("print \"still here\";");
    EXPECT_FALSE(session.reporter().had_error());
    EXPECT_EQ(out.str(), "still here\n");
}

TEST_F(ReplTest, RuntimeErrorInEchoedExpression) {
    session.feed_line("-\"x\"");
    EXPECT_NE(err.str().find("Operand must be a number."), std::string::npos);
    EXPECT_EQ(out.str(), "");
}

TEST_F(ReplTest, ClassesFromEarlierEntries) {
    session.feed_line("class Greeter { hi(n) { return \"hi \" + n; } }");
    session.feed_line("var g = Greeter();");
    session.feed_line("g.hi(\"there\")");
    EXPECT_EQ(out.str(), "hi there\n");
}

TEST_F(ReplTest, ClosureOutlivesEntry) {
    session.feed_line("fun make() { var n = 0; fun inc() { n = n + 1; return n; } return inc; }");
    session.feed_line("var c = make();");
    session.feed_line("c();");
    session.feed_line("c()");
    EXPECT_EQ(out.str(), "1\n2\n");
}

TEST_F(ReplTest, ExitCommands) {
    EXPECT_EQ(session.feed_line("exit"), ReplSession::Status::EXIT);
    EXPECT_EQ(session.feed_line("quit"), ReplSession::Status::EXIT);
}

TEST_F(ReplTest, BlankLineIsIgnored) {
    EXPECT_EQ(session.feed_line(""), ReplSession::Status::COMPLETE);
    EXPECT_EQ(session.feed_line("   "), ReplSession::Status::COMPLETE);
    EXPECT_EQ(out.str(), "");
    EXPECT_EQ(err.str(), "");
}

TEST_F(ReplTest, TrailingCommentIsNotTerminated) {
    session.feed_line("print 3; // three");
    EXPECT_EQ(out.str(), "3\n");
    EXPECT_EQ(err.str(), "");
}

TEST_F(ReplTest, SlashesInsideStringAreNotAComment) {
    EXPECT_EQ(session.feed_line("print \"http://x\""), ReplSession::Status::COMPLETE);
    session.feed_line("\"a//b\"");
    EXPECT_EQ(out.str(), "http://x\na//b\n");
    EXPECT_EQ(err.str(), "");
}

TEST_F(ReplTest, CommentAfterStringWithSlashes) {
    session.feed_line("print \"a//b\"; // trailing");
    EXPECT_EQ(out.str(), "a//b\n");
    EXPECT_EQ(err.str(), "");
}
