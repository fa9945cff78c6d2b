#include <gtest/gtest.h>
#include "../include/Action.hpp"
#include "TestSupport.hpp"
#include <sstream>
#include <stdexcept>

using namespace ergon;
using namespace ergon::testing;

TEST(CmdAction, SuccessCapturesStdout)
{
    const CmdAction a("echo hello");
    const auto res = a.execute(ActionContext{true, true});
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.out, "hello\n");
    EXPECT_EQ(res.err, "");
}

TEST(CmdAction, NonZeroExitIsFailure)
{
    const CmdAction a("echo oops 1>&2; exit 3");
    const auto res = a.execute(ActionContext{true, true});
    EXPECT_EQ(res.kind, ActionResult::Kind::Failure);
    EXPECT_EQ(res.err, "oops\n");
    EXPECT_NE(res.message.find("returned 3"), std::string::npos);
}

TEST(CmdAction, StdoutOnlyCapture)
{
    const CmdAction a("echo visible");
    const auto res = a.execute(ActionContext{false, true});
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.out, "");
}

TEST(CmdAction, WritesFiles)
{
    TmpDir dir;
    const std::string target = dir.file("out.txt");
    const CmdAction a("printf abc > '" + target + "'");
    ASSERT_TRUE(a.execute(ActionContext{}).ok());
    EXPECT_EQ(read_file(target), "abc");
}

TEST(CallableAction, FalseIsFailure)
{
    const CallableAction a("nope", [](std::ostream &, std::ostream &) { return false; });
    const auto res = a.execute(ActionContext{});
    EXPECT_EQ(res.kind, ActionResult::Kind::Failure);
    EXPECT_EQ(a.describe(), "nope");
}

TEST(CallableAction, ThrowIsError)
{
    const CallableAction a("boom", [](std::ostream &, std::ostream &) -> bool {
        throw std::runtime_error("kaboom");
    });
    const auto res = a.execute(ActionContext{});
    EXPECT_EQ(res.kind, ActionResult::Kind::Error);
    EXPECT_NE(res.message.find("kaboom"), std::string::npos);
}

TEST(CallableAction, CapturesStreams)
{
    const CallableAction a("talk", [](std::ostream &out, std::ostream &err) {
        out << "to out";
        err << "to err";
        return true;
    });
    const auto res = a.execute(ActionContext{true, true});
    EXPECT_TRUE(res.ok());
    EXPECT_EQ(res.out, "to out");
    EXPECT_EQ(res.err, "to err");
}
