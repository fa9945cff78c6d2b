#include <gtest/gtest.h>
#include "../include/Errors.hpp"
#include "../include/TaskSelector.hpp"
#include "TestSupport.hpp"
#include <algorithm>
#include <memory>

using namespace ergon;
using namespace ergon::testing;

namespace
{
    std::vector<std::string> names_of(const ExecutionPlan &plan)
    {
        std::vector<std::string> out;
        for (const Task *t: plan) out.push_back(t->name);
        return out;
    }

    std::shared_ptr<const Action> noop()
    {
        return std::make_shared<CallableAction>("noop", [](std::ostream &, std::ostream &) { return true; });
    }

    // every task comes after the whole of its task_dep closure
    void expect_dependency_order(const ExecutionPlan &plan)
    {
        const auto names = names_of(plan);
        auto pos = [&](const std::string &n) { return std::find(names.begin(), names.end(), n) - names.begin(); };
        for (const Task *t: plan) {
            for (const auto &dep: t->task_dep) {
                EXPECT_LT(pos(dep), pos(t->name)) << dep << " must come before " << t->name;
            }
        }
    }
} // namespace

TEST(TaskSelector, DefaultSelectsTopLevelInDeclarationOrder)
{
    Task sub = make_task("compile:a.c", {noop()});
    sub.is_subtask = true;
    const TaskGraph g({make_task("setup", {noop()}), make_task("test", {noop()}), sub,
                       make_task("compile", {}, {}, {"compile:a.c"})});
    const TaskSelector sel(g);
    const auto plan = sel.process({});
    EXPECT_EQ(names_of(plan), (std::vector<std::string>{"setup", "test", "compile:a.c", "compile"}));
}

TEST(TaskSelector, ConfiguredDefaultTasks)
{
    const TaskGraph g({make_task("a", {noop()}), make_task("b", {noop()}), make_task("c", {noop()})});
    const TaskSelector sel(g, {"c"});
    EXPECT_EQ(names_of(sel.process({})), (std::vector<std::string>{"c"}));
    EXPECT_EQ(names_of(sel.process({"a"})), (std::vector<std::string>{"a"}));
}

TEST(TaskSelector, UnknownNameThrows)
{
    const TaskGraph g({make_task("a", {noop()})});
    const TaskSelector sel(g);
    try {
        (void) sel.process({"a", "nope"});
        FAIL() << "expected InvalidCommand";
    } catch (const InvalidCommand &e) {
        EXPECT_NE(std::string(e.what()).find("'nope' is not a task."), std::string::npos);
    }
}

TEST(TaskSelector, CycleRejected)
{
    const TaskGraph g({make_task("A", {noop()}, {}, {"B"}), make_task("B", {noop()}, {}, {"A"})});
    const TaskSelector sel(g);
    try {
        (void) sel.process({"A"});
        FAIL() << "expected SelectionError";
    } catch (const SelectionError &e) {
        EXPECT_NE(std::string(e.what()).find("A -> B -> A"), std::string::npos) << e.what();
    }
}

TEST(TaskSelector, CycleBehindGroupRejected)
{
    const TaskGraph g({make_task("all", {}, {}, {"x"}), make_task("x", {noop()}, {}, {"y"}),
                       make_task("y", {noop()}, {}, {"z"}), make_task("z", {noop()}, {}, {"x"})});
    const TaskSelector sel(g);
    EXPECT_THROW((void) sel.process({"all"}), SelectionError);
}

TEST(TaskSelector, DependenciesComeFirst)
{
    // declared in reverse order on purpose
    const TaskGraph g({make_task("link", {noop()}, {}, {"compile"}), make_task("compile", {noop()}, {}, {"gen"}),
                       make_task("gen", {noop()})});
    const TaskSelector sel(g);
    const auto plan = sel.process({"link"});
    EXPECT_EQ(names_of(plan), (std::vector<std::string>{"gen", "compile", "link"}));
    expect_dependency_order(plan);
}

TEST(TaskSelector, DiamondAppearsOnce)
{
    const TaskGraph g({make_task("base", {noop()}), make_task("left", {noop()}, {}, {"base"}),
                       make_task("right", {noop()}, {}, {"base"}), make_task("top", {noop()}, {}, {"left", "right"})});
    const TaskSelector sel(g);
    const auto plan = sel.process({"top", "left", "top"});
    EXPECT_EQ(names_of(plan), (std::vector<std::string>{"base", "left", "right", "top"}));
    expect_dependency_order(plan);
}

TEST(TaskSelector, IndependentTasksKeepDeclarationOrder)
{
    const TaskGraph g({make_task("y", {noop()}), make_task("z", {noop()})});
    const TaskSelector sel(g);
    EXPECT_EQ(names_of(sel.process({"z", "y"})), (std::vector<std::string>{"y", "z"}));
}

TEST(TaskSelector, TaskWaitingOnLaterDeclaredDepKeepsItsPlace)
{
    const TaskGraph g({make_task("a", {noop()}, {}, {"c"}), make_task("b", {noop()}), make_task("c", {noop()})});
    const TaskSelector sel(g);
    const auto plan = sel.process({});
    EXPECT_EQ(names_of(plan), (std::vector<std::string>{"c", "a", "b"}));
    expect_dependency_order(plan);
}

TEST(TaskSelector, DependencyListOrderKept)
{
    const TaskGraph g({make_task("y", {noop()}), make_task("x", {noop()}), make_task("top", {noop()}, {}, {"x", "y"})});
    const TaskSelector sel(g);
    EXPECT_EQ(names_of(sel.process({"top"})), (std::vector<std::string>{"x", "y", "top"}));
}

TEST(TaskSelector, GroupExpandsRecursively)
{
    const TaskGraph g({make_task("x", {noop()}), make_task("y", {noop()}), make_task("inner", {}, {}, {"y"}),
                       make_task("outer", {}, {}, {"x", "inner"}), make_task("other", {noop()})});
    const TaskSelector sel(g);
    const auto plan = sel.process({"outer"});
    EXPECT_EQ(names_of(plan), (std::vector<std::string>{"x", "y", "inner", "outer"}));
}

TEST(TaskSelector, GroupMembersBreadthFirst)
{
    const TaskGraph g({make_task("w", {noop()}), make_task("x", {noop()}, {}, {"w"}), make_task("y", {noop()}),
                       make_task("h", {}, {}, {"y"}), make_task("g", {}, {}, {"x", "h"})});
    const TaskSelector sel(g);
    // x has actions of its own, so its dependency w is not a group member
    EXPECT_EQ(sel.group_members("g"), (std::vector<std::string>{"g", "x", "h", "y"}));
    EXPECT_EQ(sel.group_members("x"), (std::vector<std::string>{"x"}));
}

TEST(TaskSelector, GroupMembersStopOnCycle)
{
    const TaskGraph g({make_task("g1", {}, {}, {"g2"}), make_task("g2", {}, {}, {"g1"})});
    const TaskSelector sel(g);
    EXPECT_EQ(sel.group_members("g1"), (std::vector<std::string>{"g1", "g2"}));
}

TEST(TaskGraph, DuplicateNameRejected)
{
    EXPECT_THROW((void) TaskGraph({make_task("a", {}), make_task("a", {})}), InvalidTask);
}

TEST(TaskGraph, DanglingTaskDepRejected)
{
    EXPECT_THROW((void) TaskGraph({make_task("a", {}, {}, {"ghost"})}), InvalidTask);
}
