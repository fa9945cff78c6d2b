#include <gtest/gtest.h>
#include "../include/Errors.hpp"
#include "../include/TaskFile.hpp"
#include "TestSupport.hpp"
#include <fstream>
#include <string>
#include <vector>

using namespace ergon;
using namespace ergon::testing;

namespace
{
    TaskFileParser parse(const TmpDir &dir, const std::string &text)
    {
        const std::string path = dir.file("Ergonfile");
        write_file(path, text);
        return load_task_file(path);
    }

    const Task &find_task(const TaskFileParser &p, const std::string &name)
    {
        for (const auto &t: p.get_tasks()) {
            if (t.name == name) return t;
        }
        throw std::runtime_error("no task " + name);
    }
} // namespace

TEST(TaskFile, SimpleTask)
{
    TmpDir dir;
    const auto p = parse(dir,
                         "# build the thing\n"
                         "@task compile\n"
                         "  @doc \"compile sources\"\n"
                         "  @action cc -c main.c -o main.o\n"
                         "  @file_dep main.c util.h\n"
                         "  @target main.o\n"
                         "  @clean\n"
                         "@end\n"
                         "@task link\n"
                         "  @action cc main.o -o app\n"
                         "  @task_dep compile\n"
                         "  @file_dep main.o\n"
                         "  @verbosity 2\n"
                         "@end\n");

    ASSERT_EQ(p.get_tasks().size(), 2u);
    const Task &c = p.get_tasks()[0];
    EXPECT_EQ(c.name, "compile");
    EXPECT_EQ(c.doc, "compile sources");
    ASSERT_EQ(c.actions.size(), 1u);
    EXPECT_EQ(c.actions[0]->describe(), "cc -c main.c -o main.o");
    EXPECT_EQ(c.file_dep, (std::vector<std::string>{"main.c", "util.h"}));
    EXPECT_EQ(c.targets, std::vector<std::string>{"main.o"});
    EXPECT_TRUE(c.clean_targets);
    EXPECT_FALSE(c.verbosity.has_value());

    const Task &l = p.get_tasks()[1];
    EXPECT_EQ(l.task_dep, std::vector<std::string>{"compile"});
    EXPECT_EQ(l.verbosity, 2);
    EXPECT_FALSE(l.clean_targets);
}

TEST(TaskFile, HashInsideCommandIsKept)
{
    TmpDir dir;
    const auto p = parse(dir,
                         "@task t\n"
                         "  @action echo '#not a comment' // still here\n"
                         "  // a comment line\n"
                         "@end\n");
    ASSERT_EQ(p.get_tasks().size(), 1u);
    ASSERT_EQ(p.get_tasks()[0].actions.size(), 1u);
    EXPECT_EQ(p.get_tasks()[0].actions[0]->describe(), "echo '#not a comment' // still here");
}

TEST(TaskFile, LetExpansion)
{
    TmpDir dir;
    const auto p = parse(dir,
                         "@let CC=gcc\n"
                         "@let OUT build\n"
                         "@task compile\n"
                         "  @action ${CC} -c a.c -o ${OUT}/a.o ${UNSET}\n"
                         "  @target ${OUT}/a.o\n"
                         "@end\n");
    const Task &t = find_task(p, "compile");
    EXPECT_EQ(t.actions[0]->describe(), "gcc -c a.c -o build/a.o ${UNSET}");
    EXPECT_EQ(t.targets, std::vector<std::string>{"build/a.o"});
}

TEST(TaskFile, ForeachMakesSubtasksAndGroup)
{
    TmpDir dir;
    const auto p = parse(dir,
                         "@task lint\n"
                         "  @doc check ${F}\n"
                         "  @foreach F in a.py b.py\n"
                         "  @action pyflakes ${F}\n"
                         "  @file_dep ${F}\n"
                         "@end\n");

    ASSERT_EQ(p.get_tasks().size(), 3u);
    const Task &a = p.get_tasks()[0];
    EXPECT_EQ(a.name, "lint:a.py");
    EXPECT_TRUE(a.is_subtask);
    EXPECT_EQ(a.actions[0]->describe(), "pyflakes a.py");
    EXPECT_EQ(a.file_dep, std::vector<std::string>{"a.py"});
    EXPECT_EQ(a.doc, "check a.py");
    EXPECT_EQ(p.get_tasks()[1].name, "lint:b.py");

    const Task &group = p.get_tasks()[2];
    EXPECT_EQ(group.name, "lint");
    EXPECT_TRUE(group.is_group());
    EXPECT_FALSE(group.is_subtask);
    EXPECT_EQ(group.task_dep, (std::vector<std::string>{"lint:a.py", "lint:b.py"}));
}

TEST(TaskFile, ConfigValues)
{
    TmpDir dir;
    const auto p = parse(dir,
                         "@config default_tasks = build test\n"
                         "@config verbosity=2\n"
                         "@config continue=yes\n"
                         "@config always=0\n"
                         "@config reporter=executed-only\n"
                         "@config dep_file=\".state.db\"\n"
                         "@config jobs=4\n");
    const FileConfig &c = p.get_config();
    EXPECT_EQ(c.default_tasks, (std::vector<std::string>{"build", "test"}));
    EXPECT_EQ(c.verbosity, 2);
    EXPECT_EQ(c.continue_on_error, true);
    EXPECT_EQ(c.always_execute, false);
    EXPECT_EQ(c.reporter, "executed-only");
    EXPECT_EQ(c.dep_file, ".state.db");
    EXPECT_EQ(c.jobs, 4u);
}

TEST(TaskFile, BadConfigThrows)
{
    TmpDir dir;
    EXPECT_THROW((void) parse(dir, "@config colour=blue\n"), InvalidTask);
    EXPECT_THROW((void) parse(dir, "@config jobs=0\n"), InvalidTask);
    EXPECT_THROW((void) parse(dir, "@config verbosity=many\n"), InvalidTask);
}

TEST(TaskFile, UnknownDirectiveReportsLine)
{
    TmpDir dir;
    try {
        (void) parse(dir, "@let A=1\n\n@frobnicate now\n");
        FAIL() << "expected InvalidTask";
    } catch (const InvalidTask &e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("line 3"), std::string::npos) << msg;
        EXPECT_NE(msg.find("@frobnicate"), std::string::npos) << msg;
    }
}

TEST(TaskFile, BlockErrors)
{
    TmpDir dir;
    EXPECT_THROW((void) parse(dir, "@task a\n@action true\n"), InvalidTask);
    EXPECT_THROW((void) parse(dir, "@end\n"), InvalidTask);
    EXPECT_THROW((void) parse(dir, "@task a\n@task b\n@end\n"), InvalidTask);
    EXPECT_THROW((void) parse(dir, "@task a\n@include other\n@end\n"), InvalidTask);
    EXPECT_THROW((void) parse(dir, "@task a\n@action\n@end\n"), InvalidTask);
    EXPECT_THROW((void) parse(dir, "@task a\n@verbosity 7\n@end\n"), InvalidTask);
    EXPECT_THROW((void) parse(dir, "plain text\n"), InvalidTask);
}

TEST(TaskFile, MissingFileThrows)
{
    TmpDir dir;
    EXPECT_THROW((void) load_task_file(dir.file("nowhere")), InvalidTask);
}

TEST(TaskFile, UnreachablePathIsInvalidTask)
{
    TmpDir dir;
    // a component longer than NAME_MAX makes stat fail with ENAMETOOLONG
    const std::string too_long = dir.file(std::string(300, 'x'));
    EXPECT_THROW((void) load_task_file(too_long + "/Ergonfile"), InvalidTask);
    EXPECT_THROW((void) parse(dir, "@include " + too_long + "\n"), InvalidTask);
}

TEST(TaskFile, IncludeRelativeToIncludingFile)
{
    TmpDir dir;
    std::filesystem::create_directory(dir.path / "sub");
    write_file(dir.file("sub/extra.ergon"),
               "@let WHO=sub\n"
               "@task hello\n"
               "  @action echo ${WHO}\n"
               "@end\n");
    const auto p = parse(dir,
                         "@let SUB=sub\n"
                         "@include \"${SUB}/extra.ergon\"\n"
                         "@task after\n"
                         "  @action echo ${WHO}\n"
                         "  @task_dep hello\n"
                         "@end\n");
    ASSERT_EQ(p.get_tasks().size(), 2u);
    EXPECT_EQ(p.get_tasks()[0].name, "hello");
    EXPECT_EQ(p.get_tasks()[1].actions[0]->describe(), "echo sub");
}

TEST(TaskFile, IncludeErrorNamesIncludedFile)
{
    TmpDir dir;
    write_file(dir.file("broken.ergon"), "\n@bogus\n");
    try {
        (void) parse(dir, "@include broken.ergon\n");
        FAIL() << "expected InvalidTask";
    } catch (const InvalidTask &e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("broken.ergon line 2"), std::string::npos) << msg;
    }
}

TEST(TaskFile, IncludeCircularDetected)
{
    TmpDir dir;
    write_file(dir.file("a.ergon"), "@include b.ergon\n");
    write_file(dir.file("b.ergon"), "@include a.ergon\n");
    EXPECT_THROW((void) load_task_file(dir.file("a.ergon")), InvalidTask);
}

TEST(TaskFile, RequireIsNotADirective)
{
    TmpDir dir;
    try {
        (void) parse(dir, "@let N=4\n@require ${N} == 4\n");
        FAIL() << "expected InvalidTask";
    } catch (const InvalidTask &e) {
        EXPECT_NE(std::string(e.what()).find("Unknown directive: @require"), std::string::npos) << e.what();
    }
}

TEST(TaskFile, ParsedTasksRunAsCommands)
{
    TmpDir dir;
    const std::string out = dir.file("out.txt");
    auto p = parse(dir,
                   "@let OUT=" + out + "\n"
                   "@task write\n"
                   "  @action printf hello > ${OUT}\n"
                   "@end\n");
    const auto tasks = p.take_tasks();
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_TRUE(tasks[0].actions[0]->execute(ActionContext{true, true}).ok());
    EXPECT_EQ(read_file(out), "hello");
}
