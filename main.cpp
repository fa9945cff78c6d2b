#include "include/Commands.hpp"
#include "include/Errors.hpp"
#include "include/Log.hpp"
#include "include/TaskFile.hpp"
#include <algorithm>
#include <clocale>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace ergon;

namespace {
    constexpr int EXIT_USER_ERROR = 3;

    struct CliArgs {
        std::string command = "run";
        std::vector<std::string> tasks;
        std::string task_file = DEFAULT_TASK_FILE;
        std::optional<std::string> dep_file;
        std::optional<std::string> output;
        std::optional<std::string> reporter;
        std::optional<int> verbosity;
        std::optional<unsigned> jobs;
        bool always = false;
        bool continue_on_error = false;
        bool dry_run = false;
        ListParams list;
    };

    void print_usage(std::ostream &os, const ReporterRegistry &reporters) {
        os << _("usage: ergon [command] [task...] [options]") << "\n\n"
           << _("commands:") << "\n"
           << "  run      " << _("run tasks (default command)") << "\n"
           << "  list     " << _("list tasks") << "\n"
           << "  clean    " << _("clean task targets") << "\n"
           << "  forget   " << _("forget saved task status") << "\n"
           << "  ignore   " << _("ignore tasks until forgotten") << "\n"
           << "  auto     " << _("re-run tasks when their file dependencies change") << "\n"
           << "  help     " << _("show this text") << "\n\n"
           << _("options:") << "\n"
           << "  -f, --file PATH      " << _("task file (default Ergonfile)") << "\n"
           << "  --db PATH            " << _("dependency store (default .ergon.db)") << "\n"
           << "  --log-level LEVEL    " << _("debug, info, warn, error or off") << "\n"
           << "  run:   -v 0|1|2, -a/--always, -c/--continue, -n N, --reporter NAME, --output PATH\n"
           << "  list:  --all, --status, --private, -s/--subtask, --doc\n"
           << "  clean: --dry-run\n\n"
           << _("reporters:");
        for (const auto &name: reporters.names()) os << ' ' << name;
        os << std::endl;
    }

    std::string value_of(const std::vector<std::string> &args, size_t &i) {
        if (i + 1 >= args.size()) throw InvalidCommand(std::string(_("Missing value for option ")) + args[i]);
        return args[++i];
    }

    int to_int(const std::string &opt, const std::string &v) {
        try {
            size_t used = 0;
            const int n = std::stoi(v, &used);
            if (used == v.size()) return n;
        } catch (const std::exception &) {
        }
        throw InvalidCommand(std::string(_("Option ")) + opt + _(" expects an integer, got ") + v);
    }

    CliArgs parse_args(const int argc, char **argv) {
        static const std::vector<std::string> commands = {"run", "list", "clean", "forget", "ignore", "auto", "help"};
        const std::vector<std::string> args(argv + 1, argv + argc);
        CliArgs cli;
        size_t i = 0;
        if (!args.empty() && std::ranges::find(commands, args[0]) != commands.end()) {
            cli.command = args[0];
            i = 1;
        }
        for (; i < args.size(); ++i) {
            const std::string &a = args[i];
            if (a == "-f" || a == "--file") cli.task_file = value_of(args, i);
            else if (a == "--db") cli.dep_file = value_of(args, i);
            else if (a == "--log-level") set_log_level(parse_log_level(value_of(args, i)));
            else if (a == "--output") cli.output = value_of(args, i);
            else if (a == "--reporter") cli.reporter = value_of(args, i);
            else if (a == "-v" || a == "--verbosity") {
                const int v = to_int(a, value_of(args, i));
                if (v < 0 || v > 2) throw InvalidCommand(_("verbosity must be 0, 1 or 2"));
                cli.verbosity = v;
            } else if (a == "-n" || a == "--jobs") {
                const int n = to_int(a, value_of(args, i));
                if (n <= 0) throw InvalidCommand(_("jobs must be > 0"));
                cli.jobs = static_cast<unsigned>(n);
            } else if (a == "-a" || a == "--always") cli.always = true;
            else if (a == "-c" || a == "--continue") cli.continue_on_error = true;
            else if (a == "--dry-run") cli.dry_run = true;
            else if (a == "--all") cli.list.all = true;
            else if (a == "--status") cli.list.status = true;
            else if (a == "--private") cli.list.private_tasks = true;
            else if (a == "-s" || a == "--subtask") cli.list.subtasks = true;
            else if (a == "--doc") cli.list.doc = true;
            else if (a == "-h" || a == "--help") cli.command = "help";
            else if (!a.empty() && a.front() == '-') throw InvalidCommand(std::string(_("Unknown option: ")) + a);
            else cli.tasks.push_back(a);
        }
        return cli;
    }

    int dispatch(const CliArgs &cli, const ReporterRegistry &reporters) {
        if (cli.command == "help") {
            print_usage(std::cout, reporters);
            return 0;
        }

        TaskFileParser parser = load_task_file(cli.task_file);
        const FileConfig &config = parser.get_config();
        const TaskGraph graph(parser.take_tasks());
        const Project project{graph, cli.dep_file.value_or(config.dep_file.value_or(DEFAULT_DEP_FILE)),
                              config.default_tasks};

        RunParams params;
        params.options.verbosity = cli.verbosity ? cli.verbosity : config.verbosity;
        params.options.always_execute = cli.always || config.always_execute.value_or(false);
        params.options.continue_on_error = cli.continue_on_error || config.continue_on_error.value_or(false);
        params.options.jobs = cli.jobs.value_or(config.jobs.value_or(1));
        params.reporter = cli.reporter.value_or(config.reporter.value_or("default"));

        if (cli.command == "list") return cmd_list(project, cli.tasks, std::cout, cli.list);
        if (cli.command == "clean") return cmd_clean(project, cli.tasks, std::cout, cli.dry_run);
        if (cli.command == "forget") return cmd_forget(project, cli.tasks, std::cout);
        if (cli.command == "ignore") return cmd_ignore(project, cli.tasks, std::cout);
        if (cli.command == "auto") return cmd_auto(project, cli.tasks, std::cout, params, reporters);

        if (cli.output) {
            // opening truncates, so refuse a bad request first
            (void) check_run(project, cli.tasks, params, reporters);
            std::ofstream out(*cli.output);
            if (!out.is_open()) throw InvalidCommand(std::string(_("Cannot open output file: ")) + *cli.output);
            return cmd_run(project, cli.tasks, out, params, reporters);
        }
        return cmd_run(project, cli.tasks, std::cout, params, reporters);
    }
} // namespace

int main(const int argc, char **argv) {
    std::setlocale(LC_ALL, "");
    textdomain("ergon");
    init_log_level_from_env();

    const ReporterRegistry reporters = ReporterRegistry::with_defaults();
    try {
        return dispatch(parse_args(argc, argv), reporters);
    } catch (const InvalidCommand &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_USER_ERROR;
    } catch (const InvalidTask &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_USER_ERROR;
    } catch (const SelectionError &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_USER_ERROR;
    } catch (const StoreError &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return RUN_ERROR;
    } catch (const WatchError &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return RUN_ERROR;
    } catch (const std::filesystem::filesystem_error &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return RUN_ERROR;
    }
}
