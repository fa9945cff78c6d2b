#include "../include/Task.hpp"
#include "../include/Log.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

using namespace std;
namespace fs = std::filesystem;

namespace ergon {
    bool Task::clean(ostream &out, const bool dryrun) const {
        const string dry = dryrun ? "dryrun " : "";
        bool ok = true;
        for (const auto &action: clean_actions) {
            out << name << " - " << dry << "executing '" << action->describe() << "'\n";
            if (dryrun) continue;
            if (const auto res = action->execute(ActionContext{false, false}); !res.ok()) {
                log_error(name, ": ", res.message);
                ok = false;
            }
        }
        if (!clean_targets) return ok;

        vector<string> files;
        vector<string> dirs;
        for (const auto &t: targets) {
            error_code ec;
            if (fs::is_directory(t, ec)) dirs.push_back(t);
            else if (fs::exists(t, ec)) files.push_back(t);
        }
        for (const auto &f: files) {
            out << name << " - " << dry << "removing file '" << f << "'\n";
            if (dryrun) continue;
            error_code ec;
            fs::remove(f, ec);
            if (ec) {
                log_error(name, ": cannot remove '", f, "': ", ec.message());
                ok = false;
            }
        }
        // deepest directories first so nested empty dirs can go
        ranges::sort(dirs, [](const string &a, const string &b) { return a.size() > b.size(); });
        for (const auto &d: dirs) {
            error_code ec;
            if (!fs::is_empty(d, ec) || ec) continue;
            out << name << " - " << dry << "removing dir '" << d << "'\n";
            if (dryrun) continue;
            fs::remove(d, ec);
            if (ec) {
                log_error(name, ": cannot remove '", d, "': ", ec.message());
                ok = false;
            }
        }
        return ok;
    }
} // namespace ergon
