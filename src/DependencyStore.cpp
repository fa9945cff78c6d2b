#include "../include/DependencyStore.hpp"
#include "../include/Errors.hpp"
#include "../include/Log.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <xxhash.h>

using namespace std;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ergon {
    namespace {
        constexpr const char *DB_MAGIC = "ergon-db";
        constexpr int DB_VERSION = 2;

        json to_json(const DependencyRecord &rec) {
            json files = json::object();
            for (const auto &[path, sig]: rec.fingerprints.files) {
                files[path] = {{"mtime_ns", sig.mtime_ns}, {"size", sig.size}, {"digest", sig.digest}};
            }
            json deps = json::object();
            for (const auto &[dep, stamp]: rec.fingerprints.tasks) deps[dep] = stamp;
            return {{"stamp", rec.stamp}, {"ignored", rec.ignored}, {"files", files}, {"deps", deps}};
        }

        DependencyRecord record_from_json(const json &j) {
            DependencyRecord rec;
            rec.stamp = j.at("stamp").get<uint64_t>();
            rec.ignored = j.at("ignored").get<bool>();
            for (const auto &[path, sig]: j.at("files").items()) {
                FileSignature fs_sig;
                fs_sig.mtime_ns = sig.at("mtime_ns").get<int64_t>();
                fs_sig.size = sig.at("size").get<uint64_t>();
                fs_sig.digest = sig.at("digest").get<uint64_t>();
                rec.fingerprints.files.emplace(path, fs_sig);
            }
            for (const auto &[dep, stamp]: j.at("deps").items()) {
                rec.fingerprints.tasks.emplace(dep, stamp.get<uint64_t>());
            }
            return rec;
        }

        uint64_t digest_of(const string &path) {
            ifstream in(path, ios::binary);
            if (!in) {
                throw fs::filesystem_error("cannot read file", path, make_error_code(errc::io_error));
            }
            const unique_ptr<XXH64_state_t, decltype(&XXH64_freeState)> state(XXH64_createState(), &XXH64_freeState);
            if (!state) throw bad_alloc();
            XXH64_reset(state.get(), 0);
            char buf[1 << 16];
            while (in) {
                in.read(buf, sizeof buf);
                if (const auto n = in.gcount(); n > 0) XXH64_update(state.get(), buf, static_cast<size_t>(n));
            }
            return XXH64_digest(state.get());
        }
    } // namespace

    const char *to_string(const Status s) {
        switch (s) {
            case Status::Ignore: return "ignore";
            case Status::UpToDate: return "up-to-date";
            case Status::Run: return "run";
        }
        return "run";
    }

    FileSignature DependencyStore::signature_of(const string &path) {
        FileSignature sig;
        sig.mtime_ns = chrono::duration_cast<chrono::nanoseconds>(
            fs::last_write_time(path).time_since_epoch()).count();
        sig.size = fs::file_size(path);
        sig.digest = digest_of(path);
        return sig;
    }

    DependencyStore::DependencyStore(string path) : file(std::move(path)) {
        load();
    }

    DependencyStore::~DependencyStore() {
        try {
            close();
        } catch (const exception &e) {
            log_error(_("Failed to save dependency store: "), e.what());
        }
    }

    void DependencyStore::load() {
        error_code ec;
        if (!fs::exists(file, ec)) {
            if (ec) throw StoreError(string(_("Cannot access dependency store")) + " '" + file + "': " + ec.message());
            log_debug("new dependency store: ", file);
            return;
        }
        ifstream in(file);
        if (!in.is_open()) throw StoreError(string(_("Cannot open dependency store")) + " '" + file + "'");

        const auto bad = [&](const string &msg) {
            return StoreError(string(_("Corrupt dependency store")) + " '" + file + "': " + msg);
        };
        try {
            const json root = json::parse(in);
            if (!root.is_object() || root.value("format", "") != DB_MAGIC) throw bad(_("bad header"));
            if (const int version = root.at("version").get<int>(); version != DB_VERSION) {
                throw bad(string(_("unsupported version ")) + std::to_string(version));
            }
            next_stamp = root.at("next_stamp").get<uint64_t>();
            for (const auto &[name, rec]: root.at("tasks").items()) records[name] = record_from_json(rec);
        } catch (const json::exception &e) {
            throw bad(e.what());
        }
        log_debug("loaded ", records.size(), " records from ", file);
    }

    void DependencyStore::check_open() const {
        if (!open) throw StoreError(string(_("Dependency store is closed")) + " '" + file + "'");
    }

    bool DependencyStore::file_changed(const string &path, const FileSignature &stored) const {
        error_code ec;
        if (!fs::is_regular_file(path, ec)) return true;
        const auto mtime = chrono::duration_cast<chrono::nanoseconds>(
            fs::last_write_time(path, ec).time_since_epoch()).count();
        if (ec) return true;
        const auto size = fs::file_size(path, ec);
        if (ec) return true;
        if (mtime == stored.mtime_ns && size == stored.size) return false;
        if (size != stored.size) return true;
        try {
            return digest_of(path) != stored.digest;
        } catch (const fs::filesystem_error &) {
            return true;
        }
    }

    Status DependencyStore::get_status(const Task &task, const TaskGraph &graph) {
        lock_guard lock(mtx);
        check_open();
        unordered_map<string, Status> memo;
        vector<string> in_progress;
        return status_locked(task, graph, memo, in_progress);
    }

    Status DependencyStore::status_locked(const Task &task, const TaskGraph &graph,
                                          unordered_map<string, Status> &memo,
                                          vector<string> &in_progress) {
        if (const auto it = memo.find(task.name); it != memo.end()) return it->second;
        if (const auto loop = ranges::find(in_progress, task.name); loop != in_progress.end()) {
            string path;
            for (auto it = loop; it != in_progress.end(); ++it) path += *it + " -> ";
            throw SelectionError(string(_("Cyclic task dependency: ")) + path + task.name);
        }

        const auto compute = [&]() -> Status {
            const auto rec = records.find(task.name);
            if (rec != records.end() && rec->second.ignored) return Status::Ignore;
            if (rec == records.end()) return Status::Run;
            const Fingerprints &fp = rec->second.fingerprints;

            for (const auto &f: task.file_dep) {
                const auto stored = fp.files.find(f);
                if (stored == fp.files.end() || file_changed(f, stored->second)) return Status::Run;
            }
            for (const auto &t: task.targets) {
                error_code ec;
                if (!fs::exists(t, ec)) return Status::Run;
            }
            in_progress.push_back(task.name);
            for (const auto &dep_name: task.task_dep) {
                const Task &dep = graph.at(dep_name);
                if (status_locked(dep, graph, memo, in_progress) == Status::Run) {
                    in_progress.pop_back();
                    return Status::Run;
                }
                const auto dep_rec = records.find(dep_name);
                const uint64_t current = dep_rec == records.end() ? 0 : dep_rec->second.stamp;
                if (const auto stored = fp.tasks.find(dep_name); stored == fp.tasks.end() || stored->second != current) {
                    in_progress.pop_back();
                    return Status::Run;
                }
            }
            in_progress.pop_back();
            return Status::UpToDate;
        };

        const Status s = compute();
        memo.emplace(task.name, s);
        return s;
    }

    Fingerprints DependencyStore::compute_fingerprints(const Task &task) {
        Fingerprints fp;
        for (const auto &f: task.file_dep) fp.files[f] = signature_of(f);
        lock_guard lock(mtx);
        check_open();
        for (const auto &dep: task.task_dep) {
            const auto rec = records.find(dep);
            fp.tasks[dep] = rec == records.end() ? 0 : rec->second.stamp;
        }
        return fp;
    }

    void DependencyStore::commit(const string &name, Fingerprints fingerprints) {
        lock_guard lock(mtx);
        check_open();
        auto &rec = records[name];
        rec.fingerprints = std::move(fingerprints);
        rec.stamp = next_stamp++;
        dirty = true;
    }

    void DependencyStore::remove(const string &name) {
        lock_guard lock(mtx);
        check_open();
        if (records.erase(name) > 0) dirty = true;
    }

    void DependencyStore::remove_all() {
        lock_guard lock(mtx);
        check_open();
        records.clear();
        dirty = true;
    }

    void DependencyStore::ignore(const Task &task) {
        lock_guard lock(mtx);
        check_open();
        records[task.name].ignored = true;
        dirty = true;
    }

    optional<DependencyRecord> DependencyStore::record(const string &name) const {
        lock_guard lock(mtx);
        const auto it = records.find(name);
        if (it == records.end()) return nullopt;
        return it->second;
    }

    void DependencyStore::close() {
        lock_guard lock(mtx);
        if (!open) return;
        open = false;
        if (!dirty) return;

        const fs::path target(file);
        if (target.has_parent_path()) {
            error_code ec;
            fs::create_directories(target.parent_path(), ec);
            if (ec) throw StoreError(string(_("Cannot create directory for")) + " '" + file + "': " + ec.message());
        }
        const string tmp = file + ".tmp";
        {
            json tasks = json::object();
            for (const auto &[name, rec]: records) tasks[name] = to_json(rec);
            const json root = {{"format", DB_MAGIC}, {"version", DB_VERSION}, {"next_stamp", next_stamp},
                               {"tasks", std::move(tasks)}};
            ofstream out(tmp, ios::trunc);
            if (!out.is_open()) throw StoreError(string(_("Cannot write dependency store")) + " '" + tmp + "'");
            // invalid UTF-8 in a name is replaced, such a record never matches again
            out << root.dump(1, '\t', false, json::error_handler_t::replace) << '\n';
            out.flush();
            if (!out) throw StoreError(string(_("Cannot write dependency store")) + " '" + tmp + "'");
        }
        error_code ec;
        fs::rename(tmp, file, ec);
        if (ec) throw StoreError(string(_("Cannot replace dependency store")) + " '" + file + "': " + ec.message());
        dirty = false;
        log_debug("saved ", records.size(), " records to ", file);
    }
} // namespace ergon
