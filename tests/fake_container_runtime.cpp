// Stand-in for a docker-compatible CLI, driven by environment variables:
//   FAKE_RUNTIME_STATE    file of "<id>\t<label>" lines (the fake container table)
//   FAKE_RUNTIME_LOG      every invocation is appended as one tab-joined line
//   FAKE_RUNTIME_MODE     ok | broken | hang | crash | garbage | noisy
//   FAKE_RUNTIME_HARNESS  harness binary executed for `run`
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

using Row = std::pair<std::string, std::string>;

static std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : fallback;
}

static std::vector<Row> load_state() {
    std::vector<Row> rows;
    std::ifstream in(env_or("FAKE_RUNTIME_STATE", ""));
    std::string line;
    while (std::getline(in, line)) {
        auto tab = line.find('\t');
        if (tab == std::string::npos) continue;
        rows.emplace_back(line.substr(0, tab), line.substr(tab + 1));
    }
    return rows;
}

static void save_state(const std::vector<Row>& rows) {
    const std::string path = env_or("FAKE_RUNTIME_STATE", "");
    if (path.empty()) return;
    std::ofstream out(path, std::ios::trunc);
    for (const auto& r : rows) out << r.first << '\t' << r.second << '\n';
}

static void log_invocation(int argc, char** argv) {
    const std::string path = env_or("FAKE_RUNTIME_LOG", "");
    if (path.empty()) return;
    std::ofstream out(path, std::ios::app);
    for (int i = 1; i < argc; ++i) out << (i > 1 ? "\t" : "") << argv[i];
    out << '\n';
}

static int cmd_ps(int argc, char** argv) {
    std::string label;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--filter" && i + 1 < argc) {
            std::string f = argv[++i];
            if (f.rfind("label=", 0) == 0) label = f.substr(6);
        }
    }
    for (const auto& r : load_state()) {
        if (label.empty() || r.second == label) std::cout << r.first << '\n';
    }
    return 0;
}

static int cmd_rm(int argc, char** argv) {
    std::vector<std::string> ids;
    for (int i = 2; i < argc; ++i) {
        if (argv[i][0] != '-') ids.push_back(argv[i]);
    }
    auto rows = load_state();
    std::vector<Row> kept;
    for (const auto& r : rows) {
        bool drop = false;
        for (const auto& id : ids) drop = drop || r.first == id;
        if (!drop) kept.push_back(r);
    }
    save_state(kept);
    return 0;
}

static int cmd_run(int argc, char** argv, const std::string& mode) {
    std::string name;
    std::string label;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--name" && i + 1 < argc) name = argv[++i];
        else if (a.rfind("--label=", 0) == 0) label = a.substr(8);
        else if (a[0] != '-') break;  // image; the command follows
    }

    auto rows = load_state();
    rows.emplace_back(name, label);
    save_state(rows);

    int code = 0;
    if (mode == "hang") {
        for (;;) pause();
    } else if (mode == "crash") {
        std::cerr << "boom: plugin runner died while evaluating the batch " << std::string(400, 'x') << std::endl;
        code = 3;
    } else if (mode == "garbage") {
        std::cout << "this is not json" << std::endl;
    } else {
        const std::string harness = env_or("FAKE_RUNTIME_HARNESS", "");
        pid_t pid = fork();
        if (pid == 0) {
            execl(harness.c_str(), harness.c_str(), static_cast<char*>(nullptr));
            std::cerr << "fake runtime: exec " << harness << " failed: " << std::strerror(errno) << std::endl;
            _exit(127);
        }
        int status = 0;
        if (pid < 0 || waitpid(pid, &status, 0) < 0) code = 125;
        else code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        if (mode == "noisy") std::cerr << "fake runtime: noisy diagnostics" << std::endl;
    }

    // --rm
    auto after = load_state();
    std::vector<Row> kept;
    for (const auto& r : after) {
        if (r.first != name) kept.push_back(r);
    }
    save_state(kept);
    return code;
}

int main(int argc, char** argv) {
    log_invocation(argc, argv);
    const std::string mode = env_or("FAKE_RUNTIME_MODE", "ok");
    if (argc < 2) return 2;

    const std::string cmd = argv[1];
    if (cmd == "version") {
        if (mode == "broken") {
            std::cerr << "Cannot connect to the container daemon" << std::endl;
            return 1;
        }
        std::cout << "fake-runtime 1.0" << std::endl;
        return 0;
    }
    if (cmd == "ps") return cmd_ps(argc, argv);
    if (cmd == "rm") return cmd_rm(argc, argv);
    if (cmd == "run") return cmd_run(argc, argv, mode);

    std::cerr << "fake runtime: unknown command " << cmd << std::endl;
    return 2;
}
