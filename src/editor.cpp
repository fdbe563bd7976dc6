#include "editor.hpp"
#include "log.hpp"
#include "util.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cedarmcp {

EditCommand edit_command_from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        throw EditParseError("Editor returned a command without a type");
    }

    EditCommand cmd;
    cmd.type = j["type"].get<std::string>();
    if (j.contains("action") && j["action"].is_string())
        cmd.action = j["action"].get<std::string>();

    if (j.contains("targets")) {
        if (!j["targets"].is_array())
            throw EditParseError("Editor returned non-array targets for " + cmd.type);
        for (const auto& t : j["targets"]) {
            if (!t.is_string())
                throw EditParseError("Editor returned a non-string target for " + cmd.type);
            cmd.targets.push_back(t.get<std::string>());
        }
    } else if (j.contains("target") && j["target"].is_string()) {
        cmd.targets.push_back(j["target"].get<std::string>());
    }

    cmd.raw = j;
    return cmd;
}

nlohmann::json serialize_command(const EditCommand& cmd) {
    nlohmann::json out = cmd.raw.is_object() ? cmd.raw : nlohmann::json::object();
    out["type"] = cmd.type;
    if (!cmd.action.empty()) out["action"] = cmd.action;
    out["targets"] = cmd.targets;
    return out;
}

// ── ProcessEditEngine ───────────────────────────────────────────

ProcessEditEngine::ProcessEditEngine(const std::string& command_line, uint32_t timeout_ms)
    : argv_(split_whitespace(command_line)), timeout_ms_(timeout_ms) {
    if (argv_.empty()) {
        throw std::invalid_argument("Editor command is empty");
    }
}

static void write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = write(fd, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;  // reader went away; its exit status tells the rest
        written += static_cast<size_t>(n);
    }
}

static int wait_child(pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

ProcessEditEngine::RunResult ProcessEditEngine::run(const std::vector<std::string>& args,
                                                    const std::string& stdin_data) const {
    std::vector<std::string> full = argv_;
    full.insert(full.end(), args.begin(), args.end());

    std::vector<char*> c_argv;
    c_argv.reserve(full.size() + 1);
    for (auto& a : full) c_argv.push_back(a.data());
    c_argv.push_back(nullptr);

    int stdin_pipe[2];
    int stdout_pipe[2];
    if (pipe(stdin_pipe) != 0) {
        throw EditExecutionError(std::string("Failed to create pipes: ") + std::strerror(errno));
    }
    if (pipe(stdout_pipe) != 0) {
        int err = errno;
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        throw EditExecutionError(std::string("Failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        throw EditExecutionError(std::string("Failed to fork editor: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: own session so terminal signals aimed at the server skip it
        setsid();
        close(stdin_pipe[1]);
        close(stdout_pipe[0]);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdin_pipe[0]);
        close(stdout_pipe[1]);
        execvp(c_argv[0], c_argv.data());
        _exit(127);
    }

    close(stdin_pipe[0]);
    close(stdout_pipe[1]);

    write_all(stdin_pipe[1], stdin_data);
    close(stdin_pipe[1]);

    RunResult result;
    std::array<char, 4096> buffer;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfd;
        pfd.fd = stdout_pipe[0];
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) {
            result.timed_out = true;
            break;
        }

        ssize_t n = read(stdout_pipe[0], buffer.data(), buffer.size());
        if (n > 0) {
            result.output.append(buffer.data(), static_cast<size_t>(n));
            if (result.output.size() > kMaxOutput) {
                result.overflowed = true;
                break;
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;  // EOF or read error
    }

    close(stdout_pipe[0]);
    if (result.timed_out || result.overflowed) {
        kill(pid, SIGKILL);
    }
    result.exit_code = wait_child(pid);
    return result;
}

static std::string failure_detail(const ProcessEditEngine::RunResult& r,
                                  std::optional<int64_t>& command_index) {
    try {
        auto j = nlohmann::json::parse(r.output);
        if (j.is_object() && j.contains("error") && j["error"].is_object()) {
            const auto& err = j["error"];
            if (err.contains("command_index") && err["command_index"].is_number_integer())
                command_index = err["command_index"].get<int64_t>();
            if (err.contains("message") && err["message"].is_string())
                return err["message"].get<std::string>();
        }
    } catch (const nlohmann::json::parse_error&) {
        // Plain-text diagnostics; fall through
    }
    std::string text = trim(r.output);
    if (!text.empty()) return text;
    return "editor exited with status " + std::to_string(r.exit_code);
}

static void check_ran(const ProcessEditEngine::RunResult& r, const std::string& program,
                      uint32_t timeout_ms) {
    if (r.timed_out) {
        throw EditExecutionError("Editor timed out after " + std::to_string(timeout_ms) + " ms");
    }
    if (r.overflowed) {
        throw EditExecutionError("Editor output exceeded limit");
    }
    if (r.exit_code == 127) {
        throw EditExecutionError("Editor command could not be started: " + program);
    }
}

static nlohmann::json parse_output(const std::string& output, const char* what) {
    try {
        return nlohmann::json::parse(output);
    } catch (const nlohmann::json::parse_error& e) {
        throw EditExecutionError(std::string("Editor returned invalid JSON for ") + what +
                                 ": " + e.what());
    }
}

std::vector<EditCommand> ProcessEditEngine::parse(const std::string& commands) {
    auto r = run({"parse"}, commands);
    check_ran(r, argv_.front(), timeout_ms_);
    if (r.exit_code != 0) {
        std::optional<int64_t> ignored;
        throw EditParseError(failure_detail(r, ignored));
    }

    auto j = parse_output(r.output, "parse");
    if (!j.is_object() || !j.contains("commands") || !j["commands"].is_array()) {
        throw EditExecutionError("Editor parse output lacks a commands array");
    }

    std::vector<EditCommand> parsed;
    for (const auto& c : j["commands"]) {
        parsed.push_back(edit_command_from_json(c));
    }
    log_debug("editor", "parsed " + std::to_string(parsed.size()) + " command(s)");
    return parsed;
}

nlohmann::json ProcessEditEngine::apply(const std::filesystem::path& root,
                                        const std::string& commands) {
    auto r = run({"apply", root.string()}, commands);
    check_ran(r, argv_.front(), timeout_ms_);
    if (r.exit_code != 0) {
        std::optional<int64_t> index;
        std::string detail = failure_detail(r, index);
        throw EditExecutionError(detail, index);
    }

    auto j = parse_output(r.output, "apply");
    if (j.is_object() && j.contains("results")) return j["results"];
    return j;
}

std::string ProcessEditEngine::version() {
    try {
        auto r = run({"version"}, "");
        if (!r.timed_out && !r.overflowed && r.exit_code == 0) {
            std::string v = trim(r.output);
            if (!v.empty()) return v;
        }
    } catch (const EditExecutionError& e) {
        log_debug("editor", std::string("version query failed: ") + e.what());
    }
    return "unknown";
}

} // namespace cedarmcp
