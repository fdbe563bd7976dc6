#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cedarmcp {

// One parsed edit command as reported by the engine.
struct EditCommand {
    std::string type;                  // UPDATE, CREATE, DELETE, MOVE
    std::string action;                // may be empty
    std::vector<std::string> targets;  // every file the command touches
    nlohmann::json raw = nlohmann::json::object();
};

// Command text the engine could not parse.
class EditParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Engine failed while executing (or could not be run at all).
class EditExecutionError : public std::runtime_error {
public:
    explicit EditExecutionError(const std::string& message,
                                std::optional<int64_t> command_index = std::nullopt)
        : std::runtime_error(message), command_index_(command_index) {}

    std::optional<int64_t> command_index() const { return command_index_; }

private:
    std::optional<int64_t> command_index_;
};

// External command-language parser/executor. Callers must validate every
// EditCommand::targets entry before calling apply().
class EditEngine {
public:
    virtual ~EditEngine() = default;

    virtual std::vector<EditCommand> parse(const std::string& commands) = 0;
    virtual nlohmann::json apply(const std::filesystem::path& root,
                                 const std::string& commands) = 0;
    virtual std::string version() = 0;
    virtual std::string engine_name() const = 0;
};

// Throws EditParseError when j is not a command object.
EditCommand edit_command_from_json(const nlohmann::json& j);

nlohmann::json serialize_command(const EditCommand& cmd);

// Runs an external editor program (no shell involved):
//   <cmd...> parse           commands on stdin, {"commands":[...]} on stdout
//   <cmd...> apply <root>    commands on stdin, {"results":[...]} on stdout
//   <cmd...> version         version string on stdout
// stderr is inherited so the editor's diagnostics land in the server log.
class ProcessEditEngine : public EditEngine {
public:
    ProcessEditEngine(const std::string& command_line, uint32_t timeout_ms);

    std::vector<EditCommand> parse(const std::string& commands) override;
    nlohmann::json apply(const std::filesystem::path& root,
                         const std::string& commands) override;
    std::string version() override;
    std::string engine_name() const override { return "process"; }

    const std::vector<std::string>& argv() const { return argv_; }

    struct RunResult {
        int exit_code = -1;   // -1 when killed by a signal
        bool timed_out = false;
        bool overflowed = false;
        std::string output;
    };

    RunResult run(const std::vector<std::string>& args, const std::string& stdin_data) const;

private:
    static constexpr size_t kMaxOutput = 8 * 1024 * 1024;

    std::vector<std::string> argv_;
    uint32_t timeout_ms_;
};

} // namespace cedarmcp
