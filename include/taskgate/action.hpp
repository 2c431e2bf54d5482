#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace taskgate {

// Order matches the ActionParams alternatives below.
enum class ActionKind {
    Step,
    FileOperation,
    ProgramExecution,
    SystemCommand,
    NetworkAccess,
    DownloadFile,
    GameInteraction,
    ScreenControl,
    KeyboardInput,
    MouseControl
};

enum class ActionCategory {
    None,
    FileMutation,
    ProgramExecution,
    NetworkAccess,
    Download,
    SystemCommand,
    InputControl
};

enum class FileOp { Read, Create, Write, Delete, Move };

struct StepParams {
    std::string description;
};

struct FileParams {
    FileOp op{FileOp::Read};
    std::string path;
    std::string destination;  // Move only
};

struct ProgramParams {
    std::string program;
    std::vector<std::string> arguments;
};

struct CommandParams {
    std::string command;
};

struct NetworkParams {
    std::string url;
    std::string method{"GET"};
};

struct DownloadParams {
    std::string url;
    std::string file_name;
    uint64_t size_bytes{0};
};

struct GameParams {
    std::string game;
    std::string action;
};

struct ScreenParams {
    int x{0}, y{0}, width{0}, height{0};  // zero size = full screen
    std::string output_path;
};

struct KeyboardParams {
    std::string text;
    std::vector<std::string> keys;  // hotkey chord when text is empty
};

struct MouseParams {
    int x{0};
    int y{0};
    std::string button{"left"};
};

using ActionParams = std::variant<StepParams, FileParams, ProgramParams, CommandParams, NetworkParams,
                                  DownloadParams, GameParams, ScreenParams, KeyboardParams, MouseParams>;

using Details = std::map<std::string, std::string>;

/// A side-effecting action with typed parameters. Factories validate their
/// arguments and throw std::invalid_argument on malformed input.
class Action {
public:
    static Action step(std::string description, std::string name = "step");
    static Action file(FileOp op, std::string path, std::string destination = {}, std::string name = {});
    static Action program(std::string program, std::vector<std::string> arguments = {}, std::string name = {});
    static Action command(std::string command, std::string name = {});
    static Action network(std::string url, std::string method = "GET", std::string name = {});
    static Action download(std::string url, std::string file_name, uint64_t size_bytes = 0, std::string name = {});
    static Action game(std::string game, std::string action, std::string name = {});
    static Action screen(ScreenParams region, std::string name = {});
    static Action keyboard_text(std::string text, std::string name = {});
    static Action keyboard_keys(std::vector<std::string> keys, std::string name = {});
    static Action mouse(int x, int y, std::string button = "left", std::string name = {});

    const std::string& name() const { return name_; }
    ActionKind kind() const { return static_cast<ActionKind>(params_.index()); }
    ActionCategory category() const;
    const ActionParams& params() const { return params_; }

    template <typename T>
    const T* get_if() const { return std::get_if<T>(&params_); }

    std::string describe() const;
    Details details() const;

    // Path the action mutates or executes, if any.
    std::optional<std::string> target_path() const;

private:
    Action(std::string name, ActionParams params) : name_(std::move(name)), params_(std::move(params)) {}

    std::string name_;
    ActionParams params_;
};

const char* to_string(ActionKind kind);
const char* to_string(ActionCategory category);
const char* to_string(FileOp op);
std::optional<ActionKind> parse_action_kind(const std::string& text);
std::optional<ActionCategory> parse_category(const std::string& text);
std::optional<FileOp> parse_file_op(const std::string& text);

} // namespace taskgate
