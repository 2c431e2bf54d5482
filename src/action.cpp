#include "taskgate/action.hpp"

#include <sstream>
#include <stdexcept>

namespace taskgate {

namespace {

void require(bool cond, const std::string& what) {
    if (!cond) throw std::invalid_argument("action: " + what);
}

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::string or_default(std::string name, const char* fallback) {
    return name.empty() ? std::string(fallback) : name;
}

} // namespace

// --------------- factories ----------------
Action Action::step(std::string description, std::string name) {
    require(!description.empty(), "step description is empty");
    return Action(or_default(std::move(name), "step"), StepParams{std::move(description)});
}

Action Action::file(FileOp op, std::string path, std::string destination, std::string name) {
    require(!path.empty(), "file path is empty");
    require(op != FileOp::Move || !destination.empty(), "move requires a destination");
    std::string fallback = std::string("file_") + to_string(op);
    if (name.empty()) name = fallback;
    return Action(std::move(name), FileParams{op, std::move(path), std::move(destination)});
}

Action Action::program(std::string program, std::vector<std::string> arguments, std::string name) {
    require(!program.empty(), "program path is empty");
    return Action(or_default(std::move(name), "run_program"), ProgramParams{std::move(program), std::move(arguments)});
}

Action Action::command(std::string command, std::string name) {
    require(!command.empty(), "command is empty");
    return Action(or_default(std::move(name), "system_command"), CommandParams{std::move(command)});
}

Action Action::network(std::string url, std::string method, std::string name) {
    require(!url.empty(), "url is empty");
    require(!method.empty(), "http method is empty");
    return Action(or_default(std::move(name), "network_access"), NetworkParams{std::move(url), std::move(method)});
}

Action Action::download(std::string url, std::string file_name, uint64_t size_bytes, std::string name) {
    require(!url.empty(), "download url is empty");
    if (file_name.empty()) {
        auto pos = url.find_last_of('/');
        file_name = pos == std::string::npos ? url : url.substr(pos + 1);
    }
    require(!file_name.empty(), "download file name is empty");
    return Action(or_default(std::move(name), "download_file"),
                  DownloadParams{std::move(url), std::move(file_name), size_bytes});
}

Action Action::game(std::string game, std::string action, std::string name) {
    require(!game.empty(), "game name is empty");
    require(!action.empty(), "game action is empty");
    return Action(or_default(std::move(name), "game_interaction"), GameParams{std::move(game), std::move(action)});
}

Action Action::screen(ScreenParams region, std::string name) {
    require(region.x >= 0 && region.y >= 0, "screen region origin is negative");
    require(region.width >= 0 && region.height >= 0, "screen region size is negative");
    return Action(or_default(std::move(name), "screen_capture"), std::move(region));
}

Action Action::keyboard_text(std::string text, std::string name) {
    require(!text.empty(), "keyboard text is empty");
    return Action(or_default(std::move(name), "keyboard_type"), KeyboardParams{std::move(text), {}});
}

Action Action::keyboard_keys(std::vector<std::string> keys, std::string name) {
    require(!keys.empty(), "hotkey has no keys");
    for (const auto& k : keys) require(!k.empty(), "hotkey contains an empty key");
    return Action(or_default(std::move(name), "keyboard_hotkey"), KeyboardParams{{}, std::move(keys)});
}

Action Action::mouse(int x, int y, std::string button, std::string name) {
    require(x >= 0 && y >= 0, "mouse coordinates are negative");
    require(button == "left" || button == "right" || button == "middle", "unknown mouse button '" + button + "'");
    return Action(or_default(std::move(name), "mouse_click"), MouseParams{x, y, std::move(button)});
}

// --------------- queries ----------------
ActionCategory Action::category() const {
    switch (kind()) {
    case ActionKind::FileOperation:
        return std::get<FileParams>(params_).op == FileOp::Read ? ActionCategory::None
                                                                : ActionCategory::FileMutation;
    case ActionKind::ProgramExecution: return ActionCategory::ProgramExecution;
    case ActionKind::SystemCommand: return ActionCategory::SystemCommand;
    case ActionKind::NetworkAccess: return ActionCategory::NetworkAccess;
    case ActionKind::DownloadFile: return ActionCategory::Download;
    case ActionKind::KeyboardInput:
    case ActionKind::MouseControl: return ActionCategory::InputControl;
    case ActionKind::Step:
    case ActionKind::GameInteraction:
    case ActionKind::ScreenControl: return ActionCategory::None;
    }
    return ActionCategory::None;
}

std::string Action::describe() const {
    std::ostringstream os;
    switch (kind()) {
    case ActionKind::Step:
        os << std::get<StepParams>(params_).description;
        break;
    case ActionKind::FileOperation: {
        const auto& p = std::get<FileParams>(params_);
        os << "File " << to_string(p.op) << ": " << p.path;
        if (p.op == FileOp::Move) os << " -> " << p.destination;
        break;
    }
    case ActionKind::ProgramExecution: {
        const auto& p = std::get<ProgramParams>(params_);
        os << "Run program: " << p.program;
        if (!p.arguments.empty()) os << " " << join(p.arguments, " ");
        break;
    }
    case ActionKind::SystemCommand:
        os << "System command: " << std::get<CommandParams>(params_).command;
        break;
    case ActionKind::NetworkAccess: {
        const auto& p = std::get<NetworkParams>(params_);
        os << "Network " << p.method << ": " << p.url;
        break;
    }
    case ActionKind::DownloadFile: {
        const auto& p = std::get<DownloadParams>(params_);
        os << "Download file: " << p.file_name << " from " << p.url;
        break;
    }
    case ActionKind::GameInteraction: {
        const auto& p = std::get<GameParams>(params_);
        os << "Game " << p.game << ": " << p.action;
        break;
    }
    case ActionKind::ScreenControl: {
        const auto& p = std::get<ScreenParams>(params_);
        os << "Screen capture";
        if (p.width > 0 && p.height > 0)
            os << " (" << p.x << "," << p.y << " " << p.width << "x" << p.height << ")";
        if (!p.output_path.empty()) os << " -> " << p.output_path;
        break;
    }
    case ActionKind::KeyboardInput: {
        const auto& p = std::get<KeyboardParams>(params_);
        if (!p.text.empty()) os << "Type text: " << p.text;
        else os << "Press keys: " << join(p.keys, "+");
        break;
    }
    case ActionKind::MouseControl: {
        const auto& p = std::get<MouseParams>(params_);
        os << "Mouse " << p.button << " click at (" << p.x << ", " << p.y << ")";
        break;
    }
    }
    return os.str();
}

Details Action::details() const {
    Details d;
    d["action"] = name_;
    d["kind"] = to_string(kind());
    switch (kind()) {
    case ActionKind::Step:
        break;
    case ActionKind::FileOperation: {
        const auto& p = std::get<FileParams>(params_);
        d["operation"] = to_string(p.op);
        d["file_path"] = p.path;
        if (!p.destination.empty()) d["destination"] = p.destination;
        break;
    }
    case ActionKind::ProgramExecution: {
        const auto& p = std::get<ProgramParams>(params_);
        d["program"] = p.program;
        d["arguments"] = join(p.arguments, " ");
        break;
    }
    case ActionKind::SystemCommand:
        d["command"] = std::get<CommandParams>(params_).command;
        break;
    case ActionKind::NetworkAccess: {
        const auto& p = std::get<NetworkParams>(params_);
        d["url"] = p.url;
        d["method"] = p.method;
        break;
    }
    case ActionKind::DownloadFile: {
        const auto& p = std::get<DownloadParams>(params_);
        d["url"] = p.url;
        d["file_name"] = p.file_name;
        d["size_bytes"] = std::to_string(p.size_bytes);
        break;
    }
    case ActionKind::GameInteraction: {
        const auto& p = std::get<GameParams>(params_);
        d["game"] = p.game;
        d["game_action"] = p.action;
        break;
    }
    case ActionKind::ScreenControl: {
        const auto& p = std::get<ScreenParams>(params_);
        d["region"] = std::to_string(p.x) + "," + std::to_string(p.y) + "," + std::to_string(p.width) + ","
            + std::to_string(p.height);
        if (!p.output_path.empty()) d["output_path"] = p.output_path;
        break;
    }
    case ActionKind::KeyboardInput: {
        const auto& p = std::get<KeyboardParams>(params_);
        if (!p.text.empty()) d["text"] = p.text;
        else d["keys"] = join(p.keys, "+");
        break;
    }
    case ActionKind::MouseControl: {
        const auto& p = std::get<MouseParams>(params_);
        d["x"] = std::to_string(p.x);
        d["y"] = std::to_string(p.y);
        d["button"] = p.button;
        break;
    }
    }
    return d;
}

std::optional<std::string> Action::target_path() const {
    if (const auto* f = get_if<FileParams>()) {
        if (f->op == FileOp::Read) return std::nullopt;
        return f->path;
    }
    if (const auto* p = get_if<ProgramParams>()) return p->program;
    return std::nullopt;
}

// --------------- names ----------------
const char* to_string(ActionKind kind) {
    switch (kind) {
    case ActionKind::Step: return "step";
    case ActionKind::FileOperation: return "file_operation";
    case ActionKind::ProgramExecution: return "program_execution";
    case ActionKind::SystemCommand: return "system_command";
    case ActionKind::NetworkAccess: return "network_access";
    case ActionKind::DownloadFile: return "download_file";
    case ActionKind::GameInteraction: return "game_interaction";
    case ActionKind::ScreenControl: return "screen_control";
    case ActionKind::KeyboardInput: return "keyboard_input";
    case ActionKind::MouseControl: return "mouse_control";
    }
    return "unknown";
}

const char* to_string(ActionCategory category) {
    switch (category) {
    case ActionCategory::None: return "none";
    case ActionCategory::FileMutation: return "file_mutation";
    case ActionCategory::ProgramExecution: return "program_execution";
    case ActionCategory::NetworkAccess: return "network_access";
    case ActionCategory::Download: return "download";
    case ActionCategory::SystemCommand: return "system_command";
    case ActionCategory::InputControl: return "input_control";
    }
    return "unknown";
}

const char* to_string(FileOp op) {
    switch (op) {
    case FileOp::Read: return "read";
    case FileOp::Create: return "create";
    case FileOp::Write: return "write";
    case FileOp::Delete: return "delete";
    case FileOp::Move: return "move";
    }
    return "unknown";
}

std::optional<ActionKind> parse_action_kind(const std::string& text) {
    for (int i = 0; i <= static_cast<int>(ActionKind::MouseControl); ++i) {
        auto kind = static_cast<ActionKind>(i);
        if (text == to_string(kind)) return kind;
    }
    return std::nullopt;
}

std::optional<ActionCategory> parse_category(const std::string& text) {
    for (int i = 0; i <= static_cast<int>(ActionCategory::InputControl); ++i) {
        auto cat = static_cast<ActionCategory>(i);
        if (text == to_string(cat)) return cat;
    }
    return std::nullopt;
}

std::optional<FileOp> parse_file_op(const std::string& text) {
    for (int i = 0; i <= static_cast<int>(FileOp::Move); ++i) {
        auto op = static_cast<FileOp>(i);
        if (text == to_string(op)) return op;
    }
    return std::nullopt;
}

} // namespace taskgate
