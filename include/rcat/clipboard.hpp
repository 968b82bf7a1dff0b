#pragma once

#include <rcat/result.hpp>
#include <string>
#include <vector>

namespace rcat {

// An external program that accepts clipboard content on stdin.
struct ClipboardTool {
    std::string name;                 // program looked up on PATH
    std::vector<std::string> argv;    // full command line, argv[0] == name
};

// Known tools in probe order: pbcopy, wl-copy, xclip, xsel.
const std::vector<ClipboardTool>& known_clipboard_tools();

// True if `program` is an executable file in one of the PATH directories.
// Names containing '/' are checked directly.
bool command_available(const std::string& program, const std::string& path_env);
bool command_available(const std::string& program);

// First known tool that is available. Fails with a Clipboard error (and an
// install hint) when none is.
Result<ClipboardTool> detect_clipboard_tool();
Result<ClipboardTool> detect_clipboard_tool(const std::string& path_env);

// Run `args` with `input` piped to its stdin. The child's stdout and stderr
// go to /dev/null (xclip keeps them open after it forks into the background).
// Returns the exit code.
Result<int> run_with_input(const std::vector<std::string>& args, const std::string& input);

// Deliver content through `tool`; non-zero exit is a Clipboard error.
Status copy_to_clipboard(const ClipboardTool& tool, const std::string& content);

// Write content to stdout in full.
Status write_to_stdout(const std::string& content);

} // namespace rcat
