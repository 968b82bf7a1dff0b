#include <rcat/clipboard.hpp>
#include <rcat/log.hpp>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rcat {

const std::vector<ClipboardTool>& known_clipboard_tools() {
    static const std::vector<ClipboardTool> tools = {
        {"pbcopy", {"pbcopy"}},
        {"wl-copy", {"wl-copy"}},
        {"xclip", {"xclip", "-selection", "clipboard"}},
        {"xsel", {"xsel", "--clipboard", "--input"}},
    };
    return tools;
}

static bool is_executable_file(const std::string& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

bool command_available(const std::string& program, const std::string& path_env) {
    if (program.empty()) return false;
    if (program.find('/') != std::string::npos) return is_executable_file(program);

    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        if (is_executable_file(dir + "/" + program)) return true;
    }
    return false;
}

bool command_available(const std::string& program) {
    const char* path = std::getenv("PATH");
    return command_available(program, path ? path : "");
}

Result<ClipboardTool> detect_clipboard_tool(const std::string& path_env) {
    for (const auto& tool : known_clipboard_tools()) {
        if (command_available(tool.name, path_env)) {
            log::debug("using clipboard tool %s", tool.name.c_str());
            return Result<ClipboardTool>::ok(tool);
        }
    }
    return RcatError{RcatError::Clipboard,
        "no clipboard tool found (tried pbcopy, wl-copy, xclip, xsel)",
        "install one of them, or pass --stdout to print the output instead"};
}

Result<ClipboardTool> detect_clipboard_tool() {
    const char* path = std::getenv("PATH");
    return detect_clipboard_tool(path ? path : "");
}

Result<int> run_with_input(const std::vector<std::string>& args, const std::string& input) {
    if (args.empty()) {
        return RcatError{RcatError::InvalidArg, "run_with_input: empty args"};
    }

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdin_pipe[2];
    if (pipe(stdin_pipe) != 0) {
        return RcatError{RcatError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdin_pipe[0]); close(stdin_pipe[1]);
        return RcatError{RcatError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        close(stdin_pipe[1]);
        dup2(stdin_pipe[0], STDIN_FILENO);
        close(stdin_pipe[0]);

        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process
    close(stdin_pipe[0]);

    // A child that exits early must not kill us with SIGPIPE
    struct sigaction ignore_pipe {};
    struct sigaction saved_pipe {};
    ignore_pipe.sa_handler = SIG_IGN;
    sigemptyset(&ignore_pipe.sa_mask);
    sigaction(SIGPIPE, &ignore_pipe, &saved_pipe);

    const char* data = input.data();
    size_t left = input.size();
    int write_errno = 0;
    while (left > 0) {
        ssize_t n = write(stdin_pipe[1], data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            write_errno = errno;
            break;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    close(stdin_pipe[1]);
    sigaction(SIGPIPE, &saved_pipe, nullptr);

    int status = 0;
    pid_t w;
    do {
        w = waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    if (w < 0) {
        return RcatError{RcatError::IO,
            std::string("waitpid failed: ") + strerror(errno)};
    }

    int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (write_errno != 0 && exit_code == 0) {
        return RcatError{RcatError::IO,
            std::string("write to ") + args[0] + " failed: " + strerror(write_errno)};
    }
    return Result<int>::ok(exit_code);
}

Status copy_to_clipboard(const ClipboardTool& tool, const std::string& content) {
    auto result = run_with_input(tool.argv, content);
    if (result.is_err()) {
        auto err = std::move(result).error();
        return RcatError{RcatError::Clipboard,
            "could not copy to clipboard with " + tool.name + ": " + err.message};
    }
    int code = result.value();
    if (code == 127) {
        return RcatError{RcatError::Clipboard,
            "could not start clipboard tool " + tool.name};
    }
    if (code != 0) {
        return RcatError{RcatError::Clipboard,
            tool.name + " exited with status " + std::to_string(code)};
    }
    return ok_status();
}

Status write_to_stdout(const std::string& content) {
    if (!content.empty() &&
        std::fwrite(content.data(), 1, content.size(), stdout) != content.size()) {
        return RcatError{RcatError::IO,
            std::string("failed to write to stdout: ") + strerror(errno)};
    }
    if (std::fflush(stdout) != 0) {
        return RcatError{RcatError::IO,
            std::string("failed to flush stdout: ") + strerror(errno)};
    }
    return ok_status();
}

} // namespace rcat
