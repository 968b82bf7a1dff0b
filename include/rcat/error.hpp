#pragma once

#include <string>

namespace rcat {

struct RcatError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg,
        Clipboard
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    RcatError() = default;
    RcatError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    RcatError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    RcatError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace rcat
