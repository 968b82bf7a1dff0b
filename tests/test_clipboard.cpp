#include <catch2/catch.hpp>
#include <rcat/clipboard.hpp>
#include "temp_dir.hpp"
#include <fstream>
#include <sstream>

using namespace rcat;
namespace fs = std::filesystem;

static fs::path make_executable(TempDir& tmp, const std::string& name) {
    auto p = tmp.write_file("bin/" + name, "#!/bin/sh\ncat > /dev/null\n");
    fs::permissions(p, fs::perms::owner_all, fs::perm_options::add);
    return p;
}

static std::string slurp(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST_CASE("known tools are probed in a fixed order", "[clipboard]") {
    const auto& tools = known_clipboard_tools();
    REQUIRE(tools.size() == 4);
    REQUIRE(tools[0].name == "pbcopy");
    REQUIRE(tools[1].name == "wl-copy");
    REQUIRE(tools[2].argv == std::vector<std::string>{"xclip", "-selection", "clipboard"});
    REQUIRE(tools[3].argv == std::vector<std::string>{"xsel", "--clipboard", "--input"});
}

TEST_CASE("command lookup walks PATH entries", "[clipboard]") {
    TempDir tmp("clip");
    make_executable(tmp, "xsel");
    tmp.write_file("bin/not-exec", "data");
    std::string path_env = "/nonexistent:" + (tmp.path / "bin").string();

    REQUIRE(command_available("xsel", path_env));
    REQUIRE_FALSE(command_available("xclip", path_env));
    REQUIRE_FALSE(command_available("not-exec", path_env));
    REQUIRE_FALSE(command_available("", path_env));
    REQUIRE(command_available((tmp.path / "bin" / "xsel").string(), ""));
}

TEST_CASE("detection picks the first available tool", "[clipboard]") {
    TempDir tmp("clip");
    make_executable(tmp, "xsel");
    make_executable(tmp, "wl-copy");

    auto tool = detect_clipboard_tool((tmp.path / "bin").string());
    REQUIRE(tool.is_ok());
    REQUIRE(tool.value().name == "wl-copy");
}

TEST_CASE("detection fails with an install hint", "[clipboard]") {
    TempDir tmp("clip");
    auto tool = detect_clipboard_tool((tmp.path / "empty").string());
    REQUIRE(tool.is_err());
    REQUIRE(tool.error().code == RcatError::Clipboard);
    REQUIRE(tool.error().hint.find("--stdout") != std::string::npos);
}

TEST_CASE("run_with_input feeds stdin and reports the exit code", "[clipboard]") {
    TempDir tmp("clip");
    auto out = tmp.path / "received.txt";
    std::string payload(256 * 1024, 'q');
    payload += "\nend\n";

    auto r = run_with_input({"sh", "-c", "cat > \"$0\"", out.string()}, payload);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 0);
    REQUIRE(slurp(out) == payload);

    auto failing = run_with_input({"sh", "-c", "cat > /dev/null; exit 3"}, "x");
    REQUIRE(failing.value() == 3);

    auto missing = run_with_input({"rcat-no-such-program-xyz"}, "x");
    REQUIRE(missing.value() == 127);

    REQUIRE(run_with_input({}, "x").is_err());
}

TEST_CASE("copy_to_clipboard maps failures to clipboard errors", "[clipboard]") {
    TempDir tmp("clip");
    auto out = tmp.path / "clip.txt";

    ClipboardTool good{"fake", {"sh", "-c", "cat > \"$0\"", out.string()}};
    REQUIRE(copy_to_clipboard(good, "copied text").is_ok());
    REQUIRE(slurp(out) == "copied text");

    ClipboardTool bad{"fake", {"sh", "-c", "cat > /dev/null; exit 1"}};
    auto st = copy_to_clipboard(bad, "x");
    REQUIRE(st.is_err());
    REQUIRE(st.error().code == RcatError::Clipboard);
    REQUIRE(st.error().message.find("status 1") != std::string::npos);

    ClipboardTool absent{"rcat-missing", {"rcat-no-such-program-xyz"}};
    REQUIRE(copy_to_clipboard(absent, "x").error().code == RcatError::Clipboard);
}
