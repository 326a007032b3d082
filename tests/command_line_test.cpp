#include <catch2/catch.hpp>

#include "core/command_line.h"

using namespace CommandLine;

TEST_CASE("GetArg reads unquoted and quoted values", "[cmdline]") {
    std::string cmd = R"("C:\app\webview_host.exe" --url=https://example.com --title="My App" --width=800)";

    CHECK(GetArg("url", cmd) == "https://example.com");
    CHECK(GetArg("title", cmd) == "My App");
    CHECK(GetArg("width", cmd) == "800");
}

TEST_CASE("GetArg returns empty for missing or valueless switches", "[cmdline]") {
    std::string cmd = "host.exe --debug --url=";

    CHECK(GetArg("title", cmd).empty());
    CHECK(GetArg("debug", cmd).empty());
    CHECK(GetArg("url", cmd).empty());
}

TEST_CASE("GetArg matches whole switch names only", "[cmdline]") {
    std::string cmd = "host.exe --data-path-extra=x --data-path=C:\\data --xurl=bad";

    CHECK(GetArg("data-path", cmd) == "C:\\data");
    CHECK(GetArg("url", cmd).empty());
}

TEST_CASE("GetIntArg falls back on missing or malformed numbers", "[cmdline]") {
    std::string cmd = "host.exe --width=1024 --height=tall --depth=12px";

    CHECK(GetIntArg("width", cmd, 640) == 1024);
    CHECK(GetIntArg("height", cmd, 480) == 480);
    CHECK(GetIntArg("depth", cmd, 7) == 7);
    CHECK(GetIntArg("missing", cmd, 3) == 3);
}

TEST_CASE("HasFlag detects bare and valued switches", "[cmdline]") {
    std::string cmd = "host.exe --debug --auto-focus=1";

    CHECK(HasFlag("debug", cmd));
    CHECK(HasFlag("auto-focus", cmd));
    CHECK_FALSE(HasFlag("auto", cmd));
    CHECK_FALSE(HasFlag("bug", cmd));
    CHECK_FALSE(HasFlag("log-file", cmd));
}
