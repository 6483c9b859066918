#include <catch2/catch_test_macros.hpp>

#include "base64.hpp"
#include "clipboard.hpp"
#include "terminal_view.hpp"
#include "trigger.hpp"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// Puts a shell script named wl-paste first on PATH for the test's lifetime.
struct FakeWlPaste {
    fs::path dir;
    std::string old_path;

    explicit FakeWlPaste(const std::string& body) {
        dir = fs::temp_directory_path() / ("aa_test_wlpaste_" + std::to_string(getpid()));
        fs::create_directories(dir);
        if (!body.empty()) {
            auto script = dir / "wl-paste";
            std::ofstream(script) << "#!/bin/sh\n" << body;
            fs::permissions(script, fs::perms::owner_all);
        }
        const char* path = std::getenv("PATH");
        old_path = path ? path : "";
        ::setenv("PATH", dir.c_str(), 1);
    }

    ~FakeWlPaste() {
        ::setenv("PATH", old_path.c_str(), 1);
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

} // namespace

TEST_CASE("ParseTrigger", "[trigger]") {

    SECTION("Ask") {
        auto t = parse_trigger("ask   what is 2+2?  ");
        REQUIRE(t.has_value());
        REQUIRE(t->kind == Trigger::Kind::Ask);
        REQUIRE(t->argument == "what is 2+2?");

        auto empty = parse_trigger("ask");
        REQUIRE_FALSE(empty.has_value());
        REQUIRE(empty.error() == "usage: ask <text>");
    }

    SECTION("ImageWithAndWithoutQuestion") {
        auto t = parse_trigger("image /tmp/a.png what is this");
        REQUIRE(t.has_value());
        REQUIRE(t->kind == Trigger::Kind::Image);
        REQUIRE(t->argument == "/tmp/a.png");
        REQUIRE(t->question == "what is this");

        auto bare = parse_trigger("image /tmp/a.png");
        REQUIRE(bare.has_value());
        REQUIRE(bare->question.empty());

        auto missing = parse_trigger("image");
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error() == "usage: image <path> [question]");
    }

    SECTION("SimpleCommands") {
        REQUIRE(parse_trigger("clip")->kind == Trigger::Kind::Clip);
        REQUIRE(parse_trigger("ping")->kind == Trigger::Kind::Ping);
        REQUIRE(parse_trigger("quit")->kind == Trigger::Kind::Quit);
        REQUIRE(parse_trigger("exit")->kind == Trigger::Kind::Quit);

        auto shot = parse_trigger("shot explain the error");
        REQUIRE(shot->kind == Trigger::Kind::Shot);
        REQUIRE(shot->question == "explain the error");
    }

    SECTION("Errors") {
        REQUIRE(parse_trigger("").error() == "empty command");
        REQUIRE(parse_trigger("   \t").error() == "empty command");
        REQUIRE(parse_trigger("reboot now").error() == "unknown command: reboot");
        // Commands are case sensitive.
        REQUIRE_FALSE(parse_trigger("ASK hi").has_value());
    }
}

TEST_CASE("QueryEnvelopes", "[trigger]") {

    SECTION("PrefixIsPrependedAndTrimmed") {
        REQUIRE(prefixed_question("use code to solve: ", "2+2") == "use code to solve: 2+2");
        REQUIRE(prefixed_question("", "  hi  ") == "hi");
        // Image-only queries carry just the prefix.
        REQUIRE(prefixed_question("use code to solve: ", "") == "use code to solve:");
    }

    SECTION("TextQuery") {
        auto env = make_text_query("Q: ", "hello");
        REQUIRE(env["command"] == "ai_query_text");
        REQUIRE(env["question"] == "Q: hello");
        REQUIRE_FALSE(env.contains("image_data"));
    }

    SECTION("ImageQuery") {
        std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0};
        auto env = make_image_query("Q: ", "what", png);
        REQUIRE(env["command"] == "ai_query");
        REQUIRE(env["question"] == "Q: what");
        auto decoded = base64::decode(env["image_data"].get<std::string>());
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == png);
    }

    SECTION("ReadFile") {
        auto path = fs::temp_directory_path() / ("aa_test_trigger_" + std::to_string(getpid()));
        {
            std::ofstream f(path, std::ios::binary);
            f.write("\x89PNG\0x", 6);
        }
        auto data = read_file(path.string());
        fs::remove(path);
        REQUIRE(data.has_value());
        REQUIRE(data->size() == 6);
        REQUIRE((*data)[4] == 0);

        auto missing = read_file("/nonexistent/aa.png");
        REQUIRE_FALSE(missing.has_value());
        REQUIRE(missing.error().starts_with("cannot open /nonexistent/aa.png"));
    }
}

TEST_CASE("ClipboardClassify", "[clipboard]") {
    using Kind = ClipboardContent::Kind;

    REQUIRE(WaylandClipboard::classify({"image/png"}) == Kind::Image);
    REQUIRE(WaylandClipboard::classify({"image/png", "image/jpeg"}) == Kind::Image);
    // Text wins whenever any text type is offered.
    REQUIRE(WaylandClipboard::classify({"image/png", "text/plain"}) == Kind::Text);
    REQUIRE(WaylandClipboard::classify({"UTF8_STRING", "image/png"}) == Kind::Text);
    REQUIRE(WaylandClipboard::classify({"text/html"}) == Kind::Text);
    // Nothing usable is read as (empty) text.
    REQUIRE(WaylandClipboard::classify({}) == Kind::Text);
    REQUIRE(WaylandClipboard::classify({"image/jpeg"}) == Kind::Text);
}

TEST_CASE("WaylandClipboard", "[clipboard]") {
    using Kind = ClipboardContent::Kind;

    SECTION("TextWithDefaultSignalMask") {
        // The overlay blocks SIGINT/SIGTERM for its signalfd; wl-paste must not inherit that.
        FakeWlPaste fake("case \"$1\" in\n"
                         "  --list-types) echo text/plain ;;\n"
                         "  --no-newline) /bin/grep SigBlk /proc/self/status | /usr/bin/tr -d ' \\t' ;;\n"
                         "esac\n");
        sigset_t mask;
        sigset_t old;
        sigemptyset(&mask);
        sigaddset(&mask, SIGTERM);
        sigaddset(&mask, SIGINT);
        ::sigprocmask(SIG_BLOCK, &mask, &old);

        WaylandClipboard clipboard;
        auto content = clipboard.read();
        ::sigprocmask(SIG_SETMASK, &old, nullptr);

        REQUIRE(content.has_value());
        REQUIRE(content->kind == Kind::Text);
        REQUIRE(content->text == "SigBlk:0000000000000000\n");
    }

    SECTION("ImageOnly") {
        FakeWlPaste fake("case \"$1\" in\n"
                         "  --list-types) echo image/png ;;\n"
                         "  --type) printf 'PNGDATA' ;;\n"
                         "esac\n");
        WaylandClipboard clipboard;
        auto content = clipboard.read();
        REQUIRE(content.has_value());
        REQUIRE(content->kind == Kind::Image);
        REQUIRE(std::string(content->png.begin(), content->png.end()) == "PNGDATA");
    }

    SECTION("EmptyClipboard") {
        FakeWlPaste fake("exit 1\n");
        WaylandClipboard clipboard;
        auto content = clipboard.read();
        REQUIRE(content.has_value());
        REQUIRE(content->kind == Kind::Text);
        REQUIRE(content->text.empty());
    }

    SECTION("NotInstalled") {
        FakeWlPaste fake("");
        WaylandClipboard clipboard;
        auto content = clipboard.read();
        REQUIRE_FALSE(content.has_value());
        REQUIRE(content.error() == "wl-paste not found");
    }
}

TEST_CASE("TerminalView", "[view]") {
    std::FILE* sink = std::tmpfile();
    REQUIRE(sink != nullptr);

    {
        TerminalView view(sink);
        REQUIRE(view.current() == "Waiting...");

        view.show({ClientEvent::Kind::Connected, "Successfully connected to server"});
        REQUIRE(view.current() == "Successfully connected to server");

        view.show({ClientEvent::Kind::Answer, "42"});
        REQUIRE(view.current() == "42");

        // The most recent message replaces the previous one.
        view.show({ClientEvent::Kind::ServerError, "Server error: No image provided"});
        REQUIRE(view.current() == "Server error: No image provided");

        view.status("Not connected, question dropped");
        REQUIRE(view.current() == "Not connected, question dropped");
    }

    REQUIRE(TerminalView::format({ClientEvent::Kind::Answer, ""}) == "(empty answer)");
    REQUIRE(TerminalView::format({ClientEvent::Kind::Screenshot, "AAAA"}) ==
            "Screenshot received, analyzing...");
    REQUIRE(TerminalView::format({ClientEvent::Kind::Retrying,
                                  "Connection lost. Retrying in 2 seconds..."}) ==
            "Connection lost. Retrying in 2 seconds...");

    std::fclose(sink);
}
