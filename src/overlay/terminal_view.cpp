#include "terminal_view.hpp"

#include <print>
#include <unistd.h>

TerminalView::TerminalView(std::FILE* out) : out_(out) {
    render();
}

std::string TerminalView::format(const ClientEvent& event) {
    switch (event.kind) {
        case ClientEvent::Kind::Screenshot:
            return "Screenshot received, analyzing...";
        case ClientEvent::Kind::Answer:
            if (event.text.empty()) return "(empty answer)";
            return event.text;
        case ClientEvent::Kind::Connected:
        case ClientEvent::Kind::Retrying:
        case ClientEvent::Kind::ServerError:
        case ClientEvent::Kind::InvalidMessage:
            break;
    }
    return event.text;
}

void TerminalView::show(const ClientEvent& event) {
    current_ = format(event);
    render();
}

void TerminalView::status(const std::string& text) {
    current_ = text;
    render();
}

void TerminalView::render() {
    // Answers span several lines; a rule keeps consecutive messages apart.
    if (::isatty(::fileno(out_))) {
        std::println(out_, "\x1b[2m──────────\x1b[0m");
    } else {
        std::println(out_, "----------");
    }
    std::println(out_, "{}", current_);
    std::fflush(out_);
}
