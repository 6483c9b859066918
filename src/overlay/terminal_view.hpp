#pragma once

#include "reconnecting_client.hpp"

#include <cstdio>
#include <string>

// Presentation layer of the overlay: always shows the most recent message,
// whether it is an answer, a connection status or an error.
class TerminalView {
public:
    explicit TerminalView(std::FILE* out = stdout);

    void show(const ClientEvent& event);
    // Local status lines (input errors, "Sending ...").
    void status(const std::string& text);

    const std::string& current() const { return current_; }

    static std::string format(const ClientEvent& event);

private:
    void render();

    std::FILE* out_;
    std::string current_ = "Waiting...";
};
