#pragma once

#include <cstddef>
#include <optional>
#include <string>

// Accumulates stream reads and splits them into newline-delimited messages.
class LineBuffer {
public:
    explicit LineBuffer(size_t max_line_bytes = 32 * 1024 * 1024)
        : max_line_bytes_(max_line_bytes) {}

    // Returns false once any line, complete or still pending, exceeds the limit.
    bool append(const char* data, size_t len) {
        buf_.append(data, len);
        for (auto pos = buf_.find('\n', scan_from_); pos != std::string::npos;
             pos = buf_.find('\n', pos + 1)) {
            if (pos - line_start_ > max_line_bytes_) return false;
            line_start_ = pos + 1;
        }
        scan_from_ = buf_.size();
        return buf_.size() - line_start_ <= max_line_bytes_;
    }

    // Pops the next complete line without its terminator.
    std::optional<std::string> next_line() {
        auto pos = buf_.find('\n');
        if (pos == std::string::npos || pos >= scan_from_) return std::nullopt;

        std::string line = buf_.substr(0, pos);
        buf_.erase(0, pos + 1);
        line_start_ -= pos + 1;
        scan_from_ -= pos + 1;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return line;
    }

    size_t pending() const { return buf_.size(); }
    void clear() {
        buf_.clear();
        line_start_ = 0;
        scan_from_ = 0;
    }

private:
    std::string buf_;
    // Offset just past the last newline seen by append().
    size_t line_start_ = 0;
    size_t scan_from_ = 0;
    size_t max_line_bytes_;
};
