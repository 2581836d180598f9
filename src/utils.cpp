// ============================================================================
// utils.cpp — File I/O and string utilities
// ============================================================================

#include "proplogic/utils.hpp"

#include <fstream>
#include <stdexcept>

namespace proplogic {

// ── read_lines ──────────────────────────────────────────────────────────────

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

// ── trim ────────────────────────────────────────────────────────────────────

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ── strip_comment ───────────────────────────────────────────────────────────

std::string strip_comment(const std::string& line) {
    auto pos = line.find('#');
    if (pos == std::string::npos) {
        return trim(line);
    }
    return trim(line.substr(0, pos));
}

// ── is_blank_or_comment ─────────────────────────────────────────────────────

bool is_blank_or_comment(const std::string& line) {
    return strip_comment(line).empty();
}

// ── split ───────────────────────────────────────────────────────────────────

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    for (;;) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(trim(s.substr(start)));
            return parts;
        }
        parts.push_back(trim(s.substr(start, pos - start)));
        start = pos + 1;
    }
}

// ── parse_assignment ────────────────────────────────────────────────────────

Interpretation parse_assignment(const std::string& text) {
    Interpretation interp;
    if (trim(text).empty()) return interp;

    for (const std::string& item : split(text, ',')) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("expected NAME=VALUE in assignment, got '" + item + "'");
        }
        std::string name  = trim(item.substr(0, eq));
        std::string value = trim(item.substr(eq + 1));

        bool v;
        if (value == "1" || value == "true" || value == "T") {
            v = true;
        } else if (value == "0" || value == "false" || value == "F") {
            v = false;
        } else {
            throw std::runtime_error("invalid truth value '" + value + "' for " + name);
        }

        if (interp.binds(name)) {
            throw std::runtime_error("atom assigned twice: " + name);
        }
        interp = interp.with(name, v);
    }
    return interp;
}

}  // namespace proplogic
