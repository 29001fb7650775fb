// ============================================================================
// utils.cpp — File I/O and string utilities
// ============================================================================

#include "xi/utils.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace xi {

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

// ── write_text_file ─────────────────────────────────────────────────────────

void write_text_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file for writing: " + path);
    }
    file << content;
    if (!file) {
        throw std::runtime_error("error writing file: " + path);
    }
}

// ── trim / strip_comment ────────────────────────────────────────────────────

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string strip_comment(const std::string& line) {
    auto pos = line.find('#');
    if (pos == std::string::npos) {
        return trim(line);
    }
    return trim(line.substr(0, pos));
}

bool is_blank_or_comment(const std::string& line) {
    return strip_comment(line).empty();
}

// ── split_first_word ────────────────────────────────────────────────────────

std::pair<std::string, std::string> split_first_word(const std::string& s) {
    std::string t = trim(s);
    auto ws = t.find_first_of(" \t");
    if (ws == std::string::npos) {
        return {t, ""};
    }
    return {t.substr(0, ws), trim(t.substr(ws))};
}

// ── parse_int / parse_bool ──────────────────────────────────────────────────

int parse_int(const std::string& text, const std::string& what) {
    std::size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used, 10);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error(what + " expects an integer, got '" + text + "'");
    } catch (const std::out_of_range&) {
        throw std::runtime_error(what + " is out of range: '" + text + "'");
    }
    if (used != text.size()) {
        throw std::runtime_error(what + " expects an integer, got '" + text + "'");
    }
    return value;
}

bool parse_bool(const std::string& text, const std::string& what) {
    if (text == "true") return true;
    if (text == "false") return false;
    throw std::runtime_error(what + " expects true or false, got '" + text + "'");
}

// ── json_escape ─────────────────────────────────────────────────────────────

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

}  // namespace xi
