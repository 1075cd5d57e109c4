#include "gitwip/utility.h"

#include <cctype>

namespace gitwip {

bool wildcard_match(std::string_view pattern, std::string_view text) {
    std::size_t p = 0;
    std::size_t t = 0;
    std::size_t star = std::string::npos;
    std::size_t match = 0;

    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = ++p;
            match = t;
        } else if (star != std::string::npos) {
            p = star;
            t = ++match;
        } else {
            return false;
        }
    }

    while (p < pattern.size() && pattern[p] == '*') {
        ++p;
    }

    return p == pattern.size();
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const char ch = text[pos];
        if (ch != '\n' && ch != '\r') {
            ++pos;
            continue;
        }
        lines.emplace_back(text.substr(start, pos - start));
        if (ch == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') {
            ++pos;
        }
        start = ++pos;
    }
    if (start < text.size()) {
        lines.emplace_back(text.substr(start));
    }
    return lines;
}

std::vector<std::string> split_whitespace(std::string_view text) {
    std::vector<std::string> words;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        const std::size_t start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos > start) {
            words.emplace_back(text.substr(start, pos - start));
        }
    }
    return words;
}

std::string shell_quote(std::string_view value) {
#ifndef _WIN32
    std::string result = "'";
    for (char ch : value) {
        if (ch == '\'') {
            result += "'\\''";
        } else {
            result += ch;
        }
    }
    result += "'";
    return result;
#else
    std::string result = "\"";
    for (char ch : value) {
        if (ch == '"') {
            result += "\\\"";
        } else {
            result += ch;
        }
    }
    result += "\"";
    return result;
#endif
}

std::string shell_quote(const std::filesystem::path& path) {
    return shell_quote(std::string_view{path.string()});
}

} // namespace gitwip
