// =================================================================
// src/Folio/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-style pattern matching.

#include "Folio/IgnorePattern.hpp"
#include "Folio/Logger.hpp"
#include <fstream>
#include <cstring>

namespace Folio {

static std::string escapeRegexChar(char c) {
    if (std::strchr(".^$+{}|()[]\\*?", c) != nullptr) {
        return std::string("\\") + c;
    }
    return std::string(1, c);
}

IgnorePattern::IgnorePattern(const std::string& pattern)
    : m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty || path.empty()) {
        return false;
    }

    std::string candidate = path;
    if (candidate.back() == '/') {
        candidate.pop_back();
        is_directory = true;
    }
    if (candidate.empty()) {
        return false;
    }

    std::smatch match;
    if (!std::regex_match(candidate, match, m_regex)) {
        return false;
    }

    // Group 1 is the part below the matched entry; unmatched means the
    // pattern named the entry itself.
    bool matched_entry_itself = !match[1].matched;
    if (m_directory_only && matched_entry_itself && !is_directory) {
        return false;
    }
    return true;
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working_pattern = pattern;

    // Trailing whitespace is dropped unless escaped
    while (!working_pattern.empty()) {
        char last = working_pattern.back();
        if (last == '\r' || last == '\n' || last == '\t') {
            working_pattern.pop_back();
        } else if (last == ' ' && !(working_pattern.size() >= 2 &&
                                    working_pattern[working_pattern.size() - 2] == '\\')) {
            working_pattern.pop_back();
        } else {
            break;
        }
    }

    if (working_pattern.empty() || working_pattern[0] == '#') {
        m_is_empty = true;
        return;
    }

    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern.erase(0, 1);
    } else if (working_pattern.size() >= 2 && working_pattern[0] == '\\' &&
               (working_pattern[1] == '!' || working_pattern[1] == '#')) {
        working_pattern.erase(0, 1);
    }

    if (!working_pattern.empty() && working_pattern.back() == '/') {
        m_directory_only = true;
        working_pattern.pop_back();
    }

    if (!working_pattern.empty() && working_pattern[0] == '/') {
        m_is_anchored = true;
        working_pattern.erase(0, 1);
    } else if (working_pattern.find('/') != std::string::npos) {
        m_is_anchored = true;
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    std::string regex_pattern = m_is_anchored ? "" : "(?:.*/)?";
    regex_pattern += globToRegex(working_pattern);
    regex_pattern += "(/.*)?";

    try {
        m_regex = std::regex(regex_pattern, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        Logger::getInstance().warning("IgnorePattern",
            "Failed to compile pattern '" + pattern + "'", e.what());
        m_is_empty = true;
    }
}

std::string IgnorePattern::globToRegex(const std::string& glob_pattern) const {
    std::string regex_pattern;
    const size_t length = glob_pattern.length();
    size_t i = 0;

    while (i < length) {
        char c = glob_pattern[i];

        if (c == '*') {
            if (i + 1 < length && glob_pattern[i + 1] == '*') {
                bool segment_start = (i == 0 || glob_pattern[i - 1] == '/');
                size_t after = i + 2;
                if (segment_start && after < length && glob_pattern[after] == '/') {
                    // "**/" matches zero or more directories
                    regex_pattern += "(?:.*/)?";
                    i = after + 1;
                } else if (segment_start && after == length) {
                    // trailing "**" matches everything inside
                    regex_pattern += ".*";
                    i = after;
                } else {
                    regex_pattern += "[^/]*";
                    i = after;
                }
            } else {
                regex_pattern += "[^/]*";
                ++i;
            }
            continue;
        }

        if (c == '?') {
            regex_pattern += "[^/]";
            ++i;
            continue;
        }

        if (c == '[') {
            size_t close = i + 1;
            if (close < length && (glob_pattern[close] == '!' || glob_pattern[close] == '^')) {
                ++close;
            }
            if (close < length && glob_pattern[close] == ']') {
                ++close;
            }
            while (close < length && glob_pattern[close] != ']') {
                ++close;
            }
            if (close >= length) {
                // Unterminated class is a literal '['
                regex_pattern += "\\[";
                ++i;
                continue;
            }

            std::string char_class = "[";
            size_t k = i + 1;
            if (glob_pattern[k] == '!' || glob_pattern[k] == '^') {
                char_class += '^';
                ++k;
            }
            for (; k < close; ++k) {
                char member = glob_pattern[k];
                if (member == '\\' || member == '[' || member == ']') {
                    char_class += '\\';
                }
                char_class += member;
            }
            char_class += ']';
            regex_pattern += char_class;
            i = close + 1;
            continue;
        }

        if (c == '\\' && i + 1 < length) {
            regex_pattern += escapeRegexChar(glob_pattern[i + 1]);
            i += 2;
            continue;
        }

        regex_pattern += escapeRegexChar(c);
        ++i;
    }

    return regex_pattern;
}

// IgnorePatternSet implementation

bool IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (ignore_pattern.isEmpty()) {
        return false;
    }
    m_patterns.push_back(std::move(ignore_pattern));
    return true;
}

size_t IgnorePatternSet::loadFromFile(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    size_t patterns_loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (addPattern(line)) {
            patterns_loaded++;
        }
    }

    return patterns_loaded;
}

bool IgnorePatternSet::shouldIgnore(const std::string& path, bool is_directory) const {
    bool should_ignore = false;

    // Later patterns override earlier ones
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path, is_directory)) {
            should_ignore = !pattern.isNegation();
        }
    }

    return should_ignore;
}

} // namespace Folio
