#include "path/utils.hpp"

namespace M2M {

namespace {

// Returns the length of the class expression starting at pattern[idx] == '[',
// or 0 when the class is malformed. 'matched' reports whether ch is a member.
auto match_class(std::string_view pattern, std::size_t idx, char ch, bool& matched) -> std::size_t {
    std::size_t pos = idx + 1;
    bool invert = false;
    if (pos < pattern.size() && pattern[pos] == '!') {
        invert = true;
        ++pos;
    }

    bool hit      = false;
    char prevChar = '\0';
    while (pos < pattern.size() && pattern[pos] != ']') {
        if (pattern[pos] == '-' && prevChar != '\0' && pos + 1 < pattern.size() && pattern[pos + 1] != ']') {
            if (ch >= prevChar && ch <= pattern[pos + 1])
                hit = true;
            prevChar = '\0';
            pos += 2;
        } else {
            if (ch == pattern[pos])
                hit = true;
            prevChar = pattern[pos];
            ++pos;
        }
    }
    if (pos >= pattern.size())
        return 0;

    matched = invert ? !hit : hit;
    return pos - idx + 1;
}

} // namespace

auto match_names(std::string_view const pattern, std::string_view const name) -> bool {
    std::size_t patternIdx = 0;
    std::size_t nameIdx    = 0;
    // Backtrack point for the most recent '*'
    std::size_t starIdx      = std::string_view::npos;
    std::size_t starNameIdx  = 0;

    while (nameIdx < name.size()) {
        if (patternIdx < pattern.size()) {
            char const token = pattern[patternIdx];
            if (token == '*') {
                starIdx     = patternIdx++;
                starNameIdx = nameIdx;
                continue;
            }
            if (token == '?') {
                ++patternIdx;
                ++nameIdx;
                continue;
            }
            if (token == '[') {
                bool matched = false;
                auto const length = match_class(pattern, patternIdx, name[nameIdx], matched);
                if (length == 0)
                    return false;
                if (matched) {
                    patternIdx += length;
                    ++nameIdx;
                    continue;
                }
            } else if (token == '\\') {
                if (patternIdx + 1 < pattern.size() && pattern[patternIdx + 1] == name[nameIdx]) {
                    patternIdx += 2;
                    ++nameIdx;
                    continue;
                }
            } else if (token == name[nameIdx]) {
                ++patternIdx;
                ++nameIdx;
                continue;
            }
        }
        if (starIdx == std::string_view::npos)
            return false;
        patternIdx = starIdx + 1;
        nameIdx    = ++starNameIdx;
    }

    while (patternIdx < pattern.size() && pattern[patternIdx] == '*') {
        ++patternIdx;
    }
    return patternIdx == pattern.size();
}

auto is_glob(std::string_view text) -> bool {
    bool escaped = false;
    for (char const ch : text) {
        if (escaped) {
            escaped = false;
            continue;
        }
        if (ch == '\\')
            escaped = true;
        else if (ch == '*' || ch == '?' || ch == '[')
            return true;
    }
    return false;
}

auto split_path(std::string_view path) -> std::vector<std::string_view> {
    std::vector<std::string_view> segments;
    std::size_t                   start = 0;
    while (true) {
        auto const slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return segments;
}

auto join_path(std::vector<std::string_view> const& segments, std::size_t first) -> std::string {
    std::string joined;
    for (std::size_t i = first; i < segments.size(); ++i) {
        if (i != first)
            joined.push_back('/');
        joined.append(segments[i]);
    }
    return joined;
}

} // namespace M2M
