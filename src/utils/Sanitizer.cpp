#include "utils/Sanitizer.h"

#include <cctype>
#include <cstring>
#include <utility>

namespace Sanitizer {

namespace {

struct CharacterReference {
    const char *name;
    const char *replacement;
};

constexpr CharacterReference kReferences[] = {
    {"&nbsp;", " "}, {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&#39;", "'"}, {"&apos;", "'"},
};

bool opensTag(const std::string &text, size_t i) {
    if (text[i] != '<' || i + 1 >= text.size()) {
        return false;
    }
    const unsigned char next = static_cast<unsigned char>(text[i + 1]);
    return std::isalpha(next) || next == '/' || next == '!';
}

// Locates the next tag at or after `from`; `end` is the index of its closing '>'
bool findTag(const std::string &text, size_t from, size_t &start, size_t &end) {
    size_t i = from;
    while (i < text.size()) {
        if (!opensTag(text, i)) {
            ++i;
            continue;
        }

        size_t j = i + 1;
        while (j < text.size() && text[j] != '>' && text[j] != '<') {
            ++j;
        }

        if (j < text.size() && text[j] == '>') {
            start = i;
            end = j;
            return true;
        }
        i = j;
    }
    return false;
}

std::string removeTags(const std::string &text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    size_t start = 0;
    size_t end = 0;
    while (findTag(text, pos, start, end)) {
        out.append(text, pos, start - pos);
        pos = end + 1;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

std::string decodeOnce(const std::string &text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (text[i] == '&') {
            bool matched = false;
            for (const auto &ref : kReferences) {
                const size_t len = std::strlen(ref.name);
                if (text.compare(i, len, ref.name) == 0) {
                    out.append(ref.replacement);
                    i += len;
                    matched = true;
                    break;
                }
            }
            if (matched) {
                continue;
            }
        }
        out.push_back(text[i++]);
    }
    return out;
}

} // namespace

bool containsMarkup(const std::string &text) {
    size_t start = 0;
    size_t end = 0;
    return findTag(text, 0, start, end);
}

std::string stripMarkup(const std::string &text) {
    // Decoding can reveal new tags (&lt;b&gt;), so run to a fixed point
    std::string current = text;
    while (true) {
        std::string next = decodeOnce(removeTags(current));
        if (next == current) {
            break;
        }
        current = std::move(next);
    }
    return trim(current);
}

std::string trim(const std::string &text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace Sanitizer
