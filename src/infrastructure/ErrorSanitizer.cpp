/**
 * @file ErrorSanitizer.cpp
 * @brief Implementation of ErrorSanitizer.
 */

#include "infrastructure/ErrorSanitizer.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace shotgate::infrastructure {

namespace {

bool IsSeparator(char c) {
    return c == '/' || c == '\\';
}

bool IsSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool IsWrapper(char c) {
    return c == '(' || c == ')' || c == '[' || c == ']' || c == '\'' || c == '"';
}

bool IsTrailingPunctuation(char c) {
    return c == ':' || c == ',' || c == ';';
}

// Mid-sentence, "Input/output" or "and/or" are words, not paths.
bool LooksLikePathWord(const std::string& word) {
    if (word.empty()) {
        return false;
    }
    if (word.find('\\') != std::string::npos) {
        return true;
    }
    if (word[0] == '/' || word.rfind("~/", 0) == 0 || word.rfind("./", 0) == 0 || word.rfind("../", 0) == 0
        || word.rfind("<...>/", 0) == 0) {
        return true;
    }
    return word.size() >= 3 && std::isalpha(static_cast<unsigned char>(word[0])) && word[1] == ':' && word[2] == '/';
}

std::string SwapSeparators(std::string text) {
    for (char& c : text) {
        if (c == '/') c = '\\';
        else if (c == '\\') c = '/';
    }
    return text;
}

} // namespace

std::string ErrorSanitizer::SanitizePath(const std::string& path, bool showBasename) {
    if (!showBasename) {
        return kOpaquePlaceholder;
    }

    std::size_t end = path.size();
    while (end > 0 && IsSeparator(path[end - 1])) {
        --end;
    }

    std::size_t begin = end;
    while (begin > 0 && !IsSeparator(path[begin - 1])) {
        --begin;
    }

    std::string basename = path.substr(begin, end - begin);
    // "C:" is a drive, not a name.
    if (basename.empty() || basename == "." || (begin == 0 && basename.size() == 2 && basename[1] == ':')) {
        return kOpaquePlaceholder;
    }
    return std::string(kBasenamePrefix) + basename;
}

std::string ErrorSanitizer::FormatPathError(const std::filesystem::filesystem_error& error, bool showBasename) {
    std::string text = error.code().message();
    if (!error.path1().empty()) {
        text += ": " + SanitizePath(error.path1().string(), showBasename);
    }
    if (!error.path2().empty()) {
        text += ", " + SanitizePath(error.path2().string(), showBasename);
    }
    return text;
}

std::string ErrorSanitizer::FormatPathError(const std::error_code& code, const std::filesystem::path& path, bool showBasename) {
    return code.message() + ": " + SanitizePath(path.string(), showBasename);
}

std::string ErrorSanitizer::FormatPathError(int errnum, const std::filesystem::path& path, bool showBasename) {
    return FormatPathError(std::error_code(errnum, std::generic_category()), path, showBasename);
}

std::string ErrorSanitizer::FormatPathError(const std::string& message, bool showBasename) {
    const std::size_t last = message.rfind(": ");
    if (last == std::string::npos) {
        return SanitizeTokens(message, showBasename);
    }

    const std::string tail = message.substr(last + 2);
    if (!LooksLikePathWord(tail)) {
        return SanitizeTokens(message, showBasename);
    }

    // The tail may contain spaces, so it is sanitized whole.
    const std::size_t first = message.find(": ");
    return SanitizeTokens(message.substr(0, first), showBasename) + ": " + SanitizePath(tail, showBasename);
}

std::string ErrorSanitizer::SanitizeTokens(const std::string& text, bool showBasename) {
    std::string result;
    result.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        if (IsSpace(text[pos])) {
            result += text[pos++];
            continue;
        }
        std::size_t end = pos;
        while (end < text.size() && !IsSpace(text[end])) {
            ++end;
        }

        // Keep wrapping punctuation such as "(", quotes and a trailing ":" outside the path.
        std::size_t begin = pos;
        while (begin < end && IsWrapper(text[begin])) {
            ++begin;
        }
        std::size_t stop = end;
        while (stop > begin && (IsWrapper(text[stop - 1]) || IsTrailingPunctuation(text[stop - 1]))) {
            --stop;
        }

        const std::string core = text.substr(begin, stop - begin);
        result += text.substr(pos, begin - pos);
        result += LooksLikePathWord(core) ? SanitizePath(core, showBasename) : core;
        result += text.substr(stop, end - stop);
        pos = end;
    }
    return result;
}

std::string ErrorSanitizer::SanitizeErrorMessage(const std::string& message,
                                                 const std::vector<std::string>& sensitivePaths,
                                                 bool showBasename) {
    std::vector<std::pair<std::string, std::string>> replacements;
    for (const auto& path : sensitivePaths) {
        if (std::all_of(path.begin(), path.end(), IsSeparator)) {
            continue; // empty or bare root
        }
        const std::string replacement = SanitizePath(path, showBasename);
        replacements.emplace_back(path, replacement);
        const std::string swapped = SwapSeparators(path);
        if (swapped != path) {
            replacements.emplace_back(swapped, replacement);
        }
    }
    std::stable_sort(replacements.begin(), replacements.end(), [](const auto& a, const auto& b) {
        return a.first.size() > b.first.size();
    });

    // Single left-to-right pass so a placeholder is never rewritten again.
    std::string result;
    result.reserve(message.size());
    std::size_t pos = 0;
    while (pos < message.size()) {
        bool replaced = false;
        for (const auto& [needle, replacement] : replacements) {
            if (message.compare(pos, needle.size(), needle) == 0) {
                result += replacement;
                pos += needle.size();
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            result += message[pos++];
        }
    }
    return result;
}

} // namespace shotgate::infrastructure
