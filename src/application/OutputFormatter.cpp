#include "application/OutputFormatter.hpp"
#include "domain/Errors.hpp"

#include <algorithm>
#include <iostream>
#include <vector>

namespace shotgate::application {

namespace {

const char* const kStyles[] = {"markdown", "html", "text"};

std::size_t EditDistance(const std::string& a, const std::string& b) {
    std::vector<std::size_t> prev(b.size() + 1);
    std::vector<std::size_t> curr(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;
    for (std::size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            const std::size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

} // namespace

std::string OutputFormatter::SuggestFormat(const std::string& text) {
    const std::string lower = domain::ToLower(text);
    if (lower.empty()) {
        return "";
    }
    if (lower == "plain_text" || lower == "plain" || lower == "txt") {
        return "text";
    }
    if (lower == "md") {
        return "markdown";
    }

    std::string best;
    std::size_t bestDistance = 3; // anything further is not a typo
    for (const char* style : kStyles) {
        const std::string candidate(style);
        if (candidate.rfind(lower, 0) == 0) {
            return candidate;
        }
        const std::size_t distance = EditDistance(lower, candidate);
        if (distance < bestDistance) {
            bestDistance = distance;
            best = candidate;
        }
    }
    return best;
}

domain::OutputStyle OutputFormatter::ParseStyle(const std::string& text) {
    if (auto style = domain::ParseOutputStyle(text)) {
        return *style;
    }
    if (domain::ToLower(text) == "plain_text") {
        std::cerr << "[OutputFormatter] Warning: The 'plain_text' output format is deprecated and will be "
                     "removed in v1.0.0. Use 'text' instead." << std::endl;
        return domain::OutputStyle::Text;
    }
    std::string message = "Invalid output format: " + text + ". Valid options: markdown, html, text.";
    const std::string suggestion = SuggestFormat(text);
    if (!suggestion.empty()) {
        message += " Did you mean: " + suggestion + "?";
    }
    throw domain::InvalidInputError(message);
}

std::string OutputFormatter::FormatPath(domain::OutputStyle style, const std::filesystem::path& path, bool repoRelative) {
    const std::string shown = repoRelative ? "/" + path.generic_string() : path.string();
    const std::string name = path.filename().string();
    switch (style) {
        case domain::OutputStyle::Markdown: return "![" + name + "](" + shown + ")";
        case domain::OutputStyle::Html: return "<img src=\"" + shown + "\" alt=\"" + name + "\">";
        case domain::OutputStyle::Text: return shown;
    }
    return shown;
}

} // namespace shotgate::application
