#include "installer/ProgressParser.h"
#include <cctype>

namespace BjornManager {
namespace Installer {

namespace {

// Drops ESC [ ... <final byte> sequences.
std::string stripColour(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\x1b' && i + 1 < text.size() && text[i + 1] == '[') {
            i += 2;
            while (i < text.size() && !(text[i] >= '@' && text[i] <= '~')) {
                ++i;
            }
            continue;
        }
        out.push_back(text[i]);
    }
    return out;
}

std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

bool matchWord(std::string_view text, size_t& pos, std::string_view word)
{
    if (pos + word.size() > text.size()) {
        return false;
    }
    for (size_t i = 0; i < word.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) != word[i]) {
            return false;
        }
    }
    pos += word.size();
    return true;
}

bool skipSpaces(std::string_view text, size_t& pos)
{
    const size_t start = pos;
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
        ++pos;
    }
    return pos > start;
}

std::optional<int> readNumber(std::string_view text, size_t& pos)
{
    const size_t start = pos;
    int value = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (pos - start >= 6) {
            return std::nullopt;
        }
        value = value * 10 + (text[pos] - '0');
        ++pos;
    }
    if (pos == start) {
        return std::nullopt;
    }
    return value;
}

std::optional<StepProgress> matchAt(std::string_view text, size_t pos)
{
    if (!matchWord(text, pos, "step") || !skipSpaces(text, pos)) {
        return std::nullopt;
    }
    const auto index = readNumber(text, pos);
    if (!index.has_value() || !skipSpaces(text, pos) || !matchWord(text, pos, "of")
        || !skipSpaces(text, pos)) {
        return std::nullopt;
    }
    const auto total = readNumber(text, pos);
    if (!total.has_value()) {
        return std::nullopt;
    }

    StepProgress progress;
    progress.index = index.value();
    progress.total = total.value();

    std::string_view rest = text.substr(pos);
    if (!rest.empty() && rest.front() == ':') {
        rest.remove_prefix(1);
        progress.label = std::string(trim(rest));
    }
    else if (!rest.empty() && !std::isspace(static_cast<unsigned char>(rest.front()))) {
        // "Step 3 of 13x" is not a marker.
        return std::nullopt;
    }
    if (progress.label.empty()) {
        progress.label =
            "Step " + std::to_string(progress.index) + "/" + std::to_string(progress.total);
    }
    return progress;
}

} // namespace

std::optional<StepProgress> parseStepMarker(std::string_view line)
{
    const std::string text = stripColour(line);
    for (size_t pos = 0; pos < text.size(); ++pos) {
        const bool wordStart =
            pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1]));
        if (!wordStart) {
            continue;
        }
        if (auto progress = matchAt(text, pos)) {
            return progress;
        }
    }
    return std::nullopt;
}

LineOutcome advanceProgress(ProgressState state, const std::string& line)
{
    LineOutcome outcome;
    std::string text = line;
    while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) {
        text.pop_back();
    }
    if (trim(stripColour(text)).empty()) {
        outcome.state = std::move(state);
        return outcome;
    }

    state.recentLines.push_back(text);
    while (state.recentLines.size() > state.maxRecentLines) {
        state.recentLines.pop_front();
    }

    if (auto progress = parseStepMarker(text)) {
        state.stepIndex = progress->index;
        state.stepTotal = progress->total;
        state.label = progress->label;
        outcome.progress = std::move(progress);
    }
    else {
        outcome.logLine = std::move(text);
    }
    outcome.state = std::move(state);
    return outcome;
}

std::vector<std::string> failureContext(const ProgressState& state)
{
    return std::vector<std::string>(state.recentLines.begin(), state.recentLines.end());
}

} // namespace Installer
} // namespace BjornManager
