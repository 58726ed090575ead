#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace BjornManager {
namespace Installer {

struct StepProgress {
    int index = 0;
    int total = 0;
    std::string label;

    bool operator==(const StepProgress&) const = default;
};

// Recognizes "Step <n> of <total>: <label>" anywhere in the line, ignoring case and colour
// escapes. A marker without a label yields "Step <n>/<total>".
std::optional<StepProgress> parseStepMarker(std::string_view line);

struct ProgressState {
    int stepIndex = 0;
    int stepTotal = 0;
    std::string label;
    // Most recent non-blank lines, oldest first.
    std::deque<std::string> recentLines;
    size_t maxRecentLines = 20;
};

// What one line contributes: a step marker or a plain log line, never both. Blank lines
// contribute nothing.
struct LineOutcome {
    ProgressState state;
    std::optional<StepProgress> progress;
    std::optional<std::string> logLine;
};

// Never throws. The latest marker wins, even when the step number goes backwards.
LineOutcome advanceProgress(ProgressState state, const std::string& line);

std::vector<std::string> failureContext(const ProgressState& state);

} // namespace Installer
} // namespace BjornManager
