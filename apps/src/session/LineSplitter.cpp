#include "session/LineSplitter.h"

namespace BjornManager {
namespace Session {

std::vector<std::string> LineSplitter::push(const std::string& chunk)
{
    std::vector<std::string> lines;
    for (const char ch : chunk) {
        if (pendingCr_) {
            pendingCr_ = false;
            if (ch == '\n') {
                continue;
            }
        }
        if (ch == '\n' || ch == '\r') {
            lines.push_back(std::move(partial_));
            partial_.clear();
            pendingCr_ = (ch == '\r');
            continue;
        }
        partial_.push_back(ch);
    }
    return lines;
}

std::string LineSplitter::flush()
{
    std::string rest = std::move(partial_);
    partial_.clear();
    pendingCr_ = false;
    return rest;
}

} // namespace Session
} // namespace BjornManager
