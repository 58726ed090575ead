#pragma once

#include <string>
#include <vector>

namespace BjornManager {
namespace Session {

// Reassembles lines from arbitrary chunks. "\r\n" and bare "\r" end a line like "\n".
class LineSplitter {
public:
    std::vector<std::string> push(const std::string& chunk);

    // The trailing text not yet terminated by a newline; emptied.
    std::string flush();

    const std::string& partial() const { return partial_; }

private:
    std::string partial_;
    bool pendingCr_ = false;
};

} // namespace Session
} // namespace BjornManager
