#include "discovery/DiscoverySource.h"

namespace BjornManager {
namespace Discovery {

const char* toString(SourceKind kind)
{
    switch (kind) {
        case SourceKind::Mdns:
            return "mdns";
        case SourceKind::RangeProbe:
            return "range-probe";
        case SourceKind::LivenessPoll:
            return "liveness-poll";
    }
    return "unknown";
}

} // namespace Discovery
} // namespace BjornManager
