#include "core/ManagerError.h"

namespace BjornManager {

const char* toString(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::Busy:
            return "busy";
        case ErrorKind::Cancelled:
            return "cancelled";
        case ErrorKind::Config:
            return "config";
        case ErrorKind::Connection:
            return "connection";
        case ErrorKind::Discovery:
            return "discovery";
        case ErrorKind::NotConnected:
            return "not-connected";
        case ErrorKind::RemoteExecution:
            return "remote-execution";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::Transfer:
            return "transfer";
        case ErrorKind::Validation:
            return "validation";
    }
    return "unknown";
}

} // namespace BjornManager
