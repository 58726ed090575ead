#include "session/SshTransport.h"

namespace BjornManager {
namespace Session {

std::string AuthMethod::describe() const
{
    switch (kind) {
        case Kind::PublicKey:
            return "key " + keyPath.string();
        case Kind::Password:
            return "password";
    }
    return "unknown";
}

} // namespace Session
} // namespace BjornManager
