#pragma once

#include "session/SshTransport.h"

namespace BjornManager {
namespace Session {

// libssh2 in non-blocking mode. Every libssh2 call on a session is made under that
// session's mutex, so a keep-alive thread and one channel reader can share it.
class Libssh2Connector : public SshConnector {
public:
    Outcome<std::unique_ptr<SshConnection>> connect(
        const ConnectRequest& request, HostKeyVerifier& verifier) override;
};

} // namespace Session
} // namespace BjornManager
