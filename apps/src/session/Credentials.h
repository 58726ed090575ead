#pragma once

#include "session/SshTransport.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace BjornManager {
namespace Session {

// What the operator supplied for one connect. Never persisted.
struct Credentials {
    std::string user = "bjorn";
    std::optional<std::string> password;
    // Falls back to password when unset.
    std::optional<std::string> sudoPassword;
    // When set, the only key tried; otherwise the conventional keys in ~/.ssh.
    std::optional<std::filesystem::path> keyPath;
    // For encrypted private keys. Unset means the keys are tried without one.
    std::optional<std::string> keyPassphrase;

    std::optional<std::string> effectiveSudoPassword() const;
};

// Existing private key files to try, in order. Missing files are skipped.
std::vector<std::filesystem::path> candidateKeyPaths(
    const std::optional<std::filesystem::path>& explicitKey,
    const std::filesystem::path& sshDir,
    const std::vector<std::string>& keyNames);

// Keys first (with keyPassphrase, if any), then the password.
std::vector<AuthMethod> buildAuthMethods(
    const Credentials& credentials, const std::vector<std::filesystem::path>& keys);

// $HOME, else the passwd entry of the current user.
std::filesystem::path homeDirectory();

} // namespace Session
} // namespace BjornManager
