#include "session/Credentials.h"
#include "core/LoggingChannels.h"
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace BjornManager {
namespace Session {

std::optional<std::string> Credentials::effectiveSudoPassword() const
{
    if (sudoPassword.has_value() && !sudoPassword->empty()) {
        return sudoPassword;
    }
    if (password.has_value() && !password->empty()) {
        return password;
    }
    return std::nullopt;
}

std::vector<std::filesystem::path> candidateKeyPaths(
    const std::optional<std::filesystem::path>& explicitKey,
    const std::filesystem::path& sshDir,
    const std::vector<std::string>& keyNames)
{
    std::vector<std::filesystem::path> keys;
    std::error_code error;

    if (explicitKey.has_value()) {
        if (std::filesystem::is_regular_file(explicitKey.value(), error)) {
            keys.push_back(explicitKey.value());
        }
        else {
            LOG_WARN(Session, "Key file {} not found", explicitKey->string());
        }
        return keys;
    }

    for (const auto& name : keyNames) {
        const auto path = sshDir / name;
        if (std::filesystem::is_regular_file(path, error)) {
            keys.push_back(path);
        }
    }
    return keys;
}

std::vector<AuthMethod> buildAuthMethods(
    const Credentials& credentials, const std::vector<std::filesystem::path>& keys)
{
    std::vector<AuthMethod> methods;
    for (const auto& key : keys) {
        AuthMethod method;
        method.kind = AuthMethod::Kind::PublicKey;
        method.keyPath = key;
        method.secret = credentials.keyPassphrase.value_or("");
        methods.push_back(method);
    }
    if (credentials.password.has_value() && !credentials.password->empty()) {
        AuthMethod method;
        method.kind = AuthMethod::Kind::Password;
        method.secret = credentials.password.value();
        methods.push_back(method);
    }
    return methods;
}

std::filesystem::path homeDirectory()
{
    if (const char* home = std::getenv("HOME"); home && *home) {
        return home;
    }
    if (const passwd* entry = getpwuid(getuid()); entry && entry->pw_dir) {
        return entry->pw_dir;
    }
    return std::filesystem::current_path();
}

} // namespace Session
} // namespace BjornManager
