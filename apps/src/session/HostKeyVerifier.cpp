#include "session/HostKeyVerifier.h"
#include "core/Base64.h"
#include "core/LoggingChannels.h"
#include <fstream>
#include <libssh2.h>
#include <sstream>

namespace BjornManager {
namespace Session {

namespace {

std::string hostPortKey(const std::string& host, int port)
{
    if (port == 22) {
        return host;
    }
    return "[" + host + "]:" + std::to_string(port);
}

std::string encodeBlob(const std::string& blob)
{
    return base64Encode(reinterpret_cast<const unsigned char*>(blob.data()), blob.size());
}

int knownHostKeyMask(const std::string& type)
{
    if (type == "ssh-rsa") {
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    }
    if (type == "ssh-dss") {
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
    }
    if (type == "ecdsa-sha2-nistp256") {
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    }
    if (type == "ecdsa-sha2-nistp384") {
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    }
    if (type == "ecdsa-sha2-nistp521") {
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
    }
    if (type == "ssh-ed25519") {
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
    }
    // Zero makes libssh2 compare the key bytes only.
    return 0;
}

} // namespace

std::string knownHostsLine(const std::string& host, int port, const HostKey& key)
{
    return hostPortKey(host, port) + " " + key.type + " " + encodeBlob(key.blob);
}

VoidOutcome AcceptAnyHostKey::verify(const std::string& host, int port, const HostKey& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string name = hostPortKey(host, port);

    auto it = seen_.find(name);
    if (it == seen_.end()) {
        LOG_WARN(Session, "Accepting unverified {} host key for {}", key.type, name);
        LOG_INFO(Session, "To pin it, add to known_hosts: {}", knownHostsLine(host, port, key));
        seen_.emplace(name, key);
        return okayVoid();
    }
    if (it->second.type != key.type || it->second.blob != key.blob) {
        return failVoid(
            ErrorKind::Connection, "Host key for " + name + " changed since first connection");
    }
    return okayVoid();
}

struct PinnedKnownHosts::Impl {
    mutable std::mutex mutex;
    bool libraryReady = false;
    LIBSSH2_SESSION* session = nullptr;
    LIBSSH2_KNOWNHOSTS* hosts = nullptr;

    Impl()
    {
        // libssh2_init() is reference counted; this pairs with libssh2_exit() below.
        libraryReady = (libssh2_init(0) == 0);
        if (!libraryReady) {
            return;
        }
        session = libssh2_session_init();
        if (session) {
            hosts = libssh2_knownhost_init(session);
        }
    }

    ~Impl()
    {
        if (hosts) {
            libssh2_knownhost_free(hosts);
        }
        if (session) {
            libssh2_session_free(session);
        }
        if (libraryReady) {
            libssh2_exit();
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

PinnedKnownHosts::PinnedKnownHosts() = default;

PinnedKnownHosts::~PinnedKnownHosts() = default;

Outcome<std::shared_ptr<PinnedKnownHosts>> PinnedKnownHosts::fromFile(
    const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return fail<std::shared_ptr<PinnedKnownHosts>>(
            ErrorKind::Config, "Cannot read known hosts file " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto loaded = fromText(buffer.str());
    if (loaded.isValue()) {
        LOG_DEBUG(
            Session,
            "Loaded {} known_hosts entries from {}",
            loaded.value()->size(),
            path.string());
    }
    return loaded;
}

Outcome<std::shared_ptr<PinnedKnownHosts>> PinnedKnownHosts::fromText(const std::string& text)
{
    auto verifier = std::make_shared<PinnedKnownHosts>();
    Impl& impl = *verifier->pImpl_;
    if (!impl.hosts) {
        return fail<std::shared_ptr<PinnedKnownHosts>>(
            ErrorKind::Config, "Cannot initialise libssh2 known-host store");
    }

    // Line by line, so one entry libssh2 does not understand (e.g. @cert-authority) does
    // not discard the rest of the file.
    std::istringstream stream(text);
    std::string line;
    int lineNumber = 0;
    while (std::getline(stream, line)) {
        ++lineNumber;
        const int rc = libssh2_knownhost_readline(
            impl.hosts, line.c_str(), line.size(), LIBSSH2_KNOWNHOST_FILE_OPENSSH);
        if (rc != 0) {
            LOG_WARN(Session, "Skipping known_hosts line {} (libssh2 error {})", lineNumber, rc);
        }
    }
    return Outcome<std::shared_ptr<PinnedKnownHosts>>::okay(verifier);
}

size_t PinnedKnownHosts::size() const
{
    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    size_t count = 0;
    libssh2_knownhost* previous = nullptr;
    libssh2_knownhost* entry = nullptr;
    while (pImpl_->hosts && libssh2_knownhost_get(pImpl_->hosts, &entry, previous) == 0) {
        ++count;
        previous = entry;
    }
    return count;
}

VoidOutcome PinnedKnownHosts::verify(const std::string& host, int port, const HostKey& key)
{
    const std::string name = hostPortKey(host, port);
    const int typeMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW
        | knownHostKeyMask(key.type);

    std::lock_guard<std::mutex> lock(pImpl_->mutex);
    const int check = libssh2_knownhost_checkp(
        pImpl_->hosts, host.c_str(), port, key.blob.data(), key.blob.size(), typeMask, nullptr);
    switch (check) {
        case LIBSSH2_KNOWNHOST_CHECK_MATCH:
            return okayVoid();
        case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
            return failVoid(
                ErrorKind::Connection, "Host key for " + name + " does not match known_hosts");
        case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
            return failVoid(ErrorKind::Connection, "Host " + name + " is not in known_hosts");
    }
    return failVoid(ErrorKind::Connection, "Known-hosts check failed for " + name);
}

Outcome<std::shared_ptr<HostKeyVerifier>> makeHostKeyVerifier(
    const SessionConfig& config, const std::filesystem::path& homeDir)
{
    using VerifierOutcome = Outcome<std::shared_ptr<HostKeyVerifier>>;

    if (config.hostKeyPolicy == HostKeyPolicy::AcceptAny) {
        if (!config.acceptUnknownHosts) {
            return fail<std::shared_ptr<HostKeyVerifier>>(
                ErrorKind::Config,
                "host_key_policy 'accept-any' requires accept_unknown_hosts to be true");
        }
        return VerifierOutcome::okay(std::make_shared<AcceptAnyHostKey>());
    }

    const std::filesystem::path path = config.knownHostsPath.empty()
        ? homeDir / ".ssh" / "known_hosts"
        : std::filesystem::path(config.knownHostsPath);
    auto pinned = PinnedKnownHosts::fromFile(path);
    if (pinned.isError()) {
        return VerifierOutcome::error(pinned.errorValue());
    }
    return VerifierOutcome::okay(pinned.value());
}

} // namespace Session
} // namespace BjornManager
