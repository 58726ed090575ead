#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace BjornManager {

// What the discovery engine does when every endpoint of a device has gone stale.
// Keep marks the record stale and leaves it listed; Remove deletes the record but keeps
// its alias so a returning device gets the same number.
enum class GonePolicy { Keep, Remove };

enum class HostKeyPolicy { AcceptAny, KnownHosts };

const char* toString(GonePolicy policy);
const char* toString(HostKeyPolicy policy);

struct DiscoveryConfig {
    std::string hostnamePrefix = "bjorn";
    std::vector<std::string> mdnsServiceTypes = { "_ssh._tcp", "_workstation._tcp" };
    int loginPort = 22;
    int webUiPort = 8000;
    std::string usbRange = "172.20.2.0/24";
    std::string bluetoothRange = "172.20.1.0/24";
    bool scanGatewaySubnet = true;
    int probeIntervalSeconds = 60;
    int probeTimeoutMs = 400;
    int probeWorkers = 24;
    int pollIntervalSeconds = 30;
    int pollTimeoutMs = 1500;
    int staleTimeoutSeconds = 90;
    int sweepIntervalSeconds = 5;
    std::vector<std::string> ignoredAddresses;
    GonePolicy gonePolicy = GonePolicy::Keep;
    bool strictNaming = true;
};

struct SessionConfig {
    std::string defaultUser = "bjorn";
    int port = 22;
    int connectTimeoutSeconds = 15;
    int commandTimeoutSeconds = 30;
    int keepaliveSeconds = 30;
    std::vector<std::string> keyNames = { "id_ed25519", "id_rsa", "id_ecdsa" };
    HostKeyPolicy hostKeyPolicy = HostKeyPolicy::KnownHosts;
    // AcceptAny (trust on first use) is refused unless this is set.
    bool acceptUnknownHosts = false;
    // Empty means ~/.ssh/known_hosts.
    std::string knownHostsPath;
};

struct InstallConfig {
    std::string remoteHome = "/home/bjorn";
    std::string remoteScriptName = "install_bjorn.sh";
    std::string assetsDir = "assets";
    std::string packagesArchive = "bjorn_packages.tar.gz";
    std::string debugBundle = "Bjorn.zip";
    int failureContextLines = 20;
    int progressTimeoutSeconds = 600;
    std::string serviceUnit = "bjorn.service";
};

struct ManagerConfig {
    DiscoveryConfig discovery;
    SessionConfig session;
    InstallConfig install;
};

// Strict: unknown fields throw std::runtime_error. Omitted fields keep their defaults.
void from_json(const nlohmann::json& j, DiscoveryConfig& config);
void to_json(nlohmann::json& j, const DiscoveryConfig& config);
void from_json(const nlohmann::json& j, SessionConfig& config);
void to_json(nlohmann::json& j, const SessionConfig& config);
void from_json(const nlohmann::json& j, InstallConfig& config);
void to_json(nlohmann::json& j, const InstallConfig& config);
void from_json(const nlohmann::json& j, ManagerConfig& config);
void to_json(nlohmann::json& j, const ManagerConfig& config);

} // namespace BjornManager
