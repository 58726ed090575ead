#include "core/ManagerConfig.h"
#include "core/JsonStrict.h"
#include <stdexcept>

namespace BjornManager {

namespace {

GonePolicy gonePolicyFromString(const std::string& text)
{
    if (text == "keep") {
        return GonePolicy::Keep;
    }
    if (text == "remove") {
        return GonePolicy::Remove;
    }
    throw std::runtime_error("gone_policy must be 'keep' or 'remove', got '" + text + "'");
}

HostKeyPolicy hostKeyPolicyFromString(const std::string& text)
{
    if (text == "accept-any") {
        return HostKeyPolicy::AcceptAny;
    }
    if (text == "known-hosts") {
        return HostKeyPolicy::KnownHosts;
    }
    throw std::runtime_error(
        "host_key_policy must be 'accept-any' or 'known-hosts', got '" + text + "'");
}

void requirePositive(int value, const char* name)
{
    if (value <= 0) {
        throw std::runtime_error(std::string(name) + " must be positive");
    }
}

} // namespace

const char* toString(GonePolicy policy)
{
    return policy == GonePolicy::Keep ? "keep" : "remove";
}

const char* toString(HostKeyPolicy policy)
{
    return policy == HostKeyPolicy::AcceptAny ? "accept-any" : "known-hosts";
}

void from_json(const nlohmann::json& j, DiscoveryConfig& config)
{
    JsonStrict::requireObject(
        j,
        "DiscoveryConfig",
        { "hostname_prefix",
          "mdns_service_types",
          "login_port",
          "web_ui_port",
          "usb_range",
          "bluetooth_range",
          "scan_gateway_subnet",
          "probe_interval_seconds",
          "probe_timeout_ms",
          "probe_workers",
          "poll_interval_seconds",
          "poll_timeout_ms",
          "stale_timeout_seconds",
          "sweep_interval_seconds",
          "ignored_addresses",
          "gone_policy",
          "strict_naming" });

    config = DiscoveryConfig{};
    JsonStrict::readOptional(j, "hostname_prefix", config.hostnamePrefix);
    JsonStrict::readOptional(j, "mdns_service_types", config.mdnsServiceTypes);
    JsonStrict::readOptional(j, "login_port", config.loginPort);
    JsonStrict::readOptional(j, "web_ui_port", config.webUiPort);
    JsonStrict::readOptional(j, "usb_range", config.usbRange);
    JsonStrict::readOptional(j, "bluetooth_range", config.bluetoothRange);
    JsonStrict::readOptional(j, "scan_gateway_subnet", config.scanGatewaySubnet);
    JsonStrict::readOptional(j, "probe_interval_seconds", config.probeIntervalSeconds);
    JsonStrict::readOptional(j, "probe_timeout_ms", config.probeTimeoutMs);
    JsonStrict::readOptional(j, "probe_workers", config.probeWorkers);
    JsonStrict::readOptional(j, "poll_interval_seconds", config.pollIntervalSeconds);
    JsonStrict::readOptional(j, "poll_timeout_ms", config.pollTimeoutMs);
    JsonStrict::readOptional(j, "stale_timeout_seconds", config.staleTimeoutSeconds);
    JsonStrict::readOptional(j, "sweep_interval_seconds", config.sweepIntervalSeconds);
    JsonStrict::readOptional(j, "ignored_addresses", config.ignoredAddresses);
    JsonStrict::readOptional(j, "strict_naming", config.strictNaming);

    std::string gonePolicy = toString(config.gonePolicy);
    JsonStrict::readOptional(j, "gone_policy", gonePolicy);
    config.gonePolicy = gonePolicyFromString(gonePolicy);

    if (config.hostnamePrefix.empty()) {
        throw std::runtime_error("hostname_prefix must not be empty");
    }
    requirePositive(config.probeWorkers, "probe_workers");
    requirePositive(config.probeIntervalSeconds, "probe_interval_seconds");
    requirePositive(config.pollIntervalSeconds, "poll_interval_seconds");
    requirePositive(config.staleTimeoutSeconds, "stale_timeout_seconds");
    requirePositive(config.sweepIntervalSeconds, "sweep_interval_seconds");
}

void to_json(nlohmann::json& j, const DiscoveryConfig& config)
{
    j = nlohmann::json{
        { "hostname_prefix", config.hostnamePrefix },
        { "mdns_service_types", config.mdnsServiceTypes },
        { "login_port", config.loginPort },
        { "web_ui_port", config.webUiPort },
        { "usb_range", config.usbRange },
        { "bluetooth_range", config.bluetoothRange },
        { "scan_gateway_subnet", config.scanGatewaySubnet },
        { "probe_interval_seconds", config.probeIntervalSeconds },
        { "probe_timeout_ms", config.probeTimeoutMs },
        { "probe_workers", config.probeWorkers },
        { "poll_interval_seconds", config.pollIntervalSeconds },
        { "poll_timeout_ms", config.pollTimeoutMs },
        { "stale_timeout_seconds", config.staleTimeoutSeconds },
        { "sweep_interval_seconds", config.sweepIntervalSeconds },
        { "ignored_addresses", config.ignoredAddresses },
        { "gone_policy", toString(config.gonePolicy) },
        { "strict_naming", config.strictNaming },
    };
}

void from_json(const nlohmann::json& j, SessionConfig& config)
{
    JsonStrict::requireObject(
        j,
        "SessionConfig",
        { "default_user",
          "port",
          "connect_timeout_seconds",
          "command_timeout_seconds",
          "keepalive_seconds",
          "key_names",
          "host_key_policy",
          "accept_unknown_hosts",
          "known_hosts_path" });

    config = SessionConfig{};
    JsonStrict::readOptional(j, "default_user", config.defaultUser);
    JsonStrict::readOptional(j, "port", config.port);
    JsonStrict::readOptional(j, "connect_timeout_seconds", config.connectTimeoutSeconds);
    JsonStrict::readOptional(j, "command_timeout_seconds", config.commandTimeoutSeconds);
    JsonStrict::readOptional(j, "keepalive_seconds", config.keepaliveSeconds);
    JsonStrict::readOptional(j, "key_names", config.keyNames);
    JsonStrict::readOptional(j, "accept_unknown_hosts", config.acceptUnknownHosts);
    JsonStrict::readOptional(j, "known_hosts_path", config.knownHostsPath);

    std::string policy = toString(config.hostKeyPolicy);
    JsonStrict::readOptional(j, "host_key_policy", policy);
    config.hostKeyPolicy = hostKeyPolicyFromString(policy);

    requirePositive(config.port, "port");
    requirePositive(config.connectTimeoutSeconds, "connect_timeout_seconds");
    requirePositive(config.commandTimeoutSeconds, "command_timeout_seconds");
}

void to_json(nlohmann::json& j, const SessionConfig& config)
{
    j = nlohmann::json{
        { "default_user", config.defaultUser },
        { "port", config.port },
        { "connect_timeout_seconds", config.connectTimeoutSeconds },
        { "command_timeout_seconds", config.commandTimeoutSeconds },
        { "keepalive_seconds", config.keepaliveSeconds },
        { "key_names", config.keyNames },
        { "host_key_policy", toString(config.hostKeyPolicy) },
        { "accept_unknown_hosts", config.acceptUnknownHosts },
        { "known_hosts_path", config.knownHostsPath },
    };
}

void from_json(const nlohmann::json& j, InstallConfig& config)
{
    JsonStrict::requireObject(
        j,
        "InstallConfig",
        { "remote_home",
          "remote_script_name",
          "assets_dir",
          "packages_archive",
          "debug_bundle",
          "failure_context_lines",
          "progress_timeout_seconds",
          "service_unit" });

    config = InstallConfig{};
    JsonStrict::readOptional(j, "remote_home", config.remoteHome);
    JsonStrict::readOptional(j, "remote_script_name", config.remoteScriptName);
    JsonStrict::readOptional(j, "assets_dir", config.assetsDir);
    JsonStrict::readOptional(j, "packages_archive", config.packagesArchive);
    JsonStrict::readOptional(j, "debug_bundle", config.debugBundle);
    JsonStrict::readOptional(j, "failure_context_lines", config.failureContextLines);
    JsonStrict::readOptional(j, "progress_timeout_seconds", config.progressTimeoutSeconds);
    JsonStrict::readOptional(j, "service_unit", config.serviceUnit);

    requirePositive(config.failureContextLines, "failure_context_lines");
    requirePositive(config.progressTimeoutSeconds, "progress_timeout_seconds");
}

void to_json(nlohmann::json& j, const InstallConfig& config)
{
    j = nlohmann::json{
        { "remote_home", config.remoteHome },
        { "remote_script_name", config.remoteScriptName },
        { "assets_dir", config.assetsDir },
        { "packages_archive", config.packagesArchive },
        { "debug_bundle", config.debugBundle },
        { "failure_context_lines", config.failureContextLines },
        { "progress_timeout_seconds", config.progressTimeoutSeconds },
        { "service_unit", config.serviceUnit },
    };
}

void from_json(const nlohmann::json& j, ManagerConfig& config)
{
    JsonStrict::requireObject(j, "ManagerConfig", { "discovery", "session", "install" });

    config = ManagerConfig{};
    JsonStrict::readOptional(j, "discovery", config.discovery);
    JsonStrict::readOptional(j, "session", config.session);
    JsonStrict::readOptional(j, "install", config.install);
}

void to_json(nlohmann::json& j, const ManagerConfig& config)
{
    j = nlohmann::json{
        { "discovery", config.discovery },
        { "session", config.session },
        { "install", config.install },
    };
}

} // namespace BjornManager
