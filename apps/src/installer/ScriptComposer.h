#pragma once

#include "installer/InstallOptions.h"
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <vector>

namespace BjornManager {
namespace Installer {

struct SystemToggles {
    bool enableSpi = true;
    bool enableI2c = true;
    bool enableBluetooth = true;
    bool enableUsbGadget = true;
    bool configureWifi = true;
    bool setLimits = true;
};

struct UserSnippet {
    std::string name;
    std::string code;
};

struct ComposerConfig {
    std::string displayDriver = kDefaultDisplayDriver;
    bool manualMode = true;
    std::string bluetoothMac = kDefaultBluetoothMac;
    bool webUiAuth = false;
    std::string webUiPassword;
    std::string gitBranch = kDefaultGitBranch;
    std::vector<std::string> aptPackages;
    std::vector<std::string> pipPackages;
    // Whitespace separated, as typed by the operator.
    std::string extraApt;
    std::string extraPip;
    SystemToggles system;
    std::vector<UserSnippet> snippets;
    // Shown in the script header.
    std::string label;
};

void from_json(const nlohmann::json& j, SystemToggles& toggles);
void from_json(const nlohmann::json& j, UserSnippet& snippet);
void from_json(const nlohmann::json& j, ComposerConfig& config);

// Steps announced before the user snippets.
inline constexpr int kFixedSteps = 8;

int totalSteps(const ComposerConfig& config);

// Characters outside [A-Za-z0-9_-. ] become '_'; blank names become "snippet".
std::string sanitizeSnippetName(const std::string& name);

std::vector<std::string> splitPackages(const std::string& text);

// Deterministic: the same config always yields the same text.
std::string composeScript(const ComposerConfig& config);

} // namespace Installer
} // namespace BjornManager
