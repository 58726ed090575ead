#pragma once

#include "core/ManagerError.h"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace BjornManager {
namespace Installer {

enum class InstallMode { Online, Local, Debug };

const char* toString(InstallMode mode);
std::optional<InstallMode> installModeFromString(const std::string& text);

// Positional flag understood by install_bjorn.sh.
const char* modeFlag(InstallMode mode);

inline constexpr const char* kDefaultDisplayDriver = "epd2in13_V4";
inline constexpr const char* kDefaultBluetoothMac = "60:57:C8:47:E3:88";
inline constexpr const char* kDefaultGitBranch = "main";

// epd2in13, epd2in13_V2, epd2in13_V3, epd2in13_V4, epd2in7.
const std::vector<std::string>& displayDrivers();
bool isKnownDisplayDriver(const std::string& driver);

// The numbered menu of the stock installer: 1..5.
Outcome<std::string> displayDriverFromChoice(int choice);

bool isValidMacAddress(const std::string& text);

struct InstallOptions {
    std::string displayDriver = kDefaultDisplayDriver;
    // Manual mode keeps the device from running its actions on its own.
    bool manualMode = true;
    bool webUiAuth = false;
    std::string webUiPassword;
    std::string bluetoothMac = kDefaultBluetoothMac;
    std::string gitBranch = kDefaultGitBranch;
    InstallMode mode = InstallMode::Online;
    bool rebootAfter = false;

    // Local script run instead of the stock orchestrator; validated before upload.
    std::string customScript;
    // Overrides for the archives of local and debug mode. Empty means the assets directory.
    std::string packageArchive;
    std::string debugBundle;
};

// Strict: unknown fields throw. "epd_choice" (1..5) is accepted in place of "display_driver".
void from_json(const nlohmann::json& j, InstallOptions& options);
void to_json(nlohmann::json& j, const InstallOptions& options);

VoidOutcome validateOptions(const InstallOptions& options);

// Variables the remote entry point reads in non-interactive mode, in a fixed order.
std::vector<std::pair<std::string, std::string>> installEnvironment(const InstallOptions& options);

// sudo -S VAR=... bash <script> -<mode>, every value shell-quoted.
std::string buildInstallCommand(const InstallOptions& options, const std::string& remoteScript);

} // namespace Installer
} // namespace BjornManager
