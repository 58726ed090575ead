#include "installer/InstallOptions.h"
#include "core/JsonStrict.h"
#include "core/ShellQuote.h"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace BjornManager {
namespace Installer {

const char* toString(InstallMode mode)
{
    switch (mode) {
        case InstallMode::Online:
            return "online";
        case InstallMode::Local:
            return "local";
        case InstallMode::Debug:
            return "debug";
    }
    return "online";
}

std::optional<InstallMode> installModeFromString(const std::string& text)
{
    if (text == "online") {
        return InstallMode::Online;
    }
    if (text == "local") {
        return InstallMode::Local;
    }
    if (text == "debug") {
        return InstallMode::Debug;
    }
    return std::nullopt;
}

const char* modeFlag(InstallMode mode)
{
    switch (mode) {
        case InstallMode::Online:
            return "-online";
        case InstallMode::Local:
            return "-local";
        case InstallMode::Debug:
            return "-debug";
    }
    return "-online";
}

const std::vector<std::string>& displayDrivers()
{
    static const std::vector<std::string> drivers = {
        "epd2in13", "epd2in13_V2", "epd2in13_V3", "epd2in13_V4", "epd2in7",
    };
    return drivers;
}

bool isKnownDisplayDriver(const std::string& driver)
{
    const auto& drivers = displayDrivers();
    return std::find(drivers.begin(), drivers.end(), driver) != drivers.end();
}

Outcome<std::string> displayDriverFromChoice(int choice)
{
    const auto& drivers = displayDrivers();
    if (choice < 1 || choice > static_cast<int>(drivers.size())) {
        return fail<std::string>(
            ErrorKind::Validation,
            "Display choice must be 1.." + std::to_string(drivers.size()) + ", got "
                + std::to_string(choice));
    }
    return Outcome<std::string>::okay(drivers[choice - 1]);
}

bool isValidMacAddress(const std::string& text)
{
    if (text.size() != 17) {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i % 3 == 2) {
            if (text[i] != ':') {
                return false;
            }
        }
        else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

void from_json(const nlohmann::json& j, InstallOptions& options)
{
    JsonStrict::requireObject(
        j,
        "InstallOptions",
        { "display_driver",
          "epd_choice",
          "manual_mode",
          "webui_auth",
          "webui_password",
          "bluetooth_mac",
          "git_branch",
          "mode",
          "reboot_after",
          "custom_script",
          "package_archive",
          "debug_bundle" });

    options = InstallOptions{};
    if (j.contains("display_driver") && j.contains("epd_choice")) {
        throw std::runtime_error("InstallOptions takes display_driver or epd_choice, not both");
    }
    JsonStrict::readOptional(j, "display_driver", options.displayDriver);
    if (j.contains("epd_choice")) {
        auto driver = displayDriverFromChoice(j.at("epd_choice").get<int>());
        if (driver.isError()) {
            throw std::runtime_error(driver.errorValue().message);
        }
        options.displayDriver = driver.value();
    }
    JsonStrict::readOptional(j, "manual_mode", options.manualMode);
    JsonStrict::readOptional(j, "webui_auth", options.webUiAuth);
    JsonStrict::readOptional(j, "webui_password", options.webUiPassword);
    JsonStrict::readOptional(j, "bluetooth_mac", options.bluetoothMac);
    JsonStrict::readOptional(j, "git_branch", options.gitBranch);
    if (j.contains("mode")) {
        const auto text = j.at("mode").get<std::string>();
        const auto mode = installModeFromString(text);
        if (!mode.has_value()) {
            throw std::runtime_error(
                "mode must be 'online', 'local' or 'debug', got '" + text + "'");
        }
        options.mode = mode.value();
    }
    JsonStrict::readOptional(j, "reboot_after", options.rebootAfter);
    JsonStrict::readOptional(j, "custom_script", options.customScript);
    JsonStrict::readOptional(j, "package_archive", options.packageArchive);
    JsonStrict::readOptional(j, "debug_bundle", options.debugBundle);
}

void to_json(nlohmann::json& j, const InstallOptions& options)
{
    // The password is never written back out.
    j = nlohmann::json{
        { "display_driver", options.displayDriver },
        { "manual_mode", options.manualMode },
        { "webui_auth", options.webUiAuth },
        { "bluetooth_mac", options.bluetoothMac },
        { "git_branch", options.gitBranch },
        { "mode", toString(options.mode) },
        { "reboot_after", options.rebootAfter },
    };
    if (!options.customScript.empty()) {
        j["custom_script"] = options.customScript;
    }
    if (!options.packageArchive.empty()) {
        j["package_archive"] = options.packageArchive;
    }
    if (!options.debugBundle.empty()) {
        j["debug_bundle"] = options.debugBundle;
    }
}

VoidOutcome validateOptions(const InstallOptions& options)
{
    if (!isKnownDisplayDriver(options.displayDriver)) {
        return failVoid(
            ErrorKind::Validation, "Unknown display driver '" + options.displayDriver + "'");
    }
    if (!isValidMacAddress(options.bluetoothMac)) {
        return failVoid(
            ErrorKind::Validation,
            "Bluetooth address '" + options.bluetoothMac
                + "' is not of the form AA:BB:CC:DD:EE:FF");
    }
    if (options.gitBranch.empty()
        || std::any_of(options.gitBranch.begin(), options.gitBranch.end(), [](char ch) {
               return std::isspace(static_cast<unsigned char>(ch));
           })) {
        return failVoid(ErrorKind::Validation, "Git branch must be a single non-empty word");
    }
    if (options.webUiAuth && options.webUiPassword.empty()) {
        return failVoid(ErrorKind::Validation, "Web UI authentication needs a password");
    }
    return okayVoid();
}

std::vector<std::pair<std::string, std::string>> installEnvironment(const InstallOptions& options)
{
    const std::string webUiPassword = options.webUiAuth ? options.webUiPassword : "";
    return {
        { "NON_INTERACTIVE", "1" },
        { "EPD_VERSION", options.displayDriver },
        { "MANUAL_MODE", options.manualMode ? "True" : "False" },
        { "enable_auth", options.webUiAuth ? "y" : "n" },
        { "WEBUI_PASSWORD", webUiPassword },
        { "WEBUI_PASSWORD_CONFIRM", webUiPassword },
        { "BLUETOOTH_MAC_ADDRESS", options.bluetoothMac },
        { "GIT_BRANCH", options.gitBranch },
    };
}

std::string buildInstallCommand(const InstallOptions& options, const std::string& remoteScript)
{
    std::string command = "sudo -S";
    for (const auto& [name, value] : installEnvironment(options)) {
        command += " " + name + "=" + shellEscapeArg(value);
    }
    command += " bash " + shellEscapeArg(remoteScript) + " " + modeFlag(options.mode);
    return command;
}

} // namespace Installer
} // namespace BjornManager
