#include "installer/ScriptComposer.h"
#include "core/JsonStrict.h"
#include "core/ShellQuote.h"
#include <cctype>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace BjornManager {
namespace Installer {

namespace {

constexpr const char* kBjornRepository = "https://github.com/infinition/Bjorn.git";

std::string quotedList(const std::vector<std::string>& items)
{
    std::string out;
    for (const auto& item : items) {
        if (item.empty()) {
            continue;
        }
        if (!out.empty()) {
            out.push_back(' ');
        }
        out += shellEscapeArg(item);
    }
    return out;
}

std::string singleLine(const std::string& text)
{
    std::string out;
    for (const char ch : text) {
        out.push_back(ch == '\n' || ch == '\r' ? ' ' : ch);
    }
    return out;
}

// A heredoc terminator that no line of the body can end early.
std::string uniqueDelimiter(const std::string& base, const std::string& body)
{
    std::string delimiter = base;
    while (true) {
        bool clash = false;
        std::istringstream lines(body);
        std::string line;
        while (std::getline(lines, line)) {
            if (line == delimiter) {
                clash = true;
                break;
            }
        }
        if (!clash) {
            return delimiter;
        }
        delimiter += "_X";
    }
}

void writePreamble(std::ostream& out, const ComposerConfig& config)
{
    out << "#!/bin/bash\n"
        << "# Bjorn custom installer, composed by bjorn-manager.\n";
    if (!config.label.empty()) {
        out << "# Label: " << singleLine(config.label) << "\n";
    }
    out << "export LANG=C.UTF-8\n"
        << "export LC_ALL=C.UTF-8\n"
        << "\n"
        << "SCRIPT_DIR=\"$(cd \"$(dirname \"${BASH_SOURCE[0]}\")\" && pwd)\"\n"
        << "LIB_DIR=\"$SCRIPT_DIR/lib\"\n"
        << "if [ -d \"$LIB_DIR\" ]; then\n"
        << "    for module in \"$LIB_DIR\"/*.sh; do\n"
        << "        . \"$module\"\n"
        << "    done\n"
        << "fi\n"
        << "\n"
        << "# Stand-ins for when lib/ is not on the device.\n"
        << ": \"${LOG_FILE:=/var/log/bjorn_custom_install.log}\"\n"
        << "mkdir -p \"$(dirname \"$LOG_FILE\")\"\n"
        << "if ! type log >/dev/null 2>&1; then\n"
        << "    log() { echo \"[$1] $2\" | tee -a \"$LOG_FILE\"; }\n"
        << "fi\n"
        << "if ! type pip_install >/dev/null 2>&1; then\n"
        << "    pip_install() {\n"
        << "        pip3 install --break-system-packages \"$@\" >> \"$LOG_FILE\" 2>&1 \\\n"
        << "            || pip3 install \"$@\" >> \"$LOG_FILE\" 2>&1\n"
        << "    }\n"
        << "fi\n"
        << "\n"
        << "TOTAL_STEPS=" << totalSteps(config) << "\n"
        << "announce_step() {\n"
        << "    echo \"Step $1 of $TOTAL_STEPS: $2\"\n"
        << "    log \"INFO\" \"Step $1/$TOTAL_STEPS: $2\"\n"
        << "}\n"
        << "\n";
}

void writeVariables(std::ostream& out, const ComposerConfig& config)
{
    const std::string password = config.webUiAuth ? config.webUiPassword : "";
    out << "EPD_VERSION=" << shellEscapeArg(config.displayDriver) << "\n"
        << "MANUAL_MODE=" << (config.manualMode ? "True" : "False") << "\n"
        << "BLUETOOTH_MAC_ADDRESS=" << shellEscapeArg(config.bluetoothMac) << "\n"
        << "WEBUI_AUTH=" << (config.webUiAuth ? "true" : "false") << "\n"
        << "WEBUI_PASSWORD=" << shellEscapeArg(password) << "\n"
        << "WEBUI_PASSWORD_JSON=" << shellEscapeArg(nlohmann::json(password).dump()) << "\n"
        << "GIT_BRANCH=" << shellEscapeArg(config.gitBranch) << "\n"
        << "NON_INTERACTIVE=1\n"
        << "\n"
        << "APT_PACKAGES=(" << quotedList(config.aptPackages) << ")\n"
        << "PIP_PACKAGES=(" << quotedList(config.pipPackages) << ")\n"
        << "EXTRA_APT_PACKAGES=(" << quotedList(splitPackages(config.extraApt)) << ")\n"
        << "EXTRA_PIP_PACKAGES=(" << quotedList(splitPackages(config.extraPip)) << ")\n"
        << "\n"
        << "log \"INFO\" \"Custom installation started\"\n"
        << "\n";
}

void writeAptLoop(std::ostream& out, const char* arrayName)
{
    out << "for pkg in \"${" << arrayName << "[@]}\"; do\n"
        << "    log \"INFO\" \"Installing $pkg\"\n"
        << "    apt-get install -y \"$pkg\" 2>&1 | tee -a \"$LOG_FILE\" \\\n"
        << "        || log \"ERROR\" \"Failed to install $pkg\"\n"
        << "done\n";
}

void writePipLoop(std::ostream& out, const char* arrayName)
{
    out << "for pkg in \"${" << arrayName << "[@]}\"; do\n"
        << "    log \"INFO\" \"Installing $pkg\"\n"
        << "    pip_install \"$pkg\" || log \"ERROR\" \"Failed to install $pkg\"\n"
        << "done\n";
}

void writeSystemToggles(std::ostream& out, const SystemToggles& toggles)
{
    bool any = false;
    if (toggles.enableSpi) {
        any = true;
        out << "log \"INFO\" \"Enabling SPI\"\n"
            << "raspi-config nonint do_spi 0 >> \"$LOG_FILE\" 2>&1"
            << " || log \"WARNING\" \"raspi-config SPI failed\"\n";
    }
    if (toggles.enableI2c) {
        any = true;
        out << "log \"INFO\" \"Enabling I2C\"\n"
            << "raspi-config nonint do_i2c 0 >> \"$LOG_FILE\" 2>&1"
            << " || log \"WARNING\" \"raspi-config I2C failed\"\n";
    }
    if (toggles.enableBluetooth) {
        any = true;
        out << "log \"INFO\" \"Enabling Bluetooth\"\n"
            << "systemctl enable bluetooth >> \"$LOG_FILE\" 2>&1 || true\n"
            << "systemctl start bluetooth >> \"$LOG_FILE\" 2>&1 || true\n";
    }
    if (toggles.enableUsbGadget) {
        any = true;
        out << "log \"INFO\" \"Configuring USB gadget\"\n"
            << "grep -q '^dtoverlay=dwc2' /boot/firmware/config.txt"
            << " || echo 'dtoverlay=dwc2' >> /boot/firmware/config.txt\n"
            << "grep -q 'modules-load=dwc2,g_ether' /boot/firmware/cmdline.txt"
            << " || sed -i 's/rootwait/& modules-load=dwc2,g_ether/' /boot/firmware/cmdline.txt\n";
    }
    if (toggles.configureWifi) {
        any = true;
        out << "log \"INFO\" \"Applying preconfigured WiFi connection if present\"\n"
            << "WIFI_PROFILE=/etc/NetworkManager/system-connections/preconfigured.nmconnection\n"
            << "if [ -f \"$WIFI_PROFILE\" ]; then\n"
            << "    chmod 600 \"$WIFI_PROFILE\"\n"
            << "    nmcli connection reload >> \"$LOG_FILE\" 2>&1"
            << " || log \"WARNING\" \"nmcli reload failed\"\n"
            << "fi\n";
    }
    if (toggles.setLimits) {
        any = true;
        out << "log \"INFO\" \"Raising open file limits\"\n"
            << "grep -q '^\\* soft nofile 65535' /etc/security/limits.conf"
            << " || echo '* soft nofile 65535' >> /etc/security/limits.conf\n"
            << "grep -q '^\\* hard nofile 65535' /etc/security/limits.conf"
            << " || echo '* hard nofile 65535' >> /etc/security/limits.conf\n";
    }
    if (!any) {
        out << "log \"INFO\" \"No system configuration selected\"\n";
    }
}

void writeFixedSteps(std::ostream& out, const ComposerConfig& config)
{
    out << "announce_step 1 \"Updating package list\"\n"
        << "apt-get update 2>&1 | tee -a \"$LOG_FILE\" || log \"ERROR\" \"apt-get update failed\"\n"
        << "\n"
        << "announce_step 2 \"Installing base APT packages\"\n";
    writeAptLoop(out, "APT_PACKAGES");
    out << "\n"
        << "announce_step 3 \"Installing extra APT packages\"\n";
    writeAptLoop(out, "EXTRA_APT_PACKAGES");
    out << "\n"
        << "announce_step 4 \"Installing base PIP packages\"\n";
    writePipLoop(out, "PIP_PACKAGES");
    out << "\n"
        << "announce_step 5 \"Installing extra PIP packages\"\n";
    writePipLoop(out, "EXTRA_PIP_PACKAGES");
    out << "\n"
        << "announce_step 6 \"Applying system configuration\"\n";
    writeSystemToggles(out, config.system);
    out << "\n"
        << "announce_step 7 \"Setting up the Bjorn repository\"\n"
        << "cd /home/bjorn || exit 1\n"
        << "if [ ! -d Bjorn ]; then\n"
        << "    git clone -b \"$GIT_BRANCH\" " << kBjornRepository
        << " 2>&1 | tee -a \"$LOG_FILE\" \\\n"
        << "        || log \"ERROR\" \"Failed to clone repository\"\n"
        << "fi\n"
        << "cd Bjorn || exit 1\n"
        << R"(sed -i 's/"epd_type": "epd[^"]*"/"epd_type": "'"$EPD_VERSION"'"/' shared.py)"
        << " || true\n"
        << R"(sed -i 's/"manual_mode": [A-Za-z]*/"manual_mode": '"$MANUAL_MODE"'/' shared.py)"
        << " || true\n"
        << "\n"
        << "if [ \"$WEBUI_AUTH\" = \"true\" ]; then\n"
        << "    announce_step 8 \"Configuring web UI authentication\"\n"
        << "    mkdir -p /home/bjorn/.settings_bjorn\n"
        << "    cat > /home/bjorn/.settings_bjorn/webapp.json << WEBAPP_EOF\n"
        << "{\n"
        << "    \"username\": \"bjorn\",\n"
        << "    \"password\": $WEBUI_PASSWORD_JSON,\n"
        << "    \"always_require_auth\": true\n"
        << "}\n"
        << "WEBAPP_EOF\n"
        << "else\n"
        << "    announce_step 8 \"Skipping web UI authentication\"\n"
        << "fi\n"
        << "\n"
        << "chown -R bjorn:bjorn /home/bjorn/Bjorn || true\n"
        << "chmod -R 755 /home/bjorn/Bjorn || true\n"
        << "\n"
        << "if type setup_services >/dev/null 2>&1; then\n"
        << "    setup_services\n"
        << "else\n"
        << "    cat > /etc/systemd/system/bjorn.service << UNIT_EOF\n"
        << "[Unit]\n"
        << "Description=Bjorn Service\n"
        << "After=network.target\n"
        << "\n"
        << "[Service]\n"
        << "ExecStart=/usr/bin/python3 /home/bjorn/Bjorn/Bjorn.py\n"
        << "WorkingDirectory=/home/bjorn/Bjorn\n"
        << "Restart=always\n"
        << "User=root\n"
        << "\n"
        << "[Install]\n"
        << "WantedBy=multi-user.target\n"
        << "UNIT_EOF\n"
        << "    systemctl daemon-reload\n"
        << "    systemctl enable bjorn.service\n"
        << "    systemctl start bjorn.service || log \"ERROR\" \"Failed to start bjorn.service\"\n"
        << "fi\n"
        << "\n";
}

void writeSnippets(std::ostream& out, const std::vector<UserSnippet>& snippets)
{
    if (snippets.empty()) {
        out << "announce_step " << kFixedSteps + 1 << " \"No user snippets provided\"\n"
            << "log \"INFO\" \"No user snippets to run\"\n"
            << "\n";
        return;
    }

    for (size_t i = 0; i < snippets.size(); ++i) {
        const int number = static_cast<int>(i) + 1;
        const std::string name = sanitizeSnippetName(snippets[i].name);
        std::string code = snippets[i].code;
        if (!code.empty() && code.back() != '\n') {
            code.push_back('\n');
        }
        const std::string delimiter =
            uniqueDelimiter("BJORN_SNIPPET_" + std::to_string(number), code);
        const std::string file = "/tmp/bjorn_user_snippet_" + std::to_string(number) + ".sh";

        out << "announce_step " << kFixedSteps + number << " \"Running user snippet: " << name
            << "\"\n"
            << "SNIPPET_FILE=" << file << "\n"
            << "cat > \"$SNIPPET_FILE\" << '" << delimiter << "'\n"
            << code << delimiter << "\n"
            << "if [ -s \"$SNIPPET_FILE\" ]; then\n"
            << "    bash \"$SNIPPET_FILE\" 2>&1 | tee -a \"$LOG_FILE\"\n"
            << "    if [ \"${PIPESTATUS[0]}\" -ne 0 ]; then\n"
            << "        log \"ERROR\" \"User snippet '" << name << "' returned non-zero\"\n"
            << "    else\n"
            << "        log \"INFO\" \"User snippet '" << name << "' completed\"\n"
            << "    fi\n"
            << "else\n"
            << "    log \"WARNING\" \"User snippet '" << name << "' is empty\"\n"
            << "fi\n"
            << "rm -f \"$SNIPPET_FILE\"\n"
            << "\n";
    }
}

} // namespace

void from_json(const nlohmann::json& j, SystemToggles& toggles)
{
    JsonStrict::requireObject(
        j,
        "SystemToggles",
        { "enable_spi",
          "enable_i2c",
          "enable_bluetooth",
          "enable_usb_gadget",
          "configure_wifi",
          "set_limits" });
    toggles = SystemToggles{};
    JsonStrict::readOptional(j, "enable_spi", toggles.enableSpi);
    JsonStrict::readOptional(j, "enable_i2c", toggles.enableI2c);
    JsonStrict::readOptional(j, "enable_bluetooth", toggles.enableBluetooth);
    JsonStrict::readOptional(j, "enable_usb_gadget", toggles.enableUsbGadget);
    JsonStrict::readOptional(j, "configure_wifi", toggles.configureWifi);
    JsonStrict::readOptional(j, "set_limits", toggles.setLimits);
}

void from_json(const nlohmann::json& j, UserSnippet& snippet)
{
    JsonStrict::requireObject(j, "UserSnippet", { "name", "code" });
    snippet = UserSnippet{};
    JsonStrict::readOptional(j, "name", snippet.name);
    JsonStrict::readRequired(j, "UserSnippet", "code", snippet.code);
}

void from_json(const nlohmann::json& j, ComposerConfig& config)
{
    JsonStrict::requireObject(
        j,
        "ComposerConfig",
        { "display_driver",
          "manual_mode",
          "bluetooth_mac",
          "webui_auth",
          "webui_password",
          "git_branch",
          "apt_packages",
          "pip_packages",
          "extra_apt",
          "extra_pip",
          "system",
          "snippets",
          "label" });

    config = ComposerConfig{};
    JsonStrict::readOptional(j, "display_driver", config.displayDriver);
    JsonStrict::readOptional(j, "manual_mode", config.manualMode);
    JsonStrict::readOptional(j, "bluetooth_mac", config.bluetoothMac);
    JsonStrict::readOptional(j, "webui_auth", config.webUiAuth);
    JsonStrict::readOptional(j, "webui_password", config.webUiPassword);
    JsonStrict::readOptional(j, "git_branch", config.gitBranch);
    JsonStrict::readOptional(j, "apt_packages", config.aptPackages);
    JsonStrict::readOptional(j, "pip_packages", config.pipPackages);
    JsonStrict::readOptional(j, "extra_apt", config.extraApt);
    JsonStrict::readOptional(j, "extra_pip", config.extraPip);
    JsonStrict::readOptional(j, "system", config.system);
    JsonStrict::readOptional(j, "snippets", config.snippets);
    JsonStrict::readOptional(j, "label", config.label);

    if (!isKnownDisplayDriver(config.displayDriver)) {
        throw std::runtime_error("Unknown display driver '" + config.displayDriver + "'");
    }
}

int totalSteps(const ComposerConfig& config)
{
    const int snippets = static_cast<int>(config.snippets.size());
    return kFixedSteps + (snippets > 0 ? snippets : 1);
}

std::string sanitizeSnippetName(const std::string& name)
{
    size_t begin = 0;
    size_t end = name.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(name[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(name[end - 1]))) {
        --end;
    }

    std::string out;
    bool inRun = false;
    for (size_t i = begin; i < end; ++i) {
        const char ch = name[i];
        const bool allowed = std::isalnum(static_cast<unsigned char>(ch)) || ch == '_'
            || ch == '-' || ch == '.' || ch == ' ';
        if (allowed) {
            out.push_back(ch);
            inRun = false;
        }
        else if (!inRun) {
            // A run of disallowed characters collapses to one underscore.
            out.push_back('_');
            inRun = true;
        }
    }
    return out.empty() ? "snippet" : out;
}

std::vector<std::string> splitPackages(const std::string& text)
{
    std::vector<std::string> packages;
    std::istringstream stream(text);
    std::string token;
    while (stream >> token) {
        packages.push_back(token);
    }
    return packages;
}

std::string composeScript(const ComposerConfig& config)
{
    std::ostringstream out;
    writePreamble(out, config);
    writeVariables(out, config);
    writeFixedSteps(out, config);
    out << "# User snippets\n";
    writeSnippets(out, config.snippets);
    out << "log \"SUCCESS\" \"Bjorn installation completed\"\n"
        << "echo \"Installation completed successfully\"\n"
        << "echo \"Web interface: http://[device-ip]:8000\"\n";
    return out.str();
}

} // namespace Installer
} // namespace BjornManager
