#include "installer/InstallOptions.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace BjornManager;
using namespace BjornManager::Installer;

TEST(InstallOptionsTest, DisplayChoicesMapToDrivers)
{
    EXPECT_EQ(displayDriverFromChoice(1).value(), "epd2in13");
    EXPECT_EQ(displayDriverFromChoice(4).value(), "epd2in13_V4");
    EXPECT_EQ(displayDriverFromChoice(5).value(), "epd2in7");
    EXPECT_EQ(displayDriverFromChoice(0).errorValue().kind, ErrorKind::Validation);
    EXPECT_TRUE(displayDriverFromChoice(6).isError());
}

TEST(InstallOptionsTest, ParsesKnownFieldsAndKeepsDefaults)
{
    const auto options = nlohmann::json::parse(R"({
        "epd_choice": 2,
        "manual_mode": false,
        "mode": "local",
        "git_branch": "dev"
    })")
                             .get<InstallOptions>();

    EXPECT_EQ(options.displayDriver, "epd2in13_V2");
    EXPECT_FALSE(options.manualMode);
    EXPECT_EQ(options.mode, InstallMode::Local);
    EXPECT_EQ(options.gitBranch, "dev");
    EXPECT_EQ(options.bluetoothMac, kDefaultBluetoothMac);
    EXPECT_FALSE(options.rebootAfter);
}

TEST(InstallOptionsTest, RejectsUnknownFieldsAndBadValues)
{
    EXPECT_THROW(
        nlohmann::json::parse(R"({"epdChoice": 2})").get<InstallOptions>(), std::runtime_error);
    EXPECT_THROW(
        nlohmann::json::parse(R"({"mode": "usb"})").get<InstallOptions>(), std::runtime_error);
    EXPECT_THROW(
        nlohmann::json::parse(R"({"epd_choice": 9})").get<InstallOptions>(), std::runtime_error);
    EXPECT_THROW(
        nlohmann::json::parse(R"({"epd_choice": 1, "display_driver": "epd2in7"})")
            .get<InstallOptions>(),
        std::runtime_error);
}

TEST(InstallOptionsTest, ValidationCatchesBadValues)
{
    InstallOptions options;
    EXPECT_TRUE(validateOptions(options).isValue());

    options.bluetoothMac = "60:57:C8:47:E3";
    EXPECT_EQ(validateOptions(options).errorValue().kind, ErrorKind::Validation);

    options = InstallOptions{};
    options.gitBranch = "main; rm -rf /";
    EXPECT_TRUE(validateOptions(options).isError());

    options = InstallOptions{};
    options.webUiAuth = true;
    EXPECT_TRUE(validateOptions(options).isError());
    options.webUiPassword = "hunter2";
    EXPECT_TRUE(validateOptions(options).isValue());
}

TEST(InstallOptionsTest, CommandQuotesEveryValue)
{
    InstallOptions options;
    options.displayDriver = "epd2in7";
    options.manualMode = false;
    options.webUiAuth = true;
    options.webUiPassword = "it's secret";
    options.mode = InstallMode::Debug;

    EXPECT_EQ(
        buildInstallCommand(options, "/home/bjorn/install_bjorn.sh"),
        "sudo -S NON_INTERACTIVE=1 EPD_VERSION=epd2in7 MANUAL_MODE=False enable_auth=y "
        "WEBUI_PASSWORD='it'\\''s secret' WEBUI_PASSWORD_CONFIRM='it'\\''s secret' "
        "BLUETOOTH_MAC_ADDRESS=60:57:C8:47:E3:88 GIT_BRANCH=main "
        "bash /home/bjorn/install_bjorn.sh -debug");
}

TEST(InstallOptionsTest, PasswordIsDroppedWhenAuthIsOff)
{
    InstallOptions options;
    options.webUiPassword = "unused";
    for (const auto& [name, value] : installEnvironment(options)) {
        if (name == "WEBUI_PASSWORD" || name == "WEBUI_PASSWORD_CONFIRM") {
            EXPECT_TRUE(value.empty());
        }
    }
}
