#include "core/ConfigLoader.h"
#include "core/ManagerConfig.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace BjornManager;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        testDir_ = std::filesystem::temp_directory_path() / "bjorn_config_loader_test";
        std::filesystem::remove_all(testDir_);
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override
    {
        std::filesystem::remove_all(testDir_);
        ConfigLoader::clearConfigDir();
    }

    void writeConfigFile(const std::string& filename, const std::string& content)
    {
        std::ofstream file(testDir_ / filename);
        file << content;
    }

    std::filesystem::path testDir_;
};

TEST_F(ConfigLoaderTest, LoadReturnsConfigErrorWhenFileNotFound)
{
    ConfigLoader::setConfigDir(testDir_.string());
    auto result = ConfigLoader::load<ManagerConfig>("nonexistent-bjorn-manager.json");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::Config);
    EXPECT_NE(result.errorValue().message.find("not found"), std::string::npos);
}

TEST_F(ConfigLoaderTest, LoadOrDefaultReturnsDefaultsWhenFileNotFound)
{
    ConfigLoader::setConfigDir(testDir_.string());
    auto result = ConfigLoader::loadOrDefault<ManagerConfig>("nonexistent-bjorn-manager.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().discovery.hostnamePrefix, "bjorn");
}

TEST_F(ConfigLoaderTest, LoadReturnsValueWhenFileExists)
{
    writeConfigFile("manager.json", R"({"discovery": {"hostname_prefix": "pager"}})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<ManagerConfig>("manager.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().discovery.hostnamePrefix, "pager");
}

TEST_F(ConfigLoaderTest, LocalFileTakesPrecedenceOverBase)
{
    writeConfigFile("manager.json", R"({"session": {"default_user": "base"}})");
    writeConfigFile("manager.json.local", R"({"session": {"default_user": "local"}})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<ManagerConfig>("manager.json");
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().session.defaultUser, "local");
}

TEST_F(ConfigLoaderTest, FindConfigFileReturnsLocalPathWhenBothExist)
{
    writeConfigFile("manager.json", "{}");
    writeConfigFile("manager.json.local", "{}");
    ConfigLoader::setConfigDir(testDir_.string());

    auto path = ConfigLoader::findConfigFile("manager.json");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path.value(), testDir_ / "manager.json.local");
}

TEST_F(ConfigLoaderTest, InvalidJsonReturnsError)
{
    writeConfigFile("manager.json", "not valid json {{{");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<ManagerConfig>("manager.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().message.find("parse error"), std::string::npos);
}

TEST_F(ConfigLoaderTest, EmptyFileReturnsError)
{
    writeConfigFile("manager.json", "");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<ManagerConfig>("manager.json");
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.errorValue().message.find("file is empty"), std::string::npos);
}

TEST_F(ConfigLoaderTest, UnknownFieldIsRejected)
{
    writeConfigFile("manager.json", R"({"discovery": {"hostname_prefx": "bjorn"}})");
    ConfigLoader::setConfigDir(testDir_.string());

    auto result = ConfigLoader::load<ManagerConfig>("manager.json");
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::Config);
    EXPECT_NE(result.errorValue().message.find("hostname_prefx"), std::string::npos);
}
