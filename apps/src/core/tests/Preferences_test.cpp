#include "core/Preferences.h"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <unistd.h>

using namespace BjornManager;

namespace {

std::filesystem::path makeTempDir(const std::string& prefix)
{
    const auto base = std::filesystem::temp_directory_path();
    for (int attempt = 0; attempt < 100; ++attempt) {
        const auto candidate = base / (prefix + std::to_string(::getpid()) + "_"
                                       + std::to_string(attempt));
        if (std::filesystem::create_directory(candidate)) {
            return candidate;
        }
    }
    return base / prefix;
}

} // namespace

TEST(PreferencesTest, MissingFileYieldsDefaults)
{
    const auto dir = makeTempDir("bjorn_prefs_");
    PreferencesStore store(dir / "preferences.json");

    auto result = store.load();
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().language, "en");
    EXPECT_FALSE(result.value().defaultKeyPath.has_value());

    std::filesystem::remove_all(dir);
}

TEST(PreferencesTest, SavedPreferencesLoadBack)
{
    const auto dir = makeTempDir("bjorn_prefs_");
    PreferencesStore store(dir / "nested" / "preferences.json");

    Preferences preferences;
    preferences.language = "fr";
    preferences.defaultKeyPath = "~/.ssh/bjorn_key";
    ASSERT_TRUE(store.save(preferences).isValue());

    auto result = store.load();
    ASSERT_TRUE(result.isValue());
    EXPECT_EQ(result.value().language, "fr");
    ASSERT_TRUE(result.value().defaultKeyPath.has_value());
    EXPECT_EQ(result.value().defaultKeyPath.value(), "~/.ssh/bjorn_key");

    std::filesystem::remove_all(dir);
}

TEST(PreferencesTest, UnknownFieldIsConfigError)
{
    const auto dir = makeTempDir("bjorn_prefs_");
    {
        std::ofstream file(dir / "preferences.json");
        file << R"({"language": "en", "theme": "dark"})";
    }
    PreferencesStore store(dir / "preferences.json");

    auto result = store.load();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.errorValue().kind, ErrorKind::Config);

    std::filesystem::remove_all(dir);
}
