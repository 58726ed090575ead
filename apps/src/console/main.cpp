#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/ManagerConfig.h"
#include "core/Preferences.h"
#include "discovery/AliasStore.h"
#include "discovery/DiscoveryEngine.h"
#include "events/EventRelay.h"
#include "installer/InstallOrchestrator.h"
#include "installer/RemoteAdministration.h"
#include "installer/ScriptComposer.h"
#include "installer/ScriptValidator.h"
#include "session/CommandStream.h"
#include "session/SessionManager.h"
#include <args.hxx>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

using namespace BjornManager;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFailed = 2;

std::atomic<bool> g_interrupted{ false };

void signalHandler(int)
{
    g_interrupted = true;
}

// Runs onInterrupt once when SIGINT/SIGTERM arrives; joined on destruction.
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::function<void()> onInterrupt)
        : onInterrupt_(std::move(onInterrupt)), thread_([this] { run(); })
    {}

    ~InterruptWatcher()
    {
        done_ = true;
        thread_.join();
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    void run()
    {
        while (!done_) {
            if (g_interrupted.exchange(false)) {
                SLOG_WARN("Interrupted, cancelling");
                onInterrupt_();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    std::function<void()> onInterrupt_;
    std::atomic<bool> done_{ false };
    std::thread thread_;
};

std::string buildCommandHelp()
{
    return "Commands:\n"
           "  discover                 Watch the network for devices (--duration)\n"
           "  install <host>           Run the install workflow on a device\n"
           "  compose <config.json>    Compose a custom install script (-o to write it)\n"
           "  logs <host>              Follow the service journal\n"
           "  restart <host>           Restart the Bjorn service\n"
           "  change-driver <host> <d> Switch the e-paper display driver\n"
           "  reboot <host>            Reboot the device\n"
           "\n"
           "Events are written to stdout as one JSON object per line; logs go to stderr.\n";
}

// Prints events as JSON lines. stop() before the relay goes out of scope.
void startEventPrinter(Events::EventRelay& relay)
{
    relay.markReady([](const Events::UiEvent& event) {
        std::cout << nlohmann::json(event).dump() << "\n" << std::flush;
    });
}

int runDiscover(const ManagerConfig& config, int durationSeconds)
{
    Events::EventRelay relay;
    startEventPrinter(relay);

    Discovery::AliasStore aliasStore(ConfigLoader::userConfigDir() / "aliases.json");
    auto deps = Discovery::DiscoveryEngine::defaultDependencies();
    deps.aliasStore = &aliasStore;
    // Seeds the alias registry from the store.
    Discovery::DiscoveryEngine engine(relay, std::move(deps));

    auto started = engine.start(config.discovery);
    if (started.isError()) {
        SLOG_ERROR("Discovery failed to start: {}", started.errorValue().message);
        relay.stop();
        return started.errorValue().kind == ErrorKind::Config ? kExitUsage : kExitFailed;
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(durationSeconds);
    while (!g_interrupted
           && (durationSeconds <= 0 || std::chrono::steady_clock::now() < deadline)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    engine.stop();
    relay.stop();
    SLOG_INFO("Discovery stopped with {} device(s) known", engine.snapshot().size());
    return kExitOk;
}

struct ConnectArgs {
    std::string host;
    Session::Credentials credentials;
};

// Connects the one device this invocation works on. Session events go to the relay.
std::shared_ptr<Session::RemoteSession> connectDevice(
    Session::SessionManager& sessions, const ConnectArgs& args)
{
    auto connected = sessions.connect(args.host, args.host, args.credentials);
    if (connected.isError()) {
        SLOG_ERROR(
            "Could not connect to {}: {} ({})",
            args.host,
            connected.errorValue().message,
            toString(connected.errorValue().kind));
        return nullptr;
    }
    return sessions.find(args.host);
}

int runInstall(
    const ManagerConfig& config,
    Session::SessionManager& sessions,
    Events::EventRelay& relay,
    const ConnectArgs& connectArgs,
    const Installer::InstallOptions& options)
{
    auto session = connectDevice(sessions, connectArgs);
    if (!session) {
        return kExitFailed;
    }

    Installer::InstallOrchestrator orchestrator(
        config.install,
        relay,
        std::make_shared<Installer::ScriptValidator>(
            std::make_shared<Installer::BashSyntaxChecker>()));

    Outcome<Installer::InstallJobSnapshot> result = fail<Installer::InstallJobSnapshot>(
        ErrorKind::Cancelled, "Install not started");
    {
        InterruptWatcher watcher([&] { orchestrator.cancel(connectArgs.host); });
        result = orchestrator.runInstall(*session, options);
    }
    sessions.disconnectAll();

    if (result.isError()) {
        SLOG_ERROR("Install refused: {}", result.errorValue().message);
        return kExitFailed;
    }
    const auto& job = result.value();
    SLOG_INFO(
        "Install on {} finished {} at step {}/{}",
        job.identity,
        toString(job.state),
        job.currentStepIndex,
        job.stepTotal);
    return job.state == JobState::Succeeded ? kExitOk : kExitFailed;
}

int runLogs(
    const InstallConfig& install, Session::SessionManager& sessions, const ConnectArgs& args)
{
    auto session = connectDevice(sessions, args);
    if (!session) {
        return kExitFailed;
    }

    auto opened = session->tailLog(install.serviceUnit);
    if (opened.isError()) {
        SLOG_ERROR("Could not follow {}: {}", install.serviceUnit, opened.errorValue().message);
        sessions.disconnectAll();
        return kExitFailed;
    }
    auto stream = opened.value();

    int exitCode = kExitOk;
    {
        InterruptWatcher watcher([stream] { stream->cancel(); });
        while (true) {
            auto line = stream->nextLine();
            if (line.isError()) {
                if (line.errorValue().kind != ErrorKind::Cancelled) {
                    SLOG_ERROR("Log stream ended: {}", line.errorValue().message);
                    exitCode = kExitFailed;
                }
                break;
            }
            if (!line.value().has_value()) {
                break;
            }
            std::cout << *line.value() << "\n" << std::flush;
        }
    }
    stream.reset();
    sessions.disconnectAll();
    return exitCode;
}

int runAdministration(
    const InstallConfig& install,
    Session::SessionManager& sessions,
    const ConnectArgs& args,
    const std::function<VoidOutcome(Installer::RemoteAdministration&)>& action)
{
    auto session = connectDevice(sessions, args);
    if (!session) {
        return kExitFailed;
    }
    Installer::RemoteAdministration admin(*session, install);
    auto result = action(admin);
    sessions.disconnectAll();
    if (result.isError()) {
        SLOG_ERROR("{} ({})", result.errorValue().message, toString(result.errorValue().kind));
        return result.errorValue().kind == ErrorKind::Validation ? kExitUsage : kExitFailed;
    }
    return kExitOk;
}

int runCompose(const std::string& configPath, const std::optional<std::string>& outputPath)
{
    Installer::ComposerConfig composerConfig;
    try {
        std::ifstream file(configPath);
        if (!file) {
            SLOG_ERROR("Cannot open {}", configPath);
            return kExitUsage;
        }
        composerConfig = nlohmann::json::parse(file).get<Installer::ComposerConfig>();
    }
    catch (const std::exception& e) {
        SLOG_ERROR("Invalid composer config {}: {}", configPath, e.what());
        return kExitUsage;
    }

    const std::string script = Installer::composeScript(composerConfig);
    Installer::ScriptValidator validator(std::make_shared<Installer::BashSyntaxChecker>());
    const auto validation = validator.validate(script);
    for (const auto& note : validation.notes) {
        SLOG_INFO("{}", note);
    }
    for (const auto& diagnostic : validation.diagnostics) {
        SLOG_ERROR("{}", diagnostic);
    }

    if (outputPath.has_value()) {
        std::ofstream out(*outputPath, std::ios::binary | std::ios::trunc);
        out << validation.text;
        if (!out) {
            SLOG_ERROR("Failed to write {}", *outputPath);
            return kExitFailed;
        }
        SLOG_INFO("Wrote {} ({} steps)", *outputPath, Installer::totalSteps(composerConfig));
    }
    else {
        std::cout << validation.text << std::flush;
    }
    return validation.ok() ? kExitOk : kExitFailed;
}

std::optional<Installer::InstallOptions> loadInstallOptions(const std::string& path)
{
    try {
        std::ifstream file(path);
        if (!file) {
            SLOG_ERROR("Cannot open {}", path);
            return std::nullopt;
        }
        return nlohmann::json::parse(file).get<Installer::InstallOptions>();
    }
    catch (const std::exception& e) {
        SLOG_ERROR("Invalid install options {}: {}", path, e.what());
        return std::nullopt;
    }
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Bjorn Manager",
        "Discover, install and administer Bjorn devices.\n\n" + buildCommandHelp());
    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<std::string> configDir(
        parser, "dir", "Directory searched first for manager.json", { "config-dir" });
    args::ValueFlag<std::string> logConfig(
        parser,
        "log-config",
        "Path to logging config JSON file (default: logging-config.json)",
        { "log-config" },
        "logging-config.json");
    args::ValueFlag<std::string> logChannels(
        parser,
        "channels",
        "Override log channels (e.g., session:debug,*:info)",
        { 'C', "channels" });
    args::ValueFlag<std::string> user(
        parser, "user", "Login user (default from config)", { 'u', "user" });
    args::ValueFlag<std::string> password(
        parser, "password", "Login password (or BJORN_PASSWORD)", { 'p', "password" });
    args::ValueFlag<std::string> sudoPassword(
        parser, "sudo-password", "sudo password when it differs from login", { "sudo-password" });
    args::ValueFlag<std::string> keyPath(parser, "key", "Private key to try", { 'k', "key" });
    args::ValueFlag<std::string> keyPassphrase(
        parser,
        "key-passphrase",
        "Passphrase of the private key (or BJORN_KEY_PASSPHRASE)",
        { "key-passphrase" });
    args::ValueFlag<std::string> optionsFile(
        parser, "options", "Install: JSON file with install options", { "options" });
    args::ValueFlag<std::string> mode(
        parser, "mode", "Install: online, local or debug", { "mode" });
    args::ValueFlag<std::string> script(
        parser, "script", "Install: run this script instead of the stock one", { "script" });
    args::Flag rebootAfter(parser, "reboot", "Install: reboot after success", { "reboot" });
    args::ValueFlag<std::string> output(
        parser, "output", "Compose: write the script here instead of stdout", { 'o', "output" });
    args::ValueFlag<int> duration(
        parser,
        "seconds",
        "Discover: stop after this long (default: until Ctrl+C)",
        { "duration" });

    args::Positional<std::string> command(parser, "command", "See Commands above");
    args::Positional<std::string> target(parser, "target", "Host address or config file");
    args::Positional<std::string> argument(parser, "argument", "change-driver: driver name");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return kExitOk;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return kExitUsage;
    }

    // stdout carries events and script text, so console logging goes to stderr.
    LoggingChannels::initializeFromConfig(args::get(logConfig), "bjorn-manager", true);
    if (logChannels) {
        LoggingChannels::configureFromString(args::get(logChannels));
        SLOG_INFO("Applied channel overrides: {}", args::get(logChannels));
    }

    if (!command) {
        std::cerr << "Error: command is required\n\n" << parser;
        return kExitUsage;
    }
    const std::string commandName = args::get(command);

    if (configDir) {
        ConfigLoader::setConfigDir(args::get(configDir));
    }
    auto loaded = ConfigLoader::loadOrDefault<ManagerConfig>("manager.json");
    if (loaded.isError()) {
        SLOG_ERROR("{}", loaded.errorValue().message);
        return kExitUsage;
    }
    const ManagerConfig config = loaded.value();

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    if (commandName == "discover") {
        return runDiscover(config, duration ? args::get(duration) : 0);
    }

    if (!target) {
        std::cerr << "Error: '" << commandName << "' needs a target\n\n" << parser;
        return kExitUsage;
    }

    if (commandName == "compose") {
        return runCompose(
            args::get(target),
            output ? std::optional<std::string>(args::get(output)) : std::nullopt);
    }

    if (commandName != "install" && commandName != "logs" && commandName != "restart"
        && commandName != "reboot" && commandName != "change-driver") {
        std::cerr << "Error: unknown command '" << commandName << "'\n\n" << parser;
        return kExitUsage;
    }

    ConnectArgs connectArgs;
    connectArgs.host = args::get(target);
    connectArgs.credentials.user = user ? args::get(user) : config.session.defaultUser;
    if (password) {
        connectArgs.credentials.password = args::get(password);
    }
    else if (const char* fromEnv = std::getenv("BJORN_PASSWORD"); fromEnv && *fromEnv) {
        connectArgs.credentials.password = std::string(fromEnv);
    }
    if (sudoPassword) {
        connectArgs.credentials.sudoPassword = args::get(sudoPassword);
    }
    if (keyPassphrase) {
        connectArgs.credentials.keyPassphrase = args::get(keyPassphrase);
    }
    else if (const char* fromEnv = std::getenv("BJORN_KEY_PASSPHRASE"); fromEnv && *fromEnv) {
        connectArgs.credentials.keyPassphrase = std::string(fromEnv);
    }
    if (keyPath) {
        connectArgs.credentials.keyPath = args::get(keyPath);
    }
    else {
        auto preferences = PreferencesStore().load();
        if (preferences.isError()) {
            SLOG_WARN("{}", preferences.errorValue().message);
        }
        else if (preferences.value().defaultKeyPath.has_value()) {
            connectArgs.credentials.keyPath = *preferences.value().defaultKeyPath;
        }
    }

    Installer::InstallOptions installOptions;
    if (commandName == "install") {
        if (optionsFile) {
            auto parsed = loadInstallOptions(args::get(optionsFile));
            if (!parsed.has_value()) {
                return kExitUsage;
            }
            installOptions = *parsed;
        }
        if (mode) {
            auto parsedMode = Installer::installModeFromString(args::get(mode));
            if (!parsedMode.has_value()) {
                std::cerr << "Error: invalid mode '" << args::get(mode)
                          << "'. Use online, local or debug.\n";
                return kExitUsage;
            }
            installOptions.mode = *parsedMode;
        }
        if (script) {
            installOptions.customScript = args::get(script);
        }
        if (rebootAfter) {
            installOptions.rebootAfter = true;
        }
    }

    Events::EventRelay relay;
    startEventPrinter(relay);

    int exitCode = kExitOk;
    {
        auto created = Session::SessionManager::create(config.session, relay);
        if (created.isError()) {
            SLOG_ERROR("{}", created.errorValue().message);
            relay.stop();
            return kExitUsage;
        }
        auto& sessions = *created.value();

        if (commandName == "install") {
            exitCode = runInstall(config, sessions, relay, connectArgs, installOptions);
        }
        else if (commandName == "logs") {
            exitCode = runLogs(config.install, sessions, connectArgs);
        }
        else if (commandName == "restart") {
            exitCode = runAdministration(
                config.install, sessions, connectArgs, [](auto& admin) {
                    return admin.restartService();
                });
        }
        else if (commandName == "reboot") {
            exitCode = runAdministration(
                config.install, sessions, connectArgs, [](auto& admin) {
                    return admin.reboot();
                });
        }
        else {
            if (!argument) {
                std::cerr << "Error: change-driver needs a driver name\n";
                relay.stop();
                return kExitUsage;
            }
            const std::string driver = args::get(argument);
            exitCode = runAdministration(
                config.install, sessions, connectArgs, [&driver](auto& admin) {
                    return admin.changeDisplayDriver(driver);
                });
        }
    }

    relay.stop();
    return exitCode;
}
