#include "installer/InstallOrchestrator.h"
#include "core/LoggingChannels.h"
#include "core/ShellQuote.h"
#include "events/EventSink.h"
#include "installer/RemoteAdministration.h"
#include "installer/ScriptValidator.h"
#include "session/RemoteSession.h"
#include <algorithm>
#include <cctype>
#include <ctime>

namespace BjornManager {
namespace Installer {

namespace {

constexpr int kScriptMode = 0755;
constexpr int kDataMode = 0644;

// Unpacks <home>/Bjorn.zip over <home>/Bjorn, keeping the previous tree as Bjorn.bak.
std::string deployScript(const std::string& remoteHome)
{
    return "#!/bin/bash\n"
           "set -e\n"
           "cd "
        + shellEscapeArg(remoteHome)
        + "\n"
          "rm -rf Bjorn.tmp Bjorn.new\n"
          "mkdir -p Bjorn.tmp\n"
          "if command -v unzip >/dev/null 2>&1; then\n"
          "    unzip -o -q Bjorn.zip -d Bjorn.tmp\n"
          "else\n"
          "    python3 -c 'import zipfile; "
          "zipfile.ZipFile(\"Bjorn.zip\").extractall(\"Bjorn.tmp\")'\n"
          "fi\n"
          "TOP=$(ls Bjorn.tmp | head -n1)\n"
          "if [ -d \"Bjorn.tmp/$TOP/Bjorn\" ]; then\n"
          "    mv \"Bjorn.tmp/$TOP/Bjorn\" Bjorn.new\n"
          "elif [ -d Bjorn.tmp/Bjorn ]; then\n"
          "    mv Bjorn.tmp/Bjorn Bjorn.new\n"
          "else\n"
          "    mv Bjorn.tmp Bjorn.new\n"
          "fi\n"
          "rm -rf Bjorn.bak Bjorn.tmp\n"
          "if [ -d Bjorn ]; then mv -f Bjorn Bjorn.bak; fi\n"
          "mv -f Bjorn.new Bjorn\n"
          "chown -R bjorn:bjorn Bjorn || true\n"
          "chmod -R 755 Bjorn || true\n"
          "rm -f Bjorn.zip\n"
          "echo \"Deploy complete\"\n";
}

bool looksLikeSudoPrompt(const std::string& text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lower.find("[sudo]") != std::string::npos
        || lower.find("password for") != std::string::npos;
}

std::string lastLine(const std::string& text)
{
    std::string trimmed = text;
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    const auto pos = trimmed.find_last_of('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

std::string joinDiagnostics(const std::vector<std::string>& diagnostics)
{
    std::string joined;
    for (const auto& diagnostic : diagnostics) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += diagnostic;
    }
    return joined;
}

} // namespace

InstallOrchestrator::InstallOrchestrator(
    InstallConfig config, Events::EventSink& events, std::shared_ptr<ScriptValidator> validator)
    : config_(std::move(config)), events_(events), validator_(std::move(validator))
{}

Outcome<InstallJobSnapshot> InstallOrchestrator::runInstall(
    Session::RemoteSession& session, const InstallOptions& options)
{
    const DeviceIdentity identity = session.identity();
    auto job = std::make_shared<InstallJob>(
        identity, static_cast<size_t>(std::max(config_.failureContextLines, 1)));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.count(identity)) {
            return fail<InstallJobSnapshot>(
                ErrorKind::Busy, "An installation is already running on '" + identity + "'");
        }
        active_[identity].job = job;
    }

    job->start();
    LOG_INFO(
        Install,
        "Installing on '{}' (mode {}, driver {}, branch {})",
        identity,
        toString(options.mode),
        options.displayDriver,
        options.gitBranch);

    auto valid = validateOptions(options);
    if (valid.isError()) {
        job->fail(valid.errorValue());
        return Outcome<InstallJobSnapshot>::okay(finish(session, options, *job));
    }

    auto remoteScript = uploadAssets(session, options);
    if (remoteScript.isError()) {
        if (remoteScript.errorValue().kind == ErrorKind::Cancelled) {
            job->abort(remoteScript.errorValue().message);
        }
        else {
            job->fail(remoteScript.errorValue());
        }
        return Outcome<InstallJobSnapshot>::okay(finish(session, options, *job));
    }

    streamInstall(session, options, *job, remoteScript.value());
    return Outcome<InstallJobSnapshot>::okay(finish(session, options, *job));
}

bool InstallOrchestrator::cancel(const DeviceIdentity& identity)
{
    std::shared_ptr<Session::CommandStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(identity);
        if (it == active_.end()) {
            return false;
        }
        it->second.cancelRequested = true;
        stream = it->second.stream;
    }
    LOG_INFO(Install, "Cancelling installation on '{}'", identity);
    if (stream) {
        stream->cancel();
    }
    return true;
}

std::optional<InstallJobSnapshot> InstallOrchestrator::activeJob(
    const DeviceIdentity& identity) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(identity);
    if (it == active_.end()) {
        return std::nullopt;
    }
    return it->second.job->snapshot();
}

bool InstallOrchestrator::cancelRequested(const DeviceIdentity& identity) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(identity);
    return it != active_.end() && it->second.cancelRequested;
}

Outcome<std::string> InstallOrchestrator::uploadAssets(
    Session::RemoteSession& session, const InstallOptions& options)
{
    const std::filesystem::path assets(config_.assetsDir);

    if (options.mode == InstallMode::Local) {
        const std::filesystem::path archive = options.packageArchive.empty()
            ? assets / config_.packagesArchive
            : std::filesystem::path(options.packageArchive);
        const std::string remote = config_.remoteHome + "/" + config_.packagesArchive;
        LOG_INFO(Install, "Uploading {} to {}", archive.string(), remote);
        auto sent = session.uploadFile(archive, remote, kDataMode);
        if (sent.isError()) {
            return Outcome<std::string>::error(sent.errorValue());
        }
    }
    else if (options.mode == InstallMode::Debug) {
        const std::filesystem::path bundle = options.debugBundle.empty()
            ? assets / config_.debugBundle
            : std::filesystem::path(options.debugBundle);
        auto deployed = deployDebugBundle(session, bundle);
        if (deployed.isError()) {
            return Outcome<std::string>::error(deployed.errorValue());
        }
    }

    if (cancelRequested(session.identity())) {
        return fail<std::string>(ErrorKind::Cancelled, "Installation cancelled");
    }

    if (!options.customScript.empty()) {
        return uploadCustomScript(session, options.customScript);
    }
    return uploadStockScripts(session);
}

Outcome<std::string> InstallOrchestrator::uploadCustomScript(
    Session::RemoteSession& session, const std::string& localPath)
{
    const ScriptValidator fallback;
    const ScriptValidator& validator = validator_ ? *validator_ : fallback;
    const ValidationResult result = validator.validateFile(localPath);
    for (const auto& note : result.notes) {
        LOG_INFO(Install, "{}: {}", localPath, note);
    }
    if (!result.ok()) {
        return fail<std::string>(
            ErrorKind::Validation,
            "Custom script " + localPath + " rejected: " + joinDiagnostics(result.diagnostics));
    }

    const std::string remote = config_.remoteHome + "/custom_install_"
        + std::to_string(static_cast<long long>(std::time(nullptr))) + ".sh";
    LOG_INFO(Install, "Uploading custom script {} to {}", localPath, remote);
    auto sent = session.uploadText(result.text, remote, kScriptMode);
    if (sent.isError()) {
        return Outcome<std::string>::error(sent.errorValue());
    }
    return Outcome<std::string>::okay(remote);
}

Outcome<std::string> InstallOrchestrator::uploadStockScripts(Session::RemoteSession& session)
{
    const std::filesystem::path assets(config_.assetsDir);
    const std::filesystem::path script = assets / config_.remoteScriptName;
    const std::string remoteScript = config_.remoteHome + "/" + config_.remoteScriptName;

    std::error_code error;
    if (!std::filesystem::is_regular_file(script, error)) {
        return fail<std::string>(
            ErrorKind::Transfer, "Install script " + script.string() + " not found");
    }

    std::vector<std::filesystem::path> modules;
    const std::filesystem::path libDir = assets / "lib";
    if (std::filesystem::is_directory(libDir, error)) {
        for (const auto& entry : std::filesystem::directory_iterator(libDir, error)) {
            if (entry.is_regular_file(error) && entry.path().extension() == ".sh") {
                modules.push_back(entry.path());
            }
        }
    }
    if (error) {
        return fail<std::string>(
            ErrorKind::Transfer, "Cannot list " + libDir.string() + ": " + error.message());
    }
    std::sort(modules.begin(), modules.end());

    LOG_INFO(Install, "Uploading {} and {} module(s)", config_.remoteScriptName, modules.size());
    auto sent = session.uploadFile(script, remoteScript, kScriptMode);
    if (sent.isError()) {
        return Outcome<std::string>::error(sent.errorValue());
    }
    if (modules.empty()) {
        return Outcome<std::string>::okay(remoteScript);
    }

    const std::string remoteLib = config_.remoteHome + "/lib";
    auto made = session.executeSimple("mkdir -p " + shellEscapeArg(remoteLib));
    if (made.isError()) {
        return Outcome<std::string>::error(made.errorValue());
    }
    if (made.value().exitCode != 0) {
        return fail<std::string>(
            ErrorKind::RemoteExecution,
            "Cannot create " + remoteLib + ": " + lastLine(made.value().stderrText));
    }

    for (const auto& module : modules) {
        if (cancelRequested(session.identity())) {
            return fail<std::string>(ErrorKind::Cancelled, "Installation cancelled");
        }
        const std::string remote = remoteLib + "/" + module.filename().string();
        LOG_DEBUG(Install, "Uploading lib/{}", module.filename().string());
        sent = session.uploadFile(module, remote, kScriptMode);
        if (sent.isError()) {
            return Outcome<std::string>::error(sent.errorValue());
        }
    }
    return Outcome<std::string>::okay(remoteScript);
}

VoidOutcome InstallOrchestrator::deployDebugBundle(
    Session::RemoteSession& session, const std::filesystem::path& bundle)
{
    const std::string remoteZip = config_.remoteHome + "/" + config_.debugBundle;
    const std::string remoteDeploy = config_.remoteHome + "/deploy_tmp.sh";

    LOG_INFO(Install, "Uploading debug bundle {} to {}", bundle.string(), remoteZip);
    auto sent = session.uploadFile(bundle, remoteZip, kDataMode);
    if (sent.isError()) {
        return sent;
    }
    sent = session.uploadText(deployScript(config_.remoteHome), remoteDeploy, kScriptMode);
    if (sent.isError()) {
        return sent;
    }

    auto deployed =
        session.executePrivileged("bash " + shellEscapeArg(remoteDeploy), kDeployTimeout);
    auto removed = session.executeSimple("rm -f " + shellEscapeArg(remoteDeploy));
    if (removed.isError() || removed.value().exitCode != 0) {
        LOG_WARN(Install, "Could not remove {}", remoteDeploy);
    }

    if (deployed.isError()) {
        return VoidOutcome::error(deployed.errorValue());
    }
    if (deployed.value().exitCode != 0) {
        return failVoid(
            ErrorKind::RemoteExecution,
            "Debug bundle deploy failed (exit " + std::to_string(deployed.value().exitCode)
                + "): " + lastLine(deployed.value().stderrText));
    }
    LOG_INFO(Install, "Debug bundle deployed on '{}'", session.identity());
    return okayVoid();
}

void InstallOrchestrator::streamInstall(
    Session::RemoteSession& session,
    const InstallOptions& options,
    InstallJob& job,
    const std::string& remoteScript)
{
    const DeviceIdentity identity = session.identity();
    Session::StreamOptions streamOptions;
    streamOptions.pty = true;
    streamOptions.inactivityTimeout = std::chrono::seconds(config_.progressTimeoutSeconds);

    auto opened = session.execute(buildInstallCommand(options, remoteScript), streamOptions);
    if (opened.isError()) {
        job.fail(opened.errorValue());
        return;
    }
    auto stream = opened.value();

    const auto password = session.sudoPassword();
    if (password.has_value()) {
        bool answered = false;
        stream->setPromptResponder(
            [&answered, secret = password.value()](
                const std::string& text) -> std::optional<std::string> {
                if (answered || !looksLikeSudoPrompt(text)) {
                    return std::nullopt;
                }
                answered = true;
                LOG_DEBUG(Install, "Answering sudo prompt");
                return secret + "\n";
            });
    }
    else {
        LOG_WARN(Install, "No sudo password for '{}'; sudo must not prompt", identity);
    }

    bool cancelledEarly = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& active = active_[identity];
        active.stream = stream;
        cancelledEarly = active.cancelRequested;
    }
    if (cancelledEarly) {
        stream->cancel();
    }

    while (true) {
        auto next = stream->nextLine();
        if (next.isError()) {
            const ManagerError& error = next.errorValue();
            if (error.kind == ErrorKind::Cancelled) {
                job.abort("Installation cancelled");
            }
            else {
                job.fail(error);
            }
            break;
        }
        if (!next.value().has_value()) {
            const auto status = stream->exitStatus();
            if (status.has_value() && status.value() == 0) {
                job.succeed();
            }
            else if (status.has_value()) {
                job.fail(ManagerError(
                    ErrorKind::RemoteExecution,
                    "Install script exited with status " + std::to_string(status.value())));
            }
            else {
                job.fail(ManagerError(
                    ErrorKind::RemoteExecution, "Install script ended without an exit status"));
            }
            break;
        }

        const LineOutcome outcome = job.consumeLine(next.value().value());
        if (outcome.progress.has_value()) {
            const auto& progress = outcome.progress.value();
            events_.publish(Events::InstallProgress{
                .identity = identity,
                .stepIndex = progress.index,
                .stepTotal = progress.total,
                .label = progress.label,
            });
        }
        else if (outcome.logLine.has_value()) {
            events_.publish(Events::InstallLog{
                .identity = identity,
                .line = outcome.logLine.value(),
            });
        }
    }

    // The responder refers to this frame.
    stream->setPromptResponder(nullptr);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(identity);
    if (it != active_.end()) {
        it->second.stream.reset();
    }
}

InstallJobSnapshot InstallOrchestrator::finish(
    Session::RemoteSession& session, const InstallOptions& options, InstallJob& job)
{
    const DeviceIdentity identity = session.identity();
    std::string message;
    if (job.state() == JobState::Succeeded) {
        message = "Installation completed";
        if (options.rebootAfter) {
            auto rebooted = RemoteAdministration(session, config_).reboot();
            if (rebooted.isError()) {
                LOG_WARN(
                    Install,
                    "Reboot of '{}' failed: {}",
                    identity,
                    rebooted.errorValue().message);
                message += ", reboot failed: " + rebooted.errorValue().message;
            }
            else {
                message += ", device rebooting";
            }
        }
    }

    InstallJobSnapshot snapshot = job.snapshot();
    if (snapshot.error.has_value()) {
        message = snapshot.error->message;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(identity);
    }

    if (snapshot.state == JobState::Succeeded) {
        LOG_INFO(Install, "Installation on '{}' succeeded", identity);
    }
    else {
        LOG_ERROR(
            Install, "Installation on '{}' {}: {}", identity, toString(snapshot.state), message);
    }

    events_.publish(Events::InstallFinished{
        .identity = identity,
        .outcome = snapshot.state,
        .errorKind = snapshot.error.has_value() ? std::optional<ErrorKind>(snapshot.error->kind)
                                                : std::nullopt,
        .message = message,
        .failureContext = snapshot.failureContext,
    });
    return snapshot;
}

} // namespace Installer
} // namespace BjornManager
