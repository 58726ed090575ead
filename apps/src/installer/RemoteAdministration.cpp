#include "installer/RemoteAdministration.h"
#include "core/LoggingChannels.h"
#include "core/ShellQuote.h"
#include "installer/InstallOptions.h"

namespace BjornManager {
namespace Installer {

namespace {

VoidOutcome requireExitZero(const Outcome<Session::CommandResult>& result, const std::string& what)
{
    if (result.isError()) {
        return VoidOutcome::error(result.errorValue());
    }
    const auto& command = result.value();
    if (command.exitCode != 0) {
        std::string detail = command.stderrText.empty() ? command.stdoutText : command.stderrText;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
            detail.pop_back();
        }
        return failVoid(
            ErrorKind::RemoteExecution,
            what + " failed (exit " + std::to_string(command.exitCode) + ")"
                + (detail.empty() ? "" : ": " + detail));
    }
    return okayVoid();
}

} // namespace

RemoteAdministration::RemoteAdministration(Session::RemoteSession& session, InstallConfig config)
    : session_(session), config_(std::move(config))
{}

std::string RemoteAdministration::appDirectory() const
{
    return config_.remoteHome + "/Bjorn";
}

VoidOutcome RemoteAdministration::restartService()
{
    LOG_INFO(Install, "Restarting {} on '{}'", config_.serviceUnit, session_.identity());
    auto result = session_.executePrivileged(
        "systemctl restart " + shellEscapeArg(config_.serviceUnit), kRestartTimeout);
    auto checked = requireExitZero(result, "Restart of " + config_.serviceUnit);
    if (checked.isError()) {
        LOG_ERROR(Install, "{}", checked.errorValue().message);
        return checked;
    }
    LOG_INFO(Install, "{} restarted on '{}'", config_.serviceUnit, session_.identity());
    return okayVoid();
}

VoidOutcome RemoteAdministration::changeDisplayDriver(const std::string& driver)
{
    if (!isKnownDisplayDriver(driver)) {
        return failVoid(ErrorKind::Validation, "Unknown display driver '" + driver + "'");
    }

    LOG_INFO(Install, "Switching '{}' to display driver {}", session_.identity(), driver);
    const std::string expression =
        "s/\"epd_type\": \"epd[^\"]*\"/\"epd_type\": \"" + driver + "\"/g";
    auto rewritten = session_.executeSimple(
        buildCommandString({ "sed", "-i", expression, appDirectory() + "/shared.py" }),
        "",
        kQuickTimeout);
    auto checked = requireExitZero(rewritten, "Updating shared.py");
    if (checked.isError()) {
        return checked;
    }

    // Unquoted glob: expanded by the remote shell.
    auto cleared = session_.executePrivileged(
        "rm -f " + shellEscapeArg(appDirectory() + "/config") + "/*.json", kQuickTimeout);
    checked = requireExitZero(cleared, "Clearing cached configuration");
    if (checked.isError()) {
        return checked;
    }

    return restartService();
}

VoidOutcome RemoteAdministration::reboot()
{
    LOG_WARN(Install, "Rebooting '{}'", session_.identity());
    auto result = session_.executePrivileged("reboot", kQuickTimeout);
    if (result.isError()) {
        const ErrorKind kind = result.errorValue().kind;
        if (kind == ErrorKind::Timeout || kind == ErrorKind::RemoteExecution) {
            LOG_INFO(
                Install,
                "'{}' dropped the connection while rebooting: {}",
                session_.identity(),
                result.errorValue().message);
            return okayVoid();
        }
        return VoidOutcome::error(result.errorValue());
    }
    return requireExitZero(result, "Reboot");
}

} // namespace Installer
} // namespace BjornManager
