#include "installer/ScriptValidator.h"
#include "core/LoggingChannels.h"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

namespace BjornManager {
namespace Installer {

namespace {

constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";
constexpr int kExecFailedStatus = 127;

class TempScriptFile {
public:
    TempScriptFile()
    {
        std::error_code error;
        std::filesystem::path dir = std::filesystem::temp_directory_path(error);
        if (error) {
            dir = "/tmp";
        }
        const std::string pattern = (dir / "bjorn-script-XXXXXX").string();
        std::vector<char> buffer(pattern.begin(), pattern.end());
        buffer.push_back('\0');
        fd_ = mkstemp(buffer.data());
        if (fd_ >= 0) {
            path_ = buffer.data();
        }
    }

    ~TempScriptFile()
    {
        if (fd_ >= 0) {
            close(fd_);
        }
        if (!path_.empty()) {
            unlink(path_.c_str());
        }
    }

    TempScriptFile(const TempScriptFile&) = delete;
    TempScriptFile& operator=(const TempScriptFile&) = delete;

    bool write(const std::string& content)
    {
        if (fd_ < 0) {
            return false;
        }
        size_t written = 0;
        while (written < content.size()) {
            const ssize_t n = ::write(fd_, content.data() + written, content.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return false;
            }
            written += static_cast<size_t>(n);
        }
        close(fd_);
        fd_ = -1;
        return true;
    }

    const std::string& path() const { return path_; }

private:
    int fd_ = -1;
    std::string path_;
};

std::vector<std::string> splitDiagnostics(const std::string& output, const std::string& path)
{
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.empty()) {
            continue;
        }
        const std::string prefix = path + ": ";
        if (line.rfind(prefix, 0) == 0) {
            line = line.substr(prefix.size());
        }
        lines.push_back(line);
    }
    return lines;
}

} // namespace

BashSyntaxChecker::BashSyntaxChecker(std::string bashPath, std::chrono::milliseconds timeout)
    : bashPath_(std::move(bashPath)), timeout_(timeout)
{}

std::optional<std::string> BashSyntaxChecker::locateBash() const
{
    if (!bashPath_.empty()) {
        if (access(bashPath_.c_str(), X_OK) == 0) {
            return bashPath_;
        }
        return std::nullopt;
    }

    const char* pathEnv = std::getenv("PATH");
    std::istringstream dirs(pathEnv ? pathEnv : "/usr/bin:/bin");
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::string candidate = dir + "/bash";
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> BashSyntaxChecker::check(const std::string& scriptText)
{
    const auto bash = locateBash();
    if (!bash.has_value()) {
        LOG_DEBUG(Install, "bash not found, skipping syntax check");
        return std::nullopt;
    }

    TempScriptFile file;
    if (!file.write(scriptText)) {
        LOG_WARN(Install, "Could not write temporary script, skipping syntax check");
        return std::nullopt;
    }

    int pipeFds[2];
    if (pipe(pipeFds) != 0) {
        LOG_WARN(Install, "pipe() failed: {}", std::strerror(errno));
        return std::nullopt;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        LOG_WARN(Install, "fork() failed: {}", std::strerror(errno));
        close(pipeFds[0]);
        close(pipeFds[1]);
        return std::nullopt;
    }

    if (pid == 0) {
        // Child: both streams into the pipe, then exec.
        dup2(pipeFds[1], STDOUT_FILENO);
        dup2(pipeFds[1], STDERR_FILENO);
        close(pipeFds[0]);
        close(pipeFds[1]);
        execl(bash->c_str(), "bash", "-n", file.path().c_str(), static_cast<char*>(nullptr));
        _exit(kExecFailedStatus);
    }

    close(pipeFds[1]);
    const auto deadline = std::chrono::steady_clock::now() + timeout_;
    std::string output;
    bool timedOut = false;
    char buffer[512];
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timedOut = true;
            break;
        }
        pollfd pfd{ pipeFds[0], POLLIN, 0 };
        const int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0 && errno == EINTR) {
            continue;
        }
        if (ready <= 0) {
            timedOut = ready == 0;
            break;
        }
        const ssize_t n = read(pipeFds[0], buffer, sizeof(buffer));
        if (n <= 0) {
            break;
        }
        output.append(buffer, static_cast<size_t>(n));
    }
    close(pipeFds[0]);

    int status = 0;
    if (timedOut) {
        kill(pid, SIGKILL);
    }
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }

    if (timedOut) {
        return std::vector<std::string>{ "Syntax check timed out after "
                                         + std::to_string(timeout_.count()) + " ms" };
    }
    if (!WIFEXITED(status)) {
        return std::vector<std::string>{ "Syntax check terminated abnormally" };
    }
    if (WEXITSTATUS(status) == kExecFailedStatus) {
        LOG_WARN(Install, "Could not run {}, skipping syntax check", bash.value());
        return std::nullopt;
    }
    if (WEXITSTATUS(status) == 0) {
        return std::vector<std::string>{};
    }

    auto diagnostics = splitDiagnostics(output, file.path());
    if (diagnostics.empty()) {
        diagnostics.push_back("bash -n exited with status " + std::to_string(WEXITSTATUS(status)));
    }
    return diagnostics;
}

NormalizedText normalizeScriptText(const std::string& text)
{
    NormalizedText result;
    size_t start = 0;
    if (text.rfind(kUtf8Bom, 0) == 0) {
        result.hadBom = true;
        start = 3;
    }

    result.text.reserve(text.size() - start);
    for (size_t i = start; i < text.size(); ++i) {
        if (text[i] == '\r') {
            result.hadCarriageReturns = true;
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                continue;
            }
            result.text.push_back('\n');
            continue;
        }
        result.text.push_back(text[i]);
    }
    return result;
}

ScriptValidator::ScriptValidator(std::shared_ptr<SyntaxChecker> checker)
    : checker_(std::move(checker))
{}

ValidationResult ScriptValidator::validate(const std::string& scriptText) const
{
    ValidationResult result;
    auto normalized = normalizeScriptText(scriptText);
    result.text = std::move(normalized.text);
    if (normalized.hadBom) {
        result.notes.push_back("Removed UTF-8 byte-order mark");
    }
    if (normalized.hadCarriageReturns) {
        result.notes.push_back("Converted line endings to LF");
    }

    if (result.text.empty()) {
        result.diagnostics.push_back("Script is empty");
        return result;
    }

    const std::string firstLine = result.text.substr(0, result.text.find('\n'));
    if (firstLine.rfind("#!", 0) != 0) {
        result.diagnostics.push_back("First line is not an interpreter directive (#!)");
    }
    else if (firstLine.find_first_not_of(" \t", 2) == std::string::npos) {
        result.diagnostics.push_back("Interpreter directive names no interpreter");
    }

    if (!checker_) {
        return result;
    }
    const auto syntax = checker_->check(result.text);
    if (!syntax.has_value()) {
        result.notes.push_back("Syntax check skipped: interpreter not available");
        return result;
    }
    result.syntaxChecked = true;
    for (const auto& message : syntax.value()) {
        result.diagnostics.push_back("Syntax: " + message);
    }
    return result;
}

ValidationResult ScriptValidator::validateFile(const std::filesystem::path& path) const
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ValidationResult result;
        result.diagnostics.push_back("Cannot read " + path.string());
        return result;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return validate(buffer.str());
}

} // namespace Installer
} // namespace BjornManager
