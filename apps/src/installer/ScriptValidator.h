#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace BjornManager {
namespace Installer {

// Offline parse of a script by its interpreter.
class SyntaxChecker {
public:
    virtual ~SyntaxChecker() = default;

    // nullopt when the interpreter is not available on this host; otherwise the
    // interpreter's complaints, empty when the script parses.
    virtual std::optional<std::vector<std::string>> check(const std::string& scriptText) = 0;
};

// Runs `bash -n` on a temporary copy of the script.
class BashSyntaxChecker : public SyntaxChecker {
public:
    // An empty path searches $PATH.
    explicit BashSyntaxChecker(
        std::string bashPath = "", std::chrono::milliseconds timeout = std::chrono::seconds(10));

    std::optional<std::vector<std::string>> check(const std::string& scriptText) override;

private:
    std::optional<std::string> locateBash() const;

    std::string bashPath_;
    std::chrono::milliseconds timeout_;
};

struct ValidationResult {
    // Normalized script: what should be uploaded.
    std::string text;
    // Blocking problems. Upload only when empty.
    std::vector<std::string> diagnostics;
    // Fixes applied along the way (BOM removed, line endings converted).
    std::vector<std::string> notes;
    bool syntaxChecked = false;

    bool ok() const { return diagnostics.empty(); }
};

struct NormalizedText {
    std::string text;
    bool hadBom = false;
    bool hadCarriageReturns = false;
};

// Strips a UTF-8 byte-order mark and converts CRLF and lone CR to LF.
NormalizedText normalizeScriptText(const std::string& text);

/**
 * @brief Checks a script before it is handed to the installer.
 *
 * In order: BOM removal, line-ending normalization, interpreter directive, then the
 * syntax checker when one is available. Problems are reported as data; nothing here
 * throws.
 */
class ScriptValidator {
public:
    // A null checker skips the syntax check.
    explicit ScriptValidator(std::shared_ptr<SyntaxChecker> checker = nullptr);

    ValidationResult validate(const std::string& scriptText) const;
    ValidationResult validateFile(const std::filesystem::path& path) const;

private:
    std::shared_ptr<SyntaxChecker> checker_;
};

} // namespace Installer
} // namespace BjornManager
