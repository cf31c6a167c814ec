#include "result/result_classifier.hpp"

#include "utils/logging.hpp"

namespace safexec::result {

const std::vector<std::string>& ErrorSignatures() {
    static const std::vector<std::string> kSignatures = {
        "Traceback (most recent call last):",
        "SyntaxError:",
        "NameError:",
        "TypeError:",
        "ValueError:",
        "KeyError:",
        "IndexError:",
        "AttributeError:",
        "ImportError:",
        "ModuleNotFoundError:",
        "FileNotFoundError:",
        "ZeroDivisionError:",
        "RuntimeError:",
        "Exception:"
    };
    return kSignatures;
}

const std::string& RemediationGuidance() {
    static const std::string kGuidance =
        "\n\n---\n"
        "**Code Execution Failed**: The code above produced an error. "
        "Please analyze the error message, fix the code, and try again. "
        "Common fixes include:\n"
        "- Check column names match exactly (use df.columns to see available columns)\n"
        "- Verify file paths and filenames exist\n"
        "- Ensure required variables are defined before use\n"
        "- Check data types match expected operations\n"
        "- Handle missing or null values appropriately\n";
    return kGuidance;
}

int FindErrorSignature(const std::string& output) {
    const auto& signatures = ErrorSignatures();
    for (std::size_t i = 0; i < signatures.size(); ++i) {
        if (output.find(signatures[i]) != std::string::npos) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

ExecutionResult Classify(int exit_code, const std::string& output) {
    ExecutionResult result{};
    result.exit_code = exit_code;
    result.output = output;
    const int signature = FindErrorSignature(output);
    if (exit_code == 0 && signature < 0) {
        result.success = true;
        result.outcome = Outcome::kSuccess;
        return result;
    }
    result.success = false;
    result.outcome = Outcome::kRuntimeFailure;
    result.guidance = RemediationGuidance();
    utils::LogWarn("result", "execution failed", {
        {"exit_code", std::to_string(exit_code)},
        {"signature", signature >= 0 ? ErrorSignatures()[signature] : "(none)"}
    });
    return result;
}

ExecutionResult TimeoutResult(const std::string& output, int timeout_s) {
    ExecutionResult result{};
    result.exit_code = 124;
    result.output = output;
    if (!result.output.empty() && result.output.back() != '\n') {
        result.output.push_back('\n');
    }
    result.output += "Error: execution timed out after " + std::to_string(timeout_s) +
                     "s and was terminated";
    result.success = false;
    result.outcome = Outcome::kTimeout;
    result.guidance = RemediationGuidance();
    return result;
}

ExecutionResult FailureResult(Outcome outcome, const std::string& message) {
    ExecutionResult result{};
    result.exit_code = -1;
    result.output = "Error: " + message;
    result.success = false;
    result.outcome = outcome;
    result.guidance = "\n\n---\n**Execution Failed**: Please fix the issue and try again.";
    return result;
}

}  // namespace safexec::result
