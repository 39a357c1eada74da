#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "protocol/tool_contract.hpp"

namespace snipexec::runtime {

constexpr const char* kTimeoutMessage = "Execution timed out";

struct RunnerOptions {
    std::string interpreter = "python3";
    std::filesystem::path temp_dir;  // empty means the system temp directory
};

// Runs one snippet in a fresh interpreter process.
//
// The snippet is dedented, written to a uniquely named temporary file and
// handed to the interpreter as its script argument. The child gets its own
// process group so a timeout can kill everything it started. stdout and
// stderr are captured separately and trimmed. The exit status is not part
// of the result.
//
// run() never throws: launch failures and internal faults come back as
// stderr text, and a timeout comes back as ("", kTimeoutMessage).
class SnippetRunner {
public:
    explicit SnippetRunner(RunnerOptions options = {});

    protocol::ExecutionResult run(const std::string& code,
                                  std::uint32_t timeout_ms) const;

    const RunnerOptions& options() const { return options_; }

private:
    RunnerOptions options_;
};

}  // namespace snipexec::runtime
