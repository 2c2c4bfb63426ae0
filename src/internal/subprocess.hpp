#pragma once

#include <string>
#include <vector>

namespace tauri_mcp::internal {

    struct subprocess_result {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};
        bool timed_out{false};
    };

    // Runs argv[0] (PATH lookup) to completion, capturing both output streams.
    // Exit code 127 means the program could not be executed.
    subprocess_result run_subprocess(const std::vector<std::string>& args, int timeout_ms);

}  // namespace tauri_mcp::internal
