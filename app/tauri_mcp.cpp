#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        tauri_mcp::server_config cfg{};
        tauri_mcp::cli::cli_request request{};
        if (auto cli_result = tauri_mcp::cli::parse_cli(argc, argv, cfg, request)) {
            return *cli_result;
        }

        return tauri_mcp::cli::run(cfg, request);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
