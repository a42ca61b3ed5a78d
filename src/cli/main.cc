#include "cli/upload_command.h"
#include <CLI/CLI.hpp>
#include <iostream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    // stdout carries the JSON result list only.
    spdlog::set_default_logger(spdlog::stderr_color_mt("vaultpush"));
    spdlog::set_level(spdlog::level::warn);

    CLI::App app{"Upload attachments into a note vault", "vaultpush"};
    cli::UploadCommand command(std::cout, std::cerr);
    command.setup(app);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e) == 0 ? cli::kExitSuccess : cli::kExitFatal;
    }

    return command.execute(argv[0]);
}
