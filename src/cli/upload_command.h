#pragma once

#include "config/client_config.h"
#include <CLI/CLI.hpp>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cli {

enum ExitCode : int {
    kExitSuccess = 0,
    kExitJobFailed = 1,
    kExitFatal = 2,
};

struct UploadOptions {
    std::vector<std::string> files;
    std::string prefix;
    std::optional<std::string> vault;
    std::optional<std::string> config_path;
    std::optional<std::size_t> max_parallel;
    std::optional<std::string> log_level;
};

// `vaultpush [options] FILE...`: loads the files, uploads them as one batch and
// prints the ordered JSON outcome list.
class UploadCommand {
  public:
    UploadCommand(std::ostream& out,
                  std::ostream& err,
                  config::EnvLookup env = config::process_environment());

    void setup(CLI::App& app);

    // Returns the process exit status.
    int execute(const std::string& executable_path);

    UploadOptions& options() { return options_; }

  private:
    std::ostream& out_;
    std::ostream& err_;
    config::EnvLookup env_;
    UploadOptions options_;
};

} // namespace cli
