#include "cli/upload_command.h"
#include "core/executor.h"
#include "report/result_reporter.h"
#include "transfer/attachment_job.h"
#include "transfer/batch_orchestrator.h"
#include "util/settings.h"
#include <asio/signal_set.hpp>
#include <csignal>
#include <filesystem>
#include <functional>
#include <spdlog/spdlog.h>
#include <utility>
#include <variant>

namespace cli {

namespace {
transfer::TransferOutcome config_failure(const std::string& file,
                                         const std::string& prefix,
                                         const std::string& detail) {
    transfer::TransferOutcome outcome;
    outcome.source_label = file;
    const auto basename = std::filesystem::path(file).filename().string();
    outcome.destination_path = config::resolve_destination(prefix, basename).value_or(basename);
    outcome.success = false;
    outcome.error_detail = detail;
    outcome.error = make_error_code(core::Errc::config_error);
    return outcome;
}
} // namespace

UploadCommand::UploadCommand(std::ostream& out, std::ostream& err, config::EnvLookup env)
    : out_(out)
    , err_(err)
    , env_(std::move(env)) {}

void UploadCommand::setup(CLI::App& app) {
    app.add_option("files", options_.files, "Local files to upload")->required();
    app.add_option("-p,--prefix", options_.prefix, "Destination folder inside the vault");
    app.add_option("-v,--vault", options_.vault, "Vault name (overrides VAULTPUSH_VAULT)");
    app.add_option("-c,--config", options_.config_path, "Path to a JSON settings file");
    app.add_option("-j,--max-parallel",
                   options_.max_parallel,
                   "Maximum concurrent transfers (0 = unbounded)");
    app.add_option("--log-level", options_.log_level, "trace, debug, info, warn, error, critical, off");
}

int UploadCommand::execute(const std::string& executable_path) {
    report::ResultReporter reporter(err_, out_);

    config::ClientConfig client_config;
    try {
        auto& settings = util::Settings::instance();
        if (options_.config_path) {
            settings.init(*options_.config_path, true);
        } else {
            settings.init(util::Settings::default_path(executable_path));
        }

        config::Overrides overrides;
        overrides.vault = options_.vault;
        overrides.max_parallel_transfers = options_.max_parallel;
        overrides.log_level = options_.log_level;
        client_config = config::load_client_config(settings.get(), env_, overrides);
    } catch (const util::ConfigError& e) {
        reporter.report_fatal(e.what());
        std::vector<transfer::TransferOutcome> outcomes;
        for (const auto& file : options_.files) {
            outcomes.push_back(config_failure(file, options_.prefix, e.what()));
        }
        reporter.report_outcomes(outcomes);
        return kExitFatal;
    }
    spdlog::set_level(spdlog::level::from_str(client_config.log_level));

    // Inputs that cannot be loaded keep their slot with a ready-made failure.
    std::vector<std::optional<transfer::TransferOutcome>> slots(options_.files.size());
    std::vector<std::size_t> job_slots;
    std::vector<transfer::AttachmentJob> jobs;
    for (std::size_t i = 0; i < options_.files.size(); ++i) {
        auto loaded = transfer::load_job(options_.files[i], options_.prefix);
        if (auto* job = std::get_if<transfer::AttachmentJob>(&loaded)) {
            jobs.push_back(std::move(*job));
            job_slots.push_back(i);
            continue;
        }
        auto& outcome = std::get<transfer::TransferOutcome>(loaded);
        transfer::ProgressEvent event;
        event.job_index = i;
        event.source_label = outcome.source_label;
        event.destination_path = outcome.destination_path;
        event.state = transfer::TransferState::Failed;
        event.detail = outcome.error_detail.value_or("");
        reporter.on_progress(event);
        slots[i] = std::move(outcome);
    }

    transfer::BatchResult batch;
    if (!jobs.empty()) {
        core::Executor executor;
        transfer::BatchOrchestrator orchestrator(executor, client_config, reporter.sink());

        // Re-armed after every signal.
        asio::signal_set signals(executor.get_io_context(), SIGINT, SIGTERM);
        std::function<void(const asio::error_code&, int)> on_signal;
        on_signal = [&orchestrator, &signals, &on_signal](const asio::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            spdlog::warn("[UploadCommand::execute] Signal {} received, cancelling transfers", signal);
            orchestrator.cancel_all();
            signals.async_wait(on_signal);
        };
        signals.async_wait(on_signal);

        batch = orchestrator.run_batch(jobs);
    }

    for (std::size_t k = 0; k < batch.outcomes.size() && k < job_slots.size(); ++k) {
        slots[job_slots[k]] = std::move(batch.outcomes[k]);
    }

    std::vector<transfer::TransferOutcome> outcomes;
    outcomes.reserve(slots.size());
    bool all_succeeded = true;
    for (auto& slot : slots) {
        all_succeeded = all_succeeded && slot->success;
        outcomes.push_back(std::move(*slot));
    }

    if (batch.fatal_error) {
        reporter.report_fatal(batch.fatal_error.message());
    }
    reporter.report_outcomes(outcomes);

    if (batch.fatal_error) {
        return kExitFatal;
    }
    return all_succeeded ? kExitSuccess : kExitJobFailed;
}

} // namespace cli
