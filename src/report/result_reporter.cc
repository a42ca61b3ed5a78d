#include "report/result_reporter.h"
#include <fmt/format.h>

namespace report {

ResultReporter::ResultReporter(std::ostream& progress, std::ostream& results)
    : progress_(progress)
    , results_(results) {}

void ResultReporter::on_progress(const transfer::ProgressEvent& event) {
    using transfer::TransferState;

    switch (event.state) {
    case TransferState::Pending:
        return;
    case TransferState::HandshakeSent:
        progress_ << fmt::format("… {}: handshake sent\n", event.destination_path);
        break;
    case TransferState::Streaming:
    case TransferState::AwaitingFinalAck:
        progress_ << fmt::format("… {}: {}/{} chunks\n",
                                 event.destination_path,
                                 event.chunks_acked,
                                 event.chunks_total);
        break;
    case TransferState::Completed:
        progress_ << fmt::format("✅ {}\n", event.destination_path);
        break;
    case TransferState::Failed:
        progress_ << fmt::format("❌ {}: {}\n", event.destination_path, event.detail);
        break;
    }
    progress_.flush();
}

transfer::ProgressSink ResultReporter::sink() {
    return [this](const transfer::ProgressEvent& event) { on_progress(event); };
}

nlohmann::json ResultReporter::to_json(const transfer::TransferOutcome& outcome) {
    nlohmann::json entry;
    entry["file"] = outcome.source_label;
    entry["path"] = outcome.destination_path;
    entry["success"] = outcome.success;
    if (!outcome.success) {
        entry["error"] = outcome.error_detail.value_or(outcome.error.message());
    }
    return entry;
}

nlohmann::json ResultReporter::to_json(const std::vector<transfer::TransferOutcome>& outcomes) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& outcome : outcomes) {
        list.push_back(to_json(outcome));
    }
    return list;
}

void ResultReporter::report_outcomes(const std::vector<transfer::TransferOutcome>& outcomes) {
    // File names and remote reasons are arbitrary bytes; invalid UTF-8 becomes U+FFFD.
    results_ << to_json(outcomes).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
             << std::endl;
}

void ResultReporter::report_fatal(std::string_view message) {
    progress_ << fmt::format("error: {}\n", message);
    progress_.flush();
}

} // namespace report
