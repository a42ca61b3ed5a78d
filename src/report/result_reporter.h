#pragma once

#include "transfer/attachment_job.h"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string_view>
#include <vector>

namespace report {

// Writes human progress lines to one stream and the final JSON outcome list to
// another (stderr and stdout in the command-line tool).
class ResultReporter {
  public:
    ResultReporter(std::ostream& progress, std::ostream& results);

    void on_progress(const transfer::ProgressEvent& event);

    // Sink bound to this reporter; the reporter must outlive it.
    transfer::ProgressSink sink();

    void report_outcomes(const std::vector<transfer::TransferOutcome>& outcomes);
    void report_fatal(std::string_view message);

    static nlohmann::json to_json(const transfer::TransferOutcome& outcome);
    static nlohmann::json to_json(const std::vector<transfer::TransferOutcome>& outcomes);

  private:
    std::ostream& progress_;
    std::ostream& results_;
};

} // namespace report
