#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace transfer {

// One local file bound for one vault-relative destination. Chunks reference
// source_bytes directly, so a job must outlive the transfer that streams it.
struct AttachmentJob {
    std::string source_label;
    std::vector<std::byte> source_bytes;
    std::string destination_path;
    std::uint64_t size_bytes = 0;
    std::int64_t ctime_ms = 0;
    std::int64_t mtime_ms = 0;
};

enum class TransferState { Pending, HandshakeSent, Streaming, AwaitingFinalAck, Completed, Failed };

std::string_view to_string(TransferState state);

inline bool is_terminal(TransferState state) {
    return state == TransferState::Completed || state == TransferState::Failed;
}

struct TransferOutcome {
    std::string source_label;
    std::string destination_path;
    bool success = false;
    std::optional<std::string> error_detail;
    std::error_code error;
};

struct ProgressEvent {
    std::size_t job_index = 0;
    std::string source_label;
    std::string destination_path;
    TransferState state = TransferState::Pending;
    std::uint64_t chunks_acked = 0;
    std::uint64_t chunks_total = 0;
    std::string detail;
};

using ProgressSink = std::function<void(const ProgressEvent&)>;

// In-memory job; timestamps are left at zero.
AttachmentJob make_job(std::string source_label,
                       std::string destination_path,
                       std::vector<std::byte> bytes);

// Reads a local file into a job whose destination is prefix/basename. Inputs that
// are not readable regular files, or whose destination is unusable, come back as
// a failed outcome instead.
std::variant<AttachmentJob, TransferOutcome> load_job(const std::filesystem::path& file,
                                                       std::string_view prefix);

} // namespace transfer
