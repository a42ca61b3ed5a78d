#include "transfer/attachment_job.h"
#include "config/client_config.h"
#include "core/error.h"
#include <fstream>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <utility>

namespace transfer {

namespace {
constexpr std::string_view kFileNotFound = "file not found";

std::int64_t to_ms(const struct timespec& ts) {
    return static_cast<std::int64_t>(ts.tv_sec) * 1000 + ts.tv_nsec / 1000000;
}

TransferOutcome failed(std::string label, std::string destination, std::string detail) {
    TransferOutcome outcome;
    outcome.source_label = std::move(label);
    outcome.destination_path = std::move(destination);
    outcome.success = false;
    outcome.error_detail = std::move(detail);
    outcome.error = make_error_code(core::Errc::config_error);
    return outcome;
}
} // namespace

std::string_view to_string(TransferState state) {
    switch (state) {
    case TransferState::Pending:
        return "Pending";
    case TransferState::HandshakeSent:
        return "HandshakeSent";
    case TransferState::Streaming:
        return "Streaming";
    case TransferState::AwaitingFinalAck:
        return "AwaitingFinalAck";
    case TransferState::Completed:
        return "Completed";
    case TransferState::Failed:
        return "Failed";
    }
    return "Unknown";
}

AttachmentJob make_job(std::string source_label,
                       std::string destination_path,
                       std::vector<std::byte> bytes) {
    AttachmentJob job;
    job.source_label = std::move(source_label);
    job.destination_path = std::move(destination_path);
    job.size_bytes = bytes.size();
    job.source_bytes = std::move(bytes);
    return job;
}

std::variant<AttachmentJob, TransferOutcome> load_job(const std::filesystem::path& file,
                                                       std::string_view prefix) {
    const std::string label = file.string();
    const std::string basename = file.filename().string();

    auto destination = config::resolve_destination(prefix, basename);
    if (!destination) {
        spdlog::warn("[load_job] No usable destination for '{}' under prefix '{}'", label, prefix);
        return failed(label, basename, "invalid destination path");
    }

    std::error_code ec;
    const auto status = std::filesystem::status(file, ec);
    if (ec || !std::filesystem::is_regular_file(status)) {
        spdlog::warn("[load_job] Not a regular file: {}", label);
        return failed(label, *destination, std::string(kFileNotFound));
    }

    struct stat info {};
    if (::stat(file.c_str(), &info) != 0) {
        spdlog::warn("[load_job] stat failed for {}", label);
        return failed(label, *destination, std::string(kFileNotFound));
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        spdlog::warn("[load_job] Failed to open {}", label);
        return failed(label, *destination, std::string(kFileNotFound));
    }

    std::vector<std::byte> bytes(static_cast<std::size_t>(info.st_size));
    if (!bytes.empty()) {
        in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (static_cast<std::size_t>(in.gcount()) != bytes.size()) {
            spdlog::warn("[load_job] Short read on {} ({} of {} bytes)",
                         label,
                         in.gcount(),
                         bytes.size());
            return failed(label, *destination, "failed to read file");
        }
    }

    AttachmentJob job = make_job(label, std::move(*destination), std::move(bytes));
    job.ctime_ms = to_ms(info.st_ctim);
    job.mtime_ms = to_ms(info.st_mtim);
    spdlog::debug("[load_job] {} -> {} ({} bytes)", job.source_label, job.destination_path, job.size_bytes);
    return job;
}

} // namespace transfer
