#include "error.h"
#include <string>

namespace core {
namespace {
class TransferCategory final : public std::error_category {
  public:
    const char* name() const noexcept override { return "vaultpush"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
        case Errc::config_error:
            return "invalid configuration";
        case Errc::auth_error:
            return "credentials rejected";
        case Errc::connection_error:
            return "could not connect to endpoint";
        case Errc::connection_lost:
            return "connection lost";
        case Errc::transfer_timeout:
            return "transfer timed out";
        case Errc::remote_rejection:
            return "rejected by remote";
        case Errc::protocol_violation:
            return "protocol violation";
        case Errc::cancelled:
            return "transfer cancelled";
        }
        return "unknown error";
    }
};
} // namespace

const std::error_category& transfer_category() noexcept {
    static const TransferCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), transfer_category()};
}

std::string_view errc_name(Errc e) noexcept {
    switch (e) {
    case Errc::config_error:
        return "ConfigError";
    case Errc::auth_error:
        return "AuthError";
    case Errc::connection_error:
        return "ConnectionError";
    case Errc::connection_lost:
        return "ConnectionLost";
    case Errc::transfer_timeout:
        return "TransferTimeout";
    case Errc::remote_rejection:
        return "RemoteRejection";
    case Errc::protocol_violation:
        return "ProtocolViolation";
    case Errc::cancelled:
        return "Cancelled";
    }
    return "Unknown";
}

bool is_connection_fatal(const std::error_code& ec) noexcept {
    return ec == Errc::config_error || ec == Errc::auth_error || ec == Errc::connection_error
           || ec == Errc::connection_lost || ec == Errc::protocol_violation;
}

} // namespace core
