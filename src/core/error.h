#pragma once

#include <string_view>
#include <system_error>
#include <type_traits>

namespace core {

enum class Errc {
    config_error = 1,
    auth_error,
    connection_error,
    connection_lost,
    transfer_timeout,
    remote_rejection,
    protocol_violation,
    cancelled,
};

const std::error_category& transfer_category() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// Short kind name used in structured output, e.g. "TransferTimeout".
std::string_view errc_name(Errc e) noexcept;

// True for errors that take the whole connection (and therefore the batch) down.
bool is_connection_fatal(const std::error_code& ec) noexcept;

} // namespace core

template<>
struct std::is_error_code_enum<core::Errc> : std::true_type {};
