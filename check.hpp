#pragma once
#include <string>
#include <string_view>
#include <system_error>

// Turn a failed blocking asio call into an exception for the worker boundary to catch
inline void throw_if_err(const std::error_code& ec, std::string_view where) {
    if (ec) throw std::system_error(ec, std::string(where));
}
