#pragma once

#include <boost/system/error_code.hpp>

#include <string>
#include <type_traits>

namespace psmonitor {

// Application error codes. Value 0 is reserved for success.
enum class errc {
    invalid_credentials = 1,
    token_expired,
    token_invalid,
    not_found,
    already_claimed,
    subject_mismatch,
    provider_failure,
    pool_stopped,
    capacity_exceeded,
    bad_request,
    shutting_down,
};

const boost::system::error_category& error_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

// Stable machine-readable name, used in JSON error bodies.
const char* error_name(const boost::system::error_code& ec) noexcept;

} // namespace psmonitor

namespace boost::system {

template <>
struct is_error_code_enum<psmonitor::errc> : std::true_type {};

} // namespace boost::system
