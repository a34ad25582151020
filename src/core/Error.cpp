#include "core/Error.h"

namespace psmonitor {

namespace {

class PsmonitorCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "psmonitor"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::invalid_credentials: return "invalid credentials";
            case errc::token_expired:       return "access token has expired";
            case errc::token_invalid:       return "access token is missing or invalid";
            case errc::not_found:           return "unknown worker id";
            case errc::already_claimed:     return "worker already claimed";
            case errc::subject_mismatch:    return "subscriber does not own this worker";
            case errc::provider_failure:    return "metric provider failed";
            case errc::pool_stopped:        return "offload pool is stopped";
            case errc::capacity_exceeded:   return "server is at full capacity";
            case errc::bad_request:         return "malformed request";
            case errc::shutting_down:       return "server is shutting down";
        }
        return "unknown error";
    }
};

} // namespace

const boost::system::error_category& error_category() noexcept {
    static const PsmonitorCategory category;
    return category;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

const char* error_name(const boost::system::error_code& ec) noexcept {
    if (ec.category() != error_category()) return "internal_error";

    switch (static_cast<errc>(ec.value())) {
        case errc::invalid_credentials: return "invalid_credentials";
        case errc::token_expired:       return "token_expired";
        case errc::token_invalid:       return "token_invalid";
        case errc::not_found:           return "not_found";
        case errc::already_claimed:     return "already_claimed";
        case errc::subject_mismatch:    return "subject_mismatch";
        case errc::provider_failure:    return "provider_failure";
        case errc::pool_stopped:        return "pool_stopped";
        case errc::capacity_exceeded:   return "capacity_exceeded";
        case errc::bad_request:         return "bad_request";
        case errc::shutting_down:       return "shutting_down";
    }
    return "internal_error";
}

} // namespace psmonitor
