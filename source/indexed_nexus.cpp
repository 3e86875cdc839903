// indexed_nexus.cpp
// Staleness checks and diagnostics for dynamically derived nexus lenses

#include <lager_optics/indexed_nexus.h>

#include <iostream>

namespace lager_optics {

namespace {

std::string get_error_message(NexusErrorCode code, const NexusFingerprint& fingerprint,
                              std::size_t actual_length)
{
    switch (code) {
        case NexusErrorCode::Success:
            return "Success";
        case NexusErrorCode::LengthMismatch:
            return "Stale accessor: lens for position " + std::to_string(fingerprint.index) +
                   " was derived from a list of length " + std::to_string(fingerprint.length) +
                   " but applied to a list of length " + std::to_string(actual_length);
        case NexusErrorCode::IndexOutOfRange:
            return "Stale accessor: position " + std::to_string(fingerprint.index) +
                   " is out of range for a list of length " + std::to_string(actual_length);
    }
    return "Unknown error";
}

} // namespace

StaleAccessorError::StaleAccessorError(const NexusCheckResult& result)
    : std::runtime_error(result.error_message)
    , code_(result.error_code)
    , fingerprint_(result.fingerprint)
    , actual_length_(result.actual_length)
{
}

NexusCheckResult check_nexus(const NexusFingerprint& fingerprint, std::size_t actual_length)
{
    NexusCheckResult result;
    result.fingerprint = fingerprint;
    result.actual_length = actual_length;

    if (actual_length != fingerprint.length) {
        result.error_code = NexusErrorCode::LengthMismatch;
    } else if (fingerprint.index >= actual_length) {
        result.error_code = NexusErrorCode::IndexOutOfRange;
    } else {
        result.success = true;
        return result;
    }

    result.error_message = get_error_message(result.error_code, fingerprint, actual_length);
    return result;
}

void report_stale_accessor(const char* where, const NexusCheckResult& result)
{
    std::cerr << "[" << where << "] " << result.error_message << "\n";
}

void reject_stale_set(const char* where, const NexusCheckResult& result)
{
#if LAGER_OPTICS_STRICT_NEXUS
    (void)where;
    throw StaleAccessorError{result};
#else
    report_stale_accessor(where, result);
#endif
}

} // namespace lager_optics
