#include "endpoint.h"

namespace Crosscheck {

const char* FetchStatusName(FetchStatus status) {
    switch (status) {
        case FetchStatus::OK: return "OK";
        case FetchStatus::TIMEOUT: return "TIMEOUT";
        case FetchStatus::UNAVAILABLE: return "UNAVAILABLE";
        case FetchStatus::INVALID_RESPONSE: return "INVALID_RESPONSE";
        case FetchStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

} // namespace Crosscheck
