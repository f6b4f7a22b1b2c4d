#include "status_error.hpp"

namespace ts3status {

std::string_view describe(error_code code) {
    switch (code) {
        case error_code::connection:      return "Cannot reach the voice server";
        case error_code::auth:            return "Voice server rejected the query login or server selection";
        case error_code::protocol:        return "Voice server returned an unexpected response";
        case error_code::lock_contention: return "Internal cache synchronization failure";
    }
    return "Unknown error";
}

} // namespace ts3status
