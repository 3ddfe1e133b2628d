#include "data_structures.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace GiftSniper {
namespace Core {

std::string format_stars(double stars) {
    double whole_part = 0.0;
    double fractional_part = std::modf(stars, &whole_part);
    std::ostringstream stars_stream;
    if (std::fabs(fractional_part) < 1.0 / NANOS_PER_STAR) {
        stars_stream << std::fixed << std::setprecision(0) << whole_part;
        return stars_stream.str();
    }

    stars_stream << std::fixed << std::setprecision(9) << stars;
    std::string formatted = stars_stream.str();
    while (!formatted.empty() && formatted.back() == '0') {
        formatted.pop_back();
    }
    if (!formatted.empty() && formatted.back() == '.') {
        formatted.pop_back();
    }
    return formatted;
}

const char* to_string(AcquisitionState state) {
    switch (state) {
        case AcquisitionState::AUTHENTICATING: return "AUTHENTICATING";
        case AcquisitionState::POLLING_CATALOG: return "POLLING_CATALOG";
        case AcquisitionState::EVALUATING_OFFERS: return "EVALUATING_OFFERS";
        case AcquisitionState::VERIFYING_BALANCE: return "VERIFYING_BALANCE";
        case AcquisitionState::ATTEMPTING_PURCHASE: return "ATTEMPTING_PURCHASE";
        case AcquisitionState::DONE: return "DONE";
    }
    return "UNKNOWN";
}

const char* to_string(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::SUCCESS: return "success";
        case RunOutcome::CANCELLED: return "cancelled";
        case RunOutcome::ERROR: return "error";
    }
    return "unknown";
}

} // namespace Core
} // namespace GiftSniper
