#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <stdexcept>

namespace hedge {
namespace time_utils {

std::string to_iso8601(WallClock t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()) % 1000;

    std::tm tm = *std::gmtime(&time_t);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';

    return ss.str();
}

std::string to_iso8601(int64_t epoch_ms) {
    auto tp = WallClock(std::chrono::milliseconds(epoch_ms));
    return to_iso8601(tp);
}

int64_t epoch_ms_from_iso8601(const std::string& s) {
    std::tm tm = {};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        throw std::invalid_argument("not an ISO 8601 timestamp: " + s);
    }

    int64_t ms = static_cast<int64_t>(timegm(&tm)) * 1000;

    // Fractional seconds, first three digits only
    size_t dot_pos = s.find('.');
    if (dot_pos != std::string::npos) {
        std::string frac;
        for (size_t i = dot_pos + 1; i < s.size() && frac.size() < 3; ++i) {
            if (s[i] < '0' || s[i] > '9') break;
            frac += s[i];
        }
        while (!frac.empty() && frac.size() < 3) frac += '0';
        if (!frac.empty()) ms += std::stoi(frac);
    }

    return ms;
}

std::string now_iso8601() {
    return to_iso8601(wall_now());
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        double sec = ms / 1000.0;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << sec << "s";
        return ss.str();
    } else {
        int64_t min = ms / 60000;
        int64_t sec = (ms % 60000) / 1000;
        return std::to_string(min) + "m" + std::to_string(sec) + "s";
    }
}

} // namespace time_utils
} // namespace hedge
