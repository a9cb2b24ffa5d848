#include "parkspot/time_utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace parkspot {

std::string TimeUtils::toIso8601Utc(std::chrono::system_clock::time_point tp) {
    const int64_t ms = toEpochMs(tp);
    int64_t sec = ms / 1000;
    int64_t rem = ms % 1000;
    if (rem < 0) { rem += 1000; --sec; }

    time_t t = static_cast<time_t>(sec);
    struct tm utc_tm{};
#ifdef _WIN32
    gmtime_s(&utc_tm, &t);
#else
    gmtime_r(&t, &utc_tm);
#endif
    std::stringstream ss;
    ss << std::put_time(&utc_tm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << rem << 'Z';
    return ss.str();
}

std::string TimeUtils::getCurrentTimestamp() {
    return toIso8601Utc(std::chrono::system_clock::now());
}

int64_t TimeUtils::toEpochMs(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TimeUtils::fromEpochMs(int64_t ms) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace parkspot
