#ifndef PARKSPOT_TIME_UTILS_HPP
#define PARKSPOT_TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <cstdint>

namespace parkspot {

class TimeUtils {
public:
    // "2025-07-02T14:03:11.250Z"
    static std::string toIso8601Utc(std::chrono::system_clock::time_point tp);
    static std::string getCurrentTimestamp();
    static int64_t toEpochMs(std::chrono::system_clock::time_point tp);
    static std::chrono::system_clock::time_point fromEpochMs(int64_t ms);
};

} // namespace parkspot

#endif // PARKSPOT_TIME_UTILS_HPP
