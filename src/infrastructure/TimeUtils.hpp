/**
 * @file TimeUtils.hpp
 * @brief Local-time formatting helpers and change id generation.
 */

#pragma once
#include <chrono>
#include <ctime>
#include <string>

namespace chlog::infrastructure {

class TimeUtils {
public:
    static std::tm ToLocalTime(std::time_t tt);

    /// Local time as "YYYY-MM-DDThh:mm:ss.ffffff".
    static std::string ToIso(std::chrono::system_clock::time_point tp);
    static std::string NowIso();

    /// strftime over the current local time.
    static std::string FormatNow(const std::string& format);

    /// "chg_YYYYMMDDhhmmssffffff" for the given instant.
    static std::string MakeChangeId(std::chrono::system_clock::time_point tp);
};

} // namespace chlog::infrastructure
