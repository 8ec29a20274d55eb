#include "infrastructure/TimeUtils.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace chlog::infrastructure {

namespace {

long long MicrosOfSecond(std::chrono::system_clock::time_point tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
    long long frac = micros % 1000000;
    return frac < 0 ? frac + 1000000 : frac;
}

std::string Format(const std::tm& tm, const char* format) {
    if (format[0] == '\0') return "";
    // strftime returns 0 when the buffer is too small; grow and retry.
    for (std::size_t size = 256; size <= 65536; size *= 4) {
        std::vector<char> buf(size);
        std::size_t len = std::strftime(buf.data(), buf.size(), format, &tm);
        if (len > 0) return std::string(buf.data(), len);
    }
    std::cerr << "[TimeUtils] Format '" << format << "' produced no output" << std::endl;
    return "";
}

} // namespace

std::tm TimeUtils::ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

std::string TimeUtils::ToIso(std::chrono::system_clock::time_point tp) {
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(tp));
    std::stringstream ss;
    ss << Format(tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(6) << std::setfill('0') << MicrosOfSecond(tp);
    return ss.str();
}

std::string TimeUtils::NowIso() {
    return ToIso(std::chrono::system_clock::now());
}

std::string TimeUtils::FormatNow(const std::string& format) {
    std::tm tm = ToLocalTime(std::time(nullptr));
    return Format(tm, format.c_str());
}

std::string TimeUtils::MakeChangeId(std::chrono::system_clock::time_point tp) {
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(tp));
    std::stringstream ss;
    ss << "chg_" << Format(tm, "%Y%m%d%H%M%S") << std::setw(6) << std::setfill('0') << MicrosOfSecond(tp);
    return ss.str();
}

} // namespace chlog::infrastructure
