// include/macross/core/time_utils.hpp

#pragma once

#include <time.h>
#include <chrono>
#include <ctime>
#include <string>
#include "macross/core/types.hpp"

namespace macross {
namespace core {

/**
 * @brief Thread-safe wrapper for localtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_localtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (localtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return localtime_r(time, result);
#endif
}

/**
 * @brief Thread-safe wrapper for gmtime
 * @return Pointer to the result tm struct on success, nullptr on failure
 */
inline std::tm* safe_gmtime(const std::time_t* time, std::tm* result) {
#ifdef _WIN32
    if (gmtime_s(result, time) != 0) {
        return nullptr;
    }
    return result;
#else
    return gmtime_r(time, result);
#endif
}

/**
 * @brief Get current local time as a string with a strftime format
 */
inline std::string get_formatted_time(const char* format) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm result;
    safe_localtime(&now_c, &result);

    char buffer[128];
    std::strftime(buffer, sizeof(buffer), format, &result);
    return std::string(buffer);
}

/**
 * @brief Format a bar timestamp as UTC "YYYY-MM-DD HH:MM:SS"
 */
inline std::string format_timestamp(const Timestamp& ts) {
    auto time_c = std::chrono::system_clock::to_time_t(ts);
    std::tm result;
    if (safe_gmtime(&time_c, &result) == nullptr) {
        return "";
    }

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &result);
    return std::string(buffer);
}

}  // namespace core
}  // namespace macross
