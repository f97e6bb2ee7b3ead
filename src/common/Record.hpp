#ifndef LOGRETRY_COMMON_RECORD_HPP
#define LOGRETRY_COMMON_RECORD_HPP

#include <spdlog/common.h>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace logretry {

using Fields = std::vector<std::pair<std::string, std::string>>;

// A log record as handed to a drain. Drains only borrow it for one emit.
struct Record {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string logger;
    std::string message;
    Fields fields;
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now();

    bool operator==(const Record& other) const = default;
};

} // namespace logretry

#endif // LOGRETRY_COMMON_RECORD_HPP
