#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace quire::engine {

    /**
     * @brief Formats a time point as ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.000Z.
     */
    std::string iso8601_utc(std::chrono::system_clock::time_point tp);

    /**
     * @brief Last-write time of a file as ISO-8601 UTC.
     * @throws std::system_error if the file cannot be stat'ed.
     */
    std::string file_mtime_iso8601(const std::filesystem::path& path);

}
