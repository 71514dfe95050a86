#include "timestamp.hpp"
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <system_error>
#include <sys/stat.h>

namespace quire::engine {

    namespace {
        std::string format(std::time_t seconds, long millis) {
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            char date[32];
            std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
            char out[48];
            std::snprintf(out, sizeof(out), "%s.%03ldZ", date, millis);
            return out;
        }
    }

    std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
        std::time_t seconds = static_cast<std::time_t>(ms / 1000);
        long millis = static_cast<long>(ms % 1000);
        if (millis < 0) {
            millis += 1000;
            seconds -= 1;
        }
        return format(seconds, millis);
    }

    std::string file_mtime_iso8601(const std::filesystem::path& path) {
        struct stat st;
        if (::stat(path.c_str(), &st) != 0) {
            throw std::system_error(errno, std::generic_category(), "stat " + path.string());
        }
        return format(st.st_mtim.tv_sec, st.st_mtim.tv_nsec / 1000000);
    }

}
