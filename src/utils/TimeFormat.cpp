#include "TimeFormat.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace termroute {

std::string to_iso8601(Timestamp tp) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    const std::time_t secs = Clock::to_time_t(tp);

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms.count() << 'Z';
    return out.str();
}

}  // namespace termroute
