#include "utils.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For string streams
#include <string>
#include <stdexcept>  // For std::runtime_error
#include <cmath>      // For std::pow, std::round
#include <cctype>     // For std::isdigit
#include <ctime>
#include <atomic>

namespace core {
namespace utils {

    namespace {

        std::tm toUtcTm(std::time_t tt) {
            std::tm time_tm{};
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw std::runtime_error("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, digits.length());
            }
        }

        // 3. Timezone: Z or +HH:MM / -HH:MM. Missing designator is read as UTC.
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (ss >> sign_or_z) {
            if (sign_or_z == 'Z') {
                offset_duration = std::chrono::seconds(0);
            } else if (sign_or_z == '+' || sign_or_z == '-') {
                int offset_h = 0;
                int offset_m = 0;
                char colon = ' ';
                if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                    throw std::runtime_error("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
                }
                offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
                if (sign_or_z == '-') {
                    offset_duration *= -1;
                }
            } else {
                throw std::runtime_error("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
            }
        }

        #ifdef _WIN32
            time_t tt = _mkgmtime(&tm);
        #else
            time_t tt = timegm(&tm);
        #endif
        if (tt == (time_t)-1) {
            throw std::runtime_error("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2024-03-01T05:30:00+05:30 is 2024-03-01T00:00:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        auto tt = std::chrono::system_clock::to_time_t(ts);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()) % 1000;
        if (ms.count() < 0) {
            ms += std::chrono::seconds{1};
            tt -= 1;
        }

        std::tm time_tm = toUtcTm(tt);
        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    Timestamp fromUnixSeconds(double seconds) {
        return Timestamp(std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(seconds)));
    }

    long long toUnixSeconds(const Timestamp& ts) {
        return std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    }

    bool sameUtcDay(const Timestamp& a, const Timestamp& b) {
        std::tm ta = toUtcTm(std::chrono::system_clock::to_time_t(a));
        std::tm tb = toUtcTm(std::chrono::system_clock::to_time_t(b));
        return ta.tm_year == tb.tm_year && ta.tm_yday == tb.tm_yday;
    }

    double roundTo(double value, int decimals) {
        if (decimals < 0) return value;
        double factor = std::pow(10.0, decimals);
        return std::round(value * factor) / factor;
    }

    unsigned long long nextNonce() {
        static std::atomic<unsigned long long> last{0};
        unsigned long long now = static_cast<unsigned long long>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        unsigned long long prev = last.load();
        unsigned long long next = 0;
        do {
            next = (now > prev) ? now : prev + 1;
        } while (!last.compare_exchange_weak(prev, next));
        return next;
    }

} // namespace utils
} // namespace core
