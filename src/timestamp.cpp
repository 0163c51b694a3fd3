#include "pausaler/timestamp.hpp"
#include <ctime>

namespace pausaler::timestamp
{
    using namespace std::chrono;

    namespace
    {
        bool read_digits(const std::string &s, size_t pos, size_t count, int &out)
        {
            if (pos + count > s.size())
                return false;
            int value = 0;
            for (size_t i = pos; i < pos + count; ++i)
            {
                char c = s[i];
                if (c < '0' || c > '9')
                    return false;
                value = value * 10 + (c - '0');
            }
            out = value;
            return true;
        }

        bool expect_char(const std::string &s, size_t pos, char a, char b = '\0')
        {
            return pos < s.size() && (s[pos] == a || (b != '\0' && s[pos] == b));
        }

        LicenseError bad(const std::string &text, const std::string &why)
        {
            return LicenseError::timestamp("invalid datetime '" + text + "': " + why);
        }
    } // namespace

    std::string format_rfc3339(TimePoint tp)
    {
        auto t = system_clock::to_time_t(floor_seconds(tp));
        std::tm tm_utc;
        gmtime_r(&t, &tm_utc);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
        return buffer;
    }

    Result<TimePoint> parse_rfc3339(const std::string &text)
    {
        // date-time = YYYY-MM-DD "T" HH:MM:SS [.frac] ("Z" / ("+"/"-") HH:MM)
        int year, month, day, hour, minute, second;
        if (!read_digits(text, 0, 4, year) || !expect_char(text, 4, '-') ||
            !read_digits(text, 5, 2, month) || !expect_char(text, 7, '-') ||
            !read_digits(text, 8, 2, day))
        {
            return std::unexpected(bad(text, "malformed date"));
        }
        if (!expect_char(text, 10, 'T', 't'))
        {
            return std::unexpected(bad(text, "missing 'T' separator"));
        }
        if (!read_digits(text, 11, 2, hour) || !expect_char(text, 13, ':') ||
            !read_digits(text, 14, 2, minute) || !expect_char(text, 16, ':') ||
            !read_digits(text, 17, 2, second))
        {
            return std::unexpected(bad(text, "malformed time"));
        }

        year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                           std::chrono::day{static_cast<unsigned>(day)}};
        if (!ymd.ok())
        {
            return std::unexpected(bad(text, "date out of range"));
        }
        if (hour > 23 || minute > 59 || second > 59)
        {
            return std::unexpected(bad(text, "time out of range"));
        }

        size_t pos = 19;
        nanoseconds fraction{0};
        if (expect_char(text, pos, '.'))
        {
            ++pos;
            size_t start = pos;
            int64_t nanos = 0;
            int64_t scale = 100000000;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                nanos += (text[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
            if (pos == start)
            {
                return std::unexpected(bad(text, "empty fractional seconds"));
            }
            fraction = nanoseconds{nanos};
        }

        minutes offset{0};
        if (expect_char(text, pos, 'Z', 'z'))
        {
            ++pos;
        }
        else if (expect_char(text, pos, '+', '-'))
        {
            bool negative = text[pos] == '-';
            int off_h, off_m;
            if (!read_digits(text, pos + 1, 2, off_h) || !expect_char(text, pos + 3, ':') ||
                !read_digits(text, pos + 4, 2, off_m) || off_h > 23 || off_m > 59)
            {
                return std::unexpected(bad(text, "malformed offset"));
            }
            offset = hours{off_h} + minutes{off_m};
            if (negative)
                offset = -offset;
            pos += 6;
        }
        else
        {
            return std::unexpected(bad(text, "missing offset"));
        }

        if (pos != text.size())
        {
            return std::unexpected(bad(text, "trailing characters"));
        }

        auto local = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second};
        auto utc = local - offset;
        return TimePoint{duration_cast<system_clock::duration>(utc.time_since_epoch() + fraction)};
    }

    TimePoint floor_seconds(TimePoint tp)
    {
        return TimePoint{duration_cast<system_clock::duration>(floor<seconds>(tp).time_since_epoch())};
    }

    int64_t to_unix_seconds(TimePoint tp)
    {
        return duration_cast<seconds>(floor<seconds>(tp).time_since_epoch()).count();
    }

    TimePoint from_unix_seconds(int64_t value)
    {
        return TimePoint{duration_cast<system_clock::duration>(seconds{value})};
    }

} // namespace pausaler::timestamp
