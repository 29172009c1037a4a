/** \file    TimeUtil.cc
 *  \brief   Implementations of time-related utility functions.
 *  \author  Dr. Johannes Ruscheinski
 *  \author  Dr. Gordon W. Paynter
 *
 *  \copyright 2003-2008 Project iVia.
 *  \copyright 2003-2008 The Regents of The University of California.
 *  \copyright 2018-2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include "TimeUtil.h"
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>
#include "util.h"


namespace TimeUtil {


std::string GetCurrentDateAndTime(const std::string &format, const TimeZone time_zone) {
    time_t now;
    std::time(&now);
    return TimeTToString(now, format, time_zone);
}


std::string TimeTToString(const time_t &the_time, const std::string &format, const TimeZone time_zone) {
    struct tm tm;
    if (unlikely((time_zone == LOCAL ? ::localtime_r(&the_time, &tm) : ::gmtime_r(&the_time, &tm)) == nullptr))
        LOG_ERROR("time conversion error!");
    char time_buf[50 + 1];
    if (unlikely(std::strftime(time_buf, sizeof(time_buf), format.c_str(), &tm) == 0))
        LOG_ERROR("strftime(3) failed! (format: " + format + ")");
    return time_buf;
}


namespace {


bool ParseDigits(const std::string &s, const size_t start, const size_t count, int * const value) {
    if (start + count > s.length())
        return false;

    *value = 0;
    for (size_t i(start); i < start + count; ++i) {
        if (not std::isdigit(static_cast<unsigned char>(s[i])))
            return false;
        *value = *value * 10 + (s[i] - '0');
    }

    return true;
}


} // unnamed namespace


bool Iso8601StringToMilliseconds(const std::string &iso8601_candidate, int64_t * const milliseconds) {
    struct tm tm;
    std::memset(&tm, 0, sizeof tm);

    int year, month, day;
    if (not ParseDigits(iso8601_candidate, 0, 4, &year) or iso8601_candidate.length() < 10 or iso8601_candidate[4] != '-'
        or not ParseDigits(iso8601_candidate, 5, 2, &month) or iso8601_candidate[7] != '-'
        or not ParseDigits(iso8601_candidate, 8, 2, &day))
        return false;
    if (month < 1 or month > 12 or day < 1 or day > 31)
        return false;
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;

    int fraction_ms(0);
    size_t pos(10);
    if (pos < iso8601_candidate.length()) {
        if (iso8601_candidate[pos] != 'T' and iso8601_candidate[pos] != ' ')
            return false;
        int hour, minute, second;
        if (not ParseDigits(iso8601_candidate, pos + 1, 2, &hour) or iso8601_candidate.length() < pos + 9
            or iso8601_candidate[pos + 3] != ':' or not ParseDigits(iso8601_candidate, pos + 4, 2, &minute)
            or iso8601_candidate[pos + 6] != ':' or not ParseDigits(iso8601_candidate, pos + 7, 2, &second))
            return false;
        if (hour > 23 or minute > 59 or second > 60)
            return false;
        tm.tm_hour = hour;
        tm.tm_min = minute;
        tm.tm_sec = second;
        pos += 9;

        if (pos < iso8601_candidate.length() and iso8601_candidate[pos] == '.') {
            ++pos;
            unsigned digit_count(0);
            while (pos < iso8601_candidate.length() and std::isdigit(static_cast<unsigned char>(iso8601_candidate[pos]))) {
                if (digit_count < 3)
                    fraction_ms = fraction_ms * 10 + (iso8601_candidate[pos] - '0');
                ++digit_count, ++pos;
            }
            if (digit_count == 0)
                return false;
            for (; digit_count < 3; ++digit_count)
                fraction_ms *= 10;
        }

        if (pos < iso8601_candidate.length() and iso8601_candidate[pos] == 'Z')
            ++pos;
        if (pos != iso8601_candidate.length())
            return false;
    }

    const time_t seconds(::timegm(&tm));
    if (seconds == static_cast<time_t>(-1) and not (year == 1969 and month == 12 and day == 31))
        return false;

    *milliseconds = static_cast<int64_t>(seconds) * 1000 + fraction_ms;
    return true;
}


void Millisleep(const unsigned sleep_interval) {
    struct timespec time_remaining;
    time_remaining.tv_sec = sleep_interval / 1000u;
    time_remaining.tv_nsec = static_cast<long>(sleep_interval % 1000u) * 1000000L;
    while (::nanosleep(&time_remaining, &time_remaining) == -1) {
        if (errno != EINTR)
            LOG_ERROR("nanosleep(2) failed!");
    }
}


} // namespace TimeUtil
