/** \file    TimeUtil.h
 *  \brief   Declarations of time-related utility functions.
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
#pragma once


#include <limits>
#include <string>
#include <cinttypes>
#include <ctime>


namespace TimeUtil {


enum TimeZone { LOCAL, UTC };


constexpr time_t BAD_TIME_T = std::numeric_limits<time_t>::min();


const std::string ISO_8601_FORMAT("%Y-%m-%dT%T"); // This is only one of several possible ISO 8601 date/time formats!
const std::string ZULU_FORMAT("%Y-%m-%dT%TZ");
const std::string DEFAULT_FORMAT("%Y-%m-%d %T");


/** \brief  Get the current date and time as a string.
 *  \param  format     The format of the date and time, see strftime(3).
 *  \param  time_zone  Whether to use local time or UTC.
 */
std::string GetCurrentDateAndTime(const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


std::string TimeTToString(const time_t &the_time, const std::string &format = DEFAULT_FORMAT, const TimeZone time_zone = LOCAL);


/** \brief  Parses "YYYY-MM-DD" or "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an optional trailing "Z".
 *  \param  iso8601_candidate  The string to parse.  It is always interpreted as UTC.
 *  \param  milliseconds       Milliseconds since the Unix epoch.
 *  \return False if "iso8601_candidate" was not in one of the recognised forms.
 */
bool Iso8601StringToMilliseconds(const std::string &iso8601_candidate, int64_t * const milliseconds);


/** \brief  Suspends the current thread for "sleep_interval" milliseconds. */
void Millisleep(const unsigned sleep_interval);


} // namespace TimeUtil
