/** \file   RetryPolicy.cc
 *  \brief  Implementation of class RetryPolicy.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
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
#include "RetryPolicy.h"
#include <algorithm>
#include <cmath>
#include "TimeUtil.h"


namespace OLSync {


constexpr unsigned RetryPolicy::DEFAULT_MAX_ATTEMPTS;
constexpr unsigned RetryPolicy::DEFAULT_INITIAL_DELAY;
constexpr unsigned RetryPolicy::DEFAULT_MAX_DELAY;


RetryPolicy::RetryPolicy(const unsigned max_attempts, const unsigned initial_delay, const double backoff_factor,
                         const unsigned max_delay)
    : max_attempts_(max_attempts), initial_delay_(initial_delay), backoff_factor_(backoff_factor), max_delay_(max_delay),
      sleeper_(InterruptibleSleep)
{
    if (unlikely(max_attempts_ == 0))
        throw std::runtime_error("in RetryPolicy::RetryPolicy: max_attempts must be at least 1!");
    if (unlikely(backoff_factor_ < 1.0))
        throw std::runtime_error("in RetryPolicy::RetryPolicy: backoff_factor must not be less than 1!");
}


unsigned RetryPolicy::getDelay(const unsigned failed_attempt) const {
    const double delay(initial_delay_ * std::pow(backoff_factor_, failed_attempt == 0 ? 0 : failed_attempt - 1));
    return delay >= max_delay_ ? max_delay_ : static_cast<unsigned>(delay);
}


void RetryPolicy::InterruptibleSleep(const unsigned delay, const Stage stage) {
    const unsigned SLICE(250); // ms
    unsigned remaining(delay);
    while (remaining > 0) {
        CheckForCancellation(stage);
        const unsigned slice(std::min(SLICE, remaining));
        TimeUtil::Millisleep(slice);
        remaining -= slice;
    }
    CheckForCancellation(stage);
}


} // namespace OLSync
