/** \file   RetryPolicy.h
 *  \brief  Bounded retrying with exponential backoff.
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
#pragma once


#include <functional>
#include <string>
#include "SyncTypes.h"
#include "util.h"


namespace OLSync {


class RetryPolicy {
public:
    typedef std::function<void(const unsigned delay_in_ms, const Stage stage)> Sleeper;
    static constexpr unsigned DEFAULT_MAX_ATTEMPTS = 3;
    static constexpr unsigned DEFAULT_INITIAL_DELAY = 2000; // ms
    static constexpr unsigned DEFAULT_MAX_DELAY = 60000;    // ms
private:
    unsigned max_attempts_;
    unsigned initial_delay_;
    double backoff_factor_;
    unsigned max_delay_;
    Sleeper sleeper_;

public:
    explicit RetryPolicy(const unsigned max_attempts = DEFAULT_MAX_ATTEMPTS, const unsigned initial_delay = DEFAULT_INITIAL_DELAY,
                         const double backoff_factor = 2.0, const unsigned max_delay = DEFAULT_MAX_DELAY);

    inline unsigned getMaxAttempts() const { return max_attempts_; }

    //* \return The time to wait after the "failed_attempt"-th attempt, where the first attempt is 1.
    unsigned getDelay(const unsigned failed_attempt) const;

    //* \note Mainly for testing.  The default sleeper wakes up periodically and throws a CancelledError if requested.
    void setSleeper(const Sleeper &sleeper) { sleeper_ = sleeper; }

    /** \brief  Calls "operation" up to getMaxAttempts() times as long as it throws RetryableError's.
     *  \param  description  Used in log messages, e.g. "downloading ol_dump_authors_latest.txt.gz".
     *  \return Whatever "operation" returns.
     *  \note   Other exceptions, including FatalError and CancelledError, are passed on immediately.  After the last
     *          attempt the last RetryableError is rethrown.
     */
    template<typename Operation> auto run(const std::string &description, const Stage stage, Operation operation) const
        -> decltype(operation())
    {
        for (unsigned attempt(1); /* Intentionally empty! */; ++attempt) {
            CheckForCancellation(stage);
            try {
                return operation();
            } catch (const RetryableError &x) {
                if (attempt >= max_attempts_) {
                    LOG_WARNING(description + " failed for the last time (" + std::to_string(attempt) + "/"
                                + std::to_string(max_attempts_) + "): " + std::string(x.what()));
                    throw;
                }

                const unsigned delay(getDelay(attempt));
                LOG_WARNING(description + " failed (" + std::to_string(attempt) + "/" + std::to_string(max_attempts_) + "): "
                            + std::string(x.what()) + ", retrying in " + std::to_string(delay) + " ms");
                sleeper_(delay, stage);
            }
        }
    }

    //* \brief Sleeps for "delay" ms in short slices and throws a CancelledError if cancellation is requested meanwhile.
    static void InterruptibleSleep(const unsigned delay, const Stage stage);
};


} // namespace OLSync
