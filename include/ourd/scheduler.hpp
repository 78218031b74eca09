/*
    Copyright (c) 2026 The Ourd Authors.

    This file is part of Ourd.

    Ourd is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.

    Ourd is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef OURD_SCHEDULER_HPP
#define OURD_SCHEDULER_HPP

#include "ourd/common.hpp"

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <mutex>

namespace ourd {

/// Parsed timer schedule.
///
/// Accepts cron expressions with a leading seconds field, "sec min hour day month [weekday]", where
/// each field is a comma-separated list of "*", "?", values and ranges, any of them followed by an
/// optional "/step". Months and weekdays may be given by their three-letter English names. When the
/// weekday field is omitted it matches any day. The "@yearly" ("@annually"), "@monthly", "@weekly",
/// "@daily" ("@midnight") and "@hourly" descriptors are accepted, as well as "@every <duration>"
/// with combinable "h", "m" and "s" units, e.g. "@every 1h30m". All times are UTC.
struct schedule_t {
    // Allowed values of every field, bit N standing for the value N.
    uint64_t seconds;
    uint64_t minutes;
    uint64_t hours;
    uint64_t days;
    uint64_t months;
    uint64_t weekdays;

    // Set when the day or weekday field is a bare wildcard. Days then have to match both fields
    // instead of either one.
    bool any_day;
    bool any_weekday;

    // Positive for "@every" schedules only.
    boost::posix_time::time_duration interval;

    schedule_t();

    /// 	hrows std::system_error with error::unsupported_schedule.
    static
    auto
    parse(const std::string& spec) -> schedule_t;

    /// Returns the first activation strictly after the given moment, or not_a_date_time if the
    /// schedule has none within the next five years.
    auto
    next(const boost::posix_time::ptime& now) const -> boost::posix_time::ptime;
};

/// Fires registered timers on their own thread.
class scheduler_t {
    OURD_DECLARE_NONCOPYABLE(scheduler_t)

    class entry_t;

    const std::unique_ptr<logging::logger_t> m_log;
    const hook::timers_t& m_timers;

    std::mutex m_mutex;

    std::unique_ptr<io::loop_t> m_loop;
    std::vector<std::shared_ptr<entry_t>> m_entries;

public:
    scheduler_t(const hook::timers_t& timers, std::unique_ptr<logging::logger_t> log);
   ~scheduler_t();

    void
    start();

    /// Cancels all the timers and waits for a running one to finish.
    void
    stop();

    auto
    size() const -> size_t {
        return m_entries.size();
    }
};

} // namespace ourd

#endif
