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

#include "ourd/scheduler.hpp"

#include "ourd/detail/loop.hpp"
#include "ourd/errors.hpp"
#include "ourd/hooks.hpp"
#include "ourd/logging.hpp"

#include <asio/deadline_timer.hpp>

#include <blackhole/logger.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/lexical_cast.hpp>

#include <map>
#include <regex>

using namespace ourd;

namespace bpt = boost::posix_time;
namespace bg  = boost::gregorian;
namespace ph = std::placeholders;

namespace {

struct field_t {
    const char* name;
    unsigned min;
    unsigned max;

    // Lowercase aliases for the values starting from min, if any.
    const char* const* aliases;
};

const char* const month_names[] = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec", nullptr
};

const char* const weekday_names[] = {
    "sun", "mon", "tue", "wed", "thu", "fri", "sat", nullptr
};

const field_t fields[] = {
    { "second",  0, 59, nullptr       },
    { "minute",  0, 59, nullptr       },
    { "hour",    0, 23, nullptr       },
    { "day",     1, 31, nullptr       },
    { "month",   1, 12, month_names   },
    { "weekday", 0,  6, weekday_names }
};

auto
unsupported(const std::string& spec, const std::string& reason) -> error_t {
    return error_t(error::unsupported_schedule, "schedule '{}' is not supported - {}", spec, reason);
}

auto
number(const std::string& token, const std::string& spec) -> unsigned {
    try {
        return boost::lexical_cast<unsigned>(token);
    } catch(const boost::bad_lexical_cast&) {
        throw unsupported(spec, ourd::format("'{}' is not a number", token));
    }
}

auto
value(const std::string& token, const field_t& field, const std::string& spec) -> unsigned {
    if(field.aliases) {
        const auto lowered = boost::algorithm::to_lower_copy(token);

        for(unsigned i = 0; field.aliases[i]; ++i) {
            if(lowered == field.aliases[i]) {
                return field.min + i;
            }
        }
    }

    const auto result = number(token, spec);

    if(result < field.min || result > field.max) {
        throw unsupported(spec, ourd::format("{} {} is out of range [{}, {}]", field.name, result,
            field.min, field.max));
    }

    return result;
}

auto
parse_field(const std::string& text, const field_t& field, const std::string& spec, bool& any) -> uint64_t {
    std::vector<std::string> items;
    boost::algorithm::split(items, text, boost::algorithm::is_any_of(","));

    uint64_t bits = 0;

    for(auto it = items.begin(); it != items.end(); ++it) {
        std::vector<std::string> parts;
        boost::algorithm::split(parts, *it, boost::algorithm::is_any_of("/"));

        if(parts.size() > 2) {
            throw unsupported(spec, ourd::format("{} '{}' has too many steps", field.name, *it));
        }

        unsigned step = 1;

        if(parts.size() == 2) {
            step = number(parts[1], spec);

            if(step == 0) {
                throw unsupported(spec, ourd::format("{} '{}' has zero step", field.name, *it));
            }
        }

        unsigned low;
        unsigned high;

        const auto& range = parts[0];
        const auto dash = range.find('-');

        if(range == "*" || range == "?") {
            low = field.min;
            high = field.max;

            if(step == 1) {
                any = true;
            }
        } else if(dash == std::string::npos) {
            low = value(range, field, spec);

            // A single value with a step runs until the end of the range, e.g. "5/15".
            high = parts.size() == 2 ? field.max : low;
        } else {
            low = value(range.substr(0, dash), field, spec);
            high = value(range.substr(dash + 1), field, spec);
        }

        if(low > high) {
            throw unsupported(spec, ourd::format("{} range '{}' is reversed", field.name, range));
        }

        for(unsigned v = low; v <= high; v += step) {
            bits |= uint64_t(1) << v;
        }
    }

    return bits;
}

bool
has(uint64_t bits, unsigned value) {
    return (bits >> value) & 1;
}

} // namespace

schedule_t::schedule_t():
    seconds(0),
    minutes(0),
    hours(0),
    days(0),
    months(0),
    weekdays(0),
    any_day(false),
    any_weekday(false),
    interval(bpt::seconds(0))
{ }

auto
schedule_t::parse(const std::string& spec) -> schedule_t {
    static const std::map<std::string, std::string> descriptors = {
        { "@yearly",   "0 0 0 1 1 *" },
        { "@annually", "0 0 0 1 1 *" },
        { "@monthly",  "0 0 0 1 * *" },
        { "@weekly",   "0 0 0 * * 0" },
        { "@daily",    "0 0 0 * * *" },
        { "@midnight", "0 0 0 * * *" },
        { "@hourly",   "0 0 * * * *" }
    };

    const auto trimmed = boost::algorithm::trim_copy(spec);

    if(!trimmed.empty() && trimmed[0] == '@') {
        auto it = descriptors.find(trimmed);

        if(it != descriptors.end()) {
            return parse(it->second);
        }

        static const std::regex every("@every\\s+((?:\\d+[hms])+)");
        static const std::regex unit("(\\d+)([hms])");

        std::smatch match;

        if(!std::regex_match(trimmed, match, every)) {
            throw unsupported(spec, "unknown descriptor");
        }

        const std::string duration = match[1].str();

        schedule_t result;

        for(std::sregex_iterator it(duration.begin(), duration.end(), unit), end; it != end; ++it) {
            const auto value = boost::lexical_cast<long>((*it)[1].str());

            switch((*it)[2].str()[0]) {
            case 'h':
                result.interval += bpt::hours(value);
                break;
            case 'm':
                result.interval += bpt::minutes(value);
                break;
            default:
                result.interval += bpt::seconds(value);
            }
        }

        if(result.interval < bpt::seconds(1)) {
            throw unsupported(spec, "interval must be at least one second");
        }

        return result;
    }

    std::vector<std::string> tokens;

    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(),
        boost::algorithm::token_compress_on);

    if(tokens.size() == 5) {
        tokens.push_back("*");
    }

    if(tokens.size() != 6 || tokens[0].empty()) {
        throw unsupported(spec, "expected 5 or 6 fields");
    }

    schedule_t result;
    bool ignored = false;

    result.seconds  = parse_field(tokens[0], fields[0], spec, ignored);
    result.minutes  = parse_field(tokens[1], fields[1], spec, ignored);
    result.hours    = parse_field(tokens[2], fields[2], spec, ignored);
    result.days     = parse_field(tokens[3], fields[3], spec, result.any_day);
    result.months   = parse_field(tokens[4], fields[4], spec, ignored);
    result.weekdays = parse_field(tokens[5], fields[5], spec, result.any_weekday);

    return result;
}

auto
schedule_t::next(const bpt::ptime& now) const -> bpt::ptime {
    if(interval > bpt::seconds(0)) {
        return now + interval;
    }

    // Sub-second precision is dropped, activations happen on whole seconds.
    auto t = bpt::ptime(now.date(), bpt::seconds(now.time_of_day().total_seconds())) + bpt::seconds(1);

    const auto limit = t.date().year() + 5;

    // Every step moves to the start of the next candidate unit and restarts the checks from the
    // coarsest field.
    while(t.date().year() <= limit) {
        const auto date = t.date();
        const auto time = t.time_of_day();

        if(!has(months, date.month())) {
            t = bpt::ptime(bg::date(date.year(), date.month(), 1) + bg::months(1));
            continue;
        }

        const bool day = has(days, date.day());
        const bool weekday = has(weekdays, date.day_of_week().as_number());

        if(any_day || any_weekday ? !(day && weekday) : !(day || weekday)) {
            t = bpt::ptime(date + bg::days(1));
            continue;
        }

        if(!has(hours, time.hours())) {
            t = bpt::ptime(date, bpt::hours(time.hours() + 1));
            continue;
        }

        if(!has(minutes, time.minutes())) {
            t = bpt::ptime(date, bpt::hours(time.hours()) + bpt::minutes(time.minutes() + 1));
            continue;
        }

        if(!has(seconds, time.seconds())) {
            t += bpt::seconds(1);
            continue;
        }

        return t;
    }

    return bpt::not_a_date_time;
}

// Scheduler internals

class scheduler_t::entry_t:
    public std::enable_shared_from_this<entry_t>
{
    logging::logger_t& log;

    const hook::timers_t::timer_t& timer;

    asio::deadline_timer deadline;

    // Accessed only from the scheduler thread.
    bool cancelled;

public:
    entry_t(logging::logger_t& log_, const hook::timers_t::timer_t& timer_, asio::io_service& loop):
        log(log_),
        timer(timer_),
        deadline(loop),
        cancelled(false)
    { }

    void
    arm() {
        if(cancelled) {
            return;
        }

        const auto at = timer.schedule.next(bpt::microsec_clock::universal_time());

        if(at.is_not_a_date_time()) {
            OURD_LOG_WARNING(log, "timer '{}' is never going to fire again", timer.name);
            return;
        }

        OURD_LOG_DEBUG(log, "timer '{}' is going to fire at {}", timer.name, bpt::to_simple_string(at));

        deadline.expires_at(at);
        deadline.async_wait(std::bind(&entry_t::on_timer, shared_from_this(), ph::_1));
    }

    void
    cancel() {
        cancelled = true;
        deadline.cancel();
    }

private:
    void
    on_timer(const std::error_code& ec) {
        if(ec == asio::error::operation_aborted || cancelled) {
            return;
        }

        OURD_LOG_INFO(log, "firing timer '{}'", timer.name);

        try {
            timer.invocable();
        } catch(const std::system_error& e) {
            OURD_LOG_ERROR(log, "timer '{}' has failed: {}", timer.name, error::to_string(e));
        } catch(const std::exception& e) {
            OURD_LOG_ERROR(log, "timer '{}' has failed: {}", timer.name, e.what());
        }

        arm();
    }
};

// Scheduler

scheduler_t::scheduler_t(const hook::timers_t& timers, std::unique_ptr<logging::logger_t> log):
    m_log(std::move(log)),
    m_timers(timers)
{ }

scheduler_t::~scheduler_t() {
    stop();
}

void
scheduler_t::start() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if(m_loop) {
        return;
    }

    m_loop.reset(new io::loop_t("ourd/scheduler"));

    for(auto it = m_timers.all().begin(); it != m_timers.all().end(); ++it) {
        auto entry = std::make_shared<entry_t>(*m_log, *it, m_loop->service());

        m_loop->service().post(std::bind(&entry_t::arm, entry));
        m_entries.push_back(entry);
    }

    OURD_LOG_INFO(m_log, "scheduler has been started with {} timer(s)", m_entries.size());
}

void
scheduler_t::stop() {
    std::lock_guard<std::mutex> lock(m_mutex);

    if(!m_loop) {
        return;
    }

    for(auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        m_loop->service().post(std::bind(&entry_t::cancel, *it));
    }

    // Joins the scheduler thread once the cancellations have been processed.
    m_loop.reset();
    m_entries.clear();

    OURD_LOG_INFO(m_log, "scheduler has been stopped");
}
