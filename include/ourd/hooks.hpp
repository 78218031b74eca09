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

#ifndef OURD_HOOKS_HPP
#define OURD_HOOKS_HPP

#include "ourd/api/handler.hpp"
#include "ourd/common.hpp"
#include "ourd/dynamic.hpp"
#include "ourd/scheduler.hpp"

#include <functional>

namespace ourd { namespace hook {

enum class trigger_t {
    before_save,
    after_save,
    before_delete,
    after_delete
};

/// \throws std::system_error with error::unknown_trigger.
auto
trigger_from_string(const std::string& name) -> trigger_t;

auto
to_string(trigger_t trigger) -> std::string;

// A failing before-* hook aborts the enclosing write.
auto
is_before(trigger_t trigger) -> bool;

// Hook invocables may alter the record, which is visible to the subsequent hooks and to the write
// itself. They report errors by throwing or by failing the request.
typedef std::function<void(request_t& request, dynamic_t& record)> invocable_t;

/// Hooks bound to (record type, trigger) pairs. Write-path handlers consult it through the request,
/// where the "hooks" preprocessor attaches it.
class registry_t {
    OURD_DECLARE_NONCOPYABLE(registry_t)

    struct binding_t {
        std::string name;
        invocable_t invocable;
    };

    typedef std::pair<std::string, trigger_t> key_type;

    const std::unique_ptr<logging::logger_t> m_log;

    std::map<key_type, std::vector<binding_t>> m_hooks;

    bool m_sealed;

public:
    explicit
    registry_t(std::unique_ptr<logging::logger_t> log);

   ~registry_t();

    /// Appends the hook to the list bound to the pair. Multiple hooks may share the same pair.
    void
    insert(const std::string& type, trigger_t trigger, const std::string& name, invocable_t invocable);

    void
    seal();

    auto
    size(const std::string& type, trigger_t trigger) const -> size_t;

    /// Runs the bound hooks in their registration order.
    ///
    /// For before-* triggers the first failure stops the list. For after-* triggers every hook runs
    /// and the first failure is kept on the request.
    ///
    /// \returns true if every invoked hook has succeeded.
    auto
    invoke(const std::string& type, trigger_t trigger, request_t& request, dynamic_t& record) const -> bool;

    /// Bindings as a list of {type, trigger, name} objects.
    auto
    info() const -> dynamic_t;
};

/// Named functions contributed by plugins.
class lambdas_t {
    OURD_DECLARE_NONCOPYABLE(lambdas_t)

    std::map<std::string, std::shared_ptr<api::handler_t>> m_lambdas;

    bool m_sealed;

public:
    lambdas_t();

    /// \throws std::system_error with error::duplicate_lambda on a name collision.
    void
    insert(const std::string& name, std::shared_ptr<api::handler_t> lambda);

    void
    seal();

    auto
    get(const std::string& name) const -> std::shared_ptr<api::handler_t>;

    auto
    names() const -> std::vector<std::string>;
};

/// Scheduled invocables contributed by plugins, fired by the scheduler.
class timers_t {
    OURD_DECLARE_NONCOPYABLE(timers_t)

public:
    struct timer_t {
        std::string name;
        std::string spec;
        schedule_t schedule;
        std::function<void()> invocable;
    };

private:
    std::vector<timer_t> m_timers;

    bool m_sealed;

public:
    timers_t();

    /// \throws std::system_error with error::duplicate_timer on a name collision or with
    /// error::unsupported_schedule if the schedule cannot be parsed.
    void
    insert(const std::string& spec, const std::string& name, std::function<void()> invocable);

    void
    seal();

    auto
    all() const -> const std::vector<timer_t>& {
        return m_timers;
    }
};

}} // namespace ourd::hook

#endif
