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

#include "ourd/errors.hpp"

#include <map>
#include <utility>

using namespace ourd;
using namespace ourd::error;

namespace {

class transport_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "ourd.transport";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case ourd::error::transport_errors::parse_error:
            return "unable to parse the incoming data";
        case ourd::error::transport_errors::frame_too_large:
            return "message exceeds the maximum frame size";
        default:
            return "ourd.transport error";
        }
    }
};

class dispatch_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "ourd.dispatch";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case ourd::error::dispatch_errors::unknown_action:
            return "unknown action";
        case ourd::error::dispatch_errors::malformed_request:
            return "request is malformed";
        case ourd::error::dispatch_errors::method_not_allowed:
            return "method is not allowed";
        case ourd::error::dispatch_errors::uncaught_error:
            return "uncaught invocation exception";
        default:
            return "ourd.dispatch error";
        }
    }
};

class registry_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "ourd.registry";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case ourd::error::registry_errors::duplicate_action:
            return "action is already registered";
        case ourd::error::registry_errors::duplicate_lambda:
            return "lambda is already registered";
        case ourd::error::registry_errors::duplicate_timer:
            return "timer is already registered";
        case ourd::error::registry_errors::duplicate_component:
            return "duplicate component";
        case ourd::error::registry_errors::component_not_found:
            return "component is not available";
        case ourd::error::registry_errors::registry_sealed:
            return "registration phase is over";
        default:
            return "ourd.registry error";
        }
    }
};

class security_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "ourd.security";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case ourd::error::security_errors::missing_api_key:
            return "api key is not specified";
        case ourd::error::security_errors::invalid_api_key:
            return "api key is invalid";
        case ourd::error::security_errors::master_key_required:
            return "master key is required";
        case ourd::error::security_errors::invalid_access_token:
            return "access token is invalid";
        case ourd::error::security_errors::access_token_expired:
            return "access token has expired";
        case ourd::error::security_errors::user_required:
            return "authenticated user is required";
        default:
            return "ourd.security error";
        }
    }
};

class plugin_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "ourd.plugin";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case ourd::error::plugin_errors::handshake_timeout:
            return "timed out while waiting for handshake";
        case ourd::error::plugin_errors::handshake_failed:
            return "plugin handshake has failed";
        case ourd::error::plugin_errors::process_exited:
            return "plugin process has exited";
        case ourd::error::plugin_errors::call_timeout:
            return "timed out while waiting for plugin response";
        case ourd::error::plugin_errors::protocol_violation:
            return "plugin protocol violation";
        case ourd::error::plugin_errors::pool_exhausted:
            return "no plugin process is available";
        case ourd::error::plugin_errors::plugin_disabled:
            return "plugin is disabled";
        case ourd::error::plugin_errors::remote_error:
            return "plugin has returned an error";
        case ourd::error::plugin_errors::spawn_failed:
            return "unable to spawn plugin process";
        case ourd::error::plugin_errors::pool_shutdown:
            return "plugin pool is shutting down";
        case ourd::error::plugin_errors::invalid_transition:
            return "invalid plugin process state transition";
        default:
            return "ourd.plugin error";
        }
    }
};

class hook_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "ourd.hook";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case ourd::error::hook_errors::unknown_trigger:
            return "unknown hook trigger";
        case ourd::error::hook_errors::unsupported_schedule:
            return "unsupported timer schedule";
        default:
            return "ourd.hook error";
        }
    }
};

auto
transport_category() -> const std::error_category& {
    static transport_category_t instance;
    return instance;
}

auto
dispatch_category() -> const std::error_category& {
    static dispatch_category_t instance;
    return instance;
}

auto
registry_category() -> const std::error_category& {
    static registry_category_t instance;
    return instance;
}

auto
hook_category() -> const std::error_category& {
    static hook_category_t instance;
    return instance;
}

} // namespace

namespace ourd { namespace error {

auto
plugin_category() -> const std::error_category& {
    static plugin_category_t instance;
    return instance;
}

auto
security_category() -> const std::error_category& {
    static security_category_t instance;
    return instance;
}

auto
make_error_code(transport_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), transport_category());
}

auto
make_error_code(dispatch_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), dispatch_category());
}

auto
make_error_code(registry_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), registry_category());
}

auto
make_error_code(security_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), security_category());
}

auto
make_error_code(plugin_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), plugin_category());
}

auto
make_error_code(hook_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), hook_category());
}

std::string
to_string(const std::system_error& e) {
    return ourd::format("[{}] {}", e.code().value(), e.what());
}

std::string
name(const std::error_code& ec) {
    static const std::map<std::pair<const std::error_category*, int>, const char*> names = {
        {{&transport_category(), transport_errors::parse_error},        "parse_error"        },
        {{&transport_category(), transport_errors::frame_too_large},    "frame_too_large"    },
        {{&dispatch_category(),  dispatch_errors::unknown_action},      "unknown_action"     },
        {{&dispatch_category(),  dispatch_errors::malformed_request},   "malformed_request"  },
        {{&dispatch_category(),  dispatch_errors::method_not_allowed},  "method_not_allowed" },
        {{&dispatch_category(),  dispatch_errors::uncaught_error},      "uncaught_error"     },
        {{&registry_category(),  registry_errors::duplicate_action},    "duplicate_action"   },
        {{&registry_category(),  registry_errors::duplicate_lambda},    "duplicate_lambda"   },
        {{&registry_category(),  registry_errors::duplicate_timer},     "duplicate_timer"    },
        {{&registry_category(),  registry_errors::duplicate_component}, "duplicate_component"},
        {{&registry_category(),  registry_errors::component_not_found}, "component_not_found"},
        {{&registry_category(),  registry_errors::registry_sealed},     "registry_sealed"    },
        {{&security_category(),  security_errors::missing_api_key},     "missing_api_key"    },
        {{&security_category(),  security_errors::invalid_api_key},     "invalid_api_key"    },
        {{&security_category(),  security_errors::master_key_required}, "master_key_required"},
        {{&security_category(),  security_errors::invalid_access_token},"invalid_access_token"},
        {{&security_category(),  security_errors::access_token_expired},"access_token_expired"},
        {{&security_category(),  security_errors::user_required},       "user_required"      },
        {{&plugin_category(),    plugin_errors::handshake_timeout},     "handshake_timeout"  },
        {{&plugin_category(),    plugin_errors::handshake_failed},      "handshake_failed"   },
        {{&plugin_category(),    plugin_errors::process_exited},        "process_exited"     },
        {{&plugin_category(),    plugin_errors::call_timeout},          "call_timeout"       },
        {{&plugin_category(),    plugin_errors::protocol_violation},    "protocol_violation" },
        {{&plugin_category(),    plugin_errors::pool_exhausted},        "pool_exhausted"     },
        {{&plugin_category(),    plugin_errors::plugin_disabled},       "plugin_disabled"    },
        {{&plugin_category(),    plugin_errors::remote_error},          "remote_error"       },
        {{&plugin_category(),    plugin_errors::spawn_failed},          "spawn_failed"       },
        {{&plugin_category(),    plugin_errors::pool_shutdown},         "pool_shutdown"      },
        {{&plugin_category(),    plugin_errors::invalid_transition},    "invalid_transition" },
        {{&hook_category(),      hook_errors::unknown_trigger},         "unknown_trigger"    },
        {{&hook_category(),      hook_errors::unsupported_schedule},    "unsupported_schedule"}
    };

    auto it = names.find(std::make_pair(&ec.category(), ec.value()));

    if(it == names.end()) {
        return std::string();
    }

    return it->second;
}

const std::error_code
error_t::kInvalidArgumentErrorCode = std::make_error_code(std::errc::invalid_argument);

}} // namespace ourd::error
