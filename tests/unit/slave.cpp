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

#include <gmock/gmock.h>

#include "ourd/errors.hpp"
#include "ourd/plugin/slave.hpp"

#include "fake.hpp"

namespace ourd {
namespace {

using plugin::slave_t;
using state_t = slave_t::state_t;

TEST(slave, lifecycle) {
    testing::script_t script;
    slave_t slave(1, std::make_shared<testing::fake_transport_t>(script));

    EXPECT_EQ(state_t::starting, slave.state());
    EXPECT_TRUE(slave.alive());

    slave.migrate(state_t::ready);
    slave.migrate(state_t::busy);
    slave.migrate(state_t::ready);
    slave.migrate(state_t::busy);
    slave.migrate(state_t::dead);

    EXPECT_FALSE(slave.alive());
}

TEST(slave, invalid_transitions) {
    testing::script_t script;

    const std::vector<std::pair<std::vector<state_t>, state_t>> samples = {
        {{}, state_t::busy},
        {{}, state_t::starting},
        {{state_t::ready}, state_t::starting},
        {{state_t::ready}, state_t::ready},
        {{state_t::ready, state_t::busy}, state_t::starting},
        {{state_t::dead}, state_t::ready},
        {{state_t::dead}, state_t::dead}
    };

    for(auto it = samples.begin(); it != samples.end(); ++it) {
        slave_t slave(1, std::make_shared<testing::fake_transport_t>(script));

        for(auto state = it->first.begin(); state != it->first.end(); ++state) {
            slave.migrate(*state);
        }

        const auto from = slave.state();

        try {
            slave.migrate(it->second);
            ADD_FAILURE() << plugin::to_string(from) << " -> " << plugin::to_string(it->second);
        } catch(const std::system_error& e) {
            EXPECT_EQ(error::invalid_transition, e.code());
        }

        EXPECT_EQ(from, slave.state());
    }
}

TEST(slave, handshake) {
    testing::script_t script;
    script.manifest = dynamic_t::object_t{{"lambdas", dynamic_t::array_t{"summarize"}}};

    slave_t slave(1, std::make_shared<testing::fake_transport_t>(script));

    const auto data = slave.handshake(std::chrono::milliseconds(100));

    EXPECT_EQ(script.manifest, data);
}

TEST(slave, handshake_rejected) {
    testing::script_t script;
    script.reject_handshake = true;

    slave_t slave(1, std::make_shared<testing::fake_transport_t>(script));

    try {
        slave.handshake(std::chrono::milliseconds(100));
        FAIL() << "rejected handshake has succeeded";
    } catch(const std::system_error& e) {
        EXPECT_EQ(error::handshake_failed, e.code());
    }
}

TEST(slave, handshake_timeout) {
    testing::script_t script;
    script.hang_handshake = true;

    slave_t slave(1, std::make_shared<testing::fake_transport_t>(script));

    try {
        slave.handshake(std::chrono::milliseconds(10));
        FAIL() << "hanging handshake has succeeded";
    } catch(const std::system_error& e) {
        EXPECT_EQ(error::handshake_timeout, e.code());
    }
}

TEST(slave, handshake_on_dead_transport) {
    testing::script_t script;

    auto transport = std::make_shared<testing::fake_transport_t>(script);
    transport->terminate();

    slave_t slave(1, transport);

    EXPECT_FALSE(slave.alive());

    try {
        slave.handshake(std::chrono::milliseconds(10));
        FAIL() << "handshake over a dead transport has succeeded";
    } catch(const std::system_error& e) {
        EXPECT_EQ(error::handshake_failed, e.code());
    }
}

} // namespace
} // namespace ourd
