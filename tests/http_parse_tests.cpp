// SPDX-License-Identifier: Apache-2.0
#include "discovery.hpp"
#include "http_panel_client.hpp"

#include <cassert>
#include <iostream>

using namespace span;

template <typename F> static bool throws_response_error(F&& f) {
    try {
        f();
    } catch (const PanelResponseError&) {
        return true;
    }
    return false;
}

int main() {
    // Newer firmware reports the proximity flag
    auto status = parse_panel_status(nlohmann::json::parse(R"({
        "system": {"serial": "nt-2204-c1abc", "model": "32A", "proximityProven": false},
        "software": {"firmwareVersion": "spanos2/r202342/04"}
    })"));
    assert(status.serial_number == "nt-2204-c1abc");
    assert(status.model == "32A");
    assert(status.firmware_version == "spanos2/r202342/04");
    assert(status.proximity_proven.has_value() && !*status.proximity_proven);
    assert(!status.remaining_auth_unlock_button_presses.has_value());

    // Older firmware counts button presses down
    status = parse_panel_status(nlohmann::json::parse(R"({
        "system": {"serial": "nt-2101-a0001", "remainingAuthUnlockButtonPresses": 2}
    })"));
    assert(!status.proximity_proven.has_value());
    assert(status.remaining_auth_unlock_button_presses.value() == 2);
    assert(status.firmware_version.empty());

    assert(throws_response_error([]() { parse_panel_status(nlohmann::json::parse(R"({"software":{}})")); }));
    assert(throws_response_error([]() { parse_panel_status(nlohmann::json::parse(R"({"system":{}})")); }));

    // Wrong field types from a device that is not quite a panel
    assert(throws_response_error([]() { parse_panel_status(nlohmann::json::parse(R"({"system":{"serial":42}})")); }));
    assert(throws_response_error([]() {
        parse_panel_status(nlohmann::json::parse(R"({"system":{"serial":"s1"},"software":{"firmwareVersion":7}})"));
    }));
    assert(throws_response_error([]() {
        parse_panel_status(
            nlohmann::json::parse(R"({"system":{"serial":"s1","remainingAuthUnlockButtonPresses":1.5}})"));
    }));
    assert(throws_response_error([]() {
        parse_panel_status(
            nlohmann::json::parse(R"({"system":{"serial":"s1","remainingAuthUnlockButtonPresses":-1}})"));
    }));
    assert(throws_response_error([]() {
        parse_panel_status(
            nlohmann::json::parse(R"({"system":{"serial":"s1","remainingAuthUnlockButtonPresses":1e12}})"));
    }));
    assert(throws_response_error(
        []() { parse_circuits(nlohmann::json::parse(R"({"circuits":{"c1":{"name":null}}})")); }));
    assert(throws_response_error(
        []() { parse_circuits(nlohmann::json::parse(R"({"circuits":{"c1":{"relayState":3}}})")); }));
    assert(throws_response_error(
        []() { parse_circuits(nlohmann::json::parse(R"({"circuits":{"c1":{"isUserControllable":"yes"}}})")); }));

    const auto circuits = parse_circuits(nlohmann::json::parse(R"({
        "circuits": {
            "c1": {"id": "c1", "name": "Kitchen", "relayState": "CLOSED", "isUserControllable": true,
                   "instantPowerW": 120.5},
            "c2": {"name": "Furnace", "relayState": "OPEN", "isUserControllable": false},
            "c3": {"relayState": "weird"}
        }
    })"));
    assert(circuits.size() == 3);
    assert(circuits.at("c1").name == "Kitchen");
    assert(circuits.at("c1").is_relay_closed());
    assert(circuits.at("c1").instant_power_w == 120.5);
    assert(circuits.at("c2").relay_state == RelayState::Open);
    assert(!circuits.at("c2").is_user_controllable);
    assert(circuits.at("c3").id == "c3");
    assert(circuits.at("c3").relay_state == RelayState::Unknown);
    assert(throws_response_error([]() { parse_circuits(nlohmann::json::parse(R"({"spaces":{}})")); }));

    assert(relay_state_to_string(RelayState::Closed) == "CLOSED");
    assert(relay_state_from_string("open") == RelayState::Open);

    assert(is_ipv4_address("192.168.1.50"));
    assert(!is_ipv4_address("fe80::1"));
    assert(!is_ipv4_address("span.local"));
    assert(!is_ipv4_address("256.1.1.1"));
    assert(!is_ipv4_address(""));

    std::cout << "http_parse_tests passed\n";
    return 0;
}
