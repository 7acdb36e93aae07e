// SPDX-License-Identifier: Apache-2.0
#include "circuit_switch.hpp"
#include "http_panel_client.hpp"
#include "panel_coordinator.hpp"
#include "panel_sim.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>

using namespace span;

namespace {

// Device that answers with bodies the parser rejects
class GarbledClient : public PanelClient {
public:
    bool ping() override { return true; }
    PanelStatus get_status_data() override {
        return parse_panel_status(nlohmann::json::parse(R"({"system":{"serial":12345}})"));
    }
    std::string get_access_token() override { return {}; }
    CircuitMap get_circuits() override {
        return parse_circuits(nlohmann::json::parse(R"({"circuits":{"c1":{"name":null}}})"));
    }
    void set_relay(const Circuit&, RelayState) override {}
    const std::string& host() const override { return host_; }

private:
    std::string host_{"10.2.0.9"};
};

} // namespace

static std::shared_ptr<SimulatedPanel> make_panel(const std::string& serial) {
    auto panel = std::make_shared<SimulatedPanel>(serial, SimulatedPanel::Firmware::ProximityFlag);
    panel->add_circuit(Circuit{"c1", "Kitchen", RelayState::Closed, true, 300.0});
    panel->add_circuit(Circuit{"c2", "Garage", RelayState::Open, true, 0.0});
    panel->add_circuit(Circuit{"main", "Main Feed", RelayState::Closed, false, 4200.0});
    panel->set_proximity_proven(true);
    return panel;
}

static void test_switches_follow_panel() {
    SimulatedNetwork net;
    auto panel = make_panel("SPAN-300");
    net.attach("10.2.0.1", panel);
    const auto token = panel->issue_token();

    PanelCoordinator coordinator(net.factory()("10.2.0.1", token), std::chrono::seconds(15));
    assert(!coordinator.data().has_value());
    assert(make_circuit_switches(coordinator).empty());
    assert(coordinator.refresh());
    assert(coordinator.last_update_success());

    auto switches = make_circuit_switches(coordinator);
    assert(switches.size() == 2); // main feed is not user-controllable
    auto& kitchen = switches[0];
    assert(kitchen.circuit_id() == "c1");
    assert(kitchen.unique_id() == "span_SPAN-300_relay_c1");
    assert(kitchen.name() == "Kitchen Breaker");
    assert(kitchen.is_on());
    assert(!switches[1].is_on());

    kitchen.turn_off();
    assert(!kitchen.is_on());
    switches[1].turn_on();
    assert(switches[1].is_on());

    const auto history = panel->relay_history();
    assert(history.size() == 2);
    assert(history[0].circuit_id == "c1" && history[0].state == RelayState::Open);
    assert(history[1].circuit_id == "c2" && history[1].state == RelayState::Closed);

    CircuitSwitch ghost(coordinator, "c9");
    bool raised = false;
    try {
        ghost.turn_on();
    } catch (const std::runtime_error&) {
        raised = true;
    }
    assert(raised);
    assert(panel->relay_history().size() == 2);
}

static void test_auth_failure_reported_once() {
    SimulatedNetwork net;
    auto panel = make_panel("SPAN-301");
    net.attach("10.2.0.2", panel);
    const auto token = panel->issue_token();

    PanelCoordinator coordinator(net.factory()("10.2.0.2", token), std::chrono::seconds(15));
    int auth_failures = 0;
    coordinator.set_auth_failed_callback([&auth_failures]() { auth_failures++; });
    assert(coordinator.refresh());

    panel->revoke_tokens();
    assert(!coordinator.refresh());
    assert(!coordinator.refresh());
    assert(auth_failures == 1);
    assert(!coordinator.last_update_success());
    // Last good snapshot is kept
    assert(coordinator.data().has_value());

    // Transport failures are not token failures
    panel->set_reachable(false);
    assert(!coordinator.refresh());
    assert(auth_failures == 1);
}

static void test_polling_thread() {
    SimulatedNetwork net;
    auto panel = make_panel("SPAN-302");
    net.attach("10.2.0.3", panel);
    const auto token = panel->issue_token();

    PanelCoordinator coordinator(net.factory()("10.2.0.3", token), std::chrono::seconds(60));
    coordinator.start();
    for (int i = 0; i < 200 && !coordinator.data(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(coordinator.data().has_value());

    const auto before = panel->calls().circuits;
    coordinator.request_refresh();
    for (int i = 0; i < 200 && panel->calls().circuits == before; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(panel->calls().circuits > before);
    coordinator.stop();
}

static void test_garbled_responses_are_refresh_failures() {
    auto client = std::make_shared<GarbledClient>();
    PanelCoordinator coordinator(client, std::chrono::seconds(60));
    bool auth_failed = false;
    coordinator.set_auth_failed_callback([&auth_failed]() { auth_failed = true; });
    assert(!coordinator.refresh());
    assert(!coordinator.last_update_success());
    assert(!coordinator.data().has_value());
    assert(!auth_failed);

    // The poll thread survives the same failure
    coordinator.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    coordinator.request_refresh();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    coordinator.stop();
    assert(!coordinator.data().has_value());
}

int main() {
    test_garbled_responses_are_refresh_failures();
    test_switches_follow_panel();
    test_auth_failure_reported_once();
    test_polling_thread();

    std::cout << "panel_coordinator_tests passed\n";
    return 0;
}
