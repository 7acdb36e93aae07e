// SPDX-License-Identifier: Apache-2.0
#include "entry_store.hpp"
#include "flow_manager.hpp"
#include "panel_sim.hpp"

#include <cassert>
#include <iostream>

using namespace span;

static Submit submit(const std::string& key, const std::string& value) {
    FormData data = FormData::object();
    data[key] = value;
    return Submit{data};
}

static void test_create_is_persisted() {
    SimulatedNetwork net;
    auto panel = std::make_shared<SimulatedPanel>("SPAN-400", SimulatedPanel::Firmware::ProximityFlag);
    net.attach("10.3.0.1", panel);
    auto store = std::make_shared<JsonEntryStore>("");
    FlowManager manager(net.factory(), store);

    auto handle = manager.start_user();
    assert(handle.flow_id == "flow-1");
    assert(handle.result.step_id == step_id::USER);
    assert(manager.is_in_progress(handle.flow_id));

    auto r = manager.configure(handle.flow_id, step_id::USER, submit(CONF_HOST, "10.3.0.1"));
    assert(r.step_id == step_id::CONFIRM_DISCOVERY);
    r = manager.configure(handle.flow_id, step_id::CONFIRM_DISCOVERY, Submit{});
    r = manager.configure(handle.flow_id, step_id::CHOOSE_AUTH_TYPE, submit("next_step_id", step_id::AUTH_PROXIMITY));
    assert(r.type == FlowResultType::ShowForm && r.step_id == step_id::AUTH_PROXIMITY);
    panel->press_unlock_button();
    r = manager.configure(handle.flow_id, step_id::AUTH_PROXIMITY, Submit{});
    assert(r.type == FlowResultType::CreateEntry);
    assert(!r.entry_id.empty());
    assert(!manager.is_in_progress(handle.flow_id));
    assert(manager.in_progress_count() == 0);

    const auto stored = store->find_by_entry_id(r.entry_id);
    assert(stored.has_value());
    assert(stored->unique_id == "SPAN-400");
    assert(stored->title == "SPAN-400");
    assert(stored->data.at(CONF_HOST) == "10.3.0.1");

    bool unknown_rejected = false;
    try {
        manager.configure(handle.flow_id, step_id::AUTH_PROXIMITY, Submit{});
    } catch (const FlowContractError&) {
        unknown_rejected = true;
    }
    assert(unknown_rejected);

    // A second flow for the same panel stops at the duplicate check
    auto again = manager.start_user();
    r = manager.configure(again.flow_id, step_id::USER, submit(CONF_HOST, "10.3.0.1"));
    assert(r.type == FlowResultType::Abort);
    assert(r.reason == abort_reason::ALREADY_CONFIGURED);
    assert(!manager.is_in_progress(again.flow_id));
}

static void test_parallel_flows_for_one_panel() {
    SimulatedNetwork net;
    net.attach("10.3.0.2", std::make_shared<SimulatedPanel>("SPAN-401", SimulatedPanel::Firmware::ProximityFlag));
    auto store = std::make_shared<JsonEntryStore>("");
    FlowManager manager(net.factory(), store);

    auto first = manager.start_discovery(DiscoveryInfo{"10.3.0.2", "span-401.local.", 80, "span-401"});
    assert(first.result.step_id == step_id::CONFIRM_DISCOVERY);

    auto second = manager.start_user();
    auto r = manager.configure(second.flow_id, step_id::USER, submit(CONF_HOST, "10.3.0.2"));
    assert(r.type == FlowResultType::Abort);
    assert(r.reason == abort_reason::ALREADY_IN_PROGRESS);
    assert(manager.is_in_progress(first.flow_id));
    assert(manager.in_progress_count() == 1);

    // Flows that never reached a panel do not interfere
    auto other = manager.start_user();
    assert(manager.in_progress_count() == 2);
    r = manager.configure(other.flow_id, step_id::USER, submit(CONF_HOST, ""));
    assert(r.errors.at(CONF_HOST) == "required");
}

static void test_reauth_and_options() {
    SimulatedNetwork net;
    auto panel = std::make_shared<SimulatedPanel>("SPAN-402", SimulatedPanel::Firmware::ButtonPresses);
    panel->set_remaining_presses(0);
    net.attach("10.3.0.3", panel);
    auto store = std::make_shared<JsonEntryStore>("");
    nlohmann::json data;
    data[CONF_HOST] = "10.3.0.3";
    data[CONF_ACCESS_TOKEN] = "stale";
    const auto entry = store->create("SPAN-402", "SPAN-402", data);
    FlowManager manager(net.factory(), store, 20);

    auto handle = manager.start_reauth(entry.entry_id);
    assert(handle.result.type == FlowResultType::Abort);
    assert(handle.result.reason == abort_reason::REAUTH_SUCCESSFUL);
    assert(store->find_by_entry_id(entry.entry_id)->data.at(CONF_ACCESS_TOKEN) == "sim-token-SPAN-402-1");
    assert(store->entries().size() == 1);

    auto options = manager.start_options(entry.entry_id);
    assert(options.result.step_id == OPTIONS_STEP_INIT);
    FormData answer;
    answer["scan_interval"] = 45;
    auto r = manager.configure(options.flow_id, OPTIONS_STEP_INIT, Submit{answer});
    assert(r.type == FlowResultType::CreateEntry);
    assert(r.entry_id == entry.entry_id);
    assert(store->find_by_entry_id(entry.entry_id)->options.at("scan_interval") == 45);
    assert(store->entries().size() == 1);

    bool unknown_rejected = false;
    try {
        manager.start_options("nope");
    } catch (const FlowContractError&) {
        unknown_rejected = true;
    }
    assert(unknown_rejected);
    store->wait_for_reloads();
}

static void test_failing_flow_is_discarded() {
    SimulatedNetwork net;
    auto panel = std::make_shared<SimulatedPanel>("SPAN-403", SimulatedPanel::Firmware::ProximityFlag);
    net.attach("10.3.0.4", panel);
    FlowManager manager(net.factory(), std::make_shared<JsonEntryStore>(""));

    auto handle = manager.start_user();
    manager.configure(handle.flow_id, step_id::USER, submit(CONF_HOST, "10.3.0.4"));
    manager.configure(handle.flow_id, step_id::CHOOSE_AUTH_TYPE, submit("next_step_id", step_id::AUTH_PROXIMITY));
    panel->set_reachable(false);
    bool raised = false;
    try {
        manager.configure(handle.flow_id, step_id::AUTH_PROXIMITY, Submit{});
    } catch (const PanelConnectionError&) {
        raised = true;
    }
    assert(raised);
    assert(!manager.is_in_progress(handle.flow_id));
}

int main() {
    test_create_is_persisted();
    test_parallel_flows_for_one_panel();
    test_reauth_and_options();
    test_failing_flow_is_discarded();

    std::cout << "flow_manager_tests passed\n";
    return 0;
}
