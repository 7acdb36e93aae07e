// SPDX-License-Identifier: Apache-2.0
#include "config_flow.hpp"
#include "entry_store.hpp"
#include "panel_sim.hpp"

#include <cassert>
#include <iostream>
#include <set>

using namespace span;

static Submit submit(const std::string& key, const std::string& value) {
    FormData data = FormData::object();
    data[key] = value;
    return Submit{data};
}

template <typename F> static bool throws_contract_error(F&& f) {
    try {
        f();
    } catch (const FlowContractError&) {
        return true;
    }
    return false;
}

static void test_user_path() {
    SimulatedNetwork net;
    auto panel = std::make_shared<SimulatedPanel>("SPAN-001", SimulatedPanel::Firmware::ProximityFlag);
    panel->set_proximity_proven(true);
    net.attach("10.0.0.5", panel);
    auto store = std::make_shared<JsonEntryStore>("");
    ConfigFlow flow(net.factory(), store);

    auto r = flow.step_user(Prompt{});
    assert(r.type == FlowResultType::ShowForm);
    assert(r.step_id == step_id::USER);
    assert(r.schema.size() == 1 && r.schema[0].name == CONF_HOST && r.schema[0].required);

    r = flow.step_user(submit(CONF_HOST, ""));
    assert(r.type == FlowResultType::ShowForm);
    assert(r.errors.at(CONF_HOST) == "required");

    // Nothing answers on this address: form again, flow untouched
    r = flow.step_user(submit(CONF_HOST, "10.0.0.9"));
    assert(r.type == FlowResultType::ShowForm);
    assert(r.errors.at("base") == abort_reason::CANNOT_CONNECT);
    assert(!flow.context().is_set_up());

    r = flow.step_user(submit(CONF_HOST, "10.0.0.5"));
    assert(r.type == FlowResultType::ShowForm);
    assert(r.step_id == step_id::CONFIRM_DISCOVERY);
    assert(r.placeholders.at(CONF_HOST) == "10.0.0.5");
    assert(flow.context().serial_number() == "SPAN-001");
    assert(flow.unique_id().value() == "SPAN-001");
    assert(flow.title_placeholders().at(CONF_HOST) == "10.0.0.5");

    // Without a submission the confirmation form renders itself again
    r = flow.step_confirm_discovery(Prompt{});
    assert(r.type == FlowResultType::ShowForm);
    assert(r.step_id == step_id::CONFIRM_DISCOVERY);
    assert(r.schema.empty() && r.errors.empty());
    assert(r.placeholders.at(CONF_HOST) == "10.0.0.5");
    r = flow.handle_step(step_id::CONFIRM_DISCOVERY, Back{});
    assert(r.type == FlowResultType::ShowForm && r.step_id == step_id::CONFIRM_DISCOVERY);

    r = flow.step_confirm_discovery(Submit{});
    assert(r.type == FlowResultType::ShowMenu);
    assert(r.step_id == step_id::CHOOSE_AUTH_TYPE);
    assert(r.menu_options.size() == 2);
    assert(r.menu_options[0].id == step_id::AUTH_PROXIMITY);
    assert(r.menu_options[1].id == step_id::AUTH_TOKEN);

    // Closing the menu goes back to the confirmation form
    r = flow.step_choose_auth_type(Back{});
    assert(r.type == FlowResultType::ShowForm && r.step_id == step_id::CONFIRM_DISCOVERY);

    r = flow.handle_step(step_id::CHOOSE_AUTH_TYPE, submit("next_step_id", step_id::AUTH_PROXIMITY));
    assert(r.type == FlowResultType::CreateEntry);
    assert(r.title == "SPAN-001");
    assert(r.unique_id == "SPAN-001");
    assert(r.data.at(CONF_HOST) == "10.0.0.5");
    assert(r.data.at(CONF_ACCESS_TOKEN) == "sim-token-SPAN-001-1");
    assert(r.data.size() == 2);
    assert(flow.context().access_token().value() == "sim-token-SPAN-001-1");
    assert(flow.proximity_attempts() == 1);
}

static void test_token_path() {
    SimulatedNetwork net;
    auto panel = std::make_shared<SimulatedPanel>("SPAN-002", SimulatedPanel::Firmware::ProximityFlag);
    net.attach("10.0.0.6", panel);
    auto store = std::make_shared<JsonEntryStore>("");
    ConfigFlow flow(net.factory(), store);

    auto r = flow.step_user(submit(CONF_HOST, "10.0.0.6"));
    assert(r.step_id == step_id::CONFIRM_DISCOVERY);

    r = flow.step_choose_auth_type(submit("next_step_id", step_id::AUTH_TOKEN));
    assert(r.type == FlowResultType::ShowForm && r.step_id == step_id::AUTH_TOKEN);
    assert(r.schema.size() == 1 && r.schema[0].name == CONF_ACCESS_TOKEN);

    // Empty token returns to the chooser
    r = flow.step_auth_token(submit(CONF_ACCESS_TOKEN, ""));
    assert(r.type == FlowResultType::ShowMenu && r.step_id == step_id::CHOOSE_AUTH_TYPE);
    r = flow.step_auth_token(Back{});
    assert(r.type == FlowResultType::ShowMenu);

    r = flow.step_auth_token(submit(CONF_ACCESS_TOKEN, "made-up"));
    assert(r.type == FlowResultType::Abort);
    assert(r.reason == abort_reason::INVALID_ACCESS_TOKEN);
    assert(!flow.context().access_token().has_value());

    panel->set_proximity_proven(true);
    const auto issued = panel->issue_token();

    ConfigFlow second(net.factory(), store);
    second.step_user(submit(CONF_HOST, "10.0.0.6"));
    r = second.handle_step(step_id::AUTH_TOKEN, submit(CONF_ACCESS_TOKEN, issued));
    assert(r.type == FlowResultType::CreateEntry);
    assert(r.data.at(CONF_ACCESS_TOKEN) == issued);
    assert(r.title == "SPAN-002");
}

static void test_zeroconf_path() {
    SimulatedNetwork net;
    auto panel = std::make_shared<SimulatedPanel>("SPAN-003", SimulatedPanel::Firmware::ProximityFlag);
    net.attach("10.0.0.7", panel);
    auto store = std::make_shared<JsonEntryStore>("");

    {
        ConfigFlow flow(net.factory(), store);
        auto r = flow.step_zeroconf(DiscoveryInfo{"fe80::1", "span.local.", 80, "span"});
        assert(r.type == FlowResultType::Abort);
        assert(r.reason == abort_reason::NOT_IPV4_ADDRESS);
        // IPv6 announcements are rejected without contacting the host
        assert(net.clients_created() == 0);
    }
    {
        ConfigFlow flow(net.factory(), store);
        auto r = flow.step_zeroconf(DiscoveryInfo{"10.0.0.8", "other.local.", 80, "other"});
        assert(r.type == FlowResultType::Abort);
        assert(r.reason == abort_reason::NOT_SPAN_PANEL);
    }
    {
        ConfigFlow flow(net.factory(), store);
        auto r = flow.step_zeroconf(DiscoveryInfo{"10.0.0.7", "span-3.local.", 80, "span-3"});
        assert(r.type == FlowResultType::ShowForm);
        assert(r.step_id == step_id::CONFIRM_DISCOVERY);
        assert(r.placeholders.at(CONF_HOST) == "10.0.0.7");
    }

    nlohmann::json data;
    data[CONF_HOST] = "10.0.0.7";
    data[CONF_ACCESS_TOKEN] = "t";
    store->create("SPAN-003", "SPAN-003", data);
    const auto contacts = net.clients_created();
    {
        ConfigFlow flow(net.factory(), store);
        auto r = flow.step_zeroconf(DiscoveryInfo{"10.0.0.7", "span-3.local.", 80, "span-3"});
        assert(r.type == FlowResultType::Abort);
        assert(r.reason == abort_reason::ALREADY_CONFIGURED);
        assert(net.clients_created() == contacts);
    }
}

static void test_moved_panel_updates_host() {
    SimulatedNetwork net;
    net.attach("10.0.0.20", std::make_shared<SimulatedPanel>("SPAN-004", SimulatedPanel::Firmware::ProximityFlag));
    auto store = std::make_shared<JsonEntryStore>("");
    std::set<std::string> reloaded;
    std::mutex reloaded_mutex;
    store->set_reload_handler([&](const Entry& e) {
        std::lock_guard<std::mutex> lock(reloaded_mutex);
        reloaded.insert(e.entry_id);
    });

    nlohmann::json data;
    data[CONF_HOST] = "10.0.0.19";
    data[CONF_ACCESS_TOKEN] = "keep-me";
    const auto entry = store->create("SPAN-004", "SPAN-004", data);

    ConfigFlow flow(net.factory(), store);
    auto r = flow.step_zeroconf(DiscoveryInfo{"10.0.0.20", "span-4.local.", 80, "span-4"});
    assert(r.type == FlowResultType::Abort);
    assert(r.reason == abort_reason::ALREADY_CONFIGURED);

    const auto stored = store->find_by_entry_id(entry.entry_id);
    assert(stored->data.at(CONF_HOST) == "10.0.0.20");
    assert(stored->data.at(CONF_ACCESS_TOKEN) == "keep-me");
    store->wait_for_reloads();
    assert(reloaded.count(entry.entry_id) == 1);
}

static void test_contract_errors() {
    SimulatedNetwork net;
    net.attach("10.0.0.30", std::make_shared<SimulatedPanel>("SPAN-005", SimulatedPanel::Firmware::ProximityFlag));
    auto store = std::make_shared<JsonEntryStore>("");
    ConfigFlow flow(net.factory(), store);

    assert(throws_contract_error([&]() { flow.step_confirm_discovery(Prompt{}); }));
    assert(throws_contract_error([&]() { flow.step_choose_auth_type(Prompt{}); }));
    assert(throws_contract_error([&]() { flow.step_auth_proximity(Prompt{}); }));
    assert(throws_contract_error([&]() { flow.step_resolve_entry(); }));
    assert(throws_contract_error([&]() { flow.handle_step("bogus", Prompt{}); }));

    flow.setup_flow(CreateTrigger{}, "10.0.0.30");
    assert(flow.context().is_create());
    assert(throws_contract_error([&]() { flow.setup_flow(CreateTrigger{}, "10.0.0.30"); }));
    // Context fields are never rewritten by a second setup attempt
    assert(flow.context().host() == "10.0.0.30");

    // Setup succeeded but no token was obtained yet
    assert(throws_contract_error([&]() { flow.step_resolve_entry(); }));

    bool rejected_null = false;
    try {
        ConfigFlow broken(nullptr, store);
    } catch (const std::invalid_argument&) {
        rejected_null = true;
    }
    assert(rejected_null);
}

int main() {
    test_user_path();
    test_token_path();
    test_zeroconf_path();
    test_moved_panel_updates_host();
    test_contract_errors();

    std::cout << "config_flow_tests passed\n";
    return 0;
}
