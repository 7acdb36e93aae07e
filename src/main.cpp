// SPDX-License-Identifier: Apache-2.0
#include "circuit_switch.hpp"
#include "discovery.hpp"
#include "entry_store.hpp"
#include "flow_manager.hpp"
#include "http_panel_client.hpp"
#include "panel_sim.hpp"
#include "span_config.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <everest/logging.hpp>

#ifndef SPAN_DEFAULT_CONFIG
#define SPAN_DEFAULT_CONFIG "configs/span.json"
#endif

namespace {
std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

struct AppOptions {
    std::string config_path{SPAN_DEFAULT_CONFIG};
    std::string command;
    std::vector<std::string> args;
};

AppOptions parse_args(int argc, char* argv[]) {
    AppOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }
    return opts;
}

void print_usage() {
    std::cerr << "Usage: span-provision [--config path] <command>\n"
              << "  add <host>                        provision a panel by address\n"
              << "  discover                          browse the network for panels\n"
              << "  reauth <entry_id>                 obtain a new token for an entry\n"
              << "  options <entry_id>                edit entry options\n"
              << "  list                              list provisioned panels\n"
              << "  circuits <entry_id>               list switchable circuits\n"
              << "  switch <entry_id> <circuit> on|off\n";
}

std::string read_line(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
        keep_running = false;
        return {};
    }
    return line;
}

std::string describe_form(const span::FlowResult& r) {
    if (r.step_id == span::step_id::CONFIRM_DISCOVERY) {
        return "Set up the SPAN panel at " + r.placeholders.at(span::CONF_HOST) + "?";
    }
    if (r.step_id == span::step_id::AUTH_PROXIMITY) {
        return "Open the panel door and press the door sensor button 3 times, then press Enter.";
    }
    if (r.step_id == span::step_id::AUTH_TOKEN) {
        return "Enter an existing access token (leave empty to go back).";
    }
    if (r.step_id == span::step_id::USER) {
        return "Enter the address of the SPAN panel.";
    }
    return "Panel options";
}

nlohmann::json parse_field(const span::FormField& field, const std::string& raw) {
    if (field.type == span::FieldType::Boolean) {
        return raw == "y" || raw == "yes" || raw == "true" || raw == "1";
    }
    if (field.type == span::FieldType::Integer) {
        try {
            std::size_t used = 0;
            const int v = std::stoi(raw, &used);
            if (used == raw.size()) return v;
        } catch (const std::exception&) {
        }
    }
    return raw;
}

/// \brief Ask the operator for the answer to a form or menu. nullopt means quit.
std::optional<span::StepInput> ask(const span::FlowResult& r) {
    if (r.type == span::FlowResultType::ShowMenu) {
        std::cout << "Choose how to authenticate:\n";
        for (std::size_t i = 0; i < r.menu_options.size(); ++i) {
            std::cout << "  " << (i + 1) << ") " << r.menu_options[i].label << "\n";
        }
        const auto line = read_line("Choice (empty to go back, q to quit): ");
        if (!keep_running || line == "q") return std::nullopt;
        if (line.empty()) return span::StepInput{span::Back{}};
        try {
            const auto idx = std::stoul(line);
            if (idx >= 1 && idx <= r.menu_options.size()) {
                span::FormData data;
                data["next_step_id"] = r.menu_options[idx - 1].id;
                return span::StepInput{span::Submit{data}};
            }
        } catch (const std::exception&) {
        }
        return span::StepInput{span::Submit{}};
    }

    std::cout << describe_form(r) << "\n";
    for (const auto& kv : r.errors) {
        std::cout << "  error: " << kv.first << " -> " << kv.second << "\n";
    }
    if (r.schema.empty()) {
        const auto line = read_line("[Enter] continue, b back, q quit: ");
        if (!keep_running || line == "q") return std::nullopt;
        if (line == "b") return span::StepInput{span::Back{}};
        return span::StepInput{span::Submit{}};
    }

    span::FormData data = span::FormData::object();
    for (const auto& field : r.schema) {
        std::string prompt = "  " + field.name;
        if (field.default_value) {
            prompt += " [" + field.default_value->dump() + "]";
        }
        const auto line = read_line(prompt + ": ");
        if (!keep_running) return std::nullopt;
        if (!line.empty()) {
            data[field.name] = parse_field(field, line);
        }
    }
    return span::StepInput{span::Submit{data}};
}

/// \brief Drive a flow on the console until it terminates. Returns the process exit code.
int run_interactive(span::FlowManager& manager, span::FlowManager::FlowHandle handle,
                    const std::function<void(const span::FlowResult&)>& before_answer = {}) {
    auto result = handle.result;
    while (!result.is_terminal()) {
        if (before_answer) {
            before_answer(result);
        }
        const auto answer = ask(result);
        if (!answer) {
            std::cout << "Cancelled." << std::endl;
            return 1;
        }
        result = manager.configure(handle.flow_id, result.step_id, *answer);
    }
    if (result.type == span::FlowResultType::CreateEntry) {
        if (result.title.empty()) {
            std::cout << "Options saved for entry " << result.entry_id << std::endl;
        } else {
            std::cout << "Panel " << result.title << " provisioned as entry " << result.entry_id << std::endl;
        }
        return 0;
    }
    std::cout << "Flow ended: " << result.reason << std::endl;
    return result.reason == span::abort_reason::REAUTH_SUCCESSFUL ? 0 : 1;
}

std::optional<span::Entry> require_entry(span::EntryRepository& entries, const std::vector<std::string>& args) {
    if (args.empty()) {
        print_usage();
        return std::nullopt;
    }
    auto entry = entries.find_by_entry_id(args[0]);
    if (!entry) {
        std::cerr << "No entry " << args[0] << std::endl;
    }
    return entry;
}

std::optional<std::string> entry_token(const span::Entry& entry) {
    if (entry.data.contains(span::CONF_ACCESS_TOKEN) && entry.data[span::CONF_ACCESS_TOKEN].is_string()) {
        return entry.data[span::CONF_ACCESS_TOKEN].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);
    if (opts.command.empty()) {
        print_usage();
        return 1;
    }

    span::SpanConfig cfg;
    try {
        cfg = span::load_span_config(opts.config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }
    if (std::filesystem::exists(cfg.logging_config)) {
        Everest::Logging::init(cfg.logging_config.string(), "span-provision");
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::shared_ptr<span::JsonEntryStore> entries;
    try {
        entries = std::make_shared<span::JsonEntryStore>(cfg.entries_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to open entry store: " << e.what() << std::endl;
        return 1;
    }
    entries->set_reload_handler(
        [](const span::Entry& entry) { EVLOG_info << "Entry " << entry.entry_id << " (" << entry.title << ") reloaded"; });

    span::SimulatedNetwork sim_network;
    span::PanelClientFactory factory = span::HttpPanelClient::factory(cfg.http);
    if (cfg.simulation_mode) {
        EVLOG_warning << "Simulation mode: panels are simulated in-process";
        factory = sim_network.factory();
    }
    auto simulate_panel = [&](const std::string& host) {
        if (cfg.simulation_mode && !sim_network.panel(host)) {
            auto panel = std::make_shared<span::SimulatedPanel>("SIM-" + std::to_string(entries->entries().size() + 1),
                                                                span::SimulatedPanel::Firmware::ProximityFlag);
            panel->add_circuit(span::Circuit{"1", "Kitchen", span::RelayState::Closed, true, 320.0});
            panel->add_circuit(span::Circuit{"2", "EV Charger", span::RelayState::Open, true, 0.0});
            panel->add_circuit(span::Circuit{"3", "Furnace", span::RelayState::Closed, false, 540.0});
            sim_network.attach(host, panel);
        }
    };
    // In simulation mode acknowledging the proximity form stands in for the door button
    auto press_button = [&](const span::FlowResult& r) {
        if (!cfg.simulation_mode || r.step_id != span::step_id::AUTH_PROXIMITY) return;
        if (const auto host = r.placeholders.find(span::CONF_HOST); host != r.placeholders.end()) {
            if (auto panel = sim_network.panel(host->second)) panel->press_unlock_button();
        }
    };

    span::FlowManager manager(factory, entries, cfg.default_scan_interval_s);
    int rc = 0;
    try {
        if (opts.command == "add") {
            if (opts.args.empty()) {
                print_usage();
                return 1;
            }
            simulate_panel(opts.args[0]);
            auto handle = manager.start_user();
            span::FormData data;
            data[span::CONF_HOST] = opts.args[0];
            handle.result = manager.configure(handle.flow_id, span::step_id::USER, span::Submit{data});
            rc = run_interactive(manager, handle, press_button);
        } else if (opts.command == "discover") {
#ifdef HAVE_DNSSD
            if (!cfg.discovery.enabled) {
                std::cerr << "Discovery disabled in config" << std::endl;
                return 1;
            }
            std::vector<span::DiscoveryInfo> found;
            span::DnsSdBrowser browser(cfg.discovery.service_type);
            std::cout << "Browsing " << cfg.discovery.service_type << " for " << cfg.discovery.browse_seconds
                      << "s..." << std::endl;
            if (!browser.browse(std::chrono::seconds(cfg.discovery.browse_seconds),
                                [&found](const span::DiscoveryInfo& info) { found.push_back(info); })) {
                std::cerr << "DNS-SD daemon unavailable" << std::endl;
                return 1;
            }
            for (const auto& info : found) {
                if (!keep_running) break;
                auto handle = manager.start_discovery(info);
                if (handle.result.is_terminal()) {
                    std::cout << info.host << ": " << handle.result.reason << std::endl;
                    continue;
                }
                rc = run_interactive(manager, handle, press_button) != 0 ? 1 : rc;
            }
            if (found.empty()) {
                std::cout << "No panels found." << std::endl;
            }
#else
            std::cerr << "Built without DNS-SD support" << std::endl;
            return 1;
#endif
        } else if (opts.command == "reauth") {
            const auto entry = require_entry(*entries, opts.args);
            if (!entry) return 1;
            simulate_panel(entry->data.value(span::CONF_HOST, ""));
            rc = run_interactive(manager, manager.start_reauth(entry->entry_id), press_button);
        } else if (opts.command == "options") {
            const auto entry = require_entry(*entries, opts.args);
            if (!entry) return 1;
            rc = run_interactive(manager, manager.start_options(entry->entry_id));
        } else if (opts.command == "list") {
            for (const auto& entry : entries->entries()) {
                std::cout << entry.entry_id << "  " << entry.title << "  " << entry.data.value(span::CONF_HOST, "")
                          << "  options=" << entry.options.dump() << std::endl;
            }
        } else if (opts.command == "circuits" || opts.command == "switch") {
            const auto entry = require_entry(*entries, opts.args);
            if (!entry) return 1;
            const auto host = entry->data.value(span::CONF_HOST, "");
            simulate_panel(host);
            const auto scan = entry->options.value("scan_interval", cfg.default_scan_interval_s);
            span::PanelCoordinator coordinator(factory(host, entry_token(*entry)), std::chrono::seconds(scan));
            bool token_rejected = false;
            coordinator.set_auth_failed_callback([&token_rejected]() { token_rejected = true; });
            if (!coordinator.refresh()) {
                if (token_rejected) {
                    std::cout << "Panel rejected the stored token; starting re-authentication." << std::endl;
                    return run_interactive(manager, manager.start_reauth(entry->entry_id), press_button);
                }
                std::cerr << "Panel at " << host << " unreachable" << std::endl;
                return 1;
            }
            auto switches = span::make_circuit_switches(coordinator);
            if (opts.command == "circuits") {
                for (const auto& sw : switches) {
                    std::cout << sw.circuit_id() << "  " << sw.name() << "  " << (sw.is_on() ? "on" : "off") << "  "
                              << sw.unique_id() << std::endl;
                }
            } else {
                if (opts.args.size() < 3 || (opts.args[2] != "on" && opts.args[2] != "off")) {
                    print_usage();
                    return 1;
                }
                bool matched = false;
                for (auto& sw : switches) {
                    if (sw.circuit_id() != opts.args[1]) continue;
                    matched = true;
                    opts.args[2] == "on" ? sw.turn_on() : sw.turn_off();
                    std::cout << sw.name() << " is now " << (sw.is_on() ? "on" : "off") << std::endl;
                }
                if (!matched) {
                    std::cerr << "No user-controllable circuit " << opts.args[1] << std::endl;
                    rc = 1;
                }
            }
        } else {
            print_usage();
            rc = 1;
        }
    } catch (const span::PanelError& e) {
        std::cerr << "Panel error: " << e.what() << std::endl;
        rc = 1;
    } catch (const span::EntryStoreError& e) {
        std::cerr << "Entry store error: " << e.what() << std::endl;
        rc = 1;
    }

    entries->wait_for_reloads();
    return rc;
}
