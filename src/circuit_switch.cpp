// SPDX-License-Identifier: Apache-2.0
#include "circuit_switch.hpp"

#include <utility>

#include <everest/logging.hpp>

namespace span {

CircuitSwitch::CircuitSwitch(PanelCoordinator& coordinator, std::string circuit_id) :
    coordinator_(&coordinator), circuit_id_(std::move(circuit_id)) {
    const auto snap = coordinator_->data();
    if (snap) {
        serial_number_ = snap->status.serial_number;
    }
    EVLOG_debug << "Created switch for circuit " << circuit_id_;
}

std::string CircuitSwitch::unique_id() const {
    return "span_" + serial_number_ + "_relay_" + circuit_id_;
}

std::string CircuitSwitch::name() const {
    const auto snap = coordinator_->data();
    if (snap) {
        auto it = snap->circuits.find(circuit_id_);
        if (it != snap->circuits.end()) {
            return it->second.name + " Breaker";
        }
    }
    return circuit_id_ + " Breaker";
}

bool CircuitSwitch::is_on() const {
    const auto snap = coordinator_->data();
    if (!snap) return false;
    auto it = snap->circuits.find(circuit_id_);
    return it != snap->circuits.end() && it->second.is_relay_closed();
}

void CircuitSwitch::turn_on() {
    set_state(RelayState::Closed);
}

void CircuitSwitch::turn_off() {
    set_state(RelayState::Open);
}

void CircuitSwitch::set_state(RelayState state) {
    const auto snap = coordinator_->data();
    if (!snap) {
        throw std::runtime_error("No panel data yet for circuit " + circuit_id_);
    }
    auto it = snap->circuits.find(circuit_id_);
    if (it == snap->circuits.end()) {
        throw std::runtime_error("Circuit " + circuit_id_ + " not present on panel " + serial_number_);
    }
    coordinator_->client().set_relay(it->second, state);
    coordinator_->request_refresh();
}

std::vector<CircuitSwitch> make_circuit_switches(PanelCoordinator& coordinator) {
    std::vector<CircuitSwitch> switches;
    const auto snap = coordinator.data();
    if (!snap) return switches;
    for (const auto& kv : snap->circuits) {
        if (kv.second.is_user_controllable) {
            switches.emplace_back(coordinator, kv.first);
        }
    }
    return switches;
}

} // namespace span
