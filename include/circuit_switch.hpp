// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "panel_coordinator.hpp"

#include <string>
#include <vector>

namespace span {

/// \brief On/off control for one user-controllable circuit breaker.
/// State is read from the coordinator's last snapshot; changes go to the panel
/// and are followed by a coordinator refresh.
class CircuitSwitch {
public:
    CircuitSwitch(PanelCoordinator& coordinator, std::string circuit_id);

    const std::string& circuit_id() const { return circuit_id_; }
    std::string unique_id() const;
    std::string name() const;
    bool is_on() const;

    void turn_on();
    void turn_off();

private:
    PanelCoordinator* coordinator_;
    std::string circuit_id_;
    std::string serial_number_;

    void set_state(RelayState state);
};

/// \brief One switch per circuit flagged user-controllable in the current snapshot.
std::vector<CircuitSwitch> make_circuit_switches(PanelCoordinator& coordinator);

} // namespace span
