// SPDX-License-Identifier: Apache-2.0
#include "panel_sim.hpp"

#include <utility>

#include <everest/logging.hpp>

namespace span {

SimulatedPanel::SimulatedPanel(std::string serial_number, Firmware firmware) :
    serial_number_(std::move(serial_number)), firmware_(firmware) {
}

void SimulatedPanel::set_reachable(bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    reachable_ = reachable;
}

void SimulatedPanel::set_proximity_proven(bool proven) {
    std::lock_guard<std::mutex> lock(mutex_);
    proximity_proven_ = proven;
}

void SimulatedPanel::set_remaining_presses(int presses) {
    std::lock_guard<std::mutex> lock(mutex_);
    remaining_presses_ = presses < 0 ? 0 : presses;
}

void SimulatedPanel::press_unlock_button() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (firmware_ == Firmware::ProximityFlag) {
        proximity_proven_ = true;
    } else if (remaining_presses_ > 0) {
        remaining_presses_--;
    }
}

void SimulatedPanel::revoke_tokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_.clear();
}

void SimulatedPanel::set_reject_tokens(bool reject) {
    std::lock_guard<std::mutex> lock(mutex_);
    reject_tokens_ = reject;
}

void SimulatedPanel::add_circuit(const Circuit& circuit) {
    std::lock_guard<std::mutex> lock(mutex_);
    circuits_[circuit.id] = circuit;
}

bool SimulatedPanel::proximity_satisfied_locked() const {
    if (firmware_ == Firmware::ProximityFlag) {
        return proximity_proven_;
    }
    return remaining_presses_ == 0;
}

void SimulatedPanel::require_reachable_locked() const {
    if (!reachable_) {
        throw PanelConnectionError("Simulated panel " + serial_number_ + " unreachable");
    }
}

void SimulatedPanel::require_token_locked(const std::optional<std::string>& token) const {
    if (!token || reject_tokens_ || !tokens_.count(*token)) {
        throw PanelAuthError("Simulated panel " + serial_number_ + " rejected token");
    }
}

bool SimulatedPanel::ping(const std::optional<std::string>& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.ping++;
    if (!reachable_) {
        return false;
    }
    if (token) {
        return !reject_tokens_ && tokens_.count(*token) > 0;
    }
    return true;
}

PanelStatus SimulatedPanel::status() {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.status++;
    require_reachable_locked();
    PanelStatus s;
    s.serial_number = serial_number_;
    s.model = "SIM-32";
    if (firmware_ == Firmware::ProximityFlag) {
        s.firmware_version = "spanos2/r202342/sim";
        s.proximity_proven = proximity_proven_;
    } else {
        s.firmware_version = "spanos2/r202301/sim";
        s.remaining_auth_unlock_button_presses = remaining_presses_;
    }
    return s;
}

std::string SimulatedPanel::issue_token() {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.token++;
    require_reachable_locked();
    if (!proximity_satisfied_locked()) {
        throw PanelAuthError("Proximity not proven on simulated panel " + serial_number_);
    }
    auto token = "sim-token-" + serial_number_ + "-" + std::to_string(++issued_count_);
    tokens_.insert(token);
    return token;
}

CircuitMap SimulatedPanel::circuits(const std::optional<std::string>& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.circuits++;
    require_reachable_locked();
    require_token_locked(token);
    return circuits_;
}

void SimulatedPanel::set_relay(const std::optional<std::string>& token, const std::string& circuit_id,
                               RelayState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.relay++;
    require_reachable_locked();
    require_token_locked(token);
    auto it = circuits_.find(circuit_id);
    if (it == circuits_.end()) {
        throw PanelConnectionError("Unknown circuit " + circuit_id);
    }
    it->second.relay_state = state;
    relay_history_.push_back(RelayCommand{circuit_id, state});
}

SimulatedPanel::CallCounts SimulatedPanel::calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

std::vector<SimulatedPanel::RelayCommand> SimulatedPanel::relay_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return relay_history_;
}

void SimulatedNetwork::attach(const std::string& host, std::shared_ptr<SimulatedPanel> panel) {
    std::lock_guard<std::mutex> lock(mutex_);
    panels_[host] = std::move(panel);
}

std::shared_ptr<SimulatedPanel> SimulatedNetwork::panel(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = panels_.find(host);
    return it == panels_.end() ? nullptr : it->second;
}

PanelClientFactory SimulatedNetwork::factory() {
    return [this](const std::string& host, const std::optional<std::string>& access_token) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            clients_created_++;
        }
        return std::make_shared<SimulatedPanelClient>(host, access_token, panel(host));
    };
}

int SimulatedNetwork::clients_created() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_created_;
}

SimulatedPanelClient::SimulatedPanelClient(std::string host, std::optional<std::string> access_token,
                                           std::shared_ptr<SimulatedPanel> panel) :
    host_(std::move(host)), access_token_(std::move(access_token)), panel_(std::move(panel)) {
}

SimulatedPanel& SimulatedPanelClient::require_panel() {
    if (!panel_) {
        throw PanelConnectionError("No panel answers on " + host_);
    }
    return *panel_;
}

bool SimulatedPanelClient::ping() {
    if (!panel_) {
        return false;
    }
    return panel_->ping(access_token_);
}

PanelStatus SimulatedPanelClient::get_status_data() {
    return require_panel().status();
}

std::string SimulatedPanelClient::get_access_token() {
    return require_panel().issue_token();
}

CircuitMap SimulatedPanelClient::get_circuits() {
    return require_panel().circuits(access_token_);
}

void SimulatedPanelClient::set_relay(const Circuit& circuit, RelayState state) {
    require_panel().set_relay(access_token_, circuit.id, state);
    EVLOG_debug << "Simulated relay " << circuit.id << " -> " << relay_state_to_string(state);
}

} // namespace span
