// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "panel_client.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <vector>

namespace span {

/// \brief In-process panel so provisioning flows can be exercised without real hardware.
class SimulatedPanel {
public:
    enum class Firmware { ProximityFlag, ButtonPresses };

    struct CallCounts {
        int ping{0};
        int status{0};
        int token{0};
        int circuits{0};
        int relay{0};
    };

    struct RelayCommand {
        std::string circuit_id;
        RelayState state{RelayState::Unknown};
    };

    SimulatedPanel(std::string serial_number, Firmware firmware);

    // Simulation controls for tests/harnesses
    void set_reachable(bool reachable);
    void set_proximity_proven(bool proven);
    void set_remaining_presses(int presses);
    /// \brief Simulate one press of the door unlock button (old firmware counts down).
    void press_unlock_button();
    void revoke_tokens();
    /// \brief Make authenticated pings fail even for tokens the panel issued.
    void set_reject_tokens(bool reject);
    void add_circuit(const Circuit& circuit);

    bool ping(const std::optional<std::string>& token);
    PanelStatus status();
    std::string issue_token();
    CircuitMap circuits(const std::optional<std::string>& token);
    void set_relay(const std::optional<std::string>& token, const std::string& circuit_id, RelayState state);

    CallCounts calls() const;
    std::vector<RelayCommand> relay_history() const;
    const std::string& serial_number() const { return serial_number_; }

private:
    mutable std::mutex mutex_;
    std::string serial_number_;
    Firmware firmware_;
    bool reachable_{true};
    bool reject_tokens_{false};
    bool proximity_proven_{false};
    int remaining_presses_{3};
    int issued_count_{0};
    std::set<std::string> tokens_;
    CircuitMap circuits_;
    CallCounts calls_;
    std::vector<RelayCommand> relay_history_;

    bool proximity_satisfied_locked() const;
    void require_reachable_locked() const;
    void require_token_locked(const std::optional<std::string>& token) const;
};

/// \brief Host -> SimulatedPanel map handing out PanelClient instances bound to host/token.
class SimulatedNetwork {
public:
    void attach(const std::string& host, std::shared_ptr<SimulatedPanel> panel);
    std::shared_ptr<SimulatedPanel> panel(const std::string& host) const;

    PanelClientFactory factory();

    /// \brief Number of clients created so far, i.e. attempted network contacts.
    int clients_created() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SimulatedPanel>> panels_;
    int clients_created_{0};
};

class SimulatedPanelClient : public PanelClient {
public:
    SimulatedPanelClient(std::string host, std::optional<std::string> access_token,
                         std::shared_ptr<SimulatedPanel> panel);
    ~SimulatedPanelClient() override = default;

    bool ping() override;
    PanelStatus get_status_data() override;
    std::string get_access_token() override;
    CircuitMap get_circuits() override;
    void set_relay(const Circuit& circuit, RelayState state) override;

    const std::string& host() const override { return host_; }

private:
    std::string host_;
    std::optional<std::string> access_token_;
    std::shared_ptr<SimulatedPanel> panel_; // nullptr when nothing answers on this host

    SimulatedPanel& require_panel();
};

} // namespace span
