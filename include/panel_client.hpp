// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace span {

enum class RelayState { Unknown, Open, Closed };

/// \brief Snapshot of GET /api/v1/status.
/// Newer firmware reports proximity_proven; older firmware counts down
/// remaining_auth_unlock_button_presses instead. Only one is meaningful.
struct PanelStatus {
    std::string serial_number;
    std::string firmware_version;
    std::string model;
    std::optional<bool> proximity_proven;
    std::optional<int> remaining_auth_unlock_button_presses;
};

struct Circuit {
    std::string id;
    std::string name;
    RelayState relay_state{RelayState::Unknown};
    bool is_user_controllable{false};
    double instant_power_w{0.0};

    bool is_relay_closed() const { return relay_state == RelayState::Closed; }
};

using CircuitMap = std::map<std::string, Circuit>;

class PanelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// \brief Host unreachable, timed out, or answered with an unexpected HTTP status.
class PanelConnectionError : public PanelError {
public:
    using PanelError::PanelError;
};

/// \brief Panel rejected the bearer token (HTTP 401/403).
class PanelAuthError : public PanelError {
public:
    using PanelError::PanelError;
};

/// \brief Panel answered but the body could not be interpreted.
class PanelResponseError : public PanelError {
public:
    using PanelError::PanelError;
};

std::string relay_state_to_string(RelayState state);
RelayState relay_state_from_string(const std::string& s);

/// \brief Abstract interface to one panel, bound to a host and an optional bearer token.
class PanelClient {
public:
    virtual ~PanelClient() = default;

    /// \brief True when the host answers like a SPAN panel. Authenticated when a token is bound.
    /// Never throws; transport failures read as false.
    virtual bool ping() = 0;

    virtual PanelStatus get_status_data() = 0;

    /// \brief Register with the panel and return a new access token.
    /// Only succeeds once proximity has been proven.
    virtual std::string get_access_token() = 0;

    virtual CircuitMap get_circuits() = 0;
    virtual void set_relay(const Circuit& circuit, RelayState state) = 0;

    virtual const std::string& host() const = 0;
};

using PanelClientFactory =
    std::function<std::shared_ptr<PanelClient>(const std::string& host, const std::optional<std::string>& access_token)>;

} // namespace span
