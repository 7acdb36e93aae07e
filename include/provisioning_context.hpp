// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <variant>

namespace span {

/// \brief Flow ends by creating a new entry keyed by the panel serial number.
struct CreateTrigger {};

/// \brief Flow ends by updating (re-authenticating) an existing entry.
struct UpdateTrigger {
    std::string entry_id;
};

using FlowTrigger = std::variant<CreateTrigger, UpdateTrigger>;

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

/// \brief State carried across the steps of one provisioning flow.
/// Fields only move from absent to set; set_up() may run exactly once and every
/// accessor throws FlowContractError until it has.
class ProvisioningContext {
public:
    ProvisioningContext() = default;

    void set_up(FlowTrigger trigger, std::string host, std::string serial_number);

    bool is_set_up() const { return set_up_; }
    void ensure_set_up() const;

    const FlowTrigger& trigger() const;
    bool is_create() const;
    const std::string& host() const;
    const std::string& serial_number() const;
    const std::optional<std::string>& access_token() const;

    /// \brief Record a token obtained from the panel or the operator. Empty tokens are rejected.
    void set_access_token(std::string token);

private:
    bool set_up_{false};
    FlowTrigger trigger_{CreateTrigger{}};
    std::string host_;
    std::string serial_number_;
    std::optional<std::string> access_token_;
};

} // namespace span
