// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "discovery.hpp"
#include "entry_repository.hpp"
#include "flow_types.hpp"
#include "panel_client.hpp"
#include "provisioning_context.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>

namespace span {

namespace step_id {
constexpr const char* USER = "user";
constexpr const char* CONFIRM_DISCOVERY = "confirm_discovery";
constexpr const char* CHOOSE_AUTH_TYPE = "choose_auth_type";
constexpr const char* AUTH_PROXIMITY = "auth_proximity";
constexpr const char* AUTH_TOKEN = "auth_token";
} // namespace step_id

/// \brief Stored entry whose token the panel no longer accepts.
struct ReauthRequest {
    std::string entry_id;
    nlohmann::json data = nlohmann::json::object();
};

/// \brief Authentication and provisioning flow for one panel.
///
/// Entered through step_user(), step_zeroconf() or step_reauth(). All three set
/// the flow up once with the panel's host and serial number, then converge on the
/// auth steps (proximity proof or an existing token) and end in step_resolve_entry(),
/// which either yields a CreateEntry result or updates the stored entry.
///
/// Not re-entrant; the owner serializes step calls.
class ConfigFlow {
public:
    ConfigFlow(PanelClientFactory client_factory, std::shared_ptr<EntryRepository> entries);

    FlowResult step_user(const StepInput& input);
    FlowResult step_zeroconf(const DiscoveryInfo& discovery_info);
    FlowResult step_reauth(const ReauthRequest& request);

    FlowResult step_confirm_discovery(const StepInput& input);
    /// \brief Back returns to the confirmation form; Submit{"next_step_id": ...} follows the chosen option.
    FlowResult step_choose_auth_type(const StepInput& input);
    FlowResult step_auth_proximity(const StepInput& input);
    FlowResult step_auth_token(const StepInput& input);
    FlowResult step_resolve_entry();

    /// \brief Route a form/menu answer to the step named by step_id.
    FlowResult handle_step(const std::string& step_id, const StepInput& input);

    /// \brief Record trigger, host and serial number. Throws FlowContractError when called twice.
    void setup_flow(FlowTrigger trigger, const std::string& host);

    /// \brief Ping the host, authenticated when a token is given.
    bool validate_host(const std::string& host, const std::optional<std::string>& access_token = std::nullopt);

    const ProvisioningContext& context() const { return context_; }
    const std::optional<std::string>& unique_id() const { return unique_id_; }
    const std::map<std::string, std::string>& title_placeholders() const { return title_placeholders_; }
    int proximity_attempts() const { return proximity_attempts_; }

private:
    PanelClientFactory client_factory_;
    std::shared_ptr<EntryRepository> entries_;
    ProvisioningContext context_;
    std::optional<std::string> unique_id_;
    std::map<std::string, std::string> title_placeholders_;
    int proximity_attempts_{0};

    std::optional<FlowResult> abort_if_already_configured();
    FlowResult finish_with_token(const std::string& access_token);
    FlowResult create_new_entry(const std::string& host, const std::string& serial_number,
                                const std::string& access_token);
    FlowResult update_existing_entry(const std::string& entry_id, const std::string& host,
                                     const std::string& access_token);
    std::map<std::string, std::string> host_placeholders() const;
};

} // namespace span
