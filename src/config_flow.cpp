// SPDX-License-Identifier: Apache-2.0
#include "config_flow.hpp"

#include <utility>

#include <everest/logging.hpp>

namespace span {

namespace {

const FormSchema USER_SCHEMA = {FormField{CONF_HOST, FieldType::String, true, std::nullopt, std::nullopt}};
const FormSchema AUTH_TOKEN_SCHEMA = {
    FormField{CONF_ACCESS_TOKEN, FieldType::String, false, std::nullopt, std::nullopt}};

std::string string_field(const FormData& data, const char* key) {
    if (!data.is_object() || !data.contains(key) || !data[key].is_string()) {
        return {};
    }
    return data[key].get<std::string>();
}

} // namespace

ConfigFlow::ConfigFlow(PanelClientFactory client_factory, std::shared_ptr<EntryRepository> entries) :
    client_factory_(std::move(client_factory)), entries_(std::move(entries)) {
    if (!client_factory_ || !entries_) {
        throw std::invalid_argument("ConfigFlow needs a panel client factory and an entry repository");
    }
}

void ConfigFlow::setup_flow(FlowTrigger trigger, const std::string& host) {
    if (context_.is_set_up()) {
        throw FlowContractError("Flow is already set up");
    }
    auto client = client_factory_(host, std::nullopt);
    const auto status = client->get_status_data();
    context_.set_up(std::move(trigger), host, status.serial_number);
    title_placeholders_[CONF_HOST] = host;
    EVLOG_debug << "Flow set up for panel " << status.serial_number << " at " << host << " (firmware "
                << status.firmware_version << ")";
}

bool ConfigFlow::validate_host(const std::string& host, const std::optional<std::string>& access_token) {
    try {
        return client_factory_(host, access_token)->ping();
    } catch (const PanelError& e) {
        EVLOG_debug << "Validation of " << host << " failed: " << e.what();
        return false;
    }
}

std::optional<FlowResult> ConfigFlow::abort_if_already_configured() {
    context_.ensure_set_up();
    unique_id_ = context_.serial_number();

    const auto existing = entries_->find_by_unique_id(*unique_id_);
    if (!existing) {
        return std::nullopt;
    }
    const auto stored_host = string_field(existing->data, CONF_HOST);
    if (stored_host != context_.host()) {
        auto data = existing->data;
        data[CONF_HOST] = context_.host();
        entries_->update(existing->entry_id, data);
        entries_->reload(existing->entry_id);
        EVLOG_info << "Panel " << *unique_id_ << " moved from " << stored_host << " to " << context_.host();
    }
    EVLOG_info << "Panel " << *unique_id_ << " already configured as entry " << existing->entry_id;
    return FlowResult::abort(abort_reason::ALREADY_CONFIGURED);
}

FlowResult ConfigFlow::step_zeroconf(const DiscoveryInfo& discovery_info) {
    // Do not probe a host that is already configured
    if (entries_->has_host(discovery_info.host)) {
        return FlowResult::abort(abort_reason::ALREADY_CONFIGURED);
    }
    if (!is_ipv4_address(discovery_info.host)) {
        return FlowResult::abort(abort_reason::NOT_IPV4_ADDRESS);
    }
    if (!validate_host(discovery_info.host)) {
        EVLOG_info << "Discovered host " << discovery_info.host << " is not a SPAN panel";
        return FlowResult::abort(abort_reason::NOT_SPAN_PANEL);
    }

    setup_flow(CreateTrigger{}, discovery_info.host);
    if (auto aborted = abort_if_already_configured()) {
        return *aborted;
    }
    return step_confirm_discovery(Prompt{});
}

FlowResult ConfigFlow::step_user(const StepInput& input) {
    const auto* data = submitted_data(input);
    if (data == nullptr) {
        return FlowResult::show_form(step_id::USER, USER_SCHEMA);
    }

    const auto host = string_field(*data, CONF_HOST);
    if (host.empty()) {
        return FlowResult::show_form(step_id::USER, USER_SCHEMA, {{CONF_HOST, "required"}});
    }
    if (!validate_host(host)) {
        return FlowResult::show_form(step_id::USER, USER_SCHEMA, {{"base", abort_reason::CANNOT_CONNECT}});
    }

    setup_flow(CreateTrigger{}, host);
    if (auto aborted = abort_if_already_configured()) {
        return *aborted;
    }
    return step_confirm_discovery(Prompt{});
}

FlowResult ConfigFlow::step_reauth(const ReauthRequest& request) {
    EVLOG_info << "Re-authentication requested for entry " << request.entry_id;
    setup_flow(UpdateTrigger{request.entry_id}, string_field(request.data, CONF_HOST));
    return step_auth_proximity(Prompt{});
}

FlowResult ConfigFlow::step_confirm_discovery(const StepInput& input) {
    context_.ensure_set_up();

    if (std::holds_alternative<Submit>(input)) {
        return step_choose_auth_type(input);
    }
    return FlowResult::show_form(step_id::CONFIRM_DISCOVERY, {}, {}, host_placeholders());
}

FlowResult ConfigFlow::step_choose_auth_type(const StepInput& input) {
    context_.ensure_set_up();

    // Menu closed without a choice
    if (std::holds_alternative<Back>(input)) {
        return step_confirm_discovery(Prompt{});
    }
    if (const auto* data = submitted_data(input)) {
        const auto next = string_field(*data, "next_step_id");
        if (next == step_id::AUTH_PROXIMITY) {
            return step_auth_proximity(Prompt{});
        }
        if (next == step_id::AUTH_TOKEN) {
            return step_auth_token(Prompt{});
        }
    }
    return FlowResult::show_menu(step_id::CHOOSE_AUTH_TYPE,
                                 {MenuOption{step_id::AUTH_PROXIMITY, "Proof of Proximity (recommended)"},
                                  MenuOption{step_id::AUTH_TOKEN, "Existing Auth Token"}});
}

FlowResult ConfigFlow::step_auth_proximity(const StepInput&) {
    context_.ensure_set_up();
    proximity_attempts_++;

    auto client = client_factory_(context_.host(), std::nullopt);
    const auto status = client->get_status_data();

    if (status.proximity_proven.has_value()) {
        // Firmware r202342 and newer
        if (!*status.proximity_proven) {
            return FlowResult::show_form(step_id::AUTH_PROXIMITY, {}, {}, host_placeholders());
        }
    } else if (status.remaining_auth_unlock_button_presses.value_or(-1) != 0) {
        return FlowResult::show_form(step_id::AUTH_PROXIMITY, {}, {}, host_placeholders());
    }

    if (context_.host().empty()) {
        return FlowResult::abort(abort_reason::HOST_NOT_SET);
    }
    EVLOG_info << "Proximity proven on panel " << context_.serial_number() << " after " << proximity_attempts_
               << " attempt(s)";
    return finish_with_token(client->get_access_token());
}

FlowResult ConfigFlow::step_auth_token(const StepInput& input) {
    context_.ensure_set_up();

    if (std::holds_alternative<Prompt>(input)) {
        return FlowResult::show_form(step_id::AUTH_TOKEN, AUTH_TOKEN_SCHEMA);
    }

    const auto* data = submitted_data(input);
    const auto token = data ? string_field(*data, CONF_ACCESS_TOKEN) : std::string{};
    if (token.empty()) {
        return step_choose_auth_type(Submit{});
    }
    if (context_.host().empty()) {
        return FlowResult::abort(abort_reason::HOST_NOT_SET);
    }
    return finish_with_token(token);
}

FlowResult ConfigFlow::finish_with_token(const std::string& access_token) {
    if (!validate_host(context_.host(), access_token)) {
        EVLOG_warning << "Panel " << context_.serial_number() << " rejected the access token";
        return FlowResult::abort(abort_reason::INVALID_ACCESS_TOKEN);
    }
    context_.set_access_token(access_token);
    return step_resolve_entry();
}

FlowResult ConfigFlow::step_resolve_entry() {
    context_.ensure_set_up();

    return std::visit(overloaded{
                          [this](const CreateTrigger&) {
                              if (context_.host().empty()) {
                                  throw FlowContractError("Host cannot be empty when creating a new entry");
                              }
                              if (context_.serial_number().empty()) {
                                  throw FlowContractError("Serial number cannot be empty when creating a new entry");
                              }
                              if (!context_.access_token()) {
                                  throw FlowContractError("Access token cannot be absent when creating a new entry");
                              }
                              return create_new_entry(context_.host(), context_.serial_number(),
                                                      *context_.access_token());
                          },
                          [this](const UpdateTrigger& update) {
                              if (context_.host().empty()) {
                                  throw FlowContractError("Host cannot be empty when updating an entry");
                              }
                              if (!context_.access_token()) {
                                  throw FlowContractError("Access token cannot be absent when updating an entry");
                              }
                              return update_existing_entry(update.entry_id, context_.host(),
                                                           *context_.access_token());
                          },
                      },
                      context_.trigger());
}

FlowResult ConfigFlow::create_new_entry(const std::string& host, const std::string& serial_number,
                                        const std::string& access_token) {
    nlohmann::json data;
    data[CONF_HOST] = host;
    data[CONF_ACCESS_TOKEN] = access_token;
    EVLOG_info << "Panel " << serial_number << " at " << host << " authenticated; creating entry";
    return FlowResult::create_entry(serial_number, data, serial_number);
}

FlowResult ConfigFlow::update_existing_entry(const std::string& entry_id, const std::string& host,
                                             const std::string& access_token) {
    const auto entry = entries_->find_by_entry_id(entry_id);
    if (!entry) {
        throw FlowContractError("Entry " + entry_id + " does not exist");
    }

    auto updated = entry->data;
    updated[CONF_HOST] = host;
    updated[CONF_ACCESS_TOKEN] = access_token;
    entries_->update(entry_id, updated);
    entries_->reload(entry_id);

    EVLOG_info << "Entry " << entry_id << " re-authenticated";
    return FlowResult::abort(abort_reason::REAUTH_SUCCESSFUL);
}

FlowResult ConfigFlow::handle_step(const std::string& step, const StepInput& input) {
    if (step == step_id::USER) return step_user(input);
    if (step == step_id::CONFIRM_DISCOVERY) return step_confirm_discovery(input);
    if (step == step_id::CHOOSE_AUTH_TYPE) return step_choose_auth_type(input);
    if (step == step_id::AUTH_PROXIMITY) return step_auth_proximity(input);
    if (step == step_id::AUTH_TOKEN) return step_auth_token(input);
    throw FlowContractError("Unknown config flow step '" + step + "'");
}

std::map<std::string, std::string> ConfigFlow::host_placeholders() const {
    return {{CONF_HOST, context_.host()}};
}

} // namespace span
