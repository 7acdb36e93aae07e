// SPDX-License-Identifier: Apache-2.0
#include "provisioning_context.hpp"
#include "flow_types.hpp"

#include <utility>

namespace span {

void ProvisioningContext::set_up(FlowTrigger trigger, std::string host, std::string serial_number) {
    if (set_up_) {
        throw FlowContractError("Flow is already set up");
    }
    trigger_ = std::move(trigger);
    host_ = std::move(host);
    serial_number_ = std::move(serial_number);
    set_up_ = true;
}

void ProvisioningContext::ensure_set_up() const {
    if (!set_up_) {
        throw FlowContractError("Flow is not set up");
    }
}

const FlowTrigger& ProvisioningContext::trigger() const {
    ensure_set_up();
    return trigger_;
}

bool ProvisioningContext::is_create() const {
    return std::holds_alternative<CreateTrigger>(trigger());
}

const std::string& ProvisioningContext::host() const {
    ensure_set_up();
    return host_;
}

const std::string& ProvisioningContext::serial_number() const {
    ensure_set_up();
    return serial_number_;
}

const std::optional<std::string>& ProvisioningContext::access_token() const {
    ensure_set_up();
    return access_token_;
}

void ProvisioningContext::set_access_token(std::string token) {
    ensure_set_up();
    if (token.empty()) {
        throw FlowContractError("Access token cannot be empty");
    }
    access_token_ = std::move(token);
}

} // namespace span
