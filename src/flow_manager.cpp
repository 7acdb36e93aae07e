// SPDX-License-Identifier: Apache-2.0
#include "flow_manager.hpp"

#include <utility>

#include <everest/logging.hpp>

namespace span {

FlowManager::FlowManager(PanelClientFactory client_factory, std::shared_ptr<EntryRepository> entries,
                         int default_scan_interval_s) :
    client_factory_(std::move(client_factory)),
    entries_(std::move(entries)),
    default_scan_interval_s_(default_scan_interval_s) {
}

std::shared_ptr<FlowManager::ActiveFlow> FlowManager::new_config_flow() const {
    auto flow = std::make_shared<ActiveFlow>();
    flow->config = std::make_unique<ConfigFlow>(client_factory_, entries_);
    return flow;
}

std::pair<std::string, std::shared_ptr<FlowManager::ActiveFlow>>
FlowManager::register_flow(std::shared_ptr<ActiveFlow> flow) {
    std::lock_guard<std::mutex> lock(flows_mutex_);
    const auto flow_id = "flow-" + std::to_string(++next_flow_id_);
    flows_[flow_id] = flow;
    return {flow_id, flow};
}

template <typename Step>
FlowResult FlowManager::run_step(const std::string& flow_id, ActiveFlow& flow, Step&& step) {
    try {
        return apply_result(flow_id, flow, step());
    } catch (...) {
        // A flow that threw is dead; the exception still reaches the caller
        discard(flow_id);
        throw;
    }
}

FlowManager::FlowHandle FlowManager::start_user() {
    const auto registered = register_flow(new_config_flow());
    auto& flow = *registered.second;
    std::lock_guard<std::mutex> lock(flow.mutex);
    return FlowHandle{registered.first,
                      run_step(registered.first, flow, [&flow]() { return flow.config->step_user(Prompt{}); })};
}

FlowManager::FlowHandle FlowManager::start_discovery(const DiscoveryInfo& info) {
    const auto registered = register_flow(new_config_flow());
    auto& flow = *registered.second;
    EVLOG_debug << "Starting discovery flow " << registered.first << " for " << info.host;
    std::lock_guard<std::mutex> lock(flow.mutex);
    return FlowHandle{registered.first,
                      run_step(registered.first, flow, [&flow, &info]() { return flow.config->step_zeroconf(info); })};
}

FlowManager::FlowHandle FlowManager::start_reauth(const std::string& entry_id) {
    const auto entry = entries_->find_by_entry_id(entry_id);
    if (!entry) {
        throw FlowContractError("Cannot re-authenticate unknown entry " + entry_id);
    }
    const auto registered = register_flow(new_config_flow());
    auto& flow = *registered.second;
    const ReauthRequest request{entry_id, entry->data};
    std::lock_guard<std::mutex> lock(flow.mutex);
    return FlowHandle{registered.first, run_step(registered.first, flow, [&flow, &request]() {
                          return flow.config->step_reauth(request);
                      })};
}

FlowManager::FlowHandle FlowManager::start_options(const std::string& entry_id) {
    auto entry = entries_->find_by_entry_id(entry_id);
    if (!entry) {
        throw FlowContractError("Cannot open options for unknown entry " + entry_id);
    }
    auto active = std::make_shared<ActiveFlow>();
    active->options = std::make_unique<OptionsFlow>(std::move(*entry), default_scan_interval_s_);
    const auto registered = register_flow(active);
    auto& flow = *registered.second;
    std::lock_guard<std::mutex> lock(flow.mutex);
    return FlowHandle{registered.first,
                      run_step(registered.first, flow, [&flow]() { return flow.options->step_init(Prompt{}); })};
}

FlowResult FlowManager::configure(const std::string& flow_id, const std::string& step_id, const StepInput& input) {
    std::shared_ptr<ActiveFlow> flow;
    {
        std::lock_guard<std::mutex> lock(flows_mutex_);
        auto it = flows_.find(flow_id);
        if (it == flows_.end()) {
            throw FlowContractError("Unknown flow " + flow_id);
        }
        flow = it->second;
    }

    std::lock_guard<std::mutex> lock(flow->mutex);
    return run_step(flow_id, *flow, [&flow, &step_id, &input]() {
        return flow->config ? flow->config->handle_step(step_id, input) : flow->options->handle_step(step_id, input);
    });
}

void FlowManager::discard(const std::string& flow_id) {
    std::lock_guard<std::mutex> lock(flows_mutex_);
    flows_.erase(flow_id);
    claimed_unique_ids_.erase(flow_id);
}

bool FlowManager::unique_id_in_progress_elsewhere(const std::string& flow_id, const std::string& unique_id) const {
    for (const auto& kv : claimed_unique_ids_) {
        if (kv.first != flow_id && kv.second == unique_id) {
            return true;
        }
    }
    return false;
}

FlowResult FlowManager::apply_result(const std::string& flow_id, ActiveFlow& flow, FlowResult result) {
    if (flow.config && !result.is_terminal() && flow.config->unique_id()) {
        std::lock_guard<std::mutex> lock(flows_mutex_);
        const auto& unique_id = *flow.config->unique_id();
        if (unique_id_in_progress_elsewhere(flow_id, unique_id)) {
            EVLOG_info << "Flow " << flow_id << " for panel " << unique_id << " duplicates a running flow";
            result = FlowResult::abort(abort_reason::ALREADY_IN_PROGRESS);
        } else {
            claimed_unique_ids_[flow_id] = unique_id;
        }
    }

    if (result.type == FlowResultType::CreateEntry) {
        if (flow.options) {
            entries_->update_options(flow.options->entry_id(), result.data);
            result.entry_id = flow.options->entry_id();
        } else if (!result.unique_id.empty() && entries_->find_by_unique_id(result.unique_id)) {
            result = FlowResult::abort(abort_reason::ALREADY_CONFIGURED);
        } else {
            result.entry_id = entries_->create(result.title, result.unique_id, result.data).entry_id;
        }
    }

    if (result.is_terminal()) {
        discard(flow_id);
        EVLOG_debug << "Flow " << flow_id << " finished: " << to_string(result.type)
                    << (result.reason.empty() ? "" : " (" + result.reason + ")");
    }
    return result;
}

bool FlowManager::is_in_progress(const std::string& flow_id) const {
    std::lock_guard<std::mutex> lock(flows_mutex_);
    return flows_.count(flow_id) > 0;
}

std::size_t FlowManager::in_progress_count() const {
    std::lock_guard<std::mutex> lock(flows_mutex_);
    return flows_.size();
}

} // namespace span
