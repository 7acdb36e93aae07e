// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "config_flow.hpp"
#include "options_flow.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace span {

/// \brief Owns running flows by id and applies their terminal results to the repository.
///
/// Steps of one flow are serialized; different flows run independently.
class FlowManager {
public:
    struct FlowHandle {
        std::string flow_id;
        FlowResult result;
    };

    FlowManager(PanelClientFactory client_factory, std::shared_ptr<EntryRepository> entries,
                int default_scan_interval_s = DEFAULT_SCAN_INTERVAL_S);

    FlowHandle start_user();
    FlowHandle start_discovery(const DiscoveryInfo& info);
    /// \brief Throws FlowContractError when the entry does not exist.
    FlowHandle start_reauth(const std::string& entry_id);
    /// \brief Throws FlowContractError when the entry does not exist.
    FlowHandle start_options(const std::string& entry_id);

    /// \brief Feed an answer to the step named step_id of a running flow.
    FlowResult configure(const std::string& flow_id, const std::string& step_id, const StepInput& input);

    bool is_in_progress(const std::string& flow_id) const;
    std::size_t in_progress_count() const;

private:
    struct ActiveFlow {
        std::mutex mutex;
        std::unique_ptr<ConfigFlow> config;
        std::unique_ptr<OptionsFlow> options;
    };

    PanelClientFactory client_factory_;
    std::shared_ptr<EntryRepository> entries_;
    int default_scan_interval_s_;
    mutable std::mutex flows_mutex_;
    std::map<std::string, std::shared_ptr<ActiveFlow>> flows_;
    std::map<std::string, std::string> claimed_unique_ids_; // flow id -> panel serial
    unsigned long next_flow_id_{0};

    std::pair<std::string, std::shared_ptr<ActiveFlow>> register_flow(std::shared_ptr<ActiveFlow> flow);
    template <typename Step> FlowResult run_step(const std::string& flow_id, ActiveFlow& flow, Step&& step);
    void discard(const std::string& flow_id);
    FlowResult apply_result(const std::string& flow_id, ActiveFlow& flow, FlowResult result);
    bool unique_id_in_progress_elsewhere(const std::string& flow_id, const std::string& unique_id) const;
    std::shared_ptr<ActiveFlow> new_config_flow() const;
};

} // namespace span
