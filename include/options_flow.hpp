// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "entry_repository.hpp"
#include "flow_types.hpp"
#include "span_config.hpp"

namespace span {

namespace option_key {
constexpr const char* SCAN_INTERVAL = "scan_interval";
constexpr const char* BATTERY_ENABLE = "enable_battery_percentage";
constexpr const char* INVERTER_ENABLE = "enable_solar_circuit";
constexpr const char* INVERTER_LEG1 = "inverter_leg1";
constexpr const char* INVERTER_LEG2 = "inverter_leg2";
} // namespace option_key

constexpr const char* OPTIONS_STEP_INIT = "init";

/// \brief Post-setup options for one entry. Defaults come from the entry's stored options.
class OptionsFlow {
public:
    explicit OptionsFlow(Entry entry, int default_scan_interval_s = DEFAULT_SCAN_INTERVAL_S);

    FlowResult step_init(const StepInput& input);
    FlowResult handle_step(const std::string& step_id, const StepInput& input);

    /// \brief Form fields with defaults resolved against the stored options.
    FormSchema schema() const;

    const std::string& entry_id() const { return entry_.entry_id; }

private:
    Entry entry_;
    int default_scan_interval_s_;

    // Stored values that fail validation fall back to the default
    int stored_int(const char* key, int fallback, int min) const;
    bool stored_bool(const char* key) const;
};

} // namespace span
