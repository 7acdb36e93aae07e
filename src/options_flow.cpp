// SPDX-License-Identifier: Apache-2.0
#include "options_flow.hpp"

#include <cmath>
#include <limits>
#include <utility>

#include <everest/logging.hpp>

namespace span {

namespace {

// Integer from a JSON number or numeric string. Rejects fractions and out-of-range values.
std::optional<int> coerce_int(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        const auto v = value.get<long long>();
        if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_number_float()) {
        const auto v = value.get<double>();
        if (std::floor(v) != v || std::fabs(v) > std::numeric_limits<int>::max()) return std::nullopt;
        return static_cast<int>(v);
    }
    if (value.is_string()) {
        const auto s = value.get<std::string>();
        try {
            std::size_t used = 0;
            const int v = std::stoi(s, &used);
            if (used != s.size()) return std::nullopt;
            return v;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

} // namespace

OptionsFlow::OptionsFlow(Entry entry, int default_scan_interval_s) :
    entry_(std::move(entry)), default_scan_interval_s_(default_scan_interval_s) {
    if (!entry_.options.is_object()) {
        entry_.options = nlohmann::json::object();
    }
}

FormSchema OptionsFlow::schema() const {
    return {
        FormField{option_key::SCAN_INTERVAL, FieldType::Integer, false,
                  stored_int(option_key::SCAN_INTERVAL, default_scan_interval_s_, MIN_SCAN_INTERVAL_S),
                  MIN_SCAN_INTERVAL_S},
        FormField{option_key::BATTERY_ENABLE, FieldType::Boolean, false, stored_bool(option_key::BATTERY_ENABLE),
                  std::nullopt},
        FormField{option_key::INVERTER_ENABLE, FieldType::Boolean, false, stored_bool(option_key::INVERTER_ENABLE),
                  std::nullopt},
        FormField{option_key::INVERTER_LEG1, FieldType::Integer, false, stored_int(option_key::INVERTER_LEG1, 0, 0), 0},
        FormField{option_key::INVERTER_LEG2, FieldType::Integer, false, stored_int(option_key::INVERTER_LEG2, 0, 0), 0},
    };
}

int OptionsFlow::stored_int(const char* key, int fallback, int min) const {
    if (!entry_.options.contains(key)) {
        return fallback;
    }
    const auto v = coerce_int(entry_.options[key]);
    if (!v || *v < min) {
        EVLOG_warning << "Entry " << entry_.entry_id << " has invalid stored option " << key << "="
                      << entry_.options[key].dump() << "; using " << fallback;
        return fallback;
    }
    return *v;
}

bool OptionsFlow::stored_bool(const char* key) const {
    if (!entry_.options.contains(key)) {
        return false;
    }
    const auto& value = entry_.options[key];
    if (!value.is_boolean()) {
        EVLOG_warning << "Entry " << entry_.entry_id << " has invalid stored option " << key << "=" << value.dump()
                      << "; using false";
        return false;
    }
    return value.get<bool>();
}

FlowResult OptionsFlow::step_init(const StepInput& input) {
    const auto fields = schema();
    const auto* data = submitted_data(input);
    if (data == nullptr) {
        return FlowResult::show_form(OPTIONS_STEP_INIT, fields);
    }

    nlohmann::json options = nlohmann::json::object();
    std::map<std::string, std::string> errors;
    for (const auto& field : fields) {
        if (!data->is_object() || !data->contains(field.name)) {
            options[field.name] = *field.default_value;
            continue;
        }
        const auto& value = (*data)[field.name];
        if (field.type == FieldType::Boolean) {
            if (!value.is_boolean()) {
                errors[field.name] = "invalid_value";
                continue;
            }
            options[field.name] = value.get<bool>();
        } else {
            const auto v = coerce_int(value);
            if (!v || (field.min && *v < *field.min)) {
                errors[field.name] = "invalid_value";
                continue;
            }
            options[field.name] = *v;
        }
    }

    if (!errors.empty()) {
        return FlowResult::show_form(OPTIONS_STEP_INIT, fields, errors);
    }
    EVLOG_info << "Options updated for entry " << entry_.entry_id << ": " << options.dump();
    return FlowResult::create_entry("", options);
}

FlowResult OptionsFlow::handle_step(const std::string& step_id, const StepInput& input) {
    if (step_id != OPTIONS_STEP_INIT) {
        throw FlowContractError("Unknown options flow step '" + step_id + "'");
    }
    return step_init(input);
}

} // namespace span
