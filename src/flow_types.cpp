// SPDX-License-Identifier: Apache-2.0
#include "flow_types.hpp"

#include <utility>

namespace span {

FlowResult FlowResult::show_form(std::string step_id, FormSchema schema, std::map<std::string, std::string> errors,
                                 std::map<std::string, std::string> placeholders) {
    FlowResult r;
    r.type = FlowResultType::ShowForm;
    r.step_id = std::move(step_id);
    r.schema = std::move(schema);
    r.errors = std::move(errors);
    r.placeholders = std::move(placeholders);
    return r;
}

FlowResult FlowResult::show_menu(std::string step_id, std::vector<MenuOption> options) {
    FlowResult r;
    r.type = FlowResultType::ShowMenu;
    r.step_id = std::move(step_id);
    r.menu_options = std::move(options);
    return r;
}

FlowResult FlowResult::create_entry(std::string title, nlohmann::json data, std::string unique_id) {
    FlowResult r;
    r.type = FlowResultType::CreateEntry;
    r.title = std::move(title);
    r.data = std::move(data);
    r.unique_id = std::move(unique_id);
    return r;
}

FlowResult FlowResult::abort(std::string reason) {
    FlowResult r;
    r.type = FlowResultType::Abort;
    r.reason = std::move(reason);
    return r;
}

std::string to_string(FlowResultType type) {
    switch (type) {
    case FlowResultType::ShowForm:
        return "form";
    case FlowResultType::ShowMenu:
        return "menu";
    case FlowResultType::CreateEntry:
        return "create_entry";
    case FlowResultType::Abort:
        return "abort";
    }
    return "unknown";
}

const FormData* submitted_data(const StepInput& input) {
    if (const auto* submit = std::get_if<Submit>(&input)) {
        return &submit->data;
    }
    return nullptr;
}

} // namespace span
