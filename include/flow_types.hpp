// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace span {

constexpr const char* CONF_HOST = "host";
constexpr const char* CONF_ACCESS_TOKEN = "access_token";

namespace abort_reason {
constexpr const char* NOT_IPV4_ADDRESS = "not_ipv4_address";
constexpr const char* NOT_SPAN_PANEL = "not_span_panel";
constexpr const char* CANNOT_CONNECT = "cannot_connect";
constexpr const char* HOST_NOT_SET = "host_not_set";
constexpr const char* INVALID_ACCESS_TOKEN = "invalid_access_token";
constexpr const char* REAUTH_SUCCESSFUL = "reauth_successful";
constexpr const char* ALREADY_CONFIGURED = "already_configured";
constexpr const char* ALREADY_IN_PROGRESS = "already_in_progress";
} // namespace abort_reason

/// \brief Caller misused a flow (wrong step order, missing context field, unknown id).
/// Never converted into a form error or abort.
class FlowContractError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

using FormData = nlohmann::json;

enum class FieldType { String, Integer, Boolean };

struct FormField {
    std::string name;
    FieldType type{FieldType::String};
    bool required{false};
    std::optional<nlohmann::json> default_value;
    std::optional<int> min; // Integer fields only
};

using FormSchema = std::vector<FormField>;

/// \brief Render the step without submitting anything.
struct Prompt {};
/// \brief Operator submitted the form.
struct Submit {
    FormData data = FormData::object();
};
/// \brief Operator backed out of the step (menu closed, empty answer).
struct Back {};

using StepInput = std::variant<Prompt, Submit, Back>;

struct MenuOption {
    std::string id;
    std::string label;
};

enum class FlowResultType { ShowForm, ShowMenu, CreateEntry, Abort };

struct FlowResult {
    FlowResultType type{FlowResultType::Abort};
    std::string step_id;

    // ShowForm
    FormSchema schema;
    std::map<std::string, std::string> errors;
    std::map<std::string, std::string> placeholders;

    // ShowMenu
    std::vector<MenuOption> menu_options;

    // CreateEntry
    std::string title;
    std::string unique_id;
    nlohmann::json data = nlohmann::json::object();
    std::string entry_id; // filled in once the entry has been stored

    // Abort
    std::string reason;

    static FlowResult show_form(std::string step_id, FormSchema schema = {},
                                std::map<std::string, std::string> errors = {},
                                std::map<std::string, std::string> placeholders = {});
    static FlowResult show_menu(std::string step_id, std::vector<MenuOption> options);
    static FlowResult create_entry(std::string title, nlohmann::json data, std::string unique_id = {});
    static FlowResult abort(std::string reason);

    bool is_terminal() const { return type == FlowResultType::CreateEntry || type == FlowResultType::Abort; }
};

std::string to_string(FlowResultType type);

/// \brief Submitted form data, or nullptr for Prompt/Back.
const FormData* submitted_data(const StepInput& input);

} // namespace span
