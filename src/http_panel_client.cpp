// SPDX-License-Identifier: Apache-2.0
#include "http_panel_client.hpp"

#include <iomanip>
#include <limits>
#include <mutex>
#include <random>
#include <sstream>
#include <utility>

#include <curl/curl.h>
#include <everest/logging.hpp>

namespace span {

namespace {

constexpr const char* STATUS_PATH = "/api/v1/status";
constexpr const char* PANEL_PATH = "/api/v1/panel";
constexpr const char* REGISTER_PATH = "/api/v1/auth/register";
constexpr const char* CIRCUITS_PATH = "/api/v1/circuits";

std::size_t write_body(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * nmemb);
    return size * nmemb;
}

std::string random_suffix() {
    std::random_device rd;
    std::uniform_int_distribution<unsigned int> dist(0, 0xFFFF);
    std::ostringstream os;
    os << std::hex << std::setw(4) << std::setfill('0') << dist(rd) << std::setw(4) << dist(rd);
    return os.str();
}

} // namespace

HttpPanelClient::HttpPanelClient(std::string host, std::optional<std::string> access_token, HttpConfig cfg) :
    host_(std::move(host)), access_token_(std::move(access_token)), cfg_(std::move(cfg)) {
    static std::once_flag curl_once;
    std::call_once(curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

PanelClientFactory HttpPanelClient::factory(const HttpConfig& cfg) {
    return [cfg](const std::string& host, const std::optional<std::string>& access_token) {
        return std::make_shared<HttpPanelClient>(host, access_token, cfg);
    };
}

std::string HttpPanelClient::make_url(const std::string& path) const {
    std::string url = "http://" + host_;
    if (cfg_.port != 80) {
        url += ":" + std::to_string(cfg_.port);
    }
    return url + path;
}

HttpPanelClient::Response HttpPanelClient::perform(const std::string& method, const std::string& path,
                                                   const std::optional<std::string>& body, bool authenticated) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw PanelConnectionError("curl_easy_init failed");
    }

    Response response;
    const auto url = make_url(path);
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
    }
    if (authenticated && access_token_) {
        const auto auth = "Authorization: Bearer " + *access_token_;
        headers = curl_slist_append(headers, auth.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, CURLPROTO_HTTP);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(cfg_.connect_timeout_s));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(cfg_.request_timeout_s));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        const std::string& payload = body ? *body : std::string{};
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(curl, CURLOPT_COPYPOSTFIELDS, payload.c_str());
    }

    const CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        throw PanelConnectionError(method + " " + url + " failed: " + curl_easy_strerror(res));
    }
    return response;
}

nlohmann::json HttpPanelClient::request_json(const std::string& method, const std::string& path,
                                             const std::optional<nlohmann::json>& body, bool authenticated) {
    std::optional<std::string> payload;
    if (body) {
        payload = body->dump();
    }
    const auto response = perform(method, path, payload, authenticated);
    if (response.status == 401 || response.status == 403) {
        throw PanelAuthError(method + " " + path + " rejected with HTTP " + std::to_string(response.status));
    }
    if (response.status < 200 || response.status >= 300) {
        throw PanelConnectionError(method + " " + path + " returned HTTP " + std::to_string(response.status));
    }
    if (response.body.empty()) {
        return nlohmann::json::object();
    }
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        throw PanelResponseError(method + " " + path + " returned malformed JSON: " + e.what());
    }
}

bool HttpPanelClient::ping() {
    try {
        if (access_token_) {
            request_json("GET", PANEL_PATH, std::nullopt, true);
        } else {
            request_json("GET", STATUS_PATH, std::nullopt, false);
        }
        return true;
    } catch (const PanelError& e) {
        EVLOG_debug << "Ping of " << host_ << " failed: " << e.what();
        return false;
    }
}

PanelStatus HttpPanelClient::get_status_data() {
    return parse_panel_status(request_json("GET", STATUS_PATH, std::nullopt, false));
}

std::string HttpPanelClient::get_access_token() {
    nlohmann::json body;
    body["name"] = cfg_.client_name + "-" + random_suffix();
    body["description"] = "Local SPAN panel provisioning client";
    const auto j = request_json("POST", REGISTER_PATH, body, false);
    const auto token = j.value("accessToken", "");
    if (token.empty()) {
        throw PanelResponseError("Register response carried no accessToken");
    }
    return token;
}

CircuitMap HttpPanelClient::get_circuits() {
    return parse_circuits(request_json("GET", CIRCUITS_PATH, std::nullopt, true));
}

void HttpPanelClient::set_relay(const Circuit& circuit, RelayState state) {
    if (state == RelayState::Unknown) {
        throw std::invalid_argument("Relay state must be OPEN or CLOSED");
    }
    nlohmann::json body;
    body["relayStateIn"]["relayState"] = relay_state_to_string(state);
    request_json("POST", std::string(CIRCUITS_PATH) + "/" + circuit.id, body, true);
    EVLOG_info << "Circuit " << circuit.id << " on " << host_ << " set to " << relay_state_to_string(state);
}

PanelStatus parse_panel_status(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("system") || !j["system"].is_object()) {
        throw PanelResponseError("Status response missing 'system' object");
    }
    const auto& system = j["system"];
    PanelStatus status;
    try {
        status.serial_number = system.value("serial", "");
        status.model = system.value("model", "");
        const auto software = j.value("software", nlohmann::json::object());
        status.firmware_version = software.value("firmwareVersion", "");
    } catch (const nlohmann::json::exception& e) {
        throw PanelResponseError(std::string("Status response has unexpected field types: ") + e.what());
    }
    if (status.serial_number.empty()) {
        throw PanelResponseError("Status response missing serial number");
    }
    if (system.contains("proximityProven") && system["proximityProven"].is_boolean()) {
        status.proximity_proven = system["proximityProven"].get<bool>();
    }
    if (system.contains("remainingAuthUnlockButtonPresses")) {
        const auto& presses = system["remainingAuthUnlockButtonPresses"];
        if (!presses.is_number_integer() || presses.get<long long>() < 0 ||
            presses.get<long long>() > std::numeric_limits<int>::max()) {
            throw PanelResponseError("Status response has invalid remainingAuthUnlockButtonPresses " + presses.dump());
        }
        status.remaining_auth_unlock_button_presses = presses.get<int>();
    }
    return status;
}

CircuitMap parse_circuits(const nlohmann::json& j) {
    CircuitMap circuits;
    if (!j.is_object() || !j.contains("circuits") || !j["circuits"].is_object()) {
        throw PanelResponseError("Circuits response missing 'circuits' object");
    }
    try {
        for (const auto& [key, value] : j["circuits"].items()) {
            if (!value.is_object()) continue;
            Circuit c;
            c.id = value.value("id", key);
            c.name = value.value("name", c.id);
            c.relay_state = relay_state_from_string(value.value("relayState", "UNKNOWN"));
            c.is_user_controllable = value.value("isUserControllable", false);
            c.instant_power_w = value.value("instantPowerW", 0.0);
            circuits.emplace(c.id, c);
        }
    } catch (const nlohmann::json::exception& e) {
        throw PanelResponseError(std::string("Circuits response has unexpected field types: ") + e.what());
    }
    return circuits;
}

} // namespace span
