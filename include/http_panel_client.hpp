// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "panel_client.hpp"
#include "span_config.hpp"

#include <nlohmann/json.hpp>

namespace span {

/// \brief PanelClient over the panel's local REST API (libcurl).
class HttpPanelClient : public PanelClient {
public:
    HttpPanelClient(std::string host, std::optional<std::string> access_token, HttpConfig cfg);
    ~HttpPanelClient() override = default;

    bool ping() override;
    PanelStatus get_status_data() override;
    std::string get_access_token() override;
    CircuitMap get_circuits() override;
    void set_relay(const Circuit& circuit, RelayState state) override;

    const std::string& host() const override { return host_; }

    static PanelClientFactory factory(const HttpConfig& cfg);

private:
    struct Response {
        long status{0};
        std::string body;
    };

    std::string host_;
    std::optional<std::string> access_token_;
    HttpConfig cfg_;

    std::string make_url(const std::string& path) const;
    Response perform(const std::string& method, const std::string& path, const std::optional<std::string>& body,
                     bool authenticated);
    nlohmann::json request_json(const std::string& method, const std::string& path,
                                const std::optional<nlohmann::json>& body, bool authenticated);
};

/// \brief Parse the GET /api/v1/status body. Throws PanelResponseError on missing serial.
PanelStatus parse_panel_status(const nlohmann::json& j);

/// \brief Parse the GET /api/v1/circuits body.
CircuitMap parse_circuits(const nlohmann::json& j);

} // namespace span
