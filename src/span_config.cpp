// SPDX-License-Identifier: Apache-2.0
#include "span_config.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace span {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

void ensure_parent_dir(const fs::path& file_path) {
    const auto parent = file_path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}
} // namespace

SpanConfig load_span_config(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    const auto json = nlohmann::json::parse(file);
    const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

    SpanConfig cfg{};
    cfg.simulation_mode = json.value("simulationMode", false);
    cfg.default_scan_interval_s = json.value("defaultScanIntervalSeconds", cfg.default_scan_interval_s);

    const auto http = json.value("http", nlohmann::json::object());
    cfg.http.port = http.value("port", cfg.http.port);
    cfg.http.connect_timeout_s = http.value("connectTimeoutSeconds", cfg.http.connect_timeout_s);
    cfg.http.request_timeout_s = http.value("requestTimeoutSeconds", cfg.http.request_timeout_s);
    cfg.http.client_name = http.value("clientName", cfg.http.client_name);

    const auto discovery = json.value("discovery", nlohmann::json::object());
    cfg.discovery.enabled = discovery.value("enabled", cfg.discovery.enabled);
    cfg.discovery.service_type = discovery.value("serviceType", cfg.discovery.service_type);
    cfg.discovery.browse_seconds = discovery.value("browseSeconds", cfg.discovery.browse_seconds);

    if (cfg.default_scan_interval_s < MIN_SCAN_INTERVAL_S) {
        cfg.default_scan_interval_s = DEFAULT_SCAN_INTERVAL_S;
    }
    if (cfg.http.port <= 0 || cfg.http.port > 65535) {
        cfg.http.port = 80;
    }
    if (cfg.http.connect_timeout_s <= 0) {
        cfg.http.connect_timeout_s = 5;
    }
    if (cfg.http.request_timeout_s <= 0) {
        cfg.http.request_timeout_s = 15;
    }
    if (cfg.http.client_name.empty()) {
        cfg.http.client_name = "span-provision";
    }
    if (cfg.discovery.service_type.empty()) {
        cfg.discovery.service_type = "_span._tcp";
    }
    if (cfg.discovery.browse_seconds <= 0) {
        cfg.discovery.browse_seconds = 5;
    }

    cfg.entries_path = make_absolute(base_dir, json.value("entriesPath", "data/entries.json"));
    cfg.logging_config = make_absolute(base_dir, json.value("loggingConfig", "config/logging.ini"));

    // Entry store is created lazily, but its directory must exist for the first write
    ensure_parent_dir(cfg.entries_path);

    return cfg;
}

} // namespace span
