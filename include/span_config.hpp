// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <filesystem>
#include <string>

namespace span {

namespace fs = std::filesystem;

constexpr int DEFAULT_SCAN_INTERVAL_S = 15;
constexpr int MIN_SCAN_INTERVAL_S = 5;

struct HttpConfig {
    int port{80};
    int connect_timeout_s{5};
    int request_timeout_s{15};
    std::string client_name{"span-provision"}; // Name registered with the panel when requesting a token
};

struct DiscoveryConfig {
    bool enabled{true};
    std::string service_type{"_span._tcp"};
    int browse_seconds{5};
};

struct SpanConfig {
    bool simulation_mode{false}; // If true, talk to an in-process simulated panel instead of HTTP
    int default_scan_interval_s{DEFAULT_SCAN_INTERVAL_S};
    HttpConfig http;
    DiscoveryConfig discovery;

    fs::path entries_path;
    fs::path logging_config;
};

/// \brief Load span.json and populate a SpanConfig with absolute paths.
SpanConfig load_span_config(const fs::path& config_path);

} // namespace span
