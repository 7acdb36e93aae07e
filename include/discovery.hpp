// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace span {

/// \brief What network discovery knows about a panel before any contact with it.
struct DiscoveryInfo {
    std::string host;     // address as announced, may be IPv6
    std::string hostname; // e.g. "span-nt-2204-c1abc.local."
    std::uint16_t port{0};
    std::string name;     // service instance name
};

/// \brief True for dotted-quad IPv4 literals only.
bool is_ipv4_address(const std::string& host);

#ifdef HAVE_DNSSD
/// \brief Browse a DNS-SD service type and resolve every instance to its addresses.
class DnsSdBrowser {
public:
    using Callback = std::function<void(const DiscoveryInfo&)>;

    explicit DnsSdBrowser(std::string service_type);

    /// \brief Browse for the given duration, invoking on_found for each resolved address.
    /// Returns false when the DNS-SD daemon cannot be reached.
    bool browse(std::chrono::seconds duration, const Callback& on_found);

private:
    std::string service_type_;
};
#endif

} // namespace span
