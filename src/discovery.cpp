// SPDX-License-Identifier: Apache-2.0
#include "discovery.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#ifdef HAVE_DNSSD
#include <dns_sd.h>
#include <netdb.h>
#include <sys/select.h>
#include <sys/socket.h>

#include <set>
#include <utility>

#include <everest/logging.hpp>
#endif

namespace span {

bool is_ipv4_address(const std::string& host) {
    if (host.empty()) return false;
    in_addr addr{};
    return inet_pton(AF_INET, host.c_str(), &addr) == 1;
}

#ifdef HAVE_DNSSD
namespace {

struct BrowsedInstance {
    std::string name;
    std::string regtype;
    std::string domain;
    uint32_t interface_index{0};
};

struct ResolvedInstance {
    bool done{false};
    bool ok{false};
    std::string hosttarget;
    uint16_t port{0};
};

void browse_reply(DNSServiceRef, DNSServiceFlags flags, uint32_t interface_index, DNSServiceErrorType error,
                  const char* service_name, const char* regtype, const char* reply_domain, void* context) {
    if (error != kDNSServiceErr_NoError || !(flags & kDNSServiceFlagsAdd)) {
        return;
    }
    auto* found = static_cast<std::vector<BrowsedInstance>*>(context);
    found->push_back(BrowsedInstance{service_name, regtype, reply_domain, interface_index});
}

void resolve_reply(DNSServiceRef, DNSServiceFlags, uint32_t, DNSServiceErrorType error, const char*,
                   const char* hosttarget, uint16_t port, uint16_t, const unsigned char*, void* context) {
    auto* out = static_cast<ResolvedInstance*>(context);
    out->done = true;
    if (error != kDNSServiceErr_NoError) {
        return;
    }
    out->ok = true;
    out->hosttarget = hosttarget ? hosttarget : "";
    out->port = ntohs(port);
}

// Wait for one reply on ref, at most timeout. Returns false on timeout or daemon error.
bool process_one(DNSServiceRef ref, std::chrono::milliseconds timeout) {
    const int fd = DNSServiceRefSockFD(ref);
    if (fd < 0) return false;
    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(fd, &readfds);
    timeval tv{};
    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
    const int rc = select(fd + 1, &readfds, nullptr, nullptr, &tv);
    if (rc <= 0) return false;
    return DNSServiceProcessResult(ref) == kDNSServiceErr_NoError;
}

std::vector<std::string> lookup_addresses(const std::string& hostname) {
    std::vector<std::string> out;
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (getaddrinfo(hostname.c_str(), nullptr, &hints, &res) != 0) {
        return out;
    }
    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        char buf[INET6_ADDRSTRLEN] = {0};
        if (ai->ai_family == AF_INET) {
            auto* sa = reinterpret_cast<sockaddr_in*>(ai->ai_addr);
            if (inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf))) out.emplace_back(buf);
        } else if (ai->ai_family == AF_INET6) {
            auto* sa = reinterpret_cast<sockaddr_in6*>(ai->ai_addr);
            if (inet_ntop(AF_INET6, &sa->sin6_addr, buf, sizeof(buf))) out.emplace_back(buf);
        }
    }
    freeaddrinfo(res);
    return out;
}

} // namespace

DnsSdBrowser::DnsSdBrowser(std::string service_type) : service_type_(std::move(service_type)) {
}

bool DnsSdBrowser::browse(std::chrono::seconds duration, const Callback& on_found) {
    std::vector<BrowsedInstance> found;
    DNSServiceRef browse_ref = nullptr;
    auto err = DNSServiceBrowse(&browse_ref, 0, 0, service_type_.c_str(), nullptr, browse_reply, &found);
    if (err != kDNSServiceErr_NoError) {
        EVLOG_error << "DNSServiceBrowse for " << service_type_ << " failed: " << err;
        return false;
    }

    std::set<std::string> reported;
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (std::chrono::steady_clock::now() < deadline) {
        process_one(browse_ref, std::chrono::milliseconds(250));

        auto pending = std::move(found);
        found.clear();
        for (const auto& inst : pending) {
            ResolvedInstance resolved;
            DNSServiceRef resolve_ref = nullptr;
            err = DNSServiceResolve(&resolve_ref, 0, inst.interface_index, inst.name.c_str(), inst.regtype.c_str(),
                                    inst.domain.c_str(), resolve_reply, &resolved);
            if (err != kDNSServiceErr_NoError) {
                EVLOG_warning << "DNSServiceResolve for " << inst.name << " failed: " << err;
                continue;
            }
            while (!resolved.done && process_one(resolve_ref, std::chrono::seconds(2))) {
            }
            DNSServiceRefDeallocate(resolve_ref);
            if (!resolved.ok) {
                EVLOG_debug << "Could not resolve " << inst.name;
                continue;
            }
            for (const auto& address : lookup_addresses(resolved.hosttarget)) {
                if (!reported.insert(inst.name + "|" + address).second) continue;
                DiscoveryInfo info;
                info.host = address;
                info.hostname = resolved.hosttarget;
                info.port = resolved.port;
                info.name = inst.name;
                EVLOG_debug << "Discovered " << info.name << " at " << info.host;
                on_found(info);
            }
        }
    }
    DNSServiceRefDeallocate(browse_ref);
    return true;
}
#endif

} // namespace span
