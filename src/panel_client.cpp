// SPDX-License-Identifier: Apache-2.0
#include "panel_client.hpp"

#include <algorithm>
#include <cctype>

namespace span {

std::string relay_state_to_string(RelayState state) {
    switch (state) {
    case RelayState::Open:
        return "OPEN";
    case RelayState::Closed:
        return "CLOSED";
    case RelayState::Unknown:
        break;
    }
    return "UNKNOWN";
}

RelayState relay_state_from_string(const std::string& s) {
    std::string upper = s;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "OPEN") return RelayState::Open;
    if (upper == "CLOSED") return RelayState::Closed;
    return RelayState::Unknown;
}

} // namespace span
