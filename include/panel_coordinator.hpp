// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "panel_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace span {

struct PanelSnapshot {
    PanelStatus status;
    CircuitMap circuits;
    std::chrono::system_clock::time_point updated_at;
};

/// \brief Polls one provisioned panel and keeps the last good snapshot.
class PanelCoordinator {
public:
    using AuthFailedCallback = std::function<void()>;

    PanelCoordinator(std::shared_ptr<PanelClient> client, std::chrono::seconds scan_interval);
    ~PanelCoordinator();

    PanelCoordinator(const PanelCoordinator&) = delete;
    PanelCoordinator& operator=(const PanelCoordinator&) = delete;

    /// \brief Fetch status and circuits now. Returns false when the fetch failed.
    bool refresh();

    void start();
    void stop();

    /// \brief Wake the polling thread, or refresh inline when it is not running.
    void request_refresh();

    std::optional<PanelSnapshot> data() const;
    bool last_update_success() const { return last_update_success_; }
    PanelClient& client() { return *client_; }

    /// \brief Called once per streak of token rejections (reset by the next good refresh).
    void set_auth_failed_callback(AuthFailedCallback cb);

private:
    std::shared_ptr<PanelClient> client_;
    std::chrono::seconds scan_interval_;
    mutable std::mutex mutex_;
    std::optional<PanelSnapshot> snapshot_;
    AuthFailedCallback auth_failed_cb_;
    bool auth_failure_reported_{false};
    std::atomic<bool> last_update_success_{false};

    std::atomic<bool> running_{false};
    bool refresh_requested_{false};
    std::condition_variable wake_cv_;
    std::thread poll_thread_;

    void poll_loop();
};

} // namespace span
