// SPDX-License-Identifier: Apache-2.0
#include "panel_coordinator.hpp"

#include <utility>

#include <everest/logging.hpp>

namespace span {

PanelCoordinator::PanelCoordinator(std::shared_ptr<PanelClient> client, std::chrono::seconds scan_interval) :
    client_(std::move(client)), scan_interval_(scan_interval) {
    if (!client_) {
        throw std::invalid_argument("PanelCoordinator needs a panel client");
    }
    if (scan_interval_.count() <= 0) {
        scan_interval_ = std::chrono::seconds(1);
    }
}

PanelCoordinator::~PanelCoordinator() {
    stop();
}

void PanelCoordinator::set_auth_failed_callback(AuthFailedCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    auth_failed_cb_ = std::move(cb);
}

bool PanelCoordinator::refresh() {
    AuthFailedCallback notify;
    try {
        PanelSnapshot snap;
        snap.status = client_->get_status_data();
        snap.circuits = client_->get_circuits();
        snap.updated_at = std::chrono::system_clock::now();
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_ = std::move(snap);
        auth_failure_reported_ = false;
        last_update_success_ = true;
        return true;
    } catch (const PanelAuthError& e) {
        EVLOG_warning << "Panel " << client_->host() << " rejected the stored token: " << e.what();
        std::lock_guard<std::mutex> lock(mutex_);
        last_update_success_ = false;
        if (!auth_failure_reported_) {
            auth_failure_reported_ = true;
            notify = auth_failed_cb_;
        }
    } catch (const PanelError& e) {
        EVLOG_warning << "Refresh of panel " << client_->host() << " failed: " << e.what();
        last_update_success_ = false;
    }
    if (notify) {
        notify();
    }
    return false;
}

void PanelCoordinator::start() {
    if (running_.exchange(true)) {
        return;
    }
    poll_thread_ = std::thread([this]() { poll_loop(); });
}

void PanelCoordinator::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_cv_.notify_all();
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
}

void PanelCoordinator::request_refresh() {
    if (!running_) {
        refresh();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        refresh_requested_ = true;
    }
    wake_cv_.notify_all();
}

std::optional<PanelSnapshot> PanelCoordinator::data() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

void PanelCoordinator::poll_loop() {
    while (running_) {
        refresh();
        std::unique_lock<std::mutex> lock(mutex_);
        wake_cv_.wait_for(lock, scan_interval_, [this]() { return !running_ || refresh_requested_; });
        refresh_requested_ = false;
    }
}

} // namespace span
