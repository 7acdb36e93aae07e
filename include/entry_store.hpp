// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "entry_repository.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace span {

class EntryStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// \brief EntryRepository persisted as a JSON document on disk.
/// reload() requests are queued and handed to the ReloadHandler on a worker thread.
class JsonEntryStore : public EntryRepository {
public:
    using ReloadHandler = std::function<void(const Entry&)>;

    explicit JsonEntryStore(std::filesystem::path path);
    ~JsonEntryStore() override;

    JsonEntryStore(const JsonEntryStore&) = delete;
    JsonEntryStore& operator=(const JsonEntryStore&) = delete;

    void set_reload_handler(ReloadHandler handler);

    std::optional<Entry> find_by_unique_id(const std::string& unique_id) const override;
    std::optional<Entry> find_by_entry_id(const std::string& entry_id) const override;
    bool has_host(const std::string& host) const override;
    std::vector<Entry> entries() const override;

    Entry create(const std::string& title, const std::string& unique_id, const nlohmann::json& data) override;
    void update(const std::string& entry_id, const nlohmann::json& data) override;
    void update_options(const std::string& entry_id, const nlohmann::json& options) override;
    void remove(const std::string& entry_id) override;
    void reload(const std::string& entry_id) override;

    /// \brief Block until every queued reload has been handed to the handler.
    void wait_for_reloads();

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_; // keyed by entry_id

    std::mutex reload_mutex_;
    std::condition_variable reload_cv_;
    std::condition_variable reload_idle_cv_;
    std::deque<std::string> reload_queue_;
    bool reload_busy_{false};
    ReloadHandler reload_handler_;
    std::atomic<bool> running_{true};
    std::thread reload_thread_;

    void load_from_disk();
    void commit_locked(std::map<std::string, Entry> next);
    void persist(const std::map<std::string, Entry>& entries) const;
    const Entry& require_entry_locked(const std::string& entry_id) const;
    void reload_loop();
    static std::string make_entry_id();
};

nlohmann::json entry_to_json(const Entry& entry);
Entry entry_from_json(const nlohmann::json& j);

} // namespace span
