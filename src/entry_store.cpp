// SPDX-License-Identifier: Apache-2.0
#include "entry_store.hpp"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

#include <everest/logging.hpp>

namespace span {

nlohmann::json entry_to_json(const Entry& entry) {
    nlohmann::json j;
    j["entryId"] = entry.entry_id;
    j["uniqueId"] = entry.unique_id;
    j["title"] = entry.title;
    j["data"] = entry.data;
    j["options"] = entry.options;
    return j;
}

Entry entry_from_json(const nlohmann::json& j) {
    Entry entry;
    entry.entry_id = j.value("entryId", "");
    entry.unique_id = j.value("uniqueId", "");
    entry.title = j.value("title", entry.unique_id);
    entry.data = j.value("data", nlohmann::json::object());
    entry.options = j.value("options", nlohmann::json::object());
    if (entry.entry_id.empty()) {
        throw EntryStoreError("Stored entry without entryId");
    }
    if (!entry.data.is_object() || !entry.options.is_object()) {
        throw EntryStoreError("Stored entry " + entry.entry_id + " has non-object data/options");
    }
    return entry;
}

JsonEntryStore::JsonEntryStore(std::filesystem::path path) : path_(std::move(path)) {
    load_from_disk();
    reload_thread_ = std::thread([this]() { reload_loop(); });
}

JsonEntryStore::~JsonEntryStore() {
    {
        std::lock_guard<std::mutex> lock(reload_mutex_);
        running_ = false;
    }
    reload_cv_.notify_all();
    if (reload_thread_.joinable()) {
        reload_thread_.join();
    }
}

void JsonEntryStore::set_reload_handler(ReloadHandler handler) {
    std::lock_guard<std::mutex> lock(reload_mutex_);
    reload_handler_ = std::move(handler);
}

std::optional<Entry> JsonEntryStore::find_by_unique_id(const std::string& unique_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : entries_) {
        if (kv.second.unique_id == unique_id) {
            return kv.second;
        }
    }
    return std::nullopt;
}

std::optional<Entry> JsonEntryStore::find_by_entry_id(const std::string& entry_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(entry_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool JsonEntryStore::has_host(const std::string& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : entries_) {
        const auto& data = kv.second.data;
        if (data.contains("host") && data["host"].is_string() && data["host"].get<std::string>() == host) {
            return true;
        }
    }
    return false;
}

std::vector<Entry> JsonEntryStore::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Entry> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) {
        out.push_back(kv.second);
    }
    return out;
}

Entry JsonEntryStore::create(const std::string& title, const std::string& unique_id, const nlohmann::json& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!unique_id.empty()) {
        for (const auto& kv : entries_) {
            if (kv.second.unique_id == unique_id) {
                throw EntryStoreError("Entry with unique id " + unique_id + " already exists");
            }
        }
    }
    Entry entry;
    do {
        entry.entry_id = make_entry_id();
    } while (entries_.count(entry.entry_id));
    entry.unique_id = unique_id;
    entry.title = title;
    entry.data = data.is_object() ? data : nlohmann::json::object();

    auto next = entries_;
    next[entry.entry_id] = entry;
    commit_locked(std::move(next));
    EVLOG_info << "Created entry " << entry.entry_id << " (" << title << ")";
    return entry;
}

void JsonEntryStore::update(const std::string& entry_id, const nlohmann::json& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_entry_locked(entry_id);
    auto next = entries_;
    next[entry_id].data = data;
    commit_locked(std::move(next));
}

void JsonEntryStore::update_options(const std::string& entry_id, const nlohmann::json& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_entry_locked(entry_id);
    auto next = entries_;
    next[entry_id].options = options;
    commit_locked(std::move(next));
}

void JsonEntryStore::remove(const std::string& entry_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_entry_locked(entry_id);
    auto next = entries_;
    next.erase(entry_id);
    commit_locked(std::move(next));
}

void JsonEntryStore::reload(const std::string& entry_id) {
    {
        std::lock_guard<std::mutex> lock(reload_mutex_);
        reload_queue_.push_back(entry_id);
    }
    reload_cv_.notify_one();
}

void JsonEntryStore::wait_for_reloads() {
    std::unique_lock<std::mutex> lock(reload_mutex_);
    reload_idle_cv_.wait(lock, [this]() { return reload_queue_.empty() && !reload_busy_; });
}

void JsonEntryStore::reload_loop() {
    std::unique_lock<std::mutex> lock(reload_mutex_);
    while (true) {
        reload_cv_.wait(lock, [this]() { return !running_ || !reload_queue_.empty(); });
        if (!running_) {
            break;
        }
        const auto entry_id = reload_queue_.front();
        reload_queue_.pop_front();
        reload_busy_ = true;
        auto handler = reload_handler_;
        lock.unlock();

        const auto entry = find_by_entry_id(entry_id);
        if (!entry) {
            EVLOG_warning << "Reload requested for unknown entry " << entry_id;
        } else if (!handler) {
            EVLOG_debug << "No reload handler registered; dropping reload of " << entry_id;
        } else {
            try {
                handler(*entry);
            } catch (const std::exception& e) {
                EVLOG_warning << "Reload of entry " << entry_id << " failed: " << e.what();
            }
        }

        lock.lock();
        reload_busy_ = false;
        reload_idle_cv_.notify_all();
    }
    reload_busy_ = false;
    reload_idle_cv_.notify_all();
}

const Entry& JsonEntryStore::require_entry_locked(const std::string& entry_id) const {
    auto it = entries_.find(entry_id);
    if (it == entries_.end()) {
        throw EntryStoreError("No entry " + entry_id);
    }
    return it->second;
}

void JsonEntryStore::load_from_disk() {
    if (path_.empty() || !std::filesystem::exists(path_)) return;
    std::ifstream in(path_);
    if (!in) {
        throw EntryStoreError("Unable to open entry store " + path_.string());
    }
    nlohmann::json root;
    try {
        in >> root;
    } catch (const nlohmann::json::exception& e) {
        throw EntryStoreError("Entry store " + path_.string() + " is not valid JSON: " + e.what());
    }
    if (!root.contains("entries") || !root["entries"].is_array()) return;
    for (const auto& item : root["entries"]) {
        try {
            auto entry = entry_from_json(item);
            entries_[entry.entry_id] = std::move(entry);
        } catch (const std::exception& e) {
            EVLOG_warning << "Skipping stored entry: " << e.what();
        }
    }
}

// Memory only changes once the new document is on disk
void JsonEntryStore::commit_locked(std::map<std::string, Entry> next) {
    persist(next);
    entries_ = std::move(next);
}

void JsonEntryStore::persist(const std::map<std::string, Entry>& entries) const {
    if (path_.empty()) return;
    nlohmann::json root;
    root["entries"] = nlohmann::json::array();
    for (const auto& kv : entries) {
        root["entries"].push_back(entry_to_json(kv.second));
    }
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
    const auto tmp_path = path_.parent_path() / (path_.filename().string() + ".tmp");
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            throw EntryStoreError("Unable to write entry store " + tmp_path.string());
        }
        out << std::setw(2) << root;
        out.flush();
        if (!out) {
            throw EntryStoreError("Unable to write entry store " + tmp_path.string());
        }
    }
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        const auto reason = ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw EntryStoreError("Unable to replace entry store " + path_.string() + ": " + reason);
    }
}

std::string JsonEntryStore::make_entry_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream os;
    os << std::hex << std::setw(16) << std::setfill('0') << rng();
    return os.str();
}

} // namespace span
