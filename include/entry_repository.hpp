// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace span {

/// \brief One provisioned panel. data holds host/access_token plus unrelated keys.
struct Entry {
    std::string entry_id;
    std::string unique_id; // panel serial number
    std::string title;
    nlohmann::json data = nlohmann::json::object();
    nlohmann::json options = nlohmann::json::object();
};

/// \brief Persistence contract for provisioned entries.
class EntryRepository {
public:
    virtual ~EntryRepository() = default;

    virtual std::optional<Entry> find_by_unique_id(const std::string& unique_id) const = 0;
    virtual std::optional<Entry> find_by_entry_id(const std::string& entry_id) const = 0;
    virtual bool has_host(const std::string& host) const = 0;
    virtual std::vector<Entry> entries() const = 0;

    /// \brief Store a new entry. Throws when the unique id is already taken.
    virtual Entry create(const std::string& title, const std::string& unique_id, const nlohmann::json& data) = 0;
    /// \brief Replace the stored data of an entry wholesale.
    virtual void update(const std::string& entry_id, const nlohmann::json& data) = 0;
    virtual void update_options(const std::string& entry_id, const nlohmann::json& options) = 0;
    virtual void remove(const std::string& entry_id) = 0;

    /// \brief Ask whoever runs the entry to reload it. Returns without waiting.
    virtual void reload(const std::string& entry_id) = 0;
};

} // namespace span
