#pragma once

#include "Config.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace querymind {

struct ConnectionProfile {
    std::string name;
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string database;
    std::string user;
    std::string password;
    std::string sslmode = "prefer";
    std::string description;
    std::string createdAt;
    std::string updatedAt;
    std::optional<std::string> lastUsed;

    ConnectionConfig toConnectionConfig(const ConnectionConfig& defaults = ConnectionConfig{}) const;
    static ConnectionProfile fromConnectionConfig(const std::string& name,
                                                  const ConnectionConfig& config,
                                                  const std::string& description = "");
};

// What `profiles list` shows; never carries the password
struct ProfileSummary {
    std::string name;
    std::string host;
    uint16_t port = 5432;
    std::string database;
    std::string user;
    std::string description;
    std::string createdAt;
    std::optional<std::string> lastUsed;
    bool active = false;
};

// Named connection profiles persisted as one JSON file.
//
// The file is written with owner-only permissions (0600) through a
// temporary file and rename. Credentials are stored in clear text.
// The active profile is part of the file, so it survives between runs.
class ConnectionProfileStore {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr const char* FORMAT_TAG = "querymind-profiles";
    static constexpr int FORMAT_VERSION = 1;

    // Loads @p file if it exists. Throws ProfileError if it cannot be parsed.
    explicit ConnectionProfileStore(std::filesystem::path file, Clock clock = {});

    // Create or update. An update keeps createdAt and refreshes updatedAt.
    ProfileSummary add(ConnectionProfile profile);

    // Returns false when no such profile exists. Removing the active
    // profile clears the active marker.
    bool remove(const std::string& name);

    std::optional<ConnectionProfile> get(const std::string& name) const;
    std::vector<ProfileSummary> list() const;

    // Throws ProfileError for an unknown name
    void setActive(const std::string& name);
    std::optional<std::string> active() const { return m_active; }

    // Connection settings of a profile; records it as last used
    std::optional<ConnectionConfig> connectionConfig(const std::string& name,
                                                     const ConnectionConfig& defaults = ConnectionConfig{});

    const std::filesystem::path& file() const { return m_file; }

private:
    using ProfileMap = std::map<std::string, ConnectionProfile>;

    // Persist the given state; callers adopt it only once this returns
    void save(const ProfileMap& profiles, const std::optional<std::string>& active) const;
    void load();
    std::string timestamp() const;
    ProfileSummary summarize(const ConnectionProfile& profile) const;

    std::filesystem::path m_file;
    Clock m_clock;
    ProfileMap m_profiles;
    std::optional<std::string> m_active;
};

}  // namespace querymind
