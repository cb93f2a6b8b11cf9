#include "ConnectionProfileStore.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include <spdlog/spdlog.h>
#include <fstream>
#include <unistd.h>

namespace querymind {

namespace fs = std::filesystem;

// ============================================================================
// ConnectionProfile
// ============================================================================

ConnectionConfig ConnectionProfile::toConnectionConfig(const ConnectionConfig& defaults) const {
    ConnectionConfig config = defaults;
    config.host = host;
    config.port = port;
    config.database = database;
    config.user = user;
    config.password = password;
    config.sslmode = sslmode;
    return config;
}

ConnectionProfile ConnectionProfile::fromConnectionConfig(const std::string& name,
                                                          const ConnectionConfig& config,
                                                          const std::string& description) {
    ConnectionProfile profile;
    profile.name = name;
    profile.host = config.host;
    profile.port = config.port;
    profile.database = config.database;
    profile.user = config.user;
    profile.password = config.password;
    profile.sslmode = config.sslmode;
    profile.description = description;
    return profile;
}

// ============================================================================
// Persistence
// ============================================================================

ConnectionProfileStore::ConnectionProfileStore(fs::path file, Clock clock)
    : m_file(std::move(file)), m_clock(std::move(clock)) {
    load();
}

std::string ConnectionProfileStore::timestamp() const {
    auto now = m_clock ? m_clock() : std::chrono::system_clock::now();
    return FormatConverter::formatTimestamp(FormatConverter::truncateToMicros(now));
}

void ConnectionProfileStore::load() {
    std::ifstream in(m_file);
    if (!in.is_open()) {
        spdlog::debug("No profile store at {}", m_file.string());
        return;
    }

    auto data = nlohmann::json::parse(in, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        throw ProfileError("Profile store " + m_file.string() + " is not valid JSON");
    }

    try {
        if (data.value("format", "") != FORMAT_TAG || data.value("version", 0) != FORMAT_VERSION) {
            throw ProfileError("Profile store " + m_file.string() + " has an unsupported format");
        }

        for (const auto& [name, entry] : data.at("profiles").items()) {
            ConnectionProfile profile;
            profile.name = name;
            profile.host = entry.value("host", "localhost");
            profile.port = entry.value("port", uint16_t{5432});
            profile.database = entry.value("database", "");
            profile.user = entry.value("user", "");
            profile.password = entry.value("password", "");
            profile.sslmode = entry.value("sslmode", "prefer");
            profile.description = entry.value("description", "");
            profile.createdAt = entry.value("created_at", "");
            profile.updatedAt = entry.value("updated_at", "");
            if (entry.contains("last_used") && entry["last_used"].is_string()) {
                profile.lastUsed = entry["last_used"].get<std::string>();
            }
            m_profiles[name] = std::move(profile);
        }

        if (data.contains("active") && data["active"].is_string()) {
            std::string active = data["active"].get<std::string>();
            if (m_profiles.count(active)) {
                m_active = active;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ProfileError("Profile store " + m_file.string() + " is malformed: " + e.what());
    }

    spdlog::debug("Loaded {} connection profiles from {}", m_profiles.size(), m_file.string());
}

void ConnectionProfileStore::save(const ProfileMap& profiles,
                                  const std::optional<std::string>& active) const {
    nlohmann::json entries = nlohmann::json::object();
    for (const auto& [name, p] : profiles) {
        entries[name] = nlohmann::json{
            {"host", p.host},
            {"port", p.port},
            {"database", p.database},
            {"user", p.user},
            {"password", p.password},
            {"sslmode", p.sslmode},
            {"description", p.description},
            {"created_at", p.createdAt},
            {"updated_at", p.updatedAt},
            {"last_used", p.lastUsed ? nlohmann::json(*p.lastUsed) : nlohmann::json(nullptr)}
        };
    }

    nlohmann::json data{
        {"format", FORMAT_TAG},
        {"version", FORMAT_VERSION},
        {"active", active ? nlohmann::json(*active) : nlohmann::json(nullptr)},
        {"profiles", std::move(entries)}
    };

    std::error_code ec;
    if (m_file.has_parent_path()) {
        fs::create_directories(m_file.parent_path(), ec);
        if (ec) {
            throw ProfileError("Cannot create " + m_file.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path tmp = m_file;
    tmp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw ProfileError("Cannot open " + tmp.string() + " for writing");
        }

        // Restrict before any credential reaches the file
        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) {
            out.close();
            fs::remove(tmp, ec);
            throw ProfileError("Cannot restrict permissions on " + tmp.string());
        }

        out << data.dump(2);
        out.flush();
        if (!out.good()) {
            out.close();
            fs::remove(tmp, ec);
            throw ProfileError("Failed writing " + tmp.string());
        }
    }

    fs::rename(tmp, m_file, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw ProfileError("Cannot replace " + m_file.string() + ": " + ec.message());
    }
}

// ============================================================================
// Operations
// ============================================================================

ProfileSummary ConnectionProfileStore::summarize(const ConnectionProfile& profile) const {
    ProfileSummary summary;
    summary.name = profile.name;
    summary.host = profile.host;
    summary.port = profile.port;
    summary.database = profile.database;
    summary.user = profile.user;
    summary.description = profile.description;
    summary.createdAt = profile.createdAt;
    summary.lastUsed = profile.lastUsed;
    summary.active = m_active && *m_active == profile.name;
    return summary;
}

ProfileSummary ConnectionProfileStore::add(ConnectionProfile profile) {
    if (profile.name.empty()) {
        throw ProfileError("Profile name must not be empty");
    }

    std::string now = timestamp();
    auto existing = m_profiles.find(profile.name);
    if (existing != m_profiles.end()) {
        profile.createdAt = existing->second.createdAt;
        profile.lastUsed = existing->second.lastUsed;
        spdlog::info("Updating connection profile '{}'", profile.name);
    } else {
        profile.createdAt = now;
        spdlog::info("Adding connection profile '{}'", profile.name);
    }
    profile.updatedAt = now;

    std::string name = profile.name;
    ProfileMap updated = m_profiles;
    updated[name] = std::move(profile);
    save(updated, m_active);
    m_profiles = std::move(updated);

    return summarize(m_profiles[name]);
}

bool ConnectionProfileStore::remove(const std::string& name) {
    ProfileMap updated = m_profiles;
    if (updated.erase(name) == 0) {
        return false;
    }
    auto active = m_active;
    if (active && *active == name) {
        active.reset();
    }
    save(updated, active);
    m_profiles = std::move(updated);
    m_active = std::move(active);
    spdlog::info("Removed connection profile '{}'", name);
    return true;
}

std::optional<ConnectionProfile> ConnectionProfileStore::get(const std::string& name) const {
    auto it = m_profiles.find(name);
    if (it == m_profiles.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ProfileSummary> ConnectionProfileStore::list() const {
    std::vector<ProfileSummary> result;
    result.reserve(m_profiles.size());
    for (const auto& [name, profile] : m_profiles) {
        result.push_back(summarize(profile));
    }
    return result;
}

void ConnectionProfileStore::setActive(const std::string& name) {
    if (!m_profiles.count(name)) {
        throw ProfileError("Unknown connection profile: " + name);
    }
    save(m_profiles, name);
    m_active = name;
}

std::optional<ConnectionConfig> ConnectionProfileStore::connectionConfig(
    const std::string& name, const ConnectionConfig& defaults) {
    auto it = m_profiles.find(name);
    if (it == m_profiles.end()) {
        return std::nullopt;
    }

    ProfileMap updated = m_profiles;
    updated[name].lastUsed = timestamp();
    save(updated, m_active);
    m_profiles = std::move(updated);

    return m_profiles[name].toConnectionConfig(defaults);
}

}  // namespace querymind
