#include "CacheManager.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <fstream>
#include <unistd.h>

namespace querymind {

CacheManager::CacheManager(std::filesystem::path file, std::chrono::seconds ttl, Clock clock)
    : m_file(std::move(file)), m_ttl(ttl), m_clock(std::move(clock)) {
}

std::chrono::system_clock::time_point CacheManager::now() const {
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

std::filesystem::path CacheManager::temporaryPath() const {
    static std::atomic<uint64_t> counter{0};
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    return m_file.parent_path() /
           (m_file.filename().string() + ".tmp." + std::to_string(::getpid()) + "." +
            std::to_string(counter++) + "." + std::to_string(ticks));
}

std::optional<CacheEntry> CacheManager::get() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::ifstream in(m_file);
    if (!in.is_open()) {
        spdlog::debug("Cache miss: {} not found", m_file.string());
        return std::nullopt;
    }

    json envelope = json::parse(in, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        spdlog::warn("Ignoring unreadable cache file {}", m_file.string());
        return std::nullopt;
    }

    CacheEntry entry;
    try {
        if (envelope.value("format", "") != FORMAT_TAG ||
            envelope.value("version", 0) != FORMAT_VERSION) {
            spdlog::info("Ignoring cache file {} written in another format", m_file.string());
            return std::nullopt;
        }

        auto cached_at = FormatConverter::parseTimestamp(envelope.at("cached_at").get<std::string>());
        if (!cached_at) {
            spdlog::warn("Ignoring cache file {}: bad cached_at", m_file.string());
            return std::nullopt;
        }
        entry.cachedAt = *cached_at;
        entry.snapshot = FormatConverter::snapshotFromJSON(envelope.at("snapshot"));
    } catch (const json::exception& e) {
        spdlog::warn("Ignoring cache file {}: {}", m_file.string(), e.what());
        return std::nullopt;
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Ignoring cache file {}: {}", m_file.string(), e.what());
        return std::nullopt;
    }

    auto age = now() - entry.cachedAt;
    if (age > m_ttl) {
        spdlog::info("Cache expired ({}s old)",
                     std::chrono::duration_cast<std::chrono::seconds>(age).count());
        return std::nullopt;
    }

    spdlog::debug("Cache hit: {} (cached at {})", m_file.string(),
                  FormatConverter::formatTimestamp(entry.cachedAt));
    return entry;
}

void CacheManager::put(const Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(m_mutex);

    json envelope{
        {"format", FORMAT_TAG},
        {"version", FORMAT_VERSION},
        {"cached_at", FormatConverter::formatTimestamp(FormatConverter::truncateToMicros(now()))},
        {"snapshot", FormatConverter::toJSON(snapshot)}
    };

    std::error_code ec;
    if (m_file.has_parent_path()) {
        std::filesystem::create_directories(m_file.parent_path(), ec);
        if (ec) {
            throw CacheError("Cannot create cache directory " + m_file.parent_path().string() +
                             ": " + ec.message());
        }
    }

    auto tmp = temporaryPath();
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw CacheError("Cannot open " + tmp.string() + " for writing");
        }
        out << envelope.dump(2);
        out.flush();
        if (!out.good()) {
            out.close();
            std::filesystem::remove(tmp, ec);
            throw CacheError("Failed writing cache file " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, m_file, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw CacheError("Cannot replace cache file " + m_file.string() + ": " + ec.message());
    }

    spdlog::debug("Metadata cached to {}", m_file.string());
}

void CacheManager::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    if (std::filesystem::remove(m_file, ec)) {
        spdlog::info("Cache cleared: {}", m_file.string());
    } else if (ec) {
        throw CacheError("Cannot remove cache file " + m_file.string() + ": " + ec.message());
    }
}

}  // namespace querymind
