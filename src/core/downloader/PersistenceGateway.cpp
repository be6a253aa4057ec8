/**
 * PersistenceGateway.cpp
 */

#include "PersistenceGateway.hpp"
#include "../Logger.hpp"

#include <unordered_set>

namespace harbor::core::downloader {

using json = nlohmann::json;

PersistenceGateway::PersistenceGateway(std::shared_ptr<storage::DurableStore> store,
                                       PersistenceOptions options)
    : m_store(std::move(store))
    , m_options(std::move(options)) {
}

PersistenceGateway::~PersistenceGateway() {
    shutdown();
}

void PersistenceGateway::save(std::vector<DownloadItem> items) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_pending = std::move(items);
    }

    m_timer.schedule(m_options.debounce, [this] { writePending(); });
}

std::vector<DownloadItem> PersistenceGateway::load() const {
    if (!m_store) {
        return {};
    }

    auto bytes = m_store->read(m_options.key);
    if (!bytes) {
        return {};
    }

    auto items = deserialize(*bytes);
    Logger::instance().info("Loaded {} download(s) from durable storage", items.size());
    return items;
}

bool PersistenceGateway::flush() {
    m_timer.cancel();
    return writePending();
}

void PersistenceGateway::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        if (m_pending) {
            Logger::instance().debug("Dropping unsaved download snapshot at shutdown");
        }
        m_pending.reset();
    }
    m_timer.stop();
}

bool PersistenceGateway::hasPendingWrite() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.has_value();
}

size_t PersistenceGateway::writeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_writeCount;
}

bool PersistenceGateway::writePending() {
    std::lock_guard<std::mutex> writeLock(m_writeMutex);

    std::vector<DownloadItem> snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_pending) {
            return true;
        }
        snapshot = std::move(*m_pending);
        m_pending.reset();
    }

    if (!m_store) {
        return false;
    }

    bool ok = false;
    try {
        ok = m_store->write(m_options.key, serialize(snapshot));
    } catch (const std::exception& e) {
        Logger::instance().error("Error saving downloads: {}", e.what());
    }

    if (!ok) {
        Logger::instance().error("{}: snapshot of {} download(s) not saved",
                                 errorCodeName(ErrorCode::PersistenceError), snapshot.size());
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_writeCount;
    return true;
}

std::string PersistenceGateway::serialize(const std::vector<DownloadItem>& items) {
    json array = json::array();
    for (const auto& item : items) {
        array.push_back(item.toJson());
    }

    json snapshot = {
        {"schemaVersion", kSchemaVersion},
        {"items", std::move(array)}
    };
    return snapshot.dump();
}

std::vector<DownloadItem> PersistenceGateway::deserialize(const std::string& bytes) {
    std::vector<DownloadItem> items;

    json root;
    try {
        root = json::parse(bytes);
    } catch (const json::exception& e) {
        Logger::instance().error("{}: unreadable download snapshot: {}",
                                 errorCodeName(ErrorCode::PersistenceError), e.what());
        return items;
    }

    const json* records = nullptr;
    bool legacy = false;

    if (root.is_array()) {
        // Schema 1: bare array, original field names
        records = &root;
        legacy = true;
    } else if (root.is_object() && root.contains("items") && root["items"].is_array()) {
        int version = root.value("schemaVersion", 1);
        if (version > kSchemaVersion) {
            Logger::instance().warn("Download snapshot has schema {} (newer than {}); reading known fields",
                                    version, kSchemaVersion);
        }
        legacy = version < 2;
        records = &root["items"];
    } else {
        Logger::instance().error("{}: download snapshot has no item array",
                                 errorCodeName(ErrorCode::PersistenceError));
        return items;
    }

    if (legacy) {
        Logger::instance().info("Migrating {} download record(s) to schema {}",
                                records->size(), kSchemaVersion);
    }

    std::unordered_set<std::string> seen;
    for (const auto& record : *records) {
        if (!record.is_object()) {
            continue;
        }
        DownloadItem item = legacy ? DownloadItem::fromLegacyJson(record)
                                   : DownloadItem::fromJson(record);
        if (item.id.empty()) {
            Logger::instance().warn("Skipping stored download without id");
            continue;
        }
        if (!seen.insert(item.id).second) {
            Logger::instance().warn("Skipping duplicate stored download {}", item.id);
            continue;
        }
        items.push_back(std::move(item));
    }

    return items;
}

} // namespace harbor::core::downloader
