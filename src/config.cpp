#include "config.hpp"
#include "debug.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace MediaOrganizer {

template <typename T> T getOrDefault(const YAML::Node& node, const std::string& key, const T& def) {
    return node[key] ? node[key].as<T>() : def;
}

} // namespace MediaOrganizer

namespace YAML {

template <> struct convert<MediaOrganizer::CacheConfig> {
    static Node encode(const MediaOrganizer::CacheConfig& rhs) {
        Node node;
        node["max_size_bytes"] = rhs.maxSizeBytes;
        node["low_watermark"] = rhs.lowWatermark;
        node["recency_flush_interval"] = rhs.recencyFlushInterval;
        node["thumbnail_width"] = rhs.thumbnailWidth;
        node["work_dir"] = rhs.workDir.string();
        return node;
    }

    static bool decode(const Node& node, MediaOrganizer::CacheConfig& rhs) {
        using MediaOrganizer::getOrDefault;
        rhs.maxSizeBytes = getOrDefault<uint64_t>(node, "max_size_bytes", rhs.maxSizeBytes);
        rhs.lowWatermark = getOrDefault<double>(node, "low_watermark", rhs.lowWatermark);
        rhs.recencyFlushInterval = getOrDefault<int>(node, "recency_flush_interval", rhs.recencyFlushInterval);
        rhs.thumbnailWidth = getOrDefault<int>(node, "thumbnail_width", rhs.thumbnailWidth);
        rhs.workDir = getOrDefault<std::string>(node, "work_dir", rhs.workDir.string());
        return true;
    }
};

template <> struct convert<MediaOrganizer::ScanConfig> {
    static Node encode(const MediaOrganizer::ScanConfig& rhs) {
        Node node;
        node["workers"] = rhs.workers;
        node["recursive"] = rhs.recursive;
        node["extensions"] = rhs.extensions;
        return node;
    }

    static bool decode(const Node& node, MediaOrganizer::ScanConfig& rhs) {
        using MediaOrganizer::getOrDefault;
        rhs.workers = getOrDefault<int>(node, "workers", rhs.workers);
        rhs.recursive = getOrDefault<bool>(node, "recursive", rhs.recursive);
        rhs.extensions = getOrDefault<std::vector<std::string>>(node, "extensions", rhs.extensions);
        return true;
    }
};

template <> struct convert<MediaOrganizer::CommitConfig> {
    static Node encode(const MediaOrganizer::CommitConfig& rhs) {
        Node node;
        node["chunk_size_bytes"] = rhs.chunkSizeBytes;
        node["bandwidth_limit_bytes_per_sec"] = rhs.bandwidthLimitBytesPerSec;
        node["network_timeout_seconds"] = rhs.networkTimeoutSeconds;
        node["holding_dir_name"] = rhs.holdingDirName;
        node["permanent_delete"] = rhs.permanentDelete;
        return node;
    }

    static bool decode(const Node& node, MediaOrganizer::CommitConfig& rhs) {
        using MediaOrganizer::getOrDefault;
        rhs.chunkSizeBytes = getOrDefault<uint64_t>(node, "chunk_size_bytes", rhs.chunkSizeBytes);
        rhs.bandwidthLimitBytesPerSec = getOrDefault<uint64_t>(node, "bandwidth_limit_bytes_per_sec",
                                                               rhs.bandwidthLimitBytesPerSec);
        rhs.networkTimeoutSeconds = getOrDefault<int>(node, "network_timeout_seconds", rhs.networkTimeoutSeconds);
        rhs.holdingDirName = getOrDefault<std::string>(node, "holding_dir_name", rhs.holdingDirName);
        rhs.permanentDelete = getOrDefault<bool>(node, "permanent_delete", rhs.permanentDelete);
        return true;
    }
};

template <> struct convert<MediaOrganizer::LoggingConfig> {
    static Node encode(const MediaOrganizer::LoggingConfig& rhs) {
        Node node;
        node["level"] = rhs.level;
        return node;
    }

    static bool decode(const Node& node, MediaOrganizer::LoggingConfig& rhs) {
        rhs.level = MediaOrganizer::getOrDefault<std::string>(node, "level", rhs.level);
        return true;
    }
};

} // namespace YAML

namespace MediaOrganizer {

namespace {

std::filesystem::path homeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home);
    }
    return {};
}

} // namespace

Config Config::defaults() {
    Config cfg;
    auto home = homeDir();
    if (!home.empty()) {
        cfg.databasePath = home / ".local" / "share" / "MediaOrganizer" / "library.db";
        cfg.cache.workDir = home / ".cache" / "MediaOrganizer";
    } else {
        cfg.databasePath = "/tmp/MediaOrganizer/library.db";
        cfg.cache.workDir = "/tmp/MediaOrganizer/cache";
    }
    return cfg;
}

std::filesystem::path Config::defaultPath() {
    if (const char* overridePath = std::getenv("MEDIA_ORGANIZER_CONFIG"); overridePath && *overridePath) {
        return overridePath;
    }
    auto home = homeDir();
    if (!home.empty()) {
        return home / ".config" / "MediaOrganizer" / "config.yaml";
    }
    return "/tmp/MediaOrganizer/config.yaml";
}

void Config::validate() {
    if (cache.lowWatermark <= 0.0 || cache.lowWatermark > 1.0) {
        LOG_WARN("cache.low_watermark " << cache.lowWatermark << " out of range, using 0.8");
        cache.lowWatermark = 0.8;
    }
    if (cache.recencyFlushInterval < 1) {
        LOG_WARN("cache.recency_flush_interval must be >= 1, using 1");
        cache.recencyFlushInterval = 1;
    }
    if (cache.thumbnailWidth < 16) {
        LOG_WARN("cache.thumbnail_width " << cache.thumbnailWidth << " too small, using 16");
        cache.thumbnailWidth = 16;
    }
    if (scan.workers < 1) {
        LOG_WARN("scan.workers must be >= 1, using 1");
        scan.workers = 1;
    } else if (scan.workers > 16) {
        LOG_WARN("scan.workers " << scan.workers << " would saturate the share, using 16");
        scan.workers = 16;
    }
    if (commit.chunkSizeBytes < 4096) {
        LOG_WARN("commit.chunk_size_bytes " << commit.chunkSizeBytes << " too small, using 4096");
        commit.chunkSizeBytes = 4096;
    }
    if (commit.networkTimeoutSeconds < 1) {
        LOG_WARN("commit.network_timeout_seconds must be >= 1, using 30");
        commit.networkTimeoutSeconds = 30;
    }
    if (commit.holdingDirName.empty() || commit.holdingDirName.find('/') != std::string::npos) {
        LOG_WARN("commit.holding_dir_name must be a single directory name, using default");
        commit.holdingDirName = ".media-organizer-trash";
    }
    for (auto& ext : scan.extensions) {
        if (!ext.empty() && ext.front() != '.') ext.insert(ext.begin(), '.');
    }
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg = Config::defaults();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        DEBUG_LOG("No config at " << path << ", using defaults");
        return cfg;
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        if (root["database_path"]) cfg.databasePath = root["database_path"].as<std::string>();
        if (auto node = root["cache"]) YAML::convert<CacheConfig>::decode(node, cfg.cache);
        if (auto node = root["scan"]) YAML::convert<ScanConfig>::decode(node, cfg.scan);
        if (auto node = root["commit"]) YAML::convert<CommitConfig>::decode(node, cfg.commit);
        if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    } catch (const YAML::Exception& e) {
        LOG_WARN("Failed to load config " << path << ": " << e.what() << "; using defaults");
        return Config::defaults();
    }

    cfg.validate();
    return cfg;
}

void Config::save(const std::filesystem::path& path) const {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);

    YAML::Node root;
    root["database_path"] = databasePath.string();
    root["cache"] = cache;
    root["scan"] = scan;
    root["commit"] = commit;
    root["logging"] = logging;

    YAML::Emitter emitter;
    emitter << root;

    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to write config file " + path.string());
    }
    out << emitter.c_str() << "\n";
}

} // namespace MediaOrganizer
