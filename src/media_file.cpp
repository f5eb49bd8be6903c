#include "media_file.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace MediaOrganizer {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ull;
constexpr uint64_t kFnvPrime = 1099511628211ull;

void fnvMix(uint64_t& hash, const void* data, size_t length) {
    const auto* bytes = static_cast<const unsigned char*>(data);
    for (size_t i = 0; i < length; ++i) {
        hash ^= bytes[i];
        hash *= kFnvPrime;
    }
}

std::string escapeField(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string unescapeField(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\\' && i + 1 < value.size()) {
            char next = value[++i];
            if (next == 'n') out += '\n';
            else if (next == 't') out += '\t';
            else out += next;
        } else {
            out += value[i];
        }
    }
    return out;
}

std::vector<std::string> splitTabs(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\\' && i + 1 < line.size()) {
            current += line[i];
            current += line[++i];
        } else if (line[i] == '\t') {
            fields.push_back(current);
            current.clear();
        } else {
            current += line[i];
        }
    }
    fields.push_back(current);
    return fields;
}

} // namespace

std::string MediaMetadata::resolutionLabel() const {
    if (height <= 0) return {};
    return std::to_string(height) + "p";
}

std::string MediaMetadata::durationLabel() const {
    if (durationSeconds <= 0.0) return {};
    auto total = static_cast<long long>(std::llround(durationSeconds));
    long long hours = total / 3600;
    long long minutes = (total % 3600) / 60;
    long long seconds = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << "h" << std::setw(2) << std::setfill('0') << minutes << "m";
    } else if (minutes > 0) {
        oss << minutes << "m";
    } else {
        oss << seconds << "s";
    }
    return oss.str();
}

const char* scanStateName(ScanState state) {
    switch (state) {
        case ScanState::Pending:  return "Pending";
        case ScanState::Enriched: return "Enriched";
        case ScanState::Failed:   return "Failed";
        case ScanState::Stale:    return "Stale";
    }
    return "Pending";
}

ScanState scanStateFromName(const std::string& name) {
    if (name == "Enriched") return ScanState::Enriched;
    if (name == "Failed") return ScanState::Failed;
    if (name == "Stale") return ScanState::Stale;
    return ScanState::Pending;
}

std::string computeFingerprint(const std::filesystem::path& path, uintmax_t size, int64_t modifiedTime) {
    uint64_t hash = kFnvOffset;
    std::string pathStr = path.string();
    fnvMix(hash, pathStr.data(), pathStr.size());

    uint64_t sizeValue = static_cast<uint64_t>(size);
    fnvMix(hash, &sizeValue, sizeof(sizeValue));
    fnvMix(hash, &modifiedTime, sizeof(modifiedTime));

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << hash;
    return oss.str();
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

int64_t toUnixSeconds(std::filesystem::file_time_type time) {
    auto sysTime = std::chrono::file_clock::to_sys(time);
    return std::chrono::duration_cast<std::chrono::seconds>(sysTime.time_since_epoch()).count();
}

std::optional<FileRecord> statFileRecord(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }

    FileRecord record;
    record.path = path;
    record.size = std::filesystem::file_size(path, ec);
    if (ec) return std::nullopt;

    auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) return std::nullopt;
    record.modifiedTime = toUnixSeconds(mtime);

    record.fingerprint = computeFingerprint(record.path, record.size, record.modifiedTime);
    record.scanState = ScanState::Pending;
    return record;
}

std::string serializeMetadata(const MediaMetadata& metadata) {
    std::ostringstream out;
    out << "width=" << metadata.width << "\n";
    out << "height=" << metadata.height << "\n";
    out << "duration=" << std::setprecision(17) << metadata.durationSeconds << "\n";
    out << "codec=" << escapeField(metadata.codec) << "\n";
    for (const auto& sub : metadata.subtitles) {
        out << "sub=" << sub.index << "\t"
            << escapeField(sub.codec) << "\t"
            << escapeField(sub.language.value_or("")) << "\t"
            << escapeField(sub.title.value_or("")) << "\n";
    }
    return out.str();
}

std::optional<MediaMetadata> deserializeMetadata(const std::string& text) {
    MediaMetadata metadata;
    std::istringstream in(text);
    std::string line;
    bool sawCodec = false;

    try {
        while (std::getline(in, line)) {
            if (line.empty()) continue;
            auto eq = line.find('=');
            if (eq == std::string::npos) return std::nullopt;

            std::string key = line.substr(0, eq);
            std::string value = line.substr(eq + 1);

            if (key == "width") {
                metadata.width = std::stoi(value);
            } else if (key == "height") {
                metadata.height = std::stoi(value);
            } else if (key == "duration") {
                metadata.durationSeconds = std::stod(value);
            } else if (key == "codec") {
                metadata.codec = unescapeField(value);
                sawCodec = true;
            } else if (key == "sub") {
                auto fields = splitTabs(value);
                if (fields.size() != 4) return std::nullopt;
                SubtitleStream sub;
                sub.index = std::stoi(fields[0]);
                sub.codec = unescapeField(fields[1]);
                std::string language = unescapeField(fields[2]);
                std::string title = unescapeField(fields[3]);
                if (!language.empty()) sub.language = language;
                if (!title.empty()) sub.title = title;
                metadata.subtitles.push_back(std::move(sub));
            }
        }
    } catch (const std::exception&) {
        // stoi/stod on a damaged payload
        return std::nullopt;
    }

    if (!sawCodec) return std::nullopt;
    return metadata;
}

} // namespace MediaOrganizer
