#include "name_template.hpp"
#include "errors.hpp"

namespace MediaOrganizer {

std::optional<Placeholder> placeholderFromName(std::string_view name) {
    if (name == "filename") return Placeholder::Filename;
    if (name == "resolution") return Placeholder::Resolution;
    if (name == "codec") return Placeholder::Codec;
    if (name == "duration") return Placeholder::Duration;
    if (name == "extension") return Placeholder::Extension;
    return std::nullopt;
}

std::optional<std::string> placeholderValue(Placeholder placeholder, const FileRecord& record) {
    switch (placeholder) {
        case Placeholder::Filename:
            return record.path.stem().string();
        case Placeholder::Extension: {
            std::string ext = record.path.extension().string();
            if (ext.empty()) return std::nullopt;
            return ext.substr(1);
        }
        case Placeholder::Resolution:
            if (!record.metadata || record.metadata->resolutionLabel().empty()) return std::nullopt;
            return record.metadata->resolutionLabel();
        case Placeholder::Codec:
            if (!record.metadata || record.metadata->codec.empty()) return std::nullopt;
            return record.metadata->codec;
        case Placeholder::Duration:
            if (!record.metadata || record.metadata->durationSeconds <= 0.0) return std::nullopt;
            return record.metadata->durationLabel();
    }
    return std::nullopt;
}

void validateFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        throw MediaError(ErrorKind::InvalidTemplate, "template produced an empty file name");
    }

    static const std::string invalid = "<>:\"/\\|?*";
    for (char c : name) {
        if (invalid.find(c) != std::string::npos || static_cast<unsigned char>(c) < 0x20) {
            throw MediaError(ErrorKind::InvalidTemplate,
                             "file name '" + name + "' contains an invalid character");
        }
    }

    if (name.back() == ' ' || name.back() == '.') {
        throw MediaError(ErrorKind::InvalidTemplate,
                         "file name '" + name + "' ends with a space or dot");
    }
}

std::string expandTemplate(const std::string& pattern, const FileRecord& record) {
    std::string originalName = record.path.filename().string();
    if (pattern.empty()) {
        validateFileName(originalName);
        return originalName;
    }

    std::string result;
    size_t pos = 0;
    while (pos < pattern.size()) {
        size_t open = pattern.find('{', pos);
        if (open == std::string::npos) {
            result.append(pattern, pos, std::string::npos);
            break;
        }
        size_t close = pattern.find('}', open + 1);
        if (close == std::string::npos) {
            result.append(pattern, pos, std::string::npos);
            break;
        }

        result.append(pattern, pos, open - pos);
        std::string_view name(pattern.data() + open + 1, close - open - 1);

        std::optional<std::string> value;
        if (auto placeholder = placeholderFromName(name)) {
            value = placeholderValue(*placeholder, record);
        }
        if (value) {
            result += *value;
        } else {
            result.append(pattern, open, close - open + 1);
        }
        pos = close + 1;
    }

    std::string ext = record.path.extension().string();
    if (!ext.empty()) {
        bool hasExt = result.size() > ext.size() &&
                      toLower(result.substr(result.size() - ext.size())) == toLower(ext);
        if (!hasExt) {
            result += ext;
        }
    }

    validateFileName(result);
    return result;
}

} // namespace MediaOrganizer
