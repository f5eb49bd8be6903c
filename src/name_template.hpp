/**
 * @file name_template.hpp
 * @brief Expansion of file naming templates such as "{filename}_{resolution}".
 */

#pragma once

#include "media_file.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace MediaOrganizer {

/**
 * @brief Placeholders recognized inside `{...}` in a naming template.
 */
enum class Placeholder {
    Filename,   ///< Original name without extension
    Resolution, ///< "1080p"
    Codec,      ///< "h264"
    Duration,   ///< "1h32m"
    Extension   ///< Original extension without the dot
};

std::optional<Placeholder> placeholderFromName(std::string_view name);

/**
 * @brief Value of a placeholder for a record.
 * @return std::nullopt when the record has no value for it (no metadata yet)
 */
std::optional<std::string> placeholderValue(Placeholder placeholder, const FileRecord& record);

/**
 * @brief Expand a template into a new file name for `record`.
 *
 * Unrecognized placeholders, and placeholders the record has no value for,
 * are kept verbatim so the user sees them in the preview. The original
 * extension is appended unless the expansion already ends with it. An
 * empty template keeps the original file name.
 *
 * @throws MediaError(InvalidTemplate) if the result is not a valid file name
 */
std::string expandTemplate(const std::string& pattern, const FileRecord& record);

/**
 * @brief Reject names that cannot be created on an SMB share.
 * @throws MediaError(InvalidTemplate) for empty names, "." and "..", names
 *         with `< > : " / \ | ? *` or control characters, and names ending
 *         in a space or dot
 */
void validateFileName(const std::string& name);

} // namespace MediaOrganizer
