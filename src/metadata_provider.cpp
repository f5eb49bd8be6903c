#include "metadata_provider.hpp"
#include "debug.hpp"
#include "errors.hpp"

#include <array>
#include <cstdio>
#include <map>
#include <sstream>
#include <sys/wait.h>

namespace MediaOrganizer {

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

MediaMetadata FfprobeMetadataProvider::parseCompactOutput(const std::string& output) {
    MediaMetadata metadata;
    bool sawVideo = false;
    bool sawFormat = false;

    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::vector<std::string> parts;
        std::stringstream ss(line);
        std::string part;
        while (std::getline(ss, part, '|')) {
            parts.push_back(part);
        }
        if (parts.empty()) continue;

        std::map<std::string, std::string> fields;
        for (size_t i = 1; i < parts.size(); ++i) {
            auto eq = parts[i].find('=');
            if (eq == std::string::npos) continue;
            fields[parts[i].substr(0, eq)] = parts[i].substr(eq + 1);
        }

        auto field = [&fields](const std::string& key) -> std::string {
            auto it = fields.find(key);
            return it != fields.end() ? it->second : std::string{};
        };

        try {
            if (parts[0] == "stream") {
                std::string type = field("codec_type");
                if (type == "video" && !sawVideo) {
                    metadata.codec = field("codec_name");
                    if (!field("width").empty()) metadata.width = std::stoi(field("width"));
                    if (!field("height").empty()) metadata.height = std::stoi(field("height"));
                    sawVideo = true;
                } else if (type == "subtitle") {
                    SubtitleStream sub;
                    sub.index = field("index").empty() ? 0 : std::stoi(field("index"));
                    sub.codec = field("codec_name");
                    if (!field("tag:language").empty()) sub.language = field("tag:language");
                    if (!field("tag:title").empty()) sub.title = field("tag:title");
                    metadata.subtitles.push_back(std::move(sub));
                }
            } else if (parts[0] == "format") {
                std::string duration = field("duration");
                if (!duration.empty() && duration != "N/A") {
                    metadata.durationSeconds = std::stod(duration);
                }
                sawFormat = true;
            }
        } catch (const std::exception& e) {
            throw MediaError(ErrorKind::CacheGeneration, std::string("unparseable ffprobe output: ") + e.what());
        }
    }

    if (!sawVideo && !sawFormat) {
        throw MediaError(ErrorKind::CacheGeneration, "ffprobe reported no streams");
    }
    return metadata;
}

MediaMetadata FfprobeMetadataProvider::read(const std::filesystem::path& path) {
    SCOPED_TIMER_THRESHOLD("ffprobe", 2000);

    std::stringstream cmd;
    cmd << "timeout " << m_timeoutSeconds << " ffprobe -v error"
        << " -show_entries stream=index,codec_type,codec_name,width,height:stream_tags=language,title:format=duration"
        << " -of compact=p=1:nk=0 "
        << shellQuote(path.string()) << " 2>/dev/null";

    FILE* pipe = ::popen(cmd.str().c_str(), "r");
    if (!pipe) {
        throw MediaError(ErrorKind::CacheGeneration, "could not start ffprobe");
    }

    std::string output;
    std::array<char, 4096> buffer{};
    size_t n;
    while ((n = std::fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), n);
    }

    int status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
        if (code == 124) {
            throw MediaError(ErrorKind::CacheGeneration,
                             "ffprobe timed out after " + std::to_string(m_timeoutSeconds) + "s on " + path.string());
        }
        throw MediaError(ErrorKind::CacheGeneration,
                         "ffprobe failed (exit " + std::to_string(code) + ") on " + path.string());
    }

    DEBUG_LOG("Read metadata of " << path.filename());
    return parseCompactOutput(output);
}

} // namespace MediaOrganizer
