#pragma once

#include "cutline/result.hpp"

#include <cstdint>
#include <string>

namespace cutline {
namespace media {

// Probe-owned error codes (no FFmpeg codes escape)
enum class ProbeErrorCode {
    FileNotFound,
    Unsupported,
    Internal
};

inline const char* probe_error_code_to_string(ProbeErrorCode code) {
    switch (code) {
        case ProbeErrorCode::FileNotFound: return "FileNotFound";
        case ProbeErrorCode::Unsupported:  return "Unsupported";
        case ProbeErrorCode::Internal:     return "Internal";
    }
    return "Unknown";
}

struct ProbeError {
    ProbeErrorCode code;
    std::string message;

    static ProbeError file_not_found(const std::string& path) {
        return {ProbeErrorCode::FileNotFound, "File not found: " + path};
    }
    static ProbeError unsupported(const std::string& detail) {
        return {ProbeErrorCode::Unsupported, detail};
    }
    static ProbeError internal(const std::string& detail) {
        return {ProbeErrorCode::Internal, detail};
    }
};

// Container-level facts about a rendered artifact
struct MediaInfo {
    int64_t duration_us = 0;
    bool has_video = false;
    int width = 0;
    int height = 0;
    bool has_audio = false;
    std::string format_name;

    int64_t duration_ms() const { return duration_us / 1000; }
};

// Open with libavformat and read stream info; decodes nothing
Result<MediaInfo, ProbeError> probe(const std::string& path);

} // namespace media
} // namespace cutline
