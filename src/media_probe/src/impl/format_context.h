#pragma once

// FFmpeg headers - ONLY allowed in impl/ directory
extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <media_probe/probe.h>
#include <string>

namespace cutline {
namespace media {
namespace impl {

// Convert FFmpeg error code to ProbeError
ProbeError ffmpeg_error(int errnum, const std::string& context);

// Owning AVFormatContext wrapper
class FormatContext {
public:
    FormatContext() = default;
    ~FormatContext();

    // Non-copyable
    FormatContext(const FormatContext&) = delete;
    FormatContext& operator=(const FormatContext&) = delete;

    // Open a file and read stream info
    Result<void, ProbeError> open(const std::string& path);

    // Stream index, or -1 when the container has none of that type
    int find_stream(AVMediaType type) const;

    // Container duration; falls back to the longest stream
    int64_t duration_us() const;

    AVFormatContext* get() const { return m_fmt_ctx; }

private:
    AVFormatContext* m_fmt_ctx = nullptr;
};

} // namespace impl
} // namespace media
} // namespace cutline
