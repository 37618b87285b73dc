#include "format_context.h"

#include <cerrno>

namespace cutline {
namespace media {
namespace impl {

ProbeError ffmpeg_error(int errnum, const std::string& context) {
    char errbuf[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(errnum, errbuf, sizeof(errbuf));
    std::string msg = context + ": " + errbuf;

    if (errnum == AVERROR(ENOENT)) {
        return ProbeError::file_not_found(msg);
    } else if (errnum == AVERROR_INVALIDDATA || errnum == AVERROR(EINVAL) ||
               errnum == AVERROR_DEMUXER_NOT_FOUND) {
        return ProbeError::unsupported(msg);
    }
    return ProbeError::internal(msg);
}

FormatContext::~FormatContext() {
    if (m_fmt_ctx) {
        avformat_close_input(&m_fmt_ctx);
    }
}

Result<void, ProbeError> FormatContext::open(const std::string& path) {
    int ret = avformat_open_input(&m_fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        if (ret == AVERROR(ENOENT)) {
            return ProbeError::file_not_found(path);
        }
        return ffmpeg_error(ret, "avformat_open_input(" + path + ")");
    }

    ret = avformat_find_stream_info(m_fmt_ctx, nullptr);
    if (ret < 0) {
        return ffmpeg_error(ret, "avformat_find_stream_info");
    }

    return Result<void, ProbeError>();
}

int FormatContext::find_stream(AVMediaType type) const {
    if (!m_fmt_ctx) {
        return -1;
    }
    int index = av_find_best_stream(m_fmt_ctx, type, -1, -1, nullptr, 0);
    return index < 0 ? -1 : index;
}

int64_t FormatContext::duration_us() const {
    if (!m_fmt_ctx) {
        return 0;
    }

    // Container duration is in AV_TIME_BASE units (microseconds)
    if (m_fmt_ctx->duration != AV_NOPTS_VALUE && m_fmt_ctx->duration > 0) {
        return av_rescale_q(m_fmt_ctx->duration, AVRational{1, AV_TIME_BASE}, AVRational{1, 1000000});
    }

    int64_t longest = 0;
    for (unsigned i = 0; i < m_fmt_ctx->nb_streams; ++i) {
        const AVStream* stream = m_fmt_ctx->streams[i];
        if (stream->duration == AV_NOPTS_VALUE || stream->duration <= 0) {
            continue;
        }
        const int64_t us = av_rescale_q(stream->duration, stream->time_base, AVRational{1, 1000000});
        if (us > longest) {
            longest = us;
        }
    }
    return longest;
}

} // namespace impl
} // namespace media
} // namespace cutline
