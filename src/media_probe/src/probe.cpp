#include <media_probe/probe.h>
#include "impl/format_context.h"

#include <mutex>

namespace cutline {
namespace media {

Result<MediaInfo, ProbeError> probe(const std::string& path) {
    // Demuxer chatter on stderr is noise for a worker log
    static std::once_flag s_ffmpeg_log_init;
    std::call_once(s_ffmpeg_log_init, [] {
        av_log_set_level(AV_LOG_FATAL);
    });

    if (path.empty()) {
        return ProbeError::file_not_found(path);
    }

    impl::FormatContext fmt;
    Result<void, ProbeError> opened = fmt.open(path);
    if (opened.is_error()) {
        return opened.error();
    }

    MediaInfo info;
    info.duration_us = fmt.duration_us();
    if (fmt.get()->iformat && fmt.get()->iformat->name) {
        info.format_name = fmt.get()->iformat->name;
    }

    const int video = fmt.find_stream(AVMEDIA_TYPE_VIDEO);
    if (video >= 0) {
        const AVCodecParameters* params = fmt.get()->streams[video]->codecpar;
        info.has_video = true;
        info.width = params->width;
        info.height = params->height;
    }
    info.has_audio = fmt.find_stream(AVMEDIA_TYPE_AUDIO) >= 0;

    if (!info.has_video && !info.has_audio) {
        return ProbeError::unsupported("No audio or video stream in " + path);
    }
    return info;
}

} // namespace media
} // namespace cutline
