#include "ffmpeg_media_probe.hpp"

extern "C" {
  #include <libavcodec/avcodec.h>
  #include <libavformat/avformat.h>
  #include <libavutil/log.h>
}

namespace conversion_service {

namespace {

std::string avError(int code) {
  char err_buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(code, err_buf, AV_ERROR_MAX_STRING_SIZE);
  return err_buf;
}

struct InputContext {
  AVFormatContext* ctx{nullptr};
  ~InputContext() {
    if (ctx) {
      avformat_close_input(&ctx);
    }
  }
};

} // namespace

FfmpegMediaProbe::FfmpegMediaProbe(int loglevel) {
  av_log_set_level(loglevel);
}

std::expected<MediaInfo, std::string> FfmpegMediaProbe::probe(const std::filesystem::path& path) {
  InputContext input;
  if (int ret = avformat_open_input(&input.ctx, path.c_str(), nullptr, nullptr); ret < 0) {
    return std::unexpected<std::string>("could not open input file: " + avError(ret));
  }
  if (int ret = avformat_find_stream_info(input.ctx, nullptr); ret < 0) {
    return std::unexpected<std::string>("could not find stream info: " + avError(ret));
  }

  MediaInfo info;
  if (input.ctx->iformat && input.ctx->iformat->name) {
    info.format_name = input.ctx->iformat->name;
  }
  if (input.ctx->duration != AV_NOPTS_VALUE && input.ctx->duration > 0) {
    info.duration_seconds = static_cast<double>(input.ctx->duration) / AV_TIME_BASE;
  }

  for (unsigned int i = 0; i < input.ctx->nb_streams; ++i) {
    const AVStream* stream = input.ctx->streams[i];
    switch (stream->codecpar->codec_type) {
      case AVMEDIA_TYPE_VIDEO:
        // Cover art is stored as a one-frame video stream.
        if (!(stream->disposition & AV_DISPOSITION_ATTACHED_PIC)) {
          info.has_video = true;
        }
        break;
      case AVMEDIA_TYPE_AUDIO:
        ++info.audio_streams;
        break;
      case AVMEDIA_TYPE_SUBTITLE:
        ++info.subtitle_streams;
        break;
      default:
        break;
    }
  }
  return info;
}

} // namespace conversion_service
