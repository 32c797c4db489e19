/**
 * @file FFmpegUtils.hpp
 * @brief RAII handles and error helpers for the FFmpeg C API.
 *
 * Each FFmpeg object that needs a matching free call gets a unique_ptr alias
 * with a deleter, so ownership is explicit and nothing leaks on early
 * returns. The container's I/O handle is not covered here: it is closed
 * explicitly because it has to go before the container itself.
 *
 * @section Dependencies
 * - FFmpeg (libavcodec, libavformat, libavutil, libswscale)
 */

#pragma once
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}
#include <memory>
#include <string>

namespace oc {

struct AVCodecContextDeleter {
    void operator()(AVCodecContext* ctx) const {
        avcodec_free_context(&ctx);
    }
};

struct AVFormatContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        avformat_free_context(ctx);
    }
};

struct AVInputFormatContextDeleter {
    void operator()(AVFormatContext* ctx) const {
        avformat_close_input(&ctx);
    }
};

struct AVFrameDeleter {
    void operator()(AVFrame* frame) const {
        av_frame_free(&frame);
    }
};

struct AVPacketDeleter {
    void operator()(AVPacket* packet) const {
        av_packet_free(&packet);
    }
};

struct SwsContextDeleter {
    void operator()(SwsContext* ctx) const {
        sws_freeContext(ctx);
    }
};

using AVCodecContextPtr = std::unique_ptr<AVCodecContext, AVCodecContextDeleter>;
using AVFormatContextPtr =
        std::unique_ptr<AVFormatContext, AVFormatContextDeleter>;
using AVInputFormatContextPtr =
        std::unique_ptr<AVFormatContext, AVInputFormatContextDeleter>;
using AVFramePtr = std::unique_ptr<AVFrame, AVFrameDeleter>;
using AVPacketPtr = std::unique_ptr<AVPacket, AVPacketDeleter>;
using SwsContextPtr = std::unique_ptr<SwsContext, SwsContextDeleter>;

// av_strerror() text for an FFmpeg error code
std::string ffmpegError(int errnum);

} // namespace oc
