/**
 * @file VideoEncoderFFmpeg.hpp
 * @brief One FFmpeg encode session writing one MP4 file.
 *
 * VideoEncoderFFmpeg owns every native object of a single encode: codec
 * context, output container, stream, reusable frame and packet, and the
 * swscale context converting packed RGBA/BGRA into YUV 4:2:0. open() creates
 * them, encodeFrame() converts and submits one frame and writes whatever
 * packets are ready, finish() flushes the encoder and writes the trailer.
 *
 * Presentation timestamps follow call order: the n-th encodeFrame() call gets
 * pts n in a 1/fps time base, whatever the frame's capture timestamp was.
 *
 * release() frees everything in a fixed order (swscale, packet, frame,
 * container I/O, container, codec context). It runs on every failure inside
 * open() and from the destructor, so a failed or abandoned encode never
 * leaks. A file whose encode failed part way is not a usable video;
 * createdOutput() tells the caller whether there is such a file to clean up.
 *
 * @section Dependencies
 * - FFmpeg (libavcodec, libavformat, libavutil, libswscale)
 *
 * @section Patterns
 * - Wrapper/Adapter: C-style FFmpeg API behind a small C++ class.
 * - RAII: FFmpeg handles held in unique_ptrs (AVFramePtr, etc.).
 */

#pragma once
#include <map>
#include <string>
#include "FFmpegUtils.hpp"
#include "capture/CaptureTypes.hpp"
#include "util/Result.hpp"

namespace oc {

struct EncodeParams {
    fs::path outputPath;
    u32 width{0}; // input frame size; odd sizes are rounded down for 4:2:0
    u32 height{0};
    u32 fps{30};
    PixelFormat inputFormat{PixelFormat::RGBA8};
    std::string codecName{"libx264"};
    u32 crf{23};
    std::string preset{"medium"};
    // Extra codec private options, passed to avcodec_open2 by name
    std::map<std::string, std::string> codecOptions;
};

class VideoEncoderFFmpeg {
public:
    VideoEncoderFFmpeg() = default;
    ~VideoEncoderFFmpeg();

    VideoEncoderFFmpeg(const VideoEncoderFFmpeg&) = delete;
    VideoEncoderFFmpeg& operator=(const VideoEncoderFFmpeg&) = delete;

    Result<void> open(const EncodeParams& params);

    // Frame must match the size and pixel format given to open()
    Result<void> encodeFrame(const RawFrame& frame);

    // Flushes delayed packets and writes the trailer. Call exactly once.
    Result<void> finish();

    void release();

    bool isOpen() const {
        return codecCtx_ != nullptr;
    }
    i64 framesEncoded() const {
        return frameCount_;
    }
    u64 bytesWritten() const {
        return bytesWritten_;
    }
    // True once the last open() created the output file; survives release()
    bool createdOutput() const {
        return createdOutput_;
    }
    u32 outputWidth() const;
    u32 outputHeight() const;

private:
    Result<void> sendAndDrain(AVFrame* frame);

    AVCodecContextPtr codecCtx_;
    AVFormatContextPtr formatCtx_;
    AVStream* stream_{nullptr};
    AVFramePtr frame_;
    AVPacketPtr packet_;
    SwsContextPtr swsCtx_;

    EncodeParams params_;
    bool ioOpened_{false};
    bool createdOutput_{false};
    bool headerWritten_{false};
    bool finished_{false};
    i64 frameCount_{0};
    u64 bytesWritten_{0};
};

} // namespace oc
