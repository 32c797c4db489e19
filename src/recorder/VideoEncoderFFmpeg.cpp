#include "VideoEncoderFFmpeg.hpp"
#include "core/Logger.hpp"

namespace oc {

namespace {

AVPixelFormat toAVPixelFormat(PixelFormat fmt) {
    return fmt == PixelFormat::BGRA8 ? AV_PIX_FMT_BGRA : AV_PIX_FMT_RGBA;
}

} // namespace

VideoEncoderFFmpeg::~VideoEncoderFFmpeg() {
    release();
}

u32 VideoEncoderFFmpeg::outputWidth() const {
    return codecCtx_ ? static_cast<u32>(codecCtx_->width) : 0;
}

u32 VideoEncoderFFmpeg::outputHeight() const {
    return codecCtx_ ? static_cast<u32>(codecCtx_->height) : 0;
}

Result<void> VideoEncoderFFmpeg::open(const EncodeParams& params) {
    release();
    createdOutput_ = false;
    params_ = params;

    const int outW = static_cast<int>(params.width & ~1u);
    const int outH = static_cast<int>(params.height & ~1u);
    if (outW < 2 || outH < 2) {
        return Result<void>::err("Invalid frame size " +
                                 std::to_string(params.width) + "x" +
                                 std::to_string(params.height));
    }
    if (params.fps == 0)
        return Result<void>::err("Frame rate must be positive");

    auto fail = [this](std::string msg) {
        release();
        return Result<void>::err(std::move(msg));
    };

    const AVCodec* codec = avcodec_find_encoder_by_name(params.codecName.c_str());
    if (!codec)
        return fail("Codec not found: " + params.codecName);

    codecCtx_.reset(avcodec_alloc_context3(codec));
    if (!codecCtx_)
        return fail("Failed to allocate codec context");

    AVFormatContext* fmt = nullptr;
    const std::string path = params.outputPath.string();
    int ret = avformat_alloc_output_context2(&fmt, nullptr, "mp4", path.c_str());
    formatCtx_.reset(fmt);
    if (ret < 0 || !formatCtx_)
        return fail("Failed to create output context: " + ffmpegError(ret));

    stream_ = avformat_new_stream(formatCtx_.get(), nullptr);
    if (!stream_)
        return fail("Failed to create video stream");

    const int fps = static_cast<int>(params.fps);
    codecCtx_->width = outW;
    codecCtx_->height = outH;
    codecCtx_->time_base = AVRational{1, fps};
    codecCtx_->framerate = AVRational{fps, 1};
    codecCtx_->pix_fmt = AV_PIX_FMT_YUV420P;
    codecCtx_->gop_size = fps * 2;
    codecCtx_->max_b_frames = 2;
    if (formatCtx_->oformat->flags & AVFMT_GLOBALHEADER)
        codecCtx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    AVDictionary* opts = nullptr;
    av_dict_set(&opts, "crf", std::to_string(params.crf).c_str(), 0);
    av_dict_set(&opts, "preset", params.preset.c_str(), 0);
    for (const auto& [key, value] : params.codecOptions)
        av_dict_set(&opts, key.c_str(), value.c_str(), 0);

    ret = avcodec_open2(codecCtx_.get(), codec, &opts);
    if (ret >= 0) {
        const AVDictionaryEntry* e = nullptr;
        while ((e = av_dict_get(opts, "", e, AV_DICT_IGNORE_SUFFIX)))
            LOG_DEBUG("{} ignored option {}={}", params.codecName, e->key, e->value);
    }
    av_dict_free(&opts);
    if (ret < 0)
        return fail("Failed to open codec " + params.codecName + ": " +
                    ffmpegError(ret));

    ret = avcodec_parameters_from_context(stream_->codecpar, codecCtx_.get());
    if (ret < 0)
        return fail("Failed to copy codec parameters: " + ffmpegError(ret));
    stream_->time_base = codecCtx_->time_base;

    if (!(formatCtx_->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&formatCtx_->pb, path.c_str(), AVIO_FLAG_WRITE);
        if (ret < 0)
            return fail("Failed to open output file " + path + ": " +
                        ffmpegError(ret));
        ioOpened_ = true;
        createdOutput_ = true;
    }

    ret = avformat_write_header(formatCtx_.get(), nullptr);
    if (ret < 0)
        return fail("Failed to write header: " + ffmpegError(ret));
    headerWritten_ = true;

    frame_.reset(av_frame_alloc());
    if (!frame_)
        return fail("Failed to allocate frame");
    frame_->format = codecCtx_->pix_fmt;
    frame_->width = outW;
    frame_->height = outH;
    ret = av_frame_get_buffer(frame_.get(), 0);
    if (ret < 0)
        return fail("Failed to allocate frame buffer: " + ffmpegError(ret));

    packet_.reset(av_packet_alloc());
    if (!packet_)
        return fail("Failed to allocate packet");

    swsCtx_.reset(sws_getContext(static_cast<int>(params.width),
                                 static_cast<int>(params.height),
                                 toAVPixelFormat(params.inputFormat),
                                 outW,
                                 outH,
                                 AV_PIX_FMT_YUV420P,
                                 SWS_BILINEAR,
                                 nullptr,
                                 nullptr,
                                 nullptr));
    if (!swsCtx_)
        return fail("Failed to create pixel conversion context");

    LOG_DEBUG("Encoder {} opened: {}x{} @ {} fps -> {}",
              params.codecName,
              outW,
              outH,
              fps,
              path);
    return Result<void>::ok();
}

Result<void> VideoEncoderFFmpeg::encodeFrame(const RawFrame& frame) {
    if (!isOpen() || !swsCtx_)
        return Result<void>::err("Encoder is not open");
    if (finished_)
        return Result<void>::err("Encoder already finished");
    if (frame.width != params_.width || frame.height != params_.height ||
        frame.format != params_.inputFormat) {
        return Result<void>::err(
                "Frame " + std::to_string(frame.width) + "x" +
                std::to_string(frame.height) + " " +
                std::string(toString(frame.format)) +
                " does not match encoder input " +
                std::to_string(params_.width) + "x" +
                std::to_string(params_.height) + " " +
                std::string(toString(params_.inputFormat)));
    }
    if (!frame.isValid())
        return Result<void>::err("Frame buffer has " +
                                 std::to_string(frame.data.size()) +
                                 " bytes, expected " +
                                 std::to_string(frame.expectedSize()));

    int ret = av_frame_make_writable(frame_.get());
    if (ret < 0)
        return Result<void>::err("Frame not writable: " + ffmpegError(ret));

    const u8* srcData[1] = {frame.data.data()};
    const int srcLinesize[1] = {static_cast<int>(frame.width * kBytesPerPixel)};
    sws_scale(swsCtx_.get(),
              srcData,
              srcLinesize,
              0,
              static_cast<int>(frame.height),
              frame_->data,
              frame_->linesize);

    frame_->pts = frameCount_++;
    return sendAndDrain(frame_.get());
}

Result<void> VideoEncoderFFmpeg::finish() {
    if (!isOpen() || !headerWritten_)
        return Result<void>::err("Encoder is not open");
    if (finished_)
        return Result<void>::err("Encoder already finished");
    finished_ = true;

    if (auto flushed = sendAndDrain(nullptr); !flushed)
        return flushed;

    int ret = av_write_trailer(formatCtx_.get());
    if (ret < 0)
        return Result<void>::err("Failed to write trailer: " + ffmpegError(ret));

    LOG_DEBUG("Encoder finished: {} frames, {} bytes", frameCount_, bytesWritten_);
    return Result<void>::ok();
}

Result<void> VideoEncoderFFmpeg::sendAndDrain(AVFrame* frame) {
    int ret = avcodec_send_frame(codecCtx_.get(), frame);
    if (ret < 0)
        return Result<void>::err("Failed to send frame: " + ffmpegError(ret));

    while (true) {
        ret = avcodec_receive_packet(codecCtx_.get(), packet_.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            break;
        if (ret < 0)
            return Result<void>::err("Failed to receive packet: " +
                                     ffmpegError(ret));

        av_packet_rescale_ts(packet_.get(), codecCtx_->time_base, stream_->time_base);
        packet_->stream_index = stream_->index;
        const int size = packet_->size;

        // av_interleaved_write_frame takes ownership of the packet payload
        ret = av_interleaved_write_frame(formatCtx_.get(), packet_.get());
        if (ret < 0)
            return Result<void>::err("Failed to write packet: " + ffmpegError(ret));
        bytesWritten_ += static_cast<u64>(size);
    }
    return Result<void>::ok();
}

void VideoEncoderFFmpeg::release() {
    swsCtx_.reset();
    packet_.reset();
    frame_.reset();
    if (formatCtx_ && ioOpened_)
        avio_closep(&formatCtx_->pb);
    formatCtx_.reset();
    codecCtx_.reset();

    stream_ = nullptr;
    ioOpened_ = false;
    headerWritten_ = false;
    finished_ = false;
    frameCount_ = 0;
    bytesWritten_ = 0;
}

} // namespace oc
