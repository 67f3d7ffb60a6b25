// Created by block on 2026-10-17.

#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

namespace lessonreel {

	std::string AVErrorString(int err);

	/// Routes libav's own log output into our Logger, a level lower than libav reports it.
	void AttachAVLogToLogger();

	/// A point in time after which blocking libav calls get interrupted.
	class Deadline {
	public:
		using Clock = std::chrono::steady_clock;

		explicit Deadline(std::chrono::milliseconds timeout);

		bool Expired() const { return Clock::now() >= end; }
		std::chrono::milliseconds GetTimeout() const { return timeout; }

		/// The deadline has to outlive whatever the callback is attached to.
		AVIOInterruptCB AsInterrupt() const;

	private:
		static int InterruptCallback(void* opaque);

		std::chrono::milliseconds timeout;
		Clock::time_point end;
	};

	struct InputFormatDeleter {
		void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
	};

	struct OutputFormatDeleter {
		void operator()(AVFormatContext* ctx) const {
			if (ctx->pb && !(ctx->oformat->flags & AVFMT_NOFILE))
				avio_closep(&ctx->pb);
			avformat_free_context(ctx);
		}
	};

	struct CodecContextDeleter {
		void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
	};

	struct FrameDeleter {
		void operator()(AVFrame* frame) const { av_frame_free(&frame); }
	};

	struct PacketDeleter {
		void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
	};

	struct SwsDeleter {
		void operator()(SwsContext* ctx) const { sws_freeContext(ctx); }
	};

	struct SwrDeleter {
		void operator()(SwrContext* ctx) const { swr_free(&ctx); }
	};

	struct AudioFifoDeleter {
		void operator()(AVAudioFifo* fifo) const { av_audio_fifo_free(fifo); }
	};

	using InputFormatPtr = std::unique_ptr<AVFormatContext, InputFormatDeleter>;
	using OutputFormatPtr = std::unique_ptr<AVFormatContext, OutputFormatDeleter>;
	using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
	using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;
	using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
	using SwsPtr = std::unique_ptr<SwsContext, SwsDeleter>;
	using SwrPtr = std::unique_ptr<SwrContext, SwrDeleter>;
	using AudioFifoPtr = std::unique_ptr<AVAudioFifo, AudioFifoDeleter>;

	/// Opens a media file and reads its stream info, interruptible by deadline. Returns nullptr on failure.
	InputFormatPtr OpenInput(const std::filesystem::path& path, const Deadline& deadline);

	/// Container duration of a media file in seconds, or nullopt if it can't be determined.
	std::optional<double> MediaDuration(const std::filesystem::path& path, std::chrono::milliseconds timeout);

	/// Sends frame (nullptr to flush) to the encoder and writes every packet it hands back to the muxer.
	bool EncodeAndWrite(AVFormatContext* oc, AVCodecContext* ctx, AVStream* stream, AVFrame* frame, AVPacket* pkt);

} // namespace lessonreel
