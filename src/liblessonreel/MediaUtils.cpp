// Created by block on 2026-10-17.

#include <liblessonreel/MediaUtils.hpp>

#include <shared/Logger.hpp>

#include <algorithm>
#include <cstdarg>
#include <mutex>

extern "C" {
#include <libavutil/log.h>
}

namespace lessonreel {

	namespace {

		void AVLogCallback(void* avcl, int level, const char* fmt, va_list vl) {
			if (level > av_log_get_level())
				return;

			Logger::MessageSeverity sev = Logger::MessageSeverity::Debug;
			if (level <= AV_LOG_ERROR)
				sev = Logger::MessageSeverity::Warning;

			if (!Logger::The().WouldLog(sev))
				return;

			char line[1024];
			int printPrefix = 1;
			if (av_log_format_line2(avcl, level, fmt, vl, line, sizeof(line), &printPrefix) < 0)
				return;

			Logger::The().OutputMessage(sev, std::string("libav: ") + line);
		}

	} // namespace

	std::string AVErrorString(int err) {
		char buf[AV_ERROR_MAX_STRING_SIZE] = {};
		av_strerror(err, buf, sizeof(buf));
		return buf;
	}

	void AttachAVLogToLogger() {
		static std::once_flag once;
		std::call_once(once, [] {
			av_log_set_level(AV_LOG_WARNING);
			av_log_set_callback(AVLogCallback);
		});
	}

	Deadline::Deadline(std::chrono::milliseconds timeout)
		: timeout(timeout), end(Clock::now() + timeout) {
	}

	int Deadline::InterruptCallback(void* opaque) {
		return static_cast<const Deadline*>(opaque)->Expired() ? 1 : 0;
	}

	AVIOInterruptCB Deadline::AsInterrupt() const {
		return AVIOInterruptCB { &Deadline::InterruptCallback, const_cast<void*>(static_cast<const void*>(this)) };
	}

	InputFormatPtr OpenInput(const std::filesystem::path& path, const Deadline& deadline) {
		AVFormatContext* raw = avformat_alloc_context();
		if (!raw) {
			LogError("Couldn't allocate a format context for {}", path.string());
			return nullptr;
		}

		raw->interrupt_callback = deadline.AsInterrupt();

		// avformat_open_input frees the context itself on failure
		int ret = avformat_open_input(&raw, path.c_str(), nullptr, nullptr);
		if (ret < 0) {
			LogError("Couldn't open {}: {}", path.string(), AVErrorString(ret));
			return nullptr;
		}

		InputFormatPtr ctx(raw);

		ret = avformat_find_stream_info(ctx.get(), nullptr);
		if (ret < 0) {
			LogError("Couldn't read stream info of {}: {}", path.string(), AVErrorString(ret));
			return nullptr;
		}

		return ctx;
	}

	std::optional<double> MediaDuration(const std::filesystem::path& path, std::chrono::milliseconds timeout) {
		Deadline deadline(timeout);
		InputFormatPtr ctx = OpenInput(path, deadline);
		if (!ctx)
			return std::nullopt;

		if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0)
			return ctx->duration / (double)AV_TIME_BASE;

		// some containers only know per stream
		double longest = 0.0;
		for (unsigned i = 0; i < ctx->nb_streams; i++) {
			const AVStream* st = ctx->streams[i];
			if (st->duration != AV_NOPTS_VALUE && st->duration > 0)
				longest = std::max(longest, st->duration * av_q2d(st->time_base));
		}

		if (longest <= 0.0) {
			LogWarning("{} has no duration", path.string());
			return std::nullopt;
		}

		return longest;
	}

	bool EncodeAndWrite(AVFormatContext* oc, AVCodecContext* ctx, AVStream* stream, AVFrame* frame, AVPacket* pkt) {
		int ret = avcodec_send_frame(ctx, frame);
		if (ret < 0) {
			LogError("Error sending a frame to the {} encoder: {}", ctx->codec->name, AVErrorString(ret));
			return false;
		}

		// read all available output packets
		while (true) {
			ret = avcodec_receive_packet(ctx, pkt);
			if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
				return true;

			if (ret < 0) {
				LogError("Error encoding a {} frame: {}", ctx->codec->name, AVErrorString(ret));
				return false;
			}

			av_packet_rescale_ts(pkt, ctx->time_base, stream->time_base);
			pkt->stream_index = stream->index;

			// takes ownership of the packet's data
			ret = av_interleaved_write_frame(oc, pkt);
			if (ret < 0) {
				LogError("Error writing a packet: {}", AVErrorString(ret));
				return false;
			}
		}
	}

} // namespace lessonreel
