// Created by block on 2026-10-17.

#include <liblessonreel/ArtifactRegistry.hpp>
#include <liblessonreel/MediaUtils.hpp>
#include <liblessonreel/SegmentEncoder.hpp>

#include <shared/ExportUtilities.hpp>
#include <shared/ImageUtilities.hpp>
#include <shared/Logger.hpp>

#include <SDL3/SDL.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/mathematics.h>
#include <libavutil/opt.h>
#include <libavutil/samplefmt.h>
}

namespace lessonreel {

	namespace {

		bool IsLibx264(const AVCodec* codec) {
			return std::strcmp(codec->name, "libx264") == 0;
		}

		CodecContextPtr OpenVideoEncoder(const AVCodec* codec, const EncodingProfile& profile, bool global_header) {
			CodecContextPtr ctx(avcodec_alloc_context3(codec));
			if (!ctx) {
				LogError("Couldn't allocate a {} context", codec->name);
				return nullptr;
			}

			ctx->width = profile.width;
			ctx->height = profile.height;
			ctx->time_base = AVRational { 1, profile.fps };
			ctx->framerate = AVRational { profile.fps, 1 };
			ctx->pix_fmt = AV_PIX_FMT_YUV420P;
			ctx->gop_size = profile.gop;
			// keeps pts == dts, the concat step relies on it
			ctx->max_b_frames = 0;

			if (global_header)
				ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

			AVDictionary* opts = nullptr;
			if (IsLibx264(codec)) {
				av_dict_set(&opts, "preset", "veryfast", 0);
				av_dict_set(&opts, "tune", "stillimage", 0);
				av_dict_set(&opts, "crf", std::to_string(profile.crf).c_str(), 0);
			}
			else {
				ctx->bit_rate = profile.video_bit_rate;
			}

			int ret = avcodec_open2(ctx.get(), codec, &opts);
			av_dict_free(&opts);

			if (ret < 0) {
				LogDebug("Couldn't open video encoder {}: {}", codec->name, AVErrorString(ret));
				return nullptr;
			}

			return ctx;
		}

		CodecContextPtr OpenAudioEncoder(const AVCodec* codec, const EncodingProfile& profile, bool global_header) {
			CodecContextPtr ctx(avcodec_alloc_context3(codec));
			if (!ctx) {
				LogError("Couldn't allocate a {} context", codec->name);
				return nullptr;
			}

			ctx->sample_fmt = AV_SAMPLE_FMT_FLTP;
			ctx->sample_rate = profile.sample_rate;
			ctx->bit_rate = profile.audio_bit_rate;
			ctx->time_base = AVRational { 1, profile.sample_rate };
			av_channel_layout_default(&ctx->ch_layout, profile.channels);

			if (global_header)
				ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

			int ret = avcodec_open2(ctx.get(), codec, nullptr);
			if (ret < 0) {
				LogError("Couldn't open audio encoder {}: {}", codec->name, AVErrorString(ret));
				return nullptr;
			}

			return ctx;
		}

		FramePtr SurfaceToFrame(SDL_Surface* surface) {
			FramePtr frame(av_frame_alloc());
			if (!frame) {
				LogError("Couldn't allocate a video frame");
				return nullptr;
			}

			frame->format = AV_PIX_FMT_YUV420P;
			frame->width = surface->w;
			frame->height = surface->h;

			int ret = av_frame_get_buffer(frame.get(), 0);
			if (ret < 0) {
				LogError("Couldn't allocate video frame data: {}", AVErrorString(ret));
				return nullptr;
			}

			SwsPtr sws(sws_getContext(surface->w, surface->h, AV_PIX_FMT_RGBA,
			                          surface->w, surface->h, AV_PIX_FMT_YUV420P,
			                          SWS_BICUBIC, nullptr, nullptr, nullptr));
			if (!sws) {
				LogError("Couldn't create an RGBA to YUV converter");
				return nullptr;
			}

			const std::uint8_t* src[1] = { static_cast<const std::uint8_t*>(surface->pixels) };
			int srcStride[1] = { surface->pitch };
			sws_scale(sws.get(), src, srcStride, 0, surface->h, frame->data, frame->linesize);

			return frame;
		}

		// decodes a whole audio file, resampled to the profile's format, into fifo. Stops early once max_samples are buffered.
		bool DecodeAudioInto(const std::filesystem::path& path, const EncodingProfile& profile, const Deadline& deadline, AVAudioFifo* fifo, int max_samples) {
			InputFormatPtr in = OpenInput(path, deadline);
			if (!in)
				return false;

			const AVCodec* decoder = nullptr;
			int streamIndex = av_find_best_stream(in.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &decoder, 0);
			if (streamIndex < 0 || !decoder) {
				LogError("{} has no audio stream", path.string());
				return false;
			}

			CodecContextPtr dctx(avcodec_alloc_context3(decoder));
			if (!dctx || avcodec_parameters_to_context(dctx.get(), in->streams[streamIndex]->codecpar) < 0) {
				LogError("Couldn't set up a decoder for {}", path.string());
				return false;
			}

			int ret = avcodec_open2(dctx.get(), decoder, nullptr);
			if (ret < 0) {
				LogError("Couldn't open the {} decoder: {}", decoder->name, AVErrorString(ret));
				return false;
			}

			AVChannelLayout outLayout {};
			av_channel_layout_default(&outLayout, profile.channels);

			SwrContext* rawSwr = nullptr;
			ret = swr_alloc_set_opts2(&rawSwr,
			                          &outLayout, AV_SAMPLE_FMT_FLTP, profile.sample_rate,
			                          &dctx->ch_layout, dctx->sample_fmt, dctx->sample_rate,
			                          0, nullptr);
			SwrPtr swr(rawSwr);
			if (ret < 0 || !swr || swr_init(swr.get()) < 0) {
				LogError("Couldn't set up resampling for {}", path.string());
				av_channel_layout_uninit(&outLayout);
				return false;
			}

			PacketPtr pkt(av_packet_alloc());
			FramePtr frame(av_frame_alloc());
			FramePtr converted(av_frame_alloc());
			if (!pkt || !frame || !converted) {
				LogError("Couldn't allocate decoding buffers");
				av_channel_layout_uninit(&outLayout);
				return false;
			}

			auto convert = [&](AVFrame* input) -> bool {
				av_frame_unref(converted.get());
				converted->format = AV_SAMPLE_FMT_FLTP;
				converted->sample_rate = profile.sample_rate;
				av_channel_layout_copy(&converted->ch_layout, &outLayout);

				int err = swr_convert_frame(swr.get(), converted.get(), input);
				if (err < 0) {
					LogError("Couldn't resample {}: {}", path.string(), AVErrorString(err));
					return false;
				}

				if (converted->nb_samples > 0 && av_audio_fifo_write(fifo, reinterpret_cast<void**>(converted->data), converted->nb_samples) < converted->nb_samples) {
					LogError("Couldn't buffer decoded audio");
					return false;
				}

				return true;
			};

			auto drain = [&]() -> bool {
				while (true) {
					int err = avcodec_receive_frame(dctx.get(), frame.get());
					if (err == AVERROR(EAGAIN) || err == AVERROR_EOF)
						return true;

					if (err < 0) {
						LogError("Error decoding {}: {}", path.string(), AVErrorString(err));
						return false;
					}

					bool ok = convert(frame.get());
					av_frame_unref(frame.get());
					if (!ok)
						return false;
				}
			};

			bool ok = true;
			while (ok && av_audio_fifo_size(fifo) < max_samples) {
				if (deadline.Expired()) {
					LogError("Decoding {} ran past its deadline", path.string());
					ok = false;
					break;
				}

				ret = av_read_frame(in.get(), pkt.get());
				if (ret == AVERROR_EOF)
					break;

				if (ret < 0) {
					LogError("Error reading {}: {}", path.string(), AVErrorString(ret));
					ok = false;
					break;
				}

				if (pkt->stream_index == streamIndex) {
					ret = avcodec_send_packet(dctx.get(), pkt.get());
					if (ret < 0) {
						LogError("Error sending a packet to the decoder: {}", AVErrorString(ret));
						ok = false;
					}
					else {
						ok = drain();
					}
				}

				av_packet_unref(pkt.get());
			}

			// flush decoder, then resampler
			if (ok && avcodec_send_packet(dctx.get(), nullptr) >= 0)
				ok = drain();
			if (ok)
				ok = convert(nullptr);

			av_channel_layout_uninit(&outLayout);
			return ok;
		}

		// the first software encoder in the list that opens with this profile
		const AVCodec* FindVideoEncoder(const EncodingProfile& profile) {
			std::vector<const AVCodec*> candidates;

			for (const auto& name : profile.video_encoders) {
				const AVCodec* codec = avcodec_find_encoder_by_name(name.c_str());
				if (codec)
					candidates.push_back(codec);
				else
					LogDebug("Video encoder {} isn't available", name);
			}

			for (AVCodecID id : { AV_CODEC_ID_H264, AV_CODEC_ID_MPEG4 }) {
				void* it = nullptr;
				while (const AVCodec* codec = av_codec_iterate(&it)) {
					if (codec->id != id || !av_codec_is_encoder(codec))
						continue;
					if (codec->capabilities & (AV_CODEC_CAP_HARDWARE | AV_CODEC_CAP_EXPERIMENTAL))
						continue;
					candidates.push_back(codec);
				}
			}

			for (const AVCodec* codec : candidates) {
				if (OpenVideoEncoder(codec, profile, true))
					return codec;
			}

			return nullptr;
		}

	} // namespace

	SegmentEncoder::SegmentEncoder(const EncodingProfile& profile, ArtifactRegistry& registry)
		: profile(profile), registry(registry) {
	}

	double SegmentEncoder::ResolveDuration(std::optional<double> measured, const SegmentTiming& timing, int fps) {
		double seconds = timing.default_duration;
		if (measured && *measured > 0.0)
			seconds = *measured + timing.trailing_buffer;

		if (fps <= 0)
			return seconds;

		// the epsilon keeps 5.0 * 30 from becoming 151 frames
		double frames = std::max(1.0, std::ceil(seconds * fps - 1e-6));
		return frames / fps;
	}

	bool SegmentEncoder::Prepare() {
		if (video_codec && audio_codec)
			return true;

		if (!profile.IsValid()) {
			LogError("Encoding profile {}x{} @ {}fps isn't usable, dimensions must be even", profile.width, profile.height, profile.fps);
			return false;
		}

		video_codec = FindVideoEncoder(profile);
		if (!video_codec) {
			LogError("No usable video encoder, tried H.264 and MPEG-4");
			return false;
		}

		audio_codec = avcodec_find_encoder(AV_CODEC_ID_AAC);
		if (!audio_codec) {
			LogError("No AAC encoder available");
			video_codec = nullptr;
			return false;
		}

		LogInfo("Encoding {}x{} @ {}fps with {} and {}", profile.width, profile.height, profile.fps, video_codec->name, audio_codec->name);
		return true;
	}

	std::optional<std::filesystem::path> SegmentEncoder::WriteSilence(size_t index, double seconds) {
		std::filesystem::path path = registry.MakePath(std::format("segment_{:02}_silence.wav", index));
		registry.Register(path);

		if (!SamplesToWAV(MakeSilence(seconds, profile.sample_rate), profile.sample_rate, path)) {
			LogError("Couldn't write the silent track for segment {}", index);
			return std::nullopt;
		}

		return path;
	}

	std::optional<double> SegmentEncoder::NarrationDuration(const std::filesystem::path& audio) {
		return MediaDuration(audio, profile.media_timeout);
	}

	std::optional<Segment> SegmentEncoder::Encode(size_t index, const std::filesystem::path& image, const std::optional<std::filesystem::path>& audio, const SegmentTiming& timing) {
		if (!Prepare())
			return std::nullopt;

		Segment segment;
		segment.index = index;
		segment.image_path = image;

		if (audio) {
			std::optional<double> measured = NarrationDuration(*audio);
			if (!measured)
				LogWarning("Couldn't time narration {}, using the default {:.2f}s", audio->string(), timing.default_duration);

			segment.duration = ResolveDuration(measured, timing, profile.fps);
			segment.audio_path = *audio;
			segment.narrated = true;
		}
		else {
			segment.duration = ResolveDuration(std::nullopt, timing, profile.fps);

			std::optional<std::filesystem::path> silence = WriteSilence(index, segment.duration);
			if (!silence)
				return std::nullopt;

			segment.audio_path = *silence;
		}

		segment.segment_path = registry.MakePath(std::format("segment_{:02}.mp4", index));
		registry.Register(segment.segment_path);

		if (!EncodeFile(segment.image_path, segment.audio_path, segment.duration, segment.segment_path)) {
			LogError("Encoding segment {} failed", index);
			return std::nullopt;
		}

		LogDebug("Segment {}: {:.3f}s, {}", index, segment.duration, segment.narrated ? "narrated" : "silent");
		return segment;
	}

	bool SegmentEncoder::EncodeFile(const std::filesystem::path& image, const std::filesystem::path& audio, double duration, const std::filesystem::path& output) {
		Deadline deadline(profile.media_timeout);

		SDL_Surface* surface = LoadImage(image);
		if (!surface)
			return false;

		if (surface->w != profile.width || surface->h != profile.height) {
			LogDebug("Letterboxing {} from {}x{} to {}x{}", image.string(), surface->w, surface->h, profile.width, profile.height);
			SDL_Surface* boxed = LetterboxImage(surface, profile.width, profile.height);
			SDL_DestroySurface(surface);
			surface = boxed;
			if (!surface)
				return false;
		}

		FramePtr picture = SurfaceToFrame(surface);
		SDL_DestroySurface(surface);
		if (!picture)
			return false;

		AVFormatContext* rawOc = nullptr;
		int ret = avformat_alloc_output_context2(&rawOc, nullptr, "mp4", output.c_str());
		if (ret < 0 || !rawOc) {
			LogError("Couldn't create an MP4 muxer for {}: {}", output.string(), AVErrorString(ret));
			return false;
		}
		OutputFormatPtr oc(rawOc);
		oc->interrupt_callback = deadline.AsInterrupt();

		bool globalHeader = oc->oformat->flags & AVFMT_GLOBALHEADER;

		CodecContextPtr vctx = OpenVideoEncoder(video_codec, profile, globalHeader);
		CodecContextPtr actx = OpenAudioEncoder(audio_codec, profile, globalHeader);
		if (!vctx || !actx) {
			LogError("Couldn't open the encoders for {}", output.string());
			return false;
		}

		AVStream* vst = avformat_new_stream(oc.get(), nullptr);
		AVStream* ast = avformat_new_stream(oc.get(), nullptr);
		if (!vst || !ast) {
			LogError("Couldn't add streams to {}", output.string());
			return false;
		}

		vst->time_base = vctx->time_base;
		vst->avg_frame_rate = vctx->framerate;
		ast->time_base = actx->time_base;
		if (avcodec_parameters_from_context(vst->codecpar, vctx.get()) < 0 || avcodec_parameters_from_context(ast->codecpar, actx.get()) < 0) {
			LogError("Couldn't copy encoder parameters for {}", output.string());
			return false;
		}

		ret = avio_open2(&oc->pb, output.c_str(), AVIO_FLAG_WRITE, &oc->interrupt_callback, nullptr);
		if (ret < 0) {
			LogError("Couldn't open {} for writing: {}", output.string(), AVErrorString(ret));
			return false;
		}

		ret = avformat_write_header(oc.get(), nullptr);
		if (ret < 0) {
			LogError("Couldn't write the header of {}: {}", output.string(), AVErrorString(ret));
			return false;
		}

		const std::int64_t totalFrames = std::llround(duration * profile.fps);
		const std::int64_t totalSamples = std::llround(duration * profile.sample_rate);
		const int frameSize = actx->frame_size > 0 ? actx->frame_size : 1024;

		AudioFifoPtr fifo(av_audio_fifo_alloc(AV_SAMPLE_FMT_FLTP, profile.channels, frameSize));
		if (!fifo) {
			LogError("Couldn't allocate an audio buffer");
			return false;
		}

		if (!DecodeAudioInto(audio, profile, deadline, fifo.get(), static_cast<int>(totalSamples)))
			return false;

		int available = av_audio_fifo_size(fifo.get());
		if (available < totalSamples)
			LogDebug("Padding {} with {} samples of silence", output.string(), totalSamples - available);

		FramePtr sound(av_frame_alloc());
		PacketPtr pkt(av_packet_alloc());
		if (!sound || !pkt) {
			LogError("Couldn't allocate encoding buffers");
			return false;
		}

		sound->format = actx->sample_fmt;
		sound->sample_rate = actx->sample_rate;
		sound->nb_samples = frameSize;
		av_channel_layout_copy(&sound->ch_layout, &actx->ch_layout);
		ret = av_frame_get_buffer(sound.get(), 0);
		if (ret < 0) {
			LogError("Couldn't allocate audio frame data: {}", AVErrorString(ret));
			return false;
		}

		std::int64_t nextFrame = 0;
		std::int64_t nextSample = 0;

		// interleave by timestamp so the muxer never has to buffer much
		while (nextFrame < totalFrames || nextSample < totalSamples) {
			if (deadline.Expired()) {
				LogError("Encoding {} ran past its {}ms deadline", output.string(), deadline.GetTimeout().count());
				return false;
			}

			bool videoTurn = nextSample >= totalSamples
			                 || (nextFrame < totalFrames && av_compare_ts(nextFrame, vctx->time_base, nextSample, actx->time_base) <= 0);

			if (videoTurn) {
				picture->pts = nextFrame++;
				if (!EncodeAndWrite(oc.get(), vctx.get(), vst, picture.get(), pkt.get()))
					return false;
				continue;
			}

			ret = av_frame_make_writable(sound.get());
			if (ret < 0) {
				LogError("Couldn't make an audio frame writable: {}", AVErrorString(ret));
				return false;
			}

			int count = static_cast<int>(std::min<std::int64_t>(frameSize, totalSamples - nextSample));
			int read = av_audio_fifo_read(fifo.get(), reinterpret_cast<void**>(sound->data), count);
			if (read < 0) {
				LogError("Couldn't read buffered audio: {}", AVErrorString(read));
				return false;
			}

			// past the end of the narration, or a shorter last frame
			if (read < count)
				av_samples_set_silence(sound->data, read, count - read, profile.channels, actx->sample_fmt);

			sound->nb_samples = count;
			sound->pts = nextSample;
			nextSample += count;

			if (!EncodeAndWrite(oc.get(), actx.get(), ast, sound.get(), pkt.get()))
				return false;
		}

		if (!EncodeAndWrite(oc.get(), vctx.get(), vst, nullptr, pkt.get()) || !EncodeAndWrite(oc.get(), actx.get(), ast, nullptr, pkt.get()))
			return false;

		ret = av_write_trailer(oc.get());
		if (ret < 0) {
			LogError("Couldn't finish {}: {}", output.string(), AVErrorString(ret));
			return false;
		}

		return true;
	}

} // namespace lessonreel
