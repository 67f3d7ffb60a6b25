// Created by block on 2026-10-17.

#include <liblessonreel/MediaUtils.hpp>
#include <liblessonreel/TimelineAssembler.hpp>

#include <shared/Logger.hpp>

#include <algorithm>
#include <cmath>

extern "C" {
#include <libavutil/mathematics.h>
}

namespace lessonreel {

	namespace {

		constexpr double EPSILON = 1e-6;

		struct StreamPair {
			int video = -1;
			int audio = -1;
		};

		// exactly one video and one audio stream, or nothing
		std::optional<StreamPair> FindStreams(const AVFormatContext* ctx) {
			StreamPair pair;
			for (unsigned i = 0; i < ctx->nb_streams; i++) {
				int* slot = nullptr;
				switch (ctx->streams[i]->codecpar->codec_type) {
					case AVMEDIA_TYPE_VIDEO: slot = &pair.video; break;
					case AVMEDIA_TYPE_AUDIO: slot = &pair.audio; break;
					default: return std::nullopt;
				}

				if (*slot != -1)
					return std::nullopt;

				*slot = static_cast<int>(i);
			}

			if (pair.video < 0 || pair.audio < 0)
				return std::nullopt;

			return pair;
		}

		bool SameLayout(const AVCodecParameters* a, const AVCodecParameters* b) {
			if (a->codec_type != b->codec_type || a->codec_id != b->codec_id)
				return false;

			if (a->codec_type == AVMEDIA_TYPE_VIDEO)
				return a->width == b->width && a->height == b->height && a->format == b->format;

			return a->sample_rate == b->sample_rate && a->ch_layout.nb_channels == b->ch_layout.nb_channels && a->format == b->format;
		}

		std::int64_t SecondsToTimeBase(double seconds, AVRational tb) {
			return av_rescale_q(std::llround(seconds * AV_TIME_BASE), AV_TIME_BASE_Q, tb);
		}

	} // namespace

	std::optional<TruncationPolicy> PolicyFromName(std::string_view name) {
		if (name == "hardcut")
			return TruncationPolicy::HardCut;
		if (name == "drop")
			return TruncationPolicy::DropTrailingSegments;
		return std::nullopt;
	}

	std::string_view PolicyName(TruncationPolicy policy) {
		switch (policy) {
			case TruncationPolicy::HardCut: return "hardcut";
			case TruncationPolicy::DropTrailingSegments: return "drop";
		}
		return "???";
	}

	TimelineAssembler::TimelineAssembler(std::chrono::milliseconds timeout)
		: timeout(timeout) {
	}

	TimelinePlan TimelineAssembler::PlanTimeline(const std::vector<double>& durations, double cap, TruncationPolicy policy) {
		TimelinePlan plan;

		for (double d : durations)
			plan.uncapped_total += std::max(0.0, d);

		bool capped = cap > 0.0;
		double start = 0.0;

		for (size_t i = 0; i < durations.size(); i++) {
			double duration = std::max(0.0, durations[i]);

			if (!capped || start + duration <= cap + EPSILON) {
				plan.spans.push_back({ i, start, duration, false });
				start += duration;
				continue;
			}

			plan.truncated = true;

			double remaining = cap - start;
			if (remaining <= EPSILON)
				break;

			// dropping the very first segment would leave nothing, so it gets cut instead
			if (policy == TruncationPolicy::HardCut || plan.spans.empty()) {
				plan.spans.push_back({ i, start, remaining, true });
				start = cap;
			}

			break;
		}

		plan.total = start;
		return plan;
	}

	double TimelineAssembler::SnapToFrames(double seconds, double fps) {
		if (fps <= 0.0)
			return seconds;

		return std::floor(seconds * fps + EPSILON) / fps;
	}

	std::optional<AssemblyResult> TimelineAssembler::Assemble(const std::vector<Segment>& segments, const std::filesystem::path& output, double cap, TruncationPolicy policy) {
		if (segments.empty()) {
			LogError("Nothing to assemble into {}", output.string());
			return std::nullopt;
		}

		std::vector<double> durations;
		for (const auto& seg : segments)
			durations.push_back(seg.duration);

		TimelinePlan plan = PlanTimeline(durations, cap, policy);
		if (plan.truncated)
			LogWarning("Segments add up to {:.2f}s, over the {:.2f}s cap. Output is cut to {:.2f}s ({})", plan.uncapped_total, cap, plan.total, PolicyName(policy));

		double fps = 0.0;
		if (!Concatenate(segments, plan, output, fps)) {
			std::error_code ec;
			std::filesystem::remove(output, ec);
			return std::nullopt;
		}

		AssemblyResult result;
		result.output_path = output;
		result.total_duration = SnapToFrames(plan.total, fps);
		result.truncated = plan.truncated;
		result.segments_kept = plan.spans.size();
		result.segments_total = segments.size();

		LogInfo("Assembled {} of {} segments into {} ({:.2f}s)", result.segments_kept, result.segments_total, output.string(), result.total_duration);
		return result;
	}

	bool TimelineAssembler::Concatenate(const std::vector<Segment>& segments, const TimelinePlan& plan, const std::filesystem::path& output, double& fps) {
		Deadline deadline(timeout);

		std::vector<InputFormatPtr> inputs;
		std::vector<StreamPair> pairs;

		for (const auto& seg : segments) {
			InputFormatPtr in = OpenInput(seg.segment_path, deadline);
			if (!in)
				return false;

			std::optional<StreamPair> pair = FindStreams(in.get());
			if (!pair) {
				LogError("Segment {} doesn't have exactly one video and one audio stream", seg.index);
				return false;
			}

			if (!inputs.empty()) {
				const AVFormatContext* first = inputs.front().get();
				if (!SameLayout(first->streams[pairs.front().video]->codecpar, in->streams[pair->video]->codecpar)
				    || !SameLayout(first->streams[pairs.front().audio]->codecpar, in->streams[pair->audio]->codecpar)) {
					LogError("Segment {} was encoded differently from segment {}, they can't be joined without re-encoding", seg.index, segments.front().index);
					return false;
				}
			}

			inputs.push_back(std::move(in));
			pairs.push_back(*pair);
		}

		AVFormatContext* rawOc = nullptr;
		int ret = avformat_alloc_output_context2(&rawOc, nullptr, nullptr, output.c_str());
		if (ret < 0 || !rawOc) {
			LogError("Couldn't create a muxer for {}: {}", output.string(), AVErrorString(ret));
			return false;
		}
		OutputFormatPtr oc(rawOc);
		oc->interrupt_callback = deadline.AsInterrupt();

		// output stream 0 is video, 1 is audio
		const AVFormatContext* first = inputs.front().get();

		// a cut span only keeps the frames that end by its cut
		const AVStream* firstVideo = first->streams[pairs.front().video];
		AVRational rate = firstVideo->avg_frame_rate.num > 0 ? firstVideo->avg_frame_rate : firstVideo->r_frame_rate;
		fps = rate.num > 0 && rate.den > 0 ? av_q2d(rate) : 0.0;

		AVStream* outStreams[2] = {};
		int inIndex[2] = { pairs.front().video, pairs.front().audio };

		for (int s = 0; s < 2; s++) {
			const AVStream* in = first->streams[inIndex[s]];

			outStreams[s] = avformat_new_stream(oc.get(), nullptr);
			if (!outStreams[s] || avcodec_parameters_copy(outStreams[s]->codecpar, in->codecpar) < 0) {
				LogError("Couldn't set up the output streams of {}", output.string());
				return false;
			}

			outStreams[s]->codecpar->codec_tag = 0;
			outStreams[s]->time_base = in->time_base;
			outStreams[s]->avg_frame_rate = in->avg_frame_rate;
		}

		if (!(oc->oformat->flags & AVFMT_NOFILE)) {
			ret = avio_open2(&oc->pb, output.c_str(), AVIO_FLAG_WRITE, &oc->interrupt_callback, nullptr);
			if (ret < 0) {
				LogError("Couldn't open {} for writing: {}", output.string(), AVErrorString(ret));
				return false;
			}
		}

		ret = avformat_write_header(oc.get(), nullptr);
		if (ret < 0) {
			LogError("Couldn't write the header of {}: {}", output.string(), AVErrorString(ret));
			return false;
		}

		PacketPtr pkt(av_packet_alloc());
		if (!pkt) {
			LogError("Couldn't allocate a packet");
			return false;
		}

		std::int64_t lastDts[2] = { AV_NOPTS_VALUE, AV_NOPTS_VALUE };

		// plan order is segment order, so segment N is always written before N+1
		for (const TimelineSpan& span : plan.spans) {
			AVFormatContext* in = inputs[span.index].get();
			const StreamPair& pair = pairs[span.index];

			while (true) {
				if (deadline.Expired()) {
					LogError("Joining segments ran past the {}ms deadline", timeout.count());
					return false;
				}

				ret = av_read_frame(in, pkt.get());
				if (ret == AVERROR_EOF)
					break;

				if (ret < 0) {
					LogError("Error reading segment {}: {}", segments[span.index].index, AVErrorString(ret));
					return false;
				}

				int s = pkt->stream_index == pair.video ? 0 : pkt->stream_index == pair.audio ? 1 : -1;
				if (s < 0) {
					av_packet_unref(pkt.get());
					continue;
				}

				AVRational inTb = in->streams[pkt->stream_index]->time_base;

				// anything running past the kept part of a cut segment goes
				if (span.partial) {
					std::int64_t ts = pkt->pts != AV_NOPTS_VALUE ? pkt->pts : pkt->dts;
					std::int64_t end = ts + std::max<std::int64_t>(0, pkt->duration);
					if (ts == AV_NOPTS_VALUE || end > SecondsToTimeBase(span.kept, inTb)) {
						av_packet_unref(pkt.get());
						continue;
					}
				}

				av_packet_rescale_ts(pkt.get(), inTb, outStreams[s]->time_base);

				std::int64_t offset = SecondsToTimeBase(span.start, outStreams[s]->time_base);
				if (pkt->pts != AV_NOPTS_VALUE)
					pkt->pts += offset;
				if (pkt->dts != AV_NOPTS_VALUE)
					pkt->dts += offset;

				// encoder priming makes audio from one segment overlap the tail of the last
				if (pkt->dts != AV_NOPTS_VALUE && lastDts[s] != AV_NOPTS_VALUE && pkt->dts <= lastDts[s]) {
					pkt->dts = lastDts[s] + 1;
					if (pkt->pts != AV_NOPTS_VALUE && pkt->pts < pkt->dts)
						pkt->pts = pkt->dts;
				}
				if (pkt->dts != AV_NOPTS_VALUE)
					lastDts[s] = pkt->dts;

				pkt->stream_index = outStreams[s]->index;
				pkt->pos = -1;

				ret = av_interleaved_write_frame(oc.get(), pkt.get());
				if (ret < 0) {
					LogError("Error writing to {}: {}", output.string(), AVErrorString(ret));
					return false;
				}
			}
		}

		ret = av_write_trailer(oc.get());
		if (ret < 0) {
			LogError("Couldn't finish {}: {}", output.string(), AVErrorString(ret));
			return false;
		}

		return true;
	}

} // namespace lessonreel
