// Created by block on 2026-10-17.

#pragma once

#include <liblessonreel/EncodingProfile.hpp>

#include <filesystem>
#include <optional>

struct AVCodec;

namespace lessonreel {

	class ArtifactRegistry;

	struct SegmentTiming {
		double default_duration = 5.0; // seconds, for slides without narration
		double trailing_buffer = 1.0; // seconds added after narration so the last word isn't clipped
	};

	/// One encoded slide. Always holds exactly one video and one audio stream.
	struct Segment {
		size_t index = 0;
		std::filesystem::path image_path {};
		std::filesystem::path audio_path {};
		std::filesystem::path segment_path {};
		double duration = 0.0; // seconds, a whole number of frames
		bool narrated = false;
	};

	/// Loops a still image over an audio track (narration or generated silence) into a segment of the run's EncodingProfile.
	class SegmentEncoder {
	public:
		SegmentEncoder(const EncodingProfile& profile, ArtifactRegistry& registry);
		virtual ~SegmentEncoder() = default;

		/// measured + trailing buffer if there's a measured duration, the default otherwise. Rounded up to whole frames.
		static double ResolveDuration(std::optional<double> measured, const SegmentTiming& timing, int fps);

		/// Picks the encoders for the run. Encode calls this if it hasn't happened yet.
		bool Prepare();

		/// Encodes a segment into the run directory. Any failure here is fatal to the run.
		std::optional<Segment> Encode(size_t index, const std::filesystem::path& image, const std::optional<std::filesystem::path>& audio, const SegmentTiming& timing);

		const AVCodec* GetVideoCodec() const { return video_codec; }
		const EncodingProfile& GetProfile() const { return profile; }

	protected:
		/// Length of a narration track in seconds, nullopt if it can't be told.
		virtual std::optional<double> NarrationDuration(const std::filesystem::path& audio);

	private:
		std::optional<std::filesystem::path> WriteSilence(size_t index, double seconds);
		bool EncodeFile(const std::filesystem::path& image, const std::filesystem::path& audio, double duration, const std::filesystem::path& output);

		EncodingProfile profile;
		ArtifactRegistry& registry;

		const AVCodec* video_codec = nullptr;
		const AVCodec* audio_codec = nullptr;
	};

} // namespace lessonreel
