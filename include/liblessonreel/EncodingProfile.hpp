// Created by block on 2026-10-17.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace lessonreel {

	/// Format shared by every segment of a run. Segments can only be joined without re-encoding if this never changes mid-run.
	struct EncodingProfile {
		int width = 1080;
		int height = 1920;
		int fps = 30;

		// encoders by name, tried in order. Any H.264 encoder and then MPEG-4 part 2 follow.
		std::vector<std::string> video_encoders { "libx264" };
		int crf = 23; // libx264 only
		std::int64_t video_bit_rate = 4'000'000; // everything else
		int gop = 60;

		int sample_rate = 44100;
		int channels = 1;
		std::int64_t audio_bit_rate = 192'000;

		std::chrono::milliseconds media_timeout { 120'000 };

		// yuv420p needs even dimensions
		bool IsValid() const {
			return width > 0 && height > 0 && width % 2 == 0 && height % 2 == 0 && fps > 0 && sample_rate > 0 && channels > 0;
		}
	};

} // namespace lessonreel
