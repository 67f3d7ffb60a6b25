// Created by block on 2026-10-17.

#pragma once

#include <liblessonreel/SlideSpec.hpp>

#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

namespace lessonreel::test {

	struct MediaInfo {
		int video_streams = 0;
		int audio_streams = 0;
		int width = 0;
		int height = 0;
		int sample_rate = 0;
		double duration = 0.0; // container, seconds
	};

	std::optional<MediaInfo> InspectMedia(const std::filesystem::path& path);

	/// (timestamp in seconds, mean luma) of every decoded video frame, in presentation order.
	std::vector<std::pair<double, double>> DecodeLuma(const std::filesystem::path& path);

	/// Largest absolute sample value of the first audio stream.
	std::optional<float> AudioPeak(const std::filesystem::path& path);

	bool WriteSolidImage(const std::filesystem::path& path, int width, int height, Color color);

} // namespace lessonreel::test
