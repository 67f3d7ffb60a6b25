// Created by block on 2026-10-17.

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lessonreel {

	/// Mono float PCM.
	struct SpeechAudio {
		std::vector<float> samples {};
		int sample_rate = 0;

		double GetDuration() const { return sample_rate > 0 ? samples.size() / (double)sample_rate : 0.0; }
	};

	/// Turns text into speech with a voice fixed at construction.
	class SpeechEngine {
	public:
		using Clock = std::chrono::steady_clock;

		virtual ~SpeechEngine() = default;

		/// Returns nullopt on failure, including running past deadline.
		virtual std::optional<SpeechAudio> Synthesize(std::string_view text, Clock::time_point deadline) = 0;
		virtual std::string GetName() const = 0;
	};

} // namespace lessonreel
