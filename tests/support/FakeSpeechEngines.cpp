// Created by block on 2026-10-17.

#include <support/FakeSpeechEngines.hpp>

#include <cmath>
#include <numbers>
#include <stdexcept>

namespace lessonreel::test {

	std::optional<SpeechAudio> FailingSpeechEngine::Synthesize(std::string_view, Clock::time_point) {
		calls++;
		return std::nullopt;
	}

	std::optional<SpeechAudio> ThrowingSpeechEngine::Synthesize(std::string_view, Clock::time_point) {
		throw std::runtime_error("voice service went away");
	}

	std::optional<SpeechAudio> EmptySpeechEngine::Synthesize(std::string_view, Clock::time_point) {
		return SpeechAudio { {}, 22050 };
	}

	ToneSpeechEngine::ToneSpeechEngine(double seconds, int sample_rate)
		: seconds(seconds), sample_rate(sample_rate) {
	}

	std::optional<SpeechAudio> ToneSpeechEngine::Synthesize(std::string_view text, Clock::time_point deadline) {
		texts.emplace_back(text);
		deadlines.push_back(deadline);

		SpeechAudio audio;
		audio.sample_rate = sample_rate;
		audio.samples.resize(static_cast<size_t>(std::llround(seconds * sample_rate)));
		for (size_t i = 0; i < audio.samples.size(); i++)
			audio.samples[i] = 0.3f * static_cast<float>(std::sin(2.0 * std::numbers::pi * 440.0 * i / sample_rate));

		return audio;
	}

} // namespace lessonreel::test
