// Created by block on 2026-10-17.

#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>

namespace lessonreel {

	class ArtifactRegistry;
	class SpeechEngine;

	/// Writes narration for a slide to a WAV artifact.
	/// Narration is optional: every failure is logged and comes back as no audio, never as an error.
	class NarrationSynthesizer {
	public:
		/// engine may be null, which means narration is disabled.
		NarrationSynthesizer(SpeechEngine* engine, std::chrono::milliseconds timeout, ArtifactRegistry& registry);

		/// Returns the path of the registered WAV, or nullopt when there is nothing to play.
		std::optional<std::filesystem::path> Synthesize(std::string_view text, std::string_view name);

		bool IsEnabled() const { return engine != nullptr; }
		size_t GetFailureCount() const { return failures; }

	private:
		std::optional<std::filesystem::path> SynthesizeImpl(std::string_view text, std::string_view name);

		SpeechEngine* engine;
		std::chrono::milliseconds timeout;
		ArtifactRegistry& registry;
		size_t failures = 0;
	};

} // namespace lessonreel
