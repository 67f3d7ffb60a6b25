// Created by block on 2026-10-17.

#include <liblessonreel/ArtifactRegistry.hpp>
#include <liblessonreel/NarrationSynthesizer.hpp>
#include <liblessonreel/SpeechEngine.hpp>

#include <shared/ExportUtilities.hpp>
#include <shared/Logger.hpp>

#include <exception>
#include <format>

namespace lessonreel {

	NarrationSynthesizer::NarrationSynthesizer(SpeechEngine* engine, std::chrono::milliseconds timeout, ArtifactRegistry& registry)
		: engine(engine), timeout(timeout), registry(registry) {
	}

	std::optional<std::filesystem::path> NarrationSynthesizer::Synthesize(std::string_view text, std::string_view name) {
		if (text.empty() || !engine)
			return std::nullopt;

		std::optional<std::filesystem::path> path;
		try {
			path = SynthesizeImpl(text, name);
		}
		catch (const std::exception& ex) {
			LogError("Narration for {} threw: {}", name, ex.what());
			path = std::nullopt;
		}

		if (!path) {
			failures++;
			LogWarning("No narration for {}, it will be silent", name);
		}

		return path;
	}

	std::optional<std::filesystem::path> NarrationSynthesizer::SynthesizeImpl(std::string_view text, std::string_view name) {
		auto started = SpeechEngine::Clock::now();

		std::optional<SpeechAudio> audio = engine->Synthesize(text, started + timeout);
		if (!audio) {
			LogError("{} couldn't synthesize narration for {}", engine->GetName(), name);
			return std::nullopt;
		}

		if (audio->samples.empty() || audio->sample_rate <= 0) {
			LogError("{} produced no audio for {}", engine->GetName(), name);
			return std::nullopt;
		}

		std::filesystem::path path = registry.MakePath(std::format("{}_narration.wav", name));
		// registered before writing so a half written file still gets cleaned up
		registry.Register(path);

		if (!SamplesToWAV(audio->samples, audio->sample_rate, path)) {
			LogError("Couldn't write narration for {} to {}", name, path.string());
			return std::nullopt;
		}

		auto took = std::chrono::duration_cast<std::chrono::milliseconds>(SpeechEngine::Clock::now() - started);
		LogDebug("Narrated {} ({:.2f}s of audio in {}ms)", name, audio->GetDuration(), took.count());
		return path;
	}

} // namespace lessonreel
