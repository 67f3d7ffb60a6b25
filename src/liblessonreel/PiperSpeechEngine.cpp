// Created by block on 2026-10-17.

#include <liblessonreel/PiperSpeechEngine.hpp>

#include <shared/Logger.hpp>

#include <format>

extern "C" {
#include <piper.h>
}

namespace lessonreel {

	PiperSpeechEngine::PiperSpeechEngine(VoiceConfig voice)
		: voice(std::move(voice)) {
	}

	PiperSpeechEngine::~PiperSpeechEngine() {
		if (synth)
			piper_free(synth);
	}

	std::string PiperSpeechEngine::GetName() const {
		return std::format("piper ({})", voice.model_path.filename().string());
	}

	bool PiperSpeechEngine::Initialize() {
		if (synth)
			return true;

		// no point retrying a model that didn't load, every slide would log the same thing
		if (init_failed)
			return false;

		std::filesystem::path configPath = voice.model_config_path;
		if (configPath.empty())
			configPath = voice.model_path.string() + ".json";

		synth = piper_create(voice.model_path.c_str(), configPath.c_str(), voice.espeak_data_path.c_str());
		if (!synth) {
			LogError("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
			         voice.model_path.string(), configPath.string(), voice.espeak_data_path.string());
			init_failed = true;
			return false;
		}

		LogInfo("Narration voice loaded from {}", voice.model_path.string());
		return true;
	}

	std::optional<SpeechAudio> PiperSpeechEngine::Synthesize(std::string_view text, Clock::time_point deadline) {
		if (!Initialize())
			return std::nullopt;

		std::string str(text);

		piper_synthesize_options opts = piper_default_synthesize_options(synth);
		opts.speaker_id = voice.speaker_id;
		opts.length_scale = voice.length_scale;

		int startResult = piper_synthesize_start(synth, str.c_str(), &opts);
		if (startResult != PIPER_OK) {
			LogError("piper_synthesize_start failed ({})", startResult);
			return std::nullopt;
		}

		SpeechAudio audio;
		piper_audio_chunk chunk {};

		while (true) {
			int rc = piper_synthesize_next(synth, &chunk);
			if (rc == PIPER_DONE)
				break;

			if (rc < 0) {
				LogError("piper_synthesize_next failed ({})", rc);
				return std::nullopt;
			}

			audio.sample_rate = chunk.sample_rate;
			audio.samples.insert(audio.samples.end(), chunk.samples, chunk.samples + chunk.num_samples);

			// piper synthesizes a sentence per chunk, so this is as fine as the deadline gets
			if (Clock::now() > deadline) {
				LogError("Speech synthesis ran past its deadline after {:.2f}s of audio", audio.GetDuration());
				return std::nullopt;
			}

			if (chunk.is_last)
				break;
		}

		return audio;
	}

} // namespace lessonreel
