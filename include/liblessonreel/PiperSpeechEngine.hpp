// Created by block on 2026-10-17.

#pragma once

#include <liblessonreel/SpeechEngine.hpp>

#include <filesystem>

typedef struct piper_synthesizer piper_synthesizer;

namespace lessonreel {

	/// The narrator's voice.
	struct VoiceConfig {
		std::filesystem::path model_path = "voices/en_US-ryan-high.onnx";
		// defaults to model_path + ".json"
		std::filesystem::path model_config_path {};
		std::filesystem::path espeak_data_path = "/usr/share/espeak-ng-data";
		int speaker_id = 0;
		float length_scale = 1.0f;
	};

	/// Local neural TTS through the piper C library.
	class PiperSpeechEngine : public SpeechEngine {
	public:
		explicit PiperSpeechEngine(VoiceConfig voice);
		~PiperSpeechEngine() override;

		PiperSpeechEngine(const PiperSpeechEngine&) = delete;
		PiperSpeechEngine& operator=(const PiperSpeechEngine&) = delete;

		std::optional<SpeechAudio> Synthesize(std::string_view text, Clock::time_point deadline) override;
		std::string GetName() const override;

		const VoiceConfig& GetVoice() const { return voice; }

	private:
		// the model is only loaded once something needs saying
		bool Initialize();

		VoiceConfig voice;
		piper_synthesizer* synth = nullptr;
		bool init_failed = false;
	};

} // namespace lessonreel
