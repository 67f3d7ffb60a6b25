// Created by block on 2026-10-17.

#pragma once

#include <filesystem>
#include <string>

namespace lessonreel::cli {

	enum class LessonreelMode {
		Render,
		Validate,
		Preview,
		Invalid
	};

	struct OptionVariables {
		std::filesystem::path inputPath {};
		std::filesystem::path outputPath {};
		std::string templateName = "shorts";
		std::string topic = "Lesson";
		std::string subtopic = "Preview";
		bool verbose = false;

		LessonreelMode lessonreel_mode = LessonreelMode::Invalid;

		struct RenderOptions {
			std::filesystem::path voice_model = "voices/en_US-ryan-high.onnx";
			std::filesystem::path espeak_data = "/usr/share/espeak-ng-data";
			int speaker = 0;
			bool no_narration = false;

			std::filesystem::path font {};
			std::filesystem::path bold_font {};

			double cap = 59.0;
			std::string truncate = "hardcut";

			int fps = 30;
			int width = 1080;
			int height = 1920;

			int narration_timeout = 30; // seconds
			int media_timeout = 120; // seconds

			std::filesystem::path temp_root {};
			bool keep_temp = false;
		} render;
	};

	class Options {
	public:
		static OptionVariables options;

		static int ParseArgs(int argc, char** argv);
		static void PrintArgs();
	};

} // namespace lessonreel::cli
