// Created by block on 2026-10-17.

#pragma once

#include <liblessonreel/EncodingProfile.hpp>
#include <liblessonreel/LessonContent.hpp>
#include <liblessonreel/SlideSpec.hpp>
#include <liblessonreel/SlideTemplate.hpp>
#include <liblessonreel/TimelineAssembler.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lessonreel {

	class SpeechEngine;

	struct PipelineConfig {
		TemplateVariant variant = TemplateVariant::Shorts;
		RenderStyle style = SlideTemplate::DefaultStyle(TemplateVariant::Shorts);
		EncodingProfile profile {};

		bool narration = true;
		std::chrono::milliseconds narration_timeout { 30'000 };
		double trailing_buffer = 1.0;

		double duration_cap = 59.0;
		TruncationPolicy truncation = TruncationPolicy::HardCut;

		std::filesystem::path output_dir = "videos";
		std::filesystem::path temp_root {}; // system temp directory if empty
		bool keep_temp = false;
	};

	struct PipelineResult {
		std::filesystem::path output_path {};
		AssemblyResult assembly {};
		size_t slide_count = 0;
		size_t narrated_count = 0;
	};

	/// One lesson in, one video file out. Slides are rendered, narrated and encoded one at a time, in order.
	class VideoPipeline {
	public:
		/// engine may be null, in which case every slide gets a silent track.
		explicit VideoPipeline(PipelineConfig config, SpeechEngine* engine = nullptr);

		std::optional<PipelineResult> Run(const LessonContent& lesson, std::string_view topic, std::string_view subtopic);

		/// Keeps letters, digits, space, '-' and '_', trims, then cuts to max_length. Empty names become "untitled".
		static std::string SanitizeName(std::string_view name, size_t max_length = 30);
		std::filesystem::path MakeOutputPath(std::string_view topic, std::string_view subtopic) const;

		const PipelineConfig& GetConfig() const { return config; }

	private:
		PipelineConfig config;
		SpeechEngine* engine;
	};

} // namespace lessonreel
