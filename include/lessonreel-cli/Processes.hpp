// Created by block on 2026-10-17.

#pragma once

#include <liblessonreel/LessonContent.hpp>
#include <liblessonreel/VideoPipeline.hpp>

#include <optional>

namespace lessonreel::cli {

	class Processes {
	public:
		static Processes& The();

		int ProcessRender();
		int ProcessValidate();
		int ProcessPreview();

	private:
		std::optional<LessonContent> LoadLesson();
		std::optional<PipelineConfig> BuildConfig();
	};

} // namespace lessonreel::cli
