// Created by block on 2026-10-17.

#include <lessonreel-cli/Options.hpp>
#include <lessonreel-cli/Processes.hpp>

#include <liblessonreel/FontProvider.hpp>
#include <liblessonreel/PiperSpeechEngine.hpp>
#include <liblessonreel/SlideRenderer.hpp>
#include <liblessonreel/SlideTemplate.hpp>

#include <shared/Logger.hpp>

#include <format>
#include <memory>

namespace lessonreel::cli {

	Processes& Processes::The() {
		static Processes the;
		return the;
	}

	std::optional<LessonContent> Processes::LoadLesson() {
		std::optional<LessonContent> lesson = LessonContent::LoadFile(Options::options.inputPath);
		if (!lesson)
			LogError("{} isn't a usable lesson", Options::options.inputPath.string());

		return lesson;
	}

	std::optional<PipelineConfig> Processes::BuildConfig() {
		const OptionVariables& opts = Options::options;

		std::optional<TemplateVariant> variant = VariantFromName(opts.templateName);
		if (!variant) {
			LogError("Unknown template \"{}\", expected shorts or compact", opts.templateName);
			return std::nullopt;
		}

		std::optional<TruncationPolicy> truncation = PolicyFromName(opts.render.truncate);
		if (!truncation) {
			LogError("Unknown truncation \"{}\", expected hardcut or drop", opts.render.truncate);
			return std::nullopt;
		}

		PipelineConfig config;
		config.variant = *variant;
		config.style = SlideTemplate::DefaultStyle(*variant, opts.render.width, opts.render.height);

		if (!opts.render.font.empty())
			config.style.font_files[FONT_REGULAR].push_back(opts.render.font);
		if (!opts.render.bold_font.empty())
			config.style.font_files[FONT_BOLD].push_back(opts.render.bold_font);

		config.profile.width = opts.render.width;
		config.profile.height = opts.render.height;
		config.profile.fps = opts.render.fps;
		config.profile.media_timeout = std::chrono::seconds(opts.render.media_timeout);

		if (!config.profile.IsValid()) {
			LogError("Can't encode {}x{} @ {}fps, width and height must be even and positive", opts.render.width, opts.render.height, opts.render.fps);
			return std::nullopt;
		}

		config.narration = !opts.render.no_narration;
		config.narration_timeout = std::chrono::seconds(opts.render.narration_timeout);
		config.duration_cap = opts.render.cap;
		config.truncation = *truncation;
		config.output_dir = opts.outputPath;
		config.temp_root = opts.render.temp_root;
		config.keep_temp = opts.render.keep_temp;

		return config;
	}

	int Processes::ProcessRender() {
		std::optional<LessonContent> lesson = LoadLesson();
		if (!lesson)
			return EXIT_FAILURE;

		std::optional<PipelineConfig> config = BuildConfig();
		if (!config)
			return EXIT_FAILURE;

		std::unique_ptr<PiperSpeechEngine> engine;
		if (config->narration) {
			VoiceConfig voice;
			voice.model_path = Options::options.render.voice_model;
			voice.espeak_data_path = Options::options.render.espeak_data;
			voice.speaker_id = Options::options.render.speaker;
			engine = std::make_unique<PiperSpeechEngine>(voice);
		}

		VideoPipeline pipeline(*config, engine.get());
		std::optional<PipelineResult> result = pipeline.Run(*lesson, Options::options.topic, Options::options.subtopic);
		if (!result) {
			LogError("No video was made");
			return EXIT_FAILURE;
		}

		LogInfo("Video: {} ({:.2f}s, {} of {} slides narrated{})",
		        result->output_path.string(), result->assembly.total_duration,
		        result->narrated_count, result->slide_count,
		        result->assembly.truncated ? ", cut at the cap" : "");

		return EXIT_SUCCESS;
	}

	int Processes::ProcessValidate() {
		std::optional<LessonContent> lesson = LoadLesson();
		if (!lesson)
			return EXIT_FAILURE;

		LogInfo("{} is valid: {} case questions, {} independent questions, {} answers",
		        Options::options.inputPath.string(), lesson->case_questions.size(),
		        lesson->independent_questions.size(), lesson->answers.size());

		return EXIT_SUCCESS;
	}

	int Processes::ProcessPreview() {
		std::optional<LessonContent> lesson = LoadLesson();
		if (!lesson)
			return EXIT_FAILURE;

		std::optional<TemplateVariant> variant = VariantFromName(Options::options.templateName);
		if (!variant) {
			LogError("Unknown template \"{}\", expected shorts or compact", Options::options.templateName);
			return EXIT_FAILURE;
		}

		RenderStyle style = SlideTemplate::DefaultStyle(*variant, Options::options.render.width, Options::options.render.height);
		if (!Options::options.render.font.empty())
			style.font_files[FONT_REGULAR].push_back(Options::options.render.font);
		if (!Options::options.render.bold_font.empty())
			style.font_files[FONT_BOLD].push_back(Options::options.render.bold_font);

		const std::filesystem::path& outputDir = Options::options.outputPath;
		std::error_code ec;
		std::filesystem::create_directories(outputDir, ec);
		if (ec) {
			LogError("Couldn't create {}: {}", outputDir.string(), ec.message());
			return EXIT_FAILURE;
		}

		FontProvider fonts(style.font_files);
		SlideRenderer renderer(style, fonts);
		SlideTemplate slideTemplate(*variant, style);

		std::vector<SlideSpec> slides = slideTemplate.Build(*lesson, Options::options.topic, Options::options.subtopic);
		for (size_t i = 0; i < slides.size(); i++) {
			std::filesystem::path path = outputDir / std::format("slide_{:02}_{}.png", i, slides[i].name);
			if (!renderer.RenderToFile(slides[i], path))
				return EXIT_FAILURE;

			LogInfo("Saved {}", path.string());
		}

		return EXIT_SUCCESS;
	}

} // namespace lessonreel::cli
