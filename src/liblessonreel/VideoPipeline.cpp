// Created by block on 2026-10-17.

#include <liblessonreel/ArtifactRegistry.hpp>
#include <liblessonreel/FontProvider.hpp>
#include <liblessonreel/NarrationSynthesizer.hpp>
#include <liblessonreel/SegmentEncoder.hpp>
#include <liblessonreel/SlideRenderer.hpp>
#include <liblessonreel/SpeechEngine.hpp>
#include <liblessonreel/VideoPipeline.hpp>

#include <shared/Logger.hpp>

#include <format>
#include <vector>

namespace lessonreel {

	namespace {

		bool IsAsciiAlnum(char c) {
			return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
		}

	} // namespace

	VideoPipeline::VideoPipeline(PipelineConfig config, SpeechEngine* engine)
		: config(std::move(config)), engine(engine) {
	}

	std::string VideoPipeline::SanitizeName(std::string_view name, size_t max_length) {
		std::string safe;
		for (char c : name) {
			if (IsAsciiAlnum(c) || c == ' ' || c == '-' || c == '_')
				safe += c;
		}

		size_t first = safe.find_first_not_of(' ');
		if (first == std::string::npos)
			return "untitled";

		size_t last = safe.find_last_not_of(' ');
		safe = safe.substr(first, last - first + 1);

		if (safe.size() > max_length)
			safe.resize(max_length);

		return safe;
	}

	std::filesystem::path VideoPipeline::MakeOutputPath(std::string_view topic, std::string_view subtopic) const {
		return config.output_dir / std::format("{}_{}.mp4", SanitizeName(topic), SanitizeName(subtopic));
	}

	std::optional<PipelineResult> VideoPipeline::Run(const LessonContent& lesson, std::string_view topic, std::string_view subtopic) {
		if (!lesson.Validate()) {
			LogError("Lesson for {} / {} is invalid, not making a video", topic, subtopic);
			return std::nullopt;
		}

		std::filesystem::path output = MakeOutputPath(topic, subtopic);

		std::error_code ec;
		std::filesystem::create_directories(config.output_dir, ec);
		if (ec) {
			LogError("Couldn't create output directory {}: {}", config.output_dir.string(), ec.message());
			return std::nullopt;
		}

		// released on every way out of this function
		ArtifactRegistry registry(config.temp_root);
		registry.SetKeepAll(config.keep_temp);
		if (!registry.Create())
			return std::nullopt;

		FontProvider fonts(config.style.font_files);
		SlideRenderer renderer(config.style, fonts);
		SlideTemplate slideTemplate(config.variant, config.style);
		NarrationSynthesizer narrator(config.narration ? engine : nullptr, config.narration_timeout, registry);
		SegmentEncoder encoder(config.profile, registry);

		if (!encoder.Prepare())
			return std::nullopt;

		std::vector<SlideSpec> slides = slideTemplate.Build(lesson, topic, subtopic);
		LogInfo("Making {} ({} slides, {} layout)", output.string(), slides.size(), VariantName(config.variant));

		PipelineResult result;
		result.slide_count = slides.size();

		std::vector<Segment> segments;
		for (size_t i = 0; i < slides.size(); i++) {
			const SlideSpec& slide = slides[i];
			std::string name = std::format("slide_{:02}_{}", i, slide.name);

			std::filesystem::path image = registry.MakePath(name + ".png");
			registry.Register(image);
			if (!renderer.RenderToFile(slide, image)) {
				LogError("Couldn't render slide {}", name);
				return std::nullopt;
			}

			std::optional<std::filesystem::path> audio = narrator.Synthesize(slide.narration, name);
			if (audio)
				result.narrated_count++;

			SegmentTiming timing { slide.default_duration, config.trailing_buffer };
			std::optional<Segment> segment = encoder.Encode(i, image, audio, timing);
			if (!segment)
				return std::nullopt;

			LogInfo("Slide {}/{} ({}) done, {:.2f}s", i + 1, slides.size(), slide.name, segment->duration);
			segments.push_back(std::move(*segment));
		}

		TimelineAssembler assembler(config.profile.media_timeout);
		std::optional<AssemblyResult> assembly = assembler.Assemble(segments, output, config.duration_cap, config.truncation);
		if (!assembly)
			return std::nullopt;

		if (narrator.GetFailureCount() > 0)
			LogWarning("{} slides are silent because narration failed", narrator.GetFailureCount());

		result.output_path = assembly->output_path;
		result.assembly = std::move(*assembly);
		return result;
	}

} // namespace lessonreel
