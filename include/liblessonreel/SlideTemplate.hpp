// Created by block on 2026-10-17.

#pragma once

#include <liblessonreel/LessonContent.hpp>
#include <liblessonreel/SlideSpec.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace lessonreel {

	enum class TemplateVariant {
		Shorts, // hook, case, diagnosis, think pause, answer, call to action
		Compact // case, questions, think pause, answers
	};

	std::optional<TemplateVariant> VariantFromName(std::string_view name);
	std::string_view VariantName(TemplateVariant variant);

	/// Turns a lesson into the fixed deck of slides for a variant.
	/// Positions and sizes are laid out for a 1080x1920 canvas and scaled to the style's canvas.
	class SlideTemplate {
	public:
		static constexpr int DESIGN_WIDTH = 1080;
		static constexpr int DESIGN_HEIGHT = 1920;

		SlideTemplate(TemplateVariant variant, const RenderStyle& style);

		/// Always the size of Build's result, whatever the lesson holds.
		static size_t SlideCount(TemplateVariant variant);
		/// The colors and background each variant was designed with.
		static RenderStyle DefaultStyle(TemplateVariant variant);
		/// DefaultStyle on a width x height canvas, with the margin scaled along.
		static RenderStyle DefaultStyle(TemplateVariant variant, int width, int height);

		std::vector<SlideSpec> Build(const LessonContent& lesson, std::string_view topic, std::string_view subtopic) const;

		TemplateVariant GetVariant() const { return variant; }

	private:
		std::vector<SlideSpec> BuildShorts(const LessonContent& lesson) const;
		std::vector<SlideSpec> BuildCompact(const LessonContent& lesson, std::string_view topic, std::string_view subtopic) const;

		TextElement Centered(std::string text, int size, Color color, int y) const;
		TextElement Wrapped(std::string text, int size, Color color, int y, int bottom = DESIGN_HEIGHT) const;
		TextElement LeftAligned(std::string text, int size, Color color, int x, int y) const;
		/// An option line cut to the style's character budget. Wraps onto up to max_lines lines, or stays on one line if 0.
		TextElement Option(const Question& question, size_t index, int size, Color color, int y, size_t max_lines) const;

		int ScaleX(int x) const;
		int ScaleY(int y) const;
		int ScaleSize(int size) const;

		TemplateVariant variant;
		RenderStyle style;
	};

} // namespace lessonreel
