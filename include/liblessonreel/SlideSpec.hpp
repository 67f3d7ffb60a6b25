// Created by block on 2026-10-17.

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace lessonreel {

	struct Color {
		std::uint8_t r, g, b;
		std::uint8_t a = 255;

		bool operator==(const Color&) const = default;
	};

	struct Background {
		enum class Type {
			Solid,
			VerticalRamp
		};

		Type type = Type::Solid;
		Color top {};
		Color bottom {};

		static Background Solid(Color color) { return { Type::Solid, color, color }; }
		static Background Ramp(Color top, Color bottom) { return { Type::VerticalRamp, top, bottom }; }
	};

	enum class TextAlign {
		Left,
		Center
	};

	/// Font family names understood by FontProvider.
	inline constexpr const char* FONT_REGULAR = "regular";
	inline constexpr const char* FONT_BOLD = "bold";

	struct TextElement {
		std::string text {};
		int size = 48;
		Color color { 255, 255, 255 };
		int y = 0;
		TextAlign align = TextAlign::Center;
		int x = 0; // left edge, only used with TextAlign::Left
		int wrap_width = 0; // in pixels, 0 to not wrap
		size_t max_lines = 0; // with wrapping, 0 for no limit
		size_t truncate_chars = 0; // code points, applied before wrapping, 0 for no limit
		std::string family = FONT_REGULAR;
	};

	/// One visual + narration unit of the video.
	struct SlideSpec {
		std::string name {};
		std::vector<TextElement> elements {};
		std::string narration {};
		double default_duration = 5.0; // seconds, used when there's no narration

		bool HasNarration() const { return !narration.empty(); }
	};

	/// Everything about how slides look. Passed to the renderer and template at construction.
	struct RenderStyle {
		int width = 1080;
		int height = 1920;
		Background background = Background::Ramp({ 15, 23, 42 }, { 2, 6, 23 });

		Color text { 255, 255, 255 };
		Color accent_case { 255, 165, 0 };
		Color accent_question { 0, 255, 255 };
		Color accent_answer { 0, 255, 0 };

		float line_spacing = 1.4f; // line advance as a multiple of the font size
		int margin = 80; // horizontal, each side
		size_t option_char_budget = 35;

		// family -> font files to try first, in order
		std::map<std::string, std::vector<std::filesystem::path>> font_files {};

		int ContentWidth() const { return width - margin * 2; }
	};

} // namespace lessonreel
