// Created by block on 2026-10-17.

#pragma once

#include <liblessonreel/SlideSpec.hpp>

#include <SDL3/SDL_surface.h>

#include <filesystem>
#include <string>
#include <vector>

namespace lessonreel {

	class Font;
	class FontProvider;

	/// Draws SlideSpecs onto a canvas of the style's exact dimensions.
	class SlideRenderer {
	public:
		SlideRenderer(const RenderStyle& style, FontProvider& fonts);

		/// Renders into a new RGBA32 surface, owned by the caller. Returns nullptr on failure.
		SDL_Surface* Render(const SlideSpec& spec);
		bool RenderToFile(const SlideSpec& spec, const std::filesystem::path& outputPath);

		/// The lines an element is drawn as, after wrapping and truncation. None are wider than the space available to the element.
		std::vector<std::string> LayoutLines(const TextElement& element, const Font& font) const;

		/// Horizontal space an element may use, in pixels.
		int AvailableWidth(const TextElement& element) const;
		int LineAdvance(const TextElement& element) const;

		const RenderStyle& GetStyle() const { return style; }

	private:
		bool DrawBackground(SDL_Surface* surface) const;
		bool DrawElement(SDL_Surface* surface, const TextElement& element);

		RenderStyle style;
		FontProvider& fonts;
	};

} // namespace lessonreel
