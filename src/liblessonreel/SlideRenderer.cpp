// Created by block on 2026-10-17.

#include <liblessonreel/FontProvider.hpp>
#include <liblessonreel/SlideRenderer.hpp>
#include <liblessonreel/TextLayout.hpp>

#include <shared/ImageUtilities.hpp>
#include <shared/Logger.hpp>

#include <SDL3/SDL.h>

#include <algorithm>
#include <cmath>

namespace lessonreel {

	namespace {

		constexpr std::string_view ELLIPSIS = "...";

		// drops code points off the end until line + ellipsis fits
		std::string ShrinkToWidth(std::string line, const Font& font, int max_width) {
			if (font.MeasureWidth(line) <= max_width)
				return line;

			// a marker from an earlier truncation shouldn't get doubled
			if (line.ends_with(ELLIPSIS))
				line.resize(line.size() - ELLIPSIS.size());

			size_t count = CountCodepoints(line);
			while (count > 0) {
				count--;
				std::string candidate = line.substr(0, CodepointOffset(line, count)) + std::string(ELLIPSIS);
				if (font.MeasureWidth(candidate) <= max_width)
					return candidate;
			}

			// not even the marker fits
			return {};
		}

		std::uint8_t Lerp(std::uint8_t a, std::uint8_t b, float t) {
			return static_cast<std::uint8_t>(std::lround(a + (b - a) * t));
		}

	} // namespace

	SlideRenderer::SlideRenderer(const RenderStyle& style, FontProvider& fonts)
		: style(style), fonts(fonts) {
	}

	int SlideRenderer::AvailableWidth(const TextElement& element) const {
		int width = style.ContentWidth();
		if (element.align == TextAlign::Left)
			width = style.width - std::max(0, element.x) - style.margin;

		if (element.wrap_width > 0)
			width = std::min(width, element.wrap_width);

		return std::max(1, width);
	}

	int SlideRenderer::LineAdvance(const TextElement& element) const {
		return std::max(1, static_cast<int>(std::lround(element.size * style.line_spacing)));
	}

	std::vector<std::string> SlideRenderer::LayoutLines(const TextElement& element, const Font& font) const {
		int maxWidth = AvailableWidth(element);
		std::vector<std::string> lines;

		std::string text = NormalizeWhitespace(element.text);
		if (element.truncate_chars > 0)
			text = TruncateText(text, element.truncate_chars, ELLIPSIS);

		if (element.wrap_width > 0) {
			lines = WrapText(text, font, maxWidth);

			if (element.max_lines > 0 && lines.size() > element.max_lines) {
				lines.resize(element.max_lines);
				lines.back() = ShrinkToWidth(lines.back() + std::string(ELLIPSIS), font, maxWidth);
			}
		}
		else {
			// the character budget is a guess, the canvas edge isn't
			lines.push_back(ShrinkToWidth(std::move(text), font, maxWidth));
		}

		std::erase_if(lines, [](const std::string& line) { return line.empty(); });
		return lines;
	}

	bool SlideRenderer::DrawBackground(SDL_Surface* surface) const {
		const Background& bg = style.background;

		if (bg.type == Background::Type::Solid) {
			Uint32 color = SDL_MapSurfaceRGBA(surface, bg.top.r, bg.top.g, bg.top.b, bg.top.a);
			return SDL_FillSurfaceRect(surface, nullptr, color);
		}

		for (int y = 0; y < surface->h; y++) {
			float t = surface->h > 1 ? y / (float)(surface->h - 1) : 0.f;
			Uint32 color = SDL_MapSurfaceRGBA(surface,
			                                  Lerp(bg.top.r, bg.bottom.r, t),
			                                  Lerp(bg.top.g, bg.bottom.g, t),
			                                  Lerp(bg.top.b, bg.bottom.b, t),
			                                  Lerp(bg.top.a, bg.bottom.a, t));

			SDL_Rect row { 0, y, surface->w, 1 };
			if (!SDL_FillSurfaceRect(surface, &row, color))
				return false;
		}

		return true;
	}

	bool SlideRenderer::DrawElement(SDL_Surface* surface, const TextElement& element) {
		std::shared_ptr<Font> font = fonts.Resolve(element.family, element.size);

		int y = element.y;
		for (const auto& line : LayoutLines(element, *font)) {
			int x = std::max(0, element.x);
			if (element.align == TextAlign::Center)
				x = (style.width - font->MeasureWidth(line)) / 2;

			if (!font->Draw(surface, line, x, y, element.color))
				return false;

			y += LineAdvance(element);
		}

		return true;
	}

	SDL_Surface* SlideRenderer::Render(const SlideSpec& spec) {
		SDL_Surface* surface = SDL_CreateSurface(style.width, style.height, SDL_PIXELFORMAT_RGBA32);
		if (!surface) {
			LogError("Couldn't create a {}x{} canvas: {}", style.width, style.height, SDL_GetError());
			return nullptr;
		}

		if (!DrawBackground(surface)) {
			LogError("Couldn't draw the background of slide {}: {}", spec.name, SDL_GetError());
			SDL_DestroySurface(surface);
			return nullptr;
		}

		for (const auto& element : spec.elements) {
			if (!DrawElement(surface, element)) {
				LogError("Couldn't draw \"{}\" on slide {}", element.text, spec.name);
				SDL_DestroySurface(surface);
				return nullptr;
			}
		}

		return surface;
	}

	bool SlideRenderer::RenderToFile(const SlideSpec& spec, const std::filesystem::path& outputPath) {
		SDL_Surface* surface = Render(spec);
		if (!surface)
			return false;

		bool saved = SaveImage(surface, outputPath);
		SDL_DestroySurface(surface);

		if (saved)
			LogDebug("Rendered slide {} to {}", spec.name, outputPath.string());

		return saved;
	}

} // namespace lessonreel
