// Created by block on 2026-10-17.

#include <liblessonreel/FontProvider.hpp>
#include <liblessonreel/TextLayout.hpp>

#include <shared/Logger.hpp>

#include <SDL3/SDL.h>
#include <SDL3_ttf/SDL_ttf.h>

#include <algorithm>
#include <cmath>

namespace lessonreel {

	std::shared_ptr<TrueTypeFont> TrueTypeFont::Open(const std::filesystem::path& path, int size) {
		TTF_Font* font = TTF_OpenFont(path.c_str(), static_cast<float>(size));
		if (!font)
			return nullptr;

		return std::make_shared<TrueTypeFont>(font, path, size);
	}

	TrueTypeFont::TrueTypeFont(TTF_Font* font, std::filesystem::path path, int size)
		: Font(size), font(font), path(std::move(path)) {
	}

	TrueTypeFont::~TrueTypeFont() {
		if (font)
			TTF_CloseFont(font);
	}

	int TrueTypeFont::MeasureWidth(std::string_view text) const {
		if (text.empty())
			return 0;

		int w = 0, h = 0;
		if (!TTF_GetStringSize(font, text.data(), text.size(), &w, &h)) {
			LogWarning("Couldn't measure text with {}: {}", path.string(), SDL_GetError());
			return 0;
		}

		return w;
	}

	int TrueTypeFont::GetLineHeight() const {
		return TTF_GetFontLineSkip(font);
	}

	bool TrueTypeFont::Draw(SDL_Surface* target, std::string_view text, int x, int y, Color color) const {
		if (text.empty())
			return true;

		SDL_Surface* surfText = TTF_RenderText_Blended(font, text.data(), text.size(), SDL_Color { color.r, color.g, color.b, color.a });
		if (!surfText) {
			LogError("Couldn't render text \"{}\": {}", text, SDL_GetError());
			return false;
		}

		SDL_Rect dst { x, y, surfText->w, surfText->h };
		bool blitted = SDL_BlitSurface(surfText, nullptr, target, &dst);
		SDL_DestroySurface(surfText);

		if (!blitted)
			LogError("Couldn't blit text \"{}\": {}", text, SDL_GetError());

		return blitted;
	}

	BuiltinFont::BuiltinFont(int size)
		: Font(size), scale(std::max(1, size) / (float)SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE) {
	}

	int BuiltinFont::MeasureWidth(std::string_view text) const {
		return static_cast<int>(std::ceil(CountCodepoints(text) * SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE * scale));
	}

	int BuiltinFont::GetLineHeight() const {
		return static_cast<int>(std::ceil(SDL_DEBUG_TEXT_FONT_CHARACTER_SIZE * scale));
	}

	bool BuiltinFont::Draw(SDL_Surface* target, std::string_view text, int x, int y, Color color) const {
		if (text.empty())
			return true;

		SDL_Renderer* renderer = SDL_CreateSoftwareRenderer(target);
		if (!renderer) {
			LogError("Couldn't create a software renderer: {}", SDL_GetError());
			return false;
		}

		// coordinates are scaled along with the glyphs
		std::string str(text);
		SDL_SetRenderScale(renderer, scale, scale);
		SDL_SetRenderDrawColor(renderer, color.r, color.g, color.b, color.a);
		bool drawn = SDL_RenderDebugText(renderer, x / scale, y / scale, str.c_str());
		SDL_RenderPresent(renderer);
		SDL_DestroyRenderer(renderer);

		if (!drawn)
			LogError("Couldn't draw debug text: {}", SDL_GetError());

		return drawn;
	}

	FontProvider::FontProvider(std::map<std::string, std::vector<std::filesystem::path>> configured, bool use_system_fonts)
		: use_system_fonts(use_system_fonts), configured(std::move(configured)) {
		ttf_ready = TTF_Init();
		if (!ttf_ready)
			LogWarning("SDL3_ttf failed to initialize, only the builtin font is available: {}", SDL_GetError());
	}

	FontProvider::~FontProvider() {
		// fonts have to go before TTF_Quit
		resolved.clear();
		opened.clear();

		if (ttf_ready)
			TTF_Quit();
	}

	const std::vector<std::filesystem::path>& FontProvider::SystemCandidates(std::string_view family) {
		static const std::vector<std::filesystem::path> regular {
			"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
			"/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
			"/usr/share/fonts/truetype/freefont/FreeSans.ttf",
			"/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
			"/usr/share/fonts/TTF/DejaVuSans.ttf",
			"/usr/share/fonts/dejavu/DejaVuSans.ttf",
			"/usr/share/fonts/noto/NotoSans-Regular.ttf",
		};

		static const std::vector<std::filesystem::path> bold {
			"/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
			"/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
			"/usr/share/fonts/truetype/freefont/FreeSansBold.ttf",
			"/usr/share/fonts/truetype/noto/NotoSans-Bold.ttf",
			"/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
			"/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf",
			"/usr/share/fonts/noto/NotoSans-Bold.ttf",
		};

		if (family == FONT_BOLD)
			return bold;

		return regular;
	}

	std::vector<std::filesystem::path> FontProvider::GetCandidates(std::string_view family) const {
		std::vector<std::filesystem::path> candidates;

		auto addFamily = [&](std::string_view fam) {
			auto it = configured.find(std::string(fam));
			if (it != configured.end())
				candidates.insert(candidates.end(), it->second.begin(), it->second.end());

			if (use_system_fonts) {
				const auto& system = SystemCandidates(fam);
				candidates.insert(candidates.end(), system.begin(), system.end());
			}
		};

		addFamily(family);

		// a regular face beats the builtin font for any family
		if (family != FONT_REGULAR)
			addFamily(FONT_REGULAR);

		return candidates;
	}

	std::shared_ptr<Font> FontProvider::OpenCandidate(const std::filesystem::path& path, int size) {
		std::string key = path.string();
		if (failed.contains(key))
			return nullptr;

		auto it = opened.find({ key, size });
		if (it != opened.end())
			return it->second;

		std::error_code ec;
		if (!std::filesystem::is_regular_file(path, ec)) {
			failed.insert(key);
			return nullptr;
		}

		std::shared_ptr<TrueTypeFont> font = TrueTypeFont::Open(path, size);
		if (!font) {
			LogWarning("Couldn't open font {}: {}", key, SDL_GetError());
			failed.insert(key);
			return nullptr;
		}

		opened[{ key, size }] = font;
		return font;
	}

	std::shared_ptr<Font> FontProvider::Resolve(std::string_view family, int size) {
		size = std::max(1, size);

		auto it = resolved.find({ std::string(family), size });
		if (it != resolved.end())
			return it->second;

		std::shared_ptr<Font> font;
		if (ttf_ready) {
			for (const auto& path : GetCandidates(family)) {
				font = OpenCandidate(path, size);
				if (font)
					break;
			}
		}

		if (!font) {
			LogWarning("No font file for family \"{}\" at size {}, using the builtin font", family, size);
			font = std::make_shared<BuiltinFont>(size);
		}
		else {
			LogDebug("Font \"{}\" at size {} resolved to {}", family, size, font->GetSourceName());
		}

		resolved[{ std::string(family), size }] = font;
		return font;
	}

} // namespace lessonreel
