// Created by block on 2026-10-17.

#pragma once

#include <liblessonreel/SlideSpec.hpp>

#include <SDL3/SDL_surface.h>

#include <filesystem>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

typedef struct TTF_Font TTF_Font;

namespace lessonreel {

	class Font {
	public:
		explicit Font(int size) : size(size) {}
		virtual ~Font() = default;

		Font(const Font&) = delete;
		Font& operator=(const Font&) = delete;

		/// Rendered width of a single line of UTF-8 text, in pixels.
		virtual int MeasureWidth(std::string_view text) const = 0;
		virtual int GetLineHeight() const = 0;
		virtual bool Draw(SDL_Surface* target, std::string_view text, int x, int y, Color color) const = 0;

		virtual bool IsBuiltin() const { return false; }
		virtual std::string GetSourceName() const = 0;

		int GetSize() const { return size; }

	protected:
		int size;
	};

	class TrueTypeFont : public Font {
	public:
		static std::shared_ptr<TrueTypeFont> Open(const std::filesystem::path& path, int size);

		TrueTypeFont(TTF_Font* font, std::filesystem::path path, int size);
		~TrueTypeFont() override;

		int MeasureWidth(std::string_view text) const override;
		int GetLineHeight() const override;
		bool Draw(SDL_Surface* target, std::string_view text, int x, int y, Color color) const override;
		std::string GetSourceName() const override { return path.string(); }

	private:
		TTF_Font* font = nullptr;
		std::filesystem::path path;
	};

	/// SDL's 8x8 debug font, scaled up to the requested size. Always available, ASCII only.
	class BuiltinFont : public Font {
	public:
		explicit BuiltinFont(int size);

		int MeasureWidth(std::string_view text) const override;
		int GetLineHeight() const override;
		bool Draw(SDL_Surface* target, std::string_view text, int x, int y, Color color) const override;
		bool IsBuiltin() const override { return true; }
		std::string GetSourceName() const override { return "builtin"; }

	private:
		float scale;
	};

	/// Resolves a font family at a size to something drawable. Never fails: the last resort is BuiltinFont.
	class FontProvider {
	public:
		explicit FontProvider(std::map<std::string, std::vector<std::filesystem::path>> configured = {}, bool use_system_fonts = true);
		~FontProvider();

		FontProvider(const FontProvider&) = delete;
		FontProvider& operator=(const FontProvider&) = delete;

		std::shared_ptr<Font> Resolve(std::string_view family, int size);

		/// Font files tried, in order, before falling back to the builtin font.
		std::vector<std::filesystem::path> GetCandidates(std::string_view family) const;

		static const std::vector<std::filesystem::path>& SystemCandidates(std::string_view family);

	private:
		std::shared_ptr<Font> OpenCandidate(const std::filesystem::path& path, int size);

		bool ttf_ready = false;
		bool use_system_fonts = true;
		std::map<std::string, std::vector<std::filesystem::path>> configured {};

		std::map<std::pair<std::string, int>, std::shared_ptr<Font>> resolved {};
		std::map<std::pair<std::string, int>, std::shared_ptr<Font>> opened {};
		std::set<std::string> failed {};
	};

} // namespace lessonreel
