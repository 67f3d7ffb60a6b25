// Created by block on 2026-10-17.

#include <gtest/gtest.h>

#include <liblessonreel/FontProvider.hpp>

#include <support/TempDirectory.hpp>

#include <algorithm>
#include <fstream>

namespace lessonreel {
	namespace {

		std::optional<std::filesystem::path> FirstInstalledFont(std::string_view family) {
			for (const auto& path : FontProvider::SystemCandidates(family)) {
				std::error_code ec;
				if (std::filesystem::is_regular_file(path, ec))
					return path;
			}
			return std::nullopt;
		}

		// ------------------------------------------------------------------
		// Builtin fallback
		// ------------------------------------------------------------------

		TEST(FontProviderTest, FallsBackToBuiltinWithNothingConfigured) {
			FontProvider fonts({}, false);

			std::shared_ptr<Font> font = fonts.Resolve(FONT_REGULAR, 40);
			ASSERT_NE(font, nullptr);
			EXPECT_TRUE(font->IsBuiltin());
			EXPECT_EQ(font->GetSize(), 40);
		}

		TEST(FontProviderTest, MissingConfiguredFileFallsBack) {
			FontProvider fonts({ { FONT_REGULAR, { "/nonexistent/lessonreel/Font.ttf" } } }, false);

			std::shared_ptr<Font> font = fonts.Resolve(FONT_BOLD, 30);
			ASSERT_NE(font, nullptr);
			EXPECT_TRUE(font->IsBuiltin());
		}

		TEST(FontProviderTest, UnreadableFontFileFallsBack) {
			test::TempDirectory dir("fonts");
			std::filesystem::path bogus = dir / "Bogus.ttf";
			{
				std::ofstream file(bogus);
				file << "this is not a font";
			}

			FontProvider fonts({ { FONT_REGULAR, { bogus } } }, false);
			std::shared_ptr<Font> font = fonts.Resolve(FONT_REGULAR, 24);
			ASSERT_NE(font, nullptr);
			EXPECT_TRUE(font->IsBuiltin());
		}

		TEST(FontProviderTest, BuiltinMeasuresPerCodepoint) {
			BuiltinFont font(16);

			EXPECT_EQ(font.MeasureWidth("abc"), 48);
			EXPECT_EQ(font.MeasureWidth("\xC3\xA9t\xC3\xA9"), 48);
			EXPECT_EQ(font.MeasureWidth(""), 0);
			EXPECT_EQ(font.GetLineHeight(), 16);
		}

		// ------------------------------------------------------------------
		// Lookup
		// ------------------------------------------------------------------

		TEST(FontProviderTest, CachesByFamilyAndSize) {
			FontProvider fonts({}, false);

			std::shared_ptr<Font> a = fonts.Resolve(FONT_REGULAR, 40);
			std::shared_ptr<Font> b = fonts.Resolve(FONT_REGULAR, 40);
			std::shared_ptr<Font> c = fonts.Resolve(FONT_REGULAR, 41);

			EXPECT_EQ(a.get(), b.get());
			EXPECT_NE(a.get(), c.get());
			EXPECT_EQ(c->GetSize(), 41);
		}

		TEST(FontProviderTest, BoldFallsBackToRegularFiles) {
			const std::filesystem::path regular = "/opt/fonts/Regular.ttf";
			FontProvider fonts({ { FONT_REGULAR, { regular } } }, false);

			std::vector<std::filesystem::path> candidates = fonts.GetCandidates(FONT_BOLD);
			EXPECT_NE(std::find(candidates.begin(), candidates.end(), regular), candidates.end());
		}

		TEST(FontProviderTest, ConfiguredFilesComeBeforeSystemFonts) {
			const std::filesystem::path mine = "/opt/fonts/Mine.ttf";
			FontProvider fonts({ { FONT_REGULAR, { mine } } }, true);

			std::vector<std::filesystem::path> candidates = fonts.GetCandidates(FONT_REGULAR);
			ASSERT_FALSE(candidates.empty());
			EXPECT_EQ(candidates.front(), mine);
			EXPECT_GT(candidates.size(), 1u);
		}

		TEST(FontProviderTest, OpensInstalledSystemFont) {
			std::optional<std::filesystem::path> installed = FirstInstalledFont(FONT_REGULAR);
			if (!installed)
				GTEST_SKIP() << "no system font installed";

			FontProvider fonts;
			std::shared_ptr<Font> font = fonts.Resolve(FONT_REGULAR, 48);
			ASSERT_NE(font, nullptr);
			EXPECT_FALSE(font->IsBuiltin());
			EXPECT_GT(font->MeasureWidth("Clinical Case"), 0);
			EXPECT_GT(font->GetLineHeight(), 0);
		}

	} // namespace
} // namespace lessonreel
