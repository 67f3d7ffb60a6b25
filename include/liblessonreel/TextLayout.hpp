// Created by block on 2026-10-17.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lessonreel {

	class Font;

	/// Number of UTF-8 code points in text. Stray continuation bytes count as their own code point.
	size_t CountCodepoints(std::string_view text);

	/// Byte offset of the given code point index, clamped to the end of text.
	size_t CodepointOffset(std::string_view text, size_t codepoints);

	/// Greedily packs words into lines no wider than max_width as measured by font.
	/// Words wider than max_width on their own are split between code points.
	/// A code point wider than max_width by itself is dropped.
	std::vector<std::string> WrapText(std::string_view text, const Font& font, int max_width);

	/// Cuts text so the result is at most budget code points, ending with marker when anything was cut.
	std::string TruncateText(std::string_view text, size_t budget, std::string_view marker = "...");

	/// The first count sentences of text (split on '.', '!' and '?' followed by whitespace).
	std::string FirstSentences(std::string_view text, size_t count);

	/// Collapses runs of whitespace into single spaces and trims both ends.
	std::string NormalizeWhitespace(std::string_view text);

} // namespace lessonreel
