// Created by block on 2026-10-17.

#include <liblessonreel/FontProvider.hpp>
#include <liblessonreel/TextLayout.hpp>

namespace lessonreel {

	namespace {

		bool IsContinuation(unsigned char c) {
			return (c & 0xC0) == 0x80;
		}

		bool IsSpace(char c) {
			return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
		}

		std::vector<std::string_view> SplitWords(std::string_view text) {
			std::vector<std::string_view> words;

			size_t i = 0;
			while (i < text.size()) {
				while (i < text.size() && IsSpace(text[i]))
					i++;

				size_t start = i;
				while (i < text.size() && !IsSpace(text[i]))
					i++;

				if (i > start)
					words.push_back(text.substr(start, i - start));
			}

			return words;
		}

		// splits a word that's too wide by itself into pieces that each fit
		void BreakWord(std::string_view word, const Font& font, int max_width, std::vector<std::string>& lines) {
			std::string piece;

			size_t i = 0;
			while (i < word.size()) {
				size_t next = i + 1;
				while (next < word.size() && IsContinuation(word[next]))
					next++;

				std::string_view cp = word.substr(i, next - i);

				// wider than a whole line, there's nothing smaller to break it into
				if (font.MeasureWidth(cp) > max_width) {
					i = next;
					continue;
				}

				std::string candidate = piece + std::string(cp);
				if (!piece.empty() && font.MeasureWidth(candidate) > max_width) {
					lines.push_back(piece);
					piece = std::string(cp);
				}
				else {
					piece = std::move(candidate);
				}

				i = next;
			}

			if (!piece.empty())
				lines.push_back(piece);
		}

	} // namespace

	size_t CountCodepoints(std::string_view text) {
		size_t count = 0;
		for (size_t i = 0; i < text.size(); i++) {
			if (!IsContinuation(text[i]) || i == 0)
				count++;
		}
		return count;
	}

	size_t CodepointOffset(std::string_view text, size_t codepoints) {
		size_t i = 0;
		size_t seen = 0;
		while (i < text.size() && seen < codepoints) {
			i++;
			while (i < text.size() && IsContinuation(text[i]))
				i++;
			seen++;
		}
		return i;
	}

	std::vector<std::string> WrapText(std::string_view text, const Font& font, int max_width) {
		std::vector<std::string> lines;
		std::string current;

		for (std::string_view word : SplitWords(text)) {
			std::string candidate = current.empty() ? std::string(word) : current + " " + std::string(word);
			if (font.MeasureWidth(candidate) <= max_width) {
				current = std::move(candidate);
				continue;
			}

			if (!current.empty()) {
				lines.push_back(current);
				current.clear();
			}

			if (font.MeasureWidth(word) <= max_width) {
				current = std::string(word);
				continue;
			}

			size_t before = lines.size();
			BreakWord(word, font, max_width, lines);

			// keep packing after the last piece of a broken word
			if (lines.size() > before) {
				current = std::move(lines.back());
				lines.pop_back();
			}
		}

		if (!current.empty())
			lines.push_back(current);

		return lines;
	}

	std::string TruncateText(std::string_view text, size_t budget, std::string_view marker) {
		if (CountCodepoints(text) <= budget)
			return std::string(text);

		size_t markerLength = CountCodepoints(marker);
		if (budget <= markerLength)
			return std::string(text.substr(0, CodepointOffset(text, budget)));

		std::string out(text.substr(0, CodepointOffset(text, budget - markerLength)));
		out += marker;
		return out;
	}

	std::string FirstSentences(std::string_view text, size_t count) {
		if (count == 0)
			return {};

		size_t found = 0;
		for (size_t i = 0; i < text.size(); i++) {
			char c = text[i];
			if (c != '.' && c != '!' && c != '?')
				continue;

			bool atEnd = i + 1 == text.size();
			if (!atEnd && !IsSpace(text[i + 1]))
				continue;

			if (++found == count)
				return NormalizeWhitespace(text.substr(0, i + 1));
		}

		return NormalizeWhitespace(text);
	}

	std::string NormalizeWhitespace(std::string_view text) {
		std::string out;
		for (std::string_view word : SplitWords(text)) {
			if (!out.empty())
				out += ' ';
			out += word;
		}
		return out;
	}

} // namespace lessonreel
