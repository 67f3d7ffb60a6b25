// Created by block on 2026-10-17.

#pragma once

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lessonreel {

	struct Question {
		static constexpr std::array<char, 4> LABELS { 'A', 'B', 'C', 'D' };

		std::string question {};
		// indexed the same as LABELS
		std::array<std::string, 4> options {};

		const std::string& GetOption(char label) const;
		static std::optional<size_t> LabelToIndex(char label);
	};

	/// One lesson as produced by the content generator: a case, two question groups, the answers and a mnemonic.
	struct LessonContent {
		static constexpr size_t CASE_QUESTION_COUNT = 3;
		static constexpr size_t INDEPENDENT_QUESTION_COUNT = 2;
		static constexpr size_t TOTAL_QUESTION_COUNT = CASE_QUESTION_COUNT + INDEPENDENT_QUESTION_COUNT;

		std::string case_text {};
		std::vector<Question> case_questions {};
		std::vector<Question> independent_questions {};
		// 1-based question number (case questions first) -> option label
		std::map<int, char> answers {};
		std::string mnemonic {};

		/// Question by its 1-based number across both groups, or nullptr.
		const Question* GetQuestion(int number) const;
		std::optional<char> GetAnswer(int number) const;

		/// Checks every invariant and logs each violation. Returns true if the lesson is usable.
		bool Validate() const;

		static std::optional<LessonContent> FromJSON(std::string_view json);
		static std::optional<LessonContent> LoadFile(const std::filesystem::path& path);
	};

} // namespace lessonreel
