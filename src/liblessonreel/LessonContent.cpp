// Created by block on 2026-10-17.

#include <liblessonreel/LessonContent.hpp>

#include <shared/Logger.hpp>

#include <nlohmann/json.hpp>

#include <charconv>
#include <fstream>
#include <sstream>

namespace lessonreel {

	namespace {

		bool ParseQuestion(const nlohmann::json& node, Question& out, std::string_view group, size_t index) {
			if (!node.is_object()) {
				LogError("{}[{}] is not an object", group, index);
				return false;
			}

			if (!node.contains("question") || !node["question"].is_string()) {
				LogError("{}[{}] has no question text", group, index);
				return false;
			}
			out.question = node["question"].get<std::string>();

			if (!node.contains("options") || !node["options"].is_object()) {
				LogError("{}[{}] has no options", group, index);
				return false;
			}

			const auto& options = node["options"];
			if (options.size() != Question::LABELS.size()) {
				LogError("{}[{}] has {} options, expected {}", group, index, options.size(), Question::LABELS.size());
				return false;
			}

			for (size_t i = 0; i < Question::LABELS.size(); i++) {
				std::string label(1, Question::LABELS[i]);
				if (!options.contains(label) || !options[label].is_string()) {
					LogError("{}[{}] is missing option {}", group, index, label);
					return false;
				}
				out.options[i] = options[label].get<std::string>();
			}

			return true;
		}

		bool ParseGroup(const nlohmann::json& root, const char* key, std::vector<Question>& out) {
			if (!root.contains(key) || !root[key].is_array()) {
				LogError("Lesson is missing the {} array", key);
				return false;
			}

			size_t index = 0;
			for (const auto& node : root[key]) {
				Question q;
				if (!ParseQuestion(node, q, key, index++))
					return false;
				out.push_back(std::move(q));
			}

			return true;
		}

	} // namespace

	const std::string& Question::GetOption(char label) const {
		static const std::string empty {};

		std::optional<size_t> index = LabelToIndex(label);
		if (!index)
			return empty;

		return options[*index];
	}

	std::optional<size_t> Question::LabelToIndex(char label) {
		for (size_t i = 0; i < LABELS.size(); i++) {
			if (LABELS[i] == label)
				return i;
		}

		return std::nullopt;
	}

	const Question* LessonContent::GetQuestion(int number) const {
		if (number < 1)
			return nullptr;

		size_t index = number - 1;
		if (index < case_questions.size())
			return &case_questions[index];

		index -= case_questions.size();
		if (index < independent_questions.size())
			return &independent_questions[index];

		return nullptr;
	}

	std::optional<char> LessonContent::GetAnswer(int number) const {
		auto it = answers.find(number);
		if (it == answers.end())
			return std::nullopt;

		return it->second;
	}

	bool LessonContent::Validate() const {
		bool valid = true;

		if (case_text.empty()) {
			LogError("Lesson has no case text");
			valid = false;
		}

		if (mnemonic.empty()) {
			LogError("Lesson has no mnemonic");
			valid = false;
		}

		if (case_questions.size() != CASE_QUESTION_COUNT) {
			LogError("Expected {} case-based questions, got {}", CASE_QUESTION_COUNT, case_questions.size());
			valid = false;
		}

		if (independent_questions.size() != INDEPENDENT_QUESTION_COUNT) {
			LogError("Expected {} independent questions, got {}", INDEPENDENT_QUESTION_COUNT, independent_questions.size());
			valid = false;
		}

		for (int number = 1; number <= (int)(case_questions.size() + independent_questions.size()); number++) {
			const Question* q = GetQuestion(number);
			if (q->question.empty()) {
				LogError("Question {} has no text", number);
				valid = false;
			}
		}

		if (answers.size() != TOTAL_QUESTION_COUNT) {
			LogError("Expected {} answers, got {}", TOTAL_QUESTION_COUNT, answers.size());
			valid = false;
		}

		for (const auto& [number, label] : answers) {
			if (GetQuestion(number) == nullptr) {
				LogError("Answer for question {} has no matching question", number);
				valid = false;
			}

			if (!Question::LabelToIndex(label)) {
				LogError("Answer for question {} is '{}', which is not an option label", number, label);
				valid = false;
			}
		}

		return valid;
	}

	std::optional<LessonContent> LessonContent::FromJSON(std::string_view json) {
		nlohmann::json root;
		try {
			root = nlohmann::json::parse(json);
		}
		catch (const nlohmann::json::parse_error& err) {
			LogError("Lesson JSON doesn't parse: {}", err.what());
			return std::nullopt;
		}

		if (!root.is_object()) {
			LogError("Lesson JSON must be an object");
			return std::nullopt;
		}

		for (const char* key : { "case_text", "mnemonic" }) {
			if (!root.contains(key) || !root[key].is_string()) {
				LogError("Lesson is missing the {} string", key);
				return std::nullopt;
			}
		}

		if (!root.contains("answers") || !root["answers"].is_object()) {
			LogError("Lesson is missing the answers object");
			return std::nullopt;
		}

		LessonContent lesson;
		lesson.case_text = root["case_text"].get<std::string>();
		lesson.mnemonic = root["mnemonic"].get<std::string>();

		if (!ParseGroup(root, "case_based_mcqs", lesson.case_questions))
			return std::nullopt;
		if (!ParseGroup(root, "independent_mcqs", lesson.independent_questions))
			return std::nullopt;

		for (const auto& [key, value] : root["answers"].items()) {
			int number = 0;
			auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), number);
			if (ec != std::errc() || ptr != key.data() + key.size()) {
				LogError("Answer key \"{}\" is not a question number", key);
				return std::nullopt;
			}

			if (!value.is_string() || value.get<std::string>().size() != 1) {
				LogError("Answer for question {} must be a single option label", number);
				return std::nullopt;
			}

			lesson.answers[number] = value.get<std::string>()[0];
		}

		if (!lesson.Validate())
			return std::nullopt;

		return lesson;
	}

	std::optional<LessonContent> LessonContent::LoadFile(const std::filesystem::path& path) {
		std::ifstream file(path);
		if (!file.is_open()) {
			LogError("Couldn't open lesson file {}", path.string());
			return std::nullopt;
		}

		std::stringstream buffer;
		buffer << file.rdbuf();

		return FromJSON(buffer.str());
	}

} // namespace lessonreel
