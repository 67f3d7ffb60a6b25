// Created by block on 2026-10-17.

#include <gtest/gtest.h>

#include <liblessonreel/LessonContent.hpp>

#include <support/TempDirectory.hpp>
#include <support/TestLessons.hpp>

#include <fstream>

namespace lessonreel {
	namespace {

		std::string ReplaceFirst(std::string str, std::string_view from, std::string_view to) {
			size_t pos = str.find(from);
			if (pos != std::string::npos)
				str.replace(pos, from.size(), to);
			return str;
		}

		TEST(LessonContentTest, ParsesGeneratorJSON) {
			std::optional<LessonContent> lesson = LessonContent::FromJSON(test::MakeLessonJSON());
			ASSERT_TRUE(lesson.has_value());

			EXPECT_EQ(lesson->case_text, "A 54M has crushing chest pain and ST up.");
			EXPECT_EQ(lesson->case_questions.size(), 3u);
			EXPECT_EQ(lesson->independent_questions.size(), 2u);
			EXPECT_EQ(lesson->answers.size(), 5u);
			EXPECT_EQ(lesson->mnemonic, "ABC rule");
			EXPECT_EQ(lesson->GetAnswer(1), 'A');
			EXPECT_EQ(lesson->GetAnswer(5), 'D');
		}

		TEST(LessonContentTest, QuestionsAreNumberedAcrossBothGroups) {
			LessonContent lesson = test::MakeLesson();

			ASSERT_NE(lesson.GetQuestion(3), nullptr);
			EXPECT_EQ(lesson.GetQuestion(3)->question, "Case question 3?");
			ASSERT_NE(lesson.GetQuestion(4), nullptr);
			EXPECT_EQ(lesson.GetQuestion(4)->question, "Independent question 1?");
			EXPECT_EQ(lesson.GetQuestion(0), nullptr);
			EXPECT_EQ(lesson.GetQuestion(6), nullptr);
		}

		TEST(LessonContentTest, OptionsByLabel) {
			LessonContent lesson = test::MakeLesson();
			const Question* q = lesson.GetQuestion(1);
			ASSERT_NE(q, nullptr);

			EXPECT_EQ(q->GetOption('A'), "Inferior MI");
			EXPECT_EQ(q->GetOption('D'), "Pulmonary embolism");
			EXPECT_EQ(q->GetOption('E'), "");
			EXPECT_FALSE(Question::LabelToIndex('x').has_value());
		}

		TEST(LessonContentTest, RejectsMalformedJSON) {
			EXPECT_FALSE(LessonContent::FromJSON("{ \"case_text\": ").has_value());
			EXPECT_FALSE(LessonContent::FromJSON("[1, 2, 3]").has_value());
		}

		TEST(LessonContentTest, RejectsMissingOption) {
			std::string json = ReplaceFirst(test::MakeLessonJSON(), ", \"D\": \"Pulmonary embolism\"", "");
			EXPECT_FALSE(LessonContent::FromJSON(json).has_value());
		}

		TEST(LessonContentTest, RejectsExtraOption) {
			std::string json = ReplaceFirst(test::MakeLessonJSON(), "\"D\": \"Nitrates\"", "\"D\": \"Nitrates\", \"E\": \"Oxygen\"");
			EXPECT_FALSE(LessonContent::FromJSON(json).has_value());
		}

		TEST(LessonContentTest, RejectsNonNumericAnswerKey) {
			std::string json = ReplaceFirst(test::MakeLessonJSON(), "\"5\": \"D\"", "\"five\": \"D\"");
			EXPECT_FALSE(LessonContent::FromJSON(json).has_value());
		}

		TEST(LessonContentTest, RejectsMissingMnemonic) {
			std::string json = ReplaceFirst(test::MakeLessonJSON(), "\"mnemonic\": \"ABC rule\"", "\"memo\": \"ABC rule\"");
			EXPECT_FALSE(LessonContent::FromJSON(json).has_value());
		}

		TEST(LessonContentTest, ValidatesGroupCounts) {
			LessonContent lesson = test::MakeLesson();
			EXPECT_TRUE(lesson.Validate());

			lesson.case_questions.pop_back();
			EXPECT_FALSE(lesson.Validate());

			lesson = test::MakeLesson();
			lesson.independent_questions.push_back(lesson.independent_questions.front());
			EXPECT_FALSE(lesson.Validate());
		}

		TEST(LessonContentTest, ValidatesAnswerKey) {
			LessonContent lesson = test::MakeLesson();
			lesson.answers.erase(5);
			lesson.answers[6] = 'A';
			EXPECT_FALSE(lesson.Validate());

			lesson = test::MakeLesson();
			lesson.answers[2] = 'E';
			EXPECT_FALSE(lesson.Validate());

			lesson = test::MakeLesson();
			lesson.answers.erase(3);
			EXPECT_FALSE(lesson.Validate());
		}

		TEST(LessonContentTest, ValidatesText) {
			LessonContent lesson = test::MakeLesson();
			lesson.case_text.clear();
			EXPECT_FALSE(lesson.Validate());

			lesson = test::MakeLesson();
			lesson.mnemonic.clear();
			EXPECT_FALSE(lesson.Validate());
		}

		TEST(LessonContentTest, LoadsFromFile) {
			test::TempDirectory dir("lesson");
			std::filesystem::path path = dir / "lesson.json";
			{
				std::ofstream file(path);
				file << test::MakeLessonJSON();
			}

			std::optional<LessonContent> lesson = LessonContent::LoadFile(path);
			ASSERT_TRUE(lesson.has_value());
			EXPECT_EQ(lesson->GetQuestion(2)->question, "Case question 2?");

			EXPECT_FALSE(LessonContent::LoadFile(dir / "missing.json").has_value());
		}

	} // namespace
} // namespace lessonreel
