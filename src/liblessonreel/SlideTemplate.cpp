// Created by block on 2026-10-17.

#include <liblessonreel/SlideTemplate.hpp>
#include <liblessonreel/TextLayout.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace lessonreel {

	namespace {

		const Question& QuestionOrEmpty(const LessonContent& lesson, int number) {
			static const Question empty {};
			const Question* q = lesson.GetQuestion(number);
			return q ? *q : empty;
		}

		constexpr double SHORTS_HOOK_DURATION = 5.0;
		constexpr double SHORTS_BODY_DURATION = 10.0;
		constexpr double COMPACT_DURATION = 3.0;

	} // namespace

	std::optional<TemplateVariant> VariantFromName(std::string_view name) {
		if (name == "shorts")
			return TemplateVariant::Shorts;
		if (name == "compact")
			return TemplateVariant::Compact;
		return std::nullopt;
	}

	std::string_view VariantName(TemplateVariant variant) {
		switch (variant) {
			case TemplateVariant::Shorts: return "shorts";
			case TemplateVariant::Compact: return "compact";
		}
		return "???";
	}

	SlideTemplate::SlideTemplate(TemplateVariant variant, const RenderStyle& style)
		: variant(variant), style(style) {
	}

	size_t SlideTemplate::SlideCount(TemplateVariant variant) {
		switch (variant) {
			case TemplateVariant::Shorts: return 6;
			case TemplateVariant::Compact: return 4;
		}
		return 0;
	}

	RenderStyle SlideTemplate::DefaultStyle(TemplateVariant variant) {
		RenderStyle style {};

		if (variant == TemplateVariant::Compact) {
			style.background = Background::Solid({ 15, 23, 42 });
			style.accent_case = { 34, 197, 94 };
			style.accent_question = { 59, 130, 246 };
			style.accent_answer = { 34, 197, 94 };
		}

		return style;
	}

	RenderStyle SlideTemplate::DefaultStyle(TemplateVariant variant, int width, int height) {
		RenderStyle style = DefaultStyle(variant);
		int margin = style.margin;

		style.width = width;
		style.height = height;
		style.margin = std::max(1, static_cast<int>(std::lround(margin * (width / (double)DESIGN_WIDTH))));
		return style;
	}

	int SlideTemplate::ScaleX(int x) const {
		return static_cast<int>(std::lround(x * (style.width / (double)DESIGN_WIDTH)));
	}

	int SlideTemplate::ScaleY(int y) const {
		return static_cast<int>(std::lround(y * (style.height / (double)DESIGN_HEIGHT)));
	}

	int SlideTemplate::ScaleSize(int size) const {
		double scale = std::min(style.width / (double)DESIGN_WIDTH, style.height / (double)DESIGN_HEIGHT);
		return std::max(1, static_cast<int>(std::lround(size * scale)));
	}

	TextElement SlideTemplate::Centered(std::string text, int size, Color color, int y) const {
		TextElement el {};
		el.text = std::move(text);
		el.size = ScaleSize(size);
		el.color = color;
		el.y = ScaleY(y);
		el.align = TextAlign::Center;
		return el;
	}

	TextElement SlideTemplate::Wrapped(std::string text, int size, Color color, int y, int bottom) const {
		TextElement el = Centered(std::move(text), size, color, y);
		el.wrap_width = style.ContentWidth();

		// whatever doesn't fit above bottom is cut, never pushed off the canvas
		int advance = std::max(1, static_cast<int>(std::lround(el.size * style.line_spacing)));
		el.max_lines = static_cast<size_t>(std::max(1, (ScaleY(bottom) - el.y) / advance));
		return el;
	}

	TextElement SlideTemplate::LeftAligned(std::string text, int size, Color color, int x, int y) const {
		TextElement el = Centered(std::move(text), size, color, y);
		el.align = TextAlign::Left;
		el.x = ScaleX(x);
		return el;
	}

	TextElement SlideTemplate::Option(const Question& question, size_t index, int size, Color color, int y, size_t max_lines) const {
		std::string label = std::format("{}) ", Question::LABELS[index]);

		TextElement el = Centered(label + question.options[index], size, color, y);
		// the budget covers the option text, the label comes on top
		el.truncate_chars = style.option_char_budget + CountCodepoints(label);

		if (max_lines > 0) {
			el.wrap_width = style.ContentWidth();
			el.max_lines = max_lines;
		}

		return el;
	}

	std::vector<SlideSpec> SlideTemplate::Build(const LessonContent& lesson, std::string_view topic, std::string_view subtopic) const {
		if (variant == TemplateVariant::Compact)
			return BuildCompact(lesson, topic, subtopic);

		return BuildShorts(lesson);
	}

	std::vector<SlideSpec> SlideTemplate::BuildShorts(const LessonContent& lesson) const {
		std::vector<SlideSpec> slides;

		slides.push_back({
			.name = "hook",
			.elements = {
				Centered("DAILY MEDICAL CASE", 72, style.text, 600),
				Centered("Can you diagnose this?", 85, style.accent_question, 850),
				Centered("Think before the answer", 58, style.text, 1050),
			},
			.narration = "Daily medical case. Can you diagnose this? Think before the answer.",
			.default_duration = SHORTS_HOOK_DURATION,
		});
		slides.back().elements[1].family = FONT_BOLD;

		std::string caseDisplay = FirstSentences(lesson.case_text, 2);
		slides.push_back({
			.name = "case",
			.elements = {
				Centered("Clinical Case", 80, style.accent_case, 350),
				Wrapped(caseDisplay, 58, style.text, 600, 1800),
			},
			.narration = std::format("Clinical case. {}", caseDisplay),
			.default_duration = SHORTS_BODY_DURATION,
		});

		const Question& diagnosis = QuestionOrEmpty(lesson, 1);
		SlideSpec mcq {
			.name = "diagnosis",
			.elements = { Centered("Most Likely Diagnosis?", 72, style.accent_question, 300) },
			.narration = std::format("What is the most likely diagnosis? A, {}. B, {}. C, {}. or D, {}.",
			                         diagnosis.options[0], diagnosis.options[1], diagnosis.options[2], diagnosis.options[3]),
			.default_duration = SHORTS_BODY_DURATION,
		};
		for (size_t i = 0; i < Question::LABELS.size(); i++)
			mcq.elements.push_back(Option(diagnosis, i, 54, style.text, 550 + static_cast<int>(i) * 180, 2));
		slides.push_back(std::move(mcq));

		slides.push_back({
			.name = "think",
			.elements = { Centered("Think for 5 seconds", 80, style.text, 900) },
			.narration = "",
			.default_duration = SHORTS_HOOK_DURATION,
		});

		char answerKey = lesson.GetAnswer(1).value_or('A');
		const std::string& answerText = diagnosis.GetOption(answerKey);
		slides.push_back({
			.name = "answer",
			.elements = {
				Centered(std::format("Correct Answer: {}", answerKey), 90, style.accent_answer, 350),
				Wrapped(answerText, 62, style.text, 520, 930),
				Centered("Mnemonic", 72, style.accent_case, 950),
				Wrapped(lesson.mnemonic, 52, style.text, 1100, 1850),
			},
			.narration = std::format("The correct answer is {}, {}. Here is a mnemonic: {}", answerKey, answerText, lesson.mnemonic),
			.default_duration = SHORTS_BODY_DURATION,
		});

		slides.push_back({
			.name = "follow",
			.elements = {
				Centered("Daily medical cases", 75, style.text, 800),
				Centered("Follow for more!", 90, style.accent_question, 1000),
			},
			.narration = "Follow for more daily medical cases.",
			.default_duration = SHORTS_HOOK_DURATION,
		});
		slides.back().elements[1].family = FONT_BOLD;

		return slides;
	}

	std::vector<SlideSpec> SlideTemplate::BuildCompact(const LessonContent& lesson, std::string_view topic, std::string_view subtopic) const {
		std::vector<SlideSpec> slides;

		slides.push_back({
			.name = "case",
			.elements = {
				Centered(std::string(topic), 80, style.text, 150),
				Centered(std::string(subtopic), 60, style.accent_question, 270),
				Centered("Clinical Case", 60, style.accent_case, 520),
				Wrapped(NormalizeWhitespace(lesson.case_text), 50, style.text, 640, 1850),
			},
			.narration = std::format("{}. {}. Case: {}", topic, subtopic, NormalizeWhitespace(lesson.case_text)),
			.default_duration = COMPACT_DURATION,
		});

		SlideSpec questions {
			.name = "questions",
			.elements = { Centered("Questions", 70, style.accent_case, 100) },
			.narration = "Here are the questions.",
			.default_duration = COMPACT_DURATION,
		};

		// two questions fit at this size, the rest are covered by the answers slide
		for (int n = 1; n <= 2; n++) {
			const Question& q = QuestionOrEmpty(lesson, n);
			int base = 250 + (n - 1) * 510;

			TextElement title = LeftAligned(std::format("{}. {}", n, q.question), 45, style.text, 60, base);
			title.wrap_width = style.width - title.x - style.margin;
			title.max_lines = 3;
			questions.elements.push_back(std::move(title));

			for (size_t i = 0; i < Question::LABELS.size(); i++) {
				TextElement option = Option(q, i, 40, style.accent_question, base + 219 + static_cast<int>(i) * 60, 0);
				option.align = TextAlign::Left;
				option.x = ScaleX(80);
				questions.elements.push_back(std::move(option));
			}

			questions.narration += std::format(" Question {}: {}", n, q.question);
		}
		slides.push_back(std::move(questions));

		slides.push_back({
			.name = "think",
			.elements = { Centered("Think about it...", 100, style.accent_case, 900) },
			.narration = "Take a moment to think about your answers.",
			.default_duration = COMPACT_DURATION,
		});

		std::string answers;
		for (const auto& [number, label] : lesson.answers) {
			if (!answers.empty())
				answers += ' ';
			answers += std::format("{}-{}", number, label);
		}

		slides.push_back({
			.name = "answers",
			.elements = {
				Centered("Answers", 75, style.accent_case, 200),
				Centered(answers, 90, style.text, 380),
				Centered("Mnemonic", 75, style.accent_question, 680),
				Wrapped(lesson.mnemonic, 50, style.text, 830, 1850),
			},
			.narration = std::format("The answers are: {}. Here's a mnemonic to remember: {}", answers, lesson.mnemonic),
			.default_duration = COMPACT_DURATION,
		});

		return slides;
	}

} // namespace lessonreel
