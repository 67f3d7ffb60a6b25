// Created by block on 2026-10-17.

#pragma once

#include <liblessonreel/EncodingProfile.hpp>
#include <liblessonreel/LessonContent.hpp>
#include <liblessonreel/SlideSpec.hpp>

#include <string>

namespace lessonreel::test {

	/// A valid lesson: 40 character case text, 3 + 2 questions with 4 options each, 5 answers, mnemonic "ABC rule".
	LessonContent MakeLesson();

	/// The same lesson, as the content generator would send it.
	std::string MakeLessonJSON();

	/// A tenth of the real canvas, so rendering and encoding stay fast.
	RenderStyle SmallStyle();
	EncodingProfile SmallProfile();

} // namespace lessonreel::test
