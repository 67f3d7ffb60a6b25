// Created by block on 2026-10-17.

#include <SDL3/SDL.h>

#include <lessonreel-cli/Options.hpp>
#include <lessonreel-cli/Processes.hpp>

#include <liblessonreel/MediaUtils.hpp>

#include <shared/Logger.hpp>
#include <shared/StdoutSink.hpp>

#include "gitversion.h"

int main(int argc, char** argv) {
	lessonreel::LoggerAttachStdout();

	int ret = lessonreel::cli::Options::ParseArgs(argc, argv);
	if (ret != EXIT_SUCCESS)
		return ret;

	if (lessonreel::cli::Options::options.verbose)
		lessonreel::Logger::The().SetMinimumSeverity(lessonreel::Logger::MessageSeverity::Debug);

	lessonreel::AttachAVLogToLogger();

	lessonreel::LogDebug("lessonreel {}", lessonreel::version::fullTag);
	lessonreel::LogDebug("Built {} {}", __DATE__, __TIME__);
	lessonreel::LogDebug("SDL {}, rev {}", SDL_VERSION, SDL_GetRevision());
	lessonreel::LogDebug("libav {}", av_version_info());

#ifdef LESSONREEL_DEBUG
	lessonreel::cli::Options::PrintArgs();
#endif

	switch (lessonreel::cli::Options::options.lessonreel_mode) {
		case lessonreel::cli::LessonreelMode::Render:
			ret = lessonreel::cli::Processes::The().ProcessRender();
			break;
		case lessonreel::cli::LessonreelMode::Validate:
			ret = lessonreel::cli::Processes::The().ProcessValidate();
			break;
		case lessonreel::cli::LessonreelMode::Preview:
			ret = lessonreel::cli::Processes::The().ProcessPreview();
			break;
		default:
			lessonreel::LogError("Invalid lessonreel mode... how did you do that?");
			ret = EXIT_FAILURE;
			break;
	}

	return ret;
}
