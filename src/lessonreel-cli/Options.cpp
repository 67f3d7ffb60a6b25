// Created by block on 2026-10-17.

#include <lessonreel-cli/Options.hpp>

#include <shared/Logger.hpp>

#include <argparse/argparse.hpp>

#include <iostream>

namespace lessonreel::cli {

	OptionVariables Options::options {};

	int Options::ParseArgs(int argc, char** argv) {
		argparse::ArgumentParser program("lessonreel", "", argparse::default_arguments::help);

		// can't do these separately, argparse doesn't have copy/move

		argparse::ArgumentParser render_command("render", "", argparse::default_arguments::help);
		render_command.add_description("Turn a lesson into a narrated vertical video.");
		program.add_subparser(render_command);
		{
			render_command.add_argument("input").store_into(options.inputPath)
			  .help("Path to the lesson JSON.");
			render_command.add_argument("--topic").store_into(options.topic).required()
			  .help("Topic of the lesson, used in the output file name.");
			render_command.add_argument("--subtopic").store_into(options.subtopic).required()
			  .help("Subtopic of the lesson, used in the output file name.");
			render_command.add_argument("-o", "--output").store_into(options.outputPath)
			  .help("Directory to write the video to. (default: videos)");
			render_command.add_argument("-t", "--template").store_into(options.templateName)
			  .help("Slide layout, shorts or compact.");
			render_command.add_argument("--voice-model").store_into(options.render.voice_model)
			  .help("Path to the piper voice model (.onnx, with its .onnx.json beside it).");
			render_command.add_argument("--espeak-data").store_into(options.render.espeak_data)
			  .help("Path to espeak-ng's data directory.");
			render_command.add_argument("--speaker").store_into(options.render.speaker)
			  .help("Speaker id for multi-speaker voice models.");
			render_command.add_argument("--no-narration").flag().store_into(options.render.no_narration)
			  .help("If specified, every slide gets a silent track.");
			render_command.add_argument("--font").store_into(options.render.font)
			  .help("Font file to try before the system fonts.");
			render_command.add_argument("--bold-font").store_into(options.render.bold_font)
			  .help("Bold font file to try before the system fonts.");
			render_command.add_argument("--cap").store_into(options.render.cap)
			  .help("Maximum video length in seconds, 0 for none.");
			render_command.add_argument("--truncate").store_into(options.render.truncate)
			  .help("What to do past the cap: hardcut cuts at the cap, drop only keeps whole slides.");
			render_command.add_argument("--fps").store_into(options.render.fps)
			  .help("Frame rate of the video.");
			render_command.add_argument("--width").store_into(options.render.width)
			  .help("Width of the video, must be even.");
			render_command.add_argument("--height").store_into(options.render.height)
			  .help("Height of the video, must be even.");
			render_command.add_argument("--narration-timeout").store_into(options.render.narration_timeout)
			  .help("Seconds narration for one slide may take before it's given up on.");
			render_command.add_argument("--media-timeout").store_into(options.render.media_timeout)
			  .help("Seconds one media read, encode or join may take before the run fails.");
			render_command.add_argument("--temp-dir").store_into(options.render.temp_root)
			  .help("Where to put the run's temporary files. (default: the system temp directory)");
			render_command.add_argument("--keep-temp").flag().store_into(options.render.keep_temp)
			  .help("If specified, temporary slides, audio and segments are left on disk.");
			render_command.add_argument("-v", "--verbose").flag().store_into(options.verbose)
			  .help("If specified, logs debug output.");
		}

		argparse::ArgumentParser validate_command("validate", "", argparse::default_arguments::help);
		validate_command.add_description("Check a lesson JSON without making anything.");
		program.add_subparser(validate_command);
		{
			validate_command.add_argument("input").store_into(options.inputPath)
			  .help("Path to the lesson JSON.");
			validate_command.add_argument("-v", "--verbose").flag().store_into(options.verbose)
			  .help("If specified, logs debug output.");
		}

		argparse::ArgumentParser preview_command("preview", "", argparse::default_arguments::help);
		preview_command.add_description("Render a lesson's slides as PNGs, without audio or video.");
		program.add_subparser(preview_command);
		{
			preview_command.add_argument("input").store_into(options.inputPath)
			  .help("Path to the lesson JSON.");
			preview_command.add_argument("-o", "--output").store_into(options.outputPath)
			  .help("Directory to write the slides to. (default: preview)");
			preview_command.add_argument("-t", "--template").store_into(options.templateName)
			  .help("Slide layout, shorts or compact.");
			preview_command.add_argument("--topic").store_into(options.topic)
			  .help("Topic shown on the compact layout.");
			preview_command.add_argument("--subtopic").store_into(options.subtopic)
			  .help("Subtopic shown on the compact layout.");
			preview_command.add_argument("--font").store_into(options.render.font)
			  .help("Font file to try before the system fonts.");
			preview_command.add_argument("--bold-font").store_into(options.render.bold_font)
			  .help("Bold font file to try before the system fonts.");
			preview_command.add_argument("--width").store_into(options.render.width)
			  .help("Width of the slides.");
			preview_command.add_argument("--height").store_into(options.render.height)
			  .help("Height of the slides.");
			preview_command.add_argument("-v", "--verbose").flag().store_into(options.verbose)
			  .help("If specified, logs debug output.");
		}

		try {
			program.parse_args(argc, argv);
		}
		catch (const std::exception& err) {
			std::cerr << err.what() << std::endl;
			std::cerr << program;
			return EXIT_FAILURE;
		}

		if (program.is_subcommand_used(render_command)) {
			options.lessonreel_mode = LessonreelMode::Render;
		}
		else if (program.is_subcommand_used(validate_command)) {
			options.lessonreel_mode = LessonreelMode::Validate;
		}
		else if (program.is_subcommand_used(preview_command)) {
			options.lessonreel_mode = LessonreelMode::Preview;
		}
		else {
			std::cerr << program;
			return EXIT_FAILURE;
		}

		if (options.outputPath.empty())
			options.outputPath = options.lessonreel_mode == LessonreelMode::Preview ? "preview" : "videos";

		return EXIT_SUCCESS;
	}

	void Options::PrintArgs() {
		LogInfo("Args:");
		LogInfo("Input path: {}", options.inputPath.string());
		LogInfo("Output path: {}", options.outputPath.string());
		LogInfo("Template: {}", options.templateName);
		LogInfo("Topic: {} / {}\n", options.topic, options.subtopic);

		LogInfo("Render options:");
		LogInfo("    Voice model: {}", options.render.voice_model.string());
		LogInfo("    espeak data: {}", options.render.espeak_data.string());
		LogInfo("    Speaker: {}", options.render.speaker);
		LogInfo("    No narration? {}", options.render.no_narration);
		LogInfo("    Fonts: {} / {}", options.render.font.string(), options.render.bold_font.string());
		LogInfo("    Cap: {}s ({})", options.render.cap, options.render.truncate);
		LogInfo("    Format: {}x{} @ {}fps", options.render.width, options.render.height, options.render.fps);
		LogInfo("    Timeouts: narration {}s, media {}s", options.render.narration_timeout, options.render.media_timeout);
		LogInfo("    Keep temp files? {}", options.render.keep_temp);
	}

} // namespace lessonreel::cli
