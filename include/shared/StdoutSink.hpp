// Created by block on 2026-10-17.

#pragma once

#include <shared/Logger.hpp>

#include <cstdio>

namespace lessonreel {

	/// Prints to standard output. Warnings and worse go to standard error, so they survive `> /dev/null`.
	struct StdoutSink : public Logger::Sink {
		static StdoutSink& The();

		virtual void OutputMessage(const Logger::MessageData& data) override;

	private:
		static std::FILE* StreamFor(Logger::MessageSeverity severity);
	};

	/// Attach the stdout logger sink to the global logger.
	void LoggerAttachStdout();

} // namespace lessonreel
