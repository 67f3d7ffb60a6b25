// Created by block on 2026-10-17.

#include <shared/StdoutSink.hpp>

#include <cstdio>
#include <format>

namespace lessonreel {

	StdoutSink& StdoutSink::The() {
		static StdoutSink the;
		return the;
	}

	std::FILE* StdoutSink::StreamFor(Logger::MessageSeverity severity) {
		if (severity >= Logger::MessageSeverity::Warning)
			return stderr;
		return stdout;
	}

	void StdoutSink::OutputMessage(const Logger::MessageData& data) {
		auto seconds = std::chrono::floor<std::chrono::seconds>(data.time);
		std::string line = std::format("[{:%H:%M:%S}] [{}] {}\n", seconds, Logger::SeverityToString(data.severity), data.message);

		std::FILE* stream = StreamFor(data.severity);
		std::fputs(line.c_str(), stream);
		std::fflush(stream);
	}

	void LoggerAttachStdout() {
		Logger::The().AttachSink(StdoutSink::The());
	}

} // namespace lessonreel
