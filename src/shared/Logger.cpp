// Created by block on 2026-10-17.

#include <shared/Logger.hpp>

#include <algorithm>

namespace lessonreel {

	Logger& Logger::The() {
		static Logger the;
		return the;
	}

	void Logger::AttachSink(Sink& sink) {
		std::lock_guard lock(sinks_lock);
		if (std::ranges::find(sinks, &sink) == sinks.end())
			sinks.push_back(&sink);
	}

	void Logger::DetachSink(Sink& sink) {
		std::lock_guard lock(sinks_lock);
		std::erase(sinks, &sink);
	}

	void Logger::OutputMessage(MessageSeverity sev, std::string message) {
		if (!WouldLog(sev))
			return;

		// libav hands us lines with their newline still attached
		while (!message.empty() && (message.back() == '\n' || message.back() == '\r'))
			message.pop_back();

		MessageData data {
			.time = std::chrono::system_clock::now(),
			.severity = sev,
			.message = std::move(message)
		};

		// the encoders may log from their own threads
		std::lock_guard lock(sinks_lock);
		for (Sink* sink : sinks)
			sink->OutputMessage(data);
	}

} // namespace lessonreel
