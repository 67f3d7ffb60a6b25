// Created by block on 2026-10-17.

#pragma once

#include <chrono>
#include <format>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lessonreel {

	/// The global logger. Messages are formatted once and handed to every attached sink.
	class Logger {
	public:
		enum class MessageSeverity {
			Debug,
			Info,
			Warning,
			Error,
			Fatal
		};

		static constexpr std::string_view SeverityToString(MessageSeverity sev) {
			switch (sev) {
				case MessageSeverity::Debug: return "Debug";
				case MessageSeverity::Info: return "Info";
				case MessageSeverity::Warning: return "Warning";
				case MessageSeverity::Error: return "Error";
				case MessageSeverity::Fatal: return "Fatal";
			}
			return "???";
		}

		struct MessageData {
			std::chrono::system_clock::time_point time;
			MessageSeverity severity;
			std::string message;
		};

		/// A sink receives every message at or above the logger's minimum severity.
		struct Sink {
			virtual ~Sink() = default;
			virtual void OutputMessage(const MessageData& data) = 0;
		};

		static Logger& The();

		void AttachSink(Sink& sink);
		void DetachSink(Sink& sink);

		void SetMinimumSeverity(MessageSeverity sev) { minimum_severity = sev; }
		MessageSeverity GetMinimumSeverity() const { return minimum_severity; }
		bool WouldLog(MessageSeverity sev) const { return sev >= minimum_severity; }

		template <class... Args>
		void Debug(std::format_string<Args...> fmt, Args&&... args) {
			Out(MessageSeverity::Debug, fmt, std::forward<Args>(args)...);
		}

		template <class... Args>
		void Info(std::format_string<Args...> fmt, Args&&... args) {
			Out(MessageSeverity::Info, fmt, std::forward<Args>(args)...);
		}

		template <class... Args>
		void Warning(std::format_string<Args...> fmt, Args&&... args) {
			Out(MessageSeverity::Warning, fmt, std::forward<Args>(args)...);
		}

		template <class... Args>
		void Error(std::format_string<Args...> fmt, Args&&... args) {
			Out(MessageSeverity::Error, fmt, std::forward<Args>(args)...);
		}

		template <class... Args>
		void Fatal(std::format_string<Args...> fmt, Args&&... args) {
			Out(MessageSeverity::Fatal, fmt, std::forward<Args>(args)...);
		}

		void OutputMessage(MessageSeverity sev, std::string message);

	private:
		template <class... Args>
		void Out(MessageSeverity sev, std::format_string<Args...> fmt, Args&&... args) {
			// don't bother formatting something nobody will see
			if (!WouldLog(sev))
				return;

			OutputMessage(sev, std::format(fmt, std::forward<Args>(args)...));
		}

		std::mutex sinks_lock;
		std::vector<Sink*> sinks {};
#ifdef LESSONREEL_DEBUG
		MessageSeverity minimum_severity = MessageSeverity::Debug;
#else
		MessageSeverity minimum_severity = MessageSeverity::Info;
#endif
	};

	template <class... Args>
	inline void LogDebug(std::format_string<Args...> fmt, Args&&... args) {
		Logger::The().Debug(fmt, std::forward<Args>(args)...);
	}

	template <class... Args>
	inline void LogInfo(std::format_string<Args...> fmt, Args&&... args) {
		Logger::The().Info(fmt, std::forward<Args>(args)...);
	}

	template <class... Args>
	inline void LogWarning(std::format_string<Args...> fmt, Args&&... args) {
		Logger::The().Warning(fmt, std::forward<Args>(args)...);
	}

	template <class... Args>
	inline void LogError(std::format_string<Args...> fmt, Args&&... args) {
		Logger::The().Error(fmt, std::forward<Args>(args)...);
	}

	template <class... Args>
	inline void LogFatal(std::format_string<Args...> fmt, Args&&... args) {
		Logger::The().Fatal(fmt, std::forward<Args>(args)...);
	}

} // namespace lessonreel
