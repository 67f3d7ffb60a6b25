// Created by block on 2026-10-17.

#pragma once

#include <atomic>
#include <filesystem>
#include <format>
#include <string_view>
#include <system_error>

#include <unistd.h>

namespace lessonreel::test {

	/// A scratch directory for one test, removed with everything in it afterwards.
	class TempDirectory {
	public:
		explicit TempDirectory(std::string_view tag = "test") {
			static std::atomic<int> counter = 0;
			path = std::filesystem::temp_directory_path() / std::format("lessonreel-{}-{}-{}", tag, getpid(), counter++);
			std::filesystem::remove_all(path);
			std::filesystem::create_directories(path);
		}

		~TempDirectory() {
			std::error_code ec;
			std::filesystem::remove_all(path, ec);
		}

		TempDirectory(const TempDirectory&) = delete;
		TempDirectory& operator=(const TempDirectory&) = delete;

		const std::filesystem::path& Path() const { return path; }
		std::filesystem::path operator/(std::string_view name) const { return path / name; }

		bool IsEmpty() const { return std::filesystem::is_empty(path); }

	private:
		std::filesystem::path path;
	};

} // namespace lessonreel::test
