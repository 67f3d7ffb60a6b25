// Created by block on 2026-10-17.

#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

namespace lessonreel {

	/// Owns every temporary file of one pipeline run, inside a directory unique to the run.
	/// Everything registered is deleted by Release(), which the destructor calls, so cleanup happens on every way out of a run.
	class ArtifactRegistry {
	public:
		explicit ArtifactRegistry(std::filesystem::path temp_root = {});
		~ArtifactRegistry();

		ArtifactRegistry(const ArtifactRegistry&) = delete;
		ArtifactRegistry& operator=(const ArtifactRegistry&) = delete;

		/// Creates the run directory. Returns false if it couldn't be created.
		bool Create();
		bool IsCreated() const { return !directory.empty(); }

		const std::filesystem::path& GetDirectory() const { return directory; }

		/// A path inside the run directory. Not registered until Register is called.
		std::filesystem::path MakePath(std::string_view name) const;

		void Register(const std::filesystem::path& path);
		/// Stops tracking path so it survives the run. Returns false if it wasn't registered.
		bool Keep(const std::filesystem::path& path);

		bool IsRegistered(const std::filesystem::path& path) const;
		size_t Count() const { return artifacts.size(); }
		const std::vector<std::filesystem::path>& GetArtifacts() const { return artifacts; }

		/// Leave everything on disk at release, for debugging.
		void SetKeepAll(bool keep) { keep_all = keep; }

		/// Deletes every registered artifact and the run directory. Failures are logged, never thrown.
		/// Returns the number of files deleted.
		size_t Release();

	private:
		std::filesystem::path temp_root;
		std::filesystem::path directory {};
		std::vector<std::filesystem::path> artifacts {};
		bool keep_all = false;
	};

} // namespace lessonreel
