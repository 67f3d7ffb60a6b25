// Created by block on 2026-10-17.

#include <liblessonreel/ArtifactRegistry.hpp>

#include <shared/Logger.hpp>

#include <algorithm>
#include <chrono>
#include <format>
#include <random>

#include <unistd.h>

namespace lessonreel {

	ArtifactRegistry::ArtifactRegistry(std::filesystem::path temp_root)
		: temp_root(std::move(temp_root)) {
	}

	ArtifactRegistry::~ArtifactRegistry() {
		Release();
	}

	bool ArtifactRegistry::Create() {
		if (IsCreated())
			return true;

		std::error_code ec;
		std::filesystem::path root = temp_root;
		if (root.empty()) {
			root = std::filesystem::temp_directory_path(ec);
			if (ec) {
				LogError("No temporary directory available: {}", ec.message());
				return false;
			}
		}

		if (!std::filesystem::create_directories(root, ec) && ec) {
			LogError("Couldn't create temp root {}: {}", root.string(), ec.message());
			return false;
		}

		std::random_device rd;
		std::mt19937_64 rng(rd() ^ static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));

		// create_directory reports false for an existing directory, so a collision just rolls again
		for (int attempt = 0; attempt < 16; attempt++) {
			std::filesystem::path candidate = root / std::format("lessonreel-{}-{:016x}", getpid(), rng());
			if (std::filesystem::create_directory(candidate, ec)) {
				directory = candidate;
				LogDebug("Run directory is {}", directory.string());
				return true;
			}

			if (ec) {
				LogError("Couldn't create run directory {}: {}", candidate.string(), ec.message());
				return false;
			}
		}

		LogError("Couldn't find a free run directory name under {}", root.string());
		return false;
	}

	std::filesystem::path ArtifactRegistry::MakePath(std::string_view name) const {
		return directory / name;
	}

	void ArtifactRegistry::Register(const std::filesystem::path& path) {
		if (!IsRegistered(path))
			artifacts.push_back(path);
	}

	bool ArtifactRegistry::Keep(const std::filesystem::path& path) {
		auto it = std::find(artifacts.begin(), artifacts.end(), path);
		if (it == artifacts.end())
			return false;

		artifacts.erase(it);
		return true;
	}

	bool ArtifactRegistry::IsRegistered(const std::filesystem::path& path) const {
		return std::find(artifacts.begin(), artifacts.end(), path) != artifacts.end();
	}

	size_t ArtifactRegistry::Release() {
		if (keep_all) {
			if (!artifacts.empty())
				LogInfo("Keeping {} temporary files in {}", artifacts.size(), directory.string());
			artifacts.clear();
			directory.clear();
			return 0;
		}

		size_t removed = 0;
		std::error_code ec;

		// newest first, the reverse of creation
		for (auto it = artifacts.rbegin(); it != artifacts.rend(); ++it) {
			if (std::filesystem::remove(*it, ec))
				removed++;
			else if (ec)
				LogWarning("Couldn't remove {}: {}", it->string(), ec.message());
		}
		artifacts.clear();

		if (!directory.empty()) {
			// anything left in here was kept or never registered, so it isn't ours to delete
			bool empty = std::filesystem::is_empty(directory, ec);
			if (ec)
				LogWarning("Couldn't look inside run directory {}: {}", directory.string(), ec.message());
			else if (!empty)
				LogInfo("Leaving {} behind, it still holds kept files", directory.string());
			else if (!std::filesystem::remove(directory, ec) && ec)
				LogWarning("Couldn't remove run directory {}: {}", directory.string(), ec.message());
			directory.clear();
		}

		if (removed > 0)
			LogDebug("Cleaned up {} temporary files", removed);

		return removed;
	}

} // namespace lessonreel
