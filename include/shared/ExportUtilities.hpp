// Created by block on 2024-11-14.

#pragma once

#include <filesystem>
#include <fstream>
#include <vector>

namespace lessonreel {

	/// Writes mono IEEE float samples as a WAV file.
	bool SamplesToWAV(const std::vector<float>& samples, int samplerate, std::ofstream& file);
	bool SamplesToWAV(const std::vector<float>& samples, int samplerate, const std::filesystem::path& outputPath);

	/// A buffer of digital silence, rounded to the nearest sample.
	std::vector<float> MakeSilence(double seconds, int samplerate);

} // namespace lessonreel
