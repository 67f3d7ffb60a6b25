// Created by block on 2024-11-14.

#include <shared/ExportUtilities.hpp>
#include <shared/Logger.hpp>

#include <cmath>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace lessonreel {

	static void stream_add_str(std::ofstream& file, std::string_view str) {
		file.write(str.data(), str.length());
	}

	template<typename T>
	concept arithmetic = std::integral<T> or std::floating_point<T>;

	// WAV is little endian, as are we
	template <typename T> requires arithmetic<T>
	static void stream_add_num(std::ofstream& file, T num) {
		char arr[sizeof(T)] = {};
		std::memcpy(&arr[0], &num, sizeof(T));

		file.write(&arr[0], sizeof(T));
	}

	bool SamplesToWAV(const std::vector<float>& samples, int samplerate, std::ofstream& file) {
		std::streampos startPos = file.tellp();
		const int channels = 1;
		const int bitDepth = sizeof(float) * 8;

		// Header chunk
		//
		stream_add_str(file, "RIFF");

		// we'll come back to this
		stream_add_num<std::uint32_t>(file, 0); // @0x4

		// WAVE chunk
		//
		stream_add_str(file, "WAVE");

		// fmt chunk
		//
		stream_add_str(file, "fmt ");
		stream_add_num<std::uint32_t>(file, 16); // chunk size
		stream_add_num<std::uint16_t>(file, 0x0003); // format type, IEEE float
		stream_add_num<std::uint16_t>(file, channels);
		stream_add_num<std::uint32_t>(file, samplerate);

		std::uint32_t bytesPerSec = (channels * samplerate * bitDepth) / 8;
		stream_add_num<std::uint32_t>(file, bytesPerSec);

		std::uint16_t blockAlign = channels * (bitDepth / 8);
		stream_add_num<std::uint16_t>(file, blockAlign);

		stream_add_num<std::uint16_t>(file, bitDepth);

		// fact chunk
		//
		stream_add_str(file, "fact");
		stream_add_num<std::uint32_t>(file, 4); // chunk size
		stream_add_num<std::uint32_t>(file, samples.size());

		// DATA chunk
		//
		stream_add_str(file, "data");
		stream_add_num<std::uint32_t>(file, samples.size() * sizeof(float));
		for (float smp : samples)
			stream_add_num(file, smp);

		// seek back for filesize
		std::streampos endPos = file.tellp();
		file.seekp(startPos + std::streamoff(4));
		stream_add_num<std::uint32_t>(file, static_cast<std::uint32_t>(endPos - startPos) - 8);
		file.seekp(endPos);

		return file.good();
	}

	bool SamplesToWAV(const std::vector<float>& samples, int samplerate, const std::filesystem::path& outputPath) {
		std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
		if (!file.is_open()) {
			LogError("Couldn't open {} for writing", outputPath.string());
			return false;
		}

		if (!SamplesToWAV(samples, samplerate, file)) {
			LogError("Failed writing WAV data to {}", outputPath.string());
			return false;
		}

		file.close();
		return !file.fail();
	}

	std::vector<float> MakeSilence(double seconds, int samplerate) {
		if (seconds <= 0.0 || samplerate <= 0)
			return {};

		return std::vector<float>(static_cast<size_t>(std::llround(seconds * samplerate)), 0.f);
	}

} // namespace lessonreel
