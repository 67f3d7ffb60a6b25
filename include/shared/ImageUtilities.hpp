// Created by block on 2024-11-14.

#pragma once

#include <SDL3/SDL_surface.h>

#include <filesystem>

extern "C" {
#include <libswscale/swscale.h>
}

namespace lessonreel {

	/// Loads an image and converts it to RGBA32. Returns nullptr on failure.
	SDL_Surface* LoadImage(const std::filesystem::path& inputPath);
	bool SaveImage(SDL_Surface* surface, const std::filesystem::path& outputPath);

	SDL_Surface* RescaleImage(SDL_Surface* surface, int width, int height, int flags = SWS_BICUBIC);

	/// Scales the surface into a width x height RGBA32 surface, keeping the aspect ratio and padding with black.
	SDL_Surface* LetterboxImage(SDL_Surface* surface, int width, int height, int flags = SWS_BICUBIC);

} // namespace lessonreel
