// Created by block on 2024-11-14.

#include <shared/ImageUtilities.hpp>

#include <shared/Logger.hpp>
#include <shared/Rect.hpp>

#include <SDL3/SDL.h>
#include <SDL3_image/SDL_image.h>

extern "C" {
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

namespace lessonreel {

	SDL_Surface* LoadImage(const std::filesystem::path& inputPath) {
		if (inputPath.empty()) {
			LogError("Need a file to load!");
			return nullptr;
		}

		SDL_Surface* surfOrig = IMG_Load(inputPath.c_str());
		if (!surfOrig) {
			LogError("SDL3_image failed to load image {}: {}", inputPath.string(), SDL_GetError());
			return nullptr;
		}

		if (surfOrig->format == SDL_PIXELFORMAT_RGBA32)
			return surfOrig;

		SDL_Surface* surfConv = SDL_ConvertSurface(surfOrig, SDL_PIXELFORMAT_RGBA32);
		SDL_DestroySurface(surfOrig);

		if (!surfConv)
			LogError("Couldn't convert {} to RGBA32: {}", inputPath.string(), SDL_GetError());

		return surfConv;
	}

	bool SaveImage(SDL_Surface* surface, const std::filesystem::path& outputPath) {
		if (surface == nullptr || outputPath.empty()) {
			LogError("Need a surface and a path to save an image!");
			return false;
		}

		if (!IMG_SavePNG(surface, outputPath.c_str())) {
			LogError("SDL3_image failed to save {}: {}", outputPath.string(), SDL_GetError());
			return false;
		}

		return true;
	}

	SDL_Surface* RescaleImage(SDL_Surface* surf, int width, int height, int flags /*= SWS_BICUBIC*/) {
		// convert orig to RGBA32
		SDL_Surface* surfConv = SDL_ConvertSurface(surf, SDL_PIXELFORMAT_RGBA32);
		if (!surfConv) {
			LogError("Couldn't convert surface to RGBA32: {}", SDL_GetError());
			return nullptr;
		}

		SDL_Surface* surfOut = SDL_CreateSurface(width, height, SDL_PIXELFORMAT_RGBA32);
		if (!surfOut) {
			LogError("Couldn't create {}x{} surface: {}", width, height, SDL_GetError());
			SDL_DestroySurface(surfConv);
			return nullptr;
		}

		SwsContext* sws_ctx = sws_getContext(
			surfConv->w, surfConv->h, AV_PIX_FMT_RGBA,
			surfOut->w, surfOut->h, AV_PIX_FMT_RGBA,
			flags, nullptr, nullptr, nullptr
		);

		if (!sws_ctx) {
			LogError("Couldn't get a scaling context for {}x{} -> {}x{}", surfConv->w, surfConv->h, width, height);
			SDL_DestroySurface(surfConv);
			SDL_DestroySurface(surfOut);
			return nullptr;
		}

		// SDL rows can be padded, so the pitch is the linesize
		const std::uint8_t* src_data[4] = { static_cast<const std::uint8_t*>(surfConv->pixels), nullptr, nullptr, nullptr };
		int src_linesize[4] = { surfConv->pitch, 0, 0, 0 };
		std::uint8_t* dst_data[4] = { static_cast<std::uint8_t*>(surfOut->pixels), nullptr, nullptr, nullptr };
		int dst_linesize[4] = { surfOut->pitch, 0, 0, 0 };

		sws_scale(sws_ctx, src_data, src_linesize, 0, surfConv->h, dst_data, dst_linesize);

		sws_freeContext(sws_ctx);
		SDL_DestroySurface(surfConv);

		return surfOut;
	}

	SDL_Surface* LetterboxImage(SDL_Surface* surf, int width, int height, int flags /*= SWS_BICUBIC*/) {
		Rect letterbox = Rect::CreateLetterbox(width, height, { 0, 0, surf->w, surf->h });

		SDL_Surface* surfScaled = RescaleImage(surf, letterbox.w, letterbox.h, flags);
		if (!surfScaled)
			return nullptr;

		SDL_Surface* surfOut = SDL_CreateSurface(width, height, SDL_PIXELFORMAT_RGBA32);
		if (!surfOut) {
			LogError("Couldn't create {}x{} surface: {}", width, height, SDL_GetError());
			SDL_DestroySurface(surfScaled);
			return nullptr;
		}

		SDL_FillSurfaceRect(surfOut, nullptr, SDL_MapSurfaceRGBA(surfOut, 0, 0, 0, 255));

		SDL_Rect dst { letterbox.x, letterbox.y, letterbox.w, letterbox.h };
		SDL_SetSurfaceBlendMode(surfScaled, SDL_BLENDMODE_NONE);
		bool blitted = SDL_BlitSurface(surfScaled, nullptr, surfOut, &dst);
		SDL_DestroySurface(surfScaled);

		if (!blitted) {
			LogError("Couldn't letterbox image: {}", SDL_GetError());
			SDL_DestroySurface(surfOut);
			return nullptr;
		}

		return surfOut;
	}

} // namespace lessonreel
