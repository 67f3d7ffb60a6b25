// Created by block on 2024-11-12.

#include <shared/Rect.hpp>

#include <algorithm>
#include <cmath>

namespace lessonreel {
	Rect Rect::CreateLetterbox(int box_width, int box_height, Rect rect) {
		Rect ret { 0, 0, box_width, box_height };

		if (rect.w <= 0 || rect.h <= 0)
			return ret;

		// same as ffmpeg's force_original_aspect_ratio=decrease
		float scalar = std::min(box_width / (float)rect.w, box_height / (float)rect.h);

		ret.w = std::clamp((int)std::lround(rect.w * scalar), 1, box_width);
		ret.h = std::clamp((int)std::lround(rect.h * scalar), 1, box_height);
		ret.x = (box_width - ret.w) / 2;
		ret.y = (box_height - ret.h) / 2;

		return ret;
	}
} // namespace lessonreel
