// Created by block on 2024-11-12.

#pragma once

namespace lessonreel {
	struct Rect {
		int x, y;
		int w, h;

		/// Fits rect inside a box of the given size, keeping its aspect ratio and centering it.
		static Rect CreateLetterbox(int box_width, int box_height, Rect rect);
	};
} // namespace lessonreel
