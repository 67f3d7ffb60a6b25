// Created by block on 2026-10-17.

#pragma once

#include <liblessonreel/SegmentEncoder.hpp>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace lessonreel {

	/// What happens when the segments add up to more than the cap.
	enum class TruncationPolicy {
		HardCut, // cut at the cap, even mid sentence
		DropTrailingSegments // keep only whole segments that fit
	};

	std::optional<TruncationPolicy> PolicyFromName(std::string_view name);
	std::string_view PolicyName(TruncationPolicy policy);

	struct TimelineSpan {
		size_t index = 0; // into the segment list
		double start = 0.0; // in the output, seconds
		double kept = 0.0; // seconds of the segment that make it into the output
		bool partial = false;
	};

	struct TimelinePlan {
		std::vector<TimelineSpan> spans {};
		double total = 0.0;
		double uncapped_total = 0.0;
		bool truncated = false;
	};

	struct AssemblyResult {
		std::filesystem::path output_path {};
		double total_duration = 0.0; // whole video frames, so a cap between frames reads as the frame before it
		bool truncated = false;
		size_t segments_kept = 0;
		size_t segments_total = 0;
	};

	/// Joins segments into the final file by copying packets, without re-encoding.
	class TimelineAssembler {
	public:
		explicit TimelineAssembler(std::chrono::milliseconds timeout);

		/// Where each segment lands in the output. A cap of zero or less means no cap.
		static TimelinePlan PlanTimeline(const std::vector<double>& durations, double cap, TruncationPolicy policy);

		/// seconds rounded down to a whole number of frames. Left alone if fps isn't positive.
		static double SnapToFrames(double seconds, double fps);

		/// Segments must all share one stream layout. A failed assembly leaves nothing at output.
		std::optional<AssemblyResult> Assemble(const std::vector<Segment>& segments, const std::filesystem::path& output, double cap, TruncationPolicy policy);

	private:
		bool Concatenate(const std::vector<Segment>& segments, const TimelinePlan& plan, const std::filesystem::path& output, double& fps);

		std::chrono::milliseconds timeout;
	};

} // namespace lessonreel
