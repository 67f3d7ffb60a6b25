// Created by block on 2026-10-17.

#include <gtest/gtest.h>

#include <liblessonreel/ArtifactRegistry.hpp>
#include <liblessonreel/SegmentEncoder.hpp>

#include <shared/ExportUtilities.hpp>

#include <support/MediaInspection.hpp>
#include <support/TempDirectory.hpp>
#include <support/TestLessons.hpp>

#include <chrono>
#include <cmath>
#include <numbers>

namespace lessonreel {
	namespace {

		std::vector<float> Tone(double seconds, int sample_rate) {
			std::vector<float> samples(static_cast<size_t>(seconds * sample_rate));
			for (size_t i = 0; i < samples.size(); i++)
				samples[i] = 0.3f * static_cast<float>(std::sin(2.0 * std::numbers::pi * 440.0 * i / sample_rate));
			return samples;
		}

		// an encoder that can never tell how long a narration is
		class UntimedNarrationEncoder : public SegmentEncoder {
		public:
			using SegmentEncoder::SegmentEncoder;

		protected:
			std::optional<double> NarrationDuration(const std::filesystem::path&) override { return std::nullopt; }
		};

		class SegmentEncoderTest : public ::testing::Test {
		protected:
			void SetUp() override {
				ASSERT_TRUE(registry.Create());
				image = dir / "slide.png";
				ASSERT_TRUE(test::WriteSolidImage(image, profile.width, profile.height, { 40, 90, 160 }));
			}

			test::TempDirectory dir { "segments" };
			ArtifactRegistry registry { dir.Path() };
			EncodingProfile profile = test::SmallProfile();
			std::filesystem::path image {};
		};

		// ------------------------------------------------------------------
		// Duration
		// ------------------------------------------------------------------

		TEST(SegmentDurationTest, NarrationPlusBuffer) {
			SegmentTiming timing { 5.0, 1.0 };

			EXPECT_DOUBLE_EQ(SegmentEncoder::ResolveDuration(2.0, timing, 30), 3.0);
			EXPECT_DOUBLE_EQ(SegmentEncoder::ResolveDuration(1.234, timing, 10), 2.3);
		}

		TEST(SegmentDurationTest, DefaultWithoutNarration) {
			SegmentTiming timing { 5.0, 1.0 };

			EXPECT_DOUBLE_EQ(SegmentEncoder::ResolveDuration(std::nullopt, timing, 30), 5.0);
			EXPECT_DOUBLE_EQ(SegmentEncoder::ResolveDuration(0.0, timing, 30), 5.0);
			EXPECT_DOUBLE_EQ(SegmentEncoder::ResolveDuration(-1.0, timing, 30), 5.0);
		}

		TEST(SegmentDurationTest, NeverShorterThanNarration) {
			SegmentTiming timing { 5.0, 1.0 };

			for (int fps : { 10, 24, 25, 30, 60 }) {
				for (double measured : { 0.01, 0.5, 1.0, 2.345, 7.77, 12.0, 33.3333 }) {
					double d = SegmentEncoder::ResolveDuration(measured, timing, fps);
					EXPECT_GE(d, measured + timing.trailing_buffer - 1e-6) << measured << " @ " << fps;
					EXPECT_LT(d, measured + timing.trailing_buffer + 1.0 / fps + 1e-9) << measured << " @ " << fps;

					double frames = d * fps;
					EXPECT_NEAR(frames, std::round(frames), 1e-6);
				}
			}
		}

		TEST(SegmentDurationTest, AtLeastOneFrame) {
			SegmentTiming timing { 0.0, 0.0 };
			EXPECT_DOUBLE_EQ(SegmentEncoder::ResolveDuration(std::nullopt, timing, 25), 1.0 / 25);
		}

		// ------------------------------------------------------------------
		// Encoding
		// ------------------------------------------------------------------

		TEST_F(SegmentEncoderTest, SilentSegment) {
			SegmentEncoder encoder(profile, registry);

			std::optional<Segment> segment = encoder.Encode(0, image, std::nullopt, { 2.0, 1.0 });
			ASSERT_TRUE(segment.has_value());

			EXPECT_FALSE(segment->narrated);
			EXPECT_DOUBLE_EQ(segment->duration, 2.0);
			EXPECT_EQ(segment->segment_path.filename(), "segment_00.mp4");
			EXPECT_TRUE(registry.IsRegistered(segment->segment_path));
			EXPECT_TRUE(registry.IsRegistered(segment->audio_path));

			std::optional<test::MediaInfo> info = test::InspectMedia(segment->segment_path);
			ASSERT_TRUE(info.has_value());
			EXPECT_EQ(info->video_streams, 1);
			EXPECT_EQ(info->audio_streams, 1);
			EXPECT_EQ(info->width, profile.width);
			EXPECT_EQ(info->height, profile.height);
			EXPECT_EQ(info->sample_rate, profile.sample_rate);
			EXPECT_NEAR(info->duration, 2.0, 0.1);

			std::optional<float> peak = test::AudioPeak(segment->segment_path);
			ASSERT_TRUE(peak.has_value());
			EXPECT_LT(*peak, 1e-3f);
		}

		TEST_F(SegmentEncoderTest, NarratedSegmentOutlastsNarration) {
			std::filesystem::path narration = dir / "narration.wav";
			ASSERT_TRUE(SamplesToWAV(Tone(1.5, 22050), 22050, narration));

			SegmentEncoder encoder(profile, registry);
			std::optional<Segment> segment = encoder.Encode(3, image, narration, { 5.0, 1.0 });
			ASSERT_TRUE(segment.has_value());

			EXPECT_TRUE(segment->narrated);
			EXPECT_GE(segment->duration, 2.5 - 1e-9);
			EXPECT_LE(segment->duration, 2.6 + 1e-9);
			EXPECT_EQ(segment->segment_path.filename(), "segment_03.mp4");

			std::optional<test::MediaInfo> info = test::InspectMedia(segment->segment_path);
			ASSERT_TRUE(info.has_value());
			EXPECT_NEAR(info->duration, 2.5, 0.1);

			std::optional<float> peak = test::AudioPeak(segment->segment_path);
			ASSERT_TRUE(peak.has_value());
			EXPECT_GT(*peak, 0.1f);
		}

		TEST_F(SegmentEncoderTest, UntimedNarrationIsCutAtTheDefault) {
			std::filesystem::path narration = dir / "long_narration.wav";
			ASSERT_TRUE(SamplesToWAV(Tone(3.0, 22050), 22050, narration));

			UntimedNarrationEncoder encoder(profile, registry);
			std::optional<Segment> segment = encoder.Encode(2, image, narration, { 1.0, 1.0 });
			ASSERT_TRUE(segment.has_value());

			EXPECT_TRUE(segment->narrated);
			EXPECT_DOUBLE_EQ(segment->duration, 1.0);
			EXPECT_EQ(segment->audio_path, narration);

			std::optional<test::MediaInfo> info = test::InspectMedia(segment->segment_path);
			ASSERT_TRUE(info.has_value());
			EXPECT_LE(info->duration, 1.1);
			EXPECT_GE(info->duration, 0.9);

			// the narration is still there, just shortened
			std::optional<float> peak = test::AudioPeak(segment->segment_path);
			ASSERT_TRUE(peak.has_value());
			EXPECT_GT(*peak, 0.1f);
		}

		TEST_F(SegmentEncoderTest, KeepsTheImage) {
			SegmentEncoder encoder(profile, registry);
			std::optional<Segment> segment = encoder.Encode(0, image, std::nullopt, { 1.0, 1.0 });
			ASSERT_TRUE(segment.has_value());

			std::vector<std::pair<double, double>> luma = test::DecodeLuma(segment->segment_path);
			ASSERT_EQ(luma.size(), 10u);

			// BT.601 limited range luma of (40, 90, 160)
			for (const auto& [t, y] : luma)
				EXPECT_NEAR(y, 88.0, 8.0) << t;
		}

		TEST_F(SegmentEncoderTest, LetterboxesOtherSizes) {
			std::filesystem::path square = dir / "square.png";
			ASSERT_TRUE(test::WriteSolidImage(square, 50, 50, { 255, 255, 255 }));

			SegmentEncoder encoder(profile, registry);
			std::optional<Segment> segment = encoder.Encode(1, square, std::nullopt, { 1.0, 1.0 });
			ASSERT_TRUE(segment.has_value());

			std::optional<test::MediaInfo> info = test::InspectMedia(segment->segment_path);
			ASSERT_TRUE(info.has_value());
			EXPECT_EQ(info->width, profile.width);
			EXPECT_EQ(info->height, profile.height);
		}

		TEST_F(SegmentEncoderTest, MissingImageFails) {
			SegmentEncoder encoder(profile, registry);
			EXPECT_FALSE(encoder.Encode(0, dir / "nope.png", std::nullopt, { 1.0, 1.0 }).has_value());
		}

		TEST_F(SegmentEncoderTest, RejectsOddDimensions) {
			profile.width = 107;
			SegmentEncoder encoder(profile, registry);

			EXPECT_FALSE(encoder.Prepare());
			EXPECT_FALSE(encoder.Encode(0, image, std::nullopt, { 1.0, 1.0 }).has_value());
		}

		TEST_F(SegmentEncoderTest, ExpiredDeadlineFailsAndCleansUp) {
			profile.media_timeout = std::chrono::milliseconds(0);
			std::filesystem::path run = registry.GetDirectory();

			SegmentEncoder encoder(profile, registry);
			EXPECT_FALSE(encoder.Encode(0, image, std::nullopt, { 2.0, 1.0 }).has_value());
			EXPECT_GT(registry.Count(), 0u);

			registry.Release();
			EXPECT_FALSE(std::filesystem::exists(run / "segment_00.mp4"));
			EXPECT_FALSE(std::filesystem::exists(run / "segment_00_silence.wav"));
			EXPECT_FALSE(std::filesystem::exists(run));
		}

		TEST_F(SegmentEncoderTest, PicksAnEncoder) {
			SegmentEncoder encoder(profile, registry);
			ASSERT_TRUE(encoder.Prepare());
			ASSERT_NE(encoder.GetVideoCodec(), nullptr);
		}

	} // namespace
} // namespace lessonreel
