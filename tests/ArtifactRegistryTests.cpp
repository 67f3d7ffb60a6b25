// Created by block on 2026-10-17.

#include <gtest/gtest.h>

#include <liblessonreel/ArtifactRegistry.hpp>

#include <shared/Logger.hpp>

#include <support/TempDirectory.hpp>

#include <fstream>
#include <stdexcept>

namespace lessonreel {
	namespace {

		void Touch(const std::filesystem::path& path) {
			std::ofstream file(path);
			file << "x";
		}

		// collects log messages while it's in scope
		class CapturingSink : public Logger::Sink {
		public:
			CapturingSink() { Logger::The().AttachSink(*this); }
			~CapturingSink() override { Logger::The().DetachSink(*this); }

			void OutputMessage(const Logger::MessageData& data) override { messages.push_back(data); }

			bool Contains(Logger::MessageSeverity sev, std::string_view text) const {
				for (const auto& m : messages) {
					if (m.severity == sev && m.message.find(text) != std::string::npos)
						return true;
				}
				return false;
			}

			std::vector<Logger::MessageData> messages {};
		};

		// ------------------------------------------------------------------
		// Creation
		// ------------------------------------------------------------------

		TEST(ArtifactRegistryTest, CreatesUniqueDirectories) {
			test::TempDirectory root("registry");
			ArtifactRegistry a(root.Path());
			ArtifactRegistry b(root.Path());

			ASSERT_TRUE(a.Create());
			ASSERT_TRUE(b.Create());

			EXPECT_NE(a.GetDirectory(), b.GetDirectory());
			EXPECT_TRUE(std::filesystem::is_directory(a.GetDirectory()));
			EXPECT_TRUE(std::filesystem::is_directory(b.GetDirectory()));
			EXPECT_EQ(a.GetDirectory().parent_path(), root.Path());
		}

		TEST(ArtifactRegistryTest, CreateIsIdempotent) {
			test::TempDirectory root("registry");
			ArtifactRegistry registry(root.Path());

			ASSERT_TRUE(registry.Create());
			std::filesystem::path first = registry.GetDirectory();
			ASSERT_TRUE(registry.Create());
			EXPECT_EQ(registry.GetDirectory(), first);
		}

		TEST(ArtifactRegistryTest, RegistersOnce) {
			test::TempDirectory root("registry");
			ArtifactRegistry registry(root.Path());
			ASSERT_TRUE(registry.Create());

			std::filesystem::path path = registry.MakePath("slide_00_hook.png");
			EXPECT_EQ(path.parent_path(), registry.GetDirectory());

			registry.Register(path);
			registry.Register(path);
			EXPECT_EQ(registry.Count(), 1u);
			EXPECT_TRUE(registry.IsRegistered(path));
		}

		// ------------------------------------------------------------------
		// Cleanup
		// ------------------------------------------------------------------

		TEST(ArtifactRegistryTest, ReleaseDeletesEverything) {
			test::TempDirectory root("registry");
			ArtifactRegistry registry(root.Path());
			ASSERT_TRUE(registry.Create());

			std::vector<std::filesystem::path> paths;
			for (const char* name : { "a.png", "b.wav", "c.mp4" }) {
				paths.push_back(registry.MakePath(name));
				Touch(paths.back());
				registry.Register(paths.back());
			}

			EXPECT_EQ(registry.Release(), 3u);
			for (const auto& path : paths)
				EXPECT_FALSE(std::filesystem::exists(path));

			EXPECT_TRUE(root.IsEmpty());
			EXPECT_EQ(registry.Count(), 0u);
		}

		TEST(ArtifactRegistryTest, DestructorCleansUp) {
			test::TempDirectory root("registry");
			std::filesystem::path path;
			{
				ArtifactRegistry registry(root.Path());
				ASSERT_TRUE(registry.Create());
				path = registry.MakePath("segment_00.mp4");
				Touch(path);
				registry.Register(path);
			}

			EXPECT_FALSE(std::filesystem::exists(path));
			EXPECT_TRUE(root.IsEmpty());
		}

		TEST(ArtifactRegistryTest, CleansUpWhenAnExceptionUnwinds) {
			test::TempDirectory root("registry");
			std::filesystem::path path;

			try {
				ArtifactRegistry registry(root.Path());
				ASSERT_TRUE(registry.Create());
				path = registry.MakePath("segment_00.mp4");
				Touch(path);
				registry.Register(path);
				throw std::runtime_error("encoder blew up");
			}
			catch (const std::runtime_error& err) {
				EXPECT_STREQ(err.what(), "encoder blew up");
			}

			EXPECT_FALSE(path.empty());
			EXPECT_FALSE(std::filesystem::exists(path));
			EXPECT_TRUE(root.IsEmpty());
		}

		TEST(ArtifactRegistryTest, MissingFilesAreNotAnError) {
			test::TempDirectory root("registry");
			ArtifactRegistry registry(root.Path());
			ASSERT_TRUE(registry.Create());

			registry.Register(registry.MakePath("never_written.wav"));
			EXPECT_EQ(registry.Release(), 0u);
			EXPECT_TRUE(root.IsEmpty());
		}

		TEST(ArtifactRegistryTest, VanishedDirectoryIsReported) {
			test::TempDirectory root("registry");
			ArtifactRegistry registry(root.Path());
			ASSERT_TRUE(registry.Create());

			std::filesystem::path path = registry.MakePath("a.png");
			Touch(path);
			registry.Register(path);
			std::filesystem::remove_all(registry.GetDirectory());

			CapturingSink sink;
			EXPECT_EQ(registry.Release(), 0u);
			EXPECT_FALSE(registry.IsCreated());
			EXPECT_TRUE(sink.Contains(Logger::MessageSeverity::Warning, "Couldn't look inside run directory"));
			EXPECT_FALSE(sink.Contains(Logger::MessageSeverity::Info, "still holds kept files"));
		}

		TEST(ArtifactRegistryTest, ReleaseTwiceIsHarmless) {
			test::TempDirectory root("registry");
			ArtifactRegistry registry(root.Path());
			ASSERT_TRUE(registry.Create());

			std::filesystem::path path = registry.MakePath("a.png");
			Touch(path);
			registry.Register(path);

			EXPECT_EQ(registry.Release(), 1u);
			EXPECT_EQ(registry.Release(), 0u);
			EXPECT_FALSE(registry.IsCreated());
		}

		// ------------------------------------------------------------------
		// Keeping files
		// ------------------------------------------------------------------

		TEST(ArtifactRegistryTest, KeptFilesSurvive) {
			test::TempDirectory root("registry");
			ArtifactRegistry registry(root.Path());
			ASSERT_TRUE(registry.Create());

			std::filesystem::path dir = registry.GetDirectory();
			std::filesystem::path kept = registry.MakePath("final.mp4");
			std::filesystem::path temp = registry.MakePath("segment_00.mp4");
			Touch(kept);
			Touch(temp);
			registry.Register(kept);
			registry.Register(temp);

			EXPECT_TRUE(registry.Keep(kept));
			EXPECT_FALSE(registry.Keep(dir / "unknown.mp4"));

			EXPECT_EQ(registry.Release(), 1u);
			EXPECT_TRUE(std::filesystem::exists(kept));
			EXPECT_FALSE(std::filesystem::exists(temp));
			EXPECT_TRUE(std::filesystem::is_directory(dir));
		}

		TEST(ArtifactRegistryTest, UnregisteredFilesAreLeftAlone) {
			test::TempDirectory root("registry");
			ArtifactRegistry registry(root.Path());
			ASSERT_TRUE(registry.Create());

			std::filesystem::path stranger = registry.MakePath("not_mine.txt");
			Touch(stranger);

			registry.Release();
			EXPECT_TRUE(std::filesystem::exists(stranger));
		}

		TEST(ArtifactRegistryTest, KeepAllSkipsCleanup) {
			test::TempDirectory root("registry");
			std::filesystem::path path;
			{
				ArtifactRegistry registry(root.Path());
				ASSERT_TRUE(registry.Create());
				registry.SetKeepAll(true);

				path = registry.MakePath("slide_00_hook.png");
				Touch(path);
				registry.Register(path);
			}

			EXPECT_TRUE(std::filesystem::exists(path));
		}

	} // namespace
} // namespace lessonreel
