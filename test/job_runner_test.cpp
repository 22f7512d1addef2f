#include "artifact_store.hpp"
#include "file_utils.hpp"
#include "job_runner.hpp"
#include "jpeg_optimizer.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace optipack;
using namespace optipack::testing;

class JobRunnerTest : public ::testing::Test {
protected:
    ScopedTempDir dir{"runner-test"};
    JobRegistry registry;
    EventChannelHub channels;
    ArtifactStore artifacts{dir.path()};
    OptimizerRegistry optimizers;
    ImageTransformer transformer{optimizers};
    JobRunner runner{registry, channels, artifacts, transformer};

    struct Outcome {
        JobId id;
        std::vector<ProgressEvent> events;
    };

    Outcome run(const ByteBuffer& zip, const OptimizationOptions& options = {}) {
        Outcome outcome;
        outcome.id = registry.create(options);
        const auto subscription = channels.open(outcome.id)->subscribe();
        runner.run(outcome.id, zip, options);
        outcome.events = drain(*subscription, std::chrono::seconds(5));
        return outcome;
    }

    std::vector<ArchiveMember> artifact_of(const ProgressEvent& event) {
        return extract_entries(artifacts.load(std::get<Complete>(event).artifact_id));
    }

    static std::vector<std::string> names(const std::vector<ArchiveMember>& members) {
        std::vector<std::string> out;
        for (const auto& m : members) out.push_back(m.name);
        return out;
    }
};

TEST_F(JobRunnerTest, MixedArchiveProducesOrderedEvents) {
    const auto zip = make_zip({{"a.jpg", make_jpeg(120, 90)},
                               {"b.png", make_png(64, 48)},
                               text_member("c.txt", "readme")});
    OptimizationOptions options;
    options.jpeg_quality = 80;
    options.convert_png_to_jpeg = true;
    const auto outcome = run(zip, options);

    ASSERT_EQ(outcome.events.size(), 5u);
    ASSERT_TRUE(std::holds_alternative<FileComplete>(outcome.events[0]));
    EXPECT_EQ(std::get<FileComplete>(outcome.events[0]).result.name, "a.jpg");
    EXPECT_EQ(std::get<Progress>(outcome.events[1]).percent, 50);
    ASSERT_TRUE(std::holds_alternative<FileComplete>(outcome.events[2]));
    const auto& png = std::get<FileComplete>(outcome.events[2]).result;
    EXPECT_EQ(png.name, "b.png");
    EXPECT_EQ(png.status, ResultStatus::Success);
    EXPECT_TRUE(png.converted);
    EXPECT_EQ(std::get<FileComplete>(outcome.events[0]).result.status, ResultStatus::Success);
    EXPECT_EQ(std::get<Progress>(outcome.events[3]).percent, 100);
    ASSERT_TRUE(std::holds_alternative<Complete>(outcome.events[4]));

    const auto members = artifact_of(outcome.events[4]);
    EXPECT_EQ(names(members), (std::vector<std::string>{"a.jpg", "b.jpg"}));
    EXPECT_NO_THROW((void)JpegOptimizer::decode(members[1].bytes));

    const auto snapshot = registry.lookup(outcome.id);
    EXPECT_EQ(snapshot.state, JobState::Done);
    EXPECT_EQ(snapshot.total_entries, 2u);
    EXPECT_EQ(snapshot.processed_entries, 2u);
    EXPECT_EQ(snapshot.results.size(), 2u);
    EXPECT_EQ(snapshot.artifact_id, std::get<Complete>(outcome.events[4]).artifact_id);
}

TEST_F(JobRunnerTest, CorruptImageDoesNotFailTheJob) {
    auto broken = make_jpeg(120, 90);
    broken.resize(broken.size() / 2);
    const auto zip = make_zip({{"broken.jpg", broken}, {"ok.png", make_png(32, 32)}});
    const auto outcome = run(zip);

    ASSERT_FALSE(outcome.events.empty());
    ASSERT_TRUE(std::holds_alternative<Complete>(outcome.events.back()));
    const auto& first = std::get<FileComplete>(outcome.events[0]).result;
    EXPECT_EQ(first.status, ResultStatus::Error);
    EXPECT_TRUE(first.error_detail.has_value());

    const auto members = artifact_of(outcome.events.back());
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[0].bytes, broken);
}

TEST_F(JobRunnerTest, OversizedImageHeaderIsAnEntryErrorNotAJobFailure) {
    const auto huge = make_png_header_only(900000, 900000);
    const auto zip = make_zip({{"huge.png", huge}, {"ok.jpg", make_jpeg(64, 48)}});
    OptimizationOptions options;
    options.convert_png_to_jpeg = true;
    const auto outcome = run(zip, options);

    ASSERT_FALSE(outcome.events.empty());
    ASSERT_TRUE(std::holds_alternative<Complete>(outcome.events.back()));

    std::vector<OptimizedResult> results;
    for (const auto& event : outcome.events) {
        if (const auto* file = std::get_if<FileComplete>(&event)) results.push_back(file->result);
    }
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].name, "huge.png");
    EXPECT_EQ(results[0].status, ResultStatus::Error);
    EXPECT_TRUE(results[0].error_detail.has_value());
    EXPECT_EQ(results[1].status, ResultStatus::Success);

    const auto members = artifact_of(outcome.events.back());
    EXPECT_EQ(names(members), (std::vector<std::string>{"huge.png", "ok.jpg"}));
    EXPECT_EQ(members[0].bytes, huge);
    EXPECT_EQ(registry.lookup(outcome.id).state, JobState::Done);
}

TEST_F(JobRunnerTest, ArchiveWithoutImagesFails) {
    const auto outcome = run(make_zip({text_member("notes.txt", "nothing to see")}));

    ASSERT_EQ(outcome.events.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<Failed>(outcome.events[0]));
    EXPECT_EQ(std::get<Failed>(outcome.events[0]).reason, "archive contains no image entries");
    EXPECT_EQ(registry.lookup(outcome.id).state, JobState::Failed);
    EXPECT_EQ(registry.stats().jobs_failed, 1u);
}

TEST_F(JobRunnerTest, UnreadableArchiveFails) {
    const auto outcome = run(to_buffer("this is not a zip file at all"));

    ASSERT_EQ(outcome.events.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<Failed>(outcome.events[0]));
    EXPECT_EQ(registry.lookup(outcome.id).state, JobState::Failed);
}

TEST_F(JobRunnerTest, ConvertedNameAvoidsExistingEntry) {
    const auto zip = make_zip({{"b.png", make_png(40, 40)}, {"b.jpg", make_jpeg(40, 40)}});
    OptimizationOptions options;
    options.convert_png_to_jpeg = true;
    const auto outcome = run(zip, options);

    ASSERT_TRUE(std::holds_alternative<Complete>(outcome.events.back()));
    const auto members = artifact_of(outcome.events.back());
    EXPECT_EQ(names(members), (std::vector<std::string>{"b-1.jpg", "b.jpg"}));
    EXPECT_NO_THROW((void)JpegOptimizer::decode(members[0].bytes));

    const auto& converted = std::get<FileComplete>(outcome.events[0]).result;
    EXPECT_TRUE(converted.converted);
    EXPECT_EQ(converted.name, "b.png");
    EXPECT_EQ(converted.output_name, "b-1.jpg");
}

TEST_F(JobRunnerTest, CancelledJobStopsBeforeNextEntry) {
    const auto zip = make_zip({{"a.jpg", make_jpeg(40, 40)}});
    const JobId id = registry.create({});
    const auto subscription = channels.open(id)->subscribe();
    std::stop_source worker;
    worker.request_stop();
    runner.run(id, zip, {}, worker.get_token());

    const auto events = drain(*subscription, std::chrono::seconds(5));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(std::get<Failed>(events[0]).reason, "job cancelled");
    EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

TEST_F(JobRunnerTest, JobThatAlreadyFailedIsNotStarted) {
    const JobId id = registry.create({});
    const auto channel = channels.open(id);
    ASSERT_TRUE(registry.mark_failed(id, "shutting down"));

    runner.run(id, make_zip({{"a.jpg", make_jpeg(40, 40)}}), {});
    EXPECT_EQ(channel->backlog(), 0u);
    EXPECT_EQ(registry.lookup(id).failure_reason, "shutting down");
}
