#include "errors.hpp"
#include "progress_event.hpp"
#include <gtest/gtest.h>

using namespace optipack;

TEST(ProgressEventTest, ProgressWireFormat) {
    const auto j = to_json(ProgressEvent{Progress{50}});
    EXPECT_EQ(j.at("type"), "progress");
    EXPECT_EQ(j.at("percent"), 50);
}

TEST(ProgressEventTest, FileCompleteCarriesResult) {
    OptimizedResult r;
    r.name = "photos/b.png";
    r.output_name = "photos/b.jpg";
    r.format = ImageFormat::Png;
    r.original_size = 1000;
    r.optimized_size = 1200;
    r.saving_percentage = compute_saving_percentage(1000, 1200);
    r.status = ResultStatus::Success;
    r.converted = true;

    const auto j = to_json(ProgressEvent{FileComplete{r}});
    EXPECT_EQ(j.at("type"), "file_complete");
    EXPECT_EQ(j.at("name"), "photos/b.png");
    EXPECT_EQ(j.at("output_name"), "photos/b.jpg");
    EXPECT_EQ(j.at("format"), "png");
    EXPECT_EQ(j.at("status"), "success");
    EXPECT_DOUBLE_EQ(j.at("saving_percentage").get<double>(), -20.0);
    EXPECT_TRUE(j.at("converted").get<bool>());
    EXPECT_FALSE(j.contains("error_detail"));

    const auto decoded = decode_event(encode_event(FileComplete{r}));
    ASSERT_TRUE(std::holds_alternative<FileComplete>(decoded));
    EXPECT_EQ(std::get<FileComplete>(decoded).result, r);
}

TEST(ProgressEventTest, ErrorDetailOnlyWhenPresent) {
    OptimizedResult r;
    r.name = "bad.jpg";
    r.status = ResultStatus::Error;
    r.error_detail = "Premature end of JPEG file";
    const auto j = to_json(ProgressEvent{FileComplete{r}});
    EXPECT_EQ(j.at("status"), "error");
    EXPECT_EQ(j.at("error_detail"), "Premature end of JPEG file");
}

TEST(ProgressEventTest, TerminalEvents) {
    EXPECT_TRUE(is_terminal(Complete{"abc"}));
    EXPECT_TRUE(is_terminal(Failed{"boom"}));
    EXPECT_FALSE(is_terminal(Progress{100}));
    EXPECT_EQ(event_type(Complete{"abc"}), "complete");
    EXPECT_EQ(event_type(Failed{"boom"}), "failed");

    const auto failed = decode_event(R"({"type":"failed","reason":"archive error"})");
    ASSERT_TRUE(std::holds_alternative<Failed>(failed));
    EXPECT_EQ(std::get<Failed>(failed).reason, "archive error");
}

TEST(ProgressEventTest, DecodeRejectsMalformedMessages) {
    EXPECT_THROW(decode_event("not json"), ValidationError);
    EXPECT_THROW(decode_event(R"({"type":"unknown"})"), ValidationError);
    EXPECT_THROW(decode_event(R"({"type":"progress"})"), ValidationError);
}
