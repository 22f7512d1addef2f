#include "archive.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cstdint>

using namespace optipack;
using optipack::testing::make_zip;
using optipack::testing::text_member;

TEST(ArchiveTest, ZipPreservesOrderAndSubdirectories) {
    const auto zip = make_zip({
        text_member("b.txt", "second"),
        text_member("album/2024/a.txt", "first"),
    });
    EXPECT_EQ(validate_archive(zip), 2u);

    const auto members = extract_entries(zip);
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[0].name, "b.txt");
    EXPECT_EQ(members[1].name, "album/2024/a.txt");
    EXPECT_EQ(std::string(members[1].bytes.begin(), members[1].bytes.end()), "first");
}

TEST(ArchiveTest, EmptyPayloadIsRejected) {
    EXPECT_THROW(validate_archive(ByteBuffer{}), ArchiveError);
}

TEST(ArchiveTest, GarbageIsRejected) {
    const auto junk = to_buffer("this is definitely not a zip file, just some text bytes");
    EXPECT_THROW(validate_archive(junk), ArchiveError);
    EXPECT_THROW(extract_entries(junk), ArchiveError);
}

TEST(ArchiveTest, TruncatedZipIsRejected) {
    // incompressible body, so the cut lands inside the member data
    std::string body(16384, '\0');
    std::uint32_t state = 12345;
    for (auto& c : body) {
        state = state * 1103515245u + 12345u;
        c = static_cast<char>(state >> 24);
    }
    auto zip = make_zip({text_member("a.bin", body)});
    zip.resize(zip.size() / 3);
    EXPECT_THROW(extract_entries(zip), ArchiveError);
}

TEST(ArchiveTest, SanitizeEntryName) {
    EXPECT_EQ(sanitize_entry_name("a/b/c.png"), "a/b/c.png");
    EXPECT_EQ(sanitize_entry_name("/abs/c.png"), "abs/c.png");
    EXPECT_EQ(sanitize_entry_name("./x/./y.jpg"), "x/y.jpg");
    EXPECT_EQ(sanitize_entry_name("dir\\win.bmp"), "dir/win.bmp");
    EXPECT_EQ(sanitize_entry_name("../escape.png"), "");
    EXPECT_EQ(sanitize_entry_name("a/../../escape.png"), "");
    EXPECT_EQ(sanitize_entry_name(""), "");
}

TEST(ArchiveTest, TraversalMembersAreSkipped) {
    const auto zip = make_zip({
        text_member("../evil.txt", "nope"),
        text_member("ok.txt", "fine"),
    });
    const auto members = extract_entries(zip);
    ASSERT_EQ(members.size(), 1u);
    EXPECT_EQ(members[0].name, "ok.txt");
}
