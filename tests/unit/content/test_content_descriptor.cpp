// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file test_content_descriptor.cpp
 * @brief Unit tests for content_descriptor and content_location
 */

#include <gtest/gtest.h>

#include <kcenon/ims_session/content/content_descriptor.h>
#include <kcenon/ims_session/content/content_location.h>

#include <atomic>
#include <thread>
#include <vector>

namespace kcenon::ims_session::test {

// =============================================================================
// content_location Tests
// =============================================================================

class ContentLocationTest : public ::testing::Test {};

TEST_F(ContentLocationTest, FromPathBuildsFileUri) {
    auto loc = content_location::from_path("/data/ft/photo.jpg");

    EXPECT_EQ(loc.uri(), "file:///data/ft/photo.jpg");
    EXPECT_EQ(loc.path(), std::filesystem::path("/data/ft/photo.jpg"));
    EXPECT_FALSE(loc.empty());
}

TEST_F(ContentLocationTest, FromPathEscapesReservedCharacters) {
    auto loc = content_location::from_path("/data/ft/holiday photo#1.jpg");
    EXPECT_EQ(loc.uri(), "file:///data/ft/holiday%20photo%231.jpg");
}

TEST_F(ContentLocationTest, FromPathNormalizes) {
    auto loc = content_location::from_path("/data/ft/../ft/./photo.jpg");
    EXPECT_EQ(loc.uri(), "file:///data/ft/photo.jpg");
}

TEST_F(ContentLocationTest, RelativePathMadeAbsolute) {
    auto loc = content_location::from_path("photo.jpg");
    EXPECT_TRUE(loc.path().is_absolute());
}

TEST_F(ContentLocationTest, FromUriDecodesPath) {
    auto loc = content_location::from_uri("file:///data/ft/holiday%20photo.jpg");

    ASSERT_TRUE(loc.has_value());
    EXPECT_EQ(loc.value().path(), std::filesystem::path("/data/ft/holiday photo.jpg"));
}

TEST_F(ContentLocationTest, FromUriMatchesFromPath) {
    auto from_path = content_location::from_path("/data/ft/a b.jpg");
    auto from_uri = content_location::from_uri(from_path.uri());

    ASSERT_TRUE(from_uri.has_value());
    EXPECT_EQ(from_uri.value(), from_path);
}

TEST_F(ContentLocationTest, FromUriRejectsOtherSchemes) {
    auto loc = content_location::from_uri("https://ftcontent.example.com/photo.jpg");

    ASSERT_FALSE(loc.has_value());
    EXPECT_EQ(loc.error().code, error_code::invalid_argument);
}

TEST_F(ContentLocationTest, FromUriRejectsBadEscapes) {
    EXPECT_FALSE(content_location::from_uri("file:///data/%G1.jpg").has_value());
    EXPECT_FALSE(content_location::from_uri("file:///data/%2").has_value());
}

TEST_F(ContentLocationTest, FromUriRequiresAbsolutePath) {
    EXPECT_FALSE(content_location::from_uri("file://").has_value());
}

// =============================================================================
// content_descriptor Tests
// =============================================================================

class ContentDescriptorTest : public ::testing::Test {
protected:
    static auto make_info() -> content_info {
        content_info info;
        info.name = "photo.jpg";
        info.size = 1000;
        info.mime_type = "image/jpeg";
        return info;
    }
};

TEST_F(ContentDescriptorTest, AttributesFixedAtConstruction) {
    content_descriptor content(make_info());

    EXPECT_EQ(content.name(), "photo.jpg");
    EXPECT_EQ(content.size(), 1000u);
    EXPECT_EQ(content.mime_type(), "image/jpeg");
    EXPECT_FALSE(content.sha256().has_value());
}

TEST_F(ContentDescriptorTest, DefaultMimeType) {
    content_info info;
    EXPECT_EQ(info.mime_type, "application/octet-stream");
}

TEST_F(ContentDescriptorTest, LocationUnsetInitially) {
    content_descriptor content(make_info());

    EXPECT_FALSE(content.has_location());
    EXPECT_FALSE(content.location().has_value());
}

TEST_F(ContentDescriptorTest, LocationAssignedOnce) {
    content_descriptor content(make_info());

    auto first = content.set_location(content_location::from_path("/data/ft/photo.jpg"));
    auto second = content.set_location(content_location::from_path("/data/ft/other.jpg"));

    EXPECT_TRUE(first.has_value());
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, error_code::location_already_set);
    ASSERT_TRUE(content.location().has_value());
    EXPECT_EQ(content.location()->uri(), "file:///data/ft/photo.jpg");
}

TEST_F(ContentDescriptorTest, EmptyLocationRejected) {
    content_descriptor content(make_info());

    auto r = content.set_location(content_location{});

    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::invalid_argument);
    EXPECT_FALSE(content.has_location());
}

TEST_F(ContentDescriptorTest, ConcurrentAssignmentHasSingleWinner) {
    content_descriptor content(make_info());
    std::atomic<int> winners{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&content, &winners, i] {
            auto loc = content_location::from_path("/data/ft/" + std::to_string(i) + ".jpg");
            if (content.set_location(loc)) {
                ++winners;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
}

TEST_F(ContentDescriptorTest, EpochExpirationNeverExpires) {
    content_descriptor content(make_info());
    EXPECT_FALSE(content.is_expired());
}

TEST_F(ContentDescriptorTest, ExpiresAtExpirationInstant) {
    auto info = make_info();
    auto now = std::chrono::system_clock::now();
    info.expiration = now;
    content_descriptor content(info);

    EXPECT_FALSE(content.is_expired(now - std::chrono::seconds(1)));
    EXPECT_TRUE(content.is_expired(now));
    EXPECT_TRUE(content.is_expired(now + std::chrono::hours(1)));
}

}  // namespace kcenon::ims_session::test
