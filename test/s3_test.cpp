#include <gtest/gtest.h>

#include "./test_utils.hpp"

#include "../src/s3/s3.hpp"

TEST(s3_test, object_key) {
    S3Destination destination("archive", "http://play.min.io", "Q3AM3UQ867SPQQA43P2F", "zuf+tfteSlswRu7BJ86wekitnifILbZam1KYY3TG", "test", "", "relay/videos");
    EXPECT_EQ(destination.get_id(), "archive");
    EXPECT_EQ(destination.object_key("clip.mp4"), "relay/videos/clip.mp4");

    S3Destination root("archive", "http://play.min.io", "Q3AM3UQ867SPQQA43P2F", "zuf+tfteSlswRu7BJ86wekitnifILbZam1KYY3TG", "test", "", "");
    EXPECT_EQ(root.object_key("clip.mp4"), "clip.mp4");
}

TEST(s3_test, unknown_session) {
    S3Destination destination("archive", "http://play.min.io", "Q3AM3UQ867SPQQA43P2F", "zuf+tfteSlswRu7BJ86wekitnifILbZam1KYY3TG", "test", "", "");
    const upload_session_t session { "no-such-upload" };
    const auto transfer_ret = destination.transfer(session, 0, "data");
    EXPECT_TRUE(transfer_ret.has_value());
    const auto finish_ret = destination.finish(session, upload_metadata_t { "clip.mp4", "Clip", "Clip", std::nullopt });
    ASSERT_TRUE(std::holds_alternative<finish_error_t>(finish_ret));
    EXPECT_FALSE(std::get<finish_error_t>(finish_ret).secondary_artifact);
    // nothing to abort
    destination.abandon(session);
}

TEST(s3_test, factory) {
    const destination_config_t config { "archive", DESTINATION_KIND_S3, "http://play.min.io", "test", "key", "secret", "", "relay" };
    const auto ret = make_destination(config);
    ASSERT_TRUE(std::holds_alternative<std::unique_ptr<UploadDestination>>(ret));
    EXPECT_EQ(std::get<std::unique_ptr<UploadDestination>>(ret)->get_id(), "archive");
}
