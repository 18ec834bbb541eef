#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <gtest/gtest.h>

#include "../src/config/config.hpp"
#include "../src/source/source_id.hpp"
#include "test_utils.hpp"

TEST(config_test, graph_destination) {
    const auto ret = parse_destination_spec("id=fb, type=graph, page=123, token=abc");
    ASSERT_TRUE(std::holds_alternative<destination_config_t>(ret));
    const auto &config = std::get<destination_config_t>(ret);
    EXPECT_EQ(config.id, "fb");
    EXPECT_EQ(config.kind, DESTINATION_KIND_GRAPH);
    EXPECT_EQ(config.endpoint, DEFAULT_GRAPH_ENDPOINT);
    EXPECT_EQ(config.account, "123");
    EXPECT_EQ(config.credential, "abc");
}

TEST(config_test, s3_destination) {
    const auto ret = parse_destination_spec("id=archive,type=s3,endpoint=http://localhost:9000,bucket=media,access_key=key,secret_key=secret,region=us-east-1,path=relay");
    ASSERT_TRUE(std::holds_alternative<destination_config_t>(ret));
    const auto &config = std::get<destination_config_t>(ret);
    EXPECT_EQ(config.kind, DESTINATION_KIND_S3);
    EXPECT_EQ(config.endpoint, "http://localhost:9000");
    EXPECT_EQ(config.account, "media");
    EXPECT_EQ(config.credential, "key");
    EXPECT_EQ(config.secret, "secret");
    EXPECT_EQ(config.region, "us-east-1");
    EXPECT_EQ(config.path, "relay");
}

TEST(config_test, invalid_destinations) {
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_destination_spec("type=graph,account=1,token=2")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_destination_spec("id=x,type=ftp,account=1,token=2")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_destination_spec("id=x,account=1")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_destination_spec("id=x,type=s3,bucket=b,access_key=k,secret_key=s")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_destination_spec("id=x,type=s3,endpoint=e,bucket=b,access_key=k")));
}

TEST(config_test, destinations_file) {
    const auto dir = std::filesystem::path(get_tmp_dir()) / "config";
    std::filesystem::create_directories(dir);
    const auto path = (dir / "destinations.txt").string();
    {
        std::ofstream file(path);
        file << "# relay targets\n"
             << "id=fb,account=123,token=abc\n"
             << "\n"
             << "id=archive,type=s3,endpoint=http://localhost:9000,bucket=media,access_key=k,secret_key=s\n";
    }
    const auto ret = load_destinations_file(path);
    ASSERT_TRUE(std::holds_alternative<std::vector<destination_config_t>>(ret));
    const auto &configs = std::get<std::vector<destination_config_t>>(ret);
    ASSERT_EQ(configs.size(), 2);
    EXPECT_EQ(configs[0].id, "fb");
    EXPECT_EQ(configs[1].id, "archive");

    {
        std::ofstream file(path);
        file << "id=fb,account=123,token=abc\n"
             << "id=broken\n";
    }
    const auto broken = load_destinations_file(path);
    ASSERT_TRUE(std::holds_alternative<std::string>(broken));
    EXPECT_NE(std::get<std::string>(broken).find(":2:"), std::string::npos);

    std::filesystem::remove_all(dir);
    EXPECT_TRUE(std::holds_alternative<std::string>(load_destinations_file(path)));
}

TEST(config_test, destination_from_env) {
    unsetenv(ENV_PAGE_ID);
    unsetenv(ENV_PAGE_ACCESS_TOKEN);
    EXPECT_FALSE(destination_from_env().has_value());
    setenv(ENV_PAGE_ID, "123", 1);
    EXPECT_FALSE(destination_from_env().has_value());
    setenv(ENV_PAGE_ACCESS_TOKEN, "abc", 1);
    const auto config = destination_from_env();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->id, ENV_DESTINATION_ID);
    EXPECT_EQ(config->kind, DESTINATION_KIND_GRAPH);
    EXPECT_EQ(config->account, "123");
    EXPECT_EQ(config->credential, "abc");
    unsetenv(ENV_PAGE_ID);
    unsetenv(ENV_PAGE_ACCESS_TOKEN);
}

TEST(config_test, source_spec) {
    const auto bare = parse_source_spec(" https://source/video.mp4 ");
    EXPECT_EQ(bare.id, "https://source/video.mp4");
    EXPECT_EQ(bare.locator, "https://source/video.mp4");
    const auto named = parse_source_spec("id=clip,url=https://source/video.mp4");
    EXPECT_EQ(named.id, "clip");
    EXPECT_EQ(named.locator, "https://source/video.mp4");
}

TEST(config_test, video_url_forms_share_source_id) {
    EXPECT_EQ(source_id_for("https://www.youtube.com/watch?v=dQw4w9WgXcQ"), "dQw4w9WgXcQ");
    EXPECT_EQ(source_id_for("https://youtube.com/watch?v=dQw4w9WgXcQ&t=42s"), "dQw4w9WgXcQ");
    EXPECT_EQ(source_id_for("https://youtu.be/dQw4w9WgXcQ"), "dQw4w9WgXcQ");
    EXPECT_EQ(source_id_for("youtu.be/dQw4w9WgXcQ?si=abc"), "dQw4w9WgXcQ");
    EXPECT_EQ(source_id_for("https://www.youtube.com/shorts/dQw4w9WgXcQ"), "dQw4w9WgXcQ");
    EXPECT_EQ(source_id_for("https://m.youtube.com/watch?v=dQw4w9WgXcQ"), "dQw4w9WgXcQ");
    // anything else is its own id
    EXPECT_EQ(source_id_for(" https://source/video.mp4 "), "https://source/video.mp4");
    EXPECT_EQ(source_id_for("https://youtu.be/short"), "https://youtu.be/short");

    EXPECT_EQ(parse_source_spec("https://youtu.be/dQw4w9WgXcQ").id, "dQw4w9WgXcQ");
    EXPECT_EQ(parse_source_spec("https://www.youtube.com/watch?v=dQw4w9WgXcQ").id, "dQw4w9WgXcQ");
    EXPECT_EQ(parse_source_spec("https://www.youtube.com/watch?v=dQw4w9WgXcQ").locator, "https://www.youtube.com/watch?v=dQw4w9WgXcQ");
    EXPECT_EQ(parse_source_spec("url=https://youtu.be/dQw4w9WgXcQ").id, "dQw4w9WgXcQ");
}
