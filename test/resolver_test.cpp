#include <gtest/gtest.h>

#include "../src/source/resolver.hpp"

TEST(resolver_test, direct) {
    DirectResolver resolver;
    const auto ret = resolver.resolve("https://cdn.example/videos/clip.mp4?sig=1");
    ASSERT_TRUE(std::holds_alternative<resolved_source_t>(ret));
    const auto &source = std::get<resolved_source_t>(ret);
    EXPECT_EQ(source.url, "https://cdn.example/videos/clip.mp4?sig=1");
    EXPECT_EQ(source.title, "clip.mp4");
    EXPECT_EQ(source.declared_size, 0);
    EXPECT_FALSE(source.thumbnail_url.has_value());
    EXPECT_TRUE(std::holds_alternative<std::string>(resolver.resolve("")));
}

TEST(resolver_test, title_from_locator) {
    EXPECT_EQ(title_from_locator("https://host/a/b/"), "b");
    EXPECT_EQ(title_from_locator("clip"), "clip");
}

TEST(resolver_test, api_response) {
    const auto ret = parse_resolver_response(R"({
        "status": true,
        "data": {
            "metadata": {"title": "Cat video", "thumbnail": "https://cdn.example/t.jpg"},
            "download": {"url": "https://cdn.example/v.mp4", "size": 12000000}
        }
    })");
    ASSERT_TRUE(std::holds_alternative<resolved_source_t>(ret));
    const auto &source = std::get<resolved_source_t>(ret);
    EXPECT_EQ(source.url, "https://cdn.example/v.mp4");
    EXPECT_EQ(source.declared_size, 12000000);
    EXPECT_EQ(source.title, "Cat video");
    EXPECT_EQ(source.thumbnail_url, "https://cdn.example/t.jpg");
}

TEST(resolver_test, api_response_without_metadata) {
    const auto ret = parse_resolver_response(R"({"status": true, "data": {"download": {"url": "https://cdn.example/v.mp4"}}})");
    ASSERT_TRUE(std::holds_alternative<resolved_source_t>(ret));
    EXPECT_EQ(std::get<resolved_source_t>(ret).title, "v.mp4");
    EXPECT_EQ(std::get<resolved_source_t>(ret).declared_size, 0);
}

TEST(resolver_test, api_failures) {
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_resolver_response(R"({"status": false})")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_resolver_response(R"({"status": true, "data": {}})")));
    EXPECT_TRUE(std::holds_alternative<std::string>(parse_resolver_response("<html>")));
}
