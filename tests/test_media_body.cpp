#include "mediaserv/body/any_body.hpp"
#include "mediaserv/body/media_body.hpp"
#include "test_util.hpp"
#include <fmt/format.h>
#include <gtest/gtest.h>

using namespace mediaserv;
using html::byte_range;

class media_body_test : public ::testing::Test
{
protected:
    void SetUp() override
    {
        path_    = dir_.path() / "clip.mp4";
        content_ = test::make_content(1000);
        test::write_file(path_, content_);
    }

    body::media_body::value_type open(std::vector<byte_range> ranges = {},
                                      std::string boundary = {})
    {
        body::media_body::value_type value;
        beast::error_code ec;
        value.file.open(path_, ec);
        EXPECT_FALSE(ec);
        value.file_size    = content_.size();
        value.ranges       = std::move(ranges);
        value.content_type = "video/mp4";
        value.boundary     = std::move(boundary);
        return value;
    }

    test::temp_dir dir_;
    fs::path path_;
    std::string content_;
};

TEST_F(media_body_test, whole_file)
{
    auto value = open();
    EXPECT_EQ(value.size(), content_.size());
    EXPECT_EQ(test::drain<body::media_body>(value), content_);
}

TEST_F(media_body_test, single_range_is_bare_slice)
{
    auto value = open({{10, 19, 1000}});
    EXPECT_FALSE(value.is_multipart());
    EXPECT_EQ(value.size(), 10u);
    EXPECT_EQ(test::drain<body::media_body>(value), content_.substr(10, 10));
}

TEST_F(media_body_test, multipart_framing)
{
    auto value = open({{0, 99, 1000}, {200, 299, 1000}}, "BOUNDARY");
    ASSERT_TRUE(value.is_multipart());

    auto expected = fmt::format("--BOUNDARY\r\n"
                                "Content-Type: video/mp4\r\n"
                                "Content-Range: bytes 0-99/1000\r\n"
                                "\r\n"
                                "{}\r\n"
                                "--BOUNDARY\r\n"
                                "Content-Type: video/mp4\r\n"
                                "Content-Range: bytes 200-299/1000\r\n"
                                "\r\n"
                                "{}\r\n"
                                "--BOUNDARY--\r\n",
                                content_.substr(0, 100),
                                content_.substr(200, 100));

    auto out = test::drain<body::media_body>(value);
    EXPECT_EQ(out, expected);
    EXPECT_EQ(value.size(), expected.size());
}

TEST_F(media_body_test, multipart_keeps_part_order)
{
    auto value = open({{900, 999, 1000}, {0, 0, 1000}, {900, 999, 1000}}, "b");
    auto out   = test::drain<body::media_body>(value);

    auto first  = out.find("Content-Range: bytes 900-999/1000");
    auto second = out.find("Content-Range: bytes 0-0/1000");
    auto third  = out.find("Content-Range: bytes 900-999/1000", first + 1);
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    ASSERT_NE(third, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_LT(second, third);
    EXPECT_EQ(value.size(), out.size());
}

TEST_F(media_body_test, closed_file_fails_init)
{
    body::media_body::value_type value;
    value.file_size = 10;
    beast::error_code ec;
    test::drain<body::media_body>(value, ec);
    EXPECT_TRUE(ec);
}

TEST_F(media_body_test, any_body_dispatches_to_held_body)
{
    body::any_body::value_type value = open({{5, 9, 1000}});
    EXPECT_TRUE(value.is_body_type<body::media_body>());
    EXPECT_EQ(body::any_body::size(value), 5u);
    EXPECT_EQ(test::drain<body::any_body>(value), content_.substr(5, 5));

    value = std::string("hello");
    EXPECT_TRUE(value.is_body_type<http::string_body>());
    EXPECT_EQ(body::any_body::size(value), 5u);
    EXPECT_EQ(test::drain<body::any_body>(value), "hello");

    value = http::empty_body::value_type {};
    EXPECT_EQ(body::any_body::size(value), 0u);
    EXPECT_EQ(test::drain<body::any_body>(value), "");
}
