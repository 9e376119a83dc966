#include "mediaserv/body/media_file.hpp"
#include "test_util.hpp"
#include <boost/beast/http/error.hpp>
#include <gtest/gtest.h>

using namespace mediaserv;

namespace {

std::string read_all(body::chunk_reader& reader, beast::error_code& ec, std::size_t* chunks = nullptr)
{
    std::string out;
    while (auto chunk = reader.next(ec)) {
        EXPECT_LE(chunk->size(), body::chunk_reader::chunk_size);
        out.append(static_cast<const char*>(chunk->data()), chunk->size());
        if (chunks)
            ++*chunks;
    }
    return out;
}

} // namespace

TEST(media_file, open_missing_file_fails)
{
    test::temp_dir dir;
    body::media_file file;
    beast::error_code ec;
    file.open(dir.path() / "missing.mp4", ec);
    EXPECT_TRUE(ec);
    EXPECT_FALSE(file.is_open());
}

TEST(media_file, size_is_measured_on_the_handle)
{
    test::temp_dir dir;
    auto path = dir.path() / "a.mp4";
    test::write_file(path, test::make_content(1234));

    body::media_file file;
    beast::error_code ec;
    file.open(path, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(file.size(ec), 1234u);
    EXPECT_FALSE(ec);

    file.close();
    EXPECT_FALSE(file.is_open());
}

TEST(chunk_reader, reads_interval_in_bounded_chunks)
{
    test::temp_dir dir;
    auto path    = dir.path() / "big.mp4";
    auto content = test::make_content(body::chunk_reader::chunk_size * 2 + 1000);
    test::write_file(path, content);

    body::media_file file;
    beast::error_code ec;
    file.open(path, ec);
    ASSERT_FALSE(ec);

    body::chunk_reader reader(file, 0, content.size() - 1);
    std::size_t chunks = 0;
    auto out           = read_all(reader, ec, &chunks);
    EXPECT_FALSE(ec);
    EXPECT_EQ(chunks, 3u);
    EXPECT_TRUE(reader.done());
    EXPECT_EQ(out, content);
}

TEST(chunk_reader, reads_exact_slice)
{
    test::temp_dir dir;
    auto path    = dir.path() / "a.mp4";
    auto content = test::make_content(1000);
    test::write_file(path, content);

    body::media_file file;
    beast::error_code ec;
    file.open(path, ec);
    ASSERT_FALSE(ec);

    body::chunk_reader reader(file, 100, 199);
    EXPECT_EQ(reader.remaining(), 100u);
    auto out = read_all(reader, ec);
    EXPECT_FALSE(ec);
    EXPECT_EQ(out, content.substr(100, 100));

    // exhausted readers stay exhausted
    EXPECT_FALSE(reader.next(ec));
    EXPECT_FALSE(ec);
}

TEST(chunk_reader, same_interval_twice_is_identical)
{
    test::temp_dir dir;
    auto path = dir.path() / "a.mp4";
    test::write_file(path, test::make_content(5000));

    body::media_file file;
    beast::error_code ec;
    file.open(path, ec);
    ASSERT_FALSE(ec);

    body::chunk_reader first(file, 1000, 3999);
    auto a = read_all(first, ec);
    ASSERT_FALSE(ec);
    body::chunk_reader second(file, 1000, 3999);
    auto b = read_all(second, ec);
    ASSERT_FALSE(ec);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.size(), 3000u);
}

TEST(chunk_reader, truncated_file_reports_short_read)
{
    test::temp_dir dir;
    auto path = dir.path() / "a.mp4";
    test::write_file(path, test::make_content(1000));

    body::media_file file;
    beast::error_code ec;
    file.open(path, ec);
    ASSERT_FALSE(ec);

    // the file shrinks after the interval was promised
    fs::resize_file(path, 500);

    body::chunk_reader reader(file, 0, 999);
    auto out = read_all(reader, ec);
    EXPECT_EQ(ec, beast::error_code(http::error::short_read));
    EXPECT_EQ(out.size(), 500u);
    EXPECT_FALSE(reader.done());
}
