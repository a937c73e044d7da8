#include "protocols/http/Multipart.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace rh::protocols::http::multipart;

namespace {

std::string body(const std::string& boundary, const std::string& disposition, const std::string& data) {
    return "--" + boundary + "\r\n"
           "Content-Disposition: " + disposition + "\r\n"
           "Content-Type: video/mp4\r\n"
           "\r\n" + data + "\r\n"
           "--" + boundary + "--\r\n";
}

}

TEST(MultipartTest, BoundaryFromContentType) {
    EXPECT_EQ(boundaryFrom("multipart/form-data; boundary=abc123"), "abc123");
    EXPECT_EQ(boundaryFrom("Multipart/Form-Data; charset=utf-8; boundary=\"a b;c\""), "a b;c");
    EXPECT_FALSE(boundaryFrom("application/json"));
    EXPECT_FALSE(boundaryFrom("multipart/form-data"));
    EXPECT_FALSE(boundaryFrom("multipart/form-data; boundary=" + std::string(71, 'x')));
}

TEST(MultipartTest, ParsesFileField) {
    std::string payload{'\0', '\1'};
    payload += "binary\r\nwith crlf";
    const auto b = body("XyZ", "form-data; name=\"file\"; filename=\"clip.mp4\"", payload);

    const auto parts = parse(b, "XyZ");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].name, "file");
    ASSERT_TRUE(parts[0].filename);
    EXPECT_EQ(*parts[0].filename, "clip.mp4");
    EXPECT_EQ(parts[0].contentType, "video/mp4");
    EXPECT_EQ(parts[0].data, payload);
}

TEST(MultipartTest, FindsNamedFieldAmongSeveral) {
    const std::string b =
        "--B\r\n"
        "Content-Disposition: form-data; name=\"title\"\r\n"
        "\r\n"
        "My clip\r\n"
        "--B\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"a.webm\"\r\n"
        "\r\n"
        "DATA\r\n"
        "--B--";

    const auto parts = parse(b, "B");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_FALSE(parts[0].filename);

    const auto file = findField(parts, "file");
    ASSERT_TRUE(file);
    EXPECT_EQ(*file->filename, "a.webm");
    EXPECT_EQ(file->data, "DATA");

    EXPECT_FALSE(findField(parts, "missing"));
}

TEST(MultipartTest, ExtendedFilenameWins) {
    const auto b = body("q", "form-data; name=\"file\"; filename=\"fallback.mp4\"; filename*=UTF-8''caf%C3%A9.mp4", "x");
    const auto parts = parse(b, "q");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(*parts[0].filename, "caf\xC3\xA9.mp4");
}

TEST(MultipartTest, EmptyFileIsAllowed) {
    const auto parts = parse(body("q", "form-data; name=\"file\"; filename=\"empty.mp4\"", ""), "q");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_TRUE(parts[0].data.empty());
}

TEST(MultipartTest, MalformedBodiesThrow) {
    EXPECT_THROW(parse("no boundary here", "B"), std::invalid_argument);
    EXPECT_THROW(parse("--B\r\nContent-Disposition: form-data; name=\"file\"\r\n\r\nDATA", "B"),
                 std::invalid_argument);
    EXPECT_THROW(parse("--B\r\nbroken header line\r\n\r\nDATA\r\n--B--", "B"), std::invalid_argument);
    EXPECT_THROW(parse("--Bjunk", "B"), std::invalid_argument);
    EXPECT_THROW(parse("x", ""), std::invalid_argument);
}
