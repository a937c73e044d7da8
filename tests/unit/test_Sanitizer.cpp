#include "storage/Sanitizer.hpp"
#include "storage/Error.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace rh::storage;

TEST(SanitizerTest, AcceptsPlainStoredNames) {
    EXPECT_TRUE(Sanitizer::isSafe("1700000000000-clip.mp4"));
    EXPECT_TRUE(Sanitizer::isSafe("holiday video.webm"));
    EXPECT_NO_THROW(Sanitizer::validate("1700000000000-clip.mp4"));
}

TEST(SanitizerTest, DotsWithinOneComponentAreAllowed) {
    for (const std::string name : {"clip..final.mp4", "trip...mp4", "..hidden.mp4", "1700000000000-a..b.webm"}) {
        EXPECT_TRUE(Sanitizer::isSafe(name)) << name;
        EXPECT_NO_THROW(Sanitizer::validate(name)) << name;
    }
}

TEST(SanitizerTest, RejectsTraversalAndSeparators) {
    for (const std::string name : {"../etc/passwd", "..", ".", "../../etc/passwd", "a/b.mp4", "a\\b.mp4", "/abs.mp4", "..\\x.mp4"}) {
        EXPECT_FALSE(Sanitizer::isSafe(name)) << name;
        try {
            Sanitizer::validate(name);
            FAIL() << "expected rejection for " << name;
        } catch (const Error& e) {
            EXPECT_EQ(e.reason(), Error::Reason::PathTraversal);
            EXPECT_STREQ(e.what(), "Invalid filename");
        }
    }
}

TEST(SanitizerTest, RejectsEmptyAndEmbeddedNul) {
    EXPECT_FALSE(Sanitizer::isSafe(""));
    EXPECT_FALSE(Sanitizer::isSafe(std::string("clip\0.mp4", 9)));
}
