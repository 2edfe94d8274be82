#include <stdexcept>
#include "common/base64.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace bayview;

TEST(Base64Test, DecodeTest) {
    EXPECT_EQ(decode_base64(""), "");
    EXPECT_EQ(decode_base64("Zg=="), "f");
    EXPECT_EQ(decode_base64("Zm8="), "fo");
    EXPECT_EQ(decode_base64("Zm9v"), "foo");
    EXPECT_EQ(decode_base64("SGVsbG8sIFdvcmxkIQ=="), "Hello, World!");
}

TEST(Base64Test, EncodeTest) {
    EXPECT_EQ(encode_base64(""), "");
    EXPECT_EQ(encode_base64("f"), "Zg==");
    EXPECT_EQ(encode_base64("fo"), "Zm8=");
    EXPECT_EQ(encode_base64("foo"), "Zm9v");
    EXPECT_EQ(encode_base64("print(\"Hello, World!\")"), "cHJpbnQoIkhlbGxvLCBXb3JsZCEiKQ==");
}

TEST(Base64Test, BinaryTest) {
    string binary;
    for (int i = 0; i < 256; ++i) binary.push_back((char)i);
    EXPECT_EQ(decode_base64(encode_base64(binary)), binary);
}

TEST(Base64Test, LineBreakTest) {
    EXPECT_EQ(decode_base64("SGVsbG8s\r\nIFdvcmxk\nIQ=="), "Hello, World!");
}

TEST(Base64Test, MalformedTest) {
    EXPECT_THROW(decode_base64("@@@@"), invalid_argument);
    EXPECT_THROW(decode_base64("Zm9"), invalid_argument);
    EXPECT_THROW(decode_base64("Zg==Zg=="), invalid_argument);
    EXPECT_THROW(decode_base64("Z==="), invalid_argument);
}
