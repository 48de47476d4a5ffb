#include <gtest/gtest.h>

#include <string>

#include "content/content_codec.hpp"
#include "exec/exec_error.hpp"

namespace codebox::content {
namespace {

using exec::Encoding;
using exec::ErrorKind;
using exec::ExecError;

ErrorKind KindOf(const exec::Bytes& content, Encoding encoding) {
    try {
        Decode(content, encoding);
    } catch (const ExecError& ex) {
        return ex.Kind();
    }
    ADD_FAILURE() << "expected a decode failure";
    return ErrorKind::kUnsupportedLanguage;
}

TEST(ContentCodecTest, Utf8PassesBytesThrough) {
    const exec::Bytes raw = "console.log('hello');";
    EXPECT_EQ(Decode(raw, Encoding::kUtf8), raw);
}

TEST(ContentCodecTest, MissingEncodingMeansUtf8) {
    const exec::Bytes raw("\xff\x00raw", 5);
    EXPECT_EQ(Decode(raw, std::nullopt), raw);
}

TEST(ContentCodecTest, DecodesKnownBase64) {
    EXPECT_EQ(Decode("Y29uc29sZS5sb2coJ2hlbGxvJyk7", Encoding::kBase64), "console.log('hello');");
    EXPECT_EQ(Decode("cHJpbnQoJ2hlbGxvJyk=", Encoding::kBase64), "print('hello')");
    EXPECT_EQ(Decode("", Encoding::kBase64), "");
}

TEST(ContentCodecTest, DecodesKnownHex) {
    EXPECT_EQ(Decode("636f6e736f6c652e6c6f67282768656c6c6f27293b", Encoding::kHex),
              "console.log('hello');");
    EXPECT_EQ(Decode("7072696E74282768656C6C6F2729", Encoding::kHex), "print('hello')");
}

TEST(ContentCodecTest, RoundTripsArbitraryBytes) {
    exec::Bytes all;
    for (int i = 0; i < 256; ++i) {
        all.push_back(static_cast<char>(i));
    }
    for (std::size_t length : {0u, 1u, 2u, 3u, 4u, 255u, 256u}) {
        const auto sample = all.substr(0, length);
        EXPECT_EQ(Decode(EncodeBase64(sample), Encoding::kBase64), sample) << length;
        EXPECT_EQ(Decode(EncodeHex(sample), Encoding::kHex), sample) << length;
    }
}

TEST(ContentCodecTest, RejectsMalformedBase64) {
    EXPECT_EQ(KindOf("abc", Encoding::kBase64), ErrorKind::kInternal);
    EXPECT_EQ(KindOf("ab!d", Encoding::kBase64), ErrorKind::kInternal);
    EXPECT_EQ(KindOf("a===", Encoding::kBase64), ErrorKind::kInternal);
    EXPECT_EQ(KindOf("ab=cabcd", Encoding::kBase64), ErrorKind::kInternal);
    EXPECT_EQ(KindOf("YR==", Encoding::kBase64), ErrorKind::kInternal);
    EXPECT_EQ(KindOf("Y29u\nc29s", Encoding::kBase64), ErrorKind::kInternal);
}

TEST(ContentCodecTest, RejectsMalformedHex) {
    EXPECT_EQ(KindOf("abc", Encoding::kHex), ErrorKind::kInternal);
    EXPECT_EQ(KindOf("zz", Encoding::kHex), ErrorKind::kInternal);
}

TEST(ContentCodecTest, RejectsNonUtf8EncodedText) {
    try {
        Decode("\xff\xfe", Encoding::kBase64);
        FAIL() << "expected failure";
    } catch (const ExecError& ex) {
        EXPECT_NE(std::string(ex.what()).find("Invalid UTF-8 in base64"), std::string::npos);
    }
    EXPECT_EQ(KindOf("\xc3(", Encoding::kHex), ErrorKind::kInternal);
}

TEST(ContentCodecTest, DecodesFileUsingItsEncoding) {
    exec::File file{"main.js", "6869", Encoding::kHex};
    EXPECT_EQ(Decode(file), "hi");
}

}  // namespace
}  // namespace codebox::content
