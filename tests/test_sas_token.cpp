#include <gtest/gtest.h>
#include "../crypto/SasToken.hpp"

using namespace geotrack;

TEST(SasTokenTest, UrlEncodeEscapesReservedCharacters) {
    EXPECT_EQ(SasToken::urlEncode("hello world"), "hello%20world");
    EXPECT_EQ(SasToken::urlEncode("test@domain.com"), "test%40domain.com");
    EXPECT_EQ(SasToken::urlEncode("safe-chars_123.~"), "safe-chars_123.~");
    EXPECT_EQ(SasToken::urlEncode("a/b"), "a%2Fb");
}

TEST(SasTokenTest, Base64KnownVectors) {
    EXPECT_EQ(SasToken::base64Encode("sure."), "c3VyZS4=");
    EXPECT_EQ(SasToken::base64Decode("c3VyZS4="), "sure.");
    EXPECT_EQ(SasToken::base64Decode(SasToken::base64Encode("Hello, World!")), "Hello, World!");
    EXPECT_EQ(SasToken::base64Decode(""), "");
}

TEST(SasTokenTest, HmacMatchesRfc4231) {
    auto digest = SasToken::hmacSha256("Jefe", "what do ya want for nothing?");
    EXPECT_EQ(SasToken::hexEncode(digest),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(SasTokenTest, SignPayloadPrefixesHexDigest) {
    auto signature = SasToken::signPayload("Jefe", "what do ya want for nothing?");
    EXPECT_EQ(signature, "sha256=5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
    EXPECT_NE(SasToken::signPayload("other", "what do ya want for nothing?"), signature);
}

TEST(SasTokenTest, TokenFormat) {
    const std::string deviceKey = "dGVzdGtleQ==";   // "testkey"
    auto token = SasToken::generate("Test-Hub.example.net", "tracker-1", deviceKey, 1234567890);

    EXPECT_EQ(token.find("SharedAccessSignature sr=test-hub.example.net%2Fdevices%2Ftracker-1&sig="), 0u);
    EXPECT_NE(token.find("&se=1234567890"), std::string::npos);
    EXPECT_EQ(token, SasToken::generate("test-hub.example.net", "tracker-1", deviceKey, 1234567890));
    EXPECT_NE(token, SasToken::generate("test-hub.example.net", "tracker-1", deviceKey, 1234567891));
}
