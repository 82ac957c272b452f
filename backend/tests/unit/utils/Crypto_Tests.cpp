#include <gtest/gtest.h>
#include "../../../src/utils/Crypto.hpp"
#include "../../../src/utils/logging.hpp"
#include "../TestThreads.hpp"
#include <set>
#include <string>
#include <vector>

// ============================================================================
// Digest / encoding
// ============================================================================

TEST(CryptoTest, Sha256Hex_KnownVectors) {
    EXPECT_EQ(Crypto::sha256Hex(""),
        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(Crypto::sha256Hex("abc"),
        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTest, ToHex_LowercaseTwoCharsPerByte) {
    std::vector<unsigned char> bytes = { 0x00, 0x0A, 0xAB, 0xFF };
    EXPECT_EQ(Crypto::toHex(bytes), "000aabff");
    EXPECT_EQ(Crypto::toHex({}), "");
}

TEST(CryptoTest, ToBase64Url_UsesUrlAlphabetWithoutPadding) {
    EXPECT_EQ(Crypto::toBase64Url({ 0xFB, 0xFF }), "-_8");
    EXPECT_EQ(Crypto::toBase64Url({ 'M', 'a', 'n' }), "TWFu");
}

TEST(CryptoTest, RandomBytes_LengthAndVariation) {
    auto a = Crypto::randomBytes(32);
    auto b = Crypto::randomBytes(32);
    ASSERT_EQ(a.size(), 32u);
    ASSERT_EQ(b.size(), 32u);
    EXPECT_NE(a, b);

    EXPECT_TRUE(Crypto::randomBytes(0).empty());
}

// ============================================================================
// Constant-time comparison
// ============================================================================

TEST(CryptoTest, ConstantTimeEquals_EqualStrings) {
    EXPECT_TRUE(Crypto::constantTimeEquals("abcdef", "abcdef"));
    EXPECT_TRUE(Crypto::constantTimeEquals("", ""));
}

TEST(CryptoTest, ConstantTimeEquals_DifferenceAnywhere) {
    EXPECT_FALSE(Crypto::constantTimeEquals("xbcdef", "abcdef"));
    EXPECT_FALSE(Crypto::constantTimeEquals("abcxef", "abcdef"));
    EXPECT_FALSE(Crypto::constantTimeEquals("abcdex", "abcdef"));
}

TEST(CryptoTest, ConstantTimeEquals_LengthMismatchIsFalse) {
    EXPECT_FALSE(Crypto::constantTimeEquals("abc", "abcdef"));
    EXPECT_FALSE(Crypto::constantTimeEquals("abcdefg", "abcdef"));
    EXPECT_FALSE(Crypto::constantTimeEquals("", "a"));
    EXPECT_FALSE(Crypto::constantTimeEquals("a", ""));
}

// ============================================================================
// Log redaction
// ============================================================================

TEST(LogRedactTest, MasksSensitiveValues) {
    std::string out = Log::redact("ssn 123-45-6789 card 4111 1111 1111 1111");
    EXPECT_EQ(out.find("123-45-6789"), std::string::npos);
    EXPECT_EQ(out.find("4111 1111"), std::string::npos);
    EXPECT_NE(out.find("[REDACTED]"), std::string::npos);
}

TEST(LogRedactTest, MasksBearerAndLongTokens) {
    std::string token(40, 'a');
    std::string out = Log::redact("Authorization: Bearer abc.def-ghi and key " + token);
    EXPECT_EQ(out.find("abc.def-ghi"), std::string::npos);
    EXPECT_EQ(out.find(token), std::string::npos);
}

TEST(LogRedactTest, TruncatesLongText) {
    std::string out = Log::redact(std::string(2000, ' '));
    EXPECT_EQ(out.size(), 1000u + std::string("...[TRUNCATED]").size());
}

TEST(LogRedactTest, LongRunsRedactedOnSmallWorkerStack) {
    std::string opaque, bearer;
    ASSERT_TRUE(RunWithStackSize(1024 * 1024, [&] {
        opaque = Log::redact(std::string(200000, 'b'));
        bearer = Log::redact("Authorization: Bearer " + std::string(100000, 'x'));
    }));

    const std::string tail = "...[TRUNCATED]";
    EXPECT_EQ(opaque.find("bbb"), std::string::npos);
    EXPECT_EQ(opaque.rfind("[REDACTED]", 0), 0u);
    ASSERT_GE(opaque.size(), tail.size());
    EXPECT_EQ(opaque.substr(opaque.size() - tail.size()), tail);

    EXPECT_EQ(bearer.find("xxx"), std::string::npos);
}

TEST(LogRedactTest, LeavesOrdinaryTextAlone) {
    EXPECT_EQ(Log::redact("Call the client about renewal"), "Call the client about renewal");
}
