#include <gtest/gtest.h>
#include "../../../src/auth/PinHasher.hpp"
#include <set>
#include <string>
#include <variant>

class PinHasherTest : public ::testing::Test {
protected:
    // SHA-256("1234")
    const std::string legacy1234 =
        "03ac674216f3e15c761ee1a5e255f067953623c8b388b4459e13f978d7c846f4";

    const std::string fixedSalt = "00112233445566778899aabbccddeeff";
    // SHA-256("00112233445566778899aabbccddeeff:1234")
    const std::string fixedSaltHash =
        "8ea092a8015b7f4e96d99819caed8bb5ddcd0f636cf2d11aff9a5a3c51cc2ff8";
};

// ============================================================================
// Salts and hashing
// ============================================================================

TEST_F(PinHasherTest, GenerateSalt_Is32LowercaseHexAndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        std::string salt = PinHasher::generateSalt();
        ASSERT_EQ(salt.size(), PinHasher::SALT_HEX_LEN);
        for (char c : salt)
            EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << salt;
        seen.insert(salt);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST_F(PinHasherTest, HashWithSalt_KnownAnswer) {
    EXPECT_EQ(PinHasher::hashWithSalt("1234", fixedSalt), fixedSaltHash);
}

TEST_F(PinHasherTest, HashWithSalt_Deterministic) {
    const std::string salt = PinHasher::generateSalt();
    EXPECT_EQ(PinHasher::hashWithSalt("4821", salt), PinHasher::hashWithSalt("4821", salt));
}

TEST_F(PinHasherTest, HashWithSalt_DifferentSaltsDiffer) {
    const std::string s1 = PinHasher::generateSalt();
    const std::string s2 = PinHasher::generateSalt();
    ASSERT_NE(s1, s2);
    EXPECT_NE(PinHasher::hashWithSalt("1234", s1), PinHasher::hashWithSalt("1234", s2));
}

TEST_F(PinHasherTest, HashLegacy_IsBareSha256) {
    EXPECT_EQ(PinHasher::hashLegacy("1234"), legacy1234);
}

TEST_F(PinHasherTest, VerifyWithSalt) {
    EXPECT_TRUE(PinHasher::verifyWithSalt("1234", fixedSalt, fixedSaltHash));
    EXPECT_FALSE(PinHasher::verifyWithSalt("1235", fixedSalt, fixedSaltHash));
    EXPECT_FALSE(PinHasher::verifyWithSalt("1234", fixedSalt, fixedSaltHash.substr(0, 10)));
    EXPECT_FALSE(PinHasher::verifyWithSalt("1234", fixedSalt, ""));
}

// ============================================================================
// Format discrimination
// ============================================================================

TEST_F(PinHasherTest, IsSaltedFormat_AcceptsExactShapeOnly) {
    EXPECT_TRUE(PinHasher::isSaltedFormat(fixedSalt + ":" + fixedSaltHash));

    EXPECT_FALSE(PinHasher::isSaltedFormat(legacy1234));
    EXPECT_FALSE(PinHasher::isSaltedFormat(""));
    EXPECT_FALSE(PinHasher::isSaltedFormat(fixedSalt + fixedSaltHash + "x"));
    EXPECT_FALSE(PinHasher::isSaltedFormat(fixedSalt + ";" + fixedSaltHash));
    EXPECT_FALSE(PinHasher::isSaltedFormat(fixedSalt + ":" + fixedSaltHash.substr(1)));
    EXPECT_FALSE(PinHasher::isSaltedFormat("0" + fixedSalt + ":" + fixedSaltHash.substr(1)));

    std::string upper = fixedSalt + ":" + fixedSaltHash;
    upper[2] = 'A';
    EXPECT_FALSE(PinHasher::isSaltedFormat(upper));

    std::string nonHex = fixedSalt + ":" + fixedSaltHash;
    nonHex[40] = 'g';
    EXPECT_FALSE(PinHasher::isSaltedFormat(nonHex));
}

TEST_F(PinHasherTest, ParseSalted_SplitsComponents) {
    auto parsed = PinHasher::parseSalted(fixedSalt + ":" + fixedSaltHash);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->salt, fixedSalt);
    EXPECT_EQ(parsed->hash, fixedSaltHash);
    EXPECT_EQ(parsed->serialize(), fixedSalt + ":" + fixedSaltHash);

    EXPECT_FALSE(PinHasher::parseSalted(legacy1234).has_value());
}

TEST_F(PinHasherTest, ParseStored_MalformedFallsThroughToLegacy) {
    auto stored = PinHasher::parseStored("not-a-hash:at-all");
    ASSERT_TRUE(std::holds_alternative<LegacyCredential>(stored));
    EXPECT_EQ(std::get<LegacyCredential>(stored).hash, "not-a-hash:at-all");

    EXPECT_TRUE(std::holds_alternative<SaltedCredential>(
        PinHasher::parseStored(fixedSalt + ":" + fixedSaltHash)));
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(PinHasherTest, CreateSaltedCredential_HasStorageShape) {
    std::string stored = PinHasher::createSaltedCredential("1234");
    EXPECT_EQ(stored.size(), 32u + 1u + 64u);
    EXPECT_TRUE(PinHasher::isSaltedFormat(stored));
    EXPECT_NE(stored, PinHasher::createSaltedCredential("1234"));
}

TEST_F(PinHasherTest, VerifyCredential_SaltedCorrectPin) {
    auto r = PinHasher::verifyCredential("1234", PinHasher::createSaltedCredential("1234"));
    EXPECT_TRUE(r.valid);
    EXPECT_FALSE(r.needs_upgrade);
}

TEST_F(PinHasherTest, VerifyCredential_SaltedWrongPin) {
    auto r = PinHasher::verifyCredential("9999", PinHasher::createSaltedCredential("1234"));
    EXPECT_FALSE(r.valid);
    EXPECT_FALSE(r.needs_upgrade);
}

TEST_F(PinHasherTest, VerifyCredential_LegacyCorrectPinNeedsUpgrade) {
    auto r = PinHasher::verifyCredential("1234", PinHasher::hashLegacy("1234"));
    EXPECT_TRUE(r.valid);
    EXPECT_TRUE(r.needs_upgrade);
}

TEST_F(PinHasherTest, VerifyCredential_LegacyWrongPinNeverSignalsUpgrade) {
    auto r = PinHasher::verifyCredential("9999", PinHasher::hashLegacy("1234"));
    EXPECT_FALSE(r.valid);
    EXPECT_FALSE(r.needs_upgrade);
}

TEST_F(PinHasherTest, VerifyCredential_MalformedStoredIsInvalid) {
    for (const std::string stored : { std::string(), std::string("abc"),
                                      std::string(64, 'z'), fixedSalt + ":" }) {
        auto r = PinHasher::verifyCredential("1234", stored);
        EXPECT_FALSE(r.valid) << stored;
        EXPECT_FALSE(r.needs_upgrade) << stored;
    }
}

TEST_F(PinHasherTest, VerifyCredential_UpgradedHashVerifiesWithoutUpgrade) {
    auto legacy = PinHasher::verifyCredential("1234", legacy1234);
    ASSERT_TRUE(legacy.needs_upgrade);

    std::string upgraded = PinHasher::createSaltedCredential("1234");
    auto after = PinHasher::verifyCredential("1234", upgraded);
    EXPECT_TRUE(after.valid);
    EXPECT_FALSE(after.needs_upgrade);
}

// ============================================================================
// Input shape
// ============================================================================

TEST_F(PinHasherTest, IsValidPin) {
    EXPECT_TRUE(PinHasher::isValidPin("0000"));
    EXPECT_TRUE(PinHasher::isValidPin("1234"));
    EXPECT_FALSE(PinHasher::isValidPin("123"));
    EXPECT_FALSE(PinHasher::isValidPin("12345"));
    EXPECT_FALSE(PinHasher::isValidPin("12a4"));
    EXPECT_FALSE(PinHasher::isValidPin(""));
}

TEST_F(PinHasherTest, IsValidUsername) {
    EXPECT_TRUE(PinHasher::isValidUsername("Derrick"));
    EXPECT_TRUE(PinHasher::isValidUsername("Sam Smith 2"));
    EXPECT_TRUE(PinHasher::isValidUsername("  Al  "));
    EXPECT_FALSE(PinHasher::isValidUsername("A"));
    EXPECT_FALSE(PinHasher::isValidUsername("1abc"));
    EXPECT_FALSE(PinHasher::isValidUsername("bob;drop"));
    EXPECT_FALSE(PinHasher::isValidUsername(std::string(31, 'a')));
}
