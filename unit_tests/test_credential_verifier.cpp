#include "gtest/gtest.h"
#include "security/credential_verifier.h"
#include "security/check_result.h"
#include <memory>

TEST(StaticTokenVerifierTest, AcceptsExactToken) {
    StaticTokenVerifier verifier("valid-oauth-token");
    std::optional<Principal> principal = verifier.verify("valid-oauth-token");
    ASSERT_TRUE(principal.has_value());
    EXPECT_EQ(principal->subject, "static-token-client");
}

TEST(StaticTokenVerifierTest, UsesConfiguredSubject) {
    StaticTokenVerifier verifier("t0k3n", "ops");
    std::optional<Principal> principal = verifier.verify("t0k3n");
    ASSERT_TRUE(principal.has_value());
    EXPECT_EQ(principal->subject, "ops");
}

TEST(StaticTokenVerifierTest, RejectsWrongOrPartialTokens) {
    StaticTokenVerifier verifier("valid-oauth-token");
    EXPECT_FALSE(verifier.verify("").has_value());
    EXPECT_FALSE(verifier.verify("valid-oauth-toke").has_value());
    EXPECT_FALSE(verifier.verify("valid-oauth-tokenX").has_value());
    EXPECT_FALSE(verifier.verify("VALID-OAUTH-TOKEN").has_value());
    EXPECT_FALSE(verifier.verify("invalid-oauth-tk").has_value());
}

TEST(StaticTokenVerifierTest, EmptyConfiguredTokenRejectsEverything) {
    StaticTokenVerifier verifier("");
    EXPECT_FALSE(verifier.verify("").has_value());
    EXPECT_FALSE(verifier.verify("anything").has_value());
}

TEST(StaticTokenVerifierTest, UsableThroughInterface) {
    std::unique_ptr<CredentialVerifier> verifier(new StaticTokenVerifier("abc"));
    EXPECT_TRUE(verifier->verify("abc").has_value());
    EXPECT_FALSE(verifier->verify("abd").has_value());
}

TEST(CheckResultTest, DescribesRejection) {
    CheckResult rejected = CheckResult::reject(Rejection::kDangerousPattern, "..");
    EXPECT_FALSE(rejected);
    EXPECT_EQ(rejected.describe(), "DangerousPattern: ..");
    EXPECT_EQ(CheckResult::reject(Rejection::kNotFound).describe(), "NotFound");

    CheckResult accepted = CheckResult::accept("guide.pdf");
    EXPECT_TRUE(accepted);
    EXPECT_EQ(accepted.reason(), Rejection::kNone);
    EXPECT_EQ(accepted.value(), "guide.pdf");
}

TEST(CheckResultTest, RejectionNames) {
    EXPECT_STREQ(rejectionName(Rejection::kUnauthorized), "Unauthorized");
    EXPECT_STREQ(rejectionName(Rejection::kHiddenFileRejected), "HiddenFileRejected");
    EXPECT_STREQ(rejectionName(Rejection::kExtensionNotAllowed), "ExtensionNotAllowed");
}
