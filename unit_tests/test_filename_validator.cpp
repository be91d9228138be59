#include "gtest/gtest.h"
#include "security/filename_validator.h"
#include <string>

TEST(FilenameValidatorTest, AcceptsPlainFilename) {
    CheckResult result = FilenameValidator::validate("report.pdf");
    ASSERT_TRUE(result.ok()) << result.describe();
    EXPECT_EQ(result.value(), "report.pdf");
}

TEST(FilenameValidatorTest, AcceptsAllowedPunctuation) {
    CheckResult result = FilenameValidator::validate("User_Guide-v2.1.docx");
    ASSERT_TRUE(result.ok()) << result.describe();
    EXPECT_EQ(result.value(), "User_Guide-v2.1.docx");
}

TEST(FilenameValidatorTest, DecodesPercentEscapesOnce) {
    CheckResult result = FilenameValidator::validate("user%2Dguide.pdf");
    ASSERT_TRUE(result.ok()) << result.describe();
    EXPECT_EQ(result.value(), "user-guide.pdf");
}

TEST(FilenameValidatorTest, RejectsMalformedEscape) {
    EXPECT_EQ(FilenameValidator::validate("guide%2.pdf").reason(), Rejection::kInvalidEncoding);
    EXPECT_EQ(FilenameValidator::validate("guide%zz.pdf").reason(), Rejection::kInvalidEncoding);
    EXPECT_EQ(FilenameValidator::validate("guide.pdf%").reason(), Rejection::kInvalidEncoding);
}

TEST(FilenameValidatorTest, PlusBecomesSpaceAndIsRejected) {
    EXPECT_EQ(FilenameValidator::validate("user+guide.pdf").reason(), Rejection::kInvalidCharacters);
}

TEST(FilenameValidatorTest, RejectsControlCharacters) {
    CheckResult nul = FilenameValidator::validate("guide%00.pdf");
    EXPECT_EQ(nul.reason(), Rejection::kControlCharacter);
    EXPECT_EQ(nul.detail(), "null byte at offset 5");

    CheckResult bell = FilenameValidator::validate(std::string("gu\x07ide.pdf"));
    EXPECT_EQ(bell.reason(), Rejection::kControlCharacter);
    EXPECT_EQ(bell.detail(), "0x07 at offset 2");
}

TEST(FilenameValidatorTest, TabAndNewlineFailCharacterClassInstead) {
    EXPECT_EQ(FilenameValidator::validate("guide%09.pdf").reason(), Rejection::kInvalidCharacters);
    EXPECT_EQ(FilenameValidator::validate("guide%0a.pdf").reason(), Rejection::kInvalidCharacters);
}

TEST(FilenameValidatorTest, RejectsEmptyName) {
    EXPECT_EQ(FilenameValidator::validate("").reason(), Rejection::kInvalidCharacters);
}

TEST(FilenameValidatorTest, RejectsNamesOverMaxLength) {
    std::string exact(251, 'a');
    exact += ".pdf";
    ASSERT_EQ(exact.size(), 255u);
    EXPECT_TRUE(FilenameValidator::validate(exact).ok());

    std::string too_long = "a" + exact;
    CheckResult result = FilenameValidator::validate(too_long);
    EXPECT_EQ(result.reason(), Rejection::kTooLong);
    EXPECT_EQ(result.detail(), "256 bytes");
}

TEST(FilenameValidatorTest, TraversalIsNeverAccepted) {
    const char* attacks[] = {
        "../etc/passwd",
        "..%2f..%2fetc%2fpasswd",
        "%2e%2e%2fetc%2fpasswd",
        "%252e%252e%252fetc%252fpasswd",
        "..\\windows\\win.ini",
        "..",
        "....",
        "guide..pdf",
        "/etc/passwd",
        "~/secret.pdf",
        "C:guide.pdf",
    };
    for (const char* attack : attacks) {
        CheckResult result = FilenameValidator::validate(attack);
        EXPECT_FALSE(result.ok()) << attack << " was accepted as " << result.value();
    }
}

TEST(FilenameValidatorTest, DotDotIsDangerousPattern) {
    CheckResult result = FilenameValidator::validate("guide..pdf");
    EXPECT_EQ(result.reason(), Rejection::kDangerousPattern);
    EXPECT_EQ(result.detail(), "..");
}

TEST(FilenameValidatorTest, SingleDotIsInvalidAfterSanitization) {
    EXPECT_EQ(FilenameValidator::validate(".").reason(), Rejection::kInvalidAfterSanitization);
}

TEST(FilenameValidatorTest, ValidateIsIdempotentOnAcceptedOutput) {
    const char* inputs[] = {"report.pdf", "user%2Dguide.md", "A-b_c.1.txt", "%41bc.doc"};
    for (const char* input : inputs) {
        CheckResult first = FilenameValidator::validate(input);
        ASSERT_TRUE(first.ok()) << input;
        CheckResult second = FilenameValidator::validate(first.value());
        ASSERT_TRUE(second.ok()) << first.value();
        EXPECT_EQ(first.value(), second.value());
    }
}

TEST(FilenameValidatorStepsTest, FindControlCharacter) {
    EXPECT_EQ(FilenameValidator::findControlCharacter("clean.pdf"), std::string::npos);
    EXPECT_EQ(FilenameValidator::findControlCharacter("a\tb\r\n"), std::string::npos);
    EXPECT_EQ(FilenameValidator::findControlCharacter(std::string("ab\0c", 4)), 2u);
    EXPECT_EQ(FilenameValidator::findControlCharacter("x\x1f"), 1u);
}

TEST(FilenameValidatorStepsTest, HasOnlyAllowedCharacters) {
    EXPECT_TRUE(FilenameValidator::hasOnlyAllowedCharacters("Az09._-"));
    EXPECT_FALSE(FilenameValidator::hasOnlyAllowedCharacters(""));
    EXPECT_FALSE(FilenameValidator::hasOnlyAllowedCharacters("a b"));
    EXPECT_FALSE(FilenameValidator::hasOnlyAllowedCharacters("a/b"));
    EXPECT_FALSE(FilenameValidator::hasOnlyAllowedCharacters("caf\xc3\xa9.pdf"));
}

TEST(FilenameValidatorStepsTest, FindDangerousPattern) {
    EXPECT_EQ(FilenameValidator::findDangerousPattern("safe.pdf"), nullptr);
    EXPECT_STREQ(FilenameValidator::findDangerousPattern("a/b"), "/");
    EXPECT_STREQ(FilenameValidator::findDangerousPattern("a\\b"), "\\");
    EXPECT_STREQ(FilenameValidator::findDangerousPattern("a|b"), "|");
    EXPECT_STREQ(FilenameValidator::findDangerousPattern("~/x"), "~/");
    EXPECT_STREQ(FilenameValidator::findDangerousPattern("what?"), "?");
}

TEST(FilenameValidatorStepsTest, BaseName) {
    EXPECT_EQ(FilenameValidator::baseName("dir/file.pdf"), "file.pdf");
    EXPECT_EQ(FilenameValidator::baseName("file.pdf"), "file.pdf");
    EXPECT_EQ(FilenameValidator::baseName("dir/sub/"), "sub");
    EXPECT_EQ(FilenameValidator::baseName(""), ".");
    EXPECT_EQ(FilenameValidator::baseName("///"), "/");
}

TEST(FilenameValidatorStepsTest, DecodeFollowsQueryRules) {
    std::string out;
    ASSERT_TRUE(FilenameValidator::decode("a+b%41", &out));
    EXPECT_EQ(out, "a bA");
    EXPECT_FALSE(FilenameValidator::decode("%g0", &out));
}
