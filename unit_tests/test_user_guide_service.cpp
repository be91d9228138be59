#include "gtest/gtest.h"
#include "service/user_guide_service.h"
#include "test_utils.h"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

TEST(UserGuideServiceTest, LocatesConfiguredGuide) {
    TempDir base("service");
    write_test_file(base / "user-guide.pdf", "%PDF");

    UserGuideService service(base.str(), "user-guide.pdf");
    CheckResult result = service.locateUserGuide();
    ASSERT_TRUE(result.ok()) << result.describe();
    EXPECT_EQ(result.value(), fs::canonical(base / "user-guide.pdf").string());
    EXPECT_EQ(service.configuredFile(), "user-guide.pdf");
    EXPECT_EQ(service.baseDir(), base.str());
}

TEST(UserGuideServiceTest, TraversalInConfiguredNameIsRejectedBeforeFilesystem) {
    TempDir base("service");
    UserGuideService service(base.str(), "..%2f..%2fetc%2fpasswd");
    CheckResult result = service.locateUserGuide();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.reason(), Rejection::kInvalidCharacters);
}

TEST(UserGuideServiceTest, DisallowedExtensionIsRejected) {
    TempDir base("service");
    write_test_file(base / "notes.exe", "MZ");
    UserGuideService service(base.str(), "notes.exe");
    EXPECT_EQ(service.locateUserGuide().reason(), Rejection::kExtensionNotAllowed);
}

TEST(UserGuideServiceTest, MissingGuideIsNotFound) {
    TempDir base("service");
    UserGuideService service(base.str(), "user-guide.pdf");
    EXPECT_EQ(service.locateUserGuide().reason(), Rejection::kNotFound);
}

TEST(UserGuideServiceTest, GuideAppearingLaterIsPickedUp) {
    TempDir base("service");
    UserGuideService service(base.str(), "manual.md");
    EXPECT_FALSE(service.locateUserGuide().ok());
    write_test_file(base / "manual.md", "# Manual");
    EXPECT_TRUE(service.locateUserGuide().ok());
}

TEST(UserGuideServiceTest, ReportsSanitizedNameSeparatelyFromCanonicalPath) {
    TempDir base("service");
    write_test_file(base / "real.txt", "text");
    fs::create_symlink(base / "real.txt", base / "guide.pdf");

    UserGuideService service(base.str(), "guide.pdf");
    std::string name;
    CheckResult result = service.locateUserGuide(&name);
    ASSERT_TRUE(result.ok()) << result.describe();
    EXPECT_EQ(name, "guide.pdf");
    EXPECT_EQ(result.value(), fs::canonical(base / "real.txt").string());
}

TEST(UserGuideServiceTest, SanitizedNameUntouchedOnRejection) {
    TempDir base("service");
    UserGuideService service(base.str(), "user-guide.pdf");
    std::string name = "unchanged";
    EXPECT_FALSE(service.locateUserGuide(&name).ok());
    EXPECT_EQ(name, "unchanged");
}

TEST(UserGuideServiceTest, LeadingDotWithAllowedExtensionIsServed) {
    TempDir base("service");
    write_test_file(base / ".pdf", "%PDF");
    UserGuideService service(base.str(), ".pdf");
    CheckResult result = service.locateUserGuide();
    ASSERT_TRUE(result.ok()) << result.describe();
    EXPECT_EQ(result.value(), fs::canonical(base / ".pdf").string());
}
