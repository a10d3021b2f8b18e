#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include "checksum/classifier.hpp"
#include "store/sidecar_store.hpp"
#include "test_utils.hpp"

using namespace csu::checksum;
using csu::store::sidecar_path;

namespace {

std::string to_upper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}

} // namespace

class ClassifierTest : public ::testing::Test {
protected:
  TempDir dir{"classifier_test"};

  void SetUp() override {
    init_test_logging();
  }
};

//==============================================
// VERIFICATION
//==============================================

TEST_F(ClassifierTest, VerifyWithoutSidecarIsNotFound) {
  auto path = dir.write_file("data.txt", "hello");

  auto result = verify(path);
  EXPECT_EQ(result.status(), VerificationStatus::NotFound);
  EXPECT_FALSE(result.has_error());
  EXPECT_EQ(result.path(), path);
}

TEST_F(ClassifierTest, VerifyMatchIsCaseInsensitive) {
  auto path = dir.write_file("data.txt", "hello");
  dir.write_file("data.txt.sha512", to_upper(reference_sha512_hex("hello")));

  auto result = verify(path);
  EXPECT_EQ(result.status(), VerificationStatus::Match);
  EXPECT_FALSE(result.has_error());
}

TEST_F(ClassifierTest, VerifyTrimsSurroundingWhitespace) {
  auto path = dir.write_file("data.txt", "hello");
  dir.write_file("data.txt.sha512", "  " + reference_sha512_hex("hello") + "\n");

  EXPECT_EQ(verify(path).status(), VerificationStatus::Match);
}

TEST_F(ClassifierTest, VerifyDifferentDigestIsNotMatch) {
  auto path = dir.write_file("data.txt", "hello");
  dir.write_file("data.txt.sha512", "deadbeef");

  auto result = verify(path);
  EXPECT_EQ(result.status(), VerificationStatus::NotMatch);
  EXPECT_FALSE(result.has_error());
}

TEST_F(ClassifierTest, VerifyScenarioAcrossSidecarRewrites) {
  auto path = dir.write_file("data.txt", "hello");
  EXPECT_EQ(verify(path).status(), VerificationStatus::NotFound);

  dir.write_file("data.txt.sha512", to_upper(reference_sha512_hex("hello")));
  EXPECT_EQ(verify(path).status(), VerificationStatus::Match);

  dir.write_file("data.txt.sha512", "deadbeef");
  EXPECT_EQ(verify(path).status(), VerificationStatus::NotMatch);
}

TEST_F(ClassifierTest, VerifyEmptyFile) {
  auto path = dir.write_file("empty.txt", "");
  dir.write_file("empty.txt.sha512", reference_sha512_hex(""));

  EXPECT_EQ(verify(path).status(), VerificationStatus::Match);
}

TEST_F(ClassifierTest, VerifyMissingFileFails) {
  auto result = verify(dir.path() / "missing.txt");
  EXPECT_EQ(result.status(), VerificationStatus::CheckingFailed);
  ASSERT_TRUE(result.has_error());
  EXPECT_FALSE(result.error()->empty());
}

TEST_F(ClassifierTest, VerifyDirectoryFailsWhileHashing) {
  auto sub = dir.path() / "folder";
  std::filesystem::create_directories(sub);
  dir.write_file("folder.sha512", "deadbeef");

  auto result = verify(sub);
  EXPECT_EQ(result.status(), VerificationStatus::CheckingFailed);
  EXPECT_TRUE(result.has_error());
}

TEST_F(ClassifierTest, VerifyLockedFile) {
  auto path = dir.write_file("locked.txt", "secret");
  if (!lock_file(path)) {
    GTEST_SKIP() << "Unable to enforce read permissions in this environment";
  }

  auto result = verify(path);
  EXPECT_EQ(result.status(), VerificationStatus::Locked);
  EXPECT_TRUE(result.has_error());
}

TEST_F(ClassifierTest, VerifyLockedFileWinsOverMissingSidecar) {
  auto path = dir.write_file("locked.txt", "secret");
  if (!lock_file(path)) {
    GTEST_SKIP() << "Unable to enforce read permissions in this environment";
  }
  ASSERT_FALSE(std::filesystem::exists(sidecar_path(path)));

  EXPECT_EQ(verify(path).status(), VerificationStatus::Locked);
}

//==============================================
// CREATION
//==============================================

TEST_F(ClassifierTest, CreateWritesLowercaseHexWithoutNewline) {
  auto path = dir.write_file("data.txt", "hello checksum");

  auto result = create(path);
  EXPECT_EQ(result.status(), CreationStatus::Created);
  EXPECT_FALSE(result.has_error());
  EXPECT_EQ(read_file(sidecar_path(path)), reference_sha512_hex("hello checksum"));
}

TEST_F(ClassifierTest, CreateLeavesExistingSidecarUntouched) {
  auto path = dir.write_file("data.txt", "hello checksum");
  dir.write_file("data.txt.sha512", "existing");

  auto result = create(path);
  EXPECT_EQ(result.status(), CreationStatus::Existing);
  EXPECT_FALSE(result.has_error());
  EXPECT_EQ(read_file(sidecar_path(path)), "existing");
}

TEST_F(ClassifierTest, CreateMissingFileFails) {
  auto path = dir.path() / "missing.txt";

  auto result = create(path);
  EXPECT_EQ(result.status(), CreationStatus::Failed);
  EXPECT_TRUE(result.has_error());
  EXPECT_FALSE(std::filesystem::exists(sidecar_path(path)));
}

TEST_F(ClassifierTest, CreateLockedFile) {
  auto path = dir.write_file("locked.txt", "secret");
  if (!lock_file(path)) {
    GTEST_SKIP() << "Unable to enforce read permissions in this environment";
  }

  auto result = create(path);
  EXPECT_EQ(result.status(), CreationStatus::LockedCreation);
  EXPECT_TRUE(result.has_error());
  EXPECT_FALSE(std::filesystem::exists(sidecar_path(path)));
}

TEST_F(ClassifierTest, CreateWithExistingSidecarSkipsUnreadableFile) {
  auto path = dir.write_file("data.txt", "data");
  dir.write_file("data.txt.sha512", "existing");
  if (!lock_file(path)) {
    GTEST_SKIP() << "Unable to enforce read permissions in this environment";
  }

  auto result = create(path);
  EXPECT_EQ(result.status(), CreationStatus::Existing);
  EXPECT_FALSE(result.has_error());
  EXPECT_EQ(read_file(sidecar_path(path)), "existing");
}

TEST_F(ClassifierTest, CreateThenVerifyMatches) {
  const std::vector<std::string> contents = {
    "",
    "hello",
    std::string(200000, '\0'),
    std::string("\x00\xff\x10 binary \r\n", 13),
  };

  for (size_t i = 0; i < contents.size(); ++i) {
    auto path = dir.write_file("file_" + std::to_string(i), contents[i]);
    ASSERT_EQ(create(path).status(), CreationStatus::Created) << "content #" << i;
    EXPECT_EQ(verify(path).status(), VerificationStatus::Match) << "content #" << i;
  }
}

TEST_F(ClassifierTest, VerifyDetectsModificationAfterCreate) {
  auto path = dir.write_file("data.txt", "original");
  ASSERT_EQ(create(path).status(), CreationStatus::Created);

  dir.write_file("data.txt", "tampered");
  EXPECT_EQ(verify(path).status(), VerificationStatus::NotMatch);
}

//==============================================
// OUTCOME INVARIANTS
//==============================================

TEST(OutcomeTest, ErrorPairingIsEnforced) {
  EXPECT_NO_THROW(VerificationOutcome("/a", VerificationStatus::Match));
  EXPECT_NO_THROW(VerificationOutcome("/a", VerificationStatus::Locked, std::string("denied")));
  EXPECT_THROW(VerificationOutcome("/a", VerificationStatus::Match, std::string("oops")), std::invalid_argument);
  EXPECT_THROW(VerificationOutcome("/a", VerificationStatus::CheckingFailed), std::invalid_argument);
  EXPECT_THROW(VerificationOutcome("/a", VerificationStatus::CheckingFailed, std::string()), std::invalid_argument);

  EXPECT_NO_THROW(CreationOutcome("/a", CreationStatus::Existing));
  EXPECT_THROW(CreationOutcome("/a", CreationStatus::Failed), std::invalid_argument);
  EXPECT_THROW(CreationOutcome("/a", CreationStatus::Created, std::string("oops")), std::invalid_argument);
}

TEST(OutcomeTest, StatusNames) {
  EXPECT_STREQ(to_string(VerificationStatus::NotMatch), "NotMatch");
  EXPECT_STREQ(to_string(VerificationStatus::Locked), "Locked");
  EXPECT_STREQ(to_string(CreationStatus::LockedCreation), "LockedCreation");
  EXPECT_THAT(::testing::PrintToString(CreationStatus::Existing), ::testing::HasSubstr("Existing"));
}
