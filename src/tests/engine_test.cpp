#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <sstream>
#include <sys/stat.h>
#include "engine/engine.hpp"
#include "store/sidecar_store.hpp"
#include "test_utils.hpp"

using namespace csu::engine;
using namespace csu::checksum;
using ::testing::HasSubstr;
using ::testing::Not;

class EngineTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_test_logging();
    reporter_ = std::make_unique<csu::report::Reporter>(out_);
  }

  Engine make_engine(std::istream* input = nullptr, bool input_is_tty = true) {
    EngineOptions options;
    options.input = input;
    options.input_is_tty = input_is_tty;
    options.progress_enabled = false;
    options.version = "v0.0.0-test";
    return Engine(state_, *reporter_, options);
  }

  TempDir temp_dir_{"csu_engine_test"};
  RunState state_;
  std::ostringstream out_;
  std::unique_ptr<csu::report::Reporter> reporter_;
};

TEST_F(EngineTest, CreateThenCheckDirectory) {
  auto a = temp_dir_.write_file("a.txt", "alpha");
  auto b = temp_dir_.write_file("nested/b.txt", "beta");

  EXPECT_EQ(make_engine().create({temp_dir_.path().string()}), 0);

  EXPECT_EQ(read_file(csu::store::sidecar_path(a)), reference_sha512_hex("alpha"));
  EXPECT_EQ(read_file(csu::store::sidecar_path(b)), reference_sha512_hex("beta"));
  ASSERT_EQ(state_.creation_results().size(), 2u);
  EXPECT_THAT(out_.str(), HasSubstr("Checksum-Utils v0.0.0-test\n" + std::string(csu::report::PROJECT_URL) + "\n"));
  EXPECT_THAT(out_.str(), HasSubstr("Processing " + temp_dir_.path().string() + "\n"));
  EXPECT_THAT(out_.str(), HasSubstr("- " + a.string() + " ✅ ("));
  EXPECT_THAT(out_.str(), HasSubstr("✅ : 2 checksum files created"));

  out_.str("");
  EXPECT_EQ(make_engine().check({temp_dir_.path().string()}), 0);

  // Sidecars created above are skipped as candidates
  ASSERT_EQ(state_.verification_results().size(), 2u);
  EXPECT_THAT(out_.str(), HasSubstr("Results: 2 files processed"));
  EXPECT_THAT(out_.str(), HasSubstr("✅ : 2 checksum files match"));
  EXPECT_THAT(out_.str(), Not(HasSubstr("Errors:")));
}

TEST_F(EngineTest, CheckReportsEveryBucket) {
  temp_dir_.write_file("good.txt", "good");
  auto bad = temp_dir_.write_file("bad.txt", "bad");
  auto bare = temp_dir_.write_file("bare.txt", "bare");
  temp_dir_.write_file("good.txt.sha512", reference_sha512_hex("good") + "\n");
  temp_dir_.write_file("bad.txt.sha512", reference_sha512_hex("not bad"));

  EXPECT_EQ(make_engine().check({temp_dir_.path().string()}), 0);

  const std::string text = out_.str();
  EXPECT_THAT(text, HasSubstr("Results: 3 files processed"));
  EXPECT_THAT(text, HasSubstr("✅ : 1 checksum files match"));
  EXPECT_THAT(text, HasSubstr("⚠️ : 1 checksum files not match\n- " + bad.string() + "\n"));
  EXPECT_THAT(text, HasSubstr("👻 : 1 files without a checksum file\n- " + bare.string() + "\n"));
  EXPECT_THAT(text, HasSubstr("- " + bare.string() + " 👻\n"));
}

TEST_F(EngineTest, CreateLeavesExistingSidecarsAlone) {
  auto a = temp_dir_.write_file("a.txt", "alpha");
  temp_dir_.write_file("a.txt.sha512", "keep me");

  EXPECT_EQ(make_engine().create({a.string()}), 0);

  EXPECT_EQ(read_file(csu::store::sidecar_path(a)), "keep me");
  EXPECT_THAT(out_.str(), HasSubstr("- " + a.string() + " 📄\n"));
  EXPECT_THAT(out_.str(), HasSubstr("📄 : 1 files already had a checksum file"));
}

TEST_F(EngineTest, RejectedRootsAreCollectedAsErrors) {
  auto sidecar = temp_dir_.write_file("a.txt.sha512", "abc");
  auto missing = temp_dir_.path() / "missing.txt";

  EXPECT_EQ(make_engine().check({sidecar.string(), missing.string()}), 0);

  ASSERT_EQ(state_.errors().size(), 2u);
  EXPECT_EQ(state_.errors()[0], sidecar.string() + " is a checksum file.");
  EXPECT_THAT(state_.errors()[1], HasSubstr(missing.string()));

  // An existing root is announced before it is rejected; a missing one is not
  const std::string text = out_.str();
  EXPECT_THAT(text, HasSubstr("Processing " + sidecar.string() + "\n"));
  EXPECT_THAT(text, Not(HasSubstr("Processing " + missing.string())));
  EXPECT_THAT(text, Not(HasSubstr("Results:")));
  EXPECT_THAT(text, HasSubstr("\nErrors:\n- " + sidecar.string() + " is a checksum file.\n"));
}

TEST_F(EngineTest, NonRegularRootIsRejectedWithoutBlocking) {
  const auto fifo = temp_dir_.path() / "pipe";
  ASSERT_EQ(::mkfifo(fifo.c_str(), 0644), 0);

  EXPECT_EQ(make_engine().check({fifo.string()}), 0);

  EXPECT_TRUE(state_.verification_results().empty());
  ASSERT_EQ(state_.errors().size(), 1u);
  EXPECT_EQ(state_.errors()[0], fifo.string() + " is not a regular file");
}

TEST_F(EngineTest, GlobArgumentsAreExpanded) {
  temp_dir_.write_file("one.log", "1");
  temp_dir_.write_file("two.log", "2");
  temp_dir_.write_file("three.txt", "3");

  EXPECT_EQ(make_engine().create({(temp_dir_.path() / "*.log").string()}), 0);

  EXPECT_EQ(state_.creation_results().size(), 1u);
  EXPECT_TRUE(std::filesystem::exists(temp_dir_.path() / "one.log.sha512"));
  EXPECT_TRUE(std::filesystem::exists(temp_dir_.path() / "two.log.sha512"));
  EXPECT_FALSE(std::filesystem::exists(temp_dir_.path() / "three.txt.sha512"));
  EXPECT_THAT(out_.str(), HasSubstr("Processing " + (temp_dir_.path() / "one.log").string()));
  EXPECT_THAT(out_.str(), HasSubstr("Processing " + (temp_dir_.path() / "two.log").string()));
}

TEST_F(EngineTest, PathListFromInput) {
  auto a = temp_dir_.write_file("a.txt", "alpha");
  auto b = temp_dir_.write_file("b.txt", "beta");
  std::istringstream input(a.string() + "\n\n" + b.string() + ".sha512\n" + b.string() + "\n");

  EXPECT_EQ(make_engine(&input, false).create({}), 0);

  EXPECT_TRUE(std::filesystem::exists(csu::store::sidecar_path(a)));
  EXPECT_TRUE(std::filesystem::exists(csu::store::sidecar_path(b)));
  EXPECT_TRUE(state_.errors().empty());
}

TEST_F(EngineTest, TerminalInputIsNotRead) {
  auto a = temp_dir_.write_file("a.txt", "alpha");
  std::istringstream input(a.string() + "\n");

  EXPECT_EQ(make_engine(&input, true).create({}), 0);

  EXPECT_FALSE(std::filesystem::exists(csu::store::sidecar_path(a)));
  EXPECT_THAT(out_.str(), Not(HasSubstr("Processing")));
}

TEST_F(EngineTest, ResultsAreScopedPerRoot) {
  temp_dir_.write_file("first/a.txt", "alpha");
  auto b = temp_dir_.write_file("second/b.txt", "beta");

  EXPECT_EQ(make_engine().create({(temp_dir_.path() / "first").string(),
                                  (temp_dir_.path() / "second").string()}), 0);

  // Only the last root's results remain after the run
  auto results = state_.creation_results();
  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].path(), b);
}
