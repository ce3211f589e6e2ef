/**
 * @file annotation_store_test.cpp
 * @brief Unit tests for AnnotationStore
 */

#include "storage/annotation_store.h"

#include <gtest/gtest.h>
#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace annotate::storage {
namespace {

class AnnotationStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("annotate_store_test_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
    path_ = (dir_ / ".annotations").string();
  }

  void TearDown() override { fs::remove_all(dir_); }

  void WriteFile(const std::string& contents) const {
    std::ofstream out(path_, std::ios::trunc);
    out << contents;
  }

  std::string ReadFile() const {
    std::ifstream in(path_);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
  }

  fs::path dir_;
  std::string path_;
};

// ============================================================================
// Load
// ============================================================================

TEST_F(AnnotationStoreTest, LoadCreatesMissingFile) {
  AnnotationStore store(path_);
  ASSERT_FALSE(fs::exists(path_));

  auto loaded = store.Load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message();
  EXPECT_TRUE(loaded->empty());
  EXPECT_TRUE(fs::exists(path_));
  EXPECT_EQ(fs::file_size(path_), 0U);
}

TEST_F(AnnotationStoreTest, LoadEmptyFile) {
  WriteFile("");
  AnnotationStore store(path_);

  auto loaded = store.Load();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_TRUE(loaded->empty());
}

TEST_F(AnnotationStoreTest, LoadKeepsFileOrder) {
  WriteFile("1000 hello\n2000 world\n");
  AnnotationStore store(path_);

  auto loaded = store.Load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message();
  ASSERT_EQ(loaded->size(), 2U);
  EXPECT_EQ((*loaded)[0].content, "hello");
  EXPECT_EQ((*loaded)[0].created_at, 1000U);
  EXPECT_EQ((*loaded)[1].content, "world");
  EXPECT_EQ((*loaded)[1].created_at, 2000U);
}

TEST_F(AnnotationStoreTest, LoadSkipsEmptyLines) {
  WriteFile("\n1000 hello\n\n\n2000 world");
  AnnotationStore store(path_);

  auto loaded = store.Load();
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 2U);
  EXPECT_EQ((*loaded)[1].content, "world");
}

TEST_F(AnnotationStoreTest, LoadRejectsMalformedLine) {
  WriteFile("1000 hello\nhelloworld\n2000 world\n");
  AnnotationStore store(path_);

  auto loaded = store.Load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().code(), utils::ErrorCode::kAnnotationMissingDelimiter);
  EXPECT_EQ(loaded.error().context(), path_ + ":2");
  EXPECT_TRUE(loaded.error().IsCorruptStore());
}

TEST_F(AnnotationStoreTest, LoadRejectsInvalidTimestamp) {
  WriteFile("yesterday hello\n");
  AnnotationStore store(path_);

  auto loaded = store.Load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().code(), utils::ErrorCode::kAnnotationInvalidTimestamp);
}

TEST_F(AnnotationStoreTest, LoadFailsWhenDirectoryIsMissing) {
  AnnotationStore store((dir_ / "missing" / ".annotations").string());

  auto loaded = store.Load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().code(), utils::ErrorCode::kStoreOpenFailed);
}

// ============================================================================
// Append
// ============================================================================

TEST_F(AnnotationStoreTest, AppendWritesOneLine) {
  AnnotationStore store(path_);

  auto appended = store.Append("hello", 1000);
  ASSERT_TRUE(appended.has_value()) << appended.error().message();
  EXPECT_EQ(ReadFile(), "1000 hello\n");
}

TEST_F(AnnotationStoreTest, AppendThenLoadKeepsOrder) {
  AnnotationStore store(path_);
  const int kCount = 5;
  for (int i = 0; i < kCount; ++i) {
    ASSERT_TRUE(store.Append("note " + std::to_string(i), 1000 + static_cast<uint64_t>(i)).has_value());
  }

  auto loaded = store.Load();
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), static_cast<size_t>(kCount));
  for (int i = 0; i < kCount; ++i) {
    EXPECT_EQ((*loaded)[i].content, "note " + std::to_string(i));
    EXPECT_EQ((*loaded)[i].created_at, 1000 + static_cast<uint64_t>(i));
  }
}

TEST_F(AnnotationStoreTest, AppendUsesCurrentTime) {
  AnnotationStore store(path_);
  uint64_t before = annotation::CurrentTimeMillis();
  ASSERT_TRUE(store.Append("now").has_value());
  uint64_t after = annotation::CurrentTimeMillis();

  auto loaded = store.Load();
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 1U);
  EXPECT_GE((*loaded)[0].created_at, before);
  EXPECT_LE((*loaded)[0].created_at, after);
}

TEST_F(AnnotationStoreTest, AppendPreservesExistingRecords) {
  WriteFile("1000 hello\n");
  AnnotationStore store(path_);

  ASSERT_TRUE(store.Append("world", 2000).has_value());
  EXPECT_EQ(ReadFile(), "1000 hello\n2000 world\n");
}

TEST_F(AnnotationStoreTest, AppendRejectsMultilineContent) {
  AnnotationStore store(path_);

  auto appended = store.Append("first\nsecond", 1000);
  ASSERT_FALSE(appended.has_value());
  EXPECT_EQ(appended.error().code(), utils::ErrorCode::kAnnotationInvalidContent);
  EXPECT_FALSE(fs::exists(path_));
}

TEST_F(AnnotationStoreTest, AppendReportsOpenFailure) {
  AnnotationStore store((dir_ / "missing" / ".annotations").string());

  auto appended = store.Append("hello", 1000);
  ASSERT_FALSE(appended.has_value());
  EXPECT_EQ(appended.error().code(), utils::ErrorCode::kStoreOpenFailed);
}

// ============================================================================
// Save
// ============================================================================

TEST_F(AnnotationStoreTest, SaveRewritesWholeFile) {
  WriteFile("1000 hello\n2000 world\n3000 again\n");
  AnnotationStore store(path_);

  AnnotationCollection remaining = {annotation::Annotation("again", 3000)};
  ASSERT_TRUE(store.Save(remaining).has_value());
  EXPECT_EQ(ReadFile(), "3000 again\n");
}

TEST_F(AnnotationStoreTest, SaveEmptyCollectionTruncates) {
  WriteFile("1000 hello\n");
  AnnotationStore store(path_);

  ASSERT_TRUE(store.Save({}).has_value());
  EXPECT_EQ(ReadFile(), "");
}

TEST_F(AnnotationStoreTest, DeleteFirstThenSave) {
  WriteFile("1000 hello\n2000 world\n");
  AnnotationStore store(path_);

  auto loaded = store.Load();
  ASSERT_TRUE(loaded.has_value());
  loaded->erase(loaded->begin());
  ASSERT_TRUE(store.Save(*loaded).has_value());

  EXPECT_EQ(ReadFile(), "2000 world\n");
}

TEST_F(AnnotationStoreTest, SaveReportsOpenFailure) {
  AnnotationStore store((dir_ / "missing" / ".annotations").string());

  auto saved = store.Save({annotation::Annotation("hello", 1000)});
  ASSERT_FALSE(saved.has_value());
  EXPECT_EQ(saved.error().code(), utils::ErrorCode::kStoreOpenFailed);
}

// ============================================================================
// Path resolution
// ============================================================================

class ResolveDefaultPathTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* home = std::getenv("HOME");
    had_home_ = home != nullptr;
    if (had_home_) {
      saved_home_ = home;
    }
  }

  void TearDown() override {
    if (had_home_) {
      ::setenv("HOME", saved_home_.c_str(), 1);
    } else {
      ::unsetenv("HOME");
    }
  }

 private:
  bool had_home_ = false;
  std::string saved_home_;
};

TEST_F(ResolveDefaultPathTest, UsesHomeDirectory) {
  ::setenv("HOME", "/home/tester", 1);

  auto path = AnnotationStore::ResolveDefaultPath();
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(*path, "/home/tester/.annotations");
}

TEST_F(ResolveDefaultPathTest, FailsWithoutHome) {
  ::unsetenv("HOME");

  auto path = AnnotationStore::ResolveDefaultPath();
  ASSERT_FALSE(path.has_value());
  EXPECT_EQ(path.error().code(), utils::ErrorCode::kStoreHomeNotSet);
}

TEST_F(ResolveDefaultPathTest, FailsWithEmptyHome) {
  ::setenv("HOME", "", 1);

  auto path = AnnotationStore::ResolveDefaultPath();
  ASSERT_FALSE(path.has_value());
  EXPECT_EQ(path.error().code(), utils::ErrorCode::kStoreHomeNotSet);
}

}  // namespace
}  // namespace annotate::storage
