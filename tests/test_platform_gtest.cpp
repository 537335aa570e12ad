// ==============================================================================
// test_platform_gtest.cpp - Тесты платформенного модуля (GoogleTest)
// ==============================================================================

#include <scanconv/platform.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace scanconv::platform::test {

// ==============================================================================
// Преобразование путей UTF-8 <-> path
// ==============================================================================

TEST(PlatformTest, PathFromUtf8_BasicPath) {
    // Act
    fs::path p = path_from_utf8("responses/abc123/openai.json");

    // Assert
    EXPECT_EQ(p.filename(), "openai.json");
    EXPECT_EQ(p.parent_path().filename(), "abc123");
}

TEST(PlatformTest, PathConversion_KeepsNonAscii) {
    // Arrange
    const std::string utf8 = "\xd0\xbe\xd1\x82\xd1\x87\xd1\x91\xd1\x82.txt";  // "отчёт.txt"

    // Act
    std::string back = path_to_utf8(path_from_utf8(utf8));

    // Assert
    EXPECT_EQ(back, utf8);
}

TEST(PlatformTest, PathConversion_Empty) {
    EXPECT_TRUE(path_from_utf8("").empty());
    EXPECT_TRUE(path_to_utf8(fs::path()).empty());
}

// ==============================================================================
// TTY detection
// ==============================================================================

TEST(PlatformTest, IsTty_DoesNotThrow) {
    EXPECT_NO_THROW({
        (void)is_tty(stdout);
        (void)is_tty(stderr);
    });
}

TEST(PlatformTest, IsTty_NullStreamIsNotTty) {
    EXPECT_FALSE(is_tty(nullptr));
}

// ==============================================================================
// Временные файлы и атомарная замена
// ==============================================================================

class PlatformFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("scanconv_platform_") + test_info->name() + "_" +
                                  std::to_string(
#ifdef _WIN32
                                      GetCurrentProcessId()
#else
                                      getpid()
#endif
                                  );
        temp_dir_ = fs::temp_directory_path() / unique_name;

        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    static std::string read_all(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path temp_dir_;
};

TEST_F(PlatformFileTest, MakeTempFileBeside_CreatesHiddenSibling) {
    // Arrange
    fs::path target = temp_dir_ / "converted.http";

    // Act
    fs::path tmp = make_temp_file_beside(target);

    // Assert
    EXPECT_TRUE(fs::exists(tmp));
    EXPECT_EQ(tmp.parent_path(), target.parent_path());
    EXPECT_EQ(path_to_utf8(tmp.filename()).rfind(".converted.http.", 0), 0u);
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(PlatformFileTest, MakeTempFileBeside_NamesAreUnique) {
    fs::path target = temp_dir_ / "unknown.txt";

    fs::path a = make_temp_file_beside(target);
    fs::path b = make_temp_file_beside(target);

    EXPECT_NE(a, b);
}

TEST_F(PlatformFileTest, MakeTempFileBeside_MissingDirectoryThrows) {
    fs::path target = temp_dir_ / "absent" / "file.json";

    EXPECT_THROW(make_temp_file_beside(target), std::runtime_error);
}

TEST_F(PlatformFileTest, ReplaceFile_OverwritesTarget) {
    // Arrange
    fs::path target = temp_dir_ / "http-client.env.json";
    {
        std::ofstream(target) << "old";
    }
    fs::path tmp = make_temp_file_beside(target);
    {
        std::ofstream(tmp) << "new";
    }

    // Act
    std::error_code ec = replace_file(tmp, target);

    // Assert
    EXPECT_FALSE(ec) << ec.message();
    EXPECT_EQ(read_all(target), "new");
    EXPECT_FALSE(fs::exists(tmp));
}

TEST_F(PlatformFileTest, ReplaceFile_MissingSourceReportsError) {
    std::error_code ec = replace_file(temp_dir_ / "absent", temp_dir_ / "target");

    EXPECT_TRUE(ec);
}

TEST_F(PlatformFileTest, SyncFile_WrittenFileIsSynced) {
    // Arrange
    std::FILE* file = std::fopen(path_to_utf8(temp_dir_ / "synced.json").c_str(), "wb");
    ASSERT_NE(file, nullptr);
    const std::string content = "{\"dev\": {}}";
    ASSERT_EQ(std::fwrite(content.data(), 1, content.size(), file), content.size());
    ASSERT_EQ(std::fflush(file), 0);

    // Act
    const bool synced = sync_file(file);
    std::fclose(file);

    // Assert
    EXPECT_TRUE(synced);
    EXPECT_EQ(read_all(temp_dir_ / "synced.json"), content);
}

TEST(PlatformTest, SyncFile_NullStreamFails) {
    EXPECT_FALSE(sync_file(nullptr));
}

TEST_F(PlatformFileTest, IsTty_RegularFileIsNotTty) {
    std::FILE* file = std::fopen(path_to_utf8(temp_dir_ / "plain.txt").c_str(), "wb");
    ASSERT_NE(file, nullptr);

    EXPECT_FALSE(is_tty(file));

    std::fclose(file);
}

}  // namespace scanconv::platform::test
