// ==============================================================================
// test_convert_gtest.cpp - Сквозные тесты конвейера конвертации (GoogleTest)
// ==============================================================================

#include <scanconv/convert.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <rapidjson/document.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace scanconv::convert::test {

class ConvertTestFixture : public ::testing::Test {
protected:
    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("scanconv_convert_") + test_info->name() + "_" +
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

        paths_ = OutputPaths::in_directory(temp_dir_ / "out");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    fs::path write_report(const std::string& content) {
        fs::path path = temp_dir_ / "report.txt";
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    static std::string read_file(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    ConvertResult run(const fs::path& report,
                      classify::CollisionPolicy policy = classify::CollisionPolicy::LastWriteWins) {
        auto built = ConverterBuilder::create().collision_policy(policy).build();
        EXPECT_TRUE(built.ok) << built.error;
        return built.converter->convert(report, paths_);
    }

    fs::path temp_dir_;
    OutputPaths paths_;
};

// ==============================================================================
// Сквозные сценарии
// ==============================================================================

TEST_F(ConvertTestFixture, KnownSecretProducesTemplateAndStoreEntry) {
    auto report = write_report("Found verified result 🐷🔑\n"
                               "Detector Type: OpenAI\n"
                               "Decoder Type: PLAIN\n"
                               "Raw result: sk-test123\n"
                               "File: /x/extensions/abc/y.js\n"
                               "Line: 3\n");

    auto result = run(report);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.stats.parsed, 1u);
    EXPECT_EQ(result.stats.known, 1u);
    EXPECT_EQ(result.stats.unknown, 0u);
    EXPECT_EQ(result.stats.dirs_created, 1u);

    EXPECT_EQ(read_file(paths_.http_file),
              "### OpenAI (abc)\n"
              "GET https://api.openai.com/v1/models HTTP/1.1\n"
              "Authorization: Bearer {{abc_openai}}\n"
              ">> responses/abc/openai.json\n"
              "\n");

    rapidjson::Document store;
    store.Parse(read_file(paths_.env_file).c_str());
    ASSERT_FALSE(store.HasParseError());
    ASSERT_TRUE(store.HasMember("dev"));
    ASSERT_TRUE(store["dev"].HasMember("abc_openai"));
    EXPECT_STREQ(store["dev"]["abc_openai"].GetString(), "sk-test123");

    EXPECT_EQ(read_file(paths_.unknown_file), "");
    EXPECT_TRUE(fs::is_directory(paths_.responses_root / "abc"));
}

TEST_F(ConvertTestFixture, UnknownSecretGoesOnlyToUnknownReport) {
    auto report = write_report("Found unverified result 🐷🔑❓\n"
                               "Detector Type: FooBarService\n"
                               "Raw result: foo-raw-value\n"
                               "File: /tmp/a.txt\n");

    auto result = run(report);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.stats.known, 0u);
    EXPECT_EQ(result.stats.unknown, 1u);

    EXPECT_EQ(read_file(paths_.http_file), "");

    rapidjson::Document store;
    store.Parse(read_file(paths_.env_file).c_str());
    ASSERT_FALSE(store.HasParseError());
    EXPECT_TRUE(store["dev"].IsObject());
    EXPECT_EQ(store["dev"].MemberCount(), 0u);

    EXPECT_EQ(read_file(paths_.unknown_file),
              "Unknown Secret Type: FooBarService\n"
              "Extension: unknown\n"
              "Raw Value: foo-raw-value\n"
              "File: /tmp/a.txt\n"
              "Verified: No\n"
              "\n");
    // Директории групп создаются только для known
    EXPECT_TRUE(fs::is_directory(paths_.responses_root));
    EXPECT_FALSE(fs::exists(paths_.responses_root / "unknown"));
}

TEST_F(ConvertTestFixture, CollisionKeepsLastValueAndEmitsBothBlocks) {
    auto report = write_report("Found verified result\n"
                               "Detector Type: OpenAI\n"
                               "Raw result: sk-first\n"
                               "File: extensions/g/a.js\n"
                               "Found verified result\n"
                               "Detector Type: OpenAI\n"
                               "Raw result: sk-second\n"
                               "File: extensions/g/b.js\n");

    auto result = run(report);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.stats.known, 2u);
    EXPECT_EQ(result.stats.collisions, 1u);

    const std::string http = read_file(paths_.http_file);
    std::size_t blocks = 0;
    for (auto pos = http.find("{{g_openai}}"); pos != std::string::npos;
         pos = http.find("{{g_openai}}", pos + 1)) {
        ++blocks;
    }
    EXPECT_EQ(blocks, 2u);

    rapidjson::Document store;
    store.Parse(read_file(paths_.env_file).c_str());
    ASSERT_FALSE(store.HasParseError());
    EXPECT_EQ(store["dev"].MemberCount(), 1u);
    EXPECT_STREQ(store["dev"]["g_openai"].GetString(), "sk-second");
}

TEST_F(ConvertTestFixture, DisambiguateKeepsBothValues) {
    auto report = write_report("Found verified result\n"
                               "Detector Type: OpenAI\n"
                               "Raw result: sk-first\n"
                               "File: extensions/g/a.js\n"
                               "Found verified result\n"
                               "Detector Type: OpenAI\n"
                               "Raw result: sk-second\n"
                               "File: extensions/g/b.js\n");

    auto result = run(report, classify::CollisionPolicy::Disambiguate);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.stats.collisions, 0u);

    const std::string http = read_file(paths_.http_file);
    EXPECT_NE(http.find("{{g_openai}}"), std::string::npos);
    EXPECT_NE(http.find("{{g_openai_2}}"), std::string::npos);

    rapidjson::Document store;
    store.Parse(read_file(paths_.env_file).c_str());
    ASSERT_FALSE(store.HasParseError());
    EXPECT_STREQ(store["dev"]["g_openai"].GetString(), "sk-first");
    EXPECT_STREQ(store["dev"]["g_openai_2"].GetString(), "sk-second");
}

TEST_F(ConvertTestFixture, DuplicateRawValuesAreRemoved) {
    auto report = write_report("Found verified result\n"
                               "Detector Type: Miro\n"
                               "Raw result: same\n"
                               "Found unverified result\n"
                               "Detector Type: Miro\n"
                               "Raw result: same\n");

    auto result = run(report);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.stats.parsed, 2u);
    EXPECT_EQ(result.stats.duplicates, 1u);
    EXPECT_EQ(result.stats.known, 1u);
}

TEST_F(ConvertTestFixture, SecretValuesNeverAppearInTemplates) {
    auto report = write_report("Found verified result\n"
                               "Detector Type: Alchemy\n"
                               "Raw result: alch-secret\n"
                               "Found verified result\n"
                               "Detector Type: TelegramBotToken\n"
                               "Raw result: 123456:tg-secret\n"
                               "Found verified result\n"
                               "Detector Type: Unlisted\n"
                               "Raw result: other-secret\n");

    auto result = run(report);

    ASSERT_TRUE(result.ok) << result.error.format();
    const std::string http = read_file(paths_.http_file);
    EXPECT_EQ(http.find("alch-secret"), std::string::npos);
    EXPECT_EQ(http.find("tg-secret"), std::string::npos);
    EXPECT_EQ(http.find("other-secret"), std::string::npos);
    EXPECT_NE(http.find("{{unknown_alchemy}}"), std::string::npos);
    EXPECT_NE(http.find("{{unknown_telegrambottoken}}"), std::string::npos);
}

TEST_F(ConvertTestFixture, RerunOverwritesArtifacts) {
    auto report = write_report("Found verified result\n"
                               "Detector Type: OpenAI\n"
                               "Raw result: sk-1\n");
    ASSERT_TRUE(run(report).ok);

    report = write_report("Found verified result\n"
                          "Detector Type: Miro\n"
                          "Raw result: m-1\n");
    auto result = run(report);

    ASSERT_TRUE(result.ok) << result.error.format();
    const std::string store = read_file(paths_.env_file);
    EXPECT_EQ(store.find("sk-1"), std::string::npos);
    EXPECT_NE(store.find("m-1"), std::string::npos);
    // Директория группы уже существовала
    EXPECT_EQ(result.stats.dirs_created, 0u);
}

TEST_F(ConvertTestFixture, EmptyReportProducesEmptyArtifacts) {
    auto result = run(write_report(""));

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(read_file(paths_.http_file), "");
    EXPECT_EQ(read_file(paths_.unknown_file), "");
    EXPECT_NE(read_file(paths_.env_file).find("\"dev\": {}"), std::string::npos);
}

// ==============================================================================
// Ошибки
// ==============================================================================

TEST_F(ConvertTestFixture, MissingReportStopsBeforeAnyArtifact) {
    auto result = run(temp_dir_ / "absent.txt");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, artifact::ArtifactKind::Report);
    EXPECT_FALSE(fs::exists(paths_.http_file));
    EXPECT_FALSE(fs::exists(paths_.responses_root));
}

TEST_F(ConvertTestFixture, BlockedResponseRootStopsPipeline) {
    auto report = write_report("Found verified result\n"
                               "Detector Type: OpenAI\n"
                               "Raw result: sk-1\n");
    fs::create_directories(paths_.responses_root.parent_path());
    {
        std::ofstream blocker(paths_.responses_root);
        blocker << "x";
    }

    auto result = run(report);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, artifact::ArtifactKind::ResponseDirectories);
    EXPECT_FALSE(fs::exists(paths_.http_file));
}

TEST_F(ConvertTestFixture, TemplateLeakingSecretIsRefused) {
    // Значение секрета совпадает с частью URL шаблона
    auto report = write_report("Found verified result\n"
                               "Detector Type: OpenAI\n"
                               "Raw result: api.openai.com\n");

    auto result = run(report);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, artifact::ArtifactKind::HttpTemplates);
    EXPECT_FALSE(fs::exists(paths_.http_file));
    EXPECT_EQ(result.error.format().find("api.openai.com"), std::string::npos);
}

TEST_F(ConvertTestFixture, UnknownSecretInTemplateIsRefused) {
    // Значение нераспознанного секрета совпадает с хостом шаблона OpenAI
    auto report = write_report("Found verified result\n"
                               "Detector Type: OpenAI\n"
                               "Raw result: sk-known\n"
                               "Found unverified result\n"
                               "Detector Type: Unlisted\n"
                               "Raw result: api.openai.com\n");

    auto result = run(report);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, artifact::ArtifactKind::HttpTemplates);
    EXPECT_FALSE(fs::exists(paths_.http_file));
    EXPECT_FALSE(fs::exists(paths_.unknown_file));
}

// ==============================================================================
// Builder и пути
// ==============================================================================

TEST(ConverterBuilderTest, RejectsEmptyEnvironment) {
    auto built = ConverterBuilder::create().environment("").build();

    EXPECT_FALSE(built.ok);
    EXPECT_EQ(built.converter, nullptr);
    EXPECT_FALSE(built.error.empty());
}

TEST(ConverterBuilderTest, RejectsReservedEnvironment) {
    auto built = ConverterBuilder::create().environment("$schema").build();

    EXPECT_FALSE(built.ok);
}

TEST(ConverterBuilderTest, DefaultsUseBuiltinCatalog) {
    auto built = ConverterBuilder::create().build();

    ASSERT_TRUE(built.ok);
    EXPECT_EQ(built.converter->catalog().size(), catalog::Catalog::builtin().size());
    EXPECT_EQ(built.converter->environment(), "dev");
    EXPECT_EQ(built.converter->collision_policy(), classify::CollisionPolicy::LastWriteWins);
}

TEST(OutputPathsTest, DefaultsInsideDirectory) {
    auto paths = OutputPaths::in_directory("out");

    EXPECT_EQ(paths.http_file, fs::path("out") / "converted.http");
    EXPECT_EQ(paths.env_file, fs::path("out") / "http-client.env.json");
    EXPECT_EQ(paths.unknown_file, fs::path("out") / "unknown.txt");
    EXPECT_EQ(paths.responses_root, fs::path("out") / "responses");
}

TEST(OutputPathsTest, RedirectPrefixIsRelativeToHttpFile) {
    EXPECT_EQ(redirect_prefix_for(OutputPaths::in_directory(".")), "responses");
    EXPECT_EQ(redirect_prefix_for(OutputPaths::in_directory("a/b")), "responses");

    OutputPaths paths = OutputPaths::in_directory("work");
    paths.responses_root = "work/data/resp/";
    EXPECT_EQ(redirect_prefix_for(paths), "data/resp");

    paths.http_file = "work/http/converted.http";
    paths.responses_root = "work/resp";
    EXPECT_EQ(redirect_prefix_for(paths), "../resp");

    paths.http_file = "work/converted.http";
    paths.responses_root = "work";
    EXPECT_EQ(redirect_prefix_for(paths), "");
}

}  // namespace scanconv::convert::test
