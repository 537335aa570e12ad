// ==============================================================================
// test_artifact_gtest.cpp - Тесты генерации артефактов (GoogleTest)
// ==============================================================================

#include <scanconv/artifact.hpp>

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

namespace scanconv::artifact::test {

namespace {

report::SecretRecord make_record(std::string type, std::string raw, std::string group) {
    report::SecretRecord r;
    r.detector_type = std::move(type);
    r.raw_value = std::move(raw);
    r.group_id = std::move(group);
    r.file_path = "data/extensions/" + r.group_id + "/x.js";
    return r;
}

}  // namespace

// ==============================================================================
// HTTP шаблоны
// ==============================================================================

TEST(HttpTemplatesTest, RendersGetRequestWithHeader) {
    auto record = make_record("OpenAI", "sk-abc123", "abc");
    const catalog::EndpointTemplate* endpoint = catalog::Catalog::builtin().find("OpenAI");
    ASSERT_NE(endpoint, nullptr);

    std::string block = render_http_request(record, "abc_openai", *endpoint);

    EXPECT_EQ(block,
              "### OpenAI (abc)\n"
              "GET https://api.openai.com/v1/models HTTP/1.1\n"
              "Authorization: Bearer {{abc_openai}}\n"
              ">> responses/abc/openai.json\n"
              "\n");
}

TEST(HttpTemplatesTest, RendersPostRequestWithBody) {
    auto record = make_record("Infura", "inf-key", "grp");
    const catalog::EndpointTemplate* endpoint = catalog::Catalog::builtin().find("Infura");
    ASSERT_NE(endpoint, nullptr);

    std::string block = render_http_request(record, "grp_infura", *endpoint);

    EXPECT_EQ(block,
              "### Infura (grp)\n"
              "POST https://mainnet.infura.io/v3/{{grp_infura}} HTTP/1.1\n"
              "Content-Type: application/json\n"
              ">> responses/grp/infura.json\n"
              "\n"
              "{\n"
              "  \"jsonrpc\": \"2.0\",\n"
              "  \"method\": \"eth_blockNumber\",\n"
              "  \"params\": [],\n"
              "  \"id\": 1\n"
              "}\n"
              "\n");
}

TEST(HttpTemplatesTest, RedirectUsesNormalizedTypeAndPrefix) {
    auto record = make_record("Telegram Bot Token", "123:abc", "unknown");
    const catalog::EndpointTemplate* endpoint =
        catalog::Catalog::builtin().find(record.detector_type);
    ASSERT_NE(endpoint, nullptr);

    std::string block =
        render_http_request(record, "unknown_telegrambottoken", *endpoint, "../out/responses/");

    EXPECT_NE(block.find("### Telegram Bot Token (unknown)\n"), std::string::npos);
    EXPECT_NE(block.find("GET https://api.telegram.org/bot{{unknown_telegrambottoken}}/getMe"),
              std::string::npos);
    EXPECT_NE(block.find(">> ../out/responses/unknown/telegrambottoken.json\n"),
              std::string::npos);
}

TEST(HttpTemplatesTest, EmptyPrefixWritesGroupRelativePath) {
    auto record = make_record("Miro", "m", "g");
    const catalog::EndpointTemplate* endpoint = catalog::Catalog::builtin().find("Miro");
    ASSERT_NE(endpoint, nullptr);

    std::string block = render_http_request(record, "g_miro", *endpoint, "");

    EXPECT_NE(block.find(">> g/miro.json\n"), std::string::npos);
}

TEST(HttpTemplatesTest, AllBlocksInOrderWithoutSecrets) {
    std::vector<report::SecretRecord> known = {
        make_record("OpenAI", "sk-first", "a"),
        make_record("Miro", "miro-second", "b"),
    };
    std::vector<std::string> variables = {"a_openai", "b_miro"};

    std::string text = render_http_templates(known, variables, catalog::Catalog::builtin());

    auto first = text.find("### OpenAI (a)");
    auto second = text.find("### Miro (b)");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_TRUE(verify_redacted(text, known).empty());
}

TEST(HttpTemplatesTest, NoKnownRecordsYieldsEmptyText) {
    EXPECT_EQ(render_http_templates({}, {}, catalog::Catalog::builtin()), "");
}

TEST(HttpTemplatesTest, VerifyRedactedReportsLeakedValuesOnce) {
    std::vector<report::SecretRecord> records = {
        make_record("OpenAI", "sk-leak", "a"),
        make_record("Miro", "not-present", "a"),
        make_record("OpenAI", "sk-leak", "b"),
    };

    auto leaked = verify_redacted("Authorization: Bearer sk-leak\n", records);

    ASSERT_EQ(leaked.size(), 1u);
    EXPECT_EQ(leaked[0], "sk-leak");
}

// ==============================================================================
// Хранилище учётных данных
// ==============================================================================

TEST(CredentialStoreTest, RendersSchemaAndEnvironment) {
    std::vector<report::SecretRecord> known = {make_record("OpenAI", "sk-abc123", "abc")};
    std::vector<std::string> variables = {"abc_openai"};

    std::string json = render_credential_store(known, variables);

    EXPECT_EQ(json,
              "{\n"
              "  \"$schema\": \"https://raw.githubusercontent.com/mistweaverco/kulala.nvim/"
              "main/schemas/http-client.env.schema.json\",\n"
              "  \"dev\": {\n"
              "    \"abc_openai\": \"sk-abc123\"\n"
              "  }\n"
              "}\n");
}

TEST(CredentialStoreTest, EmptyKnownYieldsEmptySection) {
    std::string json = render_credential_store({}, {}, "staging", "https://schema");

    EXPECT_EQ(json,
              "{\n"
              "  \"$schema\": \"https://schema\",\n"
              "  \"staging\": {}\n"
              "}\n");
}

TEST(CredentialStoreTest, DuplicateNameKeepsLastValueInFirstPosition) {
    std::vector<report::SecretRecord> known = {
        make_record("OpenAI", "sk-1", "g"),
        make_record("Miro", "m-1", "g"),
        make_record("OpenAI", "sk-2", "g"),
    };
    std::vector<std::string> variables = {"g_openai", "g_miro", "g_openai"};

    std::string json = render_credential_store(known, variables);

    EXPECT_EQ(json.find("sk-1"), std::string::npos);
    auto openai = json.find("\"g_openai\": \"sk-2\"");
    auto miro = json.find("\"g_miro\": \"m-1\"");
    ASSERT_NE(openai, std::string::npos);
    ASSERT_NE(miro, std::string::npos);
    EXPECT_LT(openai, miro);
}

TEST(CredentialStoreTest, EscapesSpecialCharacters) {
    std::vector<report::SecretRecord> known = {make_record("OpenAI", "a\"b\\c", "g")};
    std::vector<std::string> variables = {"g_openai"};

    std::string json = render_credential_store(known, variables);

    EXPECT_NE(json.find(R"("g_openai": "a\"b\\c")"), std::string::npos);
}

// ==============================================================================
// Отчёт о нераспознанных секретах
// ==============================================================================

TEST(UnknownReportTest, RendersAllFields) {
    auto record = make_record("FooBarService", "xyz", "unknown");
    record.file_path = "/tmp/a.txt";
    record.line_number = "7";
    record.set_extra("Account", "octocat");
    record.verified = false;

    std::string text = render_unknown_report({record});

    EXPECT_EQ(text,
              "Unknown Secret Type: FooBarService\n"
              "Extension: unknown\n"
              "Raw Value: xyz\n"
              "File: /tmp/a.txt\n"
              "Line: 7\n"
              "Account: octocat\n"
              "Verified: No\n"
              "\n");
}

TEST(UnknownReportTest, OmitsMissingLineAndMarksVerified) {
    auto record = make_record("", "raw", "g");
    record.verified = true;

    std::string text = render_unknown_report({record});

    EXPECT_EQ(text.find("Line:"), std::string::npos);
    EXPECT_NE(text.find("Unknown Secret Type: \n"), std::string::npos);
    EXPECT_NE(text.find("Verified: Yes\n\n"), std::string::npos);
}

TEST(UnknownReportTest, EmptyInputYieldsEmptyText) {
    EXPECT_EQ(render_unknown_report({}), "");
}

// ==============================================================================
// Файловая система
// ==============================================================================

class ArtifactFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* test_info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name = std::string("scanconv_artifact_") + test_info->name() + "_" +
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

    static std::string read_file(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    }

    std::size_t entry_count() const {
        std::size_t count = 0;
        for (auto it = fs::directory_iterator(temp_dir_); it != fs::directory_iterator(); ++it) {
            ++count;
        }
        return count;
    }

    fs::path temp_dir_;
};

TEST_F(ArtifactFileTest, CreatesOneDirectoryPerGroup) {
    std::vector<report::SecretRecord> known = {
        make_record("OpenAI", "1", "a"),
        make_record("Miro", "2", "a"),
        make_record("OpenAI", "3", "b"),
    };
    fs::path root = temp_dir_ / "responses";

    auto result = ensure_response_directories(known, root);

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(result.groups, 2u);
    EXPECT_EQ(result.created, 2u);
    EXPECT_TRUE(fs::is_directory(root / "a"));
    EXPECT_TRUE(fs::is_directory(root / "b"));
}

TEST_F(ArtifactFileTest, ExistingDirectoriesAreLeftUntouched) {
    fs::path root = temp_dir_ / "responses";
    fs::create_directories(root / "a");
    {
        std::ofstream marker(root / "a" / "previous.json");
        marker << "{}";
    }

    auto result = ensure_response_directories({make_record("OpenAI", "1", "a")}, root);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.created, 0u);
    EXPECT_TRUE(fs::exists(root / "a" / "previous.json"));
}

TEST_F(ArtifactFileTest, NoKnownRecordsCreatesOnlyRoot) {
    fs::path root = temp_dir_ / "responses";

    auto result = ensure_response_directories({}, root);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.created, 0u);
    EXPECT_TRUE(fs::is_directory(root));
}

TEST_F(ArtifactFileTest, RootBlockedByFileIsAnError) {
    fs::path root = temp_dir_ / "responses";
    {
        std::ofstream blocker(root);
        blocker << "x";
    }

    auto result = ensure_response_directories({make_record("OpenAI", "1", "a")}, root);

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ArtifactKind::ResponseDirectories);
    EXPECT_NE(result.error.format().find("failed to write response directories"),
              std::string::npos);
}

TEST_F(ArtifactFileTest, WriteArtifactReplacesContent) {
    fs::path path = temp_dir_ / "converted.http";
    {
        std::ofstream old(path);
        old << "old content that is longer than the new one";
    }

    auto result = write_artifact(ArtifactKind::HttpTemplates, path, "new\n");

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_EQ(read_file(path), "new\n");
    // Временный файл не остаётся
    EXPECT_EQ(entry_count(), 1u);
}

TEST_F(ArtifactFileTest, WriteArtifactCreatesParentDirectory) {
    fs::path path = temp_dir_ / "nested" / "dir" / "unknown.txt";

    auto result = write_artifact(ArtifactKind::UnknownSecrets, path, "");

    ASSERT_TRUE(result.ok) << result.error.format();
    EXPECT_TRUE(fs::exists(path));
    EXPECT_EQ(read_file(path), "");
}

TEST_F(ArtifactFileTest, WriteArtifactToDirectoryFailsWithoutTempLeftovers) {
    fs::path path = temp_dir_ / "target";
    fs::create_directories(path);

    auto result = write_artifact(ArtifactKind::CredentialStore, path, "{}");

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ArtifactKind::CredentialStore);
    EXPECT_NE(result.error.format().find("credential store"), std::string::npos);
    EXPECT_EQ(entry_count(), 1u);
}

TEST(ArtifactKindTest, Names) {
    EXPECT_STREQ(to_string(ArtifactKind::Report), "report");
    EXPECT_STREQ(to_string(ArtifactKind::HttpTemplates), "http templates");
    EXPECT_STREQ(to_string(ArtifactKind::UnknownSecrets), "unknown secrets report");

    ArtifactError error;
    error.kind = ArtifactKind::Report;
    error.path = "r.txt";
    error.message = "file does not exist";
    EXPECT_EQ(error.format(), "failed to read report 'r.txt' - file does not exist");
}

}  // namespace scanconv::artifact::test
