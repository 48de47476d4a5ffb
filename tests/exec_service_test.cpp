#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "api/exec_service.hpp"
#include "content/content_codec.hpp"
#include "test_support.hpp"

namespace codebox::api {
namespace {

using exec::ErrorKind;

exec::Language Javascript() {
    return exec::Language{exec::LanguageKind::kJavascript, std::nullopt};
}

exec::File Script(const std::string& name, const std::string& body) {
    return exec::File{name, body, std::nullopt};
}

class ExecServiceTest : public ::testing::Test {
protected:
    exec::Result<exec::ExecResult> RunFiles(const std::vector<exec::File>& files,
                                            const std::optional<exec::Limits>& limits = std::nullopt) {
        return service_.Run(Javascript(), files, std::nullopt, {}, {}, limits);
    }

    codebox::testing::TempDir scratch_;
    ExecService service_{codebox::testing::ShellProfile(), codebox::testing::FastOptions(scratch_)};
};

TEST_F(ExecServiceTest, OneShotPrefersMainOverFirstFile) {
    const auto result = RunFiles({Script("helper.js", "echo helper"), Script("main.js", "echo main")});
    ASSERT_TRUE(result.Ok()) << exec::Describe(result.GetError());
    EXPECT_EQ(result.Value().run.stdout_text, "main\n");
}

TEST_F(ExecServiceTest, OneShotAcceptsIndexConvention) {
    const auto result = RunFiles({Script("a.js", "echo a"), Script("index.js", "echo index")});
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.Value().run.stdout_text, "index\n");
}

TEST_F(ExecServiceTest, OneShotFallsBackToFirstFile) {
    const auto result = RunFiles({Script("first.js", "echo first"), Script("second.js", "echo second")});
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.Value().run.stdout_text, "first\n");
}

TEST_F(ExecServiceTest, OneShotDecodesEntrypoint) {
    const auto result = RunFiles({exec::File{"main.js", content::EncodeHex("echo decoded"), exec::Encoding::kHex}});
    ASSERT_TRUE(result.Ok());
    EXPECT_EQ(result.Value().run.stdout_text, "decoded\n");
}

TEST_F(ExecServiceTest, OneShotWithoutFilesIsInternal) {
    const auto result = RunFiles({});
    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(result.GetError().kind, ErrorKind::kInternal);
    EXPECT_EQ(result.GetError().message, "No javascript files provided");
}

TEST_F(ExecServiceTest, OneShotRejectsOtherLanguage) {
    const auto result = service_.Run(exec::Language{exec::LanguageKind::kPython, std::nullopt},
                                     {Script("main.py", "print(1)")}, std::nullopt, {}, {}, std::nullopt);
    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(result.GetError().kind, ErrorKind::kUnsupportedLanguage);
}

TEST_F(ExecServiceTest, TimeoutCarriesNoPayload) {
    exec::Limits limits{};
    limits.time_ms = 100;
    const auto result = RunFiles({Script("main.js", "echo partial; sleep 30")}, limits);
    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(result.GetError().kind, ErrorKind::kTimeout);
    EXPECT_FALSE(result.GetError().stage.has_value());
    EXPECT_TRUE(result.GetError().message.empty());
}

TEST_F(ExecServiceTest, SessionWorkflow) {
    const auto created = service_.CreateSession(Javascript());
    ASSERT_TRUE(created.Ok());
    const auto handle = created.Value();

    ASSERT_TRUE(service_.Upload(handle, Script("main.js", "echo \"$GREETING\"")).Ok());
    ASSERT_TRUE(service_.SetWorkingDir(handle, "/work").Ok());

    const auto listed = service_.ListFiles(handle, "/");
    ASSERT_TRUE(listed.Ok());
    EXPECT_EQ(listed.Value(), std::vector<std::string>{"main.js"});

    const auto ran = service_.RunSession(handle, "main.js", {}, std::nullopt, {{"GREETING", "hi"}}, std::nullopt);
    ASSERT_TRUE(ran.Ok());
    EXPECT_EQ(ran.Value().run.stdout_text, "hi\n");

    const auto downloaded = service_.Download(handle, "main.js");
    ASSERT_TRUE(downloaded.Ok());
    EXPECT_EQ(downloaded.Value(), "echo \"$GREETING\"");

    service_.CloseSession(handle);
    service_.CloseSession(handle);
    const auto after = service_.Download(handle, "main.js");
    ASSERT_FALSE(after.Ok());
    EXPECT_EQ(after.GetError().kind, ErrorKind::kInternal);
    EXPECT_EQ(after.GetError().message, "Session not found");
}

TEST_F(ExecServiceTest, SessionRunOfMissingEntrypointProducesNoResult) {
    const auto handle = service_.CreateSession(Javascript()).Value();
    const auto ran = service_.RunSession(handle, "nope.js", {}, std::nullopt, {}, std::nullopt);
    ASSERT_FALSE(ran.Ok());
    EXPECT_EQ(ran.GetError().kind, ErrorKind::kInternal);
    EXPECT_EQ(ran.GetError().message, "Entrypoint file 'nope.js' not found");
}

TEST_F(ExecServiceTest, UploadDecodeFailureIsReported) {
    const auto handle = service_.CreateSession(Javascript()).Value();
    const auto uploaded = service_.Upload(handle, exec::File{"main.js", "xyz", exec::Encoding::kHex});
    ASSERT_FALSE(uploaded.Ok());
    EXPECT_EQ(uploaded.GetError().kind, ErrorKind::kInternal);
    EXPECT_NE(uploaded.GetError().message.find("Hex decode error"), std::string::npos);
}

TEST_F(ExecServiceTest, CreateRejectsOtherLanguage) {
    const auto created = service_.CreateSession(exec::Language{exec::LanguageKind::kUnknown, std::nullopt});
    ASSERT_FALSE(created.Ok());
    EXPECT_EQ(created.GetError().kind, ErrorKind::kUnsupportedLanguage);
}

TEST(ExecServiceConfigTest, FromConfigResolvesProfile) {
    config::EngineConfig config{};
    config.language = "python";
    const auto service = ExecService::FromConfig(config);
    EXPECT_EQ(service->Profile().kind, exec::LanguageKind::kPython);
    EXPECT_EQ(service->Profile().extension, "py");
    EXPECT_EQ(service->Profile().interpreters, (std::vector<std::string>{"python3", "python"}));
}

TEST(ExecServiceConfigTest, FromConfigHonoursInterpreterOverride) {
    config::EngineConfig config{};
    config.language = "js";
    config.interpreters = {"sh"};
    const auto service = ExecService::FromConfig(config);
    EXPECT_EQ(service->Profile().kind, exec::LanguageKind::kJavascript);
    EXPECT_EQ(service->Profile().interpreters, std::vector<std::string>{"sh"});
}

TEST(ExecServiceConfigTest, FromConfigRejectsUnknownLanguage) {
    config::EngineConfig config{};
    config.language = "cobol";
    try {
        ExecService::FromConfig(config);
        FAIL() << "expected failure";
    } catch (const exec::ExecError& ex) {
        EXPECT_EQ(ex.Kind(), ErrorKind::kUnsupportedLanguage);
    }
}

}  // namespace
}  // namespace codebox::api
