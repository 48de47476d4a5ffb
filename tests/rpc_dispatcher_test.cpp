#include <gtest/gtest.h>

#include "api/rpc_dispatcher.hpp"
#include "content/content_codec.hpp"
#include "test_support.hpp"

namespace codebox::api {
namespace {

using nlohmann::json;

class RpcDispatcherTest : public ::testing::Test {
protected:
    json Call(const json& request) {
        return dispatcher_.Dispatch(request);
    }

    codebox::testing::TempDir scratch_;
    ExecService service_{codebox::testing::ShellProfile(), codebox::testing::FastOptions(scratch_)};
    RpcDispatcher dispatcher_{service_};
};

TEST_F(RpcDispatcherTest, ExecutorRun) {
    const auto reply = Call({
        {"op", "executor.run"},
        {"language", "javascript"},
        {"files", json::array({json{{"name", "main.js"}, {"content", "echo \"$1:$MODE\"; cat"}}})},
        {"args", json::array({"x"})},
        {"env", {{"MODE", "rpc"}}},
        {"stdin", "piped"}
    });
    ASSERT_TRUE(reply["ok"].get<bool>()) << reply.dump();
    EXPECT_EQ(reply["value"]["run"]["stdout"], "x:rpc\npiped");
    EXPECT_EQ(reply["value"]["run"]["exit_code"], 0);
}

TEST_F(RpcDispatcherTest, EnvAsPairs) {
    const auto reply = Call({
        {"op", "executor.run"},
        {"language", "javascript"},
        {"files", json::array({json{{"name", "main.js"}, {"content", "echo $A$B"}}})},
        {"env", json::array({json::array({"A", "1"}), json::array({"B", "2"})})}
    });
    ASSERT_TRUE(reply["ok"].get<bool>()) << reply.dump();
    EXPECT_EQ(reply["value"]["run"]["stdout"], "12\n");
}

TEST_F(RpcDispatcherTest, SessionLifecycle) {
    const auto created = Call({{"op", "session.create"}, {"language", "javascript"}});
    ASSERT_TRUE(created["ok"].get<bool>());
    const auto handle = created["value"].get<std::uint64_t>();
    EXPECT_EQ(handle, 1u);

    const auto uploaded = Call({
        {"op", "session.upload"},
        {"session", handle},
        {"file", {{"name", "main.js"}, {"content", content::EncodeBase64("echo up")}, {"encoding", "base64"}}}
    });
    EXPECT_TRUE(uploaded["ok"].get<bool>()) << uploaded.dump();

    const auto listed = Call({{"op", "session.list_files"}, {"session", handle}, {"dir", "/"}});
    EXPECT_EQ(listed["value"], json::array({"main.js"}));

    const auto ran = Call({{"op", "session.run"}, {"session", handle}, {"entrypoint", "main.js"}});
    EXPECT_EQ(ran["value"]["run"]["stdout"], "up\n");

    const auto downloaded = Call({{"op", "session.download"}, {"session", handle}, {"path", "main.js"}});
    EXPECT_EQ(downloaded["value"]["encoding"], "base64");
    EXPECT_EQ(content::Decode(downloaded["value"]["content"].get<std::string>(), exec::Encoding::kBase64),
              "echo up");

    EXPECT_TRUE(Call({{"op", "session.set_working_dir"}, {"session", handle}, {"path", "/w"}})["ok"].get<bool>());
    EXPECT_TRUE(Call({{"op", "session.close"}, {"session", handle}})["ok"].get<bool>());
    EXPECT_TRUE(Call({{"op", "session.close"}, {"session", handle}})["ok"].get<bool>());

    const auto gone = Call({{"op", "session.list_files"}, {"session", handle}});
    EXPECT_FALSE(gone["ok"].get<bool>());
    EXPECT_EQ(gone["error"]["kind"], "internal");
    EXPECT_EQ(gone["error"]["message"], "Session not found");
}

TEST_F(RpcDispatcherTest, OutOfRangeHandlesNeverAliasLiveSessions) {
    const auto handle = Call({{"op", "session.create"}, {"language", "javascript"}})["value"].get<std::uint64_t>();
    ASSERT_EQ(handle, 1u);
    ASSERT_TRUE(Call({
        {"op", "session.upload"},
        {"session", handle},
        {"file", {{"name", "a.js"}, {"content", "secret"}}}
    })["ok"].get<bool>());

    for (const auto* line : {
             R"({"op":"session.download","session":4294967297,"path":"a.js"})",
             R"({"op":"session.download","session":-1,"path":"a.js"})",
             R"({"op":"session.download","session":1.5,"path":"a.js"})",
             R"({"op":"session.list_files","session":18446744073709551617})"}) {
        const auto reply = json::parse(dispatcher_.DispatchLine(line));
        EXPECT_FALSE(reply["ok"].get<bool>()) << line;
        EXPECT_EQ(reply["error"]["message"], "Session not found") << line;
    }

    for (const auto* line : {
             R"({"op":"session.close","session":4294967297})",
             R"({"op":"session.close","session":-1})"}) {
        EXPECT_TRUE(json::parse(dispatcher_.DispatchLine(line))["ok"].get<bool>()) << line;
    }
    const auto listed = Call({{"op", "session.list_files"}, {"session", handle}});
    EXPECT_EQ(listed["value"], json::array({"a.js"}));
}

TEST_F(RpcDispatcherTest, TimeoutReply) {
    const auto reply = Call({
        {"op", "executor.run"},
        {"language", "javascript"},
        {"files", json::array({json{{"name", "main.js"}, {"content", "sleep 30"}}})},
        {"limits", {{"time_ms", 100}}}
    });
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["error"], (json{{"kind", "timeout"}}));
}

TEST_F(RpcDispatcherTest, UnsupportedLanguageReply) {
    const auto reply = Call({{"op", "session.create"}, {"language", "python"}});
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["error"]["kind"], "unsupported-language");
}

TEST_F(RpcDispatcherTest, MalformedRequests) {
    const auto unknown = Call({{"op", "session.explode"}, {"session", 1}});
    EXPECT_FALSE(unknown["ok"].get<bool>());
    EXPECT_EQ(unknown["error"]["kind"], "internal");

    const auto no_handle = Call({{"op", "session.run"}, {"entrypoint", "main.js"}});
    EXPECT_EQ(no_handle["error"]["message"], "missing session handle");

    const auto line = json::parse(dispatcher_.DispatchLine("{not json"));
    EXPECT_FALSE(line["ok"].get<bool>());
    EXPECT_EQ(line["error"]["kind"], "internal");
}

}  // namespace
}  // namespace codebox::api
