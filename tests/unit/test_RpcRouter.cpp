#include "SandboxFixture.hpp"
#include "engine/Engine.hpp"
#include "protocols/rpc/Router.hpp"
#include "protocols/rpc/handler/Folders.hpp"

using namespace fw::protocols::rpc;
using json = nlohmann::json;

class RpcRouterTest : public SandboxFixture {
protected:
    std::unique_ptr<fw::engine::Engine> engine;
    std::unique_ptr<handler::Folders> folders;
    Router router;

    void SetUp() override {
        SandboxFixture::SetUp();
        fw::engine::EngineConfig cfg;
        cfg.roots = {root};
        engine = std::make_unique<fw::engine::Engine>(std::move(cfg));
        folders = std::make_unique<handler::Folders>(*engine);
        folders->registerAll(router);
    }

    json call(const std::string& command, json payload = json::object()) const {
        return router.routeMessage({{"command", command}, {"payload", std::move(payload)}});
    }
};

TEST_F(RpcRouterTest, RegistersEveryFolderCommand) {
    EXPECT_EQ(router.commands(), (std::vector<std::string>{
        "apply_plan", "check", "find_duplicates", "list", "organize_by_category", "organize_by_type", "plan_alpha"
    }));
}

TEST_F(RpcRouterTest, ListReturnsTaggedResponse) {
    writeFile(root / "a.txt", "a");

    const auto res = router.routeMessage({{"command", "list"}, {"request_id", 7}});

    EXPECT_EQ(res["command"], "list");
    EXPECT_EQ(res["status"], "ok");
    EXPECT_EQ(res["request_id"], 7);
    EXPECT_EQ(res["data"]["total_count"], 1);
    EXPECT_EQ(res["data"]["folder_path"], root.string());
}

TEST_F(RpcRouterTest, RequestIdIsOmittedWhenAbsent) {
    const auto res = call("list");
    EXPECT_FALSE(res.contains("request_id"));
}

TEST_F(RpcRouterTest, SandboxViolationCarriesErrorType) {
    const auto res = call("list", {{"folder_path", outside.string()}});

    EXPECT_EQ(res["status"], "error");
    EXPECT_TRUE(res["error"].get<bool>());
    EXPECT_EQ(res["error_type"], "SecurityError");
    EXPECT_FALSE(res.contains("data"));
}

TEST_F(RpcRouterTest, UnknownCommandIsInvalidRequest) {
    const auto res = call("format_disk");
    EXPECT_EQ(res["command"], "format_disk");
    EXPECT_EQ(res["error_type"], "InvalidRequest");
}

TEST_F(RpcRouterTest, MalformedRequestsAreInvalidRequests) {
    const auto notJson = router.routeLine("{not json");
    EXPECT_EQ(notJson["command"], "unknown");
    EXPECT_EQ(notJson["error_type"], "InvalidRequest");

    EXPECT_EQ(router.routeLine("[1,2]")["error_type"], "InvalidRequest");
    EXPECT_EQ(router.routeLine(R"({"payload":{}})")["error_type"], "InvalidRequest");
    EXPECT_EQ(router.routeLine(R"({"command":"list","payload":[]})")["error_type"], "InvalidRequest");
    EXPECT_EQ(call("check")["error_type"], "InvalidRequest");
    EXPECT_EQ(call("list", {{"folder_path", 3}})["error_type"], "InvalidRequest");
}

TEST_F(RpcRouterTest, CheckReportsSafety) {
    const auto res = router.routeLine(R"({"command":"check","payload":{"path":"../x"},"request_id":"r1"})");
    EXPECT_EQ(res["status"], "ok");
    EXPECT_EQ(res["request_id"], "r1");
    EXPECT_FALSE(res["data"]["is_safe"].get<bool>());
}

TEST_F(RpcRouterTest, ApplyPlanDefaultsToDryRun) {
    writeFile(root / "A B.txt", "x");

    const auto planned = call("plan_alpha");
    ASSERT_EQ(planned["status"], "ok");

    const auto dry = call("apply_plan", {{"plan", planned["data"]["plan"]}});
    ASSERT_EQ(dry["status"], "ok");
    EXPECT_TRUE(dry["data"]["dry_run"].get<bool>());
    EXPECT_TRUE(fs::exists(root / "A B.txt"));

    const auto real = call("apply_plan", {{"plan", planned["data"]["plan"]}, {"dry_run", false}});
    ASSERT_EQ(real["status"], "ok");
    EXPECT_TRUE(fs::exists(root / "a_b.txt"));
}

TEST_F(RpcRouterTest, ApplyPlanRequiresAList) {
    EXPECT_EQ(call("apply_plan")["error_type"], "InvalidRequest");
    EXPECT_EQ(call("apply_plan", {{"plan", "A -> a"}})["error_type"], "InvalidRequest");
}

TEST_F(RpcRouterTest, ApplyPlanRejectsUnknownItemType) {
    const json plan = json::array({{{"current_name", "a"}, {"proposed_name", "b"}, {"type", "socket"}}});
    const auto res = call("apply_plan", {{"plan", plan}});
    EXPECT_EQ(res["error_type"], "InvalidRequest");
    EXPECT_NE(res["error_message"].get<std::string>().find("socket"), std::string::npos);
}

TEST_F(RpcRouterTest, OrganizeByCategoryValidatesPayload) {
    EXPECT_EQ(call("organize_by_category", {{"category", "x"}})["error_type"], "InvalidRequest");

    const auto res = call("organize_by_category", {{"category", "x"}, {"target_folder", outside.string()}});
    EXPECT_EQ(res["error_type"], "SecurityError");
}

TEST(RpcRouterStandalone, HandlerExceptionsBecomeInternalErrors) {
    Router router;
    router.registerPayload("boom", Router::RawPayloadHandler{[](const json&) -> json {
        throw std::runtime_error("kaboom");
    }});

    const auto res = router.routeMessage({{"command", "boom"}});
    EXPECT_EQ(res["error_type"], "InternalError");
    EXPECT_EQ(res["error_message"], "kaboom");
}
