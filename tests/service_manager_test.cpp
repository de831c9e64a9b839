#include "board.h"
#include "config_manager.h"
#include "errors.h"
#include "fake_process_runner.h"
#include "fake_transport.h"
#include "service_manager.h"
#include "session_manager.h"
#include "test_helpers.h"
#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <thread>

using namespace testing_support;

namespace {

class ServiceManagerTest : public ::testing::Test {
protected:
    ServiceManagerTest() : dir("lr-services")
    {
        writeJson(dir.path / "agent.json", agentConfig(dir));
        writeJson(dir.path / "home" / "settings.json", boardSettings("online", true, false));

        config = std::make_unique<ConfigManager>((dir.path / "agent.json").string());
        board = std::make_unique<Board>(*config);
        board->load();

        transport_state = std::make_shared<FakeTransport::State>();
        SessionOptions options;
        options.dispatch_workers = 1;
        session = std::make_unique<SessionManager>(*board, options, std::make_unique<FakeTransport>(transport_state));
        session->connect();

        registry_path = dir.path / "home" / "services.json";
    }

    ~ServiceManagerTest() override
    {
        manager.reset();
        session->stop();
    }

    ServiceManager& makeManager()
    {
        manager = std::make_unique<ServiceManager>(*config, *board, *session, runner);
        return *manager;
    }

    nlohmann::json persistedServices() { return readJson(registry_path)["services"]; }

    TempDir dir;
    std::unique_ptr<ConfigManager> config;
    std::unique_ptr<Board> board;
    std::shared_ptr<FakeTransport::State> transport_state;
    std::unique_ptr<SessionManager> session;
    FakeProcessRunner runner;
    std::unique_ptr<ServiceManager> manager;
    std::filesystem::path registry_path;
};

} // namespace

TEST_F(ServiceManagerTest, TunnelUrlUsesControlPlaneHost)
{
    ServiceManager& services = makeManager();
    EXPECT_EQ(services.tunnelUrl(), "wss://ctrl.example.org:8080");
}

TEST_F(ServiceManagerTest, PlainEndpointUsesWebSocketScheme)
{
    nlohmann::json settings = boardSettings("online", false, false);
    settings["iotronic"]["wamp"]["main-agent"] = {{"url", "mqtt://10.0.0.5:1883"}, {"realm", "s4t"}};
    board->replaceSettings(settings);

    ServiceManager& services = makeManager();
    EXPECT_EQ(services.tunnelUrl(), "ws://10.0.0.5:8080");
}

TEST_F(ServiceManagerTest, ExposeSpawnsTunnelAndPersists)
{
    ServiceManager& services = makeManager();
    services.start();

    ServiceInfo info = services.exposeService("web", 8080);

    EXPECT_EQ(info.name, "web");
    EXPECT_EQ(info.local_port, 8080);
    EXPECT_EQ(info.status, ServiceManager::kStatusRunning);
    EXPECT_EQ(info.public_url, "wss://ctrl.example.org:8080/web");
    EXPECT_GT(info.pid, 0);

    ASSERT_EQ(runner.spawned.size(), 1u);
    std::vector<std::string> expected = {
        "/usr/bin/wstun", "client", "-s", "wss://ctrl.example.org:8080", "-t", "127.0.0.1:8080"};
    EXPECT_EQ(runner.spawned[0], expected);

    nlohmann::json persisted = persistedServices();
    ASSERT_TRUE(persisted.contains("web"));
    EXPECT_EQ(persisted["web"]["local_port"], 8080);
    EXPECT_EQ(persisted["web"]["status"], "running");
}

TEST_F(ServiceManagerTest, ExposeTwiceIsAlreadyExposed)
{
    ServiceManager& services = makeManager();
    services.start();

    services.exposeService("web", 8080);
    EXPECT_THROW(services.exposeService("web", 9090), AlreadyExistsError);

    EXPECT_EQ(services.listServices().size(), 1u);
    EXPECT_EQ(services.listServices()[0].local_port, 8080);
    EXPECT_EQ(persistedServices().size(), 1u);
    EXPECT_EQ(runner.spawned.size(), 1u);
}

TEST_F(ServiceManagerTest, UnexposeAbsentNameIsNotFound)
{
    ServiceManager& services = makeManager();
    services.start();
    services.exposeService("ssh", 22);

    EXPECT_THROW(services.unexposeService("web"), NotFoundError);
    EXPECT_EQ(services.listServices().size(), 1u);
    EXPECT_EQ(persistedServices().size(), 1u);
}

TEST_F(ServiceManagerTest, ExposeUnexposeScenario)
{
    ServiceManager& services = makeManager();
    services.start();
    EXPECT_TRUE(services.listServices().empty());

    ServiceInfo info = services.exposeService("web", 8080);
    ASSERT_EQ(services.listServices().size(), 1u);
    EXPECT_EQ(services.listServices()[0].status, "running");
    EXPECT_FALSE(info.public_url.empty());

    services.unexposeService("web");
    EXPECT_TRUE(services.listServices().empty());
    EXPECT_TRUE(persistedServices().empty());
    ASSERT_EQ(runner.terminated.size(), 1u);
    EXPECT_EQ(runner.terminated[0], info.pid);

    EXPECT_THROW(services.unexposeService("web"), NotFoundError);
}

TEST_F(ServiceManagerTest, UnexposeToleratesAlreadyDeadProcess)
{
    ServiceManager& services = makeManager();
    services.start();
    ServiceInfo info = services.exposeService("web", 8080);

    runner.kill(info.pid);

    EXPECT_NO_THROW(services.unexposeService("web"));
    EXPECT_TRUE(services.listServices().empty());
}

TEST_F(ServiceManagerTest, SpawnFailureLeavesRegistryEmpty)
{
    ServiceManager& services = makeManager();
    services.start();
    runner.fail_spawn = true;

    EXPECT_THROW(services.exposeService("web", 8080), ProcessError);
    EXPECT_TRUE(services.listServices().empty());
    EXPECT_TRUE(persistedServices().empty());
}

TEST_F(ServiceManagerTest, InvalidNameIsRejected)
{
    ServiceManager& services = makeManager();
    services.start();

    EXPECT_THROW(services.exposeService("../web", 8080), InvalidArgumentError);
    EXPECT_TRUE(runner.spawned.empty());
}

TEST_F(ServiceManagerTest, ReconcileRespawnsDeadTunnel)
{
    ServiceManager& services = makeManager();
    services.start();
    ServiceInfo before = services.exposeService("web", 8080);

    runner.kill(before.pid);
    services.reconcile();

    ASSERT_EQ(services.listServices().size(), 1u);
    ServiceInfo after = services.listServices()[0];
    EXPECT_NE(after.pid, before.pid);
    EXPECT_EQ(after.status, "running");
    EXPECT_EQ(after.public_url, before.public_url);
    EXPECT_EQ(persistedServices()["web"]["pid"], after.pid);
}

TEST_F(ServiceManagerTest, ReconcileMarksStoppedWhenRespawnFails)
{
    ServiceManager& services = makeManager();
    services.start();
    ServiceInfo before = services.exposeService("web", 8080);

    runner.kill(before.pid);
    runner.fail_spawn = true;
    services.reconcile();

    ASSERT_EQ(services.listServices().size(), 1u);
    EXPECT_EQ(services.listServices()[0].status, "stopped");
    EXPECT_EQ(persistedServices()["web"]["status"], "stopped");

    runner.fail_spawn = false;
    services.reconcile();
    EXPECT_EQ(services.listServices()[0].status, "running");
}

TEST_F(ServiceManagerTest, StartRestoresRegistryFromDisk)
{
    writeJson(registry_path, {
        {"services", {
            {"web", {{"name", "web"}, {"local_port", 8080}, {"public_url", "wss://old/web"},
                     {"pid", 999999}, {"status", "running"}}}
        }}
    });

    ServiceManager& services = makeManager();
    services.start();

    // pid 999999 is unknown to the runner, so it was respawned
    ASSERT_EQ(services.listServices().size(), 1u);
    EXPECT_NE(services.listServices()[0].pid, 999999);
    EXPECT_EQ(runner.spawned.size(), 1u);
}

TEST_F(ServiceManagerTest, StartRegistersCapabilitiesUnderSession)
{
    ServiceManager& services = makeManager();
    services.start();

    std::vector<std::string> names = session->registeredProcedures();
    for (const std::string verb : {"ExposeService", "UnexposeService", "ServicesList"}) {
        std::string name = "iotronic.1001.9f0c1d7e-board." + verb;
        EXPECT_NE(std::find(names.begin(), names.end(), name), names.end()) << name;
    }
}

TEST_F(ServiceManagerTest, StopTerminatesEveryTunnel)
{
    ServiceManager& services = makeManager();
    services.start();
    services.exposeService("web", 8080);
    services.exposeService("ssh", 22);

    services.stop();

    EXPECT_EQ(runner.aliveCount(), 0u);
    EXPECT_TRUE(services.listServices().empty());
    EXPECT_TRUE(persistedServices().empty());
}

TEST_F(ServiceManagerTest, RpcHandlersReturnStructuredResults)
{
    ServiceManager& services = makeManager();
    services.start();

    auto capabilities = services.capabilities();
    auto find = [&](const std::string& verb) {
        for (const auto& capability : capabilities) {
            if (capability.verb == verb) {
                return capability.handler;
            }
        }
        return rpc::Handler();
    };

    nlohmann::json exposed = find("ExposeService")(nlohmann::json::array({"web", 8080.0}));
    EXPECT_EQ(exposed["result"], "SUCCESS");
    EXPECT_EQ(exposed["data"]["public_url"], "wss://ctrl.example.org:8080/web");

    nlohmann::json again = find("ExposeService")(nlohmann::json::array({"web", 8080}));
    EXPECT_EQ(again["result"], "ERROR");

    nlohmann::json missing_args = find("ExposeService")(nlohmann::json::array({"web"}));
    EXPECT_EQ(missing_args["result"], "ERROR");

    nlohmann::json listed = find("ServicesList")(nlohmann::json::array());
    EXPECT_EQ(listed["result"], "SUCCESS");
    EXPECT_EQ(listed["data"]["services"].size(), 1u);

    nlohmann::json removed = find("UnexposeService")(nlohmann::json::array({"web"}));
    EXPECT_EQ(removed["result"], "SUCCESS");

    nlohmann::json not_found = find("UnexposeService")(nlohmann::json::array({"web"}));
    EXPECT_EQ(not_found["result"], "ERROR");
}

TEST_F(ServiceManagerTest, ConcurrentExposeOfSameNameSucceedsOnce)
{
    ServiceManager& services = makeManager();
    services.start();

    std::atomic<int> succeeded(0);
    std::atomic<int> rejected(0);
    std::vector<std::thread> callers;
    for (int i = 0; i < 16; ++i) {
        callers.emplace_back([&]() {
            try {
                services.exposeService("web", 8080);
                ++succeeded;
            } catch (const AlreadyExistsError&) {
                ++rejected;
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(rejected.load(), 15);
    EXPECT_EQ(services.listServices().size(), 1u);
    EXPECT_EQ(runner.aliveCount(), 1u);
    EXPECT_EQ(persistedServices().size(), 1u);
}

TEST_F(ServiceManagerTest, UnwritableRegistryKeepsExposedServiceInMemory)
{
    ServiceManager& services = makeManager();
    services.start();

    // A directory squatting on the temp file name makes the registry write fail
    std::filesystem::create_directories(registry_path.string() + ".tmp");

    nlohmann::json result;
    for (const auto& capability : services.capabilities()) {
        if (capability.verb == "ExposeService") {
            result = capability.handler(nlohmann::json::array({"web", 8080}));
        }
    }

    EXPECT_EQ(result["result"], "ERROR");
    ASSERT_EQ(services.listServices().size(), 1u);
    EXPECT_EQ(services.listServices()[0].name, "web");
    EXPECT_EQ(services.listServices()[0].status, "running");
    EXPECT_EQ(runner.aliveCount(), 1u);
    EXPECT_TRUE(persistedServices().empty());
}
