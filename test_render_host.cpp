// RenderHostLauncher: browser command line and both readiness probes

#include <catch2/catch.hpp>

#include <algorithm>

#include "errors.hpp"
#include "render_host.hpp"
#include "test_fakes.hpp"

using namespace page_recorder;
using namespace page_recorder::testing;

namespace {

bool hasArg(const SpawnSpec& sp, const std::string& arg) {
    return std::find(sp.argv.begin(), sp.argv.end(), arg) != sp.argv.end();
}

struct Rig {
    FakeSpawner spawner;
    FakeInspector inspector;
    ManualTimeSource clock;
    ProcessSupervisor supervisor{ProcessSupervisor::Config{}, clock};
};

} // namespace

TEST_CASE("readiness strategy names", "[render_host]") {
    CHECK(parseReadinessStrategy("strong") == ReadinessStrategy::Strong);
    CHECK(parseReadinessStrategy("weak") == ReadinessStrategy::Weak);
    CHECK_THROWS_AS(parseReadinessStrategy("medium"), std::invalid_argument);
    CHECK(std::string(readinessStrategyName(ReadinessStrategy::Weak)) == "weak");
}

TEST_CASE("browser command line", "[render_host]") {
    Rig rig;
    RenderHostLauncher launcher(RenderHostConfig{}, DisplayConfig{}, rig.spawner, rig.inspector, rig.clock);
    auto sp = launcher.buildSpec("https://example.test/preview/v1");

    REQUIRE_FALSE(sp.argv.empty());
    CHECK(sp.argv.front() == "/usr/bin/google-chrome");
    CHECK(sp.argv.back() == "https://example.test/preview/v1");
    CHECK(hasArg(sp, "--no-sandbox"));
    CHECK(hasArg(sp, "--kiosk"));
    CHECK(hasArg(sp, "--autoplay-policy=no-user-gesture-required"));
    CHECK(hasArg(sp, "--window-size=1920,1080"));
    CHECK(hasArg(sp, "--user-data-dir=/usr/src/app/chrome-data"));
    CHECK(hasArg(sp, "--remote-debugging-address=127.0.0.1"));
    CHECK(hasArg(sp, "--remote-debugging-port=9222"));
    CHECK(hasArg(sp, "--mute-audio"));
    CHECK(hasArg(sp, "--disable-extensions"));
    CHECK(sp.env.at("DISPLAY") == ":99");
}

TEST_CASE("strong probe waits for playback past two seconds", "[render_host]") {
    Rig rig;
    RenderHostLauncher launcher(RenderHostConfig{}, DisplayConfig{}, rig.spawner, rig.inspector, rig.clock);

    rig.inspector.push(std::nullopt);            // page not reachable yet
    auto loading = renderingStatus(0.0);
    loading.page_loaded = false;
    rig.inspector.push(loading);
    rig.inspector.push(renderingStatus(1.5));    // playing, but not long enough
    rig.inspector.push(renderingStatus(2.4));

    auto host = launcher.launchAndWaitReady("https://example.test/v1", rig.supervisor);

    REQUIRE(host);
    CHECK(rig.inspector.inspections() == 4);
    CHECK(rig.supervisor.trackedNames() == std::vector<std::string>{"Chrome"});
    // 4 probe intervals plus the stabilization delay
    CHECK(rig.clock.elapsed() == Millis(4 * 1000 + 3000));
}

TEST_CASE("strong probe times out and stops the browser", "[render_host]") {
    Rig rig;
    RenderHostLauncher launcher(RenderHostConfig{}, DisplayConfig{}, rig.spawner, rig.inspector, rig.clock);
    auto stalled = renderingStatus(0.0);
    stalled.media_playing = false;
    rig.inspector.setFallback(stalled);

    try {
        launcher.launchAndWaitReady("https://example.test/v1", rig.supervisor);
        FAIL("expected RenderReadinessTimeout");
    } catch (const RecorderError& e) {
        CHECK(e.kind() == ErrorKind::RenderReadinessTimeout);
        CHECK(std::string(e.what()).find("60 seconds") != std::string::npos);
    }

    CHECK(rig.inspector.inspections() == 60);
    CHECK(rig.supervisor.activeCount() == 0);
    auto chrome = rig.spawner.byBinary("/usr/bin/google-chrome");
    REQUIRE(chrome);
    CHECK(chrome->exited());
    CHECK(chrome->signals().front() == SIGTERM);
}

TEST_CASE("browser exiting during the probe fails immediately", "[render_host]") {
    Rig rig;
    rig.spawner.on_spawn = [](const SpawnSpec&, FakeProcess& p) { p.exitAfterPolls(3, 1); };
    RenderHostLauncher launcher(RenderHostConfig{}, DisplayConfig{}, rig.spawner, rig.inspector, rig.clock);

    try {
        launcher.launchAndWaitReady("https://example.test/v1", rig.supervisor);
        FAIL("expected RenderHostStart");
    } catch (const RecorderError& e) {
        CHECK(e.kind() == ErrorKind::RenderHostStart);
    }
    CHECK(rig.inspector.inspections() == 2);
}

TEST_CASE("missing browser binary", "[render_host]") {
    Rig rig;
    rig.spawner.failOn("/usr/bin/google-chrome");
    RenderHostLauncher launcher(RenderHostConfig{}, DisplayConfig{}, rig.spawner, rig.inspector, rig.clock);

    try {
        launcher.launch("https://example.test/v1", rig.supervisor);
        FAIL("expected RenderHostStart");
    } catch (const RecorderError& e) {
        CHECK(e.kind() == ErrorKind::RenderHostStart);
    }
    CHECK(rig.supervisor.activeCount() == 0);
}

TEST_CASE("weak probe only checks that the browser survives", "[render_host]") {
    Rig rig;
    RenderHostConfig cfg;
    cfg.strategy = ReadinessStrategy::Weak;
    RenderHostLauncher launcher(cfg, DisplayConfig{}, rig.spawner, rig.inspector, rig.clock);

    launcher.launchAndWaitReady("https://example.test/v1", rig.supervisor);

    CHECK(rig.inspector.inspections() == 0);
    CHECK(rig.clock.elapsed() == Millis(10000));
    CHECK(rig.supervisor.activeCount() == 1);
}

TEST_CASE("weak probe notices a crash", "[render_host]") {
    Rig rig;
    rig.spawner.on_spawn = [](const SpawnSpec&, FakeProcess& p) { p.exitAfterPolls(5, 139); };
    RenderHostConfig cfg;
    cfg.strategy = ReadinessStrategy::Weak;
    RenderHostLauncher launcher(cfg, DisplayConfig{}, rig.spawner, rig.inspector, rig.clock);

    CHECK_THROWS_AS(launcher.launchAndWaitReady("https://example.test/v1", rig.supervisor), RecorderError);
}
