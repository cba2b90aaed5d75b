// PosixProcess against real /bin/sh children

#include <catch2/catch.hpp>

#include <csignal>
#include <mutex>
#include <string>
#include <vector>

#include "errors.hpp"
#include "process.hpp"

using namespace page_recorder;

namespace {

SpawnSpec shell(const std::string& script) {
    SpawnSpec sp;
    sp.argv = {"/bin/sh", "-c", script};
    return sp;
}

} // namespace

TEST_CASE("exit code of a finished child is reported", "[process]") {
    SteadyTimeSource clock;
    auto p = PosixProcess::spawn(shell("exit 3"));
    auto st = waitForExit(*p, clock, std::chrono::seconds(5), Millis(10));
    REQUIRE(st);
    CHECK(st->exit_code == 3);
    CHECK(st->term_signal == 0);
    CHECK_FALSE(st->success());
    CHECK(st->describe() == "exit code 3");

    // Cached once reaped
    auto again = p->tryWait();
    REQUIRE(again);
    CHECK(again->exit_code == 3);
    CHECK_FALSE(p->signal(SIGTERM));
}

TEST_CASE("missing binary raises SpawnError", "[process]") {
    SpawnSpec sp;
    sp.argv = {"/nonexistent/definitely-not-here"};
    CHECK_THROWS_AS(PosixProcess::spawn(sp), SpawnError);

    SpawnSpec empty;
    CHECK_THROWS_AS(PosixProcess::spawn(empty), SpawnError);
}

TEST_CASE("bad working directory raises SpawnError", "[process]") {
    SpawnSpec sp = shell("exit 0");
    sp.cwd = "/nonexistent/dir";
    CHECK_THROWS_AS(PosixProcess::spawn(sp), SpawnError);
}

TEST_CASE("output lines reach the callback", "[process]") {
    std::mutex mx;
    std::vector<std::string> lines;

    SpawnSpec sp = shell("echo one; printf 'two\\rthree\\n'; echo four >&2; echo \"$PAGE_RECORDER_TEST\"");
    sp.env["PAGE_RECORDER_TEST"] = "from-env";
    sp.on_output = [&](const std::string& line) {
        std::lock_guard<std::mutex> lk(mx);
        lines.push_back(line);
    };

    {
        SteadyTimeSource clock;
        auto p = PosixProcess::spawn(sp);
        REQUIRE(waitForExit(*p, clock, std::chrono::seconds(5), Millis(10)));
    } // reader joined on release

    std::lock_guard<std::mutex> lk(mx);
    CHECK(lines == std::vector<std::string>{"one", "two", "three", "four", "from-env"});
}

TEST_CASE("terminateGracefully stops a cooperative child with SIGTERM", "[process]") {
    SteadyTimeSource clock;
    auto p = PosixProcess::spawn(shell("exec sleep 30"));
    REQUIRE(p->running());

    CHECK(terminateGracefully(*p, "sleep", std::chrono::seconds(5), clock, Millis(20)));
    auto st = p->tryWait();
    REQUIRE(st);
    CHECK(st->term_signal == SIGTERM);
}

TEST_CASE("terminateGracefully escalates to SIGKILL", "[process]") {
    SteadyTimeSource clock;
    auto p = PosixProcess::spawn(shell("trap '' TERM; sleep 30"));
    clock.sleepFor(Millis(200)); // let the trap install

    const auto start = clock.now();
    CHECK(terminateGracefully(*p, "stubborn", Millis(300), clock, Millis(20)));
    CHECK(clock.now() - start >= Millis(300));

    auto st = p->tryWait();
    REQUIRE(st);
    CHECK(st->term_signal == SIGKILL);
}

TEST_CASE("waitForExit times out on a running child", "[process]") {
    SteadyTimeSource clock;
    auto p = PosixProcess::spawn(shell("exec sleep 30"));
    CHECK_FALSE(waitForExit(*p, clock, Millis(100), Millis(10)));
    CHECK(p->signal(SIGKILL));
    auto st = waitForExit(*p, clock, std::chrono::seconds(5), Millis(10));
    REQUIRE(st);
    CHECK(st->term_signal == SIGKILL);
}

TEST_CASE("describeCommand joins argv", "[process]") {
    SpawnSpec sp;
    sp.argv = {"Xvfb", ":99", "-screen", "0", "1920x1080x24"};
    CHECK(describeCommand(sp) == "Xvfb :99 -screen 0 1920x1080x24");
}
