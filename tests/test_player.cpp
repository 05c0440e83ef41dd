/*
* @license
* (C) zachbabanov
*
*/

#include <catch2/catch.hpp>

#include "test_support.hpp"

#include <config.hpp>
#include <player.hpp>
#include <registry.hpp>

using namespace iptv;
using namespace iptv::playback;
using namespace iptv::testing;

namespace {

    const char *ENDPOINT = "/fake/state/mpv.sock";

    /**
     * Facade wired to fakes. Every Background spawn makes the endpoint appear after
     * `absent_after_spawn` failed connection attempts, served by `mpv`.
     */
    struct FacadeFixture {
        ManualClock clock;
        task::Scheduler sched;
        config::PlayerConfig cfg;
        FakeSupervisor sup;
        FakeConnector conn;
        registry::InstanceRegistry reg;
        std::shared_ptr<FakePlayer> mpv;
        int absent_after_spawn;
        std::unique_ptr<player::PlayerFacade> facade;

        FacadeFixture() : sched(clock), mpv(std::make_shared<FakePlayer>()), absent_after_spawn(1) {
            cfg.endpoint_dir = "/fake/state";
            sup.on_launch = [this](const protocol::SpawnCommand &cmd, pid_t) {
                if (cmd.mode != PlaybackMode::Background) return;
                FakeEndpoint ep;
                ep.absent_attempts = absent_after_spawn;
                ep.player = mpv;
                conn.endpoints[cmd.endpoint] = ep;
            };
            facade.reset(new player::PlayerFacade(cfg, clock, sup, conn, reg));
        }

        template<typename T>
        std::shared_ptr<T> run(std::shared_ptr<T> op) {
            sched.run_until_done(op);
            return op;
        }

        /// Register an owned Background instance served by `p` (or by nobody).
        PlayerInstance seed_owned(pid_t pid, std::shared_ptr<FakePlayer> p) {
            PlayerInstance inst;
            inst.pid = pid;
            inst.channel_address = ENDPOINT;
            inst.live = true;
            inst.ownership = Ownership::Owned;
            inst.mode = PlaybackMode::Background;
            sup.run(pid);
            if (p) {
                FakeEndpoint ep;
                ep.player = std::move(p);
                conn.endpoints[ENDPOINT] = ep;
            }
            inst.id = reg.set(inst);
            return inst;
        }
    };

} // namespace

TEST_CASE_METHOD(FacadeFixture, "Background play spawns once, then reuses the live player", "[player][background]") {
    auto start = clock.now();
    auto first = run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background));

    REQUIRE(first->ok());
    REQUIRE(first->outcome() == PlaybackOutcome::Spawned);
    REQUIRE(sup.launches.size() == 1);
    // endpoint answered on the second poll attempt
    REQUIRE(clock.since(start) == cfg.poll_interval());

    const protocol::SpawnCommand &cmd = sup.launches[0];
    REQUIRE(cmd.endpoint == ENDPOINT);
    REQUIRE(std::find(cmd.args.begin(), cmd.args.end(), std::string("--input-ipc-server=") + ENDPOINT) != cmd.args.end());
    REQUIRE(std::find(cmd.args.begin(), cmd.args.end(), "http://x/1") == cmd.args.end());

    auto cur = reg.current();
    REQUIRE(cur.has_value());
    REQUIRE(cur->ownership == Ownership::Owned);
    REQUIRE(cur->pid == 1000);
    REQUIRE(cur->now_playing == "http://x/1");
    REQUIRE(mpv->now_playing == "http://x/1");

    auto second = run(facade->play(PlaybackTarget("http://x/2"), PlaybackMode::Background));
    REQUIRE(second->ok());
    REQUIRE(second->outcome() == PlaybackOutcome::Reused);
    REQUIRE(sup.launches.size() == 1);
    REQUIRE(reg.current()->id == cur->id);
    REQUIRE(mpv->now_playing == "http://x/2");
    REQUIRE(mpv->commands == std::vector<std::string>{"loadfile", "get_property", "loadfile"});
}

TEST_CASE_METHOD(FacadeFixture, "Repeated Background plays keep the same current instance", "[player][background]") {
    REQUIRE(run(facade->play(PlaybackTarget("http://x/0"), PlaybackMode::Background))->ok());
    const uint64_t id = reg.current()->id;

    for (int i = 1; i <= 5; ++i) {
        auto op = run(facade->play(PlaybackTarget("http://x/" + std::to_string(i)), PlaybackMode::Background));
        REQUIRE(op->ok());
        REQUIRE(op->outcome() == PlaybackOutcome::Reused);
        REQUIRE(reg.current()->id == id);
    }
    REQUIRE(sup.launches.size() == 1);
}

TEST_CASE_METHOD(FacadeFixture, "Concurrent Background plays are serialized onto one spawn", "[player][background][ordering]") {
    auto a = facade->play(PlaybackTarget("http://x/a"), PlaybackMode::Background);
    auto b = facade->play(PlaybackTarget("http://x/b"), PlaybackMode::Background);
    sched.submit(a);
    sched.submit(b);
    sched.run_until_done(b);

    REQUIRE(a->done());
    REQUIRE(a->ok());
    REQUIRE(b->ok());
    REQUIRE(a->outcome() == PlaybackOutcome::Spawned);
    REQUIRE(b->outcome() == PlaybackOutcome::Reused);
    REQUIRE(sup.launches.size() == 1);
    REQUIRE(mpv->now_playing == "http://x/b");
}

TEST_CASE_METHOD(FacadeFixture, "status and stop issued while a Background spawn awaits its endpoint", "[player][ordering]") {
    absent_after_spawn = 5;
    auto play = facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background);
    auto status = facade->status();
    auto stop = facade->stop();
    sched.submit(play);
    sched.submit(status);
    sched.submit(stop);

    sched.tick();
    // the player is launched and its endpoint is not up yet
    REQUIRE(sup.launches.size() == 1);
    REQUIRE_FALSE(play->done());
    REQUIRE_FALSE(reg.current().has_value());
    // status does not queue behind the spawn
    REQUIRE(status->done());
    REQUIRE(status->ok());
    REQUIRE(status->status().kind == StatusKind::Idle);
    // stop does
    REQUIRE_FALSE(stop->done());

    bool stop_finished_first = false;
    while (!stop->done()) {
        sched.wait();
        sched.tick();
        if (stop->done() && !play->done()) stop_finished_first = true;
    }

    REQUIRE_FALSE(stop_finished_first);
    REQUIRE(play->ok());
    REQUIRE(play->outcome() == PlaybackOutcome::Spawned);
    REQUIRE(stop->ok());
    REQUIRE_FALSE(stop->noop());
    // Stop went to the instance the play registered
    REQUIRE(mpv->commands == std::vector<std::string>{"loadfile", "get_property", "stop"});
    REQUIRE(mpv->now_playing.empty());
    REQUIRE(reg.current()->pid == 1000);
    REQUIRE(reg.current()->now_playing.empty());
    REQUIRE(sup.launches.size() == 1);
}

TEST_CASE_METHOD(FacadeFixture, "Probe reset evicts and falls through to a fresh spawn", "[player][eviction]") {
    auto dead = std::make_shared<FakePlayer>();
    dead->reset = true;
    PlayerInstance old = seed_owned(555, dead);
    sup.exit(555, exited_with(2));

    auto op = run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background));

    REQUIRE(op->ok());
    REQUIRE(op->outcome() == PlaybackOutcome::Spawned);
    REQUIRE(sup.launches.size() == 1);
    REQUIRE(dead->commands == std::vector<std::string>{"get_property"});
    auto cur = reg.current();
    REQUIRE(cur.has_value());
    REQUIRE(cur->id != old.id);
    REQUIRE(cur->pid == 1000);
    REQUIRE(facade->take_exit_message() == "player exited with code 2");
    REQUIRE(facade->take_exit_message().empty());
}

TEST_CASE_METHOD(FacadeFixture, "Endpoint poll deadline yields ConnectError::Timeout and no registration", "[player][timeout]") {
    absent_after_spawn = 1000000;
    auto start = clock.now();
    auto op = run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background));

    REQUIRE_FALSE(op->ok());
    REQUIRE(op->error().kind == PlayErrorKind::Connect);
    REQUIRE(op->error().connect == ConnectError::Timeout);
    REQUIRE_FALSE(reg.current().has_value());
    REQUIRE(clock.since(start) == cfg.connect_timeout());
    // the uncontrollable player is not left behind
    REQUIRE(sup.was_terminated(1000));
}

TEST_CASE_METHOD(FacadeFixture, "Player dying before its endpoint appears is an immediate exit", "[player][spawn]") {
    sup.on_launch = [this](const protocol::SpawnCommand &, pid_t pid) { sup.exit(pid, exited_with(1)); };
    auto op = run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background));

    REQUIRE_FALSE(op->ok());
    REQUIRE(op->error().kind == PlayErrorKind::Spawn);
    REQUIRE(op->error().spawn == SpawnError::ImmediateExit);
    REQUIRE(op->error().exit_code == 1);
    REQUIRE_FALSE(reg.current().has_value());
}

TEST_CASE_METHOD(FacadeFixture, "Missing binary surfaces BinaryNotFound without retrying", "[player][spawn]") {
    sup.next_error = SpawnError::BinaryNotFound;
    auto op = run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background));

    REQUIRE_FALSE(op->ok());
    REQUIRE(op->error().kind == PlayErrorKind::Spawn);
    REQUIRE(op->error().spawn == SpawnError::BinaryNotFound);
    REQUIRE(sup.launches.size() == 1);
    REQUIRE_FALSE(reg.current().has_value());
}

TEST_CASE_METHOD(FacadeFixture, "Non-Background modes never touch the registered channel", "[player][modes]") {
    PlayerInstance bg = seed_owned(555, mpv);
    const int attempts = conn.attempts;

    SECTION("Detached") {
        auto op = run(facade->play(PlaybackTarget("http://x/d", "Movie"), PlaybackMode::Detached));
        REQUIRE(op->ok());
        REQUIRE(op->outcome() == PlaybackOutcome::Launched);
        REQUIRE(std::find(sup.launches[0].args.begin(), sup.launches[0].args.end(), "http://x/d") !=
                sup.launches[0].args.end());
    }
    SECTION("Disassociated") {
        auto op = run(facade->play(PlaybackTarget("http://x/d"), PlaybackMode::Disassociated));
        REQUIRE(op->ok());
        REQUIRE(op->outcome() == PlaybackOutcome::Launched);
    }
    SECTION("Terminal") {
        auto op = run(facade->play(PlaybackTarget("http://x/t"), PlaybackMode::Terminal));
        REQUIRE(op->ok());
        REQUIRE(op->outcome() == PlaybackOutcome::Finished);
    }

    REQUIRE(conn.attempts == attempts);
    REQUIRE(mpv->commands.empty());
    REQUIRE(sup.launches.size() == 1);
    REQUIRE(sup.launches[0].endpoint.empty());
    REQUIRE(reg.current()->id == bg.id);
}

TEST_CASE_METHOD(FacadeFixture, "Non-Background play clears a Background instance only when it is dead", "[player][modes]") {
    PlayerInstance bg = seed_owned(555, mpv);

    SECTION("alive: kept") {
        REQUIRE(run(facade->play(PlaybackTarget("http://x/d"), PlaybackMode::Detached))->ok());
        REQUIRE(reg.current()->id == bg.id);
    }
    SECTION("dead: cleared") {
        sup.exit(555, exited_with(0));
        REQUIRE(run(facade->play(PlaybackTarget("http://x/d"), PlaybackMode::Detached))->ok());
        REQUIRE_FALSE(reg.current().has_value());
        REQUIRE(facade->take_exit_message() == "player exited normally (status: 0)");
    }
}

TEST_CASE_METHOD(FacadeFixture, "Detached spawn that exits inside the confirmation window fails", "[player][modes]") {
    sup.on_launch = [this](const protocol::SpawnCommand &, pid_t pid) { sup.exit(pid, exited_with(3)); };
    auto op = run(facade->play(PlaybackTarget("http://x/d"), PlaybackMode::Detached));

    REQUIRE_FALSE(op->ok());
    REQUIRE(op->error().spawn == SpawnError::ImmediateExit);
    REQUIRE(op->error().exit_code == 3);
}

TEST_CASE_METHOD(FacadeFixture, "Detached spawn is confirmed after the confirmation window", "[player][modes]") {
    auto start = clock.now();
    auto op = run(facade->play(PlaybackTarget("http://x/d"), PlaybackMode::Detached));
    REQUIRE(op->ok());
    REQUIRE(clock.since(start) == cfg.spawn_confirm());
}

TEST_CASE_METHOD(FacadeFixture, "Terminal exit codes", "[player][terminal]") {
    SECTION("4 is a normal quit") {
        sup.terminal_status = exited_with(4);
        auto op = run(facade->play(PlaybackTarget("http://x/t"), PlaybackMode::Terminal));
        REQUIRE(op->ok());
        REQUIRE(op->exit_code() == 4);
        REQUIRE(facade->take_exit_message().empty());
    }
    SECTION("other codes are reported") {
        sup.terminal_status = exited_with(2);
        auto op = run(facade->play(PlaybackTarget("http://x/t"), PlaybackMode::Terminal));
        REQUIRE(op->ok());
        REQUIRE(op->exit_code() == 2);
        REQUIRE(facade->take_exit_message() == "player exited with code 2");
    }
}

TEST_CASE_METHOD(FacadeFixture, "stop with nothing registered is a no-op success", "[player][stop]") {
    auto op = run(facade->stop());
    REQUIRE(op->ok());
    REQUIRE(op->noop());
    REQUIRE(conn.attempts == 0);
    REQUIRE(sup.launches.empty());
    REQUIRE(sup.terminated.empty());

    auto again = run(facade->stop());
    REQUIRE(again->ok());
    REQUIRE(again->noop());
}

TEST_CASE_METHOD(FacadeFixture, "status reports Playing, and Idle after a successful stop", "[player][stop][status]") {
    REQUIRE(run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background))->ok());

    auto st = run(facade->status());
    REQUIRE(st->status().kind == StatusKind::Playing);
    REQUIRE(st->status().url == "http://x/1");

    auto stop = run(facade->stop());
    REQUIRE(stop->ok());
    REQUIRE_FALSE(stop->noop());
    REQUIRE(mpv->commands.back() == "stop");
    // player stays resident by default
    REQUIRE(reg.current().has_value());
    REQUIRE(sup.terminated.empty());

    auto after = run(facade->status());
    REQUIRE(after->status().kind == StatusKind::Idle);
}

TEST_CASE_METHOD(FacadeFixture, "stop_terminates ends the owned player", "[player][stop]") {
    cfg.stop_terminates = true;
    REQUIRE(run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background))->ok());

    auto stop = run(facade->stop());
    REQUIRE(stop->ok());
    REQUIRE(sup.was_terminated(1000));
    REQUIRE_FALSE(reg.current().has_value());
    REQUIRE(std::find(conn.removed.begin(), conn.removed.end(), ENDPOINT) != conn.removed.end());
}

TEST_CASE_METHOD(FacadeFixture, "Player rejecting LoadFile is reported, instance kept", "[player][errors]") {
    REQUIRE(run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background))->ok());
    mpv->reject_load = true;

    auto op = run(facade->play(PlaybackTarget("http://x/bad"), PlaybackMode::Background));
    REQUIRE_FALSE(op->ok());
    REQUIRE(op->error().kind == PlayErrorKind::Rejected);
    REQUIRE(op->error().message == "loading failed");
    REQUIRE(reg.current().has_value());
}

TEST_CASE_METHOD(FacadeFixture, "LoadFile timeout evicts; the stuck player is replaced on the next play", "[player][errors]") {
    REQUIRE(run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background))->ok());
    mpv->silent.insert("loadfile");

    auto start = clock.now();
    auto op = run(facade->play(PlaybackTarget("http://x/2"), PlaybackMode::Background));
    REQUIRE_FALSE(op->ok());
    REQUIRE(op->error().kind == PlayErrorKind::Channel);
    REQUIRE(op->error().channel == ChannelError::Timeout);
    REQUIRE(clock.since(start) == cfg.request_timeout());
    REQUIRE_FALSE(reg.current().has_value());

    mpv->silent.clear();
    auto next = run(facade->play(PlaybackTarget("http://x/3"), PlaybackMode::Background));
    REQUIRE(next->ok());
    REQUIRE(next->outcome() == PlaybackOutcome::Spawned);
    REQUIRE(sup.was_terminated(1000));
    REQUIRE(reg.current()->pid == 1001);
}

TEST_CASE_METHOD(FacadeFixture, "A player already on the endpoint is discovered and reused", "[player][discovery]") {
    auto existing = std::make_shared<FakePlayer>();
    existing->now_playing = "http://x/old";
    FakeEndpoint ep;
    ep.player = existing;
    conn.endpoints[ENDPOINT] = ep;

    auto op = run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background));
    REQUIRE(op->ok());
    REQUIRE(op->outcome() == PlaybackOutcome::Reused);
    REQUIRE(sup.launches.empty());
    auto cur = reg.current();
    REQUIRE(cur->ownership == Ownership::Discovered);
    REQUIRE_FALSE(cur->has_process());
    REQUIRE(existing->now_playing == "http://x/1");

    // shutdown leaves a player we did not start alone
    facade->shutdown();
    REQUIRE(sup.terminated.empty());
    REQUIRE(reg.current().has_value());
}

TEST_CASE_METHOD(FacadeFixture, "A refused endpoint is stale: removed, then a player is spawned", "[player][discovery]") {
    FakeEndpoint ep;
    ep.state = channel::ConnectAttempt::Refused;
    conn.endpoints[ENDPOINT] = ep;

    auto discover = run(facade->discover());
    REQUIRE(discover->ok());
    REQUIRE_FALSE(discover->found());
    REQUIRE(discover->stale_removed());
    REQUIRE(conn.removed == std::vector<std::string>{ENDPOINT});

    conn.endpoints[ENDPOINT] = ep;
    auto op = run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background));
    REQUIRE(op->ok());
    REQUIRE(op->outcome() == PlaybackOutcome::Spawned);
}

TEST_CASE_METHOD(FacadeFixture, "Permission denied on the endpoint fails the play", "[player][discovery]") {
    FakeEndpoint ep;
    ep.state = channel::ConnectAttempt::PermissionDenied;
    conn.endpoints[ENDPOINT] = ep;

    auto op = run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background));
    REQUIRE_FALSE(op->ok());
    REQUIRE(op->error().kind == PlayErrorKind::Connect);
    REQUIRE(op->error().connect == ConnectError::PermissionDenied);
    REQUIRE(sup.launches.empty());
}

TEST_CASE_METHOD(FacadeFixture, "status is Unknown when the channel is gone but the process runs", "[player][status]") {
    seed_owned(555, nullptr);

    auto st = run(facade->status());
    REQUIRE(st->status().kind == StatusKind::Unknown);
    REQUIRE_FALSE(reg.current().has_value());

    // the unresponsive process is terminated before a replacement is spawned
    auto op = run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background));
    REQUIRE(op->ok());
    REQUIRE(sup.was_terminated(555));
}

TEST_CASE_METHOD(FacadeFixture, "status with nothing registered is Idle", "[player][status]") {
    auto st = run(facade->status());
    REQUIRE(st->ok());
    REQUIRE(st->status().kind == StatusKind::Idle);
    REQUIRE(conn.attempts == 0);
}

TEST_CASE_METHOD(FacadeFixture, "shutdown terminates an owned player and removes its endpoint", "[player][shutdown]") {
    REQUIRE(run(facade->play(PlaybackTarget("http://x/1"), PlaybackMode::Background))->ok());
    facade->shutdown();

    REQUIRE(sup.was_terminated(1000));
    REQUIRE_FALSE(reg.current().has_value());
    REQUIRE(conn.removed.back() == ENDPOINT);
}

TEST_CASE_METHOD(FacadeFixture, "Every facade call reaps finished children", "[player][reap]") {
    run(facade->status());
    run(facade->stop());
    run(facade->play(PlaybackTarget("http://x/t"), PlaybackMode::Terminal));
    REQUIRE(sup.reaps == 3);
}
