/*
* @license
* (C) zachbabanov
*
*/

#include <player.hpp>
#include <logger.hpp>
#include <translator.hpp>

#include <algorithm>

#include <fmt/core.h>

using namespace iptv::log;
using namespace iptv::playback;
using iptv::task::Poll;

/*
 * Implementation notes:
 * - Every operation re-probes the registered instance before using it; nothing trusts a liveness
 *   flag from an earlier call.
 * - An owned player that is evicted while still running becomes an orphan. Orphans are terminated
 *   before the next Background spawn so two residents never share one endpoint path.
 * - Terminal/Detached/Disassociated never touch the registered instance's channel.
 */

namespace iptv::player {

    Operation::Operation(PlayerFacade &facade)
            : Task(facade.clock_), facade_(facade), serialized_(false), failed_(false) {}

    Poll Operation::fail(PlayError e) {
        failed_ = true;
        error_ = std::move(e);
        LOG_PLAYER_ERROR("{} failed: {}", name(), iptv::to_string(error_));
        return Poll::Ready;
    }

    bool Operation::acquire_slot() {
        if (!serialized_) return true;
        std::shared_ptr<task::Task> blocker = facade_.slot_blocker(this);
        if (!blocker) return true;
        LOG_PLAYER_DEBUG("{} waiting for in-flight {}", name(), blocker->name());
        follow(*blocker);
        return false;
    }

    // ---------------------------------------------------------------- discover

    DiscoverTask::DiscoverTask(PlayerFacade &facade)
            : Operation(facade), state_(State::Start), found_(false), stale_removed_(false) {}

    Poll DiscoverTask::step() {
        switch (state_) {
            case State::Start:
                if (!acquire_slot()) return Poll::Pending;
                if (facade_.registry_.current()) return Poll::Ready;
                address_ = facade_.cfg_.endpoint_path();
                connect_ = std::make_shared<channel::ConnectTask>(clock_, facade_.connector_, address_,
                                                                  std::chrono::milliseconds(0),
                                                                  facade_.cfg_.poll_interval());
                state_ = State::Connecting;
                [[fallthrough]];

            case State::Connecting:
                if (connect_->poll() == Poll::Pending) {
                    follow(*connect_);
                    return Poll::Pending;
                }
                switch (connect_->error()) {
                    case ConnectError::None:
                        break;
                    case ConnectError::Timeout:
                        if (connect_->last_attempt() == channel::ConnectAttempt::Refused) {
                            LOG_PLAYER_INFO("Stale player endpoint '{}' found, removing", address_);
                            facade_.connector_.remove_endpoint(address_);
                            stale_removed_ = true;
                        }
                        return Poll::Ready;
                    case ConnectError::PermissionDenied:
                    case ConnectError::IoFailure:
                        return fail(PlayError::from_connect(connect_->error(), connect_->detail()));
                }
                channel_ = connect_->take_channel();
                query_ = std::make_shared<channel::RequestTask>(clock_, *channel_, ControlRequest::query_status(),
                                                                facade_.cfg_.probe_timeout());
                state_ = State::Querying;
                [[fallthrough]];

            case State::Querying:
                if (query_->poll() == Poll::Pending) {
                    follow(*query_);
                    return Poll::Pending;
                }
                if (query_->error() != ChannelError::None) {
                    LOG_PLAYER_WARN("Endpoint '{}' accepted a connection but did not answer: {}", address_,
                                    query_->detail());
                    channel_.reset();
                    return Poll::Ready;
                }
                instance_ = PlayerInstance();
                instance_.channel_address = address_;
                instance_.live = true;
                instance_.ownership = Ownership::Discovered;
                instance_.mode = PlaybackMode::Background;
                instance_.now_playing = protocol::status_from_response(query_->response()).url;
                instance_.id = facade_.registry_.set(instance_);
                found_ = true;
                LOG_PLAYER_INFO("Attached to running player at '{}'", address_);
                return Poll::Ready;
        }
        return Poll::Ready;
    }

    // ---------------------------------------------------------------- play

    PlayTask::PlayTask(PlayerFacade &facade, PlaybackTarget target, PlaybackMode mode)
            : Operation(facade),
              target_(std::move(target)),
              mode_(mode),
              state_(State::Start),
              pid_(-1),
              outcome_(PlaybackOutcome::Spawned),
              exit_code_(0) {}

    void PlayTask::start_load() {
        load_ = std::make_shared<channel::RequestTask>(clock_, *channel_, ControlRequest::load_file(target_.url()),
                                                       facade_.cfg_.request_timeout());
        state_ = State::Loading;
    }

    Poll PlayTask::spawn_background() {
        facade_.terminate_orphans();

        protocol::SpawnCommand cmd = protocol::build_spawn_command(facade_.cfg_, target_, PlaybackMode::Background);
        endpoint_ = cmd.endpoint;
        // whatever is left at the path is not a usable player at this point
        facade_.connector_.remove_endpoint(endpoint_);

        int status = 0;
        std::string why;
        SpawnError err = facade_.supervisor_.launch(cmd, pid_, status, why);
        if (err != SpawnError::None) return fail(PlayError::from_spawn(err, 0, why));

        connect_ = std::make_shared<channel::ConnectTask>(clock_, facade_.connector_, endpoint_,
                                                          facade_.cfg_.connect_timeout(), facade_.cfg_.poll_interval());
        state_ = State::AwaitEndpoint;
        return await_endpoint();
    }

    Poll PlayTask::await_endpoint() {
        int status = 0;
        switch (facade_.supervisor_.check(pid_, status)) {
            case process::ProcessState::Exited:
                return fail(PlayError::from_spawn(SpawnError::ImmediateExit, process::exit_code_of(status),
                                                  "player " + process::describe_status(status) +
                                                  " before its control endpoint appeared"));
            case process::ProcessState::Gone:
                return fail(PlayError::from_spawn(SpawnError::ImmediateExit, -1,
                                                  "player vanished before its control endpoint appeared"));
            case process::ProcessState::Running:
                break;
        }

        if (connect_->poll() == Poll::Pending) {
            follow(*connect_);
            return Poll::Pending;
        }
        if (connect_->error() != ConnectError::None) {
            // a player we cannot control is of no use; nothing gets registered
            if (facade_.supervisor_.check(pid_, status) == process::ProcessState::Running) {
                facade_.supervisor_.terminate(pid_);
            }
            return fail(PlayError::from_connect(connect_->error(),
                                                fmt::format("endpoint '{}' after {} attempt(s): {}", endpoint_,
                                                            connect_->attempts(), connect_->detail())));
        }

        channel_ = connect_->take_channel();
        instance_ = PlayerInstance();
        instance_.pid = pid_;
        instance_.channel_address = endpoint_;
        instance_.live = true;
        instance_.ownership = Ownership::Owned;
        instance_.mode = PlaybackMode::Background;
        instance_.id = facade_.registry_.set(instance_);
        outcome_ = PlaybackOutcome::Spawned;
        start_load();
        return step();
    }

    Poll PlayTask::launch_unmanaged() {
        facade_.forget_dead_instance();

        protocol::SpawnCommand cmd = protocol::build_spawn_command(facade_.cfg_, target_, mode_);
        int status = 0;
        std::string why;
        SpawnError err = facade_.supervisor_.launch(cmd, pid_, status, why);
        if (err != SpawnError::None) return fail(PlayError::from_spawn(err, 0, why));

        switch (mode_) {
            case PlaybackMode::Terminal:
                exit_code_ = process::exit_code_of(status);
                outcome_ = PlaybackOutcome::Finished;
                // 4 is mpv's "quit by user"
                if (exit_code_ != 0 && exit_code_ != 4) {
                    facade_.note_exit("player " + process::describe_status(status));
                } else {
                    LOG_PLAYER_INFO("Finished playing '{}'", target_.display_name());
                }
                return Poll::Ready;
            case PlaybackMode::Detached:
            case PlaybackMode::Disassociated:
                confirm_ = std::make_shared<process::SpawnConfirmTask>(
                        clock_, facade_.supervisor_, pid_, facade_.cfg_.spawn_confirm(),
                        std::min(facade_.cfg_.poll_interval(), facade_.cfg_.spawn_confirm()));
                state_ = State::Confirming;
                return step();
            case PlaybackMode::Background:
                break;
        }
        return fail(PlayError::from_spawn(SpawnError::IoFailure, 0, "background mode has no unmanaged launch"));
    }

    Poll PlayTask::step() {
        switch (state_) {
            case State::Start:
                facade_.housekeeping();
                LOG_PLAYER_INFO("Play '{}' ({})", target_.display_name(), playback::to_string(mode_));
                if (mode_ != PlaybackMode::Background) {
                    state_ = State::Launching;
                    return launch_unmanaged();
                }
                state_ = State::Queued;
                [[fallthrough]];

            case State::Queued:
                if (!acquire_slot()) return Poll::Pending;
                if (facade_.registry_.current()) {
                    probe_ = facade_.make_probe();
                    state_ = State::Probing;
                } else if (!facade_.orphans_.empty()) {
                    // our own unresponsive player still holds the endpoint; replace it
                    state_ = State::Spawning;
                } else {
                    discover_ = std::make_shared<DiscoverTask>(facade_);
                    state_ = State::Discovering;
                }
                return step();

            case State::Probing:
                if (probe_->poll() == Poll::Pending) {
                    follow(*probe_);
                    return Poll::Pending;
                }
                if (probe_->live() && probe_->instance()->has_channel()) {
                    instance_ = *probe_->instance();
                    channel_ = probe_->take_channel();
                    outcome_ = PlaybackOutcome::Reused;
                    start_load();
                    return step();
                }
                if (probe_->live()) {
                    facade_.evict(*probe_->instance(), PlayError::no_instance());
                } else {
                    facade_.absorb(*probe_);
                }
                state_ = State::Spawning;
                return spawn_background();

            case State::Discovering:
                if (discover_->poll() == Poll::Pending) {
                    follow(*discover_);
                    return Poll::Pending;
                }
                if (!discover_->ok()) return fail(discover_->error());
                if (discover_->found()) {
                    instance_ = discover_->instance();
                    channel_ = discover_->take_channel();
                    outcome_ = PlaybackOutcome::Reused;
                    start_load();
                    return step();
                }
                state_ = State::Spawning;
                return spawn_background();

            case State::Spawning:
                return spawn_background();

            case State::AwaitEndpoint:
                return await_endpoint();

            case State::Loading:
                if (load_->poll() == Poll::Pending) {
                    follow(*load_);
                    return Poll::Pending;
                }
                if (load_->error() != ChannelError::None) {
                    PlayError e = PlayError::from_channel(load_->error(), load_->detail());
                    facade_.evict(instance_, e);
                    return fail(e);
                }
                if (!load_->response().ok()) {
                    return fail(PlayError::rejected(load_->response().payload));
                }
                facade_.registry_.set_now_playing(instance_.id, target_.url());
                LOG_PLAYER_INFO("Now playing '{}' ({} player id={})", target_.display_name(),
                                playback::to_string(outcome_), instance_.id);
                return Poll::Ready;

            case State::Launching:
                return launch_unmanaged();

            case State::Confirming:
                if (confirm_->poll() == Poll::Pending) {
                    follow(*confirm_);
                    return Poll::Pending;
                }
                if (confirm_->error() != SpawnError::None) {
                    return fail(PlayError::from_spawn(confirm_->error(), confirm_->exit_code(), confirm_->detail()));
                }
                outcome_ = PlaybackOutcome::Launched;
                LOG_PLAYER_INFO("Player pid={} launched {} for '{}'", (int)pid_, playback::to_string(mode_),
                                target_.display_name());
                return Poll::Ready;
        }
        return Poll::Ready;
    }

    // ---------------------------------------------------------------- stop

    StopTask::StopTask(PlayerFacade &facade) : Operation(facade), state_(State::Start), noop_(false) {}

    Poll StopTask::step() {
        switch (state_) {
            case State::Start:
                facade_.housekeeping();
                state_ = State::Queued;
                [[fallthrough]];

            case State::Queued:
                if (!acquire_slot()) return Poll::Pending;
                if (!facade_.registry_.current()) {
                    LOG_PLAYER_DEBUG("Stop: no player registered");
                    noop_ = true;
                    return Poll::Ready;
                }
                probe_ = facade_.make_probe();
                state_ = State::Probing;
                [[fallthrough]];

            case State::Probing:
                if (probe_->poll() == Poll::Pending) {
                    follow(*probe_);
                    return Poll::Pending;
                }
                if (!probe_->live()) {
                    facade_.absorb(*probe_);
                    noop_ = true;
                    return Poll::Ready;
                }
                instance_ = *probe_->instance();
                if (!instance_.has_channel()) {
                    facade_.supervisor_.terminate(instance_.pid);
                    facade_.registry_.clear_if(instance_.id);
                    return Poll::Ready;
                }
                channel_ = probe_->take_channel();
                request_ = std::make_shared<channel::RequestTask>(clock_, *channel_, ControlRequest::stop(),
                                                                  facade_.cfg_.request_timeout());
                state_ = State::Stopping;
                [[fallthrough]];

            case State::Stopping:
                if (request_->poll() == Poll::Pending) {
                    follow(*request_);
                    return Poll::Pending;
                }
                if (request_->error() != ChannelError::None) {
                    PlayError e = PlayError::from_channel(request_->error(), request_->detail());
                    facade_.evict(instance_, e);
                    return fail(e);
                }
                if (!request_->response().ok()) {
                    return fail(PlayError::rejected(request_->response().payload));
                }
                facade_.registry_.set_now_playing(instance_.id, {});
                LOG_PLAYER_INFO("Playback stopped (player id={})", instance_.id);

                if (facade_.cfg_.stop_terminates && instance_.ownership == Ownership::Owned &&
                    instance_.has_process()) {
                    channel_.reset();
                    facade_.supervisor_.terminate(instance_.pid);
                    facade_.connector_.remove_endpoint(instance_.channel_address);
                    facade_.registry_.clear_if(instance_.id);
                }
                return Poll::Ready;
        }
        return Poll::Ready;
    }

    // ---------------------------------------------------------------- status

    StatusTask::StatusTask(PlayerFacade &facade) : Operation(facade), started_(false) {}

    Poll StatusTask::step() {
        if (!started_) {
            started_ = true;
            facade_.housekeeping();
            if (!facade_.registry_.current()) {
                status_ = PlaybackStatus(StatusKind::Idle, {});
                return Poll::Ready;
            }
            probe_ = facade_.make_probe();
        }
        if (probe_->poll() == Poll::Pending) {
            follow(*probe_);
            return Poll::Pending;
        }
        if (probe_->live()) {
            status_ = probe_->status();
        } else {
            facade_.absorb(*probe_);
            if (probe_->process_alive()) {
                status_ = PlaybackStatus(StatusKind::Unknown, probe_->instance()->now_playing);
            } else {
                status_ = PlaybackStatus(StatusKind::Idle, {});
            }
        }
        LOG_PLAYER_DEBUG("Status: {} {}", playback::to_string(status_.kind), status_.url);
        return Poll::Ready;
    }

    // ---------------------------------------------------------------- facade

    PlayerFacade::PlayerFacade(const config::PlayerConfig &cfg, task::Clock &clock, process::Supervisor &supervisor,
                               channel::Connector &connector, registry::InstanceRegistry &registry)
            : cfg_(cfg), clock_(clock), supervisor_(supervisor), connector_(connector), registry_(registry) {}

    template<typename T>
    std::shared_ptr<T> PlayerFacade::serialize(std::shared_ptr<T> op) {
        op->serialized_ = true;
        slot_queue_.push_back(op);
        return op;
    }

    std::shared_ptr<PlayTask> PlayerFacade::play(const PlaybackTarget &target, PlaybackMode mode) {
        auto op = std::make_shared<PlayTask>(*this, target, mode);
        if (mode == PlaybackMode::Background) return serialize(op);
        return op;
    }

    std::shared_ptr<StopTask> PlayerFacade::stop() {
        return serialize(std::make_shared<StopTask>(*this));
    }

    std::shared_ptr<StatusTask> PlayerFacade::status() {
        return std::make_shared<StatusTask>(*this);
    }

    std::shared_ptr<DiscoverTask> PlayerFacade::discover() {
        return serialize(std::make_shared<DiscoverTask>(*this));
    }

    std::shared_ptr<task::Task> PlayerFacade::slot_blocker(const task::Task *op) {
        while (!slot_queue_.empty()) {
            std::shared_ptr<task::Task> front = slot_queue_.front().lock();
            if (!front || front->done()) {
                slot_queue_.pop_front();
                continue;
            }
            if (front.get() == op) return nullptr;
            return front;
        }
        return nullptr;
    }

    std::shared_ptr<registry::LivenessProbe> PlayerFacade::make_probe() {
        return std::make_shared<registry::LivenessProbe>(clock_, cfg_, registry_, supervisor_, connector_);
    }

    void PlayerFacade::housekeeping() {
        supervisor_.reap();
        auto it = orphans_.begin();
        while (it != orphans_.end()) {
            int status = 0;
            if (supervisor_.check(*it, status) == process::ProcessState::Running) {
                ++it;
                continue;
            }
            it = orphans_.erase(it);
        }
    }

    void PlayerFacade::evict(const PlayerInstance &inst, const PlayError &why) {
        if (registry_.clear_if(inst.id)) {
            LOG_PLAYER_WARN("Dropped player id={}: {}", inst.id, iptv::to_string(why));
        }
        if (inst.ownership != Ownership::Owned || !inst.has_process()) return;

        int status = 0;
        switch (supervisor_.check(inst.pid, status)) {
            case process::ProcessState::Running:
                if (std::find(orphans_.begin(), orphans_.end(), inst.pid) == orphans_.end())
                    orphans_.push_back(inst.pid);
                break;
            case process::ProcessState::Exited:
                note_exit("player " + process::describe_status(status));
                break;
            case process::ProcessState::Gone:
                break;
        }
    }

    void PlayerFacade::absorb(const registry::LivenessProbe &probe) {
        if (!probe.exit_message().empty()) note_exit("player " + probe.exit_message());
        if (probe.process_alive() && probe.instance() && probe.instance()->has_process()) {
            pid_t pid = probe.instance()->pid;
            if (std::find(orphans_.begin(), orphans_.end(), pid) == orphans_.end()) orphans_.push_back(pid);
        }
    }

    void PlayerFacade::forget_dead_instance() {
        auto cur = registry_.current();
        if (!cur || cur->ownership != Ownership::Owned || !cur->has_process()) return;

        int status = 0;
        switch (supervisor_.check(cur->pid, status)) {
            case process::ProcessState::Running:
                return;
            case process::ProcessState::Exited:
                note_exit("player " + process::describe_status(status));
                break;
            case process::ProcessState::Gone:
                break;
        }
        registry_.clear_if(cur->id);
    }

    void PlayerFacade::terminate_orphans() {
        for (pid_t pid : orphans_) {
            LOG_PLAYER_INFO("Terminating unresponsive player pid={}", (int)pid);
            supervisor_.terminate(pid);
        }
        orphans_.clear();
    }

    void PlayerFacade::note_exit(const std::string &msg) {
        LOG_PLAYER_INFO("{}", msg);
        exit_message_ = msg;
    }

    std::string PlayerFacade::take_exit_message() {
        std::string msg;
        msg.swap(exit_message_);
        return msg;
    }

    void PlayerFacade::shutdown() {
        housekeeping();
        auto cur = registry_.current();
        if (cur && cur->ownership == Ownership::Owned) {
            LOG_PLAYER_INFO("Shutting down player id={} pid={}", cur->id, (int)cur->pid);
            if (cur->has_process()) supervisor_.terminate(cur->pid);
            if (cur->has_channel()) connector_.remove_endpoint(cur->channel_address);
            registry_.clear_if(cur->id);
        }
        terminate_orphans();
    }

} // namespace iptv::player
