/*
* @license
* (C) zachbabanov
*
*/

#include <registry.hpp>
#include <logger.hpp>
#include <translator.hpp>

#include <mutex>

using namespace iptv::log;
using namespace iptv::playback;
using iptv::task::Poll;

namespace iptv::registry {

    InstanceRegistry::InstanceRegistry() : last_id_(0) {}

    InstanceRegistry &InstanceRegistry::global() {
        static InstanceRegistry inst;
        return inst;
    }

    std::optional<PlayerInstance> InstanceRegistry::current() const {
        std::shared_lock<std::shared_mutex> lk(mtx_);
        return slot_;
    }

    uint64_t InstanceRegistry::set(PlayerInstance inst) {
        if (!inst.live) {
            LOG_REG_WARN("Refusing unverified player pid={} endpoint='{}'", (int)inst.pid, inst.channel_address);
            return 0;
        }
        std::unique_lock<std::shared_mutex> lk(mtx_);
        if (inst.id == 0) inst.id = ++last_id_;
        LOG_REG_INFO("Current player: id={} pid={} endpoint='{}' {} {}", inst.id, (int)inst.pid,
                     inst.channel_address, to_string(inst.ownership), to_string(inst.mode));
        slot_ = std::move(inst);
        return slot_->id;
    }

    void InstanceRegistry::clear() {
        std::unique_lock<std::shared_mutex> lk(mtx_);
        if (slot_) LOG_REG_INFO("Current player id={} cleared", slot_->id);
        slot_.reset();
    }

    bool InstanceRegistry::clear_if(uint64_t id) {
        std::unique_lock<std::shared_mutex> lk(mtx_);
        if (!slot_ || slot_->id != id) return false;
        LOG_REG_INFO("Current player id={} evicted", id);
        slot_.reset();
        return true;
    }

    void InstanceRegistry::set_now_playing(uint64_t id, const std::string &url) {
        std::unique_lock<std::shared_mutex> lk(mtx_);
        if (!slot_ || slot_->id != id) return;
        slot_->now_playing = url;
    }

    LivenessProbe::LivenessProbe(task::Clock &clock, const config::PlayerConfig &cfg, InstanceRegistry &registry,
                                 process::Supervisor &supervisor, channel::Connector &connector)
            : Task(clock),
              cfg_(cfg),
              registry_(registry),
              supervisor_(supervisor),
              connector_(connector),
              state_(State::Start),
              live_(false),
              evicted_(false),
              process_alive_(false) {}

    Poll LivenessProbe::evict(PlayError why) {
        error_ = std::move(why);
        channel_.reset();
        evicted_ = registry_.clear_if(instance_->id);
        LOG_REG_WARN("Player id={} failed liveness probe: {}", instance_->id, iptv::to_string(error_));

        if (instance_->ownership == Ownership::Owned && instance_->has_process()) {
            int status = 0;
            switch (supervisor_.check(instance_->pid, status)) {
                case process::ProcessState::Running:
                    process_alive_ = true;
                    break;
                case process::ProcessState::Exited:
                    exit_message_ = process::describe_status(status);
                    break;
                case process::ProcessState::Gone:
                    exit_message_ = "no longer running";
                    break;
            }
        }
        return Poll::Ready;
    }

    Poll LivenessProbe::check_process() {
        int status = 0;
        switch (supervisor_.check(instance_->pid, status)) {
            case process::ProcessState::Running:
                live_ = true;
                status_ = PlaybackStatus(StatusKind::Unknown, instance_->now_playing);
                return Poll::Ready;
            case process::ProcessState::Exited:
                exit_message_ = process::describe_status(status);
                break;
            case process::ProcessState::Gone:
                exit_message_ = "no longer running";
                break;
        }
        error_ = PlayError::no_instance();
        error_.message = exit_message_;
        evicted_ = registry_.clear_if(instance_->id);
        LOG_REG_INFO("Player id={} pid={} {}", instance_->id, (int)instance_->pid, exit_message_);
        return Poll::Ready;
    }

    Poll LivenessProbe::step() {
        switch (state_) {
            case State::Start:
                instance_ = registry_.current();
                if (!instance_) return Poll::Ready;
                if (!instance_->has_channel()) {
                    if (instance_->has_process()) return check_process();
                    return evict(PlayError::no_instance());
                }
                LOG_REG_DEBUG("Probing player id={} at '{}'", instance_->id, instance_->channel_address);
                connect_ = std::make_shared<channel::ConnectTask>(clock_, connector_, instance_->channel_address,
                                                                  std::chrono::milliseconds(0), cfg_.poll_interval());
                state_ = State::Connecting;
                [[fallthrough]];

            case State::Connecting:
                if (connect_->poll() == Poll::Pending) {
                    follow(*connect_);
                    return Poll::Pending;
                }
                if (connect_->error() != ConnectError::None) {
                    return evict(PlayError::from_connect(connect_->error(), connect_->detail()));
                }
                channel_ = connect_->take_channel();
                query_ = std::make_shared<channel::RequestTask>(clock_, *channel_, ControlRequest::query_status(),
                                                                cfg_.probe_timeout());
                state_ = State::Querying;
                [[fallthrough]];

            case State::Querying:
                if (query_->poll() == Poll::Pending) {
                    follow(*query_);
                    return Poll::Pending;
                }
                if (query_->error() != ChannelError::None) {
                    return evict(PlayError::from_channel(query_->error(), query_->detail()));
                }
                live_ = true;
                status_ = protocol::status_from_response(query_->response());
                registry_.set_now_playing(instance_->id, status_.url);
                instance_->now_playing = status_.url;
                LOG_REG_DEBUG("Player id={} alive, {}", instance_->id, to_string(status_.kind));
                return Poll::Ready;
        }
        return Poll::Ready;
    }

} // namespace iptv::registry
