#include "cohere/engine.hpp"
#include "cohere/log.hpp"

namespace cohere {

std::atomic<log_level> g_log_level{log_level::off};

engine::engine(std::shared_ptr<remote_store> remote, engine_config config, shared_clock clk,
               shared_scheduler dispatch)
    : config_(std::move(config)),
      clock_(clk ? std::move(clk) : make_system_clock()),
      dispatch_(dispatch ? std::move(dispatch) : std::make_shared<immediate_scheduler>()),
      remote_(std::move(remote)),
      cache_(cache_handle::init(clock_)) {
    if (!remote_) {
        throw engine_error(error_code::invalid_argument, "engine requires a remote store");
    }
    set_log_level(config_.level);

    conflicts_ = std::make_shared<conflict_store>(clock_, dispatch_);
    undo_ = std::make_unique<undo_journal>(clock_, config_.undo);
    coordinator_ = std::make_unique<optimistic_coordinator>(cache_, remote_, config_.mutation);
    batches_ = std::make_unique<batch_executor>(cache_, remote_, coordinator_.get(), undo_.get(), config_.batch);
    resolver_ = std::make_unique<conflict_resolver>(cache_, conflicts_, coordinator_.get());
    queries_ = std::make_unique<query_service>(cache_, remote_);
    staleness_ = std::make_unique<staleness_policy>(cache_, conflicts_, config_.staleness);
    LOG_INFO("engine", "Engine started");
}

engine::~engine() {
    shutdown();
}

change_reconciler& engine::watch(const std::string& table, bool run_loop) {
    std::lock_guard<std::mutex> lock(reconcilers_mutex_);
    if (shut_down_) {
        throw engine_error(error_code::shut_down, "engine is shut down");
    }
    auto& slot = reconcilers_[table];
    if (!slot) {
        slot = std::make_unique<change_reconciler>(cache_, remote_, conflicts_, table, config_.feed, dispatch_);
    }
    if (run_loop) {
        slot->start();
    } else {
        slot->connect();
    }
    return *slot;
}

change_reconciler* engine::reconciler(const std::string& table) {
    std::lock_guard<std::mutex> lock(reconcilers_mutex_);
    auto it = reconcilers_.find(table);
    return it == reconcilers_.end() ? nullptr : it->second.get();
}

size_t engine::on_context_transition(const context_transition& transition) {
    auto commands = staleness_->on_context_transition(transition);
    size_t ran = queries_->execute(commands);
    for (const auto& command : commands) {
        if (command.kind != command_kind::reconnect_feed) continue;
        std::lock_guard<std::mutex> lock(reconcilers_mutex_);
        for (auto& [table, reconciler] : reconcilers_) {
            auto state = reconciler->status().state;
            if (state != connection_state::connected) {
                LOG_INFO("engine", "Reconnecting %s feed", table.c_str());
                reconciler->retry();
            }
        }
        ++ran;
    }
    return ran;
}

void engine::shutdown() {
    {
        std::lock_guard<std::mutex> lock(reconcilers_mutex_);
        if (shut_down_) return;
        shut_down_ = true;
        for (auto& [_, reconciler] : reconcilers_) {
            reconciler->stop();
        }
    }
    cache_.shutdown();
    LOG_INFO("engine", "Engine shut down");
}

} // namespace cohere
