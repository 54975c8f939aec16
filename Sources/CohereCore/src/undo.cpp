#include "cohere/undo.hpp"
#include "cohere/error.hpp"
#include "cohere/log.hpp"

namespace cohere {

undo_journal::undo_journal(shared_clock clk, undo_config config)
    : clock_(clk ? std::move(clk) : make_system_clock()), config_(config) {}

std::string undo_journal::record(std::string action, std::vector<entity> snapshots, reverse_fn reverse,
                                 std::optional<std::chrono::milliseconds> ttl) {
    if (!reverse) {
        throw engine_error(error_code::invalid_argument, "undo record needs a reverse action");
    }
    auto now = clock_->now();
    undo_record rec;
    rec.id = uuid_t::generate().to_string();
    rec.action = std::move(action);
    rec.snapshots = std::move(snapshots);
    rec.created_at = now;
    rec.expires_at = now + ttl.value_or(config_.ttl);

    std::lock_guard<std::mutex> lock(mutex_);
    LOG_DEBUG("undo", "Recorded %s for %zu entities as %s", rec.action.c_str(), rec.snapshots.size(),
              rec.id.c_str());
    auto id = rec.id;
    records_.emplace(id, slot{std::move(rec), std::move(reverse)});
    return id;
}

void undo_journal::execute(const std::string& undo_id) {
    slot taken;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(undo_id);
        if (it == records_.end()) {
            throw engine_error(error_code::not_found, "no undo record " + undo_id);
        }
        if (clock_->now() >= it->second.record.expires_at) {
            records_.erase(it);
            LOG_INFO("undo", "Undo %s requested after its window closed", undo_id.c_str());
            throw engine_error(error_code::expired, "undo window for " + undo_id + " has passed");
        }
        taken = std::move(it->second);
        records_.erase(it);
    }

    try {
        taken.reverse(taken.record.snapshots);
    } catch (const std::exception& e) {
        LOG_WARN("undo", "Reverting %s failed: %s", taken.record.action.c_str(), e.what());
        std::lock_guard<std::mutex> lock(mutex_);
        records_.emplace(undo_id, std::move(taken));
        throw;
    }
    LOG_INFO("undo", "Reverted %s (%zu entities)", taken.record.action.c_str(), taken.record.snapshots.size());
}

bool undo_journal::discard(const std::string& undo_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(undo_id) != 0;
}

size_t undo_journal::purge_expired() {
    auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    size_t purged = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (now >= it->second.record.expires_at) {
            it = records_.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }
    return purged;
}

std::vector<undo_record> undo_journal::active() const {
    auto now = clock_->now();
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<undo_record> result;
    for (const auto& [_, s] : records_) {
        if (now < s.record.expires_at) result.push_back(s.record);
    }
    return result;
}

} // namespace cohere
