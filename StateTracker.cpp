#include "StateTracker.hpp"
#include "Logging.hpp"

namespace {

// STATE_CYCLE closed back onto ACTIVE
constexpr std::size_t kLoopLength = MessageCodec::STATE_CYCLE.size() + 1;

StationState loop_step(std::size_t pos) {
    return MessageCodec::STATE_CYCLE[pos % MessageCodec::STATE_CYCLE.size()];
}

} // namespace

StateTracker::StateTracker(std::size_t max_history)
    : current_(StationState::Unknown), max_history_(max_history), loop_count_(0), loop_position_(0),
      loop_in_progress_(false) {}

StateUpdate StateTracker::update(StationState next) {
    if (next == StationState::Unknown) {
        qCWarning(lcListener) << "ignoring unknown state";
        return {false, false, false};
    }
    if (next == current_) return {true, false, false};

    StationState from = current_;
    current_ = next;
    bool completed = track_loop(from, next);
    history_.push_back({MessageCodec::now_iso8601(), from, next, loop_count_});
    while (history_.size() > max_history_) history_.pop_front();
    return {true, true, completed};
}

bool StateTracker::track_loop(StationState from, StationState to) {
    if (!loop_in_progress_) {
        if (to == loop_step(0)) {
            loop_in_progress_ = true;
            loop_position_ = 0;
        }
        return false;
    }

    if (from == loop_step(loop_position_) && to == loop_step(loop_position_ + 1)) {
        ++loop_position_;
        if (loop_position_ == kLoopLength - 1) {
            // the closing ACTIVE opens the next loop
            ++loop_count_;
            loop_position_ = 0;
            qCInfo(lcListener) << "completed state loop" << loop_count_;
            return true;
        }
        return false;
    }

    qCDebug(lcListener) << "state loop broken at" << MessageCodec::name_for(from).c_str()
                        << "->" << MessageCodec::name_for(to).c_str();
    loop_in_progress_ = (to == loop_step(0));
    loop_position_ = 0;
    return false;
}

std::vector<StateTransition> StateTracker::history(std::size_t count) const {
    if (count == 0 || count >= history_.size()) return {history_.begin(), history_.end()};
    return {history_.end() - static_cast<std::ptrdiff_t>(count), history_.end()};
}
