#ifndef STATE_TRACKER_HPP
#define STATE_TRACKER_HPP

#include "MessageCodec.hpp"
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

struct StateTransition {
    std::string time;
    StationState from;
    StationState to;
    int loop_count;
};

struct StateUpdate {
    bool success;
    bool changed;
    bool loop_completed;
};

// Follows the states a publisher announces and counts complete
// ACTIVE -> STANDBY -> MAINTENANCE -> ERROR -> ACTIVE loops.
class StateTracker {
public:
    // transitions older than the last max_history are dropped
    explicit StateTracker(std::size_t max_history = DEFAULT_MAX_HISTORY);

    static constexpr std::size_t DEFAULT_MAX_HISTORY = 1000;

    StateUpdate update(StationState next);

    StationState current() const { return current_; }
    int loop_count() const { return loop_count_; }
    bool loop_in_progress() const { return loop_in_progress_; }
    std::size_t loop_position() const { return loop_position_; }

    // most recent transitions; all of them when count is 0
    std::vector<StateTransition> history(std::size_t count = 0) const;

private:
    StationState current_;
    std::deque<StateTransition> history_;
    std::size_t max_history_;
    int loop_count_;
    std::size_t loop_position_;
    bool loop_in_progress_;

    bool track_loop(StationState from, StationState to);
};

#endif // STATE_TRACKER_HPP
