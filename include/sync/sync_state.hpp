#ifndef BSYNC_SYNC_STATE_HPP
#define BSYNC_SYNC_STATE_HPP

#include <ostream>
#include <string>

namespace bsync {
namespace sync {

/**
 * SyncState tracks the phase of one sync run and rejects invalid transitions.
 */
class SyncState {
public:
    /**
     * Run phases:
     * INITIAL         - Controller created, nothing started
     * SCANNING_SOURCE - Building the source manifest
     * SCANNING_DEST   - Building the destination manifest
     * DIFFING         - Computing the transfer plan
     * TRANSFERRING    - Executing transfer tasks
     * SUMMARIZING     - Aggregating results
     * DONE            - Run finished, summary available
     * ABORTED         - A scan failed; no transfer was attempted
     */
    enum class State {
        INITIAL,
        SCANNING_SOURCE,
        SCANNING_DEST,
        DIFFING,
        TRANSFERRING,
        SUMMARIZING,
        DONE,
        ABORTED
    };

    SyncState() : current_state_(State::INITIAL) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const {
        return current_state_ == State::DONE ||
               current_state_ == State::ABORTED;
    }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::INITIAL:
                return to == State::SCANNING_SOURCE;

            case State::SCANNING_SOURCE:
                return to == State::SCANNING_DEST ||
                       to == State::ABORTED;

            case State::SCANNING_DEST:
                return to == State::DIFFING ||
                       to == State::ABORTED;

            case State::DIFFING:
                return to == State::TRANSFERRING;

            case State::TRANSFERRING:
                return to == State::SUMMARIZING;

            case State::SUMMARIZING:
                return to == State::DONE;

            case State::DONE:
            case State::ABORTED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::INITIAL:         return "INITIAL";
            case State::SCANNING_SOURCE: return "SCANNING_SOURCE";
            case State::SCANNING_DEST:   return "SCANNING_DEST";
            case State::DIFFING:         return "DIFFING";
            case State::TRANSFERRING:    return "TRANSFERRING";
            case State::SUMMARIZING:     return "SUMMARIZING";
            case State::DONE:            return "DONE";
            case State::ABORTED:         return "ABORTED";
            default:                     return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

inline std::ostream& operator<<(std::ostream& os, const SyncState::State& state) {
    os << SyncState::state_to_string(state);
    return os;
}

} // namespace sync
} // namespace bsync

#endif // BSYNC_SYNC_STATE_HPP
