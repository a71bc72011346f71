#pragma once

#include "util/timestamp.hpp"

#include <chrono>
#include <memory>
#include <mutex>

namespace mv::test {

// Manually advanced clock shared between the components under test
class FixedClock {
public:
    explicit FixedClock(const util::Timestamp start = util::Timestamp{std::chrono::seconds(1714564800)})
        : state_(std::make_shared<State>(start)) {}

    util::Clock fn() const {
        return [state = state_] {
            std::scoped_lock lock(state->mtx);
            return state->now;
        };
    }

    void advance(const std::chrono::microseconds d) const {
        std::scoped_lock lock(state_->mtx);
        state_->now += d;
    }

    util::Timestamp now() const {
        std::scoped_lock lock(state_->mtx);
        return state_->now;
    }

private:
    struct State {
        explicit State(const util::Timestamp t) : now(t) {}
        std::mutex mtx;
        util::Timestamp now;
    };

    std::shared_ptr<State> state_;
};

}
