#include "ActionRecorder.hpp"
#include "FakeDevices.hpp"
#include "Utils.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace companion;
using namespace companion::testing;

int main() {
    std::cout << "=== ActionRecorder Test ===" << std::endl;
    Config config = fast_config();

    // Test 1: Actions shorter than the floor are dropped
    {
        ActionRecorder recorder(config);
        recorder.record(ActionKind::MOVE, Direction::FORWARD, 0.01);
        recorder.record(ActionKind::ROTATE, Direction::LEFT, 0.049);
        assert_true(!recorder.has_actions(), "sub-0.05s recorded actions are discarded");

        recorder.start_action(ActionKind::MOVE, Direction::FORWARD);
        recorder.stop_action();
        assert_true(recorder.get_action_count() == 0, "instant start/stop is discarded");

        recorder.record(ActionKind::MOVE, Direction::FORWARD, 0.05);
        assert_true(recorder.get_action_count() == 1, "0.05s action is kept");
    }

    // Test 2: start_action finalizes the in-flight action
    {
        ActionRecorder recorder(config);
        recorder.start_action(ActionKind::ROTATE, Direction::LEFT);
        assert_true(recorder.get_current_action().has_value(), "current action is visible while in flight");
        utils::sleep_seconds(0.07);
        recorder.start_action(ActionKind::MOVE, Direction::FORWARD);
        assert_true(recorder.get_action_count() == 1, "overwriting start_action flushes the previous action");

        auto history = recorder.history();
        assert_true(history[0].kind == ActionKind::ROTATE && history[0].direction == Direction::LEFT,
                    "flushed action keeps kind and direction");
        assert_true(history[0].duration >= 0.07, "flushed duration covers the elapsed time");

        utils::sleep_seconds(0.06);
        recorder.stop_action();
        assert_true(recorder.get_action_count() == 2, "stop_action appends the second action");
        assert_true(!recorder.get_current_action().has_value(), "no action in flight after stop");
    }

    // Test 3: Reverse direction mapping
    {
        assert_true(ActionRecorder::get_reverse_direction(Direction::LEFT) == Direction::RIGHT, "left -> right");
        assert_true(ActionRecorder::get_reverse_direction(Direction::RIGHT) == Direction::LEFT, "right -> left");
        assert_true(ActionRecorder::get_reverse_direction(Direction::FORWARD) == Direction::BACKWARD, "forward -> backward");
        assert_true(ActionRecorder::get_reverse_direction(Direction::BACKWARD) == Direction::FORWARD, "backward -> forward");
        assert_true(ActionRecorder::get_reverse_direction(Direction::NONE) == Direction::NONE, "none -> none");
    }

    // Test 4: Replay is newest first with reversed directions, then history clears
    {
        ActionRecorder recorder(config);
        recorder.record(ActionKind::ROTATE, Direction::LEFT, 0.06);
        recorder.record(ActionKind::MOVE, Direction::FORWARD, 0.06);
        recorder.record(ActionKind::ROTATE, Direction::RIGHT, 0.05);

        assert_true(!recorder.get_next_return_action().has_value(), "no return action before start_returning");
        assert_true(recorder.start_returning(), "start_returning succeeds with history");
        assert_true(recorder.is_returning(), "is_returning set");

        recorder.record(ActionKind::MOVE, Direction::BACKWARD, 1.0);
        assert_true(recorder.get_action_count() == 3, "history is frozen while returning");

        FakeMotor motor;
        std::vector<Direction> replayed;
        bool done = false;
        int calls = 0;
        while (!done && calls < 10) {
            auto next = recorder.get_next_return_action();
            if (next) replayed.push_back(next->direction);
            done = recorder.execute_return_action(&motor);
            ++calls;
        }

        assert_true(calls == 3, "three actions replay in three calls");
        assert_true(replayed.size() == 3 &&
                    replayed[0] == Direction::LEFT &&
                    replayed[1] == Direction::BACKWARD &&
                    replayed[2] == Direction::RIGHT,
                    "replay order is newest first, reversed");
        assert_true(!recorder.has_actions(), "history empty after return");
        assert_true(!recorder.is_returning(), "is_returning cleared after return");
        assert_true(motor.count("left") >= 1 && motor.count("right") >= 1 && motor.count("backward") == 1,
                    "motor received reversed commands");
    }

    // Test 5: Rotation replays as step pulses with a remainder pulse
    {
        ActionRecorder recorder(config);
        recorder.record(ActionKind::ROTATE, Direction::LEFT, 0.055);  // 2 x 0.02 + 0.015
        recorder.start_returning();
        FakeMotor motor;
        recorder.execute_return_action(&motor);
        assert_true(motor.count("right") == 3, "0.055s rotation replays as 2 full pulses plus a remainder");
        assert_true(motor.count("stop") == 3, "each pulse is stopped");
    }

    // Test 6: Obstacles pause a replayed move, bounded by the max wait
    {
        ActionRecorder recorder(config);
        recorder.record(ActionKind::MOVE, Direction::FORWARD, 0.1);
        recorder.start_returning();

        FakeMotor motor;
        int polls = 0;
        auto start = Clock::now();
        bool done = recorder.execute_return_action(&motor, [&]() {
            ++polls;
            return true;
        });
        double elapsed = utils::seconds_since(start);
        assert_true(done, "blocked move still completes the return");
        assert_true(motor.count("backward") == 0, "motor never drives while blocked");
        assert_true(polls >= 3, "obstacle callback polled repeatedly");
        assert_true(elapsed >= 0.3 && elapsed < 2.0, "wait bounded by return_obstacle_max_wait");
    }

    // Test 7: Without a motor the replay is a plain sleep
    {
        ActionRecorder recorder(config);
        recorder.record(ActionKind::MOVE, Direction::FORWARD, 0.06);
        recorder.start_returning();
        auto start = Clock::now();
        bool done = recorder.execute_return_action(nullptr);
        assert_true(done, "motorless return completes");
        assert_true(utils::seconds_since(start) >= 0.06, "motorless replay sleeps for the duration");
    }

    // Test 8: Empty history, pending flush and cancel
    {
        ActionRecorder recorder(config);
        assert_true(!recorder.start_returning(), "start_returning fails with empty history");

        recorder.start_action(ActionKind::MOVE, Direction::FORWARD);
        utils::sleep_seconds(0.06);
        assert_true(recorder.start_returning(), "start_returning flushes the in-flight action");
        assert_true(recorder.get_action_count() == 1, "flushed action counted");

        recorder.cancel_returning();
        assert_true(!recorder.is_returning() && !recorder.has_actions(), "cancel clears return and history");
    }

    // Test 9: Movers on other threads cannot grow a frozen history
    {
        ActionRecorder recorder(config);
        std::atomic<bool> stop{false};
        std::vector<std::thread> movers;
        for (int t = 0; t < 8; ++t) {
            movers.emplace_back([&recorder, &stop, t]() {
                while (!stop) {
                    if (t % 2 == 0) {
                        recorder.record(ActionKind::ROTATE, Direction::LEFT, 0.06);
                    } else {
                        recorder.start_action(ActionKind::MOVE, Direction::FORWARD);
                        recorder.stop_action();
                    }
                    utils::sleep_seconds(0.0001);
                }
            });
        }

        int violations = 0;
        int cycles = 0;
        for (int i = 0; i < 200; ++i) {
            if (!recorder.start_returning()) continue;
            ++cycles;
            const int frozen = recorder.get_action_count();
            std::this_thread::yield();
            utils::sleep_seconds(0.0005);
            if (recorder.get_action_count() != frozen || recorder.get_current_action().has_value()) {
                ++violations;
            }
            recorder.cancel_returning();
        }
        stop = true;
        for (auto& mover : movers) mover.join();

        assert_true(cycles > 0, "returns started while movers were recording");
        assert_true(violations == 0, "history frozen for every return");
    }

    return report("ActionRecorder");
}
