#include <pipeline/bounded_queue.hpp>
#include <pipeline/cadence_gate.hpp>

#include "test_support.hpp"

#include <chrono>
#include <thread>

using sc_test::check;

namespace {
    void test_drop_oldest_on_overflow() {
        sc::BoundedQueue<int> q(3);
        for (int i = 0; i < 5; ++i) {
            check(q.push_drop_oldest(i), "push into a running queue should be accepted");
            check(q.size() <= q.capacity(), "queue length should never exceed its bound");
        }
        check(q.size() == 3, "queue should hold exactly capacity elements");
        check(q.dropped() == 2, "two evictions should be counted");

        int v = -1;
        const std::chrono::milliseconds none{0};
        check(q.pop_for(v, none) && v == 2, "oldest surviving element should be 2");
        check(q.pop_for(v, none) && v == 3, "then 3");
        check(q.pop_for(v, none) && v == 4, "then 4");
        check(!q.pop_for(v, none), "queue should now be empty");
    }

    void test_stop_and_reset() {
        sc::BoundedQueue<int> q(2);
        q.push_drop_oldest(1);
        q.stop();
        check(!q.push_drop_oldest(2), "stopped queue should reject pushes");

        int v = 0;
        check(!q.pop_for(v, std::chrono::milliseconds(10)), "pop_for should fail once stopped");

        q.reset();
        check(q.size() == 0, "reset should empty the queue");
        check(q.push_drop_oldest(3), "reset queue should accept pushes again");
        check(q.pop_for(v, std::chrono::milliseconds(10)) && v == 3, "reset queue should deliver again");
    }

    void test_pop_for_wakes_on_push() {
        sc::BoundedQueue<int> q(1);
        std::thread producer([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            q.push_drop_oldest(7);
        });
        int v = 0;
        const bool got = q.pop_for(v, std::chrono::milliseconds(1000));
        producer.join();
        check(got && v == 7, "pop_for should wake on push");
    }

    void test_pop_for_wakes_on_stop() {
        sc::BoundedQueue<int> q(1);
        const auto t0 = std::chrono::steady_clock::now();
        std::thread stopper([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            q.stop();
        });
        int v = 0;
        const bool got = q.pop_for(v, std::chrono::milliseconds(2000));
        stopper.join();
        const auto waited = std::chrono::steady_clock::now() - t0;
        check(!got, "pop_for should return false on stop");
        check(waited < std::chrono::milliseconds(1000), "stop should interrupt the bounded wait");
    }

    void test_cadence_gate() {
        sc_test::ManualClock clock;
        sc::CadenceGate gate(1.0);

        check(gate.admit(clock.now()), "first event should always be admitted");
        clock.advance(0.5);
        check(!gate.admit(clock.now()), "event inside the period should be rejected");
        clock.advance(0.48);
        check(gate.admit(clock.now()), "event within jitter slack of the period should be admitted");
        clock.advance(0.2);
        check(!gate.admit(clock.now()), "period should be measured from the last admitted event");
        check(gate.seconds_until_next(clock.now()) > 0.7, "time until next admission should be reported");

        gate.set_period(0.1);
        check(gate.admit(clock.now()), "shorter period should take effect immediately");

        gate.reset();
        check(gate.admit(clock.now()), "reset gate should admit immediately");
    }
}

int main() {
    test_drop_oldest_on_overflow();
    test_stop_and_reset();
    test_pop_for_wakes_on_push();
    test_pop_for_wakes_on_stop();
    test_cadence_gate();

    return sc_test::finish("bounded queue");
}
