#include <catch2/catch_test_macros.hpp>
#include <svcreg.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

// ---------------------------------------------------------------
// Test helpers
// ---------------------------------------------------------------

namespace {

/// Blocks each arriving thread until `expected` threads have arrived or the
/// timeout passes.  Returns false on timeout instead of hanging the test.
class rendezvous {
public:
    explicit rendezvous(int expected) : expected_(expected) {}

    bool arrive_and_wait(std::chrono::milliseconds timeout = 5s) {
        std::unique_lock lock(mutex_);
        ++arrived_;
        cv_.notify_all();
        return cv_.wait_for(lock, timeout, [this] { return arrived_ >= expected_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int arrived_ = 0;
    int expected_;
};

struct slow_value {
    int v;
};

struct slow_provider {
    std::atomic<int> calls{0};

    std::shared_ptr<slow_value> create_slow() {
        ++calls;
        // Widen the race window.
        std::this_thread::sleep_for(5ms);
        return std::make_shared<slow_value>(slow_value{42});
    }
};

struct failing_provider {
    std::atomic<int> calls{0};

    std::shared_ptr<slow_value> create_slow() {
        ++calls;
        std::this_thread::sleep_for(5ms);
        throw std::runtime_error("cannot create");
    }
};

struct left_value {
    bool met;
};

struct right_value {
    bool met;
};

struct parallel_provider {
    rendezvous meeting{2};

    std::shared_ptr<left_value> create_left() {
        return std::make_shared<left_value>(left_value{meeting.arrive_and_wait()});
    }

    std::shared_ptr<right_value> create_right() {
        return std::make_shared<right_value>(right_value{meeting.arrive_and_wait()});
    }
};

// a needs b and b needs a, each behind a gate that both threads must pass
// first, so each thread holds one half of the cycle when it asks for the other.
struct gate_a {};
struct gate_b {};
struct a {};
struct b {};

struct cross_thread_cycle_provider {
    rendezvous gates{2};

    std::shared_ptr<gate_a> create_gate_a() {
        gates.arrive_and_wait();
        return std::make_shared<gate_a>();
    }

    std::shared_ptr<gate_b> create_gate_b() {
        gates.arrive_and_wait();
        return std::make_shared<gate_b>();
    }

    std::shared_ptr<a> create_a(const gate_a&, const b&) { return std::make_shared<a>(); }
    std::shared_ptr<b> create_b(const gate_b&, const a&) { return std::make_shared<b>(); }
};

struct blocking_provider {
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;

    std::shared_ptr<slow_value> create_slow() {
        std::unique_lock lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [this] { return released; });
        return std::make_shared<slow_value>(slow_value{1});
    }

    void wait_until_entered() {
        std::unique_lock lock(mutex);
        cv.wait(lock, [this] { return entered; });
    }

    void release() {
        std::lock_guard lock(mutex);
        released = true;
        cv.notify_all();
    }
};

/// Binds a method that blocks and then reads a member of the subclass.
struct registry_with_blocking_method : svcreg::default_service_registry {
    registry_with_blocking_method() {
        add_own_methods(this, SVCREG_METHOD(registry_with_blocking_method, create_label));
    }

    ~registry_with_blocking_method() override { close_on_destruction(); }

    std::shared_ptr<std::string> create_label() {
        std::unique_lock lock(mutex);
        entered = true;
        cv.notify_all();
        cv.wait(lock, [this] { return released; });
        return std::make_shared<std::string>(label);
    }

    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;
    std::string label = "still alive";
};

} // namespace

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("provider method runs once under contention", "[concurrency]") {
    svcreg::default_service_registry reg;
    auto provider = std::make_shared<slow_provider>();
    reg.add_provider(provider, SVCREG_METHOD(slow_provider, create_slow));

    constexpr std::size_t N = 32;
    std::vector<std::shared_ptr<slow_value>> results(N);
    {
        std::vector<std::jthread> threads;
        for (std::size_t i = 0; i < N; ++i) {
            threads.emplace_back([&, i] { results[i] = reg.get<slow_value>(); });
        }
    }

    REQUIRE(provider->calls == 1);
    for (std::size_t i = 1; i < N; ++i) {
        REQUIRE(results[i].get() == results[0].get());
    }
}

TEST_CASE("failing provider method runs once and every caller sees the failure", "[concurrency]") {
    svcreg::default_service_registry reg;
    auto provider = std::make_shared<failing_provider>();
    reg.add_provider(provider, SVCREG_METHOD(failing_provider, create_slow));

    constexpr int N = 16;
    std::atomic<int> failures{0};
    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < N; ++i) {
            threads.emplace_back([&] {
                try {
                    reg.get<slow_value>();
                } catch (const svcreg::creation_failed&) {
                    ++failures;
                }
            });
        }
    }

    REQUIRE(provider->calls == 1);
    REQUIRE(failures == N);
}

TEST_CASE("independent services are created in parallel", "[concurrency]") {
    svcreg::default_service_registry reg;
    reg.add_provider(std::make_shared<parallel_provider>(),
                     SVCREG_METHOD(parallel_provider, create_left),
                     SVCREG_METHOD(parallel_provider, create_right));

    std::shared_ptr<left_value> left;
    std::shared_ptr<right_value> right;
    {
        std::jthread t1([&] { left = reg.get<left_value>(); });
        std::jthread t2([&] { right = reg.get<right_value>(); });
    }

    // Each method only sees the other arrive if neither blocks the other.
    REQUIRE(left->met);
    REQUIRE(right->met);
}

TEST_CASE("cycle spanning two threads fails in both", "[concurrency]") {
    svcreg::default_service_registry reg;
    reg.add_provider(std::make_shared<cross_thread_cycle_provider>(),
                     SVCREG_METHOD(cross_thread_cycle_provider, create_gate_a),
                     SVCREG_METHOD(cross_thread_cycle_provider, create_gate_b),
                     SVCREG_METHOD(cross_thread_cycle_provider, create_a),
                     SVCREG_METHOD(cross_thread_cycle_provider, create_b));

    std::atomic<int> cycles{0};
    {
        std::jthread t1([&] {
            try {
                reg.get<a>();
            } catch (const svcreg::cyclic_dependency&) {
                ++cycles;
            }
        });
        std::jthread t2([&] {
            try {
                reg.get<b>();
            } catch (const svcreg::cyclic_dependency&) {
                ++cycles;
            }
        });
    }

    REQUIRE(cycles == 2);
}

TEST_CASE("close waits for an in-flight lookup", "[concurrency][lifecycle]") {
    svcreg::default_service_registry reg;
    auto provider = std::make_shared<blocking_provider>();
    reg.add_provider(provider, SVCREG_METHOD(blocking_provider, create_slow));

    std::shared_ptr<slow_value> value;
    std::atomic<bool> closed{false};

    std::jthread lookup([&] { value = reg.get<slow_value>(); });
    provider->wait_until_entered();

    std::jthread closer([&] {
        reg.close();
        closed = true;
    });

    std::this_thread::sleep_for(20ms);
    REQUIRE_FALSE(closed);

    provider->release();
    lookup.join();
    closer.join();

    REQUIRE(closed);
    REQUIRE(value->v == 1);
    REQUIRE(reg.is_closed());
}

TEST_CASE("concurrent lookups and registrations", "[concurrency]") {
    struct counter {
        int v;
    };

    svcreg::default_service_registry reg;
    reg.add(std::make_shared<slow_value>(slow_value{7}));

    constexpr int N = 8;
    std::atomic<int> ok{0};
    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < N; ++i) {
            threads.emplace_back([&, i] {
                reg.add(std::make_shared<counter>(counter{i}));
                if (reg.get<slow_value>()->v == 7) ++ok;
            });
        }
    }

    REQUIRE(ok == N);
    REQUIRE(reg.get_all<counter>().size() == N);
}

TEST_CASE("subclass destructor waits for its own method to finish", "[concurrency][lifecycle]") {
    auto reg = std::make_unique<registry_with_blocking_method>();
    auto* raw = reg.get();

    std::shared_ptr<std::string> label;
    std::atomic<bool> destroyed{false};

    std::jthread lookup([&] { label = raw->get<std::string>(); });
    {
        std::unique_lock lock(raw->mutex);
        raw->cv.wait(lock, [raw] { return raw->entered; });
    }

    std::jthread destroyer([&] {
        reg.reset();
        destroyed = true;
    });

    std::this_thread::sleep_for(20ms);
    REQUIRE_FALSE(destroyed);

    {
        // Notify under the lock: the registry may be gone once it is released.
        std::lock_guard lock(raw->mutex);
        raw->released = true;
        raw->cv.notify_all();
    }
    lookup.join();
    destroyer.join();

    REQUIRE(destroyed);
    REQUIRE(*label == "still alive");
}
