#include "../framework/RecordingSurface.hpp"
#include "../framework/SimpleTest.hpp"
#include "runtime/Channel.hpp"
#include "runtime/Orchestrator.hpp"
#include "runtime/Scheduler.hpp"
#include "runtime/StreamMap.hpp"
#include "runtime/WorkerPool.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace lazybar;
using namespace lazybar::runtime;
using lazybar::test::RecordingSurface;

namespace {

// Yields the given values in order, then finishes.
class ListStream : public Stream<int> {
public:
    explicit ListStream(std::vector<int> values) : values_(std::move(values)) {}

    Poll<int> poll_next(const Waker&) override {
        if (pos_ >= values_.size()) return Poll<int>::done();
        return Poll<int>::ready(values_[pos_++]);
    }

private:
    std::vector<int> values_;
    size_t pos_ = 0;
};

class IdleStream : public Stream<int> {
public:
    Poll<int> poll_next(const Waker&) override { return Poll<int>::pending(); }
};

class OneUpdateStream : public Stream<bar::PanelUpdate> {
public:
    explicit OneUpdateStream(int width) : width_(width) {}

    Poll<bar::PanelUpdate> poll_next(const Waker&) override {
        if (sent_) return Poll<bar::PanelUpdate>::done();
        sent_ = true;
        bar::PanelDrawInfo info;
        info.width = width_;
        return Poll<bar::PanelUpdate>::ready(bar::PanelUpdate::ok(info));
    }

private:
    int width_;
    bool sent_ = false;
};

struct FinishLog {
    void add(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex);
        names.push_back(name);
    }

    std::mutex mutex;
    std::vector<std::string> names;
};

class FakeConfig : public panels::PanelConfig {
public:
    FakeConfig(std::string name, int width, bool fail = false, bool visible = true)
        : name_(std::move(name)), width_(width), fail_(fail), visible_(visible),
          delay_(std::chrono::milliseconds(width % 7)) {}

    // Setup sleeps for delay, then appends its name to finished
    FakeConfig(std::string name, int width, std::chrono::milliseconds delay, std::shared_ptr<FinishLog> finished)
        : name_(std::move(name)), width_(width), fail_(false), visible_(true), delay_(delay),
          finished_(std::move(finished)) {}

    std::pair<std::string, bool> props() const override { return {name_, visible_}; }

    panels::PanelRun run(draw::Surface&, const draw::Attrs&, int, Scheduler&) override {
        if (fail_) throw std::runtime_error("sensor missing");
        std::this_thread::sleep_for(delay_);
        if (finished_) finished_->add(name_);
        panels::PanelRun run;
        run.stream = std::make_unique<OneUpdateStream>(width_);
        run.events = bar::EventChannel{};
        return run;
    }

private:
    std::string name_;
    int width_;
    bool fail_;
    bool visible_;
    std::chrono::milliseconds delay_;
    std::shared_ptr<FinishLog> finished_;
};

const Waker NO_WAKER = []() {};

}  // namespace

TEST_CASE(test_channel_delivers_in_order_and_finishes_after_close) {
    auto channel = Channel<int>::create();
    ASSERT_TRUE(channel->send(1));
    ASSERT_TRUE(channel->send(2));
    ASSERT_EQ(channel->size(), 2u);

    ChannelStream<int> stream(channel);
    auto first = stream.poll_next(NO_WAKER);
    ASSERT_TRUE(first.is_ready());
    ASSERT_EQ(first.take(), 1);
    ASSERT_EQ(stream.poll_next(NO_WAKER).take(), 2);
    ASSERT_TRUE(stream.poll_next(NO_WAKER).is_pending());

    channel->close();
    ASSERT_TRUE(stream.poll_next(NO_WAKER).is_done());
    ASSERT_FALSE(channel->send(3));
}

TEST_CASE(test_channel_wakes_pending_consumer_from_other_thread) {
    auto channel = Channel<std::string>::create();
    std::atomic<int> wakes{0};

    ASSERT_TRUE(channel->poll_next([&wakes]() { wakes++; }).is_pending());

    std::thread producer([channel]() { channel->send("tick"); });
    producer.join();

    ASSERT_EQ(wakes.load(), 1);
    auto poll = channel->poll_next(NO_WAKER);
    ASSERT_TRUE(poll.is_ready());
    ASSERT_EQ(poll.take(), std::string("tick"));
}

TEST_CASE(test_channel_receive_times_out_empty) {
    auto channel = Channel<int>::create();
    auto value = channel->receive(std::chrono::milliseconds(10));
    ASSERT_FALSE(value.has_value());
}

TEST_CASE(test_stream_map_round_robins_between_sources) {
    StreamMap<char, int> map;
    map.insert('a', std::make_unique<ListStream>(std::vector<int>{1, 2, 3}));
    map.insert('b', std::make_unique<ListStream>(std::vector<int>{10, 20, 30}));

    std::string keys;
    std::vector<int> values;
    while (true) {
        auto poll = map.poll_next(NO_WAKER);
        if (!poll.is_ready()) {
            ASSERT_TRUE(poll.is_done());
            break;
        }
        auto item = poll.take();
        keys.push_back(item.first);
        values.push_back(item.second);
    }

    ASSERT_EQ(keys, std::string("ababab"));
    ASSERT_TRUE(values == (std::vector<int>{1, 10, 2, 20, 3, 30}));
    ASSERT_TRUE(map.empty());
}

TEST_CASE(test_stream_map_drops_finished_and_stays_pending) {
    StreamMap<int, int> map;
    map.insert(0, std::make_unique<ListStream>(std::vector<int>{7}));
    map.insert(1, std::make_unique<IdleStream>());

    auto poll = map.poll_next(NO_WAKER);
    ASSERT_TRUE(poll.is_ready());
    ASSERT_EQ(poll.take().second, 7);

    ASSERT_TRUE(map.poll_next(NO_WAKER).is_pending());
    ASSERT_EQ(map.size(), 1u);
    ASSERT_FALSE(map.contains(0));
    ASSERT_TRUE(map.contains(1));
}

TEST_CASE(test_scheduler_fires_only_due_wakers) {
    Scheduler scheduler;
    int fired = 0;
    auto now = Scheduler::Clock::now();
    scheduler.wake_at(now - std::chrono::milliseconds(1), [&fired]() { fired++; });
    scheduler.wake_at(now + std::chrono::hours(1), [&fired]() { fired += 100; });

    ASSERT_EQ(scheduler.process(), 1u);
    ASSERT_EQ(fired, 1);
    ASSERT_EQ(scheduler.pending(), 1u);

    auto wait = scheduler.time_until_next();
    ASSERT_TRUE(wait.has_value());
    ASSERT_TRUE(*wait > std::chrono::minutes(59));
}

TEST_CASE(test_scheduler_without_timers_has_no_deadline) {
    Scheduler scheduler;
    ASSERT_FALSE(scheduler.time_until_next().has_value());
    ASSERT_EQ(scheduler.process(), 0u);
}

TEST_CASE(test_interval_ticks_immediately_then_after_period) {
    Scheduler scheduler;
    IntervalStream interval(scheduler, std::chrono::milliseconds(20));
    int woken = 0;
    Waker waker = [&woken]() { woken++; };

    ASSERT_TRUE(interval.poll_next(waker).is_ready());
    ASSERT_TRUE(interval.poll_next(waker).is_pending());
    ASSERT_TRUE(interval.poll_next(waker).is_pending());
    ASSERT_EQ(scheduler.pending(), 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    ASSERT_EQ(scheduler.process(), 1u);
    ASSERT_EQ(woken, 1);
    ASSERT_TRUE(interval.poll_next(waker).is_ready());
}

TEST_CASE(test_orchestrator_keeps_order_and_skips_failures) {
    RecordingSurface surface(200, 20);
    Scheduler scheduler;
    Orchestrator orchestrator(surface, draw::Attrs{}, 20, scheduler);

    orchestrator.add(bar::Alignment::Left, std::make_unique<FakeConfig>("first", 13));
    orchestrator.add(bar::Alignment::Left, std::make_unique<FakeConfig>("broken", 0, true));
    orchestrator.add(bar::Alignment::Left, std::make_unique<FakeConfig>("third", 31, false, false));
    orchestrator.add(bar::Alignment::Right, std::make_unique<FakeConfig>("clock", 40));
    ASSERT_EQ(orchestrator.size(), 4u);

    auto result = orchestrator.start();
    ASSERT_EQ(result.failed, 1u);
    ASSERT_EQ(result.left.size(), 2u);
    ASSERT_EQ(result.left[0].name, std::string("first"));
    ASSERT_EQ(result.left[1].name, std::string("third"));
    ASSERT_FALSE(result.left[1].visible);
    ASSERT_TRUE(result.center.empty());
    ASSERT_EQ(result.right.size(), 1u);

    // Center had no panels, so only two groups are polled
    ASSERT_EQ(result.streams->size(), 2u);

    std::vector<std::pair<bar::Alignment, size_t>> seen;
    int third_width = 0;
    while (true) {
        auto poll = result.streams->poll_next(NO_WAKER);
        if (poll.is_done()) break;
        ASSERT_TRUE(poll.is_ready());
        auto item = poll.take();
        seen.emplace_back(item.first, item.second.first);
        ASSERT_TRUE(item.second.second.is_valid);
        if (item.first == bar::Alignment::Left && item.second.first == 1) {
            third_width = item.second.second.info->width;
        }
    }
    ASSERT_EQ(seen.size(), 3u);
    ASSERT_EQ(third_width, 31);

    ASSERT_THROWS(orchestrator.start(), std::logic_error);
}

TEST_CASE(test_orchestrator_keeps_configured_order_when_setups_finish_reversed) {
    RecordingSurface surface(200, 20);
    Scheduler scheduler;
    Orchestrator orchestrator(surface, draw::Attrs{}, 20, scheduler);
    auto finished = std::make_shared<FinishLog>();

    using std::chrono::milliseconds;
    orchestrator.add(bar::Alignment::Left, std::make_unique<FakeConfig>("slow", 10, milliseconds(60), finished));
    orchestrator.add(bar::Alignment::Left, std::make_unique<FakeConfig>("medium", 20, milliseconds(30), finished));
    orchestrator.add(bar::Alignment::Left, std::make_unique<FakeConfig>("fast", 30, milliseconds(0), finished));

    auto result = orchestrator.start();
    ASSERT_EQ(result.failed, 0u);
    ASSERT_EQ(finished->names.size(), 3u);
    // With one setup per worker they really complete back to front
    if (WorkerPool::instance().get_thread_count() >= 3) {
        ASSERT_EQ(finished->names[0], std::string("fast"));
        ASSERT_EQ(finished->names[2], std::string("slow"));
    }

    ASSERT_EQ(result.left.size(), 3u);
    ASSERT_EQ(result.left[0].name, std::string("slow"));
    ASSERT_EQ(result.left[1].name, std::string("medium"));
    ASSERT_EQ(result.left[2].name, std::string("fast"));

    // Each stream is keyed by the position of its panel
    size_t updates = 0;
    while (true) {
        auto poll = result.streams->poll_next(NO_WAKER);
        if (poll.is_done()) break;
        ASSERT_TRUE(poll.is_ready());
        auto item = poll.take();
        ASSERT_TRUE(item.first == bar::Alignment::Left);
        ASSERT_EQ(item.second.second.info->width, static_cast<int>((item.second.first + 1) * 10));
        ++updates;
    }
    ASSERT_EQ(updates, 3u);
}

TEST_CASE(test_worker_pool_stop_gives_up_on_blocked_job) {
    WorkerPool pool(1);
    ASSERT_EQ(pool.get_thread_count(), 1u);

    std::promise<void> started;
    auto started_future = started.get_future();
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> queued_ran{false};

    WorkerPool::Job blocking = [&started, released]() {
        started.set_value();
        released.wait();
    };
    ASSERT_TRUE(pool.submit_job(std::move(blocking)));
    ASSERT_TRUE(started_future.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    ASSERT_TRUE(pool.submit_job([&queued_ran]() { queued_ran = true; }));
    ASSERT_EQ(pool.get_queue_size(), 1u);
    ASSERT_EQ(pool.get_running_jobs(), 1u);

    auto begin = std::chrono::steady_clock::now();
    ASSERT_FALSE(pool.stop(std::chrono::milliseconds(100)));
    ASSERT_TRUE(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));
    ASSERT_EQ(pool.get_queue_size(), 0u);
    ASSERT_FALSE(pool.submit_job([]() {}));

    release.set_value();
    ASSERT_TRUE(pool.stop(std::chrono::seconds(2)));
    ASSERT_EQ(pool.get_running_jobs(), 0u);
    ASSERT_FALSE(queued_ran.load());
}

TEST_CASE(test_panel_error_message_names_group_and_index) {
    ASSERT_EQ(format_panel_error(bar::Alignment::Right, 2, "boom"),
              std::string("Error produced by right panel at index 2: boom"));
}

int main() {
    return lazybar::test::TestRunner::instance().run_all();
}
