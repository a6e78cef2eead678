#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "core/errors.h"
#include "locker/nil_locker.h"
#include "scheduler/cron_job.h"
#include "scheduler/schedule.h"
#include "scheduler/timer_service.h"

using namespace std::chrono;
using namespace dcron;
using namespace dcron::scheduler;

// 收集 ErrorHandler 上报的错误
struct ErrorSink {
    std::mutex mu;
    std::vector<std::string> kinds;
    std::vector<std::string> messages;

    ErrorHandler handler() {
        return [this](const Error& e) {
            std::lock_guard<std::mutex> lk(mu);
            if (dynamic_cast<const TaskError*>(&e)) kinds.push_back("task");
            else if (dynamic_cast<const LockBackendError*>(&e)) kinds.push_back("lock");
            else if (dynamic_cast<const ScheduleExhaustedError*>(&e)) kinds.push_back("exhausted");
            else kinds.push_back("other");
            messages.push_back(e.what());
        };
    }

    std::size_t count(const std::string& kind) {
        std::lock_guard<std::mutex> lk(mu);
        std::size_t n = 0;
        for (const auto& k : kinds) n += (k == kind);
        return n;
    }
};

class FailingLocker : public locker::Locker {
public:
    bool lock(const std::string& job, milliseconds) override {
        ++calls;
        throw LockBackendError("backend down while locking " + job);
    }
    std::string name() const override { return "failing"; }
    std::atomic<int> calls{0};
};

class DenyLocker : public locker::Locker {
public:
    bool lock(const std::string&, milliseconds) override { return false; }
    std::string name() const override { return "deny"; }
};

// stop 之后最多还有一次已经过了检查的执行，等它跑完再看结果
static void settle(const std::shared_ptr<CronJob>& job) {
    const bool idle = job->waitIdle(steady_clock::now() + seconds(5));
    assert(idle);
}

static std::shared_ptr<CronJob> makeJob(const std::string& name, Task task,
                                        locker::LockerPtr l = std::make_shared<locker::NilLocker>(),
                                        ErrorHandler onError = nullptr,
                                        std::shared_ptr<const Schedule> s = every(seconds(1))) {
    return std::make_shared<CronJob>(name, "@every 1s", std::move(s), std::move(task),
                                     std::move(l), milliseconds(500), std::move(onError));
}

static void test_fires_on_schedule() {
    std::mutex mu;
    std::vector<system_clock::time_point> hits;
    auto job = makeJob("tick", [&] {
        std::lock_guard<std::mutex> lk(mu);
        hits.push_back(system_clock::now());
    });

    const auto t0 = system_clock::now();
    job->start(t0);
    std::this_thread::sleep_for(milliseconds(3500));
    job->stop();
    settle(job);

    std::lock_guard<std::mutex> lk(mu);
    assert(hits.size() >= 3 && hits.size() <= 4);
    const auto base = floor<seconds>(t0);
    for (std::size_t i = 0; i < 3; ++i) {
        const auto expected = base + seconds(i + 1);
        const auto diff = hits[i] - expected;
        assert(diff > -seconds(1) && diff < seconds(1));
    }
    assert(job->executed() == hits.size());
    std::cout << "[OK] job fires once per second (" << hits.size() << " runs)\n";
}

static void test_stop_before_first_fire() {
    std::atomic<int> runs{0};
    auto job = makeJob("never", [&] { ++runs; });
    job->start(system_clock::now());
    job->stop();
    assert(job->stopped());

    std::this_thread::sleep_for(milliseconds(2200));
    assert(runs == 0);
    assert(job->fired() == 0);
    std::cout << "[OK] stop before first fire -> zero runs\n";
}

static void test_stop_race() {
    std::atomic<int> runs{0};
    auto job = makeJob("race", [&] { ++runs; });
    const auto t0 = system_clock::now();
    job->start(t0);

    // 在第一次到点附近调用 stop
    std::this_thread::sleep_until(floor<seconds>(t0) + seconds(1));
    job->stop();
    const int atStop = runs.load();

    std::this_thread::sleep_for(milliseconds(2500));
    settle(job);
    assert(runs - atStop <= 1);
    assert(runs <= 1);
    std::cout << "[OK] stop racing a fire -> at most one more run\n";
}

static void test_task_error_is_contained() {
    ErrorSink sink;
    std::atomic<int> runs{0};
    auto job = makeJob("boom", [&] {
        ++runs;
        throw std::runtime_error("disk full");
    }, std::make_shared<locker::NilLocker>(), sink.handler());

    job->start(system_clock::now());
    std::this_thread::sleep_for(milliseconds(2600));
    job->stop();
    settle(job);

    assert(runs >= 2);
    assert(sink.count("task") == static_cast<std::size_t>(runs.load()));
    {
        std::lock_guard<std::mutex> lk(sink.mu);
        assert(sink.messages[0] == "job boom: disk full");
    }
    std::cout << "[OK] throwing task reported as TaskError, schedule continues\n";
}

static void test_lock_backend_error() {
    ErrorSink sink;
    auto failing = std::make_shared<FailingLocker>();
    std::atomic<int> runs{0};
    auto job = makeJob("locked-out", [&] { ++runs; }, failing, sink.handler());

    job->start(system_clock::now());
    std::this_thread::sleep_for(milliseconds(2600));
    job->stop();
    settle(job);

    assert(runs == 0);
    assert(failing->calls >= 2);
    assert(sink.count("lock") == static_cast<std::size_t>(failing->calls.load()));
    std::cout << "[OK] lock backend failure skips the activation and keeps the chain\n";
}

static void test_lock_not_acquired() {
    ErrorSink sink;
    std::atomic<int> runs{0};
    auto job = makeJob("elsewhere", [&] { ++runs; }, std::make_shared<DenyLocker>(), sink.handler());

    job->start(system_clock::now());
    std::this_thread::sleep_for(milliseconds(1600));
    job->stop();
    settle(job);

    assert(runs == 0);
    assert(job->fired() >= 1);
    assert(sink.count("lock") == 0 && sink.count("task") == 0);
    std::cout << "[OK] lock held elsewhere -> silently skipped\n";
}

static void test_blocking_task_does_not_block_rearm() {
    std::atomic<int> started{0};
    auto job = makeJob("slow", [&] {
        ++started;
        std::this_thread::sleep_for(seconds(3));
    });

    job->start(system_clock::now());
    std::this_thread::sleep_for(milliseconds(3500));
    job->stop();
    settle(job);

    assert(job->fired() >= 3);
    assert(started >= 3);
    std::cout << "[OK] a blocking task does not delay the next activation\n";
}

static void test_wait_idle() {
    std::atomic<bool> release{false};
    std::atomic<int> started{0};
    auto job = makeJob("busy", [&] {
        ++started;
        while (!release) {
            std::this_thread::sleep_for(milliseconds(10));
        }
    });
    assert(job->inFlight() == 0);
    assert(job->waitIdle(steady_clock::now()));

    job->start(system_clock::now());
    while (started == 0) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    job->stop();
    // 任务还卡着，stop 不等它
    assert(job->inFlight() >= 1);
    assert(!job->waitIdle(steady_clock::now() + milliseconds(200)));

    release = true;
    settle(job);
    assert(started == 1 || started == 2);
    std::cout << "[OK] in-flight activations are tracked until they finish\n";
}

static void test_exhausted_schedule() {
    ErrorSink sink;
    std::atomic<int> runs{0};
    auto job = std::make_shared<CronJob>("y2k", "0 0 0 1 1 * 2000",
                                         parseSchedule("0 0 0 1 1 * 2000"),
                                         [&] { ++runs; },
                                         std::make_shared<locker::NilLocker>(),
                                         milliseconds(500), sink.handler());
    job->start(system_clock::now());
    assert(sink.count("exhausted") == 1);
    assert(job->nextTime() == system_clock::time_point{});
    job->stop();
    assert(runs == 0);
    std::cout << "[OK] exhausted schedule reported once at start\n";
}

static void test_throwing_error_handler() {
    std::atomic<int> runs{0};
    auto job = makeJob("bad-handler", [&] {
        ++runs;
        throw std::runtime_error("fail");
    }, std::make_shared<locker::NilLocker>(), [](const Error&) {
        throw std::logic_error("handler bug");
    });
    job->start(system_clock::now());
    std::this_thread::sleep_for(milliseconds(2300));
    job->stop();
    settle(job);
    assert(runs >= 2);
    std::cout << "[OK] a throwing error handler does not stop the job\n";
}

static void test_invalid_construction() {
    bool threw = false;
    try {
        makeJob("", [] {});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        makeJob("no-task", Task{});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] invalid CronJob construction rejected\n";
}

int main() {
    TimerService::instance().start(1);

    test_invalid_construction();
    test_exhausted_schedule();
    test_fires_on_schedule();
    test_stop_before_first_fire();
    test_stop_race();
    test_task_error_is_contained();
    test_lock_backend_error();
    test_lock_not_acquired();
    test_blocking_task_does_not_block_rearm();
    test_throwing_error_handler();
    test_wait_idle();
    std::cout << "all job tests passed\n";
    return 0;
}
