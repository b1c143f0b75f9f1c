#include <filesystem>
#include <future>
#include <thread>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "container/manager.hpp"
#include "test/fake_container_runtime.hpp"

using namespace std;
using namespace std::chrono;
using namespace executor;

class ContainerManagerTest : public ::testing::Test {
protected:
    fake_container_runtime *fake;
    unique_ptr<container_manager> manager;

    void SetUp() override {
        auto runtime = make_unique<fake_container_runtime>();
        fake = runtime.get();
        manager = make_unique<container_manager>(move(runtime), 2);
    }

    container_spec spec() {
        container_spec s;
        s.image = "python:3.12-slim";
        s.command = {"/bin/sh", "-c", "sleep 3600"};
        s.workdir = "/workspace";
        return s;
    }
};

TEST_F(ContainerManagerTest, HandleRemovesContainerOnDestruction) {
    {
        container c = manager->create(spec());
        EXPECT_EQ(fake->live_containers(), 1u);
        EXPECT_EQ(c.short_id().size(), 12u);
    }
    EXPECT_EQ(fake->removes.load(), 1);
    EXPECT_EQ(fake->live_containers(), 0u);
}

TEST_F(ContainerManagerTest, RemoveIsIdempotent) {
    {
        container c = manager->create(spec());
        manager->remove(c);
        EXPECT_TRUE(c.removed());
        manager->remove(c);
    }
    EXPECT_EQ(fake->removes.load(), 1);
}

TEST_F(ContainerManagerTest, MovedHandleRemovesOnce) {
    {
        container a = manager->create(spec());
        container b(move(a));
        EXPECT_FALSE(b.removed());
    }
    EXPECT_EQ(fake->removes.load(), 1);
}

TEST_F(ContainerManagerTest, CreateFailureBecomesSetupError) {
    fake->fail_create = true;
    EXPECT_THROW(manager->create(spec()), container_setup_error);
    EXPECT_EQ(fake->removes.load(), 0);
}

TEST_F(ContainerManagerTest, StartFailureBecomesSetupError) {
    fake->fail_start = true;
    {
        container c = manager->create(spec());
        EXPECT_THROW(manager->start(c), container_setup_error);
    }
    EXPECT_EQ(fake->removes.load(), 1);
}

TEST_F(ContainerManagerTest, AwaitCompletionReturnsExitCode) {
    fake->handler = [](const vector<string> &) {
        fake_container_runtime::behaviour b;
        b.exit_code = 3;
        b.stdout_text = "out";
        b.stderr_text = "err";
        return b;
    };
    container c = manager->create(spec());
    manager->start(c);
    int exit_code = 0;
    ASSERT_TRUE(manager->await_completion(c, milliseconds(1000), exit_code));
    EXPECT_EQ(exit_code, 3);
    process_output output = manager->collect_output(c);
    EXPECT_EQ(output.stdout_text, "out");
    EXPECT_EQ(output.stderr_text, "err");
    EXPECT_EQ(fake->kills.load(), 0);
}

TEST_F(ContainerManagerTest, AwaitCompletionKillsOnDeadline) {
    fake->handler = [](const vector<string> &) {
        fake_container_runtime::behaviour b;
        b.delay = seconds(30);
        return b;
    };
    container c = manager->create(spec());
    manager->start(c);
    elapsed_time timer;
    int exit_code = 0;
    EXPECT_FALSE(manager->await_completion(c, milliseconds(200), exit_code));
    EXPECT_LT(timer.milliseconds(), 5000);
    EXPECT_EQ(fake->kills.load(), 1);
}

TEST_F(ContainerManagerTest, ExecTimeoutKeepsContainerRunning) {
    fake->handler = [](const vector<string> &command) {
        fake_container_runtime::behaviour b;
        if (script_of(command) == "slow")
            b.delay = seconds(30);
        else
            b.stdout_text = "fast";
        return b;
    };
    container c = manager->create(spec());
    manager->start(c);

    process_output output;
    EXPECT_FALSE(manager->exec(c, {"/bin/sh", "-c", "slow"}, milliseconds(200), output));
    EXPECT_EQ(fake->terminations.load(), 1);
    EXPECT_EQ(fake->kills.load(), 0);

    ASSERT_TRUE(manager->exec(c, {"/bin/sh", "-c", "fast"}, milliseconds(1000), output));
    EXPECT_EQ(output.stdout_text, "fast");
}

TEST_F(ContainerManagerTest, DeadlineEnforcedWhilePoolSaturated) {
    // 两个线程都阻塞在等待容器退出时，超时后的强制停止仍然可以执行
    fake->handler = [](const vector<string> &) {
        fake_container_runtime::behaviour b;
        b.delay = seconds(30);
        return b;
    };
    container a = manager->create(spec());
    container b = manager->create(spec());
    manager->start(a);
    manager->start(b);

    elapsed_time timer;
    auto first = async(launch::async, [&] {
        int exit_code;
        return manager->await_completion(a, milliseconds(300), exit_code);
    });
    int exit_code;
    EXPECT_FALSE(manager->await_completion(b, milliseconds(300), exit_code));
    EXPECT_FALSE(first.get());
    EXPECT_LT(timer.milliseconds(), 5000);
}

TEST_F(ContainerManagerTest, ExecDeadlineExcludesQueueTime) {
    // 唯一的线程被另一个容器的等待占用，命令排队的时间不应当算作超时
    auto runtime = make_unique<fake_container_runtime>();
    fake_container_runtime *single = runtime.get();
    manager = make_unique<container_manager>(move(runtime), 1);
    single->handler = [](const vector<string> &command) {
        fake_container_runtime::behaviour b;
        if (script_of(command) == "sleep 3600")
            b.delay = milliseconds(1500);
        else
            b.stdout_text = "test";
        return b;
    };

    container a = manager->create(spec());
    container b = manager->create(spec());
    manager->start(a);
    manager->start(b);

    auto waiting = async(launch::async, [&] {
        int exit_code;
        return manager->await_completion(a, milliseconds(5000), exit_code);
    });
    while (single->waits.load() == 0)
        this_thread::sleep_for(milliseconds(10));

    process_output output;
    ASSERT_TRUE(manager->exec(b, {"/bin/sh", "-c", "echo test"}, milliseconds(500), output));
    EXPECT_EQ(output.stdout_text, "test");
    EXPECT_EQ(single->terminations.load(), 0);
    EXPECT_EQ(single->execs.load(), 1);
    EXPECT_TRUE(waiting.get());
}

TEST_F(ContainerManagerTest, Ping) {
    EXPECT_TRUE(manager->ping());
    fake->reachable = false;
    EXPECT_FALSE(manager->ping());
}
