#include "arbiter/notification_channel.hpp"

#include "test_support.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/interprocess/ipc/message_queue.hpp>

#include <sys/wait.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace arbiter;

namespace {

typedef std::vector<std::pair<MessageKind, std::string>> Received;

std::string uniqueAddress (const char* tag) {
    return std::string("arbiter-test-") + tag + "-" + std::to_string(::getpid());
}

void dispatchesByKindOnTheLoopThread () {
    boost::asio::io_context loop;
    NotificationChannel channel { uniqueAddress("dispatch"), loop };

    Received received;
    std::vector<std::thread::id> threads;
    channel.on(IMPORT_REQUEST, [&] (const std::string& payload) {
        received.emplace_back(IMPORT_REQUEST, payload);
        threads.push_back(std::this_thread::get_id());
    });
    channel.on(FOREGROUND_REQUEST, [&] (const std::string& payload) {
        received.emplace_back(FOREGROUND_REQUEST, payload);
        threads.push_back(std::this_thread::get_id());
        loop.stop();
    });

    assert(!channel.live());
    channel.start();
    assert(channel.live());

    test::inject(channel.address(), 12345, "not for us");
    test::inject(channel.address(), IMPORT_REQUEST, "/tmp/x.cred");
    test::inject(channel.address(), FOREGROUND_REQUEST, "");

    auto work = boost::asio::make_work_guard(loop);
    loop.run_for(std::chrono::seconds(10));

    assert(received.size() == 2);
    assert(received[0].first == IMPORT_REQUEST);
    assert(received[0].second == "/tmp/x.cred");
    assert(received[1].first == FOREGROUND_REQUEST);
    assert(received[1].second.empty());
    for (const auto& id : threads) {
        assert(id == std::this_thread::get_id());
    }
}

/* Short writes and unknown ids are dropped without disturbing what follows. */
void survivesJunk () {
    boost::asio::io_context loop;
    NotificationChannel channel { uniqueAddress("junk"), loop };

    Received received;
    channel.on(FOREGROUND_REQUEST, [&] (const std::string& payload) {
        received.emplace_back(FOREGROUND_REQUEST, payload);
        loop.stop();
    });
    channel.start();

    {
        boost::interprocess::message_queue queue {
            boost::interprocess::open_only, channel.address().c_str() };
        std::uint32_t truncated = FOREGROUND_REQUEST;
        queue.send(&truncated, sizeof(truncated), 0);
    }
    test::inject(channel.address(), IMPORT_REQUEST, "nobody handles this");
    test::inject(channel.address(), FOREGROUND_REQUEST, "");

    auto work = boost::asio::make_work_guard(loop);
    loop.run_for(std::chrono::seconds(10));

    assert(received.size() == 1);
    assert(received[0].first == FOREGROUND_REQUEST);
}

void messagesWaitUntilLive () {
    boost::asio::io_context loop;
    NotificationChannel channel { uniqueAddress("early"), loop };

    std::string payload;
    channel.on(IMPORT_REQUEST, [&] (const std::string& p) {
        payload = p;
        loop.stop();
    });

    test::inject(channel.address(), IMPORT_REQUEST, "/tmp/early.cred");
    loop.poll();
    assert(payload.empty());
    loop.restart();

    channel.start();
    auto work = boost::asio::make_work_guard(loop);
    loop.run_for(std::chrono::seconds(10));
    assert(payload == "/tmp/early.cred");
}

void stopAndDestroy () {
    auto address = uniqueAddress("stop");
    boost::asio::io_context loop;
    {
        NotificationChannel channel { address, loop };
        channel.start();
        assert(channel.live());
        channel.stop();
        assert(!channel.live());
        channel.stop();

        /* Can go live again. */
        channel.start();
        assert(channel.live());
    }

    bool gone = false;
    try {
        boost::interprocess::message_queue queue {
            boost::interprocess::open_only, address.c_str() };
    }
    catch (boost::interprocess::interprocess_exception&) {
        gone = true;
    }
    assert(gone);
    assert(!tmp_file_lock::exists(address + ARBITER_READY_SUFFIX));
}

/* A sender checking readiness holds the lock for a moment; going live waits
 * for it instead of failing. */
void startWaitsOutReadinessCheck () {
    boost::asio::io_context loop;
    NotificationChannel channel { uniqueAddress("polled"), loop };

    int fds[2];
    assert(::pipe(fds) == 0);

    pid_t child = ::fork();
    assert(child >= 0);
    if (child == 0) {
        ::close(fds[0]);
        tmp_file_lock ready { channel.address() + ARBITER_READY_SUFFIX,
            boost::interprocess::open_only };
        char held = ready.try_lock() ? 1 : 0;
        if (::write(fds[1], &held, 1) != 1) {
            ::_exit(2);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        ::_exit(0);
    }

    ::close(fds[1]);
    char held = 0;
    assert(::read(fds[0], &held, 1) == 1);
    ::close(fds[0]);
    assert(held == 1);

    channel.start();
    assert(channel.live());

    int childStatus = 0;
    assert(::waitpid(child, &childStatus, 0) == child);
    assert(WIFEXITED(childStatus) && WEXITSTATUS(childStatus) == 0);
}

void addressNamesOwnerAndPid () {
    auto address = NotificationChannel::addressFor(test::process(4242, "1000", "login:1"));
    assert(address == "arbiterd-1000-4242");
}

}

int main () {
    dispatchesByKindOnTheLoopThread();
    survivesJunk();
    messagesWaitUntilLive();
    stopAndDestroy();
    startWaitsOutReadinessCheck();
    addressNamesOwnerAndPid();

    std::cout << "notification channel tests passed\n";
    return 0;
}
