/* Two real instances of this program. The first proceeds, publishes its
 * channel and waits; the second is started with an import path, finds the
 * first, hands the path over, asks it to come to the foreground and exits. */

#include "arbiter/arbitrator.hpp"
#include "arbiter/handle_registry.hpp"
#include "arbiter/notification_channel.hpp"
#include "arbiter/notification_sender.hpp"
#include "arbiter/options.hpp"
#include "arbiter/process.hpp"
#include "arbiter/process_scanner.hpp"

#include "test_support.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstring>
#include <iostream>
#include <string>

using namespace arbiter;

namespace {

const char* const kImportPath = "/tmp/x.cred";

/* What `arbiterd -i /tmp/x.cred` does, minus logging setup and the real
 * main subsystem. */
int runSecondInstance (const char* registryDir) {
    boost::asio::io_context loop;
    ProcProcessTable processes;
    auto self = processes.current();

    NotificationChannel channel { NotificationChannel::addressFor(self), loop };
    HandleRegistry registry { registryDir };
    ProcessScanner scanner { processes, registry };
    NotificationSender sender;
    test::FakeMainSubsystem main;
    test::RecordingUserInterface ui;

    Options options;
    options.importPath = kImportPath;

    Context context { options, self, scanner, registry, sender, channel, main, ui };
    Arbitrator arbitrator { context };

    auto outcome = arbitrator.run();
    std::cout << "second instance: " << outcome << "\n";
    return outcome == Arbitrator::DEFERRED && !main.storageInitialized ? 0 : 2;
}

/* Exec the binary by its real path: the kernel names the new process after
 * the path it was given, and the scan matches on that name. */
pid_t spawnSecondInstance (const boost::filesystem::path& registryDir) {
    auto exe = boost::filesystem::read_symlink("/proc/self/exe").string();
    auto dir = registryDir.string();
    pid_t pid = ::fork();
    assert(pid >= 0);
    if (pid == 0) {
        ::execl(exe.c_str(), exe.c_str(), "second-instance", dir.c_str(),
                static_cast<char*>(nullptr));
        ::_exit(127);
    }
    return pid;
}

int runFirstInstance () {
    test::TempDir dir;

    boost::asio::io_context loop;
    ProcProcessTable processes;
    auto self = processes.current();

    NotificationChannel channel { NotificationChannel::addressFor(self), loop };
    HandleRegistry registry { dir.path() };
    ProcessScanner scanner { processes, registry };
    NotificationSender sender;
    test::FakeMainSubsystem main;
    test::RecordingUserInterface ui;
    Options options;

    Context context { options, self, scanner, registry, sender, channel, main, ui };
    Arbitrator arbitrator { context };

    int childStatus = -1;
    main.onRun = [&] () {
        auto published = registry.get(self.owner);
        assert(published && *published == channel.address());
        assert(channel.live());

        pid_t child = spawnSecondInstance(dir.path());

        auto work = boost::asio::make_work_guard(loop);
        auto stopTime = std::chrono::steady_clock::now() + std::chrono::seconds(30);
        while (main.foregroundRequests == 0 && std::chrono::steady_clock::now() < stopTime) {
            loop.run_for(std::chrono::milliseconds(50));
        }

        assert(::waitpid(child, &childStatus, 0) == child);
    };

    assert(arbitrator.run() == Arbitrator::FINISHED);

    assert(WIFEXITED(childStatus) && WEXITSTATUS(childStatus) == 0);
    assert(main.events.size() == 2);
    assert(main.events[0] == std::string("import ") + kImportPath);
    assert(main.events[1] == "foreground");
    assert(ui.messages.empty());

    std::cout << "end to end test passed\n";
    return 0;
}

}

int main (int argc, char** argv) {
    if (argc == 3 && std::strcmp(argv[1], "second-instance") == 0) {
        return runSecondInstance(argv[2]);
    }
    return runFirstInstance();
}
