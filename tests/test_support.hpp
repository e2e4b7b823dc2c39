#ifndef ARBITER_TESTS_TEST_SUPPORT_HPP
#define ARBITER_TESTS_TEST_SUPPORT_HPP

#include "arbiter/main_subsystem.hpp"
#include "arbiter/message.hpp"
#include "arbiter/process.hpp"
#include "arbiter/user_interface.hpp"

#include <boost/filesystem.hpp>
#include <boost/interprocess/ipc/message_queue.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace test {

/* A fresh directory under the temporary directory, removed on destruction. */
class TempDir {
public:
    TempDir ()
            : mPath(boost::filesystem::temp_directory_path() /
                    boost::filesystem::unique_path("arbiter-test-%%%%-%%%%-%%%%")) {
        boost::filesystem::create_directories(mPath);
    }

    ~TempDir () {
        boost::system::error_code ec;
        boost::filesystem::remove_all(mPath, ec);
    }

    TempDir (const TempDir&) = delete;
    TempDir& operator= (const TempDir&) = delete;

    const boost::filesystem::path& path () const {
        return mPath;
    }

private:
    boost::filesystem::path mPath;
};

inline arbiter::ProcessIdentity process (pid_t pid, std::string owner, std::string session,
        std::string name = "arbiterd") {
    arbiter::ProcessIdentity p;
    p.pid = pid;
    p.executableName = std::move(name);
    p.owner = std::move(owner);
    p.session = std::move(session);
    return p;
}

/* Put a message straight onto the queue at address, bypassing the sender and
 * its readiness check. kind need not be one of ours. */
inline void inject (const std::string& address, std::uint32_t kind, const std::string& payload) {
    arbiter::Message message;
    arbiter::encodeMessage(message, arbiter::IMPORT_REQUEST, payload);
    message.kind = kind;
    boost::interprocess::message_queue queue { boost::interprocess::open_only, address.c_str() };
    queue.send(&message, sizeof(message), 0);
}

class FakeProcessTable : public arbiter::ProcessTable {
public:
    FakeProcessTable (arbiter::ProcessIdentity self, std::vector<arbiter::ProcessIdentity> others)
            : mSelf(std::move(self))
            , mOthers(std::move(others)) {
    }

    arbiter::ProcessIdentity current () const override {
        return mSelf;
    }

    std::vector<arbiter::ProcessIdentity> list () const override {
        auto all = mOthers;
        all.push_back(mSelf);
        return all;
    }

private:
    arbiter::ProcessIdentity mSelf;
    std::vector<arbiter::ProcessIdentity> mOthers;
};

/* Records every message and answers yes/no questions with a fixed answer. */
class RecordingUserInterface : public arbiter::UserInterface {
public:
    explicit RecordingUserInterface (Answer answer = NO) : mAnswer(answer) { }

    Answer tellUser (const std::string& message, const std::string& title,
            Buttons buttons) override {
        messages.push_back(title + ": " + message);
        return buttons == OK ? ACKNOWLEDGED : mAnswer;
    }

    std::vector<std::string> messages;

private:
    Answer mAnswer;
};

/* Main subsystem that records what the core asked of it. */
class FakeMainSubsystem : public arbiter::MainSubsystem {
public:
    FakeMainSubsystem ()
            : storageOk(true)
            , importOk(true)
            , exportOk(true)
            , storageInitialized(false)
            , ran(false)
            , foregroundRequests(0) {
    }

    bool initStorage () override {
        storageInitialized = true;
        return storageOk;
    }

    arbiter::Status importFrom (const std::string& path) override {
        imports.push_back(path);
        events.push_back("import " + path);
        return importOk ? arbiter::Status::success() : arbiter::Status::failure("bad contents");
    }

    arbiter::Status exportTo (const std::string& directory) override {
        exports.push_back(directory);
        return exportOk ? arbiter::Status::success() : arbiter::Status::failure("disk full");
    }

    void bringToForeground () override {
        ++foregroundRequests;
        events.push_back("foreground");
    }

    void run () override {
        ran = true;
        if (onRun) {
            onRun();
        }
    }

    /* Stands in for the run loop. */
    std::function<void()> onRun;

    bool storageOk;
    bool importOk;
    bool exportOk;

    bool storageInitialized;
    bool ran;
    unsigned foregroundRequests;
    std::vector<std::string> imports;
    std::vector<std::string> exports;
    /* Imports and foreground requests, in the order they arrived. */
    std::vector<std::string> events;
};

}

#endif
