#include "credential_inbox.hpp"

#include "arbiter/common.hpp"
#include "arbiter/errors.hpp"
#include "arbiter/user_interface.hpp"

#include "util/log.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/filesystem.hpp>

#include <algorithm>
#include <csignal>
#include <fstream>
#include <utility>

namespace arbiterd {

namespace {

const char* const kStoreName = "inbox.txt";
const char* const kHeader = "arbiter-inbox 1";

}

CredentialInbox::CredentialInbox (boost::filesystem::path dataDir,
        boost::asio::io_context& loop, arbiter::UserInterface& ui)
        : mDataDir(std::move(dataDir))
        , mLoop(loop)
        , mUi(ui)
        , mForegroundRequests(0) {
}

boost::filesystem::path CredentialInbox::storePath () const {
    return mDataDir / kStoreName;
}

bool CredentialInbox::initStorage () {
    try {
        load();
        return true;
    }
    catch (arbiter::StorageError& exc) {
        LOG(warning) << exc.what();
    }

    auto answer = mUi.tellUser(
            "The " ARBITER_APP_NAME " data is corrupted. Do you want to delete the "
            "corrupted data? Warning: you will lose your imported credentials!",
            ARBITER_APP_NAME " data corrupted", arbiter::UserInterface::YES_NO);
    if (answer != arbiter::UserInterface::YES) {
        return false;
    }

    auto backup = storePath();
    backup += ".backup";
    boost::filesystem::copy_file(storePath(), backup,
            boost::filesystem::copy_options::overwrite_existing);
    LOG(info) << "Backed up corrupted inbox to " << backup;

    mEntries.clear();
    save();
    return true;
}

void CredentialInbox::load () {
    mEntries.clear();

    auto path = storePath();
    if (!boost::filesystem::exists(path)) {
        LOG(debug) << "Creating inbox " << path;
        save();
        return;
    }

    std::ifstream in { path.string().c_str() };
    std::string line;
    if (!in || !std::getline(in, line) || line != kHeader) {
        throw arbiter::StorageError("Inbox " + path.string() + " is corrupted");
    }
    while (std::getline(in, line)) {
        if (!line.empty()) {
            mEntries.push_back(line);
        }
    }
    LOG(debug) << "Loaded " << mEntries.size() << " credentials from " << path;
}

void CredentialInbox::save () const {
    boost::filesystem::create_directories(mDataDir);

    auto path = storePath();
    auto staging = path;
    staging += ".tmp";
    {
        std::ofstream out { staging.string().c_str(), std::ios::trunc };
        out << kHeader << '\n';
        for (const auto& entry : mEntries) {
            out << entry << '\n';
        }
        out.flush();
        if (!out) {
            throw arbiter::StorageError("Unable to write " + staging.string());
        }
    }
    boost::filesystem::rename(staging, path);
}

arbiter::Status CredentialInbox::importFrom (const std::string& path) {
    boost::system::error_code ec;
    auto absolute = boost::filesystem::absolute(path);

    if (!boost::filesystem::is_regular_file(absolute, ec)) {
        return arbiter::Status::failure("not a regular file");
    }
    std::ifstream in { absolute.string().c_str() };
    if (!in) {
        return arbiter::Status::failure("file is not readable");
    }

    auto entry = absolute.string();
    if (std::find(mEntries.begin(), mEntries.end(), entry) != mEntries.end()) {
        LOG(info) << entry << " was already imported";
        return arbiter::Status::success();
    }

    mEntries.push_back(entry);
    try {
        save();
    }
    catch (arbiter::StorageError& exc) {
        mEntries.pop_back();
        return arbiter::Status::failure(exc.what());
    }
    catch (boost::filesystem::filesystem_error& exc) {
        mEntries.pop_back();
        return arbiter::Status::failure(exc.what());
    }

    LOG(info) << "Imported " << entry;
    return arbiter::Status::success();
}

arbiter::Status CredentialInbox::exportTo (const std::string& directory) {
    try {
        boost::filesystem::create_directories(directory);
        boost::filesystem::copy_file(storePath(), boost::filesystem::path(directory) / kStoreName,
                boost::filesystem::copy_options::overwrite_existing);
    }
    catch (boost::filesystem::filesystem_error& exc) {
        return arbiter::Status::failure(exc.what());
    }
    return arbiter::Status::success();
}

/* arbiterd has no window to raise; count the request so it is observable. */
void CredentialInbox::bringToForeground () {
    ++mForegroundRequests;
    LOG(info) << "Foreground requested (" << mForegroundRequests << " so far)";
}

void CredentialInbox::run () {
    boost::asio::signal_set signals { mLoop, SIGINT, SIGTERM };
    signals.async_wait([this] (const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG(info) << "Caught signal " << signo << ", stopping";
            mLoop.stop();
        }
    });

    auto work = boost::asio::make_work_guard(mLoop);
    LOG(info) << ARBITER_APP_NAME " running with " << mEntries.size() << " credentials";
    mLoop.run();
}

}
