#ifndef ARBITERD_CREDENTIAL_INBOX_HPP
#define ARBITERD_CREDENTIAL_INBOX_HPP

#include "arbiter/main_subsystem.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/filesystem/path.hpp>

#include <string>
#include <vector>

namespace arbiter {
class UserInterface;
}

namespace arbiterd {

/* The work arbiterd does once it is the running instance: keep a list of
 * imported credentials files in dataDir/inbox.txt, and run the event loop
 * the notification channel posts to until SIGINT or SIGTERM. */
class CredentialInbox : public arbiter::MainSubsystem {
public:
    CredentialInbox (boost::filesystem::path dataDir, boost::asio::io_context& loop,
            arbiter::UserInterface& ui);

    bool initStorage () override;
    arbiter::Status importFrom (const std::string& path) override;
    arbiter::Status exportTo (const std::string& directory) override;
    void bringToForeground () override;
    void run () override;

    const std::vector<std::string>& entries () const {
        return mEntries;
    }

    unsigned foregroundRequests () const {
        return mForegroundRequests;
    }

    boost::filesystem::path storePath () const;

private:
    /* Throws StorageError if the store exists but is not an inbox. */
    void load ();
    void save () const;

    boost::filesystem::path mDataDir;
    boost::asio::io_context& mLoop;
    arbiter::UserInterface& mUi;
    std::vector<std::string> mEntries;
    unsigned mForegroundRequests;
};

}

#endif
