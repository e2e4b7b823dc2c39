#include "arbiter/arbitrator.hpp"
#include "arbiter/common.hpp"
#include "arbiter/errors.hpp"
#include "arbiter/handle_registry.hpp"
#include "arbiter/notification_channel.hpp"
#include "arbiter/notification_sender.hpp"
#include "arbiter/options.hpp"
#include "arbiter/process.hpp"
#include "arbiter/process_scanner.hpp"
#include "arbiter/user_interface.hpp"
#include "credential_inbox.hpp"
#include "util/log.hpp"

#include <boost/asio/io_context.hpp>

#include <cstdlib>
#include <exception>
#include <iostream>

namespace {

/* Last stop for exceptions: tell the user, then fail. Only ever called on
 * the main thread. */
int fatal (const std::string& what) {
    LOG(fatal) << what;
    arbiter::ConsoleUserInterface ui { std::cin, std::cerr };
    ui.tellUser(what, ARBITER_APP_NAME " fatal error", arbiter::UserInterface::OK);
    return EXIT_FAILURE;
}

/* Exceptions escaping any other thread end up here. */
void terminateHandler () {
    LOG(fatal) << "Terminating on an unhandled exception";
    std::abort();
}

}

int main (int argc, char** argv) try {
    std::set_terminate(terminateHandler);

    arbiter::Options options;
    try {
        options = arbiter::parseOptions(argc, argv);
    }
    catch (arbiter::OptionError& exc) {
        std::cerr << "Option error: " << exc.what() << "\n\n" << arbiter::usage();
        return EXIT_FAILURE;
    }

    if (options.help) {
        std::cout << arbiter::usage();
        return EXIT_SUCCESS;
    }

    util::initLog(options.logLevel, options.logFile);

    arbiter::ConsoleUserInterface ui { std::cin, std::cerr };

    /* Used to report a fatal error from a previous run; must not spawn
     * anything itself. */
    if (options.fatalMessage) {
        ui.tellUser(*options.fatalMessage, ARBITER_APP_NAME " fatal error",
                arbiter::UserInterface::OK);
        return EXIT_SUCCESS;
    }

    boost::asio::io_context loop;

    arbiter::ProcProcessTable processes;
    auto self = processes.current();

    arbiter::NotificationChannel channel { arbiter::NotificationChannel::addressFor(self), loop };
    arbiter::HandleRegistry registry { options.registryDir };
    arbiter::ProcessScanner scanner { processes, registry };
    arbiter::NotificationSender sender { options.deliveryTimeout };
    arbiterd::CredentialInbox inbox { options.dataDir, loop, ui };

    arbiter::Context context { options, self, scanner, registry, sender, channel, inbox, ui };
    arbiter::Arbitrator arbitrator { context };

    return arbitrator.run() == arbiter::Arbitrator::EXPORT_FAILED ?
        EXIT_FAILURE : EXIT_SUCCESS;
}
catch (arbiter::FileLockError& exc) {
    return fatal(std::string("Interprocess synchronization error: ") + exc.what());
}
catch (arbiter::QueueError& exc) {
    return fatal(std::string("Notification channel error: ") + exc.what());
}
catch (std::exception& exc) {
    return fatal(exc.what());
}
