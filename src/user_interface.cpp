#include "arbiter/user_interface.hpp"
#include "arbiter/common.hpp"

#include "util/log.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <istream>
#include <ostream>

namespace arbiter {

ConsoleUserInterface::ConsoleUserInterface (std::istream& in, std::ostream& out)
        : mIn(in)
        , mOut(out) {
}

UserInterface::Answer ConsoleUserInterface::tellUser (const std::string& message,
        const std::string& title, Buttons buttons) {
    mOut << title << ": " << message << std::endl;

    if (buttons == OK) {
        return ACKNOWLEDGED;
    }

    mOut << "[y/N] " << std::flush;
    std::string line;
    if (!std::getline(mIn, line)) {
        return NO;
    }
    boost::algorithm::trim(line);
    boost::algorithm::to_lower(line);
    return line == "y" || line == "yes" ? YES : NO;
}

void reportError (UserInterface& ui, const std::string& message) {
    LOG(error) << message;
    ui.tellUser(message, ARBITER_APP_NAME " error", UserInterface::OK);
}

}
