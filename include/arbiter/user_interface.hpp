#ifndef ARBITER_USER_INTERFACE_HPP
#define ARBITER_USER_INTERFACE_HPP

#include <iosfwd>
#include <string>

namespace arbiter {

/* The one thing the core needs from a user interface: show a message and
 * wait for it to be acknowledged, or answered yes or no. */
class UserInterface {
public:
    enum Buttons {
        OK,
        YES_NO
    };

    enum Answer {
        ACKNOWLEDGED,
        YES,
        NO
    };

    virtual ~UserInterface () { }

    virtual Answer tellUser (const std::string& message, const std::string& title,
            Buttons buttons) = 0;
};

/* Messages go to out; yes/no answers are read a line at a time from in.
 * Anything other than y or yes, including end of input, counts as no. */
class ConsoleUserInterface : public UserInterface {
public:
    ConsoleUserInterface (std::istream& in, std::ostream& out);

    Answer tellUser (const std::string& message, const std::string& title,
            Buttons buttons) override;

private:
    std::istream& mIn;
    std::ostream& mOut;
};

/* The common path for errors the process survives: log the error and tell
 * the user about it. */
void reportError (UserInterface& ui, const std::string& message);

}

#endif
