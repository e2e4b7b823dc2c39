#ifndef ARBITER_MAIN_SUBSYSTEM_HPP
#define ARBITER_MAIN_SUBSYSTEM_HPP

#include "arbiter/errors.hpp"

#include <string>

namespace arbiter {

/* The application proper, as far as arbitration is concerned. Everything
 * here is called on the main thread. */
class MainSubsystem {
public:
    virtual ~MainSubsystem () { }

    /* Open or create the application's storage. Returns false if the user
     * chose not to continue, e.g. when asked about recovering corrupted
     * data. */
    virtual bool initStorage () = 0;

    /* Import the credentials file at path. Failures are returned, not
     * thrown, because the caller may be servicing another instance. */
    virtual Status importFrom (const std::string& path) = 0;

    /* Write everything to directory. */
    virtual Status exportTo (const std::string& directory) = 0;

    virtual void bringToForeground () = 0;

    /* Run until asked to stop. */
    virtual void run () = 0;
};

}

#endif
