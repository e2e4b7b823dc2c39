#include "arbiter/process.hpp"
#include "arbiter/errors.hpp"

#include "util/log.hpp"

#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace arbiter {

namespace {

/* Value the kernel reports in /proc/<pid>/sessionid when audit has not
 * assigned a login session. */
const char* const kUnsetSession = "4294967295";

bool readFile (const boost::filesystem::path& path, std::string& contents) {
    std::ifstream in { path.string().c_str() };
    if (!in) {
        return false;
    }
    contents.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

bool isPid (const std::string& name) {
    return !name.empty() &&
        std::all_of(name.begin(), name.end(), [] (char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
}

/* /proc/<pid>/stat is "pid (comm) state ppid pgrp session ...", and comm may
 * itself contain spaces and parentheses, so split at the last ')'. */
bool parseStat (const std::string& stat, std::string& comm, std::string& session) {
    auto open = stat.find('(');
    auto close = stat.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return false;
    }
    comm = stat.substr(open + 1, close - open - 1);

    std::istringstream rest { stat.substr(close + 1) };
    std::string state, ppid, pgrp;
    return static_cast<bool>(rest >> state >> ppid >> pgrp >> session);
}

bool parseRealUid (const std::string& status, std::string& uid) {
    std::istringstream lines { status };
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, 4, "Uid:") == 0) {
            std::istringstream fields { line.substr(4) };
            return static_cast<bool>(fields >> uid);
        }
    }
    return false;
}

}

std::ostream& operator<< (std::ostream& os, const ProcessIdentity& process) {
    return os << process.executableName << "[" << process.pid << "] owner "
              << process.owner << " session " << process.session;
}

ProcProcessTable::ProcProcessTable (boost::filesystem::path root)
        : mRoot(std::move(root)) {
}

ProcessIdentity ProcProcessTable::current () const {
    auto self = read(::getpid());
    if (!self) {
        throw ScanError("Unable to read " + (mRoot / "self").string());
    }
    return *self;
}

std::vector<ProcessIdentity> ProcProcessTable::list () const {
    std::vector<ProcessIdentity> processes;
    boost::system::error_code ec;
    boost::filesystem::directory_iterator it { mRoot, ec };
    if (ec) {
        LOG(warning) << "Unable to enumerate " << mRoot << ": " << ec.message();
        return processes;
    }

    for (; it != boost::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            LOG(warning) << "Process enumeration cut short: " << ec.message();
            break;
        }
        auto name = it->path().filename().string();
        if (!isPid(name)) {
            continue;
        }
        pid_t pid;
        try {
            pid = boost::lexical_cast<pid_t>(name);
        }
        catch (boost::bad_lexical_cast&) {
            continue;
        }
        /* Processes exit while we look at them. Those just drop out. */
        auto process = read(pid);
        if (process) {
            processes.push_back(*process);
        }
    }
    return processes;
}

boost::optional<ProcessIdentity> ProcProcessTable::read (pid_t pid) const {
    auto dir = mRoot / std::to_string(pid);

    std::string stat, status;
    if (!readFile(dir / "stat", stat) || !readFile(dir / "status", status)) {
        return boost::none;
    }

    ProcessIdentity process;
    process.pid = pid;
    std::string posixSession;
    if (!parseStat(stat, process.executableName, posixSession) ||
            !parseRealUid(status, process.owner)) {
        LOG(debug) << "Unparseable process entry " << dir;
        return boost::none;
    }

    std::string loginSession;
    if (readFile(dir / "sessionid", loginSession)) {
        std::istringstream in { loginSession };
        in >> loginSession;
    }
    if (!loginSession.empty() && loginSession != kUnsetSession) {
        process.session = "login:" + loginSession;
    }
    else {
        process.session = "posix:" + posixSession;
    }

    return process;
}

}
