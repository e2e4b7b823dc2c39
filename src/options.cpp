#include "arbiter/options.hpp"
#include "arbiter/common.hpp"
#include "arbiter/errors.hpp"

#include "util/paths.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <fstream>
#include <sstream>

namespace arbiter {

namespace po = boost::program_options;

namespace {

const char* const kConfigFileName = ARBITER_APP_NAME ".conf";

po::options_description commandLineOptions () {
    po::options_description generic { "Options" };
    generic.add_options()
        ("help,h", "print this message and exit")
        ("export,e", po::value<std::string>()->value_name("dir"),
            "export to dir, then exit")
        ("import,i", po::value<std::string>()->value_name("file"),
            "import the credentials in file, handing it to the running instance if there is one")
        ("fatal-message,M", po::value<std::string>()->value_name("text"),
            "show text as a fatal error and exit")
        ("config,c", po::value<std::string>()->value_name("file"),
            "read configuration from file")
        ("verbose,v", "log debugging output");
    return generic;
}

/* Also accepted in the configuration file, as "key = value" lines. */
po::options_description configurationOptions () {
    po::options_description config { "Configuration" };
    config.add_options()
        ("log-level", po::value<std::string>()->value_name("level"),
            "trace, debug, info, warning, error or fatal (default info)")
        ("log-file", po::value<std::string>()->value_name("file"),
            "also append the log to file")
        ("registry-dir", po::value<std::string>()->value_name("dir"),
            "where the running instance publishes its address")
        ("data-dir", po::value<std::string>()->value_name("dir"),
            "where imported credentials are kept")
        ("delivery-timeout", po::value<unsigned>()->value_name("seconds"),
            "how long to wait for the running instance to accept a message (default 10)");
    return config;
}

std::string nonEmpty (const po::variables_map& vm, const char* name, const char* what) {
    auto value = vm[name].as<std::string>();
    if (value.empty()) {
        throw OptionError(std::string("empty ") + what);
    }
    return value;
}

}

Options::Options ()
        : help(false)
        , logLevel(boost::log::trivial::info)
        , deliveryTimeout(std::chrono::seconds(ARBITER_DELIVERY_TIMEOUT_SECONDS)) {
}

Options parseOptions (int argc, const char* const argv[]) {
    Options options;
    auto config = configurationOptions();

    po::options_description all;
    all.add(commandLineOptions()).add(config);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(all).run(), vm);

        /* store() keeps the first value it sees for each option, which is
         * what gives the command line precedence over the file. */
        bool explicitConfig = vm.count("config") != 0;
        options.configFile = explicitConfig ?
            boost::filesystem::path(vm["config"].as<std::string>()) :
            util::configDirectory(ARBITER_APP_NAME) / kConfigFileName;

        if (boost::filesystem::exists(options.configFile)) {
            std::ifstream in { options.configFile.string().c_str() };
            if (!in) {
                throw OptionError("unable to read " + options.configFile.string());
            }
            po::store(po::parse_config_file(in, config), vm);
        }
        else if (explicitConfig) {
            throw OptionError("no such configuration file " + options.configFile.string());
        }

        po::notify(vm);
    }
    catch (po::error& exc) {
        throw OptionError(exc.what());
    }

    options.help = vm.count("help") != 0;

    if (vm.count("export")) {
        options.exportPath = nonEmpty(vm, "export", "export path");
    }
    if (vm.count("import")) {
        options.importPath = nonEmpty(vm, "import", "import path");
    }
    if (vm.count("fatal-message")) {
        options.fatalMessage = vm["fatal-message"].as<std::string>();
    }

    if (vm.count("log-level")) {
        auto level = vm["log-level"].as<std::string>();
        if (!boost::log::trivial::from_string(level.c_str(), level.size(), options.logLevel)) {
            throw OptionError("invalid log level '" + level + "'");
        }
    }
    if (vm.count("verbose")) {
        options.logLevel = boost::log::trivial::debug;
    }
    if (vm.count("log-file")) {
        options.logFile = vm["log-file"].as<std::string>();
    }

    options.registryDir = vm.count("registry-dir") ?
        boost::filesystem::path(vm["registry-dir"].as<std::string>()) :
        util::configDirectory(ARBITER_APP_NAME);
    options.dataDir = vm.count("data-dir") ?
        boost::filesystem::path(vm["data-dir"].as<std::string>()) :
        util::dataDirectory(ARBITER_APP_NAME);

    if (vm.count("delivery-timeout")) {
        options.deliveryTimeout = std::chrono::seconds(vm["delivery-timeout"].as<unsigned>());
    }

    return options;
}

std::string usage () {
    po::options_description all;
    all.add(commandLineOptions()).add(configurationOptions());

    std::ostringstream os;
    os << "Usage: " ARBITER_APP_NAME " [-e <dir> | -i <file>] [-M <text>] [-c <file>] [-v]\n\n"
       << all;
    return os.str();
}

}
