#include "arbiter/handle_registry.hpp"
#include "arbiter/errors.hpp"

#include "util/log.hpp"

#include <boost/filesystem.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <unistd.h>

#include <utility>

namespace arbiter {

namespace {

const char* const kStoreName = "handles.ini";

/* Owners are used verbatim as INI keys, so use '/' as the path separator to
 * keep any '.' in them from being read as nesting. */
boost::property_tree::ptree::path_type slotFor (const std::string& owner) {
    return boost::property_tree::ptree::path_type("channel/" + owner, '/');
}

}

HandleRegistry::HandleRegistry (boost::filesystem::path directory)
        : mDirectory(std::move(directory)) {
}

boost::filesystem::path HandleRegistry::storePath () const {
    return mDirectory / kStoreName;
}

void HandleRegistry::set (const std::string& owner, const std::string& channelAddress) {
    namespace pt = boost::property_tree;
    auto path = storePath();

    pt::ptree tree;
    boost::system::error_code ec;
    if (boost::filesystem::exists(path, ec)) {
        try {
            pt::read_ini(path.string(), tree);
        }
        catch (pt::ini_parser_error& exc) {
            LOG(warning) << "Discarding unreadable handle registry " << path
                         << ": " << exc.what();
            tree.clear();
        }
    }
    tree.put(slotFor(owner), channelAddress);

    /* Write beside the store, then rename over it, so a concurrent reader
     * sees either the old record or the new one. */
    auto staging = path;
    staging += "." + std::to_string(::getpid()) + ".tmp";
    try {
        boost::filesystem::create_directories(mDirectory);
        pt::write_ini(staging.string(), tree);
        boost::filesystem::rename(staging, path);
    }
    catch (pt::ini_parser_error& exc) {
        boost::filesystem::remove(staging, ec);
        throw StorageError("Unable to write handle registry " + path.string() + ": " + exc.what());
    }
    catch (boost::filesystem::filesystem_error& exc) {
        boost::filesystem::remove(staging, ec);
        throw StorageError("Unable to write handle registry " + path.string() + ": " + exc.what());
    }

    LOG(debug) << "Published channel " << channelAddress << " for owner " << owner;
}

boost::optional<std::string> HandleRegistry::get (const std::string& owner) const {
    namespace pt = boost::property_tree;
    auto path = storePath();

    boost::system::error_code ec;
    if (!boost::filesystem::exists(path, ec)) {
        return boost::none;
    }

    pt::ptree tree;
    try {
        pt::read_ini(path.string(), tree);
    }
    catch (pt::ini_parser_error& exc) {
        LOG(warning) << "Unable to read handle registry " << path << ": " << exc.what();
        return boost::none;
    }

    auto address = tree.get_optional<std::string>(slotFor(owner));
    if (!address || address->empty()) {
        return boost::none;
    }
    return address;
}

}
