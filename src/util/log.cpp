#include "util/log.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/attributes/current_process_id.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/file.hpp>

#include <iostream>

namespace util {

void initLog (boost::log::trivial::severity_level level, const std::string& fileName) {
    namespace logging = boost::log;
    namespace expr = boost::log::expressions;
    namespace keywords = boost::log::keywords;

    logging::add_common_attributes();

    /* Several instances may share a terminal or a log file, so every record
     * carries the process id. */
    auto format = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << expr::attr<logging::attributes::current_process_id::value_type>("ProcessID")
        << "] <" << logging::trivial::severity << "> "
        << expr::smessage;

    logging::add_console_log(std::clog, keywords::format = format);

    if (!fileName.empty()) {
        logging::add_file_log(
                keywords::file_name = fileName,
                keywords::open_mode = std::ios_base::app,
                keywords::auto_flush = true,
                keywords::format = format);
    }

    logging::core::get()->set_filter(logging::trivial::severity >= level);
}

}
