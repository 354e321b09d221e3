#include "ms2pred/logging.hpp"

#include <stdexcept>
#include <string>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>

namespace ms2pred {

namespace logging = boost::log;

logging::trivial::severity_level parse_severity(const std::string_view name) {
    logging::trivial::severity_level level;
    if (!logging::trivial::from_string(name.data(), name.size(), level)) {
        throw std::invalid_argument("Unknown log level: " + std::string(name));
    }
    return level;
}

void init_logging(const logging::trivial::severity_level level) {
    logging::core::get()->set_filter(logging::trivial::severity >= level);
}

} // namespace ms2pred
