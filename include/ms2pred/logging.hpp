#pragma once

#include <string_view>

#include <boost/log/trivial.hpp>

namespace ms2pred {

/// @brief Parse "trace", "debug", "info", "warning", "error" or "fatal".
/// @throws std::invalid_argument for any other name.
boost::log::trivial::severity_level parse_severity(std::string_view name);

/// @brief Drop every BOOST_LOG_TRIVIAL record below @p level.
void init_logging(boost::log::trivial::severity_level level = boost::log::trivial::info);

} // namespace ms2pred
