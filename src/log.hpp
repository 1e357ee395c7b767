#ifndef LOG_HPP
#define LOG_HPP

// BOOST_LOG_DYN_LINK is set by the build system; it is needed for dynamic
// linking to the Boost log library

#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <iostream>
#include <string>

enum class Verbosity {
  fatal = 0,
  error = 1,
  warning = 2,
  info = 3,
  verbose = 4,
  debug = 5,
  trace = 6,
  everything = 7
};

extern Verbosity verbosity;

std::string to_string(Verbosity verbosity);
std::ostream &operator<<(std::ostream &os, Verbosity verbosity);
std::istream &operator>>(std::istream &is, Verbosity &verbosity);

// register a global logger
BOOST_LOG_GLOBAL_LOGGER(logger,
                        boost::log::sources::severity_logger_mt<Verbosity>)

#define LOG(severity) BOOST_LOG_SEV(logger::get(), Verbosity::severity)

/**
 * Register a sink writing to std::clog and, if path is not empty, to a file.
 *
 * Only messages at least as severe as threshold are written.
 */
void init_logging(const std::string &path,
                  Verbosity threshold = Verbosity::info);

#endif
