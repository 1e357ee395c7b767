#include "log.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/formatters/date_time.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <fstream>
#include <ostream>
#include <stdexcept>

using namespace std;

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace attrs = boost::log::attributes;

BOOST_LOG_ATTRIBUTE_KEYWORD(timestamp, "TimeStamp", boost::posix_time::ptime)
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", Verbosity)

Verbosity verbosity = Verbosity::info;

string to_string(Verbosity verb) {
  switch (verb) {
    case Verbosity::everything:
      return "everything";
    case Verbosity::trace:
      return "trace";
    case Verbosity::debug:
      return "debug";
    case Verbosity::verbose:
      return "verbose";
    case Verbosity::info:
      return "info";
    case Verbosity::warning:
      return "warning";
    case Verbosity::error:
      return "error";
    case Verbosity::fatal:
      return "fatal";
    default:
      throw logic_error("Implementation of to_string(Verbosity) incomplete!");
  }
}

ostream &operator<<(ostream &os, Verbosity verb) {
  os << to_string(verb);
  return os;
}

istream &operator>>(istream &is, Verbosity &verb) {
  string token;
  is >> token;
  for (auto candidate :
       {Verbosity::fatal, Verbosity::error, Verbosity::warning,
        Verbosity::info, Verbosity::verbose, Verbosity::debug,
        Verbosity::trace, Verbosity::everything})
    if (token == to_string(candidate)) {
      verb = candidate;
      return is;
    }
  throw runtime_error("Error: unknown verbosity level '" + token + "'.");
}

BOOST_LOG_GLOBAL_LOGGER_INIT(logger, src::severity_logger_mt<Verbosity>) {
  src::severity_logger_mt<Verbosity> lg;

  // add attribute: each log line gets a timestamp
  lg.add_attribute("TimeStamp", attrs::local_clock());
  return lg;
}

void init_logging(const string &path, Verbosity threshold) {
  using text_sink = sinks::synchronous_sink<sinks::text_ostream_backend>;
  boost::shared_ptr<text_sink> sink = boost::make_shared<text_sink>();

  if (not path.empty()) {
    auto ofs = boost::make_shared<ofstream>(path);
    if (not *ofs)
      throw runtime_error("Error: could not open log file '" + path + "'.");
    sink->locked_backend()->add_stream(ofs);
  }

  sink->locked_backend()->add_stream(
      boost::shared_ptr<ostream>(&clog, boost::null_deleter()));
  sink->locked_backend()->auto_flush(true);

  logging::formatter formatter
      = expr::stream << expr::format_date_time(timestamp,
                                               "%Y-%m-%d %H:%M:%S.%f")
                     << " [" << severity << "] " << expr::smessage;
  sink->set_formatter(formatter);

  // lower enum values are more severe
  sink->set_filter(severity <= threshold);

  logging::core::get()->add_sink(sink);
}
