/* =====================================================================================
 * Copyright (c) 2011, Jonas Maaskola
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 * =====================================================================================
 *
 *       Filename:  cli.cpp
 *
 *    Description:  Command line and configuration file processing
 *
 * =====================================================================================
 */

#include "cli.hpp"
#include <git_config.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include "log.hpp"
#include "terminal.hpp"

using namespace std;

namespace po = boost::program_options;

const std::string default_error_msg
    = "Please inspect the command line help with -h or --help.";

po::options_description gen_generic_options(string &config_path, size_t cols) {
  po::options_description generic_options("Generic options", cols);
  generic_options.add_options()
    ("config", po::value(&config_path), "Read options from a configuration file.")
    ("help,h", "Produce help message.")
    ("version", "Print out the version. Also show git SHA1 with -v.")
    ("verbose,v", "Be verbose about the progress.")
    ("noisy,V", "Be very verbose about the progress.")
    ;
  return generic_options;
}

size_t cli_columns() {
  const size_t MIN_COLS = 60;
  const size_t MAX_COLS = 80;
  size_t cols = get_terminal_width();
  if (cols < MIN_COLS)
    cols = MIN_COLS;
  if (cols > MAX_COLS)
    cols = MAX_COLS;
  return cols;
}

namespace {
int report(const string &context, const string &msg) {
  LOG(fatal) << "Error while parsing " << context << ":";
  LOG(fatal) << msg;
  LOG(fatal) << default_error_msg;
  return EXIT_FAILURE;
}
}

int process_cli_options(
    int argc, const char **argv, ExecutionInformation &exec_info,
    const std::string &usage_string,
    boost::program_options::options_description &cli_options,
    bool use_positional_options,
    boost::program_options::positional_options_description
        &positional_options) {
  exec_info = ExecutionInformation(argv[0], GIT_DESCRIPTION, GIT_BRANCH,
                                   BUILD_TYPE, argc, argv);

  const string context = "command line options";
  po::variables_map vm;
  try {
    if (not use_positional_options)
      po::store(po::command_line_parser(argc, argv).options(cli_options).run(),
                vm);
    else
      po::store(po::command_line_parser(argc, argv)
                    .options(cli_options)
                    .positional(positional_options)
                    .run(),
                vm);
  } catch (po::unknown_option &e) {
    return report(context, "Option " + e.get_option_name() + " not known.");
  } catch (po::ambiguous_option &e) {
    return report(context, "Option " + e.get_option_name() + " is ambiguous.");
  } catch (po::multiple_occurrences &e) {
    return report(context, "Option " + e.get_option_name()
                               + " was specified multiple times.");
  } catch (po::invalid_option_value &e) {
    return report(context, "The value specified for option "
                               + e.get_option_name()
                               + " has an invalid format.");
  } catch (po::too_many_positional_options_error &e) {
    return report(context, "Too many positional options were specified.");
  } catch (po::validation_error &e) {
    return report(context, "Validation of option " + e.get_option_name()
                               + " failed.");
  } catch (po::error &e) {
    return report(context, e.what());
  } catch (std::exception &e) {
    return report(context, e.what());
  }

  if (vm.count("verbose"))
    verbosity = Verbosity::verbose;
  if (vm.count("noisy"))
    verbosity = Verbosity::debug;

  if (vm.count("version") and not vm.count("help")) {
    cout << exec_info.name_and_version() << endl;
    if (verbosity >= Verbosity::verbose)
      cout << GIT_SHA1 << endl;
    return EXIT_SUCCESS;
  }

  if (vm.count("help")) {
    cout << exec_info.name_and_version() << endl
         << "Provided under GNU General Public License Version 3 or later.\n"
         << endl;
    cout << usage_string << endl << endl;
    cout << cli_options << endl;
    return EXIT_SUCCESS;
  }

  if (vm.count("config")) {
    const string config_path = vm["config"].as<string>();
    ifstream ifs(config_path.c_str());
    if (not ifs)
      return report("config file", "Can not open config file: " + config_path);
    try {
      po::store(po::parse_config_file(ifs, cli_options), vm);
    } catch (po::multiple_occurrences &e) {
      return report("config file", "Option " + e.get_option_name()
                                       + " was specified multiple times.");
    } catch (po::unknown_option &e) {
      return report("config file",
                    "Option " + e.get_option_name() + " not known.");
    } catch (po::error &e) {
      return report("config file", e.what());
    }
  }

  try {
    po::notify(vm);
  } catch (po::required_option &e) {
    return report(context, "The required option " + e.get_option_name()
                               + " was not specified.");
  } catch (po::error &e) {
    return report(context, e.what());
  }

  return PROCESSING_SUCCESSFUL;
}
