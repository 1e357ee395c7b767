#include <atomic>
#include <boost/filesystem.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>
#include "aux.hpp"
#include "cli.hpp"
#include "data.hpp"
#include "entropy.hpp"
#include "glm.hpp"
#include "io.hpp"
#include "log.hpp"
#include "parameters.hpp"
#include "predictive.hpp"
#include "sampler.hpp"
#include "stats.hpp"

using namespace std;

namespace {

struct Options {
  string data_path;
  string separator = ";";
  string response = "quality";
  string new_observation;
  string init;
};

atomic<bool> stop_requested(false);

extern "C" void handle_sigint(int) { stop_requested = true; }

BLR::Vector to_vector(const vector<double> &v) {
  BLR::Vector x(v.size());
  for (size_t i = 0; i < v.size(); ++i)
    x(i) = v[i];
  return x;
}

void log_summaries(const BLR::Chain &chain, const vector<string> &names,
                   size_t burn_in) {
  const size_t S = chain.size();
  if (burn_in + 1 >= S) {
    LOG(warning) << "Warning: no samples left after a burn-in of " << burn_in
                 << "; skipping posterior summaries.";
    return;
  }
  LOG(info) << "Posterior summaries of " << (S - burn_in)
            << " samples after burn-in:";
  LOG(info) << string(20, ' ') << Stats::summary_header();
  for (BLR::Index j = 0; j < chain.dim(); ++j) {
    const BLR::Vector trace = chain.trace(j).tail(S - burn_in);
    string name = names[j].substr(0, 19);
    name.resize(20, ' ');
    LOG(info) << name << Stats::summary(trace);
  }
}

void run(const Options &options, BLR::Parameters &parameters) {
  using namespace BLR;

  Data data = load_data(options.data_path, options.separator,
                        options.response, parameters.threshold);
  LOG(info) << "Data: " << data;
  const vector<string> names = data.coefficient_names();

  // checked before sampling, which may take long
  const Vector x_new = data.new_observation(options.new_observation);
  LOG(verbose) << "New observation (standardized): " << x_new.transpose();

  MLEFit fit = fit_logistic_mle(data.design, data.response,
                                parameters.mle_iterations,
                                parameters.mle_tolerance);
  LOG(info) << "Maximum-likelihood fit: " << fit;
  for (size_t j = 0; j < names.size(); ++j)
    LOG(verbose) << names[j] << " = " << fit.coefficients(j);
  write_vector(fit.coefficients, parameters.output_directory + "mle.tsv",
               CompressionMode::none, names);

  Vector init = fit.coefficients;
  if (not options.init.empty()) {
    init = to_vector(parse_numbers(options.init));
    LOG(info) << "Using the given initial coefficients instead of the "
                 "maximum-likelihood estimate.";
  }

  RNG rng = EntropySource::make_rng(parameters.seed);
  LOG(info) << "Random seed = " << parameters.seed;

  Sampler sampler(data.design, data.response, parameters);
  SamplingResult result = sampler.run(init, rng, &stop_requested);

  auto path = write_chain(result.chain, names,
                          parameters.output_directory + "chain.tsv",
                          parameters.compression_mode);
  LOG(info) << "Wrote chain to " << path;
  cout << "Acceptance rate: " << result.acceptance_rate() << endl;

  log_summaries(result.chain, names, parameters.burn_in);

  if (parameters.burn_in >= result.chain.size()) {
    LOG(warning) << "Warning: the chain of " << result.chain.size()
                 << " samples is not longer than the burn-in of "
                 << parameters.burn_in
                 << "; skipping posterior predictive simulation.";
    return;
  }

  LOG(info) << "Posterior mean probability of the new observation = "
            << mean_probability(result.chain, x_new, parameters.burn_in);

  auto draws = predict(result.chain, x_new, parameters.burn_in, rng);
  auto counts = tabulate(draws);
  print_frequencies(cout, counts);
  path = write_frequencies(counts, parameters.output_directory + "predictive.tsv",
                           CompressionMode::none);
  LOG(info) << "Wrote posterior predictive frequencies to " << path;
}
}

int main(int argc, char **argv) {
  Options options;
  BLR::Parameters parameters;

  string config_path;
  string usage_info
      = "Bayesian logistic regression by Metropolis-Hastings sampling\n"
        "\n"
        "Please provide a delimited table with a header line of column names\n"
        "as argument to the --file switch or as free argument. All columns but\n"
        "the response column are used as covariates; they are standardized\n"
        "and an intercept is added. Rows whose response is at least the\n"
        "threshold are labeled 1, all others 0.";

  const size_t num_cols = cli_columns();
  namespace po = boost::program_options;
  po::options_description cli_options;
  po::options_description generic_options
      = gen_generic_options(config_path, num_cols);

  po::options_description required_options("Required options", num_cols);
  po::options_description basic_options("Basic options", num_cols);
  po::options_description sampler_options("Sampler options", num_cols);
  po::options_description advanced_options("Advanced options", num_cols);

  required_options.add_options()
    ("file", po::value(&options.data_path)->required(),
     "Path to the data table. May be compressed with gzip or bzip2.");

  basic_options.add_options()
    ("sep", po::value(&options.separator)->default_value(options.separator),
     "Column separator of the data table.")
    ("response", po::value(&options.response)->default_value(options.response),
     "Name of the response column.")
    ("threshold", po::value(&parameters.threshold)->default_value(parameters.threshold),
     "Responses at or above this value are labeled 1.")
    ("new", po::value(&options.new_observation),
     "Comma-separated raw covariate values of the observation to predict. "
     "Defaults to the covariate means.")
    ("output,o", po::value(&parameters.output_directory),
     "Prefix for generated output files. A trailing '/' creates a directory.")
    ("seed", po::value(&parameters.seed)->default_value(parameters.seed),
     "Seed for the random number generator. 0 draws a random seed.");

  sampler_options.add_options()
    ("iter,i", po::value(&parameters.num_iterations)->default_value(parameters.num_iterations),
     "Length of the chain, including the initial state.")
    ("burn,b", po::value(&parameters.burn_in)->default_value(parameters.burn_in),
     "Number of leading samples to discard for summaries and prediction.")
    ("prior_sd", po::value(&parameters.prior_sd)->default_value(parameters.prior_sd),
     "Standard deviation of the normal prior of the coefficients.")
    ("scale", po::value(&parameters.proposal_scale)->default_value(parameters.proposal_scale),
     "Proposal covariance is this factor times the inverse of X^T X.")
    ("report,r", po::value(&parameters.report_interval)->default_value(parameters.report_interval),
     "Interval for reporting the acceptance rate. 0 disables reporting.")
    ("init", po::value(&options.init),
     "Comma-separated initial coefficients, including the intercept. "
     "Defaults to the maximum-likelihood estimate.");

  advanced_options.add_options()
    ("mle_iter", po::value(&parameters.mle_iterations)->default_value(parameters.mle_iterations),
     "Maximal number of IRLS iterations of the maximum-likelihood fit.")
    ("mle_tol", po::value(&parameters.mle_tolerance)->default_value(parameters.mle_tolerance, "1e-8"),
     "Relative deviance tolerance of the maximum-likelihood fit.")
    ("compression", po::value(&parameters.compression_mode)->default_value(parameters.compression_mode),
     "Compression method for the chain. "
     "Can be one of 'gzip', 'bzip2', 'none'.");

  cli_options.add(generic_options)
      .add(required_options)
      .add(basic_options)
      .add(sampler_options)
      .add(advanced_options);

  po::positional_options_description positional_options;
  positional_options.add("file", 1);

  ExecutionInformation exec_info;
  int ret_val
      = process_cli_options(argc, const_cast<const char **>(argv), exec_info,
                            usage_info, cli_options, true, positional_options);
  if (ret_val != PROCESSING_SUCCESSFUL)
    return ret_val;

  if (parameters.output_directory == BLR::default_output_string)
    parameters.output_directory
        = generate_random_label(exec_info.program_name, 0) + "/";

  if (not parameters.output_directory.empty()
      and *parameters.output_directory.rbegin() == '/') {
    boost::system::error_code ec;
    boost::filesystem::create_directories(parameters.output_directory, ec);
    if (ec) {
      LOG(fatal) << "Error creating output directory "
                 << parameters.output_directory << ": " << ec.message();
      return EXIT_FAILURE;
    }
  }
  const string log_file_path = parameters.output_directory + "log.txt";

  try {
    init_logging(log_file_path, verbosity);

    LOG(info) << exec_info.name_and_version();
    LOG(info) << exec_info.datetime;
    LOG(info) << "Working directory = " << exec_info.directory;
    LOG(info) << "Command = " << exec_info.cmdline;
    LOG(verbose) << "Parameters:\n" << parameters;

    signal(SIGINT, handle_sigint);

    run(options, parameters);
  } catch (std::exception &e) {
    LOG(fatal) << "An error occurred during program execution.";
    LOG(fatal) << e.what();
    LOG(fatal) << "Please consult the command line help with -h.";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
