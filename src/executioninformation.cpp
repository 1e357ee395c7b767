#include "executioninformation.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <ctime>
#include <random>

using namespace std;

namespace {
string reconstitute_cmdline(int argc, const char **argv) {
  string cmd;
  for (int i = 0; i < argc; i++)
    cmd += (i != 0 ? " " : "") + string(argv[i]);
  return cmd;
}
}

ExecutionInformation::ExecutionInformation()
    : ExecutionInformation("blr", "unknown", "unknown", "unknown", 0,
                           nullptr) {}

ExecutionInformation::ExecutionInformation(const string &name,
                                           const string &version,
                                           const string &branch,
                                           const string &build, int argc,
                                           const char **argv)
    : program_name(boost::filesystem::path(name).filename().string()),
      program_version(version),
      git_branch(branch),
      build_type(build),
      cmdline(reconstitute_cmdline(argc, argv)),
      datetime(),
      directory(boost::filesystem::current_path().string()) {
  time_t rawtime;
  time(&rawtime);
  datetime = ctime(&rawtime);
  datetime = datetime.substr(0, datetime.size() - 1);
}

string ExecutionInformation::name_and_version() const {
  return program_name + " " + program_version + " (" + git_branch + ", "
         + build_type + ")";
}

string generate_random_label(const string &prefix, size_t n_rnd_char) {
  random_device rng;
  uniform_int_distribution<int> r_char('a', 'z');
  using namespace boost::posix_time;

  string label
      = prefix + "_" + to_iso_extended_string(microsec_clock::universal_time())
        + "Z";

  if (n_rnd_char > 0) {
    label += "_";
    for (size_t i = 0; i < n_rnd_char; i++)
      label += static_cast<char>(r_char(rng));
  }

  return label;
}
