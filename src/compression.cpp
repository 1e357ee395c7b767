#include "compression.hpp"
#include <utility>

using namespace std;

namespace {
const vector<pair<CompressionMode, vector<string>>> mode_names
    = {{CompressionMode::none, {"none", ""}},
       {CompressionMode::gzip, {"gzip", ".gz", "gz"}},
       {CompressionMode::bzip2, {"bzip2", ".bz2", "bz2"}}};
}

string to_string(CompressionMode mode) {
  for (auto &entry : mode_names)
    if (entry.first == mode)
      return entry.second[0];
  throw logic_error("Implementation of to_string(CompressionMode) incomplete!");
}

string suffix(CompressionMode mode) {
  for (auto &entry : mode_names)
    if (entry.first == mode)
      return entry.second[1];
  throw logic_error("Implementation of suffix(CompressionMode) incomplete!");
}

ostream &operator<<(ostream &os, CompressionMode mode) {
  os << to_string(mode);
  return os;
}

istream &operator>>(istream &is, CompressionMode &mode) {
  string token;
  is >> token;
  for (auto &entry : mode_names)
    for (auto &name : entry.second)
      if (not name.empty() and token == name) {
        mode = entry.first;
        return is;
      }
  throw runtime_error("Error: compression mode '" + token
                      + "' not understood.");
}

string find_suffix_alternatives(const string &path) {
  for (auto &entry : mode_names) {
    const string p = path + entry.second[1];
    if (boost::filesystem::exists(p))
      return p;
  }
  throw Exception::File::Existence(path);
}
