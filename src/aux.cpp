#include "aux.hpp"
#include <stdexcept>

using namespace std;

vector<string> split_at(char sep, const string &str) {
  vector<string> ret;
  istringstream ss(str);
  string token;
  while (getline(ss, token, sep))
    ret.push_back(token);
  return ret;
}

string trim(const string &str, const string &symbols) {
  const size_t front = str.find_first_not_of(symbols);
  if (front == string::npos)
    return "";
  const size_t back = str.find_last_not_of(symbols);
  return str.substr(front, back - front + 1);
}

vector<double> parse_numbers(const string &str, char sep) {
  vector<double> values;
  for (auto &token : split_at(sep, str)) {
    const string t = trim(token, " \t");
    size_t pos = 0;
    double x = 0;
    try {
      x = stod(t, &pos);
    } catch (const std::exception &e) {
      throw invalid_argument("Error: '" + t + "' is not a number.");
    }
    if (pos != t.size())
      throw invalid_argument("Error: '" + t + "' is not a number.");
    values.push_back(x);
  }
  return values;
}
