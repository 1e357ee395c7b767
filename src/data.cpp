#include "data.hpp"
#include <algorithm>
#include <boost/tokenizer.hpp>
#include <cmath>
#include <cstdlib>
#include "aux.hpp"
#include "compression.hpp"
#include "exceptions.hpp"
#include "log.hpp"

using namespace std;

namespace BLR {

namespace {
double parse_field(const string &token, const string &source,
                   size_t line_number) {
  const string t = trim(token, " \t\r");
  const char *begin = t.c_str();
  char *end = nullptr;
  const double x = strtod(begin, &end);
  if (t.empty() or end != begin + t.size())
    throw ::Exception::File::Parsing(source, "line " + to_string(line_number)
                                               + ": field '" + t
                                               + "' is not numeric.");
  return x;
}
}

Table read_table(istream &is, const string &separator, const string &source) {
  using tokenizer = boost::tokenizer<boost::char_separator<char>>;
  boost::char_separator<char> sep(separator.c_str());

  Table table;
  string line;
  size_t line_number = 0;
  while (table.col_names.empty() and getline(is, line)) {
    line_number++;
    for (auto token : tokenizer(line, sep)) {
      const string name = trim(token, " \t\r\"'");
      if (not name.empty())
        table.col_names.push_back(name);
    }
  }
  if (table.col_names.empty())
    throw ::Exception::File::Parsing(source, "no header line found.");

  const size_t C = table.col_names.size();
  vector<vector<double>> rows;
  while (getline(is, line)) {
    line_number++;
    if (trim(line, " \t\r").empty())
      continue;
    vector<double> row;
    for (auto token : tokenizer(line, sep))
      row.push_back(parse_field(token, source, line_number));
    if (row.size() != C)
      throw ::Exception::File::Parsing(
          source, "line " + to_string(line_number) + " has "
                      + to_string(row.size()) + " fields but the header has "
                      + to_string(C) + ".");
    rows.push_back(row);
  }

  table.values = Matrix(rows.size(), C);
  for (size_t r = 0; r < rows.size(); ++r)
    for (size_t c = 0; c < C; ++c)
      table.values(r, c) = rows[r][c];
  return table;
}

vector<string> Data::coefficient_names() const {
  vector<string> names = {intercept_label};
  names.insert(end(names), begin(covariate_names), end(covariate_names));
  return names;
}

Vector Data::standardize(const Vector &raw) const {
  if (static_cast<size_t>(raw.size()) != num_covariates())
    throw Exception::Dimension("number of raw covariate values",
                               num_covariates(), raw.size());
  Vector x(raw.size() + 1);
  x(0) = 1;
  for (Index j = 0; j < raw.size(); ++j)
    x(j + 1) = (raw(j) - means(j)) / sds(j);
  return x;
}

Vector Data::new_observation(const string &values) const {
  if (values.empty())
    return standardize(means);
  const vector<double> raw = parse_numbers(values);
  return standardize(Eigen::Map<const Vector>(raw.data(), raw.size()));
}

Data build_data(const Table &table, const string &response_column,
                double threshold) {
  auto it = find(begin(table.col_names), end(table.col_names), response_column);
  if (it == end(table.col_names))
    throw Exception::InvalidArgument("response column '" + response_column
                                     + "' not found.");
  const Index response_idx = distance(begin(table.col_names), it);

  const Index N = table.values.rows();
  const Index P = table.values.cols() - 1;
  if (N < 2)
    throw Exception::InvalidArgument("at least two observations are needed.");

  Data data;
  data.design = Matrix::Ones(N, P + 1);
  data.response = IVector(N);
  data.means = Vector(P);
  data.sds = Vector(P);

  for (Index n = 0; n < N; ++n)
    data.response(n) = table.values(n, response_idx) >= threshold ? 1 : 0;

  Index j = 0;
  for (Index c = 0; c < table.values.cols(); ++c) {
    if (c == response_idx)
      continue;
    const Vector column = table.values.col(c);
    const double mean = column.mean();
    const double sd
        = sqrt((column.array() - mean).square().sum() / (N - 1));
    if (not(sd > 0))
      throw Exception::InvalidArgument("covariate '" + table.col_names[c]
                                       + "' is constant.");
    data.covariate_names.push_back(table.col_names[c]);
    data.means(j) = mean;
    data.sds(j) = sd;
    data.design.col(j + 1) = ((column.array() - mean) / sd).matrix();
    j++;
  }

  const size_t positives = data.response.cast<size_t>().sum();
  LOG(verbose) << "Labeled " << positives << " of " << N
               << " observations as 1 (" << response_column
               << " >= " << threshold << ").";
  return data;
}

Data load_data(const string &path, const string &separator,
               const string &response_column, double threshold) {
  LOG(verbose) << "Reading " << path;
  Table table = parse_file<Table>(path, read_table, separator, path);
  LOG(verbose) << "Read " << table.values.rows() << " rows and "
               << table.col_names.size() << " columns.";
  return build_data(table, response_column, threshold);
}

ostream &operator<<(ostream &os, const Data &data) {
  os << data.num_observations() << " observations of "
     << data.num_covariates() << " covariates";
  return os;
}
}
