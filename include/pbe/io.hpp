#pragma once

#include <map>
#include <string>
#include <vector>

namespace pbe {

struct DatasetMeta {
  std::string path;                  // relative to output_dir
  std::vector<std::string> columns;  // e.g. ["z","psi"]
  std::string description;
};

struct ResultsIndex {
  std::string schema_version = "pbe.results.v1";
  std::string pbe_version = "0.1.0";
  std::string config_used;   // usually "config_used.ini"

  // Run summary (stringified numbers to keep it simple).
  std::map<std::string, std::string> summary;

  // Named datasets produced by this run.
  std::map<std::string, DatasetMeta> datasets;
};

void ensure_dir(const std::string& path);

// Read a flat numeric profile. Lines starting with '#' or '@' are comments.
// One number per line gives the value; with two or more columns the second
// column is the value (z, value layout).
std::vector<double> read_profile_column(const std::string& path);

// Write a whitespace table. Every line of header_comment is prefixed with "# ",
// followed by one "#" line naming the columns.
void write_table(const std::string& path,
                 const std::vector<std::string>& columns,
                 const std::vector<std::vector<double>>& data_columns,
                 const std::string& header_comment = "");

// Write results.json in output_dir.
void write_results_json(const std::string& output_dir, const ResultsIndex& idx);

// Copy a file (overwrites).
void copy_file(const std::string& src, const std::string& dst);

} // namespace pbe
