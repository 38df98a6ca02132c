#pragma once

#include "../draw/GenomePlot.hpp"
#include "../stringio.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <string>
#include <sys/stat.h>
#include <vector>
#include <gitversion/version.h>
#include <yaml-cpp/yaml.h>

#define PROGRAM_NAME "GenomePlot"

namespace config {

class ConfigStore
{
public:
  int threads;

  ConfigStore();
  /** Parse command line arguments (and config file, if given).
   * @return true: program can run normally, false: indication to stop
   */
  bool parseArgs(int ac, char* av[]);
  /** Exit status to use when parseArgs() returned false. */
  int getExitCode() const;

  /** Interval dataset (BED) files. */
  const std::vector<std::string>& getBedFiles() const;
  /** Track labels (may be fewer than BED files). */
  const std::vector<std::string>& getLabels() const;
  /** Layout and drawing options. */
  draw::PlotParams getPlotParams();

  template<typename T>
    T getValue(const char* key);
  template<typename T>
    T getValue(const std::string key);

private:
  template<typename T>
    void mergeParam (
      const char* key,
      const boost::program_options::variables_map& var_map,
      T& value
    );
  /** Resolve a path relative to the config file's directory. */
  std::string resolvePath(const std::string& fn) const;
  void printSummary();

  YAML::Node _config;
  boost::filesystem::path _path_conf;
  std::vector<std::string> _vec_bed_files;
  std::vector<std::string> _vec_labels;
  int _exit_code;
}; /* class ConfigStore */

bool fileExists(std::string filename);

/*--------------------------------*
 * function templates definitions *
 *--------------------------------*/

template<typename T>
T ConfigStore::getValue(const char* key) {
  if (!_config[key]) {
    fprintf(stderr, "[WARN] ConfigStore: unknown parameter: '%s'\n", key);
    return T();
  }
  return _config[key].as<T>();
}

template<typename T>
T
ConfigStore::getValue(const std::string key) {
  return getValue<T>(key.c_str());
}

/** Command line overrides config file, config file overrides defaults. */
template<typename T>
void
ConfigStore::mergeParam (
  const char* key,
  const boost::program_options::variables_map& var_map,
  T& value
)
{
  if ((var_map.count(key) && !var_map[key].defaulted()) || !_config[key]) {
    _config[key] = value;
  }
  value = _config[key].as<T>();
}

} /* namespace config */
