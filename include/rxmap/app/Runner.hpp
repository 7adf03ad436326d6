#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "rxmap/config/IniConfig.hpp"
#include "rxmap/reaction/ReactionSpec.hpp"

namespace rxmap {

// Everything a run needs, resolved from the INI file. Relative paths are
// anchored at the config file's directory.
struct RunConfig {
  std::filesystem::path pre_data;
  std::filesystem::path post_data;

  ReactionSpec spec;
  std::vector<std::string> elements_by_type; // empty: guess from Masses
  MappingOptions options;

  std::filesystem::path out_dir;
  std::filesystem::path pre_template;
  std::filesystem::path post_template;
  std::filesystem::path map;

  bool debug = false;

  // Throws std::runtime_error on missing/invalid keys.
  static RunConfig from_ini(const IniConfig& cfg);
};

// main() only handles the CLI, then calls Runner(cfg).run().
// Runner owns the pipeline: read -> map -> extract templates -> write.
class Runner {
public:
  explicit Runner(const IniConfig& cfg, bool force_debug = false);

  const RunConfig& config() const { return rc_; }

  // Execute the run. Returns 0 on success.
  int run();

  // Parse the config, load both structures and check the reaction atoms
  // (CLI: --validate-config). Nothing is mapped or written.
  int validate_config();

private:
  const IniConfig& cfg_;
  RunConfig rc_;

  int run_impl_(bool validate_only);
};

} // namespace rxmap
