/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-10-19
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: yaml_loader.h
 * Description: Header for the YAML configuration loader. Overlays source,
 *              filter and output settings from a YAML file onto run options.
 */

#pragma once

#include "lcsee/config/options.h"
#include <string>

namespace lcsee {
namespace config {

// Load options from a YAML file on top of `options`; keys absent from the
// file keep their current value. Throws ConfigError for unreadable files,
// malformed YAML and values of the wrong type.
void load_options_from_yaml(const std::string& file_path, Options& options);

// Same, from YAML text
void load_options_from_yaml_string(const std::string& yaml_text, Options& options);

} // namespace config
} // namespace lcsee
