#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <yaml-cpp/yaml.h>

#include <tessera/ledger.hpp>

namespace tessera::script {

struct outcome
{
  std::string operation;
  std::error_code error;
  std::optional< bool > value;
};

/**
 * Runs a YAML sequence of ledger calls in order. Each entry names its caller
 * and operation, e.g.
 *
 *   - { caller: "0x01..", op: transfer, to: "0x02..", value: "100" }
 *
 * A call the ledger rejects is recorded in its outcome and does not stop the
 * script. An entry that cannot be understood throws std::runtime_error.
 */
std::vector< outcome > execute( ledger::ledger& l, const YAML::Node& script );
std::vector< outcome > execute_file( ledger::ledger& l, const std::filesystem::path& path );

} // namespace tessera::script
