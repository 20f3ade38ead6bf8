#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "internal/factory.hpp"

namespace entitystore::ctl {

/*
  entitystorectl subcommands.

  `args` holds the words after the subcommand name. Results go to `out`,
  usage problems to `err`. Return values are process exit codes: 0 on
  success, 1 on bad usage.
*/

void PrintUsage(std::ostream& out);

int RunStats(factory::Application& app, std::ostream& out);
int RunList(factory::Application& app, const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
int RunSearch(factory::Application& app, const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
int RunReconcile(factory::Application& app, std::ostream& out);

// nullopt: every entity. "--untagged" alone: entities without tags. Otherwise any of the tags.
std::optional<std::vector<std::string>> ParseTagSelection(const std::vector<std::string>& words);

} // namespace entitystore::ctl
