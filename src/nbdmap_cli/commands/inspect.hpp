#pragma once

#include <string>

#include <args.hxx>

namespace nbdmap_cli::commands {

int inspect(args::ValueFlag<std::string>& files_flag, args::Flag& json_flag, args::Flag& extents_flag);

} // namespace nbdmap_cli::commands
