#pragma once

#include <cstdint>
#include <string>

#include <args.hxx>

namespace nbdmap_cli::commands {

int map(
    args::ValueFlag<std::string>& files_flag, args::ValueFlag<std::string>& device_flag,
    args::ValueFlag<std::string>& export_flag, args::ValueFlag<std::string>& listen_address_flag,
    args::ValueFlag<uint32_t>& listen_port_flag, args::ValueFlag<uint32_t>& threads_flag,
    args::ValueFlag<uint32_t>& block_size_flag, args::Flag& read_only_flag
);

} // namespace nbdmap_cli::commands
