#include <cstdlib>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "commands/inspect.hpp"
#include "commands/map.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() {
  // apply verbosity
  int verbosity = args::get(verbosity_flag);
  redlog::set_level(redlog::level::info);
  if (verbosity == 1) {
    redlog::set_level(redlog::level::verbose);
  } else if (verbosity == 2) {
    redlog::set_level(redlog::level::trace);
  } else if (verbosity == 3) {
    redlog::set_level(redlog::level::debug);
  } else if (verbosity >= 4) {
    redlog::set_level(redlog::level::pedantic);
  }
}
} // namespace cli

namespace {
auto log_main = redlog::get_logger("nbdmap");
int g_exit_code = 0;
} // namespace

void cmd_map(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> files(
      parser, "files", "comma-separated backup files, full backup first", {'f', "file"}
  );
  args::ValueFlag<std::string> device(parser, "device", "block device to attach (default /dev/nbd0)", {'d', "device"});
  args::ValueFlag<std::string> export_name(parser, "name", "export name (default sda)", {'e', "export-name"});
  args::ValueFlag<std::string> listen_address(
      parser, "address", "export listen address (default 127.0.0.1)", {'l', "listen-address"}
  );
  args::ValueFlag<uint32_t> listen_port(parser, "port", "export listen port (default 10809)", {'p', "listen-port"});
  args::ValueFlag<uint32_t> threads(parser, "count", "export server threads (default 1)", {'t', "threads"});
  args::ValueFlag<uint32_t> block_size(parser, "bytes", "maximum request size (default 4096)", {'b', "blocksize"});
  args::Flag read_only(parser, "readonly", "map the device read-only (full backup only)", {'r', "readonly"});
  parser.Parse();

  g_exit_code = nbdmap_cli::commands::map(
      files, device, export_name, listen_address, listen_port, threads, block_size, read_only
  );
}

void cmd_inspect(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> files(
      parser, "files", "comma-separated backup files, full backup first", {'f', "file"}
  );
  args::Flag json(parser, "json", "output results in JSON format", {'j', "json"});
  args::Flag extents(parser, "extents", "list resolved extents", {'x', "extents"});
  parser.Parse();

  g_exit_code = nbdmap_cli::commands::inspect(files, json, extents);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser(
      "nbdmap - map sparse backup chains to network block devices",
      "assemble a full backup and its incrementals into an attached block device"
  );
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command map_cmd(commands, "map", "export a backup chain and attach it to a block device", &cmd_map);
  args::Command inspect_cmd(commands, "inspect", "show metadata and the resolved extent map of a backup chain", &cmd_inspect);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  if (g_exit_code != 0) {
    log_main.dbg("command finished", redlog::field("exit_code", g_exit_code));
  }
  return g_exit_code;
}
