#include <doctest/doctest.h>

#include <algorithm>
#include <chrono>
#include <thread>

#include "nbdmap/attach/attach_transport.hpp"
#include "nbdmap/process/export_service.hpp"
#include "nbdmap/process/subprocess.hpp"

using namespace nbdmap;

TEST_CASE("run_command captures exit status and stderr") {
  auto ok = process::run_command({"sh", "-c", "exit 0"});
  REQUIRE(ok.ok());
  CHECK(ok.value.success());

  auto failed = process::run_command({"sh", "-c", "echo 'Connection refused' >&2; exit 3"});
  REQUIRE(failed.ok());
  CHECK_FALSE(failed.value.success());
  CHECK(failed.value.exit_code == 3);
  CHECK(failed.value.stderr_text.find("Connection refused") != std::string::npos);
}

TEST_CASE("run_command reports missing executables") {
  auto missing = process::run_command({"nbdmap-test-no-such-binary"});
  CHECK(missing.status.code == error_code::process_error);
}

TEST_CASE("child process can be terminated") {
  auto spawned = process::child_process::spawn({"sleep", "30"});
  REQUIRE(spawned.ok());
  auto& child = *spawned.value;
  CHECK(child.pid() > 0);
  CHECK(child.running());

  child.terminate(std::chrono::milliseconds(2000));
  CHECK_FALSE(child.running());
  CHECK(child.exit_status().signal != 0);
  child.terminate();
}

TEST_CASE("child process notices an early exit") {
  auto spawned = process::child_process::spawn({"sh", "-c", "exit 2"});
  REQUIRE(spawned.ok());
  auto& child = *spawned.value;

  for (int i = 0; i < 100 && child.running(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  CHECK_FALSE(child.running());
  CHECK(child.exit_status().exit_code == 2);
}

TEST_CASE("nbdkit command carries filters and plugin parameters") {
  process::export_settings settings{};
  settings.plugin = "/usr/share/nbdmap/nbdkit-plugin.py";
  settings.routing_table = "/tmp/nbdmap-abc123.json";
  settings.port = 10900;
  settings.export_name = "vda";
  settings.threads = 4;
  settings.block_size = 65536;
  settings.copy_on_write = true;

  auto argv = process::build_nbdkit_command(settings);
  auto has = [&](const std::string& value) { return std::find(argv.begin(), argv.end(), value) != argv.end(); };

  CHECK(argv.front() == "nbdkit");
  CHECK(has("--foreground"));
  CHECK(has("--exit-with-parent"));
  CHECK(has("10900"));
  CHECK(has("vda"));
  CHECK(has("4"));
  CHECK(has("--filter=blocksize"));
  CHECK(has("--filter=cow"));
  CHECK_FALSE(has("--readonly"));
  CHECK(has("python"));
  CHECK(has("blockmap=/tmp/nbdmap-abc123.json"));
  CHECK(argv.back() == "maxlen=65536");

  auto filter = std::find(argv.begin(), argv.end(), "--filter=blocksize");
  auto plugin = std::find(argv.begin(), argv.end(), "python");
  CHECK(filter < plugin);
}

TEST_CASE("read-only exports pass --readonly without copy-on-write") {
  process::export_settings settings{};
  settings.read_only = true;
  auto argv = process::build_nbdkit_command(settings);
  CHECK(std::find(argv.begin(), argv.end(), "--readonly") != argv.end());
  CHECK(std::find(argv.begin(), argv.end(), "--filter=cow") == argv.end());
}

TEST_CASE("qemu-nbd connect command targets the export uri") {
  attach::qemu_nbd_transport transport("qemu-nbd");
  attach::attach_request request{};
  request.device = "/dev/nbd0";
  request.endpoint.host = "127.0.0.1";
  request.endpoint.port = 10809;
  request.endpoint.export_name = "sda";

  auto argv = transport.connect_command(request);
  REQUIRE(argv.size() >= 4);
  CHECK(argv[0] == "qemu-nbd");
  CHECK(argv[1] == "-c");
  CHECK(argv[2] == "/dev/nbd0");
  CHECK(argv.back() == "nbd://127.0.0.1:10809/sda");
  CHECK(std::find(argv.begin(), argv.end(), "--read-only") == argv.end());

  request.read_only = true;
  argv = transport.connect_command(request);
  CHECK(std::find(argv.begin(), argv.end(), "--read-only") != argv.end());
}
