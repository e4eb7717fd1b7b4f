#include "internal/util/process.hpp"

#include <sys/stat.h>

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/tiling/tiling_converter.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/fakes.hpp"

using namespace std::chrono_literals;

namespace {

// Writes an executable shell script standing in for the tiling tool.
std::filesystem::path WriteScript(const std::filesystem::path& dir, const std::string& name, const std::string& body) {
  const auto path = dir / name;
  lidar::testing::WriteText(path, "#!/bin/sh\n" + body);
  chmod(path.c_str(), 0755);
  return path;
}

void TestCapturesOutputAndExitCode() {
  const auto ok = lidar::util::RunProcess({"sh", "-c", "echo hello; echo oops 1>&2"}, 5s);
  assert(ok.exit_code == 0);
  assert(!ok.timed_out);
  assert(ok.output.find("hello") != std::string::npos);
  assert(ok.output.find("oops") != std::string::npos);

  const auto failed = lidar::util::RunProcess({"sh", "-c", "exit 3"}, 5s);
  assert(failed.exit_code == 3);
}

void TestMissingProgramExits127() {
  const auto result = lidar::util::RunProcess({"lidar-no-such-program"}, 5s);
  assert(result.exit_code == 127);
}

void TestTimeoutKillsChild() {
  const auto start  = std::chrono::steady_clock::now();
  const auto result = lidar::util::RunProcess({"sh", "-c", "sleep 10"}, 200ms);
  assert(result.timed_out);
  assert(std::chrono::steady_clock::now() - start < 5s);
}

void TestConverterWritesManifest() {
  const auto dir    = lidar::testing::FreshDirectory("converter_ok");
  const auto script = WriteScript(dir, "fake-tiler", "mkdir -p \"$4\" && echo '{}' > \"$4/tileset.json\"\n");

  lidar::tiling::Py3dtilesConverter converter(script.string());
  const auto manifest = converter.Convert(dir / "colored.laz", dir / "tiles", std::chrono::steady_clock::now() + 10s);
  assert(manifest == dir / "tiles" / "tileset.json");
}

void TestConverterWithoutManifestFails() {
  const auto dir    = lidar::testing::FreshDirectory("converter_no_manifest");
  const auto script = WriteScript(dir, "fake-tiler", "mkdir -p \"$4\"\n");

  lidar::tiling::Py3dtilesConverter converter(script.string());
  bool                              threw = false;
  try {
    converter.Convert(dir / "colored.laz", dir / "tiles", std::chrono::steady_clock::now() + 10s);
  } catch (const lidar::util::ToolFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestConverterFailureCarriesOutput() {
  const auto dir    = lidar::testing::FreshDirectory("converter_exit");
  const auto script = WriteScript(dir, "fake-tiler", "echo 'unsupported point format'\nexit 2\n");

  lidar::tiling::Py3dtilesConverter converter(script.string());
  try {
    converter.Convert(dir / "colored.laz", dir / "tiles", std::chrono::steady_clock::now() + 10s);
    assert(false && "converter must fail");
  } catch (const lidar::util::ToolFailure& e) {
    assert(std::string(e.what()).find("unsupported point format") != std::string::npos);
  }
}

void TestConverterHonoursDeadline() {
  const auto dir    = lidar::testing::FreshDirectory("converter_deadline");
  const auto script = WriteScript(dir, "fake-tiler", "sleep 10\n");

  lidar::tiling::Py3dtilesConverter converter(script.string());

  bool expired = false;
  try {
    converter.Convert(dir / "colored.laz", dir / "tiles", std::chrono::steady_clock::now() - 1s);
  } catch (const lidar::util::DeadlineExceeded&) {
    expired = true;
  }
  assert(expired);

  bool timed_out = false;
  try {
    converter.Convert(dir / "colored.laz", dir / "tiles", std::chrono::steady_clock::now() + 300ms);
  } catch (const lidar::util::DeadlineExceeded&) {
    timed_out = true;
  }
  assert(timed_out);
}

} // namespace

int main() {
  TestCapturesOutputAndExitCode();
  TestMissingProgramExits127();
  TestTimeoutKillsChild();
  TestConverterWritesManifest();
  TestConverterWithoutManifestFails();
  TestConverterFailureCarriesOutput();
  TestConverterHonoursDeadline();

  std::cout << "lidar_unit_process: pass\n";
  return 0;
}
