#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"

#include <iostream>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

namespace {

using netdiag::tests::common::AssertContains;
using netdiag::tests::common::AssertEqual;
using netdiag::tests::common::DispatchArgs;
using netdiag::tests::common::Fail;

class ScopedStreamCapture {
public:
  explicit ScopedStreamCapture(std::ostream& stream)
      : stream_(stream), original_(stream.rdbuf(captured_.rdbuf())) {}
  ~ScopedStreamCapture() {
    stream_.rdbuf(original_);
  }

  std::string str() const {
    return captured_.str();
  }

private:
  std::ostream& stream_;
  std::ostringstream captured_;
  std::streambuf* original_;
};

void ExpectExit(const std::vector<std::string>& argv, const int expected,
                const std::string& what) {
  const int actual = DispatchArgs(argv);
  if (actual != expected) {
    Fail(what + ": expected exit " + std::to_string(expected) + ", got " +
         std::to_string(actual));
  }
}

} // namespace

int main() {
  {
    ScopedStreamCapture out(std::cout);
    ExpectExit({"netdiag-agent", "version"}, 0, "version");
    AssertEqual(out.str(), "netdiag-agent 0.1.0\n");
  }

  {
    ScopedStreamCapture err(std::cerr);
    ExpectExit({"netdiag-agent", "version", "extra"}, 2, "version with argument");
    ExpectExit({"netdiag-agent", "upload"}, 2, "unknown subcommand");
    AssertContains(err.str(), "unknown subcommand: upload");
    ExpectExit({"netdiag-agent", "run", "--bogus"}, 2, "unknown run option");
    AssertContains(err.str(), "unknown option: --bogus");
    ExpectExit({"netdiag-agent", "run", "--log-level", "loud"}, 2, "bad log level");
    ExpectExit({"netdiag-agent", "run", "--config"}, 2, "missing config value");
    ExpectExit({"netdiag-agent", "probe", "ping"}, 2, "probe without target");
  }

  {
    ScopedStreamCapture out(std::cout);
    ExpectExit({"netdiag-agent", "help"}, 0, "help");
    AssertContains(out.str(), "netdiag-agent probe <ping|tracert> <target>");
  }

  {
    // Rejected before any process starts.
    ScopedStreamCapture out(std::cout);
    ExpectExit({"netdiag-agent", "probe", "nslookup", "example.com"}, 1, "unsupported probe");
    ExpectExit({"netdiag-agent", "probe", "ping", "-f"}, 1, "option-like probe target");
    const std::string printed = out.str();
    AssertContains(printed, "Error: Unsupported command: nslookup");
    AssertContains(printed, "Error: Invalid target: -f");
  }

  const auto temp_root = netdiag::tests::common::CreateUniqueTempDir("netdiag-cli-contract");
  {
    const auto config_path = temp_root / "broken.json";
    netdiag::tests::common::WriteTextFile(config_path, "{\"agreement_id\": ");
    ScopedStreamCapture err(std::cerr);
    ExpectExit({"netdiag-agent", "run", "--config", config_path.string()}, 10,
               "malformed config");
    AssertContains(err.str(), "invalid config JSON");
  }

  {
    const auto config_path = temp_root / "tls.json";
    netdiag::tests::common::WriteTextFile(
        config_path, R"({"agreement_id":"7712345","server_url":"wss://example.com"})");
    ScopedStreamCapture err(std::cerr);
    ExpectExit({"netdiag-agent", "--config", config_path.string()}, 10,
               "implicit run with unsupported server url");
    AssertContains(err.str(), "server_url");
  }

  netdiag::tests::common::RemovePathBestEffort(temp_root);
  return 0;
}
