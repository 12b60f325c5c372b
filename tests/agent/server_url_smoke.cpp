#include "../common/assertions.hpp"
#include "agent/server_url.hpp"

#include <string>

int main() {
  using netdiag::agent::ParseServerUrl;
  using netdiag::agent::ServerEndpoint;
  using netdiag::tests::common::AssertContains;
  using netdiag::tests::common::AssertEqual;
  using netdiag::tests::common::Fail;

  {
    ServerEndpoint endpoint;
    std::string error;
    if (!ParseServerUrl("ws://ort.chrsnv.ru:8765", endpoint, error)) {
      Fail("expected default server url to parse: " + error);
    }
    AssertEqual(endpoint.host, "ort.chrsnv.ru");
    AssertEqual(endpoint.port, "8765");
    AssertEqual(endpoint.target, "/");
    AssertEqual(endpoint.HostHeader(), "ort.chrsnv.ru:8765");
  }

  {
    ServerEndpoint endpoint;
    std::string error;
    if (!ParseServerUrl("ws://control.example/agents/v1", endpoint, error)) {
      Fail("expected url with path to parse: " + error);
    }
    AssertEqual(endpoint.port, "80");
    AssertEqual(endpoint.target, "/agents/v1");
    AssertEqual(endpoint.HostHeader(), "control.example");
  }

  {
    ServerEndpoint endpoint;
    std::string error;
    if (!ParseServerUrl("ws://[::1]:9001", endpoint, error)) {
      Fail("expected IPv6 literal to parse: " + error);
    }
    AssertEqual(endpoint.host, "::1");
    AssertEqual(endpoint.port, "9001");
    AssertEqual(endpoint.HostHeader(), "[::1]:9001");
  }

  const struct {
    const char* url;
    const char* expected;
  } invalid[] = {
      {"wss://secure.example", "not supported"},
      {"http://example.com", "must start with ws://"},
      {"ws://", "no host"},
      {"ws://host:0", "invalid port"},
      {"ws://host:70000", "invalid port"},
      {"ws://host:80a", "invalid port"},
      {"ws://[::1", "unterminated IPv6"},
  };
  for (const auto& test_case : invalid) {
    ServerEndpoint endpoint;
    std::string error;
    if (ParseServerUrl(test_case.url, endpoint, error)) {
      Fail(std::string("expected url to be rejected: ") + test_case.url);
    }
    AssertContains(error, test_case.expected);
  }

  return 0;
}
