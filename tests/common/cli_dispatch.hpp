#ifndef NETDIAG_TESTS_COMMON_CLI_DISPATCH_HPP_
#define NETDIAG_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "netdiag/cli/router.hpp"

#include <string>
#include <vector>

namespace netdiag::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return netdiag::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

} // namespace netdiag::tests::common

#endif // NETDIAG_TESTS_COMMON_CLI_DISPATCH_HPP_
