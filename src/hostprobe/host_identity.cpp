#include "hostprobe/host_identity.hpp"

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <sys/utsname.h>
#include <unistd.h>
#endif

namespace netdiag::hostprobe {

namespace {

std::string DetectOsName() {
#if defined(_WIN32)
  return "Windows";
#else
  struct utsname uts{};
  if (uname(&uts) == 0 && uts.sysname[0] != '\0') {
    return std::string(uts.sysname);
  }
#if defined(__APPLE__)
  return "Darwin";
#elif defined(__linux__)
  return "Linux";
#else
  return kUnknownHostField;
#endif
#endif
}

std::string DetectHostname() {
#if defined(_WIN32)
  char name[256] = {};
  DWORD size = static_cast<DWORD>(sizeof(name) / sizeof(name[0]));
  if (GetComputerNameA(name, &size) != 0 && size > 0U) {
    return std::string(name, size);
  }
#else
  char name[256] = {};
  if (gethostname(name, sizeof(name)) == 0) {
    name[sizeof(name) - 1U] = '\0';
    if (name[0] != '\0') {
      return std::string(name);
    }
  }
#endif
  return kUnknownHostField;
}

} // namespace

HostIdentity CollectHostIdentity() {
  HostIdentity identity;
  identity.os_name = DetectOsName();
  identity.hostname = DetectHostname();
  return identity;
}

} // namespace netdiag::hostprobe
