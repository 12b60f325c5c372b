#include "agent/autostart.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace netdiag::agent {

namespace {

std::string Quote(const fs::path& path) {
  return "\"" + path.string() + "\"";
}

#if defined(_WIN32)
constexpr const char* kRunKeyPath = "Software\\Microsoft\\Windows\\CurrentVersion\\Run";

bool WriteRunKeyValue(const std::string& command, std::string& error) {
  HKEY key = nullptr;
  LONG status = RegOpenKeyExA(HKEY_CURRENT_USER, kRunKeyPath, 0, KEY_SET_VALUE, &key);
  if (status != ERROR_SUCCESS) {
    error = "failed to open HKCU Run key (status=" + std::to_string(status) + ")";
    return false;
  }
  status = RegSetValueExA(key, kAutostartEntryName, 0, REG_SZ,
                          reinterpret_cast<const BYTE*>(command.c_str()),
                          static_cast<DWORD>(command.size() + 1U));
  RegCloseKey(key);
  if (status != ERROR_SUCCESS) {
    error = "failed to write HKCU Run value (status=" + std::to_string(status) + ")";
    return false;
  }
  return true;
}
#else
bool WriteDesktopEntry(const std::string& command, std::string& error) {
  const fs::path entry_path = ResolveDesktopEntryPath();
  if (entry_path.empty()) {
    error = "cannot locate autostart directory: neither XDG_CONFIG_HOME nor HOME is set";
    return false;
  }

  std::error_code ec;
  fs::create_directories(entry_path.parent_path(), ec);
  if (ec) {
    error = "failed to create autostart directory '" + entry_path.parent_path().string() +
            "': " + ec.message();
    return false;
  }

  std::ofstream out(entry_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "failed to open autostart entry: " + entry_path.string();
    return false;
  }
  out << BuildDesktopEntry(command);
  if (!out) {
    error = "failed to write autostart entry: " + entry_path.string();
    return false;
  }
  return true;
}
#endif

} // namespace

std::string BuildAutostartCommand(const fs::path& executable, const fs::path& config_path) {
  std::error_code ec;
  fs::path absolute_config = fs::absolute(config_path, ec);
  if (ec) {
    absolute_config = config_path;
  }
  return Quote(executable) + " run --config " + Quote(absolute_config);
}

std::string BuildDesktopEntry(const std::string& command) {
  std::string entry;
  entry += "[Desktop Entry]\n";
  entry += "Type=Application\n";
  entry += "Name=NetDiag Agent\n";
  entry += "Exec=" + command + "\n";
  entry += "Terminal=false\n";
  entry += "X-GNOME-Autostart-enabled=true\n";
  return entry;
}

fs::path ResolveDesktopEntryPath() {
  const std::string file_name = std::string(kAutostartEntryName) + ".desktop";
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && xdg[0] != '\0') {
    return fs::path(xdg) / "autostart" / file_name;
  }
  if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0') {
    return fs::path(home) / ".config" / "autostart" / file_name;
  }
  return {};
}

std::optional<fs::path> CurrentExecutablePath() {
#if defined(_WIN32)
  char buffer[MAX_PATH] = {};
  const DWORD size = GetModuleFileNameA(nullptr, buffer, MAX_PATH);
  if (size == 0U || size >= MAX_PATH) {
    return std::nullopt;
  }
  return fs::path(std::string(buffer, size));
#elif defined(__linux__)
  std::error_code ec;
  fs::path resolved = fs::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return std::nullopt;
  }
  return resolved;
#else
  return std::nullopt;
#endif
}

bool RegisterAutostart(const fs::path& executable, const fs::path& config_path,
                       std::string& error) {
  error.clear();
  if (executable.empty()) {
    error = "agent executable path is unknown";
    return false;
  }
  const std::string command = BuildAutostartCommand(executable, config_path);
#if defined(_WIN32)
  return WriteRunKeyValue(command, error);
#else
  return WriteDesktopEntry(command, error);
#endif
}

} // namespace netdiag::agent
