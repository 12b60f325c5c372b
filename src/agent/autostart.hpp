#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace netdiag::agent {

inline constexpr const char* kAutostartEntryName = "netdiag-agent";

// Command line registered for login startup: the agent binary with an explicit
// `--config`, each path double-quoted.
std::string BuildAutostartCommand(const std::filesystem::path& executable,
                                  const std::filesystem::path& config_path);

// XDG autostart entry contents for `command`.
std::string BuildDesktopEntry(const std::string& command);

// `$XDG_CONFIG_HOME/autostart/netdiag-agent.desktop`, falling back to
// `$HOME/.config/autostart/...`. Empty when neither variable is set.
std::filesystem::path ResolveDesktopEntryPath();

// Path of the running binary, if the platform can report it.
std::optional<std::filesystem::path> CurrentExecutablePath();

// Registers the agent to start at user login. Linux and other XDG desktops get
// a `.desktop` file; Windows gets a value under
// `HKCU\Software\Microsoft\Windows\CurrentVersion\Run`. Rewriting an existing
// registration is not an error.
bool RegisterAutostart(const std::filesystem::path& executable,
                       const std::filesystem::path& config_path,
                       std::string& error);

} // namespace netdiag::agent
