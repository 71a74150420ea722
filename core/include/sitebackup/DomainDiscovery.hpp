// Remote folder discovery used to pick what to back up.
#pragma once
#include "ConnectionManager.hpp"
#include <string>
#include <vector>

namespace sitebackup {

// Hosting accounts keep one folder per site under the user's home.
std::string defaultDomainRoot(const SshConnectionConfig& cfg);

// Names of the visible directories one level below root (default:
// defaultDomainRoot). Order is whatever the server returns.
bool discoverDomains(Session& session,
                     std::vector<std::string>& out,
                     BackupError& err,
                     const std::string& root = {});

// Backup candidates: every domain-like directory (name contains a '.')
// under the domain root, as "<dir>/public_html" when that exists, else
// "<dir>". Sorted.
bool discoverSites(Session& session,
                   std::vector<std::string>& out,
                   BackupError& err);

// Visible subdirectory names of path ("" and "/" mean the root). Sorted.
bool listDirectories(Session& session,
                     const std::string& path,
                     std::vector<std::string>& out,
                     BackupError& err);

} // namespace sitebackup
