#include "sitebackup/DomainDiscovery.hpp"
#include <algorithm>

namespace sitebackup {

namespace {

std::string joinRemote(const std::string& base, const std::string& name) {
    if (base.empty()) return "/" + name;
    if (base.back() == '/') return base + name;
    return base + "/" + name;
}

bool visibleDirectories(Session& session, const std::string& path,
                        std::vector<std::string>& out, BackupError& err) {
    std::vector<FileInfo> entries;
    Failure f;
    if (!session.client().list(path, entries, f)) {
        err = makeError(f, "listing " + path);
        return false;
    }
    out.clear();
    for (const auto& e : entries) {
        if (!e.is_dir || e.name.empty() || e.name.front() == '.') continue;
        out.push_back(e.name);
    }
    return true;
}

} // namespace

std::string defaultDomainRoot(const SshConnectionConfig& cfg) {
    return "/home/" + cfg.username;
}

bool discoverDomains(Session& session,
                     std::vector<std::string>& out,
                     BackupError& err,
                     const std::string& root) {
    const std::string base = root.empty() ? defaultDomainRoot(session.config()) : root;
    return visibleDirectories(session, base, out, err);
}

bool discoverSites(Session& session,
                   std::vector<std::string>& out,
                   BackupError& err) {
    const std::string base = defaultDomainRoot(session.config());
    std::vector<std::string> names;
    if (!visibleDirectories(session, base, names, err)) return false;

    out.clear();
    for (const auto& name : names) {
        if (name.find('.') == std::string::npos) continue;
        const std::string dir = joinRemote(base, name);
        const std::string publicHtml = joinRemote(dir, "public_html");
        FileInfo info;
        Failure f;
        if (session.client().stat(publicHtml, info, f) && info.is_dir)
            out.push_back(publicHtml);
        else
            out.push_back(dir);
    }
    std::sort(out.begin(), out.end());
    return true;
}

bool listDirectories(Session& session,
                     const std::string& path,
                     std::vector<std::string>& out,
                     BackupError& err) {
    const std::string p = path.empty() ? "/" : path;
    if (!visibleDirectories(session, p, out, err)) return false;
    std::sort(out.begin(), out.end());
    return true;
}

} // namespace sitebackup
