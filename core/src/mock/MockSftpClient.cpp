#include "sitebackup/MockSftpClient.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace sitebackup {

namespace {

std::string normalize(const std::string& path) {
    if (path.empty() || path == "/") return "/";
    std::string out = path;
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    if (out.front() != '/') out.insert(out.begin(), '/');
    return out;
}

std::string parentOf(const std::string& path) {
    const auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return path.substr(0, pos);
}

std::string baseName(const std::string& path) {
    const auto pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

} // namespace

MockSftpClient::MockSftpClient() {
    Node root;
    root.is_dir = true;
    fs_["/"] = root;
}

bool MockSftpClient::connect(const SshConnectionConfig& cfg,
                             std::chrono::milliseconds /*timeout*/,
                             Failure& err) {
    ++connectCalls_;
    if (connected_) {
        err = makeFailure(FailureSource::Internal, 0, "already connected");
        return false;
    }
    if (cfg.hostname.empty() || cfg.username.empty()) {
        err = makeFailure(FailureSource::Internal, 0, "host and user are required");
        return false;
    }
    if (!connectFailure_.empty()) {
        err = connectFailure_;
        return false;
    }
    if (!authorizedKey_.empty() && cfg.key_path != authorizedKey_) {
        err = makeFailure(FailureSource::Authentication, -18,
                          "publickey authentication rejected by mock server");
        return false;
    }
    connected_ = true;
    lastCfg_ = cfg;
    return true;
}

void MockSftpClient::disconnect() {
    connected_ = false;
}

bool MockSftpClient::requireConnected(Failure& err) const {
    if (connected_) return true;
    err = makeFailure(FailureSource::Network, ENOTCONN, "not connected");
    return false;
}

bool MockSftpClient::list(const std::string& remote_path,
                          std::vector<FileInfo>& out,
                          Failure& err) {
    if (!requireConnected(err)) return false;
    const std::string path = normalize(remote_path);
    listed_.push_back(path);

    auto fit = listFailures_.find(path);
    if (fit != listFailures_.end()) {
        err = fit->second;
        return false;
    }
    auto it = fs_.find(path);
    if (it == fs_.end()) {
        err = makeFailure(FailureSource::RemoteStatus, SftpStatus::NoSuchFile,
                          "no such directory in mock: " + path);
        return false;
    }
    if (!it->second.is_dir) {
        err = makeFailure(FailureSource::RemoteStatus, SftpStatus::NotADirectory,
                          "not a directory in mock: " + path);
        return false;
    }

    out.clear();
    for (const auto& kv : fs_) {
        if (kv.first == "/" || parentOf(kv.first) != path) continue;
        FileInfo fi;
        fi.name = baseName(kv.first);
        fi.is_dir = kv.second.is_dir;
        fi.size = kv.second.size;
        fi.mode = kv.second.is_dir ? 0040755 : 0100644;
        out.push_back(std::move(fi));
    }
    auto xit = listedEntries_.find(path);
    if (xit != listedEntries_.end())
        out.insert(out.end(), xit->second.begin(), xit->second.end());
    return true;
}

bool MockSftpClient::stat(const std::string& remote_path,
                          FileInfo& info,
                          Failure& err) {
    if (!requireConnected(err)) return false;
    const std::string path = normalize(remote_path);
    auto it = fs_.find(path);
    if (it == fs_.end()) {
        err = makeFailure(FailureSource::RemoteStatus, SftpStatus::NoSuchFile,
                          "no such path in mock: " + path);
        return false;
    }
    info.name = baseName(path);
    info.is_dir = it->second.is_dir;
    info.size = it->second.size;
    info.mode = it->second.is_dir ? 0040755 : 0100644;
    return true;
}

bool MockSftpClient::get(const std::string& remote,
                         const std::string& local,
                         std::size_t chunkSize,
                         std::optional<Clock::time_point> deadline,
                         Failure& err,
                         const ChunkCB& onChunk) {
    const std::string path = normalize(remote);
    ++getCalls_[path];
    deadlines_[path] = deadline;
    if (beforeGet_) beforeGet_(path);
    if (!requireConnected(err)) return false;

    auto it = fs_.find(path);
    if (it == fs_.end() || it->second.is_dir) {
        err = makeFailure(FailureSource::RemoteStatus, SftpStatus::NoSuchFile,
                          "cannot open remote file in mock: " + path);
        return false;
    }

    auto pit = getFailures_.find(path);
    if (pit != getFailures_.end() && pit->second.remaining > 0) {
        --pit->second.remaining;
        const std::size_t n = std::min(pit->second.afterBytes, it->second.content.size());
        if (n > 0) {
            std::ofstream partial(local, std::ios::binary | std::ios::trunc);
            partial.write(it->second.content.data(), static_cast<std::streamsize>(n));
            if (onChunk) onChunk(n);
        }
        err = pit->second.failure;
        if (err.source == FailureSource::Network) connected_ = false;
        return false;
    }

    if (it->second.sized_only) {
        if (deadline && Clock::now() >= *deadline) {
            err = makeFailure(FailureSource::Timeout, 0, "file transfer deadline exceeded: " + path);
            return false;
        }
        err = makeFailure(FailureSource::RemoteStatus, SftpStatus::OpUnsupported,
                          "mock file has no content: " + path);
        return false;
    }

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        const int e = errno;
        err = makeFailure(FailureSource::LocalIo, e,
                          "cannot create local file " + local + ": " + std::strerror(e));
        return false;
    }
    const std::string& data = it->second.content;
    const std::size_t step = std::max<std::size_t>(chunkSize, 1);
    for (std::size_t off = 0; off < data.size(); off += step) {
        if (deadline && Clock::now() >= *deadline) {
            err = makeFailure(FailureSource::Timeout, 0, "file transfer deadline exceeded: " + path);
            return false;
        }
        const std::size_t n = std::min(step, data.size() - off);
        out.write(data.data() + off, static_cast<std::streamsize>(n));
        if (!out) {
            const int e = errno;
            err = makeFailure(FailureSource::LocalIo, e, "local write failed: " + local);
            return false;
        }
        if (onChunk) onChunk(n);
    }
    return true;
}

void MockSftpClient::addDirectory(const std::string& path) {
    const std::string p = normalize(path);
    if (p != "/") addDirectory(parentOf(p));
    Node& n = fs_[p];
    n.is_dir = true;
}

void MockSftpClient::addFile(const std::string& path, const std::string& content) {
    const std::string p = normalize(path);
    addDirectory(parentOf(p));
    Node n;
    n.content = content;
    n.size = content.size();
    fs_[p] = n;
}

void MockSftpClient::addSizedFile(const std::string& path, std::uint64_t size) {
    const std::string p = normalize(path);
    addDirectory(parentOf(p));
    Node n;
    n.size = size;
    n.sized_only = true;
    fs_[p] = n;
}

void MockSftpClient::addListedEntry(const std::string& dir, const FileInfo& entry) {
    listedEntries_[normalize(dir)].push_back(entry);
}

void MockSftpClient::failNextGets(const std::string& path, int times, const Failure& f,
                                  std::size_t afterBytes) {
    PendingFailure pf;
    pf.remaining = times;
    pf.failure = f;
    pf.afterBytes = afterBytes;
    getFailures_[normalize(path)] = pf;
}

void MockSftpClient::failList(const std::string& path, const Failure& f) {
    listFailures_[normalize(path)] = f;
}

int MockSftpClient::getCalls(const std::string& path) const {
    auto it = getCalls_.find(normalize(path));
    return it == getCalls_.end() ? 0 : it->second;
}

std::optional<SftpClient::Clock::time_point>
MockSftpClient::lastDeadline(const std::string& path) const {
    auto it = deadlines_.find(normalize(path));
    if (it == deadlines_.end()) return std::nullopt;
    return it->second;
}

} // namespace sitebackup
