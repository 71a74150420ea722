#pragma once
#include "SftpClient.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sitebackup {

// In-memory "remote filesystem" used by tests and dry runs. Paths are
// absolute and '/'-separated; parents are created implicitly.
class MockSftpClient : public SftpClient {
public:
    MockSftpClient();

    bool connect(const SshConnectionConfig& cfg,
                 std::chrono::milliseconds timeout,
                 Failure& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool list(const std::string& remote_path,
              std::vector<FileInfo>& out,
              Failure& err) override;

    bool stat(const std::string& remote_path,
              FileInfo& info,
              Failure& err) override;

    bool get(const std::string& remote,
             const std::string& local,
             std::size_t chunkSize,
             std::optional<Clock::time_point> deadline,
             Failure& err,
             const ChunkCB& onChunk = {}) override;

    // Tree setup
    void addDirectory(const std::string& path);
    void addFile(const std::string& path, const std::string& content);
    // File whose listing reports `size` without holding the bytes; get()
    // fails with OpUnsupported once its deadline check passes.
    void addSizedFile(const std::string& path, std::uint64_t size);
    // Entry returned verbatim by list(dir), whatever its name contains.
    void addListedEntry(const std::string& dir, const FileInfo& entry);

    // Only this key path authenticates (empty: any key is accepted).
    void setAuthorizedKey(const std::string& keyPath) { authorizedKey_ = keyPath; }
    // Every connect() fails with this failure until cleared.
    void setConnectFailure(const Failure& f) { connectFailure_ = f; }
    // The next `times` get() calls for `path` fail with `f`, after writing
    // `afterBytes` of the content. Network failures also drop the
    // connection, like a real transport would.
    void failNextGets(const std::string& path, int times, const Failure& f,
                      std::size_t afterBytes = 0);
    // list() on `path` always fails with `f`.
    void failList(const std::string& path, const Failure& f);
    // Invoked at the start of every get() (e.g. to cancel mid-run).
    void setBeforeGet(std::function<void(const std::string&)> cb) { beforeGet_ = std::move(cb); }

    // Observations
    int connectCalls() const { return connectCalls_; }
    int getCalls(const std::string& path) const;
    const std::vector<std::string>& listedPaths() const { return listed_; }
    const SshConnectionConfig& lastConfig() const { return lastCfg_; }
    // Deadline passed to the latest get() for `path`.
    std::optional<Clock::time_point> lastDeadline(const std::string& path) const;

private:
    struct Node {
        bool is_dir = false;
        std::string content;
        std::uint64_t size = 0;
        bool sized_only = false;
    };
    struct PendingFailure {
        int remaining = 0;
        Failure failure;
        std::size_t afterBytes = 0;
    };

    bool connected_ = false;
    SshConnectionConfig lastCfg_{};
    std::string authorizedKey_;
    Failure connectFailure_{};
    int connectCalls_ = 0;
    std::map<std::string, Node> fs_;
    std::unordered_map<std::string, PendingFailure> getFailures_;
    std::unordered_map<std::string, Failure> listFailures_;
    std::unordered_map<std::string, int> getCalls_;
    std::unordered_map<std::string, std::optional<Clock::time_point>> deadlines_;
    std::unordered_map<std::string, std::vector<FileInfo>> listedEntries_;
    std::vector<std::string> listed_;
    std::function<void(const std::string&)> beforeGet_;

    bool requireConnected(Failure& err) const;
};

} // namespace sitebackup
