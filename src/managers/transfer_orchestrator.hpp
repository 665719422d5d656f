#pragma once

#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <ssh/ssh_client.hpp>

namespace fs = std::filesystem;

enum class TransferDirection {
    Upload,
    Download,
};

const char* to_string(TransferDirection direction);

struct TransferJob {
    uint64_t id = 0;
    TransferDirection direction = TransferDirection::Upload;
    fs::path local_path;
    std::string remote_path;
};

enum class TransferStatus {
    Succeeded,
    Failed,
};

// Terminal event; exactly one per job.
struct TransferEvent {
    TransferJob job;
    TransferStatus status = TransferStatus::Succeeded;
    std::optional<TransferErrorKind> error;
    std::string message;
};

struct TransferProgress {
    uint64_t job_id = 0;
    uint64_t bytes_done = 0;
    uint64_t bytes_total = 0;   // 0 when unknown
};

using TransferEventCallback = std::function<void(const TransferEvent&)>;
using TransferProgressCallback = std::function<void(const TransferProgress&)>;

// Runs each upload/download on its own thread with its own SFTP session over
// the shared transport. Jobs are independent of each other and of the shell;
// none is cancellable. Callbacks run on the job's thread.
class TransferOrchestrator {
public:
    explicit TransferOrchestrator(TransferEventCallback on_event,
                                  TransferProgressCallback on_progress = nullptr);
    ~TransferOrchestrator();

    TransferJob upload(std::shared_ptr<Transport> transport, const fs::path& local,
                       const std::string& remote);
    TransferJob download(std::shared_ptr<Transport> transport, const std::string& remote,
                         const fs::path& local);

    // Block until every started job has reported its terminal event.
    void wait_all();

    size_t active_count() const;

    TransferOrchestrator(const TransferOrchestrator&) = delete;
    TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

private:
    TransferJob launch(std::shared_ptr<Transport> transport, TransferJob job);
    void run_job(std::shared_ptr<Transport> transport, TransferJob job);
    TransferOutcome execute(Transport* transport, const TransferJob& job);
    void join_finished_locked();

    TransferEventCallback on_event_;
    TransferProgressCallback on_progress_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<uint64_t, std::thread> running_;
    std::vector<std::thread> finished_;
    uint64_t next_id_ = 1;
};
