#include "transfer_orchestrator.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

const char* to_string(TransferDirection direction) {
    return direction == TransferDirection::Upload ? "upload" : "download";
}

namespace {

// Closes the secondary session on every path out of a job.
struct SessionCloser {
    FileTransferSession* session;
    ~SessionCloser() { session->close(); }
};

} // namespace

// ── Construction / Destruction ──────────────────────────────

TransferOrchestrator::TransferOrchestrator(TransferEventCallback on_event,
                                           TransferProgressCallback on_progress)
    : on_event_(std::move(on_event)), on_progress_(std::move(on_progress)) {}

TransferOrchestrator::~TransferOrchestrator() {
    wait_all();
    std::lock_guard<std::mutex> lock(mutex_);
    join_finished_locked();
}

// ── Job launch ──────────────────────────────────────────────

TransferJob TransferOrchestrator::upload(std::shared_ptr<Transport> transport,
                                         const fs::path& local, const std::string& remote) {
    TransferJob job;
    job.direction = TransferDirection::Upload;
    job.local_path = local;
    job.remote_path = remote;
    return launch(std::move(transport), std::move(job));
}

TransferJob TransferOrchestrator::download(std::shared_ptr<Transport> transport,
                                           const std::string& remote, const fs::path& local) {
    TransferJob job;
    job.direction = TransferDirection::Download;
    job.local_path = local;
    job.remote_path = remote;
    return launch(std::move(transport), std::move(job));
}

TransferJob TransferOrchestrator::launch(std::shared_ptr<Transport> transport, TransferJob job) {
    std::lock_guard<std::mutex> lock(mutex_);
    join_finished_locked();
    job.id = next_id_++;
    tether_log(fmt::format("transfer #{}: {} {} <-> {}", job.id, to_string(job.direction),
                           job.local_path.string(), job.remote_path));
    // The worker cannot retire itself before it is registered: it needs mutex_.
    running_.emplace(job.id, std::thread(&TransferOrchestrator::run_job, this,
                                         std::move(transport), job));
    return job;
}

void TransferOrchestrator::join_finished_locked() {
    for (auto& t : finished_) {
        if (t.joinable()) t.join();
    }
    finished_.clear();
}

void TransferOrchestrator::wait_all() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return running_.empty(); });
}

size_t TransferOrchestrator::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.size();
}

// ── Job execution ───────────────────────────────────────────

TransferOutcome TransferOrchestrator::execute(Transport* transport, const TransferJob& job) {
    if (!transport || !transport->is_open()) {
        return TransferOutcome::Err(TransferErrorKind::TransportLost, "Not connected");
    }
    if (job.direction == TransferDirection::Upload) {
        std::error_code ec;
        if (!fs::is_regular_file(job.local_path, ec)) {
            return TransferOutcome::Err(TransferErrorKind::IOError,
                                        "Local file not found: " + job.local_path.string());
        }
    }

    auto opened = transport->open_file_transfer();
    if (opened.is_err()) {
        return TransferOutcome::Err(opened.kind, opened.error);
    }
    std::unique_ptr<FileTransferSession> session = std::move(opened.value);
    SessionCloser closer{session.get()};

    ByteProgress progress;
    if (on_progress_) {
        uint64_t id = job.id;
        progress = [this, id](uint64_t done, uint64_t total) {
            on_progress_(TransferProgress{id, done, total});
        };
    }

    if (job.direction == TransferDirection::Upload) {
        return session->put(job.local_path, job.remote_path, progress);
    }
    return session->get(job.remote_path, job.local_path, progress);
}

void TransferOrchestrator::run_job(std::shared_ptr<Transport> transport, TransferJob job) {
    TransferOutcome outcome = execute(transport.get(), job);
    transport.reset();

    TransferEvent event;
    event.job = job;
    if (outcome.is_ok()) {
        event.status = TransferStatus::Succeeded;
        tether_log(fmt::format("transfer #{}: succeeded", job.id));
    } else {
        event.status = TransferStatus::Failed;
        event.error = outcome.kind;
        event.message = outcome.error;
        tether_log(fmt::format("transfer #{}: failed ({}): {}", job.id,
                               to_string(outcome.kind), outcome.error));
    }
    if (on_event_) on_event_(event);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = running_.find(job.id);
    if (it != running_.end()) {
        finished_.push_back(std::move(it->second));
        running_.erase(it);
    }
    idle_cv_.notify_all();
}
