#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include "session_registry.hpp"

namespace fs = std::filesystem;

// SessionRegistry persisted as YAML (default ~/.tether/sessions.yaml).
// Every call re-reads the file, so two processes see each other's writes.
class SessionStore : public SessionRegistry {
public:
    explicit SessionStore(fs::path path);

    std::optional<SavedSession> get(const std::string& name) const override;
    Result<void> put(const SavedSession& session) override;
    Result<void> remove(const std::string& name) override;
    std::vector<SavedSession> list() const override;

    const fs::path& path() const { return path_; }

private:
    using SessionMap = std::map<std::string, SavedSession>;

    SessionMap load_locked() const;
    Result<void> save_locked(const SessionMap& sessions) const;

    fs::path path_;
    mutable std::mutex mutex_;
};
