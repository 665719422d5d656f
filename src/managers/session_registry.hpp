#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/utils.hpp>

// Named connection profiles. The only component that persists anything.
class SessionRegistry {
public:
    virtual ~SessionRegistry() = default;

    virtual std::optional<SavedSession> get(const std::string& name) const = 0;

    // Insert or replace by name.
    virtual Result<void> put(const SavedSession& session) = 0;

    virtual Result<void> remove(const std::string& name) = 0;

    // All sessions ordered by name.
    virtual std::vector<SavedSession> list() const = 0;

    // Sessions connected at least once, most recent first.
    virtual std::vector<SavedSession> history() const {
        std::vector<SavedSession> out;
        for (auto& s : list()) {
            if (s.last_connected) out.push_back(s);
        }
        std::stable_sort(out.begin(), out.end(), [](const SavedSession& a, const SavedSession& b) {
            return parse_iso_time(*a.last_connected) > parse_iso_time(*b.last_connected);
        });
        return out;
    }
};
