#pragma once

#include "sms_types.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace smsgw::gateway {

// Process-wide provider session. At most one login is in flight at a time;
// callers that arrive during a login wait for it and share its outcome.
class SessionCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    // ttl of zero disables age-based expiry
    SessionCache(std::shared_ptr<SmsApi> api,
                 std::string username,
                 std::string password,
                 std::chrono::seconds ttl,
                 Clock clock = [] { return std::chrono::steady_clock::now(); });

    SessionCache(const SessionCache&) = delete;
    SessionCache& operator=(const SessionCache&) = delete;

    LoginResult acquire(const CancellationToken& cancel);

    // Next acquire() logs in again
    void invalidate();

    // Drops the cached credential only if it is still `stale`
    void invalidate(const SessionCredential& stale);

    bool has_credential() const;

private:
    bool is_fresh(const SessionCredential& credential) const;

    std::shared_ptr<SmsApi> api_;
    std::string username_;
    std::string password_;
    std::chrono::seconds ttl_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::condition_variable login_done_;
    std::optional<SessionCredential> credential_;
    std::optional<AuthError> last_error_;
    bool login_in_flight_ = false;
    uint64_t generation_ = 0;  // bumped whenever a login outcome is published
};

}  // namespace smsgw::gateway
