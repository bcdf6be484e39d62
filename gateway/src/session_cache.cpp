#include "session_cache.hpp"
#include "logger.hpp"

namespace smsgw::gateway {

namespace {

// Waiters re-check their own cancellation at this interval
constexpr auto kWaitSlice = std::chrono::milliseconds(50);

}  // namespace

SessionCache::SessionCache(std::shared_ptr<SmsApi> api,
                           std::string username,
                           std::string password,
                           std::chrono::seconds ttl,
                           Clock clock)
    : api_(std::move(api))
    , username_(std::move(username))
    , password_(std::move(password))
    , ttl_(ttl)
    , clock_(std::move(clock)) {
}

bool SessionCache::is_fresh(const SessionCredential& credential) const {
    return ttl_.count() == 0 || clock_() - credential.acquired_at < ttl_;
}

LoginResult SessionCache::acquire(const CancellationToken& cancel) {
    std::unique_lock<std::mutex> lock(mutex_);

    for (;;) {
        if (credential_) {
            if (is_fresh(*credential_)) {
                return *credential_;
            }
            LOG_INFO("SMS API session expired, logging in again");
            credential_.reset();
        }

        if (cancel.cancelled()) {
            return AuthError{AuthErrorKind::Unavailable, 0, "cancelled"};
        }

        if (!login_in_flight_) {
            break;
        }

        uint64_t seen = generation_;
        login_done_.wait_for(lock, kWaitSlice, [&] {
            return !login_in_flight_ || generation_ != seen;
        });

        if (generation_ != seen && !credential_ && last_error_) {
            // The leader failed; share its outcome instead of piling on
            return *last_error_;
        }
    }

    login_in_flight_ = true;
    lock.unlock();

    LoginResult result;
    try {
        result = api_->login(username_, password_, cancel);
    } catch (const std::exception& e) {
        result = AuthError{AuthErrorKind::Unavailable, 0, e.what()};
    }

    lock.lock();
    login_in_flight_ = false;

    if (auto* credential = std::get_if<SessionCredential>(&result)) {
        credential->acquired_at = clock_();
        credential_ = *credential;
        last_error_.reset();
        ++generation_;
    } else if (!cancel.cancelled()) {
        const auto& error = std::get<AuthError>(result);
        LOG_ERROR_FMT("SMS API login failed ({}): {}", to_string(error.kind), error.detail);
        last_error_ = error;
        ++generation_;
    }
    // A cancelled leader publishes nothing; a waiter takes over

    login_done_.notify_all();
    return result;
}

void SessionCache::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    credential_.reset();
}

void SessionCache::invalidate(const SessionCredential& stale) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (credential_ && credential_->same_keys(stale)) {
        credential_.reset();
    }
}

bool SessionCache::has_credential() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credential_.has_value();
}

}  // namespace smsgw::gateway
