#pragma once

#include "config.hpp"
#include "net/cancellation.hpp"
#include <string>
#include <optional>
#include <variant>
#include <chrono>

namespace smsgw::gateway {

// Provider-issued key pair authorizing SMS submission
struct SessionCredential {
    std::string user_key;
    std::string session_key;
    std::chrono::steady_clock::time_point acquired_at;

    bool same_keys(const SessionCredential& other) const {
        return user_key == other.user_key && session_key == other.session_key;
    }
};

enum class AuthErrorKind {
    LoginRejected,      // non-2xx login response
    MalformedResponse,  // 2xx body is not "user_key;session_key"
    Unavailable         // transport failure, timeout or cancellation
};

struct AuthError {
    AuthErrorKind kind = AuthErrorKind::Unavailable;
    int status_code = 0;
    std::string detail;
};

using LoginResult = std::variant<SessionCredential, AuthError>;

struct SmsRequest {
    std::string recipient;
    std::string message;
    MessageQuality quality = MessageQuality::High;
    std::string sender;
    bool return_credits = false;
};

enum class SmsStatus {
    Sent,
    AuthFailed,
    ProviderError,
    MalformedRequest
};

struct SmsResult {
    SmsStatus status = SmsStatus::ProviderError;
    std::optional<std::string> message_id;
    std::string detail;
};

const char* to_string(AuthErrorKind kind);
const char* to_string(SmsStatus status);

// Provider wire value for a quality setting
const char* message_type_code(MessageQuality quality);

// Remote SMS provider. Implementations never throw for transport or protocol
// failures; every outcome is reported through the returned value.
class SmsApi {
public:
    virtual ~SmsApi() = default;

    virtual LoginResult login(const std::string& username,
                              const std::string& password,
                              const CancellationToken& cancel) = 0;

    virtual SmsResult send_sms(const SessionCredential& credential,
                               const SmsRequest& request,
                               const CancellationToken& cancel) = 0;
};

}  // namespace smsgw::gateway
