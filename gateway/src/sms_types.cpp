#include "sms_types.hpp"

namespace smsgw::gateway {

const char* to_string(AuthErrorKind kind) {
    switch (kind) {
        case AuthErrorKind::LoginRejected: return "LoginRejected";
        case AuthErrorKind::MalformedResponse: return "MalformedResponse";
        case AuthErrorKind::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

const char* to_string(SmsStatus status) {
    switch (status) {
        case SmsStatus::Sent: return "Sent";
        case SmsStatus::AuthFailed: return "AuthFailed";
        case SmsStatus::ProviderError: return "ProviderError";
        case SmsStatus::MalformedRequest: return "MalformedRequest";
    }
    return "Unknown";
}

const char* message_type_code(MessageQuality quality) {
    return quality == MessageQuality::High ? "N" : "L";
}

}  // namespace smsgw::gateway
