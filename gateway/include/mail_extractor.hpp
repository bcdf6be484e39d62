#pragma once

#include "transaction_handler.hpp"
#include <string>
#include <string_view>
#include <optional>
#include <variant>

namespace smsgw::gateway {

enum class ExtractionError {
    NoRecipient,
    InvalidRecipientFormat,
    UnsupportedContentType,
    EmptyBody,
    MalformedMessage
};

const char* to_string(ExtractionError error);

struct ExtractedMessage {
    std::string recipient;  // phone number, digits with optional leading '+'
    std::string body;
};

using ExtractionResult = std::variant<ExtractedMessage, ExtractionError>;

// Derives the destination number and SMS text from a mail transaction.
// Pure: no I/O, no shared state.
class MailExtractor {
public:
    static constexpr int kMaxNesting = 8;

    static ExtractionResult extract(const smtp::MailTransaction& transaction);

    // Local-part of the first recipient when it is a phone number
    static std::variant<std::string, ExtractionError>
    recipient_number(const std::vector<std::string>& rcpt_to);

    // First non-attachment text/plain part, decoded, LF line endings, trimmed
    static std::variant<std::string, ExtractionError> body_text(std::string_view raw_message);

    static bool is_phone_number(std::string_view candidate);
};

}  // namespace smsgw::gateway
