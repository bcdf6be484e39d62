#include "mail_extractor.hpp"
#include "mime_parser.hpp"
#include "smtp_commands.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>

namespace smsgw::gateway {

namespace {

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

// Depth-first, document order. Sets `malformed` when a multipart container
// cannot be split; the search still continues with its siblings.
std::optional<std::string> first_plain_text(const mime::Entity& entity, int depth, bool& malformed) {
    mime::ContentType type = entity.content_type();

    if (type.type == "multipart") {
        if (depth >= MailExtractor::kMaxNesting) {
            LOG_WARNING("MIME nesting limit reached");
            malformed = true;
            return std::nullopt;
        }

        auto boundary = type.param("boundary");
        if (!boundary || boundary->empty()) {
            malformed = true;
            return std::nullopt;
        }

        auto parts = mime::split_multipart(entity.body, *boundary);
        if (!parts) {
            malformed = true;
            return std::nullopt;
        }

        for (const auto& raw_part : *parts) {
            mime::Entity part = mime::Entity::parse(raw_part);
            if (auto text = first_plain_text(part, depth + 1, malformed)) {
                return text;
            }
        }
        return std::nullopt;
    }

    if (type.type == "text" && type.subtype == "plain" && !entity.is_attachment()) {
        auto decoded = mime::decode_body(entity);
        if (!decoded) {
            malformed = true;
        }
        return decoded;
    }

    return std::nullopt;
}

}  // namespace

const char* to_string(ExtractionError error) {
    switch (error) {
        case ExtractionError::NoRecipient: return "NoRecipient";
        case ExtractionError::InvalidRecipientFormat: return "InvalidRecipientFormat";
        case ExtractionError::UnsupportedContentType: return "UnsupportedContentType";
        case ExtractionError::EmptyBody: return "EmptyBody";
        case ExtractionError::MalformedMessage: return "MalformedMessage";
    }
    return "Unknown";
}

bool MailExtractor::is_phone_number(std::string_view candidate) {
    if (!candidate.empty() && candidate.front() == '+') {
        candidate.remove_prefix(1);
    }
    return !candidate.empty() &&
           std::all_of(candidate.begin(), candidate.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::variant<std::string, ExtractionError>
MailExtractor::recipient_number(const std::vector<std::string>& rcpt_to) {
    if (rcpt_to.empty()) {
        return ExtractionError::NoRecipient;
    }

    // Only the first recipient is meaningful; the rest are ignored
    auto address = smtp::EmailAddress::parse(rcpt_to.front());
    if (!address || !is_phone_number(address->local_part)) {
        return ExtractionError::InvalidRecipientFormat;
    }
    return address->local_part;
}

std::variant<std::string, ExtractionError> MailExtractor::body_text(std::string_view raw_message) {
    std::string normalized = mime::normalize_newlines(raw_message);
    mime::Entity message = mime::Entity::parse(normalized);

    bool malformed = false;
    auto text = first_plain_text(message, 0, malformed);
    if (!text) {
        return malformed ? ExtractionError::MalformedMessage
                         : ExtractionError::UnsupportedContentType;
    }

    std::string body = trim(*text);
    if (body.empty()) {
        return ExtractionError::EmptyBody;
    }
    return body;
}

ExtractionResult MailExtractor::extract(const smtp::MailTransaction& transaction) {
    auto number = recipient_number(transaction.rcpt_to);
    if (auto* error = std::get_if<ExtractionError>(&number)) {
        return *error;
    }

    auto body = body_text(transaction.data);
    if (auto* error = std::get_if<ExtractionError>(&body)) {
        return *error;
    }

    return ExtractedMessage{std::get<std::string>(std::move(number)),
                            std::get<std::string>(std::move(body))};
}

}  // namespace smsgw::gateway
