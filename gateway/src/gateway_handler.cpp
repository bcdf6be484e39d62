#include "gateway_handler.hpp"
#include "smtp_commands.hpp"
#include "logger.hpp"
#include <algorithm>

namespace smsgw::gateway {

namespace {

smtp::Reply cancelled_reply() {
    return {smtp::reply::LOCAL_ERROR, "Requested action aborted: transaction cancelled"};
}

}  // namespace

GatewayHandler::GatewayHandler(std::shared_ptr<SmsApi> api,
                               std::shared_ptr<SessionCache> sessions,
                               GatewayConfig config)
    : api_(std::move(api))
    , sessions_(std::move(sessions))
    , config_(std::move(config)) {
}

smtp::Reply GatewayHandler::reply_for(ExtractionError error) {
    switch (error) {
        case ExtractionError::NoRecipient:
            return {smtp::reply::MAILBOX_UNAVAILABLE, "No recipient given"};
        case ExtractionError::InvalidRecipientFormat:
            return {smtp::reply::MAILBOX_UNAVAILABLE, "Recipient local-part is not a phone number"};
        case ExtractionError::UnsupportedContentType:
            return {smtp::reply::MAILBOX_UNAVAILABLE, "Message has no text/plain part"};
        case ExtractionError::EmptyBody:
            return {smtp::reply::MAILBOX_UNAVAILABLE, "Message body is empty"};
        case ExtractionError::MalformedMessage:
            return {smtp::reply::MAILBOX_UNAVAILABLE, "Malformed MIME structure"};
    }
    return {smtp::reply::MAILBOX_UNAVAILABLE, "Message rejected"};
}

std::string GatewayHandler::truncate_utf8(const std::string& text, size_t max_code_points) {
    if (max_code_points == 0) {
        return text;
    }

    size_t count = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        // Continuation bytes are 10xxxxxx
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
            if (count == max_code_points) {
                return text.substr(0, i);
            }
            ++count;
        }
    }
    return text;
}

SmsRequest GatewayHandler::build_request(const ExtractedMessage& message) const {
    SmsRequest request;
    request.recipient = message.recipient;
    request.message = truncate_utf8(message.body, config_.max_message_length);
    request.quality = config_.quality;
    request.sender = config_.sender;
    request.return_credits = config_.return_credits;

    if (request.message.size() < message.body.size()) {
        LOG_WARNING_FMT("Message to {} truncated to {} characters",
                        request.recipient, config_.max_message_length);
    }
    return request;
}

smtp::Reply GatewayHandler::handle(const smtp::MailTransaction& transaction,
                                   const CancellationToken& cancel) {
    auto extracted = MailExtractor::extract(transaction);
    if (auto* error = std::get_if<ExtractionError>(&extracted)) {
        LOG_WARNING_FMT("Rejecting mail from {} <{}>: {}",
                        transaction.peer, transaction.mail_from, to_string(*error));
        return reply_for(*error);
    }

    if (transaction.rcpt_to.size() > 1) {
        LOG_DEBUG_FMT("Ignoring {} recipient(s) after the first", transaction.rcpt_to.size() - 1);
    }

    SmsRequest request = build_request(std::get<ExtractedMessage>(extracted));
    int retries_left = std::max(config_.auth_retries, 0);

    for (;;) {
        if (cancel.cancelled()) {
            return cancelled_reply();
        }

        auto login = sessions_->acquire(cancel);
        if (auto* error = std::get_if<AuthError>(&login)) {
            if (cancel.cancelled()) {
                return cancelled_reply();
            }
            LOG_ERROR_FMT("No SMS API session for {}: {} {}",
                          request.recipient, to_string(error->kind), error->detail);
            return {smtp::reply::LOCAL_ERROR, "SMS service unavailable, try again later"};
        }
        const auto& credential = std::get<SessionCredential>(login);

        SmsResult result = api_->send_sms(credential, request, cancel);
        if (cancel.cancelled()) {
            LOG_INFO_FMT("SMS to {} abandoned, client disconnected", request.recipient);
            return cancelled_reply();
        }

        switch (result.status) {
            case SmsStatus::Sent:
                LOG_INFO_FMT("SMS sent to {}{}", request.recipient,
                             result.message_id ? " (id " + *result.message_id + ")" : std::string());
                return {smtp::reply::OK, result.message_id ? "OK " + *result.message_id : "OK"};

            case SmsStatus::AuthFailed:
                sessions_->invalidate(credential);
                if (retries_left > 0) {
                    --retries_left;
                    LOG_WARNING_FMT("SMS API session rejected ({}), logging in again", result.detail);
                    continue;
                }
                LOG_ERROR_FMT("SMS API session rejected again for {}: {}", request.recipient, result.detail);
                return {smtp::reply::LOCAL_ERROR, "SMS provider authentication failed, try again later"};

            case SmsStatus::ProviderError:
                LOG_ERROR_FMT("SMS to {} failed: {}", request.recipient, result.detail);
                return {smtp::reply::LOCAL_ERROR, "SMS provider error, try again later"};

            case SmsStatus::MalformedRequest:
                LOG_ERROR_FMT("SMS request to {} rejected: {}", request.recipient, result.detail);
                return {smtp::reply::TRANSACTION_FAILED, "Transaction failed: SMS request rejected"};
        }

        return {smtp::reply::LOCAL_ERROR, "Requested action aborted: local error in processing"};
    }
}

}  // namespace smsgw::gateway
