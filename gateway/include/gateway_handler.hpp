#pragma once

#include "transaction_handler.hpp"
#include "mail_extractor.hpp"
#include "session_cache.hpp"
#include "sms_types.hpp"
#include "config.hpp"
#include <memory>
#include <string>

namespace smsgw::gateway {

// Mail transaction in, SMS out, SMTP reply back
class GatewayHandler : public smtp::TransactionHandler {
public:
    GatewayHandler(std::shared_ptr<SmsApi> api,
                   std::shared_ptr<SessionCache> sessions,
                   GatewayConfig config);

    smtp::Reply handle(const smtp::MailTransaction& transaction,
                       const CancellationToken& cancel) override;

    SmsRequest build_request(const ExtractedMessage& message) const;

    static smtp::Reply reply_for(ExtractionError error);

    // Cuts `text` to at most max_code_points UTF-8 code points; 0 = no limit
    static std::string truncate_utf8(const std::string& text, size_t max_code_points);

private:
    std::shared_ptr<SmsApi> api_;
    std::shared_ptr<SessionCache> sessions_;
    GatewayConfig config_;
};

}  // namespace smsgw::gateway
