#pragma once

#include "sms_types.hpp"
#include "http_client.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace smsgw::gateway {

// Session-keyed REST SMS provider:
//   GET  {base}login?username=..&password=..  -> "user_key;session_key"
//   POST {base}sms  (user_key, Session_key headers, JSON body) -> 201 JSON
class SmsApiClient : public SmsApi {
public:
    static constexpr size_t kDetailPreview = 200;

    SmsApiClient(std::string base_url, std::shared_ptr<HttpTransport> transport);

    LoginResult login(const std::string& username,
                      const std::string& password,
                      const CancellationToken& cancel) override;

    SmsResult send_sms(const SessionCredential& credential,
                       const SmsRequest& request,
                       const CancellationToken& cancel) override;

    // {"message":..,"message_type":..,"returnCredits":..,"recipient":[..],"sender":..}
    static std::string encode_request(const SmsRequest& request);

    static std::string json_escape(std::string_view text);

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    std::shared_ptr<HttpTransport> transport_;
};

}  // namespace smsgw::gateway
