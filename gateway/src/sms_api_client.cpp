#include "sms_api_client.hpp"
#include "logger.hpp"
#include <format>
#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

namespace smsgw::gateway {

namespace pt = boost::property_tree;

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string http_detail(const HttpResponse& response) {
    return std::format("HTTP {}: {}", response.status,
                       response.body.substr(0, SmsApiClient::kDetailPreview));
}

}  // namespace

SmsApiClient::SmsApiClient(std::string base_url, std::shared_ptr<HttpTransport> transport)
    : base_url_(std::move(base_url))
    , transport_(std::move(transport)) {
}

LoginResult SmsApiClient::login(const std::string& username,
                                const std::string& password,
                                const CancellationToken& cancel) {
    HttpRequest request;
    request.method = "GET";
    request.url = join_url(base_url_, "login") + "?" +
                  build_query({{"username", username}, {"password", password}});

    HttpResponse response = transport_->perform(request, cancel);
    if (!response.success) {
        LOG_WARNING_FMT("SMS API login failed: {}", response.error);
        return AuthError{AuthErrorKind::Unavailable, 0, response.error};
    }

    if (response.status < 200 || response.status >= 300) {
        LOG_WARNING_FMT("SMS API login rejected with HTTP {}", response.status);
        return AuthError{AuthErrorKind::LoginRejected, response.status, http_detail(response)};
    }

    std::string body = trim(response.body);
    auto separator = body.find(';');
    if (separator == std::string::npos || body.find(';', separator + 1) != std::string::npos) {
        LOG_WARNING("SMS API login response is not a user_key;session_key pair");
        return AuthError{AuthErrorKind::MalformedResponse, response.status,
                         body.substr(0, kDetailPreview)};
    }

    SessionCredential credential;
    credential.user_key = trim(body.substr(0, separator));
    credential.session_key = trim(body.substr(separator + 1));
    credential.acquired_at = std::chrono::steady_clock::now();

    if (credential.user_key.empty() || credential.session_key.empty()) {
        LOG_WARNING("SMS API login response has an empty key");
        return AuthError{AuthErrorKind::MalformedResponse, response.status,
                         body.substr(0, kDetailPreview)};
    }

    LOG_INFO("SMS API session established");
    return credential;
}

SmsResult SmsApiClient::send_sms(const SessionCredential& credential,
                                 const SmsRequest& request,
                                 const CancellationToken& cancel) {
    SmsResult result;

    if (request.recipient.empty() || request.message.empty()) {
        result.status = SmsStatus::MalformedRequest;
        result.detail = request.recipient.empty() ? "empty recipient" : "empty message";
        return result;
    }

    HttpRequest http_request;
    http_request.method = "POST";
    http_request.url = join_url(base_url_, "sms");
    http_request.headers = {
        {"user_key", credential.user_key},
        {"Session_key", credential.session_key},
        {"Content-Type", "application/json"}
    };
    http_request.body = encode_request(request);

    HttpResponse response = transport_->perform(http_request, cancel);
    if (!response.success) {
        result.status = SmsStatus::ProviderError;
        result.detail = response.error;
        return result;
    }

    if (response.status == 401 || response.status == 403) {
        result.status = SmsStatus::AuthFailed;
        result.detail = http_detail(response);
        return result;
    }

    if (response.status != 201) {
        result.status = SmsStatus::ProviderError;
        result.detail = http_detail(response);
        return result;
    }

    pt::ptree tree;
    try {
        std::istringstream stream(response.body);
        pt::read_json(stream, tree);
    } catch (const pt::json_parser::json_parser_error& e) {
        result.status = SmsStatus::ProviderError;
        result.detail = std::format("unparseable response: {}", e.message());
        return result;
    }

    auto outcome = tree.get_optional<std::string>("result");
    if (!outcome || *outcome != "OK") {
        result.status = SmsStatus::ProviderError;
        result.detail = outcome ? *outcome : "response has no result field";
        return result;
    }

    result.status = SmsStatus::Sent;
    if (auto id = tree.get_optional<std::string>("order_id")) {
        result.message_id = *id;
    } else if (auto fallback = tree.get_optional<std::string>("id")) {
        result.message_id = *fallback;
    }
    return result;
}

std::string SmsApiClient::encode_request(const SmsRequest& request) {
    // Written by hand: the provider needs a real JSON boolean and an array
    std::string json = "{";
    json += "\"message\":\"" + json_escape(request.message) + "\",";
    json += "\"message_type\":\"" + std::string(message_type_code(request.quality)) + "\",";
    json += std::string("\"returnCredits\":") + (request.return_credits ? "true" : "false") + ",";
    json += "\"recipient\":[\"" + json_escape(request.recipient) + "\"],";
    json += "\"sender\":\"" + json_escape(request.sender) + "\"";
    json += "}";
    return json;
}

std::string SmsApiClient::json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += std::format("\\u{:04x}", static_cast<unsigned char>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

}  // namespace smsgw::gateway
