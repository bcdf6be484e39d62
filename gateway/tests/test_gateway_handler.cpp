#include <catch2/catch_test_macros.hpp>
#include "gateway_handler.hpp"
#include "test_doubles.hpp"

using namespace smsgw::gateway;
using smsgw::gateway::testing::StubSmsApi;
using smsgw::CancellationToken;
using smsgw::GatewayConfig;
using smsgw::MessageQuality;
using smsgw::smtp::MailTransaction;

namespace {

struct Fixture {
    std::shared_ptr<StubSmsApi> api = std::make_shared<StubSmsApi>();
    std::shared_ptr<SessionCache> sessions =
        std::make_shared<SessionCache>(api, "portal", "secret", std::chrono::seconds(3600));
    GatewayConfig config;

    GatewayHandler handler() { return GatewayHandler(api, sessions, config); }
};

MailTransaction otp_mail(std::vector<std::string> rcpt = {"15551234567@gateway.local"}) {
    MailTransaction transaction;
    transaction.peer = "127.0.0.1:50000";
    transaction.mail_from = "portal@example.net";
    transaction.rcpt_to = std::move(rcpt);
    transaction.data = "From: portal@example.net\r\n"
                       "To: 15551234567@gateway.local\r\n"
                       "Subject: OTP\r\n"
                       "\r\n"
                       "Your code is 4821\r\n";
    return transaction;
}

}  // namespace

TEST_CASE("One-time code is forwarded as an SMS", "[gateway][handler]") {
    Fixture f;
    auto handler = f.handler();
    CancellationToken cancel;

    auto reply = handler.handle(otp_mail(), cancel);

    REQUIRE(reply.code == 250);
    REQUIRE(reply.to_string() == "250 OK");

    REQUIRE(f.api->sent.size() == 1);
    const auto& request = f.api->sent.front();
    REQUIRE(request.recipient == "15551234567");
    REQUIRE(request.message == "Your code is 4821");
    REQUIRE(std::string(message_type_code(request.quality)) == "N");
    REQUIRE(request.sender == "ACME");
    REQUIRE_FALSE(request.return_credits);
    REQUIRE(f.api->login_calls == 1);
}

TEST_CASE("Configured request attributes are used", "[gateway][handler]") {
    Fixture f;
    f.config.sender = "Portal";
    f.config.quality = MessageQuality::Standard;
    f.config.return_credits = true;
    auto handler = f.handler();
    CancellationToken cancel;

    REQUIRE(handler.handle(otp_mail(), cancel).code == 250);
    const auto& request = f.api->sent.front();
    REQUIRE(request.sender == "Portal");
    REQUIRE(std::string(message_type_code(request.quality)) == "L");
    REQUIRE(request.return_credits);
}

TEST_CASE("Extraction failures are permanent and never reach the API", "[gateway][handler]") {
    Fixture f;
    auto handler = f.handler();
    CancellationToken cancel;

    SECTION("Empty recipient list") {
        auto reply = handler.handle(otp_mail({}), cancel);
        REQUIRE(reply.code == 550);
    }

    SECTION("Recipient is not a phone number") {
        auto reply = handler.handle(otp_mail({"alice@gateway.local"}), cancel);
        REQUIRE(reply.code == 550);
    }

    SECTION("No plain text part") {
        auto transaction = otp_mail();
        transaction.data = "Content-Type: text/html\r\n\r\n<p>4821</p>\r\n";
        REQUIRE(handler.handle(transaction, cancel).code == 550);
    }

    SECTION("Empty body") {
        auto transaction = otp_mail();
        transaction.data = "Subject: OTP\r\n\r\n\r\n";
        REQUIRE(handler.handle(transaction, cancel).code == 550);
    }

    REQUIRE(f.api->login_calls == 0);
    REQUIRE(f.api->sent.empty());
}

TEST_CASE("Rejected session is retried once with a fresh login", "[gateway][handler]") {
    Fixture f;
    f.api->script = {SmsStatus::AuthFailed, SmsStatus::Sent};
    auto handler = f.handler();
    CancellationToken cancel;

    auto reply = handler.handle(otp_mail(), cancel);

    REQUIRE(reply.code == 250);
    REQUIRE(f.api->sent.size() == 2);
    REQUIRE(f.api->login_calls == 2);
    REQUIRE(f.api->used_credentials[0].session_key == "session1");
    REQUIRE(f.api->used_credentials[1].session_key == "session2");
}

TEST_CASE("Second authentication failure is transient", "[gateway][handler]") {
    Fixture f;
    f.api->script = {SmsStatus::AuthFailed, SmsStatus::AuthFailed};
    auto handler = f.handler();
    CancellationToken cancel;

    auto reply = handler.handle(otp_mail(), cancel);

    REQUIRE(reply.code == 451);
    REQUIRE(reply.is_transient());
    REQUIRE(f.api->sent.size() == 2);
    REQUIRE_FALSE(f.sessions->has_credential());

    // The gateway keeps serving
    REQUIRE(handler.handle(otp_mail(), cancel).code == 250);
}

TEST_CASE("Retry count is configurable", "[gateway][handler]") {
    Fixture f;
    f.config.auth_retries = 0;
    f.api->script = {SmsStatus::AuthFailed};
    auto handler = f.handler();
    CancellationToken cancel;

    REQUIRE(handler.handle(otp_mail(), cancel).code == 451);
    REQUIRE(f.api->sent.size() == 1);
}

TEST_CASE("Provider outcomes map to SMTP replies", "[gateway][handler]") {
    Fixture f;
    auto handler = f.handler();
    CancellationToken cancel;

    SECTION("Provider error is transient") {
        f.api->script = {SmsStatus::ProviderError};
        REQUIRE(handler.handle(otp_mail(), cancel).code == 451);
        REQUIRE(f.api->sent.size() == 1);
    }

    SECTION("Malformed request is permanent") {
        f.api->script = {SmsStatus::MalformedRequest};
        REQUIRE(handler.handle(otp_mail(), cancel).code == 554);
    }

    SECTION("Login failure is transient") {
        f.api->fail_login = true;
        auto reply = handler.handle(otp_mail(), cancel);
        REQUIRE(reply.code == 451);
        REQUIRE(f.api->sent.empty());
    }
}

TEST_CASE("Cancelled transaction is abandoned", "[gateway][handler]") {
    Fixture f;
    auto handler = f.handler();
    CancellationToken cancel;
    cancel.cancel();

    auto reply = handler.handle(otp_mail(), cancel);
    REQUIRE(reply.code == 451);
    REQUIRE(f.api->sent.empty());
}

TEST_CASE("Long bodies are truncated on a character boundary", "[gateway][handler]") {
    SECTION("ASCII") {
        REQUIRE(GatewayHandler::truncate_utf8("abcdef", 3) == "abc");
        REQUIRE(GatewayHandler::truncate_utf8("abc", 3) == "abc");
        REQUIRE(GatewayHandler::truncate_utf8("abc", 0) == "abc");
    }

    SECTION("Multi-byte characters are never split") {
        // "é€x": 2 + 3 + 1 bytes
        std::string text = "\xC3\xA9\xE2\x82\xAC" "x";
        REQUIRE(GatewayHandler::truncate_utf8(text, 1) == "\xC3\xA9");
        REQUIRE(GatewayHandler::truncate_utf8(text, 2) == "\xC3\xA9\xE2\x82\xAC");
    }

    SECTION("Handler applies the configured limit") {
        Fixture f;
        f.config.max_message_length = 12;
        auto handler = f.handler();
        CancellationToken cancel;

        REQUIRE(handler.handle(otp_mail(), cancel).code == 250);
        REQUIRE(f.api->sent.front().message == "Your code is");
    }
}
