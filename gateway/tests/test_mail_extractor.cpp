#include <catch2/catch_test_macros.hpp>
#include "mail_extractor.hpp"
#include "mime_parser.hpp"

using namespace smsgw::gateway;
using smsgw::smtp::MailTransaction;

namespace {

MailTransaction make_transaction(std::vector<std::string> rcpt, std::string data) {
    MailTransaction transaction;
    transaction.peer = "127.0.0.1:40000";
    transaction.mail_from = "portal@example.net";
    transaction.rcpt_to = std::move(rcpt);
    transaction.data = std::move(data);
    return transaction;
}

std::string body_of(std::string_view raw) {
    auto result = MailExtractor::body_text(raw);
    REQUIRE(std::holds_alternative<std::string>(result));
    return std::get<std::string>(result);
}

ExtractionError error_of(std::string_view raw) {
    auto result = MailExtractor::body_text(raw);
    REQUIRE(std::holds_alternative<ExtractionError>(result));
    return std::get<ExtractionError>(result);
}

}  // namespace

TEST_CASE("Recipient number extraction", "[gateway][extractor]") {
    SECTION("Local-part of the first recipient") {
        auto number = MailExtractor::recipient_number({"15551234567@gateway.local"});
        REQUIRE(std::get<std::string>(number) == "15551234567");
    }

    SECTION("Leading plus is kept") {
        auto number = MailExtractor::recipient_number({"<+393331234567@gateway.local>"});
        REQUIRE(std::get<std::string>(number) == "+393331234567");
    }

    SECTION("Extra recipients are ignored") {
        auto number = MailExtractor::recipient_number(
            {"15551234567@gateway.local", "not-a-number@gateway.local"});
        REQUIRE(std::get<std::string>(number) == "15551234567");
    }

    SECTION("No recipients") {
        auto number = MailExtractor::recipient_number({});
        REQUIRE(std::get<ExtractionError>(number) == ExtractionError::NoRecipient);
    }

    SECTION("Non-numeric local-part") {
        auto number = MailExtractor::recipient_number({"alice@gateway.local"});
        REQUIRE(std::get<ExtractionError>(number) == ExtractionError::InvalidRecipientFormat);
    }

    SECTION("Separators are not tolerated") {
        REQUIRE(std::get<ExtractionError>(MailExtractor::recipient_number({"555-1234@gw.local"})) ==
                ExtractionError::InvalidRecipientFormat);
        REQUIRE(std::get<ExtractionError>(MailExtractor::recipient_number({"+@gw.local"})) ==
                ExtractionError::InvalidRecipientFormat);
        REQUIRE(std::get<ExtractionError>(MailExtractor::recipient_number({"1+5@gw.local"})) ==
                ExtractionError::InvalidRecipientFormat);
    }

    SECTION("Empty local-part") {
        auto number = MailExtractor::recipient_number({"<>"});
        REQUIRE(std::get<ExtractionError>(number) == ExtractionError::InvalidRecipientFormat);
    }
}

TEST_CASE("Phone number rule", "[gateway][extractor]") {
    REQUIRE(MailExtractor::is_phone_number("0"));
    REQUIRE(MailExtractor::is_phone_number("+15551234567"));
    REQUIRE_FALSE(MailExtractor::is_phone_number(""));
    REQUIRE_FALSE(MailExtractor::is_phone_number("+"));
    REQUIRE_FALSE(MailExtractor::is_phone_number("++1"));
    REQUIRE_FALSE(MailExtractor::is_phone_number("1 2"));
}

TEST_CASE("Plain text body extraction", "[gateway][extractor]") {
    SECTION("Single part message") {
        REQUIRE(body_of("From: a@b.example\r\nSubject: OTP\r\n\r\nYour code is 4821\r\n") ==
                "Your code is 4821");
    }

    SECTION("Missing Content-Type defaults to text/plain") {
        REQUIRE(body_of("Subject: x\r\n\r\nhello") == "hello");
    }

    SECTION("Body without any header block") {
        REQUIRE(body_of("Your code is 4821\r\n") == "Your code is 4821");
    }

    SECTION("Line endings become LF and outer whitespace is trimmed") {
        REQUIRE(body_of("Subject: x\r\n\r\n\r\n  line one\r\nline two  \r\n\r\n") ==
                "line one\nline two");
    }

    SECTION("Folded Content-Type header") {
        std::string raw =
            "Content-Type: text/plain;\r\n"
            "\tcharset=\"iso-8859-1\"\r\n"
            "\r\n"
            "caf\xE9\r\n";
        REQUIRE(body_of(raw) == "caf\xC3\xA9");
    }

    SECTION("HTML only message is unsupported") {
        REQUIRE(error_of("Content-Type: text/html\r\n\r\n<p>4821</p>\r\n") ==
                ExtractionError::UnsupportedContentType);
    }

    SECTION("Whitespace-only body") {
        REQUIRE(error_of("Subject: x\r\n\r\n \r\n\t\r\n") == ExtractionError::EmptyBody);
    }
}

TEST_CASE("Multipart body extraction", "[gateway][extractor]") {
    SECTION("First text/plain alternative wins") {
        std::string raw =
            "Content-Type: multipart/alternative; boundary=\"b1\"\r\n"
            "\r\n"
            "This is a multi-part message in MIME format.\r\n"
            "--b1\r\n"
            "Content-Type: text/plain; charset=utf-8\r\n"
            "\r\n"
            "Your code is 4821\r\n"
            "--b1\r\n"
            "Content-Type: text/html\r\n"
            "\r\n"
            "<html><body>Your code is <b>4821</b></body></html>\r\n"
            "--b1--\r\n";
        REQUIRE(body_of(raw) == "Your code is 4821");
    }

    SECTION("Text part after HTML part is still found") {
        std::string raw =
            "Content-Type: multipart/alternative; boundary=xyz\r\n"
            "\r\n"
            "--xyz\r\n"
            "Content-Type: text/html\r\n"
            "\r\n"
            "<p>html</p>\r\n"
            "--xyz\r\n"
            "Content-Type: text/plain\r\n"
            "\r\n"
            "plain\r\n"
            "--xyz--\r\n";
        REQUIRE(body_of(raw) == "plain");
    }

    SECTION("Nested multipart is searched depth-first") {
        std::string raw =
            "Content-Type: multipart/mixed; boundary=outer\r\n"
            "\r\n"
            "--outer\r\n"
            "Content-Type: multipart/alternative; boundary=inner\r\n"
            "\r\n"
            "--inner\r\n"
            "Content-Type: text/plain\r\n"
            "\r\n"
            "nested text\r\n"
            "--inner--\r\n"
            "--outer\r\n"
            "Content-Type: text/plain\r\n"
            "\r\n"
            "later text\r\n"
            "--outer--\r\n";
        REQUIRE(body_of(raw) == "nested text");
    }

    SECTION("Attachments are skipped") {
        std::string raw =
            "Content-Type: multipart/mixed; boundary=m\r\n"
            "\r\n"
            "--m\r\n"
            "Content-Type: text/plain\r\n"
            "Content-Disposition: attachment; filename=\"notes.txt\"\r\n"
            "\r\n"
            "attached\r\n"
            "--m\r\n"
            "Content-Type: text/plain\r\n"
            "Content-Disposition: inline\r\n"
            "\r\n"
            "inline body\r\n"
            "--m--\r\n";
        REQUIRE(body_of(raw) == "inline body");
    }

    SECTION("Part without headers defaults to text/plain") {
        std::string raw =
            "Content-Type: multipart/mixed; boundary=m\r\n"
            "\r\n"
            "--m\r\n"
            "\r\n"
            "bare part\r\n"
            "--m--\r\n";
        REQUIRE(body_of(raw) == "bare part");
    }

    SECTION("Multipart without text/plain") {
        std::string raw =
            "Content-Type: multipart/mixed; boundary=m\r\n"
            "\r\n"
            "--m\r\n"
            "Content-Type: image/png\r\n"
            "Content-Transfer-Encoding: base64\r\n"
            "\r\n"
            "iVBORw0KGgo=\r\n"
            "--m--\r\n";
        REQUIRE(error_of(raw) == ExtractionError::UnsupportedContentType);
    }

    SECTION("Boundary never appears") {
        std::string raw =
            "Content-Type: multipart/mixed; boundary=missing\r\n"
            "\r\n"
            "just text\r\n";
        REQUIRE(error_of(raw) == ExtractionError::MalformedMessage);
    }

    SECTION("Multipart without boundary parameter") {
        REQUIRE(error_of("Content-Type: multipart/mixed\r\n\r\n--x\r\n\r\nhi\r\n--x--\r\n") ==
                ExtractionError::MalformedMessage);
    }
}

TEST_CASE("Transfer encodings", "[gateway][extractor][mime]") {
    SECTION("Quoted-printable with soft line break") {
        std::string raw =
            "Content-Type: text/plain; charset=utf-8\r\n"
            "Content-Transfer-Encoding: quoted-printable\r\n"
            "\r\n"
            "Your code is =\r\n"
            "4821 =E2=9C=93\r\n";
        REQUIRE(body_of(raw) == "Your code is 4821 \xE2\x9C\x93");
    }

    SECTION("Base64") {
        std::string raw =
            "Content-Type: text/plain\r\n"
            "Content-Transfer-Encoding: base64\r\n"
            "\r\n"
            "WW91ciBjb2RlIGlz\r\n"
            "IDQ4MjE=\r\n";
        REQUIRE(body_of(raw) == "Your code is 4821");
    }

    SECTION("Corrupt base64") {
        std::string raw =
            "Content-Type: text/plain\r\n"
            "Content-Transfer-Encoding: base64\r\n"
            "\r\n"
            "not*base64!\r\n";
        REQUIRE(error_of(raw) == ExtractionError::MalformedMessage);
    }
}

TEST_CASE("MIME helpers", "[gateway][mime]") {
    SECTION("Content-Type parameters") {
        auto ct = mime::ContentType::parse("Multipart/Alternative; boundary=\"a;b\"; CHARSET=utf-8");
        REQUIRE(ct.mime_type() == "multipart/alternative");
        REQUIRE(ct.param("boundary") == "a;b");
        REQUIRE(ct.param("charset") == "utf-8");
        REQUIRE_FALSE(ct.param("name").has_value());
    }

    SECTION("Header lookup is case-insensitive") {
        auto entity = mime::Entity::parse("content-type: text/plain\nX-Id: 7\n\nbody");
        REQUIRE(entity.header("Content-Type") == "text/plain");
        REQUIRE(entity.header("x-id") == "7");
        REQUIRE(entity.body == "body");
    }

    SECTION("Malformed quoted-printable escape is kept") {
        REQUIRE(mime::decode_quoted_printable("100=ZZ") == "100=ZZ");
    }

    SECTION("Latin-1 conversion") {
        REQUIRE(mime::latin1_to_utf8("\xFC") == "\xC3\xBC");
        REQUIRE(mime::latin1_to_utf8("abc") == "abc");
    }

    SECTION("Windows-1252 punctuation and euro sign") {
        auto entity = mime::Entity::parse(
            "Content-Type: text/plain; charset=windows-1252\n\nCode \x80 5\n");
        auto text = mime::decode_body(entity);
        REQUIRE(text.has_value());
        REQUIRE(*text == "Code \xE2\x82\xAC 5\n");

        REQUIRE(mime::cp1252_to_utf8("\x93" "ok\x94") == "\xE2\x80\x9C" "ok\xE2\x80\x9D");
        REQUIRE(mime::cp1252_to_utf8("\x96") == "\xE2\x80\x93");
        // Latin-1 range and unassigned bytes are unchanged code points
        REQUIRE(mime::cp1252_to_utf8("\xE9") == "\xC3\xA9");
        REQUIRE(mime::cp1252_to_utf8("\x81") == "\xC2\x81");
    }
}

TEST_CASE("Full transaction extraction", "[gateway][extractor]") {
    SECTION("Recipient and body") {
        auto result = MailExtractor::extract(make_transaction(
            {"15551234567@gateway.local"},
            "Subject: OTP\r\n\r\nYour code is 4821\r\n"));
        REQUIRE(std::holds_alternative<ExtractedMessage>(result));
        const auto& message = std::get<ExtractedMessage>(result);
        REQUIRE(message.recipient == "15551234567");
        REQUIRE(message.body == "Your code is 4821");
    }

    SECTION("Recipient problems are reported before the body is looked at") {
        auto result = MailExtractor::extract(make_transaction({}, "Content-Type: text/html\r\n\r\nx"));
        REQUIRE(std::get<ExtractionError>(result) == ExtractionError::NoRecipient);
    }

    SECTION("Received header prepended by the listener does not leak into the body") {
        auto result = MailExtractor::extract(make_transaction(
            {"15551234567@gateway.local"},
            "Received: from portal (127.0.0.1)\r\n"
            "\tby gateway.local with ESMTP;\r\n"
            "\tMon, 01 Jan 2024 00:00:00 +0000\r\n"
            "Subject: OTP\r\n"
            "\r\n"
            "Your code is 4821\r\n"));
        REQUIRE(std::get<ExtractedMessage>(result).body == "Your code is 4821");
    }
}
