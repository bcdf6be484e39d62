#pragma once

#include <string>
#include <vector>
#include <optional>

namespace smsgw::smtp {

class SMTPSession;

// Commands the listener understands; AUTH, STARTTLS and the like parse as UNKNOWN
enum class CommandType {
    HELO,
    EHLO,
    MAIL,
    RCPT,
    DATA,
    RSET,
    NOOP,
    QUIT,
    VRFY,
    HELP,
    UNKNOWN
};

struct Command {
    CommandType type = CommandType::UNKNOWN;
    std::string name;      // "MAIL FROM:", "RCPT TO:" or the bare verb
    std::string argument;  // path and ESMTP parameters, trimmed

    static Command parse(const std::string& line);
    static CommandType string_to_type(const std::string& name);
    static std::string type_to_string(CommandType type);
};

// Applies one command to the session's envelope and returns the reply line(s)
class CommandHandler {
public:
    static std::string execute(SMTPSession& session, const Command& cmd);

private:
    static std::string handle_helo(SMTPSession& session, const Command& cmd);
    static std::string handle_ehlo(SMTPSession& session, const Command& cmd);
    static std::string handle_mail(SMTPSession& session, const Command& cmd);
    static std::string handle_rcpt(SMTPSession& session, const Command& cmd);
    static std::string handle_data(SMTPSession& session);
    static std::string handle_rset(SMTPSession& session);
    static std::string handle_quit(SMTPSession& session);
    static std::string handle_vrfy(const Command& cmd);
    static std::string handle_help(SMTPSession& session);
};

// Reply codes sent by the listener and the gateway handler
namespace reply {
    constexpr int HELP = 214;
    constexpr int SERVICE_READY = 220;
    constexpr int SERVICE_CLOSING = 221;
    constexpr int OK = 250;
    constexpr int CANNOT_VRFY = 252;
    constexpr int START_MAIL_INPUT = 354;

    // Transient: the client keeps the mail and retries
    constexpr int LOCAL_ERROR = 451;
    constexpr int TOO_MANY_RECIPIENTS = 452;

    constexpr int SYNTAX_ERROR = 500;
    constexpr int SYNTAX_ERROR_PARAMS = 501;
    constexpr int BAD_SEQUENCE = 503;
    constexpr int MAILBOX_UNAVAILABLE = 550;
    constexpr int EXCEEDED_STORAGE = 552;
    constexpr int TRANSACTION_FAILED = 554;

    inline std::string make(int code, const std::string& message) {
        return std::to_string(code) + " " + message;
    }

    // "250-first\r\n250-...\r\n250 last" without the final CRLF
    inline std::string make_multi(int code, const std::vector<std::string>& lines) {
        std::string result;
        for (size_t i = 0; i < lines.size(); ++i) {
            char separator = (i + 1 == lines.size()) ? ' ' : '-';
            result += std::to_string(code) + separator + lines[i];
            if (separator == '-') {
                result += "\r\n";
            }
        }
        return result;
    }
}

// Mailbox from a MAIL/RCPT path. The null reverse-path "<>" parses to an
// empty address.
struct EmailAddress {
    std::string local_part;
    std::string domain;
    std::string full_address;

    static std::optional<EmailAddress> parse(const std::string& str);
};

}  // namespace smsgw::smtp
