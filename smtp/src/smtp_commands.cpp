#include "smtp_commands.hpp"
#include "smtp_session.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace smsgw::smtp {

namespace {

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Drops ESMTP parameters after the path, e.g. "<a@b> SIZE=1234"
std::string strip_parameters(const std::string& argument) {
    auto close = argument.find('>');
    if (close != std::string::npos) {
        return argument.substr(0, close + 1);
    }
    auto space = argument.find(' ');
    return space == std::string::npos ? argument : argument.substr(0, space);
}

}  // namespace

Command Command::parse(const std::string& line) {
    Command cmd;

    if (line.empty()) {
        return cmd;
    }

    size_t sep = line.find_first_of(" :");
    std::string name;

    if (sep == std::string::npos) {
        name = line;
    } else {
        name = line.substr(0, sep);
        // "MAIL FROM:" and "RCPT TO:" carry a qualifier before the argument
        if (line[sep] == ' ') {
            size_t next_space = line.find(' ', sep + 1);
            std::string qualifier = to_upper(next_space == std::string::npos
                ? line.substr(sep + 1)
                : line.substr(sep + 1, next_space - sep - 1));

            auto colon = qualifier.find(':');
            if (colon != std::string::npos) {
                std::string head = qualifier.substr(0, colon + 1);
                if (head == "FROM:" || head == "TO:") {
                    name += " " + head;
                    sep = sep + 1 + colon + 1;
                }
            }
        }
    }

    cmd.name = to_upper(name);
    cmd.type = string_to_type(cmd.name);

    if (sep < line.length()) {
        cmd.argument = line.substr(sep);
        auto start = cmd.argument.find_first_not_of(" :");
        if (start != std::string::npos) {
            cmd.argument = cmd.argument.substr(start);
        } else {
            cmd.argument.clear();
        }
        auto end = cmd.argument.find_last_not_of(" \t");
        if (end != std::string::npos) {
            cmd.argument.erase(end + 1);
        }
    }

    return cmd;
}

CommandType Command::string_to_type(const std::string& name) {
    static const std::unordered_map<std::string, CommandType> mapping = {
        {"HELO", CommandType::HELO},
        {"EHLO", CommandType::EHLO},
        {"MAIL FROM:", CommandType::MAIL},
        {"MAIL", CommandType::MAIL},
        {"RCPT TO:", CommandType::RCPT},
        {"RCPT", CommandType::RCPT},
        {"DATA", CommandType::DATA},
        {"RSET", CommandType::RSET},
        {"NOOP", CommandType::NOOP},
        {"QUIT", CommandType::QUIT},
        {"VRFY", CommandType::VRFY},
        {"HELP", CommandType::HELP}
    };

    auto it = mapping.find(name);
    return it != mapping.end() ? it->second : CommandType::UNKNOWN;
}

std::string Command::type_to_string(CommandType type) {
    switch (type) {
        case CommandType::HELO: return "HELO";
        case CommandType::EHLO: return "EHLO";
        case CommandType::MAIL: return "MAIL";
        case CommandType::RCPT: return "RCPT";
        case CommandType::DATA: return "DATA";
        case CommandType::RSET: return "RSET";
        case CommandType::NOOP: return "NOOP";
        case CommandType::QUIT: return "QUIT";
        case CommandType::VRFY: return "VRFY";
        case CommandType::HELP: return "HELP";
        default: return "UNKNOWN";
    }
}

std::optional<EmailAddress> EmailAddress::parse(const std::string& str) {
    std::string email = str;
    auto start = email.find('<');
    auto end = email.find('>');

    if (start != std::string::npos && end != std::string::npos && end > start) {
        email = email.substr(start + 1, end - start - 1);
    }

    auto trim_start = email.find_first_not_of(" \t");
    auto trim_end = email.find_last_not_of(" \t");
    if (trim_start != std::string::npos && trim_end != std::string::npos) {
        email = email.substr(trim_start, trim_end - trim_start + 1);
    } else {
        email.clear();
    }

    // Null reverse-path <>
    if (email.empty()) {
        return EmailAddress{"", "", ""};
    }

    // Source routes (@a,@b:user@host) are obsolete; keep the mailbox only
    if (email[0] == '@') {
        auto colon = email.find(':');
        if (colon == std::string::npos) {
            return std::nullopt;
        }
        email = email.substr(colon + 1);
    }

    auto at = email.rfind('@');
    if (at == std::string::npos || at == 0 || at == email.length() - 1) {
        return std::nullopt;
    }

    EmailAddress addr;
    addr.local_part = email.substr(0, at);
    addr.domain = email.substr(at + 1);
    addr.full_address = email;

    return addr;
}

std::string CommandHandler::execute(SMTPSession& session, const Command& cmd) {
    switch (cmd.type) {
        case CommandType::HELO: return handle_helo(session, cmd);
        case CommandType::EHLO: return handle_ehlo(session, cmd);
        case CommandType::MAIL: return handle_mail(session, cmd);
        case CommandType::RCPT: return handle_rcpt(session, cmd);
        case CommandType::DATA: return handle_data(session);
        case CommandType::RSET: return handle_rset(session);
        case CommandType::NOOP: return reply::make(reply::OK, "OK");
        case CommandType::QUIT: return handle_quit(session);
        case CommandType::VRFY: return handle_vrfy(cmd);
        case CommandType::HELP: return handle_help(session);
        case CommandType::UNKNOWN: break;
    }
    return reply::make(reply::SYNTAX_ERROR, "Unrecognized command");
}

std::string CommandHandler::handle_helo(SMTPSession& session, const Command& cmd) {
    if (cmd.argument.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Hostname required");
    }

    session.set_client_hostname(cmd.argument);
    session.set_state(SessionState::GREETED);
    session.envelope().clear();

    return reply::make(reply::OK, session.hostname() + " Hello " + cmd.argument);
}

std::string CommandHandler::handle_ehlo(SMTPSession& session, const Command& cmd) {
    if (cmd.argument.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Hostname required");
    }

    session.set_client_hostname(cmd.argument);
    session.set_state(SessionState::GREETED);
    session.envelope().clear();

    std::vector<std::string> capabilities;
    capabilities.push_back(session.hostname() + " Hello " + cmd.argument);
    capabilities.push_back("SIZE " + std::to_string(session.max_message_size()));
    capabilities.push_back("8BITMIME");
    capabilities.push_back("PIPELINING");

    return reply::make_multi(reply::OK, capabilities);
}

std::string CommandHandler::handle_mail(SMTPSession& session, const Command& cmd) {
    if (session.state() == SessionState::CONNECTED) {
        return reply::make(reply::BAD_SEQUENCE, "Send HELO/EHLO first");
    }
    if (session.state() == SessionState::MAIL || session.state() == SessionState::RCPT) {
        return reply::make(reply::BAD_SEQUENCE, "Sender already specified");
    }

    auto addr = EmailAddress::parse(strip_parameters(cmd.argument));
    if (!addr) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Invalid sender address");
    }

    session.envelope().clear();
    session.envelope().mail_from = addr->full_address;
    session.set_state(SessionState::MAIL);

    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_rcpt(SMTPSession& session, const Command& cmd) {
    if (session.state() != SessionState::MAIL && session.state() != SessionState::RCPT) {
        return reply::make(reply::BAD_SEQUENCE, "Send MAIL FROM first");
    }

    if (session.envelope().rcpt_to.size() >= session.max_recipients()) {
        return reply::make(reply::TOO_MANY_RECIPIENTS, "Too many recipients");
    }

    auto addr = EmailAddress::parse(strip_parameters(cmd.argument));
    if (!addr || addr->domain.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Invalid recipient address");
    }

    if (!session.is_local_domain(addr->domain)) {
        LOG_WARNING_FMT("Relay denied for {} from {}", addr->full_address, session.remote_address());
        return reply::make(reply::MAILBOX_UNAVAILABLE, "Relay access denied");
    }

    session.envelope().rcpt_to.push_back(addr->full_address);
    session.set_state(SessionState::RCPT);

    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_data(SMTPSession& session) {
    if (session.state() != SessionState::RCPT || session.envelope().rcpt_to.empty()) {
        return reply::make(reply::BAD_SEQUENCE, "Send RCPT TO first");
    }

    session.set_state(SessionState::DATA);
    return reply::make(reply::START_MAIL_INPUT, "Start mail input; end with <CRLF>.<CRLF>");
}

std::string CommandHandler::handle_rset(SMTPSession& session) {
    session.envelope().clear();
    if (session.state() != SessionState::CONNECTED) {
        session.set_state(SessionState::GREETED);
    }

    return reply::make(reply::OK, "OK");
}

std::string CommandHandler::handle_quit(SMTPSession& session) {
    session.set_state(SessionState::QUIT);
    return reply::make(reply::SERVICE_CLOSING, session.hostname() + " closing connection");
}

std::string CommandHandler::handle_vrfy(const Command& cmd) {
    if (cmd.argument.empty()) {
        return reply::make(reply::SYNTAX_ERROR_PARAMS, "Address required");
    }
    return reply::make(reply::CANNOT_VRFY, "Cannot VRFY user, but will accept message and attempt delivery");
}

std::string CommandHandler::handle_help(SMTPSession& session) {
    std::vector<std::string> help;
    help.push_back(session.hostname() + " supports:");
    help.push_back("HELO EHLO MAIL RCPT DATA RSET NOOP QUIT VRFY HELP");

    return reply::make_multi(reply::HELP, help);
}

}  // namespace smsgw::smtp
