#pragma once

#include "net/cancellation.hpp"
#include <string>
#include <vector>

namespace smsgw::smtp {

// One completed SMTP envelope + DATA exchange. Built by the session when the
// terminating "." arrives and handed to the handler exactly once.
struct MailTransaction {
    std::string peer;
    std::string mail_from;
    std::vector<std::string> rcpt_to;
    std::string data;
};

// Final reply to the DATA phase
struct Reply {
    int code = 250;
    std::string message = "OK";

    bool is_success() const { return code >= 200 && code < 300; }
    bool is_transient() const { return code >= 400 && code < 500; }
    bool is_permanent() const { return code >= 500; }

    std::string to_string() const { return std::to_string(code) + " " + message; }
};

// Capability the SMTP listener plugs into. Implementations are called on a
// worker thread, may block on network I/O, and must turn every outcome into
// a Reply. `cancel` is set when the client connection goes away.
class TransactionHandler {
public:
    virtual ~TransactionHandler() = default;

    virtual Reply handle(const MailTransaction& transaction,
                         const CancellationToken& cancel) = 0;
};

}  // namespace smsgw::smtp
