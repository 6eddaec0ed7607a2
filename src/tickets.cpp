#include "tix/tickets.hpp"
#include <algorithm>
#include <iterator>

namespace tix {

TicketStore::TicketStore(std::vector<Ticket> tickets)
    : tickets_(std::move(tickets)) {
}

TicketStore TicketStore::builtin() {
    return TicketStore{{
        {"T1",  "Fix login bug",       TicketStatus::Pending},
        {"T2",  "Database indexing",   TicketStatus::Pending},
        {"T10", "Payment integration", TicketStatus::Done},
        {"T11", "Email system",        TicketStatus::Done},
        {"T20", "Create dashboard UI", TicketStatus::Todo},
        {"T21", "Add search filter",   TicketStatus::Todo},
    }};
}

std::vector<Ticket> TicketStore::by_status(TicketStatus status) const {
    std::vector<Ticket> out;
    std::copy_if(tickets_.begin(), tickets_.end(), std::back_inserter(out),
                 [status](const Ticket& t) { return t.status == status; });
    return out;
}

} // namespace tix
