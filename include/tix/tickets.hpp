#pragma once
#include "types.hpp"
#include <vector>

namespace tix {

/// Immutable, ordered ticket list.
class TicketStore {
public:
    TicketStore() = default;
    explicit TicketStore(std::vector<Ticket> tickets);

    /// The fixed dataset the server ships with.
    static TicketStore builtin();

    const std::vector<Ticket>& all() const { return tickets_; }
    std::size_t size() const { return tickets_.size(); }

    /// Tickets with the given status, in insertion order.
    std::vector<Ticket> by_status(TicketStatus status) const;

private:
    std::vector<Ticket> tickets_;
};

} // namespace tix
