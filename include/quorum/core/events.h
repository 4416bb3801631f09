// QUORUM - Event Log
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// Append-only audit trail of governance and ledger effects.
//
// Events emitted while an EventLog::Batch is open are held back and only
// published (sequenced, stored, delivered to listeners) when the outermost
// batch commits. A batch destroyed without Commit() drops everything emitted
// since it opened, so a rejected call leaves no events behind.

#ifndef QUORUM_CORE_EVENTS_H
#define QUORUM_CORE_EVENTS_H

#include "quorum/core/types.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace quorum {

/// Event kinds
enum class EventType : uint8_t {
    ProposalInitiated,
    VoteCast,
    ProposalExecuted,
    ProposalEnded,
    ParameterChanged,
    DepositCollected,
    MerchantAdded,
    MerchantRemoved,
    MerchantModified,
    MerchantFrozen,
    MerchantUnfrozen,
    MintedToUser,
    PaymentProcessed,
    FundsWithdrawn,
};

const char* EventTypeToString(EventType type);

/**
 * A single event. Field meaning depends on the type:
 *
 *   ProposalInitiated  actor=initiator  detail=kind  round  amount=weight
 *   VoteCast           actor=voter      detail=kind  round  amount=weight
 *                      extra=accumulated power after the vote
 *   ProposalExecuted   actor=initiator  detail=kind  round  amount=accumulated
 *                      extra=threshold
 *   ProposalEnded      detail=kind  round  flag=executed
 *   ParameterChanged   amount=old percentage  extra=new percentage
 *   DepositCollected   actor=initiator  detail=kind  round  amount
 *   MerchantAdded      subject=merchant  actor=guardian  detail=name  amount=quota
 *   MerchantRemoved    subject=merchant
 *   MerchantModified   subject=merchant  actor=guardian  amount=quota  extra=rebate
 *   MerchantFrozen / MerchantUnfrozen   subject=merchant
 *   MintedToUser       actor=merchant (null for grants)  subject=user  amount
 *   PaymentProcessed   actor=merchant  subject=user  amount=paid  extra=rebate
 *   FundsWithdrawn     actor=asset  subject=beneficiary  amount
 */
struct Event {
    EventType type{EventType::ProposalInitiated};
    uint64_t sequence{0};
    Timestamp time{0};
    uint64_t round{0};
    Address actor;
    Address subject;
    Amount amount{0};
    Amount extra{0};
    bool flag{false};
    std::string detail;

    std::string ToString() const;
};

class EventLog {
public:
    using Listener = std::function<void(const Event&)>;

    /// RAII emission scope; see file comment.
    class Batch {
    public:
        explicit Batch(EventLog& log);
        ~Batch();

        Batch(const Batch&) = delete;
        Batch& operator=(const Batch&) = delete;

        /// Keep the events emitted in this scope
        void Commit();

    private:
        EventLog& log_;
        size_t mark_;
        bool done_{false};
    };

    EventLog() = default;

    /// Record an event (stamped with the current time)
    void Emit(Event event);

    /// Register a listener; returns a handle for Unsubscribe
    size_t Subscribe(Listener listener);
    void Unsubscribe(size_t handle);

    /// Published events in order
    std::vector<Event> GetEvents() const;

    /// Published events with sequence >= from
    std::vector<Event> GetEventsSince(uint64_t from) const;

    /// Published events of one type
    std::vector<Event> FindByType(EventType type) const;

    size_t Size() const;

    /// Sequence number the next published event will get
    uint64_t NextSequence() const;

    void Clear();

private:
    void Publish(std::vector<Event>& events);

    mutable std::recursive_mutex mutex_;
    std::vector<Event> events_;
    std::vector<Event> pending_;
    int depth_{0};
    uint64_t nextSequence_{0};
    std::map<size_t, Listener> listeners_;
    size_t nextHandle_{1};
};

} // namespace quorum

#endif // QUORUM_CORE_EVENTS_H
