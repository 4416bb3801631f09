// QUORUM - Event Log Implementation
// Copyright (c) 2024 QUORUM Developers
// MIT License

#include "quorum/core/events.h"
#include "quorum/util/time.h"

#include <sstream>

namespace quorum {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::ProposalInitiated: return "ProposalInitiated";
        case EventType::VoteCast: return "VoteCast";
        case EventType::ProposalExecuted: return "ProposalExecuted";
        case EventType::ProposalEnded: return "ProposalEnded";
        case EventType::ParameterChanged: return "ParameterChanged";
        case EventType::DepositCollected: return "DepositCollected";
        case EventType::MerchantAdded: return "MerchantAdded";
        case EventType::MerchantRemoved: return "MerchantRemoved";
        case EventType::MerchantModified: return "MerchantModified";
        case EventType::MerchantFrozen: return "MerchantFrozen";
        case EventType::MerchantUnfrozen: return "MerchantUnfrozen";
        case EventType::MintedToUser: return "MintedToUser";
        case EventType::PaymentProcessed: return "PaymentProcessed";
        case EventType::FundsWithdrawn: return "FundsWithdrawn";
        default: return "Unknown";
    }
}

std::string Event::ToString() const {
    std::ostringstream ss;
    ss << "#" << sequence << " " << EventTypeToString(type);
    if (!detail.empty()) {
        ss << " [" << detail << "]";
    }
    switch (type) {
        case EventType::ProposalInitiated:
        case EventType::VoteCast:
            ss << " round=" << round << " by=" << actor.ToShortString()
               << " weight=" << amount;
            if (type == EventType::VoteCast) {
                ss << " total=" << extra;
            }
            break;
        case EventType::ProposalExecuted:
            ss << " round=" << round << " power=" << amount << " threshold=" << extra;
            break;
        case EventType::ProposalEnded:
            ss << " round=" << round << " executed=" << (flag ? "true" : "false");
            break;
        case EventType::ParameterChanged:
            ss << " majority " << amount << "% -> " << extra << "%";
            break;
        case EventType::DepositCollected:
            ss << " round=" << round << " from=" << actor.ToShortString() << " amount=" << amount;
            break;
        case EventType::MerchantAdded:
            ss << " merchant=" << subject.ToShortString() << " guardian="
               << actor.ToShortString() << " quota=" << amount;
            break;
        case EventType::MerchantModified:
            ss << " merchant=" << subject.ToShortString() << " guardian="
               << actor.ToShortString() << " quota=" << amount << " rebate=" << extra;
            break;
        case EventType::MerchantRemoved:
        case EventType::MerchantFrozen:
        case EventType::MerchantUnfrozen:
            ss << " merchant=" << subject.ToShortString();
            break;
        case EventType::MintedToUser:
            ss << " user=" << subject.ToShortString() << " amount=" << amount;
            if (!actor.IsNull()) {
                ss << " merchant=" << actor.ToShortString();
            }
            break;
        case EventType::PaymentProcessed:
            ss << " merchant=" << actor.ToShortString() << " user=" << subject.ToShortString()
               << " amount=" << amount << " rebate=" << extra;
            break;
        case EventType::FundsWithdrawn:
            ss << " asset=" << (actor.IsNull() ? std::string("native") : actor.ToShortString())
               << " to=" << subject.ToShortString() << " amount=" << amount;
            break;
    }
    return ss.str();
}

// ============================================================================
// Batch
// ============================================================================

EventLog::Batch::Batch(EventLog& log) : log_(log) {
    std::lock_guard<std::recursive_mutex> lock(log_.mutex_);
    mark_ = log_.pending_.size();
    ++log_.depth_;
}

EventLog::Batch::~Batch() {
    if (done_) {
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(log_.mutex_);
    log_.pending_.resize(mark_);
    --log_.depth_;
}

void EventLog::Batch::Commit() {
    if (done_) {
        return;
    }
    done_ = true;

    std::lock_guard<std::recursive_mutex> lock(log_.mutex_);
    if (--log_.depth_ == 0) {
        std::vector<Event> ready;
        ready.swap(log_.pending_);
        log_.Publish(ready);
    }
}

// ============================================================================
// EventLog
// ============================================================================

void EventLog::Emit(Event event) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    event.time = util::GetTime();
    if (depth_ > 0) {
        pending_.push_back(std::move(event));
        return;
    }
    std::vector<Event> single{std::move(event)};
    Publish(single);
}

void EventLog::Publish(std::vector<Event>& events) {
    for (auto& event : events) {
        event.sequence = nextSequence_++;
        events_.push_back(event);
        for (const auto& entry : listeners_) {
            entry.second(event);
        }
    }
}

size_t EventLog::Subscribe(Listener listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    size_t handle = nextHandle_++;
    listeners_[handle] = std::move(listener);
    return handle;
}

void EventLog::Unsubscribe(size_t handle) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    listeners_.erase(handle);
}

std::vector<Event> EventLog::GetEvents() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_;
}

std::vector<Event> EventLog::GetEventsSince(uint64_t from) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<Event> result;
    for (const auto& event : events_) {
        if (event.sequence >= from) {
            result.push_back(event);
        }
    }
    return result;
}

std::vector<Event> EventLog::FindByType(EventType type) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<Event> result;
    for (const auto& event : events_) {
        if (event.type == type) {
            result.push_back(event);
        }
    }
    return result;
}

size_t EventLog::Size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return events_.size();
}

uint64_t EventLog::NextSequence() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return nextSequence_;
}

void EventLog::Clear() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    events_.clear();
    pending_.clear();
}

} // namespace quorum
