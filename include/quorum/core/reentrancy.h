// QUORUM - Reentrancy Guard
// Copyright (c) 2024 QUORUM Developers
// MIT License

#ifndef QUORUM_CORE_REENTRANCY_H
#define QUORUM_CORE_REENTRANCY_H

namespace quorum {

/**
 * "Call in progress" flag.
 *
 * Mutating entry points hold a ReentrancyGuard::Scope for their whole body.
 * A second Scope taken while the first is alive (a token callback calling
 * back into the system) does not acquire, and the entry point returns
 * ErrorCode::Reentrancy. The merchant ledger owns the guard and the
 * governance engine acquires the same instance, so one in-flight call on
 * either of them locks out both.
 *
 *   ReentrancyGuard::Scope scope(guard_);
 *   if (!scope.Acquired()) return ErrorCode::Reentrancy;
 *
 * An outer call that already holds the guard hands its Scope to the
 * internal call it makes; Holds() tells that path apart from a nested one.
 */
class ReentrancyGuard {
public:
    class Scope {
    public:
        explicit Scope(ReentrancyGuard& guard) : guard_(guard) {
            if (!guard_.entered_) {
                guard_.entered_ = true;
                acquired_ = true;
            }
        }

        ~Scope() {
            if (acquired_) {
                guard_.entered_ = false;
            }
        }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        bool Acquired() const { return acquired_; }

        /// Acquired on exactly this guard
        bool Holds(const ReentrancyGuard& guard) const {
            return acquired_ && &guard_ == &guard;
        }

    private:
        ReentrancyGuard& guard_;
        bool acquired_{false};
    };

    bool IsEntered() const { return entered_; }

private:
    bool entered_{false};
};

} // namespace quorum

#endif // QUORUM_CORE_REENTRANCY_H
