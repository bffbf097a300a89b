#pragma once

#include <atomic>
#include <datapod/datapod.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "call.hpp"
#include "marketplace.hpp"
#include "tunemart/ledger/balance_book.hpp"
#include "tunemart/ledger/receipt.hpp"
#include "tunemart/storage/journal_store.hpp"

namespace tunemart {

    /// Executor configuration
    struct ExecutorOptions {
        bool verify_invariants = true; // run Marketplace::checkInvariants after every committed call
        bool log_calls = true;         // print one line per call to stdout

        auto members() { return std::tie(verify_invariants, log_calls); }
        auto members() const { return std::tie(verify_invariants, log_calls); }
    };

    /// Host environment of one marketplace.
    ///
    /// Owns the balance book and the deployed marketplace and runs calls one at a time in
    /// submission order. Each accepted call gets the next sequence number and a receipt, whether
    /// the operation succeeded or was rejected by the marketplace. Calls rejected by the host
    /// itself (replayed id, bad signature, nothing deployed, re-entry from payee code) get neither.
    ///
    /// A committed call always returns its receipt. Journal write failures and invariant
    /// violations found afterwards are reported through fault(); unwritten receipts and events
    /// are kept and written with the next call.
    class Executor {
      public:
        explicit Executor(ExecutorOptions options = ExecutorOptions{});

        Executor(const Executor &) = delete;
        Executor &operator=(const Executor &) = delete;

        /// Credit an account out of thin air (genesis funding)
        dp::Result<void, dp::Error> fund(const Address &account, Amount amount);

        dp::Result<void, dp::Error> deploy(const Address &market_address, const CallContext &ctx,
                                           const MarketConfig &config);

        /// Mirror receipts and events to `journal`; calls already recorded there count as used
        dp::Result<void, dp::Error> attachJournal(std::shared_ptr<storage::JournalStore> journal);

        /// Run a call on behalf of `sender` (trusted path, no signature)
        dp::Result<ledger::Receipt, dp::Error> execute(const Address &sender, const MarketCall &call);

        /// Verify the signature, then run the call on behalf of the signing key's address
        dp::Result<ledger::Receipt, dp::Error> submit(const SignedCall &signed_call);

        /// Direct access for queries and payee code; calls made through it bypass ordering and receipts
        std::shared_ptr<Marketplace> market() const { return market_; }

        ledger::BalanceBook &bank() { return bank_; }
        const ledger::BalanceBook &bank() const { return bank_; }

        std::vector<ledger::Receipt> receipts() const;

        bool isCallUsed(const std::string &call_id) const;

        dp::u64 nextSequence() const;

        /// Problem found after a call committed. An invariant violation is permanent; a journal
        /// failure is cleared once the backlog has been written.
        dp::Optional<dp::Error> fault() const;

        bool hasFault() const;

        /// Receipts not yet written to the journal
        size_t unjournaledCount() const;

      private:
        /// Marks the calling thread as running a call for its whole scope
        class CallScope;

        bool insideCall() const { return executing_.load() == std::this_thread::get_id(); }

        /// Locks unless the calling thread is already running a call (payee code reading state)
        std::unique_lock<std::mutex> readLock() const;

        dp::Result<void, dp::Error> dispatch(const Address &sender, const MarketCall &call);
        dp::Result<ledger::Receipt, dp::Error> run(const Address &sender, const MarketCall &call);
        dp::Result<void, dp::Error> journal(const ledger::Receipt &receipt, size_t first_event);
        dp::Result<void, dp::Error> flushJournal();

        ExecutorOptions options_;
        ledger::BalanceBook bank_;
        std::shared_ptr<Marketplace> market_;
        std::shared_ptr<storage::JournalStore> journal_;
        std::vector<ledger::Receipt> receipts_;
        std::unordered_set<std::string> used_call_ids_;
        std::vector<ledger::Receipt> unjournaled_receipts_;
        std::vector<ledger::MarketEvent> unjournaled_events_;
        dp::Optional<dp::Error> journal_fault_;
        dp::Optional<dp::Error> invariant_fault_;
        dp::u64 next_sequence_{0};
        mutable std::mutex mutex_;
        std::atomic<std::thread::id> executing_{};
    };

} // namespace tunemart
