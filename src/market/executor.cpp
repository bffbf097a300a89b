#include <iostream>
#include <tunemart/common/error.hpp>
#include <tunemart/market/executor.hpp>

namespace tunemart {

    class Executor::CallScope {
      public:
        inline explicit CallScope(std::atomic<std::thread::id> &executing) : executing_(executing) {
            executing_.store(std::this_thread::get_id());
        }
        inline ~CallScope() { executing_.store(std::thread::id()); }

        CallScope(const CallScope &) = delete;
        CallScope &operator=(const CallScope &) = delete;

      private:
        std::atomic<std::thread::id> &executing_;
    };

    Executor::Executor(ExecutorOptions options) : options_(options) {}

    std::unique_lock<std::mutex> Executor::readLock() const {
        std::unique_lock<std::mutex> lock(mutex_, std::defer_lock);
        if (!insideCall())
            lock.lock();
        return lock;
    }

    dp::Result<void, dp::Error> Executor::fund(const Address &account, Amount amount) {
        if (insideCall())
            return dp::Result<void, dp::Error>::err(reentrant_call());
        std::lock_guard<std::mutex> lock(mutex_);
        return bank_.credit(account, amount);
    }

    dp::Result<void, dp::Error> Executor::deploy(const Address &market_address, const CallContext &ctx,
                                                 const MarketConfig &config) {
        if (insideCall())
            return dp::Result<void, dp::Error>::err(reentrant_call());
        std::lock_guard<std::mutex> lock(mutex_);
        if (market_)
            return dp::Result<void, dp::Error>::err(already_deployed());

        auto deployed = Marketplace::deploy(bank_, market_address, ctx, config);
        if (!deployed.is_ok()) {
            if (options_.log_calls)
                std::cout << "Deployment by " << ctx.sender.shortHex()
                          << " rejected: " << deployed.error().message.c_str() << std::endl;
            return dp::Result<void, dp::Error>::err(deployed.error());
        }

        market_ = deployed.value();
        if (options_.log_calls)
            std::cout << "Marketplace " << market_->name() << " deployed at " << market_address.shortHex()
                      << " with " << market_->itemCount() << " items" << std::endl;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> Executor::attachJournal(std::shared_ptr<storage::JournalStore> journal) {
        if (insideCall())
            return dp::Result<void, dp::Error>::err(reentrant_call());
        std::lock_guard<std::mutex> lock(mutex_);
        if (!journal || !journal->isOpen())
            return dp::Result<void, dp::Error>::err(dp::Error::invalid_argument("Journal is not open"));

        for (const auto &receipt : journal->readAllReceipts()) {
            used_call_ids_.insert(receipt.getCallId());
            if (receipt.sequence >= next_sequence_)
                next_sequence_ = receipt.sequence + 1;
        }
        journal_ = std::move(journal);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<ledger::Receipt, dp::Error> Executor::execute(const Address &sender, const MarketCall &call) {
        if (insideCall())
            return dp::Result<ledger::Receipt, dp::Error>::err(reentrant_call());
        std::lock_guard<std::mutex> lock(mutex_);
        CallScope scope(executing_);
        return run(sender, call);
    }

    dp::Result<ledger::Receipt, dp::Error> Executor::submit(const SignedCall &signed_call) {
        if (insideCall())
            return dp::Result<ledger::Receipt, dp::Error>::err(reentrant_call());

        auto sender = signed_call.verify();
        if (!sender.is_ok()) {
            if (options_.log_calls)
                std::cout << "Call " << signed_call.call.getCallId() << " rejected: bad signature" << std::endl;
            return dp::Result<ledger::Receipt, dp::Error>::err(sender.error());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        CallScope scope(executing_);
        return run(sender.value(), signed_call.call);
    }

    std::vector<ledger::Receipt> Executor::receipts() const {
        auto lock = readLock();
        return receipts_;
    }

    bool Executor::isCallUsed(const std::string &call_id) const {
        auto lock = readLock();
        return used_call_ids_.find(call_id) != used_call_ids_.end();
    }

    dp::u64 Executor::nextSequence() const {
        auto lock = readLock();
        return next_sequence_;
    }

    dp::Optional<dp::Error> Executor::fault() const {
        auto lock = readLock();
        if (invariant_fault_.has_value())
            return invariant_fault_;
        return journal_fault_;
    }

    bool Executor::hasFault() const { return fault().has_value(); }

    size_t Executor::unjournaledCount() const {
        auto lock = readLock();
        return unjournaled_receipts_.size();
    }

    // Caller holds mutex_
    dp::Result<ledger::Receipt, dp::Error> Executor::run(const Address &sender, const MarketCall &call) {
        using R = dp::Result<ledger::Receipt, dp::Error>;

        if (!market_)
            return R::err(not_deployed());

        std::string call_id = call.getCallId();
        if (call_id.empty())
            return R::err(dp::Error::invalid_argument("Call id must not be empty"));
        if (used_call_ids_.find(call_id) != used_call_ids_.end()) {
            if (options_.log_calls)
                std::cout << "Duplicate call detected: " << call_id << " already executed" << std::endl;
            return R::err(duplicate_call());
        }

        size_t first_event = market_->events().size();
        auto outcome = dispatch(sender, call);

        ledger::Receipt receipt;
        receipt.sequence = next_sequence_++;
        receipt.call_id = call.call_id;
        receipt.sender = sender;
        receipt.kind = call.kind;
        receipt.success = outcome.is_ok();
        receipt.events_emitted = market_->events().size() - first_event;
        if (!outcome.is_ok()) {
            receipt.error_code = outcome.error().code;
            receipt.error_message = outcome.error().message;
        }

        used_call_ids_.insert(call_id);
        receipts_.push_back(receipt);

        if (options_.log_calls) {
            std::cout << "#" << receipt.sequence << " " << callKindToString(call.getKind()) << " [" << call_id
                      << "] by " << sender.shortHex();
            if (receipt.success)
                std::cout << " committed" << std::endl;
            else
                std::cout << " reverted (" << errorKindToString(errorKind(receipt.error_code))
                          << "): " << receipt.getErrorMessage() << std::endl;
        }

        // From here on the call has taken effect; problems are faults, not call errors
        auto journaled = journal(receipt, first_event);
        if (!journaled.is_ok()) {
            std::cout << "Journal write failed after " << call_id << ": " << journaled.error().message.c_str()
                      << " (" << unjournaled_receipts_.size() << " receipts pending)" << std::endl;
            journal_fault_ = dp::Optional<dp::Error>(journaled.error());
        }

        if (receipt.success && options_.verify_invariants) {
            auto invariants = market_->checkInvariants();
            if (!invariants.is_ok()) {
                std::cout << "Invariant check failed after " << call_id << ": "
                          << invariants.error().message.c_str() << std::endl;
                invariant_fault_ = dp::Optional<dp::Error>(invariants.error());
            }
        }

        return R::ok(receipt);
    }

    dp::Result<void, dp::Error> Executor::dispatch(const Address &sender, const MarketCall &call) {
        CallContext ctx{sender, call.value};
        switch (call.getKind()) {
        case CallKind::UpdateRoyaltyFee:
            return market_->updateRoyaltyFee(ctx, call.amount);
        case CallKind::BuyToken:
            return market_->buyToken(ctx, call.token_id);
        case CallKind::ResellToken:
            return market_->resellToken(ctx, call.token_id, call.amount);
        case CallKind::TransferOwnership:
            return market_->transferOwnership(ctx, call.target);
        default:
            return dp::Result<void, dp::Error>::err(unknown_call());
        }
    }

    dp::Result<void, dp::Error> Executor::journal(const ledger::Receipt &receipt, size_t first_event) {
        if (!journal_)
            return dp::Result<void, dp::Error>::ok();

        unjournaled_receipts_.push_back(receipt);
        const auto &events = market_->events().events();
        for (size_t i = first_event; i < events.size(); ++i)
            unjournaled_events_.push_back(events[i]);

        return flushJournal();
    }

    /// Write the backlog in one transaction; on failure it stays queued for the next call
    dp::Result<void, dp::Error> Executor::flushJournal() {
        auto tx = journal_->beginTransaction();
        for (const auto &receipt : unjournaled_receipts_) {
            auto stored = journal_->storeReceipt(receipt);
            if (!stored.is_ok())
                return stored;
        }
        for (const auto &event : unjournaled_events_) {
            auto stored = journal_->storeEvent(event);
            if (!stored.is_ok())
                return stored;
        }

        auto committed = tx->commit();
        if (!committed.is_ok())
            return committed;

        unjournaled_receipts_.clear();
        unjournaled_events_.clear();
        journal_fault_ = dp::Optional<dp::Error>();
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace tunemart
