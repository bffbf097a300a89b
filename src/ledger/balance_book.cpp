#include <tunemart/common/error.hpp>
#include <tunemart/ledger/balance_book.hpp>

namespace tunemart::ledger {

    dp::Result<void, dp::Error> BalanceBook::credit(const Address &account, Amount amount) {
        if (account.isZero())
            return dp::Result<void, dp::Error>::err(zero_address());

        auto sum = checkedAdd(balanceOf(account), amount);
        if (!sum.is_ok())
            return dp::Result<void, dp::Error>::err(sum.error());

        balances_[account] = sum.value();
        return dp::Result<void, dp::Error>::ok();
    }

    Amount BalanceBook::balanceOf(const Address &account) const {
        auto it = balances_.find(account);
        return (it != balances_.end()) ? it->second : 0;
    }

    dp::Result<void, dp::Error> BalanceBook::transfer(const Address &from, const Address &to, Amount amount) {
        if (to.isZero())
            return dp::Result<void, dp::Error>::err(zero_address("Cannot pay the zero address"));

        Amount available = balanceOf(from);
        if (available < amount)
            return dp::Result<void, dp::Error>::err(insufficient_funds());

        if (from == to || amount == 0)
            return dp::Result<void, dp::Error>::ok();

        auto credited = checkedAdd(balanceOf(to), amount);
        if (!credited.is_ok())
            return dp::Result<void, dp::Error>::err(credited.error());

        balances_[from] = available - amount;
        balances_[to] = credited.value();
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> BalanceBook::pay(const Address &from, const Address &to, Amount amount) {
        auto moved = transfer(from, to, amount);
        if (!moved.is_ok())
            return moved;

        auto it = receivers_.find(to);
        if (it == receivers_.end() || !it->second)
            return dp::Result<void, dp::Error>::ok();

        // Hold a reference: the receiver may unregister itself while running
        auto receiver = it->second;
        auto accepted = receiver->onPayment(from, amount);
        if (!accepted.is_ok())
            return dp::Result<void, dp::Error>::err(payment_rejected(accepted.error().message));

        return dp::Result<void, dp::Error>::ok();
    }

    void BalanceBook::registerReceiver(const Address &account, std::shared_ptr<PaymentReceiver> receiver) {
        receivers_[account] = std::move(receiver);
    }

    void BalanceBook::unregisterReceiver(const Address &account) { receivers_.erase(account); }

    bool BalanceBook::hasReceiver(const Address &account) const { return receivers_.count(account) > 0; }

    Amount BalanceBook::totalSupply() const {
        Amount total = 0;
        for (const auto &[account, balance] : balances_)
            total += balance;
        return total;
    }

    size_t BalanceBook::accountCount() const { return balances_.size(); }

} // namespace tunemart::ledger
