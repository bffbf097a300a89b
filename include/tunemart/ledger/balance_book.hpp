#pragma once

#include <datapod/datapod.hpp>
#include <map>
#include <memory>

#include "tunemart/common/amount.hpp"
#include "tunemart/identity/address.hpp"

namespace tunemart::ledger {

    /// Code run when an account receives a payment.
    /// Receivers are third-party code: they may call back into the marketplace
    /// or refuse the payment by returning an error.
    class PaymentReceiver {
      public:
        virtual ~PaymentReceiver() = default;
        virtual dp::Result<void, dp::Error> onPayment(const Address &from, Amount amount) = 0;
    };

    /// Native currency accounts
    class BalanceBook {
      public:
        using Snapshot = std::map<Address, Amount>;

        BalanceBook() = default;

        dp::Result<void, dp::Error> credit(const Address &account, Amount amount);

        Amount balanceOf(const Address &account) const;

        /// Move funds without running receiver code
        dp::Result<void, dp::Error> transfer(const Address &from, const Address &to, Amount amount);

        /// Move funds, then run the payee's receiver (an outbound external call)
        dp::Result<void, dp::Error> pay(const Address &from, const Address &to, Amount amount);

        void registerReceiver(const Address &account, std::shared_ptr<PaymentReceiver> receiver);

        void unregisterReceiver(const Address &account);

        bool hasReceiver(const Address &account) const;

        Amount totalSupply() const;

        size_t accountCount() const;

        Snapshot snapshot() const { return balances_; }

        void restore(const Snapshot &snapshot) { balances_ = snapshot; }

      private:
        std::map<Address, Amount> balances_;
        std::map<Address, std::shared_ptr<PaymentReceiver>> receivers_;
    };

} // namespace tunemart::ledger
