#pragma once

#include <datapod/datapod.hpp>
#include <string>
#include <tuple>

#include "tunemart/identity/address.hpp"

namespace tunemart::ledger {

    /// Outcome of one executed call
    struct Receipt {
        dp::u64 sequence{0};
        dp::String call_id;
        Address sender{};
        dp::u8 kind{0}; // CallKind
        bool success{false};
        dp::u32 error_code{0};
        dp::String error_message;
        dp::u64 events_emitted{0};

        inline std::string getCallId() const { return std::string(call_id.c_str()); }

        inline std::string getErrorMessage() const { return std::string(error_message.c_str()); }

        auto members() {
            return std::tie(sequence, call_id, sender, kind, success, error_code, error_message, events_emitted);
        }
        auto members() const {
            return std::tie(sequence, call_id, sender, kind, success, error_code, error_message, events_emitted);
        }
    };

} // namespace tunemart::ledger
