#pragma once

#include <datapod/datapod.hpp>
#include <functional>
#include <sstream>
#include <tuple>
#include <string>
#include <vector>

#include "tunemart/common/amount.hpp"
#include "tunemart/identity/address.hpp"

namespace tunemart::ledger {

    /// Marketplace notification types
    enum class MarketEventType : dp::u8 {
        ItemBought = 0,   // MarketItemBought(token_id, seller, buyer, price)
        ItemRelisted = 1, // MarketItemRelisted(token_id, seller, price)
    };

    inline std::string marketEventTypeToString(MarketEventType type) {
        switch (type) {
        case MarketEventType::ItemBought:
            return "MarketItemBought";
        case MarketEventType::ItemRelisted:
            return "MarketItemRelisted";
        default:
            return "unknown";
        }
    }

    /// One emitted notification; buyer is the zero address for relists
    struct MarketEvent {
        dp::u64 sequence{0};
        dp::u8 type{0};
        TokenId token_id{0};
        Address seller{};
        Address buyer{};
        Amount price{0};

        inline static MarketEvent bought(TokenId token_id, const Address &seller, const Address &buyer, Amount price) {
            MarketEvent event;
            event.type = static_cast<dp::u8>(MarketEventType::ItemBought);
            event.token_id = token_id;
            event.seller = seller;
            event.buyer = buyer;
            event.price = price;
            return event;
        }

        inline static MarketEvent relisted(TokenId token_id, const Address &seller, Amount price) {
            MarketEvent event;
            event.type = static_cast<dp::u8>(MarketEventType::ItemRelisted);
            event.token_id = token_id;
            event.seller = seller;
            event.price = price;
            return event;
        }

        inline MarketEventType getType() const { return static_cast<MarketEventType>(type); }

        inline std::string toString() const {
            std::stringstream ss;
            ss << marketEventTypeToString(getType()) << "(" << token_id << ", " << seller.toHex();
            if (getType() == MarketEventType::ItemBought)
                ss << ", " << buyer.toHex();
            ss << ", " << price << ")";
            return ss.str();
        }

        auto members() { return std::tie(sequence, type, token_id, seller, buyer, price); }
        auto members() const { return std::tie(sequence, type, token_id, seller, buyer, price); }
    };

    /// Ordered history of committed events with synchronous listeners
    class EventLog {
      public:
        using Listener = std::function<void(const MarketEvent &)>;

        /// Assigns the next sequence number and notifies listeners.
        /// Listeners subscribed while notifying only see later events.
        inline MarketEvent publish(MarketEvent event) {
            event.sequence = next_sequence_++;
            events_.push_back(event);
            const size_t listener_count = listeners_.size();
            for (size_t i = 0; i < listener_count; ++i) {
                Listener listener = listeners_[i];
                listener(event);
            }
            return event;
        }

        inline void subscribe(Listener listener) { listeners_.push_back(std::move(listener)); }

        inline const std::vector<MarketEvent> &events() const { return events_; }

        inline std::vector<MarketEvent> eventsForToken(TokenId token_id) const {
            std::vector<MarketEvent> result;
            for (const auto &event : events_) {
                if (event.token_id == token_id)
                    result.push_back(event);
            }
            return result;
        }

        inline size_t size() const { return events_.size(); }

      private:
        std::vector<MarketEvent> events_;
        std::vector<Listener> listeners_;
        dp::u64 next_sequence_{0};
    };

} // namespace tunemart::ledger
