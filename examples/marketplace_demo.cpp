/**
 * Example: a music NFT marketplace from deployment to resale
 *
 * This demo shows how to:
 * 1. Deploy a fixed catalogue of eight tracks with a royalty deposit
 * 2. Buy a track and follow where the payment goes
 * 3. Relist the track at a higher price and sell it again
 */

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <tunemart.hpp>
#include <utility>
#include <vector>

using namespace tunemart;

// 1 currency unit = 1000
constexpr Amount UNIT = 1000;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

std::string formatAmount(Amount amount) {
    std::ostringstream out;
    out << amount / UNIT << "." << std::setw(3) << std::setfill('0') << amount % UNIT;
    return out.str();
}

void printBalances(const ledger::BalanceBook &bank, const Marketplace &market,
                   const std::vector<std::pair<std::string, Address>> &accounts) {
    for (const auto &[label, address] : accounts)
        std::cout << "  " << std::setw(12) << std::left << label << formatAmount(bank.balanceOf(address)) << std::endl;
    std::cout << "  " << std::setw(12) << std::left << "marketplace" << formatAmount(market.balance()) << std::endl;
}

void printListings(const Marketplace &market) {
    auto unsold = market.getAllUnsoldTokens();
    std::cout << "  " << unsold.size() << " of " << market.itemCount() << " tracks listed" << std::endl;
    for (const auto &item : unsold)
        std::cout << "    #" << item.token_id << " " << formatAmount(item.price) << " from " << item.seller.shortHex()
                  << std::endl;
}

int main() {
    std::cout << "Tunemart Marketplace Demo" << std::endl;

    ledger::BalanceBook bank;
    Address deployer = Address::fromLabel("label-records");
    Address artist = Address::fromLabel("artist");
    Address fan = Address::fromLabel("fan");
    Address collector = Address::fromLabel("collector");
    Address market_address = Address::fromLabel("tunemart");

    for (const auto &account : {deployer, fan, collector}) {
        auto funded = bank.credit(account, 100 * UNIT);
        if (!funded.is_ok()) {
            std::cerr << "Funding failed: " << funded.error().message.c_str() << std::endl;
            return 1;
        }
    }

    std::vector<std::pair<std::string, Address>> accounts = {
        {"deployer", deployer}, {"artist", artist}, {"fan", fan}, {"collector", collector}};

    // ===========================================
    // Deployment
    // ===========================================
    printSeparator("DEPLOYMENT");

    MarketConfig config;
    config.royalty_fee = 10; // 0.01
    config.artist = artist;
    for (Amount i = 1; i <= 8; ++i)
        config.prices.push_back(i * UNIT);

    auto deployed = Marketplace::deploy(bank, market_address, CallContext{deployer, 8 * config.royalty_fee}, config);
    if (!deployed.is_ok()) {
        std::cerr << "Deployment failed: " << deployed.error().message.c_str() << std::endl;
        return 1;
    }
    auto market = deployed.value();

    market->events().subscribe(
        [](const ledger::MarketEvent &event) { std::cout << "  event: " << event.toString() << std::endl; });

    std::cout << "  " << market->name() << " (" << market->symbol() << ") at " << market->address() << std::endl;
    std::cout << "  royalty fee " << formatAmount(market->royaltyFee()) << " to " << market->artist().shortHex()
              << std::endl;
    std::cout << "  metadata for #0: " << market->tokenURI(0).value() << std::endl;
    printListings(*market);
    printBalances(bank, *market, accounts);

    // ===========================================
    // Purchase
    // ===========================================
    printSeparator("FAN BUYS TRACK #0");

    auto bought = market->buyToken(CallContext{fan, 1 * UNIT}, 0);
    if (!bought.is_ok()) {
        std::cerr << "Purchase failed: " << bought.error().message.c_str() << std::endl;
        return 1;
    }
    printListings(*market);
    printBalances(bank, *market, accounts);

    auto double_buy = market->buyToken(CallContext{collector, 1 * UNIT}, 0);
    std::cout << "  second purchase of #0: " << double_buy.error().message.c_str() << " ("
              << errorKindToString(errorKind(double_buy.error())) << ")" << std::endl;

    // ===========================================
    // Relist
    // ===========================================
    printSeparator("FAN RELISTS TRACK #0 AT 2.000");

    auto underpaid = market->resellToken(CallContext{fan, 0}, 0, 2 * UNIT);
    std::cout << "  relist without royalty: " << underpaid.error().message.c_str() << std::endl;

    auto relisted = market->resellToken(CallContext{fan, market->royaltyFee()}, 0, 2 * UNIT);
    if (!relisted.is_ok()) {
        std::cerr << "Relist failed: " << relisted.error().message.c_str() << std::endl;
        return 1;
    }
    printListings(*market);

    // ===========================================
    // Resale
    // ===========================================
    printSeparator("COLLECTOR BUYS TRACK #0");

    auto resold = market->buyToken(CallContext{collector, 2 * UNIT}, 0);
    if (!resold.is_ok()) {
        std::cerr << "Resale failed: " << resold.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "  collector owns " << market->getMyTokens(collector).size() << " track(s)" << std::endl;
    printBalances(bank, *market, accounts);

    auto invariants = market->checkInvariants();
    std::cout << "\nInvariants: " << (invariants.is_ok() ? "hold" : invariants.error().message.c_str()) << std::endl;
    return invariants.is_ok() ? 0 : 1;
}
