/**
 * Example: running signed marketplace calls through the executor
 *
 * This demo shows how to:
 * 1. Sign calls with Ed25519 keys and submit them in order
 * 2. Read receipts for committed and reverted calls
 * 3. Keep a journal of receipts and events on disk and query a token's history
 */

#include <filesystem>
#include <iostream>
#include <tunemart.hpp>

using namespace tunemart;

constexpr Amount UNIT = 1000;

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

bool submitSigned(Executor &executor, const MarketCall &call, const Key &key) {
    auto signed_call = SignedCall::sign(call, key);
    if (!signed_call.is_ok()) {
        std::cerr << "Signing failed: " << signed_call.error().message.c_str() << std::endl;
        return false;
    }
    auto receipt = executor.submit(signed_call.value());
    if (!receipt.is_ok()) {
        std::cout << "  host rejected " << call.getCallId() << ": " << receipt.error().message.c_str() << std::endl;
        return false;
    }
    return receipt.value().success;
}

int main() {
    std::cout << "Tunemart Executor & Journal Demo" << std::endl;

    const std::string journal_path = "tunemart_journal_demo";
    std::filesystem::remove_all(journal_path);

    auto deployer_key = Key::generate();
    auto buyer_key = Key::generate();
    if (!deployer_key.is_ok() || !buyer_key.is_ok()) {
        std::cerr << "Key generation failed" << std::endl;
        return 1;
    }
    Address deployer = Address::fromKey(deployer_key.value());
    Address buyer = Address::fromKey(buyer_key.value());
    Address artist = Address::fromLabel("artist");

    Executor executor;

    // ===========================================
    // Setup
    // ===========================================
    printSeparator("SETUP");

    auto journal = std::make_shared<storage::JournalStore>();
    auto opened = journal->open(dp::String(journal_path.c_str()));
    if (!opened.is_ok()) {
        std::cerr << "Cannot open journal: " << opened.error().message.c_str() << std::endl;
        return 1;
    }
    if (!executor.attachJournal(journal).is_ok())
        return 1;

    if (!executor.fund(deployer, 10 * UNIT).is_ok() || !executor.fund(buyer, 10 * UNIT).is_ok())
        return 1;

    MarketConfig config;
    config.royalty_fee = 10;
    config.artist = artist;
    config.prices = {UNIT, 2 * UNIT, 3 * UNIT};

    auto deployed = executor.deploy(Address::fromLabel("tunemart"), CallContext{deployer, 30}, config);
    if (!deployed.is_ok())
        return 1;

    // ===========================================
    // Calls
    // ===========================================
    printSeparator("CALLS");

    submitSigned(executor, MarketCall::buyToken("buy-1", 1, 2 * UNIT), buyer_key.value());
    submitSigned(executor, MarketCall::buyToken("buy-1-again", 1, 2 * UNIT), buyer_key.value());
    submitSigned(executor, MarketCall::resellToken("relist-1", 1, 4 * UNIT, 10), buyer_key.value());
    submitSigned(executor, MarketCall::updateRoyaltyFee("fee-by-buyer", 0), buyer_key.value());
    submitSigned(executor, MarketCall::updateRoyaltyFee("fee-by-owner", 20), deployer_key.value());
    submitSigned(executor, MarketCall::buyToken("buy-1", 1, 4 * UNIT), deployer_key.value());

    // ===========================================
    // Journal
    // ===========================================
    printSeparator("JOURNAL");

    std::cout << "  receipts: " << journal->getReceiptCount() << ", events: " << journal->getEventCount()
              << std::endl;
    for (const auto &receipt : journal->readAllReceipts()) {
        std::cout << "  #" << receipt.sequence << " " << receipt.getCallId() << " "
                  << (receipt.success ? "ok" : receipt.getErrorMessage()) << std::endl;
    }

    std::cout << "  history of token #1:" << std::endl;
    for (const auto &event : journal->eventsForToken(1))
        std::cout << "    " << event.toString() << std::endl;

    journal->close();
    std::filesystem::remove_all(journal_path);
    return 0;
}
