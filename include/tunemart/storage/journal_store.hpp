#pragma once

#include <datapod/datapod.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <unordered_map>

#include "tunemart/ledger/events.hpp"
#include "tunemart/ledger/receipt.hpp"

namespace tunemart::storage {

    using namespace datapod;

    /// Storage configuration options
    struct OpenOptions {
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL; // FULL flushes after every record

        auto members() { return std::tie(sync_mode); }
        auto members() const { return std::tie(sync_mode); }
    };

    // ===========================================
    // JournalStore - append-only receipts and events
    // ===========================================

    class JournalStore {
      public:
        inline JournalStore() : is_open_(false), sync_mode_(OpenOptions::Synchronous::NORMAL) {}

        inline ~JournalStore() { close(); }

        // Non-copyable, movable
        JournalStore(const JournalStore &) = delete;
        JournalStore &operator=(const JournalStore &) = delete;

        inline JournalStore(JournalStore &&other) noexcept
            : base_path_(std::move(other.base_path_)), is_open_(other.is_open_), sync_mode_(other.sync_mode_),
              receipt_index_(std::move(other.receipt_index_)), event_count_(other.event_count_),
              pending_receipts_(std::move(other.pending_receipts_)), pending_events_(std::move(other.pending_events_)) {
            other.is_open_ = false;
        }

        /// Open or create the journal directory
        inline Result<void, Error> open(const String &path, const OpenOptions &opts = OpenOptions{}) {
            try {
                base_path_ = std::string(path.c_str());
                sync_mode_ = opts.sync_mode;

                std::filesystem::create_directories(base_path_);
                for (const char *file : {"receipts.dat", "events.dat"}) {
                    if (!std::filesystem::exists(base_path_ / file)) {
                        std::ofstream(base_path_ / file, std::ios::binary).close();
                    }
                }
                loadIndexes();

                is_open_ = true;
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                is_open_ = false;
                return Result<void, Error>::err(Error::io_error(String(e.what())));
            }
        }

        inline void close() {
            pending_receipts_.clear();
            pending_events_.clear();
            is_open_ = false;
        }

        inline bool isOpen() const { return is_open_; }

        // ===========================================
        // Transaction management (RAII)
        // ===========================================

        class TxGuard {
          public:
            inline explicit TxGuard(JournalStore &store) : store_(store), committed_(false) { store_.clearPending(); }

            inline ~TxGuard() {
                if (!committed_)
                    store_.clearPending();
            }

            TxGuard(const TxGuard &) = delete;
            TxGuard &operator=(const TxGuard &) = delete;

            inline Result<void, Error> commit() {
                if (committed_)
                    return Result<void, Error>::ok();
                committed_ = true;
                return store_.flushPending();
            }

            inline void rollback() {
                if (!committed_) {
                    store_.clearPending();
                    committed_ = true;
                }
            }

          private:
            JournalStore &store_;
            bool committed_;
        };

        inline std::unique_ptr<TxGuard> beginTransaction() { return std::make_unique<TxGuard>(*this); }

        // ===========================================
        // Writes (buffered until commit)
        // ===========================================

        inline Result<void, Error> storeReceipt(const ledger::Receipt &receipt) {
            if (!is_open_)
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            pending_receipts_.push_back(receipt);
            return Result<void, Error>::ok();
        }

        inline Result<void, Error> storeEvent(const ledger::MarketEvent &event) {
            if (!is_open_)
                return Result<void, Error>::err(Error::invalid_argument("Store not open"));
            pending_events_.push_back(event);
            return Result<void, Error>::ok();
        }

        // ===========================================
        // Queries
        // ===========================================

        inline Optional<ledger::Receipt> getReceipt(const String &call_id) {
            if (!is_open_)
                return Optional<ledger::Receipt>();

            for (const auto &receipt : pending_receipts_) {
                if (std::string(receipt.call_id.c_str()) == std::string(call_id.c_str()))
                    return Optional<ledger::Receipt>(receipt);
            }

            auto it = receipt_index_.find(std::string(call_id.c_str()));
            if (it == receipt_index_.end())
                return Optional<ledger::Receipt>();

            return readRecordAt<ledger::Receipt>(base_path_ / "receipts.dat", it->second);
        }

        /// Committed receipts in sequence order
        inline Vector<ledger::Receipt> readAllReceipts() {
            if (!is_open_)
                return Vector<ledger::Receipt>();
            return readAllRecords<ledger::Receipt>(base_path_ / "receipts.dat");
        }

        /// Committed events in sequence order
        inline Vector<ledger::MarketEvent> readAllEvents() {
            if (!is_open_)
                return Vector<ledger::MarketEvent>();
            return readAllRecords<ledger::MarketEvent>(base_path_ / "events.dat");
        }

        /// Trading history of one token
        inline Vector<ledger::MarketEvent> eventsForToken(TokenId token_id) {
            Vector<ledger::MarketEvent> result;
            for (auto &event : readAllEvents()) {
                if (event.token_id == token_id)
                    result.push_back(std::move(event));
            }
            return result;
        }

        inline bool hasCall(const String &call_id) const {
            if (receipt_index_.count(std::string(call_id.c_str())) > 0)
                return true;
            for (const auto &receipt : pending_receipts_) {
                if (std::string(receipt.call_id.c_str()) == std::string(call_id.c_str()))
                    return true;
            }
            return false;
        }

        inline i64 getReceiptCount() const {
            if (!is_open_)
                return 0;
            return static_cast<i64>(receipt_index_.size() + pending_receipts_.size());
        }

        inline i64 getEventCount() const {
            if (!is_open_)
                return 0;
            return static_cast<i64>(event_count_ + pending_events_.size());
        }

      private:
        // ===========================================
        // File I/O with datapod serialization
        // ===========================================

        template <typename T>
        inline void appendRecord(const std::filesystem::path &file, const T &record, u64 &offset) {
            std::ofstream out(file, std::ios::binary | std::ios::app);
            if (!out)
                throw std::runtime_error("Failed to open file for writing");

            offset = out.tellp();

            T mutable_record = record;
            auto buffer = datapod::serialize(mutable_record);
            u32 len = static_cast<u32>(buffer.size());

            out.write(reinterpret_cast<const char *>(&len), sizeof(len));
            out.write(reinterpret_cast<const char *>(buffer.data()), buffer.size());

            if (sync_mode_ == OpenOptions::Synchronous::FULL) {
                out.flush();
            }
        }

        template <typename T> inline Optional<T> readRecordAt(const std::filesystem::path &file, u64 offset) {
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return Optional<T>();

            in.seekg(offset);

            u32 len;
            in.read(reinterpret_cast<char *>(&len), sizeof(len));
            if (!in)
                return Optional<T>();

            ByteBuf data(len);
            in.read(reinterpret_cast<char *>(data.data()), len);
            if (!in)
                return Optional<T>();

            return Optional<T>(datapod::deserialize<Mode::NONE, T>(data));
        }

        /// Visit every complete record; a truncated tail is ignored
        template <typename T, typename Fn> inline void scanRecords(const std::filesystem::path &file, Fn &&fn) {
            std::ifstream in(file, std::ios::binary);
            if (!in)
                return;

            while (in) {
                u64 record_offset = in.tellg();

                u32 len;
                in.read(reinterpret_cast<char *>(&len), sizeof(len));
                if (!in)
                    break;

                ByteBuf data(len);
                in.read(reinterpret_cast<char *>(data.data()), len);
                if (!in)
                    break;

                fn(record_offset, datapod::deserialize<Mode::NONE, T>(data));
            }
        }

        template <typename T> inline Vector<T> readAllRecords(const std::filesystem::path &file) {
            Vector<T> records;
            scanRecords<T>(file, [&records](u64, T record) { records.push_back(std::move(record)); });
            return records;
        }

        inline void loadIndexes() {
            receipt_index_.clear();
            event_count_ = 0;

            scanRecords<ledger::Receipt>(base_path_ / "receipts.dat",
                                         [this](u64 offset, const ledger::Receipt &receipt) {
                                             receipt_index_[std::string(receipt.call_id.c_str())] = offset;
                                         });
            scanRecords<ledger::MarketEvent>(base_path_ / "events.dat",
                                             [this](u64, const ledger::MarketEvent &) { ++event_count_; });
        }

        inline void clearPending() {
            pending_receipts_.clear();
            pending_events_.clear();
        }

        inline Result<void, Error> flushPending() {
            try {
                for (const auto &receipt : pending_receipts_) {
                    u64 offset;
                    appendRecord(base_path_ / "receipts.dat", receipt, offset);
                    receipt_index_[std::string(receipt.call_id.c_str())] = offset;
                }
                pending_receipts_.clear();

                for (const auto &event : pending_events_) {
                    u64 offset;
                    appendRecord(base_path_ / "events.dat", event, offset);
                    ++event_count_;
                }
                pending_events_.clear();
                return Result<void, Error>::ok();
            } catch (const std::exception &e) {
                clearPending();
                return Result<void, Error>::err(Error::io_error(String(e.what())));
            }
        }

        // ===========================================
        // Member variables
        // ===========================================

        std::filesystem::path base_path_;
        bool is_open_;
        OpenOptions::Synchronous sync_mode_;

        std::unordered_map<std::string, u64> receipt_index_;
        u64 event_count_ = 0;

        Vector<ledger::Receipt> pending_receipts_;
        Vector<ledger::MarketEvent> pending_events_;
    };

} // namespace tunemart::storage
