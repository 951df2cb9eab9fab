#pragma once

#include <datapod/datapod.hpp>
#include <stakeit/common/error.hpp>
#include <stakeit/common/types.hpp>
#include <string>
#include <tuple>
#include <vector>

namespace stakeit::ledger {

    /// Kinds of state change recorded in the journal
    enum class EntryKind : dp::u8 {
        MarketCreated = 0,
        BetPlaced = 1,
        MarketResolved = 2,
        WinningsClaimed = 3,
        BetRefunded = 4,
        MarketCleaned = 5,
        ConfigUpdated = 6,
        OwnershipTransferred = 7,
    };

    std::string entryKindToString(EntryKind kind);

    /// One successful state change.
    /// `flag` carries the boolean of the operation (prediction, outcome), 0 otherwise.
    struct JournalEntry {
        dp::u64 sequence{0};
        dp::u8 kind{0}; // EntryKind
        dp::u64 block_height{0};
        dp::String actor;
        dp::u64 market_id{0};
        dp::u64 amount{0};
        dp::u8 flag{0};
        dp::String detail;
        dp::String previous_hash;
        dp::String hash;

        inline EntryKind getKind() const { return static_cast<EntryKind>(kind); }

        inline std::string getActor() const { return std::string(actor.c_str()); }

        inline std::string getDetail() const { return std::string(detail.c_str()); }

        inline std::string getPreviousHash() const { return std::string(previous_hash.c_str()); }

        inline std::string getHash() const { return std::string(hash.c_str()); }

        /// Canonical text covered by the hash (everything except `hash` itself).
        /// String fields are length-prefixed so no two entries share a text.
        std::string toString() const;

        std::vector<uint8_t> toBytes() const;

        static dp::Result<JournalEntry, dp::Error> fromBytes(const std::vector<uint8_t> &data);

        auto members() {
            return std::tie(sequence, kind, block_height, actor, market_id, amount, flag, detail, previous_hash, hash);
        }
        auto members() const {
            return std::tie(sequence, kind, block_height, actor, market_id, amount, flag, detail, previous_hash, hash);
        }
    };

    /// Append-only, hash-chained log of settlement activity
    class Journal {
      private:
        std::vector<JournalEntry> entries_;

        static dp::Result<std::string, dp::Error> hashData(const std::string &data);

      public:
        /// Previous-hash value of the first entry
        static const std::string GENESIS_HASH;

        Journal() = default;

        /// Rebuild a journal from exported entries; call verify() before trusting it
        static Journal restore(const std::vector<JournalEntry> &entries);

        /// Seal and append an entry; on a hash failure nothing is appended
        dp::Result<JournalEntry, dp::Error> append(EntryKind kind, BlockHeight block_height, const Principal &actor,
                                                   MarketId market_id = 0, Amount amount = 0, bool flag = false,
                                                   const std::string &detail = "");

        const std::vector<JournalEntry> &entries() const;

        std::vector<JournalEntry> entriesFor(MarketId market_id) const;

        size_t size() const;

        bool empty() const;

        std::string lastHash() const;

        /// Recompute every hash and link; false on any mismatch
        bool verify() const;

        void printSummary() const;
    };

} // namespace stakeit::ledger
