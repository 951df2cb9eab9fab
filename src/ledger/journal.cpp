#include <iostream>
#include <keylock/keylock.hpp>
#include <sstream>
#include <stakeit/ledger/journal.hpp>

namespace stakeit::ledger {

    const std::string Journal::GENESIS_HASH = std::string(64, '0');

    std::string entryKindToString(EntryKind kind) {
        switch (kind) {
        case EntryKind::MarketCreated:
            return "market-created";
        case EntryKind::BetPlaced:
            return "bet-placed";
        case EntryKind::MarketResolved:
            return "market-resolved";
        case EntryKind::WinningsClaimed:
            return "winnings-claimed";
        case EntryKind::BetRefunded:
            return "bet-refunded";
        case EntryKind::MarketCleaned:
            return "market-cleaned";
        case EntryKind::ConfigUpdated:
            return "config-updated";
        case EntryKind::OwnershipTransferred:
            return "ownership-transferred";
        default:
            return "unknown";
        }
    }

    std::string JournalEntry::toString() const {
        std::string actor_text = getActor();
        std::string detail_text = getDetail();
        std::string previous = getPreviousHash();

        std::stringstream ss;
        ss << sequence << '|' << static_cast<int>(kind) << '|' << block_height << '|' << actor_text.size() << ':'
           << actor_text << '|' << market_id << '|' << amount << '|' << static_cast<int>(flag) << '|'
           << detail_text.size() << ':' << detail_text << '|' << previous.size() << ':' << previous;
        return ss.str();
    }

    std::vector<uint8_t> JournalEntry::toBytes() const {
        auto &self = const_cast<JournalEntry &>(*this);
        auto buf = dp::serialize<dp::Mode::WITH_VERSION>(self);
        return std::vector<uint8_t>(buf.begin(), buf.end());
    }

    dp::Result<JournalEntry, dp::Error> JournalEntry::fromBytes(const std::vector<uint8_t> &data) {
        try {
            dp::ByteBuf buf(data.begin(), data.end());
            auto result = dp::deserialize<dp::Mode::WITH_VERSION, JournalEntry>(buf);
            return dp::Result<JournalEntry, dp::Error>::ok(std::move(result));
        } catch (const std::exception &e) {
            return dp::Result<JournalEntry, dp::Error>::err(dp::Error::io_error(dp::String(e.what())));
        }
    }

    dp::Result<std::string, dp::Error> Journal::hashData(const std::string &data) {
        keylock::keylock crypto(keylock::Algorithm::XChaCha20_Poly1305, keylock::HashAlgorithm::SHA256);
        std::vector<uint8_t> data_vec(data.begin(), data.end());
        auto hash_result = crypto.hash(data_vec);
        if (hash_result.success)
            return dp::Result<std::string, dp::Error>::ok(keylock::keylock::to_hex(hash_result.data));
        return dp::Result<std::string, dp::Error>::err(hash_failed("Failed to hash journal entry"));
    }

    Journal Journal::restore(const std::vector<JournalEntry> &entries) {
        Journal result;
        result.entries_ = entries;
        return result;
    }

    dp::Result<JournalEntry, dp::Error> Journal::append(EntryKind kind, BlockHeight block_height,
                                                        const Principal &actor, MarketId market_id, Amount amount,
                                                        bool flag, const std::string &detail) {
        JournalEntry entry;
        entry.sequence = entries_.size() + 1;
        entry.kind = static_cast<dp::u8>(kind);
        entry.block_height = block_height;
        entry.actor = dp::String(actor.c_str());
        entry.market_id = market_id;
        entry.amount = amount;
        entry.flag = flag ? 1 : 0;
        entry.detail = dp::String(detail.c_str());
        entry.previous_hash = dp::String(lastHash().c_str());

        auto hash = hashData(entry.toString());
        if (!hash.is_ok()) {
            return dp::Result<JournalEntry, dp::Error>::err(hash.error());
        }
        entry.hash = dp::String(hash.value().c_str());
        entries_.push_back(entry);
        return dp::Result<JournalEntry, dp::Error>::ok(entry);
    }

    const std::vector<JournalEntry> &Journal::entries() const { return entries_; }

    std::vector<JournalEntry> Journal::entriesFor(MarketId market_id) const {
        std::vector<JournalEntry> result;
        for (const auto &entry : entries_) {
            if (entry.market_id == market_id)
                result.push_back(entry);
        }
        return result;
    }

    size_t Journal::size() const { return entries_.size(); }

    bool Journal::empty() const { return entries_.empty(); }

    std::string Journal::lastHash() const { return entries_.empty() ? GENESIS_HASH : entries_.back().getHash(); }

    bool Journal::verify() const {
        std::string expected_previous = GENESIS_HASH;
        for (size_t i = 0; i < entries_.size(); i++) {
            const auto &entry = entries_[i];
            if (entry.sequence != i + 1)
                return false;
            if (entry.getPreviousHash() != expected_previous)
                return false;
            auto recomputed = hashData(entry.toString());
            if (!recomputed.is_ok() || recomputed.value() != entry.getHash())
                return false;
            expected_previous = entry.getHash();
        }
        return true;
    }

    void Journal::printSummary() const {
        std::cout << "=== Journal Summary ===" << std::endl;
        std::cout << "Entries: " << entries_.size() << std::endl;
        std::cout << "Chain Valid: " << (verify() ? "YES" : "NO") << std::endl;
        for (const auto &entry : entries_) {
            std::cout << "  #" << entry.sequence << " @" << entry.block_height << " "
                      << entryKindToString(entry.getKind()) << " by " << entry.getActor();
            if (entry.market_id != 0)
                std::cout << " market=" << entry.market_id;
            if (entry.amount != 0)
                std::cout << " amount=" << entry.amount;
            if (!entry.getDetail().empty())
                std::cout << " (" << entry.getDetail() << ")";
            std::cout << std::endl;
        }
        if (!entries_.empty())
            std::cout << "Head Hash: " << lastHash().substr(0, 16) << "..." << std::endl;
    }

} // namespace stakeit::ledger
