#ifndef MINICHAIN_BLOCK_H
#define MINICHAIN_BLOCK_H

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../transaction/Transaction.h"

namespace minichain
{

class Block
{
public:
    // previousHash of the genesis block
    static const std::string GENESIS_PREVIOUS_HASH;
    static constexpr int MAX_DIFFICULTY = 64; // hex digits in a sha256

    // timestamp in milliseconds since the epoch; nonce starts at 0
    Block(const std::vector<Transaction> &txs, const std::string &prevHash, std::int64_t time);
    Block(const std::vector<Transaction> &txs, const std::string &prevHash);

    const std::vector<Transaction> &getTransactions() const { return transactions; }
    std::int64_t getTimestamp() const { return timestamp; }
    const std::string &getPreviousHash() const { return previousHash; }
    std::uint64_t getNonce() const { return nonce; }

    // hash cached at construction / mining time, see computeHash() for a fresh one
    const std::string &getHash() const { return hash; }

    std::string computeHash() const;

    static std::string target(int difficulty);
    // Throws InvalidDifficultyError unless 1 <= difficulty <= MAX_DIFFICULTY.
    static void checkDifficulty(int difficulty);
    bool meetsDifficulty(int difficulty) const;

    // proof of work: bump the nonce until the hash starts with `difficulty` zeros
    void mineBlock(int difficulty);

    // Throws InvalidTransactionError with the index of the first bad transaction.
    void checkTransactions() const;
    bool validateTransactions() const;

    nlohmann::json toJSON() const;
    static Block fromJSON(const nlohmann::json &j);

    static std::int64_t nowMillis();

private:
    std::vector<Transaction> transactions;
    std::int64_t timestamp;
    std::string previousHash;
    std::uint64_t nonce;
    std::string hash;

    nlohmann::json transactionsJSON() const;
    std::string hashWith(const nlohmann::json &txs) const;
};

} // namespace minichain

#endif // MINICHAIN_BLOCK_H
