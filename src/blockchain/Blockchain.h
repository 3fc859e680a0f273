#ifndef MINICHAIN_BLOCKCHAIN_H
#define MINICHAIN_BLOCKCHAIN_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../block/Block.h"
#include "../config/ChainConfig.h"
#include "../transaction/Transaction.h"

namespace minichain
{

// Not safe for concurrent callers: wrap addTransaction / minePendingTransactions
// in a mutex if the chain is shared between threads.
class Blockchain
{
public:
    static constexpr std::int64_t GENESIS_TIMESTAMP = 0;

    explicit Blockchain(const ChainConfig &config = ChainConfig());

    static Block createGenesisBlock();

    // add transaction to mempool for mining
    void addTransaction(const Transaction &tx);

    // Mine everything pending (including the previous round's reward) into a new
    // block, then queue this miner's reward for the next block.
    Block minePendingTransactions(const std::string &minerAddress);

    // Link the transactions to the latest block, mine at the current difficulty
    // and append. The mempool is left alone and no reward is queued.
    Block addBlock(const std::vector<Transaction> &txs);

    // Throws ChainLinkageError, BlockTamperError or InvalidTransactionError.
    // Proof of work is not re-checked: blocks mined under an older, lower
    // difficulty stay valid.
    void checkChain() const;
    bool isValidChain() const;

    void setDifficulty(int newDifficulty);
    int getDifficulty() const { return difficulty; }
    double getMiningReward() const { return miningReward; }

    const Block &getLatestBlock() const;
    const Block &getBlockByIndex(std::size_t index) const;
    const std::vector<Block> &getChain() const { return chain; }
    const std::vector<Transaction> &getMempool() const { return mempool; }
    std::size_t size() const { return chain.size(); }

    // In-memory export/import for audits; fromJSON does not validate.
    nlohmann::json toJSON() const;
    static Blockchain fromJSON(const nlohmann::json &j, const ChainConfig &config = ChainConfig());

private:
    std::vector<Block> chain;
    std::vector<Transaction> mempool; // unconfirmed transactions
    int difficulty;
    double miningReward;
};

} // namespace minichain

#endif // MINICHAIN_BLOCKCHAIN_H
