#include "Blockchain.h"
#include "../errors/ChainErrors.h"
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace minichain
{

Blockchain::Blockchain(const ChainConfig &config)
{
    Block::checkDifficulty(config.difficulty);
    if (!std::isfinite(config.miningReward) || config.miningReward < 0)
        throw InvalidAmountError("Mining reward must be a finite, non-negative number");

    difficulty = config.difficulty;
    miningReward = config.miningReward;

    chain.push_back(createGenesisBlock());
}

// fixed contents and never mined, so every process derives the same genesis hash
Block Blockchain::createGenesisBlock()
{
    return Block({}, Block::GENESIS_PREVIOUS_HASH, GENESIS_TIMESTAMP);
}

const Block &Blockchain::getLatestBlock() const
{
    if (chain.empty())
        throw EmptyChainError();
    return chain.back();
}

const Block &Blockchain::getBlockByIndex(std::size_t index) const
{
    if (index >= chain.size())
        throw std::out_of_range("Block index out of range: " + std::to_string(index));
    return chain[index];
}

void Blockchain::setDifficulty(int newDifficulty)
{
    Block::checkDifficulty(newDifficulty);
    difficulty = newDifficulty;
}

// -----------------------------------
//      Add transaction to mempool
// -----------------------------------

void Blockchain::addTransaction(const Transaction &tx)
{
    if (tx.getSender().empty() || tx.getReceiver().empty())
        throw InvalidTransactionError("Invalid sender or receiver address");

    // rewards are only ever created by the chain itself
    if (tx.isReward())
        throw InvalidTransactionError("Reward transactions cannot be submitted");

    if (!(tx.getAmount() > 0))
        throw InvalidAmountError("Transfer amount must be positive");

    if (!tx.isValid())
        throw InvalidTransactionError("Invalid transaction, tampered or badly signed");

    mempool.push_back(tx);
}

// -----------------------------------------------------
//      Mine block containing all transaction in mempool
// -----------------------------------------------------

Block Blockchain::minePendingTransactions(const std::string &minerAddress)
{
    if (minerAddress.empty())
        throw InvalidTransactionError("Miner address must not be empty");

    // on failure neither the chain nor the mempool has changed
    Block newBlock = addBlock(mempool);

    // the reward lands in the next block, not the one just mined
    mempool.clear();
    mempool.push_back(Transaction::reward(minerAddress, miningReward));

    return newBlock;
}

// --------------------------------------------------
//      Link, mine and append a caller-built block
// --------------------------------------------------

Block Blockchain::addBlock(const std::vector<Transaction> &txs)
{
    Block newBlock(txs, getLatestBlock().getHash());

    // refuses tampered transactions; the chain is untouched if this throws
    newBlock.mineBlock(difficulty);

    chain.push_back(newBlock);
    std::cout << "Block mined: " << newBlock.getHash() << " (nonce " << newBlock.getNonce() << ")\n";
    return newBlock;
}

// -------------------------
//      Validate the chain
// -------------------------

void Blockchain::checkChain() const
{
    if (chain.empty())
        throw EmptyChainError();

    const Block &genesis = chain.front();
    if (genesis.getPreviousHash() != Block::GENESIS_PREVIOUS_HASH || genesis.getHash() != genesis.computeHash())
        throw BlockTamperError(0);

    for (size_t i = 1; i < chain.size(); i++)
    {
        const Block &current = chain[i];
        const Block &previous = chain[i - 1];

        if (current.getPreviousHash() != previous.getHash())
            throw ChainLinkageError(i);

        if (current.getHash() != current.computeHash())
            throw BlockTamperError(i);

        try
        {
            current.checkTransactions();
        }
        catch (const InvalidTransactionError &)
        {
            std::cerr << "Illegal transaction found in block #" << i << std::endl;
            throw;
        }
    }
}

bool Blockchain::isValidChain() const
{
    try
    {
        checkChain();
        return true;
    }
    catch (const CryptoError &)
    {
        // an OpenSSL fault says nothing about the chain's integrity
        throw;
    }
    catch (const ChainError &e)
    {
        std::cerr << "Chain validation failed: " << e.what() << std::endl;
        return false;
    }
}

// -----------------------------
//    JSON export / import
// -----------------------------

nlohmann::json Blockchain::toJSON() const
{
    nlohmann::json j;
    j["blocks"] = nlohmann::json::array();
    for (const auto &block : chain)
        j["blocks"].push_back(block.toJSON());

    j["pendingTransactions"] = nlohmann::json::array();
    for (const auto &tx : mempool)
        j["pendingTransactions"].push_back(tx.toJSON());

    j["difficulty"] = difficulty;
    return j;
}

Blockchain Blockchain::fromJSON(const nlohmann::json &j, const ChainConfig &config)
{
    Blockchain restored(config);

    if (!j.is_object() || !j.contains("blocks"))
        throw ChainError("Malformed chain JSON: missing 'blocks'");

    const nlohmann::json &blocks = j.at("blocks");
    if (!blocks.is_array() || blocks.empty())
        throw EmptyChainError();

    restored.chain.clear();
    for (const auto &jBlock : blocks)
        restored.chain.push_back(Block::fromJSON(jBlock));

    if (j.contains("pendingTransactions"))
    {
        const nlohmann::json &pending = j.at("pendingTransactions");
        if (!pending.is_array())
            throw ChainError("Malformed chain JSON: 'pendingTransactions' is not an array");
        for (const auto &jTx : pending)
            restored.mempool.push_back(Transaction::fromJSON(jTx));
    }

    if (j.contains("difficulty"))
        restored.setDifficulty(ChainConfig::difficultyFromJSON(j.at("difficulty")));

    return restored;
}

} // namespace minichain
