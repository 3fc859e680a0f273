#ifndef MINICHAIN_CHAIN_CONFIG_H
#define MINICHAIN_CHAIN_CONFIG_H

#include <string>
#include <nlohmann/json.hpp>

namespace minichain
{

struct ChainConfig
{
    static constexpr int DEFAULT_DIFFICULTY = 4;
    static constexpr double DEFAULT_MINING_REWARD = 50.0;

    int difficulty = DEFAULT_DIFFICULTY;
    double miningReward = DEFAULT_MINING_REWARD;

    // Range-checked before narrowing: ConfigError if v is not an integer,
    // InvalidDifficultyError if it lies outside 1..Block::MAX_DIFFICULTY.
    static int difficultyFromJSON(const nlohmann::json &v);

    // Missing keys keep their defaults; wrong types throw ConfigError.
    static ChainConfig fromJSON(const nlohmann::json &j);

    // A missing file yields the defaults; unreadable JSON throws ConfigError.
    static ChainConfig loadFromFile(const std::string &path);

    nlohmann::json toJSON() const;
};

} // namespace minichain

#endif // MINICHAIN_CHAIN_CONFIG_H
