#include "ChainConfig.h"
#include "../block/Block.h"
#include "../errors/ChainErrors.h"
#include <cstdint>
#include <fstream>
#include <iostream>

namespace minichain
{

int ChainConfig::difficultyFromJSON(const nlohmann::json &v)
{
    if (!v.is_number_integer())
        throw ConfigError("'difficulty' must be an integer, got " + v.dump());

    // compare at full width; a narrowing cast first could wrap into 1..64
    if (v.is_number_unsigned())
    {
        std::uint64_t d = v.get<std::uint64_t>();
        if (d < 1 || d > (std::uint64_t)Block::MAX_DIFFICULTY)
            throw InvalidDifficultyError("Invalid difficulty: " + v.dump() + " (expected 1..64)");
        return (int)d;
    }

    std::int64_t d = v.get<std::int64_t>();
    if (d < 1 || d > Block::MAX_DIFFICULTY)
        throw InvalidDifficultyError("Invalid difficulty: " + v.dump() + " (expected 1..64)");
    return (int)d;
}

ChainConfig ChainConfig::fromJSON(const nlohmann::json &j)
{
    if (!j.is_object())
        throw ConfigError("Chain config must be a JSON object");

    ChainConfig config;
    if (j.contains("difficulty"))
        config.difficulty = difficultyFromJSON(j.at("difficulty"));

    try
    {
        if (j.contains("miningReward"))
            config.miningReward = j.at("miningReward").get<double>();
    }
    catch (const nlohmann::json::exception &e)
    {
        throw ConfigError(std::string("Bad chain config value: ") + e.what());
    }

    return config;
}

ChainConfig ChainConfig::loadFromFile(const std::string &path)
{
    std::ifstream file(path);

    if (!file.good())
    {
        std::cout << "No chain config at " << path << ", using defaults\n";
        return ChainConfig();
    }

    nlohmann::json j;
    try
    {
        file >> j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ConfigError("Cannot parse " + path + ": " + e.what());
    }

    return fromJSON(j);
}

nlohmann::json ChainConfig::toJSON() const
{
    nlohmann::json j;
    j["difficulty"] = difficulty;
    j["miningReward"] = miningReward;
    return j;
}

} // namespace minichain
