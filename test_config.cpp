#include "blockchain/Blockchain.h"
#include "config/ChainConfig.h"
#include "errors/ChainErrors.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>

using namespace std;
using namespace minichain;

static bool testDefaults()
{
    ChainConfig config = ChainConfig::fromJSON(nlohmann::json::object());
    if (config.difficulty != 4 || config.miningReward != 50.0)
    {
        cerr << "Empty config does not yield defaults\n";
        return false;
    }

    ChainConfig missing = ChainConfig::loadFromFile("/nonexistent/minichain-config.json");
    return missing.difficulty == ChainConfig::DEFAULT_DIFFICULTY &&
           missing.miningReward == ChainConfig::DEFAULT_MINING_REWARD;
}

static bool testLoadFromFile()
{
    const string path = "test_config_override.json";
    {
        ofstream file(path);
        file << R"({"difficulty": 2, "miningReward": 12.5})";
    }

    ChainConfig config = ChainConfig::loadFromFile(path);
    remove(path.c_str());

    if (config.difficulty != 2 || config.miningReward != 12.5)
    {
        cerr << "Config file values not applied\n";
        return false;
    }

    Blockchain chain(config);
    return chain.getDifficulty() == 2 && chain.getMiningReward() == 12.5 &&
           ChainConfig::fromJSON(config.toJSON()).difficulty == 2;
}

static bool testMalformed()
{
    const string path = "test_config_broken.json";
    {
        ofstream file(path);
        file << "{ difficulty: ";
    }

    bool ok = false;
    try
    {
        ChainConfig::loadFromFile(path);
        cerr << "Unparseable config accepted\n";
    }
    catch (const ConfigError &)
    {
        ok = true;
    }
    remove(path.c_str());
    if (!ok)
        return false;

    const nlohmann::json bad[] = {
        nlohmann::json::array(),
        {{"difficulty", "four"}},
        {{"difficulty", 2.5}},
        {{"miningReward", "lots"}},
    };
    for (const auto &j : bad)
    {
        try
        {
            ChainConfig::fromJSON(j);
            cerr << "Bad config accepted: " << j.dump() << "\n";
            return false;
        }
        catch (const ConfigError &)
        {
        }
    }
    return true;
}

// values that would wrap into 1..64 if narrowed to int before checking
static bool testDifficultyOutOfRange()
{
    const nlohmann::json bad[] = {
        {{"difficulty", 4294967298ULL}},
        {{"difficulty", 18446744073709551615ULL}},
        {{"difficulty", -4294967294LL}},
        {{"difficulty", 0}},
        {{"difficulty", 65}},
    };
    for (const auto &j : bad)
    {
        try
        {
            ChainConfig config = ChainConfig::fromJSON(j);
            cerr << "Difficulty " << j.at("difficulty").dump() << " accepted as " << config.difficulty << "\n";
            return false;
        }
        catch (const InvalidDifficultyError &)
        {
        }
    }

    return ChainConfig::fromJSON({{"difficulty", 64}}).difficulty == 64 &&
           ChainConfig::fromJSON({{"difficulty", 1}}).difficulty == 1;
}

int main()
{
    try
    {
        bool ok = true;
        ok &= testDefaults();
        ok &= testLoadFromFile();
        ok &= testMalformed();
        ok &= testDifficultyOutOfRange();

        cout << "test_config: " << (ok ? "OK" : "FAIL") << "\n";
        return ok ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const exception &e)
    {
        cerr << "test_config: unexpected exception: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
}
