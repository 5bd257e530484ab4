// TIERSTAKE CLI - Command Line Interface
// Copyright (c) 2024 TIERSTAKE Developers
// MIT License
//
// The tierstake-cli tool drives a staking ledger from a script of commands
// (or a single command on the command line) and persists the result under
// the data directory.

#include <tierstake/db/database.h>
#include <tierstake/staking/engine.h>
#include <tierstake/staking/options.h>
#include <tierstake/staking/store.h>
#include <tierstake/staking/transfer.h>
#include <tierstake/util/config.h>
#include <tierstake/util/logging.h>
#include <tierstake/util/time.h>

#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace tierstake {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "TIERSTAKE CLI";

// ============================================================================
// Session State
// ============================================================================

struct Session {
    std::shared_ptr<staking::InMemoryAssetLedger> assets;
    std::unique_ptr<staking::StakingEngine> engine;
    std::shared_ptr<staking::EventRecorder> events;
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: tierstake-cli [options] [command [args]]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file path\n";
    std::cout << "  -datadir=DIR               Data directory path\n";
    std::cout << "  -script=FILE               Run commands from FILE, one per line\n";
    std::cout << "  -owner=HEX                 Owner address (40 hex chars)\n";
    std::cout << "  -custody=HEX               Custody address for staked funds\n";
    std::cout << "  -cooldown=DURATION         Deposit cooldown (e.g. 86400, 1d, 12h)\n";
    std::cout << "  -mocktime=TS               Start the session clock at TS\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error, off\n";
    std::cout << "  -logfile=FILE              Log file (default: <datadir>/debug.log)\n";
    std::cout << "  -printtoconsole            Also log to the console\n";
    std::cout << "\nCommands:\n";
    std::cout << "  time <ts>                                 Set the session clock\n";
    std::cout << "  advance <duration>                        Move the clock forward\n";
    std::cout << "  fund <addr> <amount>                      Credit an account\n";
    std::cout << "  settier <caller> <id> <bps> <duration>    Create or update a tier\n";
    std::cout << "  approve <caller> <addr> <0|1>             Change whitelist status\n";
    std::cout << "  deposit <addr> <tier> <amount>            Stake into a tier\n";
    std::cout << "  claim <addr> <tier>                       Withdraw stake and reward\n";
    std::cout << "  show <addr> <tier>                        Print a stake record\n";
    std::cout << "  tier <id>                                 Print tier parameters\n";
    std::cout << "  balance <addr>                            Print an account balance\n";
    std::cout << "  events                                    Print this session's events\n";
    std::cout << "\nAddresses are 40 hex characters, or a number 0-255 as shorthand.\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 TIERSTAKE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

std::optional<uint64_t> ParseUInt(const std::string& str) {
    if (str.empty() || !std::isdigit(static_cast<unsigned char>(str[0]))) {
        return std::nullopt;
    }
    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(str, &pos);
        if (pos != str.size()) {
            return std::nullopt;
        }
        return static_cast<uint64_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Address> ParseAddress(const std::string& str) {
    if (str.size() <= 3) {
        auto id = ParseUInt(str);
        if (id && *id <= 255) {
            return MakeAddress(static_cast<uint8_t>(*id));
        }
        return std::nullopt;
    }
    try {
        return Address::FromHex(str);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

std::optional<TierId> ParseTierId(const std::string& str) {
    auto value = ParseUInt(str);
    if (!value || *value > std::numeric_limits<TierId>::max()) {
        return std::nullopt;
    }
    return static_cast<TierId>(*value);
}

std::vector<std::string> Tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

// ============================================================================
// Command Execution
// ============================================================================

std::string FormatError(const staking::StakeResult& status) {
    return std::string("error ") + status.ToString();
}

/**
 * Run one command and print its outcome. Returns false when the command
 * could not be parsed; engine rejections still count as parsed.
 */
bool ExecuteLine(Session& session, const std::string& line) {
    std::vector<std::string> args = Tokenize(line);
    if (args.empty() || args[0][0] == '#') {
        return true;
    }

    const std::string& cmd = args[0];
    auto parseError = [&](const std::string& msg) {
        std::cout << "error Parse: " << msg << "\n";
        return false;
    };
    auto expectArgs = [&](size_t count) {
        return args.size() == count + 1;
    };

    staking::StakingEngine& engine = *session.engine;

    if (cmd == "time") {
        auto ts = expectArgs(1) ? ParseUInt(args[1]) : std::nullopt;
        if (!ts || *ts > static_cast<uint64_t>(std::numeric_limits<Timestamp>::max())) {
            return parseError("usage: time <ts>");
        }
        util::SetMockTime(static_cast<Timestamp>(*ts));
        std::cout << "ok time=" << util::GetTime() << " ("
                  << util::FormatISO8601(util::GetTime()) << ")\n";
        return true;
    }

    if (cmd == "advance") {
        auto secs = expectArgs(1) ? util::ParseDuration(args[1]) : std::nullopt;
        if (!secs) {
            return parseError("usage: advance <duration>");
        }
        util::AdvanceMockTime(*secs);
        std::cout << "ok time=" << util::GetTime() << " ("
                  << util::FormatISO8601(util::GetTime()) << ")\n";
        return true;
    }

    if (cmd == "fund") {
        auto addr = expectArgs(2) ? ParseAddress(args[1]) : std::nullopt;
        auto amount = expectArgs(2) ? ParseUInt(args[2]) : std::nullopt;
        if (!addr || !amount) {
            return parseError("usage: fund <addr> <amount>");
        }
        if (!session.assets->Credit(*addr, *amount)) {
            std::cout << "error Overflow: balance of " << addr->ToHex() << " would overflow\n";
            return true;
        }
        std::cout << "ok balance=" << session.assets->BalanceOf(*addr) << "\n";
        return true;
    }

    if (cmd == "settier") {
        auto caller = expectArgs(4) ? ParseAddress(args[1]) : std::nullopt;
        auto id = expectArgs(4) ? ParseTierId(args[2]) : std::nullopt;
        auto bps = expectArgs(4) ? ParseUInt(args[3]) : std::nullopt;
        auto lock = expectArgs(4) ? util::ParseDuration(args[4]) : std::nullopt;
        if (!caller || !id || !bps || *bps > std::numeric_limits<uint32_t>::max() || !lock) {
            return parseError("usage: settier <caller> <id> <bps> <duration>");
        }
        auto status = engine.SetTier(*caller, *id, static_cast<uint32_t>(*bps), *lock);
        if (!status) {
            std::cout << FormatError(status) << "\n";
        } else {
            std::cout << "ok tier=" << *id << " rate=" << *bps << " lock=" << *lock << "\n";
        }
        return true;
    }

    if (cmd == "approve") {
        auto caller = expectArgs(3) ? ParseAddress(args[1]) : std::nullopt;
        auto addr = expectArgs(3) ? ParseAddress(args[2]) : std::nullopt;
        if (!caller || !addr || (args[3] != "0" && args[3] != "1")) {
            return parseError("usage: approve <caller> <addr> <0|1>");
        }
        bool approved = args[3] == "1";
        auto status = engine.SetApproval(*caller, *addr, approved);
        if (!status) {
            std::cout << FormatError(status) << "\n";
        } else {
            std::cout << "ok " << addr->ToHex() << " approved=" << (approved ? 1 : 0) << "\n";
        }
        return true;
    }

    if (cmd == "deposit") {
        auto addr = expectArgs(3) ? ParseAddress(args[1]) : std::nullopt;
        auto id = expectArgs(3) ? ParseTierId(args[2]) : std::nullopt;
        auto amount = expectArgs(3) ? ParseUInt(args[3]) : std::nullopt;
        if (!addr || !id || !amount) {
            return parseError("usage: deposit <addr> <tier> <amount>");
        }
        auto result = engine.Deposit(*addr, *id, *amount, util::GetTime());
        if (!result.IsOk()) {
            std::cout << FormatError(result.status) << "\n";
        } else {
            std::cout << "ok amount=" << result.amount
                      << " reward=" << result.reward
                      << " staked=" << result.stakedAmount
                      << " accrued=" << result.accruedReward
                      << " unlock=" << result.unlockTimestamp << "\n";
        }
        return true;
    }

    if (cmd == "claim") {
        auto addr = expectArgs(2) ? ParseAddress(args[1]) : std::nullopt;
        auto id = expectArgs(2) ? ParseTierId(args[2]) : std::nullopt;
        if (!addr || !id) {
            return parseError("usage: claim <addr> <tier>");
        }
        auto result = engine.Claim(*addr, *id, util::GetTime());
        if (!result.IsOk()) {
            std::cout << FormatError(result.status) << "\n";
        } else {
            std::cout << "ok payout=" << result.payout << "\n";
        }
        return true;
    }

    if (cmd == "show") {
        auto addr = expectArgs(2) ? ParseAddress(args[1]) : std::nullopt;
        auto id = expectArgs(2) ? ParseTierId(args[2]) : std::nullopt;
        if (!addr || !id) {
            return parseError("usage: show <addr> <tier>");
        }
        staking::StakeRecord record = engine.GetStakeDetails(*addr, *id);
        std::cout << "ok staked=" << record.stakedAmount
                  << " reward=" << record.accruedReward
                  << " unlock=" << record.unlockTimestamp
                  << " claimed=" << (record.claimed ? 1 : 0) << "\n";
        return true;
    }

    if (cmd == "tier") {
        auto id = expectArgs(1) ? ParseTierId(args[1]) : std::nullopt;
        if (!id) {
            return parseError("usage: tier <id>");
        }
        staking::Tier tier = engine.GetTier(*id);
        std::cout << "ok rate=" << tier.rewardRateBps
                  << " lock=" << tier.lockDuration
                  << " (" << tier.ToString() << ")\n";
        return true;
    }

    if (cmd == "balance") {
        auto addr = expectArgs(1) ? ParseAddress(args[1]) : std::nullopt;
        if (!addr) {
            return parseError("usage: balance <addr>");
        }
        std::cout << "ok balance=" << session.assets->BalanceOf(*addr) << "\n";
        return true;
    }

    if (cmd == "events") {
        if (!expectArgs(0)) {
            return parseError("usage: events");
        }
        auto entries = session.events->Entries();
        std::cout << "ok events=" << entries.size() << "\n";
        for (const auto& event : entries) {
            std::cout << "  " << staking::EventToString(event) << "\n";
        }
        return true;
    }

    return parseError("unknown command '" + cmd + "'");
}

// ============================================================================
// Setup
// ============================================================================

bool SetupLogging(const util::ConfigManager& config, const std::string& datadir) {
    auto& logger = util::Logger::Instance();
    util::LogLevel level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, "info"));
    logger.SetLevel(level);

    std::string logfile = config.GetPath(util::ConfigKeys::LOGFILE, datadir + "/debug.log");
    auto fileSink = std::make_shared<util::FileSink>(logfile, level);
    if (!fileSink->IsOpen()) {
        std::cerr << "Error: cannot open log file " << logfile << "\n";
        return false;
    }
    logger.AddSink(fileSink);

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false)) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }
    return true;
}

bool CreateSession(const util::ConfigManager& config, staking::LedgerStore& store,
                   Session& session) {
    staking::EngineOptions options;
    auto result = staking::LoadEngineOptions(config, options);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return false;
    }

    std::optional<staking::LedgerSnapshot> snapshot;
    db::Status status = store.Load(snapshot);
    if (!status.ok()) {
        std::cerr << "Error: cannot load ledger: " << status.ToString() << "\n";
        return false;
    }

    staking::InMemoryAssetLedger::BalanceMap balances;
    status = store.LoadBalances(balances);
    if (!status.ok()) {
        std::cerr << "Error: cannot load balances: " << status.ToString() << "\n";
        return false;
    }

    if (snapshot) {
        session.assets = std::make_shared<staking::InMemoryAssetLedger>(snapshot->options.custody);
        session.assets->Restore(balances);
        session.engine = staking::StakingEngine::FromSnapshot(*snapshot, session.assets);

        if (config.HasKey(util::ConfigKeys::OWNER)) {
            Address configured;
            if (staking::LoadOwner(config, configured).success && configured != snapshot->owner) {
                LOG_WARN(util::LogCategory::CONFIG) << "Ignoring configured owner "
                    << configured.ToHex() << ", ledger is owned by " << snapshot->owner.ToHex();
            }
        }
    } else {
        Address owner;
        result = staking::LoadOwner(config, owner);
        if (!result.success) {
            std::cerr << "Error: " << result.errorMessage << "\n";
            return false;
        }
        session.assets = std::make_shared<staking::InMemoryAssetLedger>(options.custody);
        session.engine = std::make_unique<staking::StakingEngine>(owner, session.assets, options);
    }

    session.events = std::make_shared<staking::EventRecorder>();
    session.engine->AddListener(session.events);
    return true;
}

// ============================================================================
// Main Application
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    std::vector<std::string> positional;

    // Command line first, to find -conf
    auto result = config.ParseCommandLine(argc, argv, &positional);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return 1;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }

    if (config.HasKey(util::ConfigKeys::CONF)) {
        std::string confPath = config.GetPath(util::ConfigKeys::CONF);
        util::ConfigManager fileConfig;
        result = fileConfig.ParseFile(confPath);
        if (!result.success) {
            std::cerr << "Error reading " << confPath << ": " << result.errorMessage;
            if (result.errorLine > 0) {
                std::cerr << " (line " << result.errorLine << ")";
            }
            std::cerr << "\n";
            return 1;
        }
        // Command-line values take precedence over the file
        for (const auto& key : fileConfig.GetKeys()) {
            config.SetDefault(key, fileConfig.GetString(key, ""));
        }
    }

    std::string datadir = config.GetPath(util::ConfigKeys::DATADIR,
                                         util::ConfigManager::GetDefaultDataDir());

    std::error_code ec;
    std::filesystem::create_directories(datadir, ec);
    if (ec) {
        std::cerr << "Error: cannot create data directory " << datadir << ": "
                  << ec.message() << "\n";
        return 1;
    }

    auto [dbStatus, database] = db::OpenDatabase(datadir + "/ledger");
    if (!dbStatus.ok()) {
        std::cerr << "Error: cannot open database in " << datadir << ": "
                  << dbStatus.ToString() << "\n";
        return 1;
    }

    if (!SetupLogging(config, datadir)) {
        return 1;
    }

    util::EnableMockTime();
    if (auto mock = config.TryGetInt(util::ConfigKeys::MOCKTIME)) {
        util::SetMockTime(*mock);
    }

    staking::LedgerStore store(*database);
    Session session;
    if (!CreateSession(config, store, session)) {
        return 1;
    }

    std::vector<std::string> lines;
    if (config.HasKey(util::ConfigKeys::SCRIPT)) {
        std::string scriptPath = config.GetPath(util::ConfigKeys::SCRIPT);
        std::ifstream script(scriptPath);
        if (!script.is_open()) {
            std::cerr << "Error: cannot open script " << scriptPath << "\n";
            return 1;
        }
        std::string line;
        while (std::getline(script, line)) {
            lines.push_back(line);
        }
    }
    if (!positional.empty()) {
        std::string line;
        for (const auto& arg : positional) {
            if (!line.empty()) line += ' ';
            line += arg;
        }
        lines.push_back(line);
    }

    bool allParsed = true;
    for (const auto& line : lines) {
        if (!ExecuteLine(session, line)) {
            allParsed = false;
        }
    }

    auto balances = session.assets->GetBalances();
    db::Status saveStatus = store.Save(session.engine->ExportState(), &balances);
    if (!saveStatus.ok()) {
        std::cerr << "Error: cannot save ledger: " << saveStatus.ToString() << "\n";
        return 1;
    }

    util::Logger::Instance().Flush();
    return allParsed ? 0 : 1;
}

} // namespace cli
} // namespace tierstake

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return tierstake::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
