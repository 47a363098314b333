// StakeLedger CLI - Command Line Interface
// Copyright (c) 2024 StakeLedger Developers
// MIT License
//
// stakeledger-cli operates a ledger stored in the data directory. Each
// invocation loads the snapshot, runs one command, and writes the new
// snapshot back atomically if the command changed anything.

#include <stakeledger/asset/asset.h>
#include <stakeledger/db/database.h>
#include <stakeledger/db/ledgerdb.h>
#include <stakeledger/ledger/ledger.h>
#include <stakeledger/util/config.h>
#include <stakeledger/util/logging.h>
#include <stakeledger/util/time.h>

#include <filesystem>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stakeledger {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "StakeLedger CLI";

// ============================================================================
// Defaults
// ============================================================================

namespace defaults {
    constexpr const char* DB_SUBDIR = "ledger";
    constexpr const char* LOG_LEVEL = "warn";
    /// "STAKELEDGER" in ASCII, zero padded
    constexpr const char* LEDGER_ADDRESS = "0x5354414b454c4544474552000000000000000000";
    constexpr const char* BASE_SYMBOL = "BASE";
    constexpr const char* REWARD_SYMBOL = "RWD";
}

/// Exit codes
enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_LEDGER_ERROR = 2,
    EXIT_STORAGE_ERROR = 3
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: stakeledger-cli [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/stakeledger.conf)\n";
    std::cout << "  -datadir=DIR               Data directory (default: ~/.stakeledger)\n";
    std::cout << "  -admin=ADDRESS             Reserve administrator (hex)\n";
    std::cout << "  -ledgeraddress=ADDRESS     Ledger custody/issuer identity (hex)\n";
    std::cout << "  -loglevel=LEVEL            trace|debug|info|warn|error (default: warn)\n";
    std::cout << "  -logfile=FILE              Append log output to FILE\n";
    std::cout << "  -logcategories=LIST        Only log these categories (ledger,reserve,...)\n";
    std::cout << "  -printtoconsole            Log to the console\n";
    std::cout << "  -mocktime=SECONDS          Use a fixed Unix time\n";
    std::cout << "\nToken commands:\n";
    std::cout << "  mintbase <to> <amount>              Mint base asset to an account\n";
    std::cout << "  approve <owner> <base|reward> <amount>\n";
    std::cout << "                                      Let the ledger pull from owner\n";
    std::cout << "  balance <base|reward> <account>     Token balance\n";
    std::cout << "\nLedger commands:\n";
    std::cout << "  stake <account> <amount>            Stake base asset\n";
    std::cout << "  unstake <account> <amount>          Withdraw staked base asset\n";
    std::cout << "  claim <account>                     Mint accrued rewards\n";
    std::cout << "  lock <account> <amount>             Lock rewards for vesting\n";
    std::cout << "  unlock <account>                    Settle the vesting lock\n";
    std::cout << "  deposit <admin> <amount>            Fund the unlock reserve\n";
    std::cout << "\nQueries:\n";
    std::cout << "  pending <account>                   Claimable rewards now\n";
    std::cout << "  share <account>                     Share of total stake\n";
    std::cout << "  account <account>                   Stake account record\n";
    std::cout << "  preview <account>                   Unlock payout and penalty now\n";
    std::cout << "  status                              Ledger totals\n";
    std::cout << "\nAmounts are decimal token units, e.g. 1.5\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 StakeLedger Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

std::optional<Address> ParseAccount(const std::string& text) {
    Address address = Address::FromHex(text);
    if (address.IsNull()) {
        std::cerr << "error: invalid address '" << text << "'\n";
        return std::nullopt;
    }
    return address;
}

std::optional<Amount> ParseAmount(const std::string& text) {
    auto amount = ParseUnits(text, TOKEN_DECIMALS);
    if (!amount) {
        std::cerr << "error: invalid amount '" << text << "'\n";
    }
    return amount;
}

std::string Show(const Amount& amount) {
    return FormatUnits(amount, TOKEN_DECIMALS);
}

// ============================================================================
// Session
// ============================================================================

/**
 * One loaded ledger with its two tokens.
 */
struct Session {
    Address ledgerAddress;
    Address administrator;
    std::shared_ptr<asset::TokenLedger> baseToken;
    std::shared_ptr<asset::TokenLedger> rewardToken;
    std::unique_ptr<ledger::StakeLedger> ledger;
    std::unique_ptr<db::LedgerDB> store;

    std::shared_ptr<asset::TokenLedger> Token(const std::string& which) const {
        if (which == "base") return baseToken;
        if (which == "reward") return rewardToken;
        return nullptr;
    }

    db::Status Save() {
        return store->Save(*ledger, {baseToken.get(), rewardToken.get()});
    }
};

int SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.SetLevel(util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, defaults::LOG_LEVEL)));
    logger.SetCategories(config.GetList(util::ConfigKeys::LOGCATEGORIES));

    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false)) {
        util::ConsoleSink::Config sinkConfig;
        sinkConfig.useStderr = true;
        sinkConfig.level = util::LogLevel::Trace;
        logger.AddSink(std::make_shared<util::ConsoleSink>(sinkConfig));
    }

    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    if (!logFile.empty()) {
        auto sink = std::make_shared<util::FileSink>(logFile);
        if (!sink->IsOpen()) {
            std::cerr << "error: cannot open log file " << logFile << "\n";
            return EXIT_USAGE;
        }
        logger.AddSink(sink);
    }
    return EXIT_OK;
}

int OpenSession(const util::ConfigManager& config, Session& session) {
    auto ledgerAddress = ParseAccount(
        config.GetString(util::ConfigKeys::LEDGERADDRESS, defaults::LEDGER_ADDRESS));
    if (!ledgerAddress) {
        return EXIT_USAGE;
    }
    session.ledgerAddress = *ledgerAddress;

    auto adminText = config.TryGetString(util::ConfigKeys::ADMIN);
    if (adminText) {
        auto admin = ParseAccount(*adminText);
        if (!admin) {
            return EXIT_USAGE;
        }
        session.administrator = *admin;
    }

    // Both tokens are issued by the ledger identity; mintbase uses it as a faucet
    session.baseToken = std::make_shared<asset::TokenLedger>(
        "Base Asset", defaults::BASE_SYMBOL, session.ledgerAddress);
    session.rewardToken = std::make_shared<asset::TokenLedger>(
        "Reward Asset", defaults::REWARD_SYMBOL, session.ledgerAddress);

    session.ledger = std::make_unique<ledger::StakeLedger>(
        session.ledgerAddress, session.administrator,
        std::make_shared<asset::TokenPort>(session.baseToken, session.ledgerAddress),
        std::make_shared<asset::TokenPort>(session.rewardToken, session.ledgerAddress));
    session.ledger->SetEventCallback([](const ledger::LedgerEvent& event) {
        std::cout << "event: " << event.ToString() << "\n";
    });

    std::filesystem::path dbPath =
        std::filesystem::path(config.GetDataDir()) / defaults::DB_SUBDIR;
    auto [status, database] = db::OpenDatabase(dbPath);
    if (!status.ok()) {
        std::cerr << "error: cannot open " << dbPath.string() << ": " << status.ToString() << "\n";
        return EXIT_STORAGE_ERROR;
    }
    session.store = std::make_unique<db::LedgerDB>(std::move(database));

    if (session.store->HasSnapshot()) {
        db::Status loaded = session.store->Load(
            *session.ledger, {session.baseToken.get(), session.rewardToken.get()});
        if (!loaded.ok()) {
            std::cerr << "error: cannot load ledger: " << loaded.ToString() << "\n";
            return EXIT_STORAGE_ERROR;
        }
    }
    return EXIT_OK;
}

// ============================================================================
// Commands
// ============================================================================

int ReportLedgerError(const std::string& command, ledger::LedgerError error) {
    std::cerr << "error: " << command << " failed: " << ledger::LedgerErrorToString(error) << "\n";
    return EXIT_LEDGER_ERROR;
}

int ExpectArgs(const std::vector<std::string>& args, size_t count) {
    if (args.size() != count + 1) {
        std::cerr << "error: '" << args[0] << "' takes " << count << " argument"
                  << (count == 1 ? "" : "s") << "\n";
        return EXIT_USAGE;
    }
    return EXIT_OK;
}

/**
 * Run one command. Sets `mutated` when the session must be saved.
 */
int ExecuteCommand(Session& session, const std::vector<std::string>& args, bool& mutated) {
    const std::string& command = args[0];
    ledger::StakeLedger& ledger = *session.ledger;

    if (command == "status") {
        if (int rc = ExpectArgs(args, 0)) return rc;
        std::cout << "time:            " << util::FormatISO8601(util::FromUnixTime(util::GetTime())) << "\n";
        std::cout << "ledger:          0x" << session.ledgerAddress.ToHex() << "\n";
        std::cout << "administrator:   0x" << ledger.GetAdministrator().ToHex() << "\n";
        std::cout << "accounts:        " << ledger.GetAccountCount() << "\n";
        std::cout << "active locks:    " << ledger.GetActiveLockCount() << "\n";
        std::cout << "total staked:    " << Show(ledger.GetTotalStaked()) << "\n";
        std::cout << "reserve:         " << Show(ledger.GetReserve()) << "\n";
        std::cout << "total deposited: " << Show(ledger.GetTotalDeposited()) << "\n";
        std::cout << "total paid out:  " << Show(ledger.GetTotalPaidOut()) << "\n";
        std::cout << "total minted:    " << Show(ledger.GetTotalMinted()) << "\n";
        std::cout << "total burned:    " << Show(ledger.GetTotalBurned()) << "\n";
        std::cout << "base supply:     " << Show(session.baseToken->TotalSupply()) << "\n";
        std::cout << "reward supply:   " << Show(session.rewardToken->TotalSupply()) << "\n";
        return EXIT_OK;
    }

    if (command == "balance") {
        if (int rc = ExpectArgs(args, 2)) return rc;
        auto token = session.Token(args[1]);
        auto account = ParseAccount(args[2]);
        if (!token) {
            std::cerr << "error: token must be 'base' or 'reward'\n";
            return EXIT_USAGE;
        }
        if (!account) return EXIT_USAGE;
        std::cout << Show(token->BalanceOf(*account)) << "\n";
        return EXIT_OK;
    }

    if (command == "mintbase" || command == "approve") {
        bool isMint = command == "mintbase";
        if (int rc = ExpectArgs(args, isMint ? 2 : 3)) return rc;
        auto account = ParseAccount(args[1]);
        if (!account) return EXIT_USAGE;
        auto token = isMint ? session.baseToken : session.Token(args[2]);
        if (!token) {
            std::cerr << "error: token must be 'base' or 'reward'\n";
            return EXIT_USAGE;
        }
        auto amount = ParseAmount(args[isMint ? 2 : 3]);
        if (!amount) return EXIT_USAGE;

        asset::AssetStatus status = isMint
            ? token->Mint(session.ledgerAddress, *account, *amount)
            : token->Approve(*account, session.ledgerAddress, *amount);
        if (status != asset::AssetStatus::Ok) {
            std::cerr << "error: " << command << " failed: "
                      << asset::AssetStatusToString(status) << "\n";
            return EXIT_LEDGER_ERROR;
        }
        mutated = true;
        return EXIT_OK;
    }

    if (command == "stake" || command == "unstake" || command == "lock" || command == "deposit") {
        if (int rc = ExpectArgs(args, 2)) return rc;
        auto account = ParseAccount(args[1]);
        if (!account) return EXIT_USAGE;
        auto amount = ParseAmount(args[2]);
        if (!amount) return EXIT_USAGE;

        ledger::LedgerError error;
        if (command == "stake") {
            error = ledger.Stake(*account, *amount);
        } else if (command == "unstake") {
            error = ledger.Unstake(*account, *amount);
        } else if (command == "lock") {
            error = ledger.LockTokens(*account, *amount);
        } else {
            error = ledger.DepositReserve(*account, *amount);
        }
        if (error != ledger::LedgerError::OK) {
            return ReportLedgerError(command, error);
        }
        mutated = true;
        return EXIT_OK;
    }

    if (command == "claim") {
        if (int rc = ExpectArgs(args, 1)) return rc;
        auto account = ParseAccount(args[1]);
        if (!account) return EXIT_USAGE;
        Amount claimed;
        ledger::LedgerError error = ledger.ClaimReward(*account, &claimed);
        if (error != ledger::LedgerError::OK) {
            return ReportLedgerError(command, error);
        }
        std::cout << Show(claimed) << "\n";
        mutated = true;
        return EXIT_OK;
    }

    if (command == "unlock") {
        if (int rc = ExpectArgs(args, 1)) return rc;
        auto account = ParseAccount(args[1]);
        if (!account) return EXIT_USAGE;
        ledger::UnlockQuote quote;
        ledger::LedgerError error = ledger.UnlockTokens(*account, &quote);
        if (error != ledger::LedgerError::OK) {
            return ReportLedgerError(command, error);
        }
        std::cout << "payout:  " << Show(quote.payout) << "\n";
        std::cout << "penalty: " << Show(quote.penalty) << "\n";
        mutated = true;
        return EXIT_OK;
    }

    if (command == "pending" || command == "share" || command == "account" ||
        command == "preview") {
        if (int rc = ExpectArgs(args, 1)) return rc;
        auto account = ParseAccount(args[1]);
        if (!account) return EXIT_USAGE;

        if (command == "pending") {
            std::cout << Show(ledger.PendingReward(*account)) << "\n";
        } else if (command == "share") {
            std::cout << Show(ledger.GetUserShare(*account)) << "\n";
        } else if (command == "account") {
            ledger::StakeAccount record = ledger.GetAccount(*account);
            ledger::VestingLock lock = ledger.GetLock(*account);
            std::cout << "staked:      " << Show(record.stakedAmount) << "\n";
            std::cout << "unclaimed:   " << Show(record.unclaimedRewards) << "\n";
            std::cout << "last update: " << record.lastUpdateTime << "\n";
            std::cout << "locked:      " << Show(lock.amount) << "\n";
            if (lock.IsActive()) {
                std::cout << "matures:     "
                          << util::FormatISO8601(util::FromUnixTime(lock.MaturityTime())) << "\n";
            }
        } else {
            auto quote = ledger.PreviewUnlock(*account);
            if (!quote) {
                return ReportLedgerError(command, ledger::LedgerError::NoLockActive);
            }
            std::cout << "payout:  " << Show(quote->payout) << "\n";
            std::cout << "penalty: " << Show(quote->penalty) << "\n";
            std::cout << "elapsed: " << util::FormatDuration(util::Seconds{quote->elapsed})
                      << (quote->matured ? " (matured)" : "") << "\n";
        }
        return EXIT_OK;
    }

    std::cerr << "error: unknown command '" << command << "'. Use -help for usage.\n";
    return EXIT_USAGE;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    for (const char* key : {util::ConfigKeys::DATADIR, util::ConfigKeys::CONF,
                            util::ConfigKeys::ADMIN, util::ConfigKeys::LEDGERADDRESS,
                            util::ConfigKeys::LOGLEVEL, util::ConfigKeys::LOGFILE,
                            util::ConfigKeys::LOGCATEGORIES,
                            util::ConfigKeys::PRINTTOCONSOLE, util::ConfigKeys::MOCKTIME,
                            "help", "h", "version"}) {
        config.AllowKey(key);
    }

    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "error: " << parsed.errorMessage << "\n";
        return EXIT_USAGE;
    }

    if (config.GetBool("help", false) || config.GetBool("h", false)) {
        PrintHelp();
        return EXIT_OK;
    }
    if (config.GetBool("version", false)) {
        PrintVersion();
        return EXIT_OK;
    }

    // Command-line values win over the config file
    auto confPath = config.TryGetString(util::ConfigKeys::CONF);
    std::string confFile = confPath
        ? util::ConfigManager::ExpandTilde(*confPath)
        : (std::filesystem::path(config.GetDataDir()) / util::DEFAULT_CONFIG_FILENAME).string();
    if (confPath || std::filesystem::exists(confFile)) {
        parsed = config.ParseFile(confFile, false);
        if (!parsed.success) {
            std::cerr << "error: " << parsed.errorMessage;
            if (parsed.errorLine > 0) {
                std::cerr << " (" << parsed.errorFile << ":" << parsed.errorLine << ")";
            }
            std::cerr << "\n";
            return EXIT_USAGE;
        }
    }

    if (int rc = SetupLogging(config)) {
        return rc;
    }
    for (const auto& warning : config.Validate()) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }

    if (config.HasKey(util::ConfigKeys::MOCKTIME)) {
        auto mockTime = config.TryGetInt(util::ConfigKeys::MOCKTIME);
        if (!mockTime || *mockTime <= 0) {
            std::cerr << "error: -mocktime must be a positive Unix time\n";
            return EXIT_USAGE;
        }
        util::SetMockTime(*mockTime);
        util::EnableMockTime();
        LOG_INFO(util::LogCategory::CONFIG) << "Using mock time " << *mockTime;
    }

    const std::vector<std::string>& args = config.GetArgs();
    if (args.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'stakeledger-cli -help' for usage information.\n";
        return EXIT_USAGE;
    }

    Session session;
    if (int rc = OpenSession(config, session)) {
        return rc;
    }

    bool mutated = false;
    int rc = ExecuteCommand(session, args, mutated);
    if (rc == EXIT_OK && mutated) {
        db::Status saved = session.Save();
        if (!saved.ok()) {
            std::cerr << "error: cannot save ledger: " << saved.ToString() << "\n";
            return EXIT_STORAGE_ERROR;
        }
    }

    util::Logger::Instance().Shutdown();
    return rc;
}

} // namespace cli
} // namespace stakeledger

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return stakeledger::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
