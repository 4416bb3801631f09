// QUORUM CLI - Command Line Interface
// Copyright (c) 2024 QUORUM Developers
// MIT License
//
// quorum-cli loads the persisted ledger and governance state from the data
// directory, runs one operation, prints the events it produced and saves
// the result.

#include <quorum/core/errors.h>
#include <quorum/core/events.h>
#include <quorum/crypto/sha256.h>
#include <quorum/db/leveldb.h>
#include <quorum/db/state_store.h>
#include <quorum/governance/governance.h>
#include <quorum/governance/voting_power.h>
#include <quorum/ledger/merchant_ledger.h>
#include <quorum/token/token.h>
#include <quorum/util/config.h>
#include <quorum/util/logging.h>
#include <quorum/util/time.h>

#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace quorum {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "QUORUM CLI";

namespace defaults {
    constexpr const char* TOKEN_SYMBOL = "QRM";
    constexpr const char* NATIVE_SYMBOL = "NAT";
    constexpr const char* STATE_DIRNAME = "state";
    constexpr const char* LOG_FILENAME = "debug.log";
    constexpr const char* LOG_LEVEL = "warn";
}

// ============================================================================
// Runtime
// ============================================================================

/**
 * Everything one invocation operates on. Member order is construction
 * order: the tokens and the event log outlive the ledger and engine.
 */
struct Runtime {
    EventLog events;
    MemoryToken token{defaults::TOKEN_SYMBOL};
    MemoryToken native{defaults::NATIVE_SYMBOL};
    governance::TokenVotingPower power{token};
    ledger::MerchantLedger ledger;
    governance::GovernanceEngine engine;

    Runtime(const ledger::LedgerParams& ledgerParams,
            const governance::GovernanceParams& governanceParams)
        : ledger(token, native, events, ledgerParams)
        , engine(power, token, ledger, events, governanceParams) {}

    /// Vault address under which the governance token is withdrawable
    Address TokenAsset() const { return AddressFromLabel(token.GetSymbol()); }
};

// ============================================================================
// Argument Parsing
// ============================================================================

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

Amount ParseAmountArg(const std::string& text) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        throw UsageError("invalid amount '" + text + "'");
    }
    try {
        size_t pos = 0;
        unsigned long long value = std::stoull(text, &pos, 10);
        if (pos != text.size()) {
            throw UsageError("invalid amount '" + text + "'");
        }
        return static_cast<Amount>(value);
    } catch (const std::invalid_argument&) {
        throw UsageError("invalid amount '" + text + "'");
    } catch (const std::out_of_range&) {
        throw UsageError("amount out of range '" + text + "'");
    }
}

uint32_t ParsePercentArg(const std::string& text) {
    Amount value = ParseAmountArg(text);
    if (value > 100) {
        throw UsageError("percentage out of range '" + text + "'");
    }
    return static_cast<uint32_t>(value);
}

bool ParseFlagArg(const std::string& text) {
    if (text == "1" || text == "true" || text == "yes") return true;
    if (text == "0" || text == "false" || text == "no") return false;
    throw UsageError("expected 0 or 1, got '" + text + "'");
}

/// "-" (or "none") is the null address, anything else goes through ParseAddress
Address ParseOptionalAddressArg(const std::string& text) {
    if (text == "-" || text == "none") {
        return Address();
    }
    return ParseAddress(text);
}

/// "native" is the null asset address
Address ParseAssetArg(const std::string& text) {
    if (text == "native") {
        return Address();
    }
    return ParseAddress(text);
}

governance::ProposalKind ParseKindArg(const std::string& text) {
    auto kind = governance::ParseProposalKind(text);
    if (!kind) {
        throw UsageError("unknown proposal kind '" + text + "'");
    }
    return *kind;
}

/// Optional trailing deposit argument
Amount DepositArg(const std::vector<std::string>& args, size_t index) {
    return args.size() > index ? ParseAmountArg(args[index]) : 0;
}

// ============================================================================
// Output
// ============================================================================

std::string Label(const Address& address) {
    return address.IsNull() ? "-" : address.ToString();
}

/// Share of supply as "12.34%"
std::string PercentOfSupply(Amount balance, Amount supply) {
    std::ostringstream ss;
    double share = supply == 0
        ? 0.0
        : 100.0 * static_cast<double>(balance) / static_cast<double>(supply);
    ss << std::fixed << std::setprecision(2) << share << "%";
    return ss.str();
}

void PrintEvent(const Event& event) {
    std::cout << "  " << event.ToString() << "\n";
}

void PrintSlot(const governance::ProposalSlot& slot, Timestamp now) {
    std::cout << std::left << std::setw(16) << governance::ProposalKindToString(slot.kind)
              << " round " << slot.round;
    if (slot.round == 0) {
        std::cout << "  never proposed\n";
        return;
    }
    if (slot.IsOpen(now)) {
        std::cout << "  open, " << util::FormatDuration(slot.deadline - now) << " left";
    } else if (slot.active) {
        std::cout << "  expired";
    } else {
        std::cout << (slot.executed ? "  executed" : "  closed");
    }
    std::cout << "\n    power " << slot.accumulatedPower
              << ", initiator " << Label(slot.initiator)
              << ", deadline " << util::FormatISO8601(slot.deadline)
              << "\n    " << governance::DescribePayload(slot.payload);
    if (slot.depositRequested > 0) {
        std::cout << "\n    deposit " << slot.depositCollected << "/" << slot.depositRequested
                  << (slot.depositTaken ? " collected" : " not collected");
    }
    std::cout << "\n";
}

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: quorum-cli [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -datadir=DIR               Data directory (default: ~/.quorum)\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/quorum.conf)\n";
    std::cout << "  -mocktime=SECONDS          Use a fixed clock\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error (default: warn)\n";
    std::cout << "  -logfile=FILE              Log file (default: <datadir>/debug.log)\n";
    std::cout << "  -printtoconsole            Also log to stderr\n";
    std::cout << "\nAccounts are 40-digit hex addresses or labels hashed into one.\n";
    std::cout << "\nTokens:\n";
    std::cout << "  address <label>\n";
    std::cout << "  balance <account>\n";
    std::cout << "  holders\n";
    std::cout << "  token-mint <to> <amount>\n";
    std::cout << "  token-transfer <from> <to> <amount>\n";
    std::cout << "  token-approve <owner> <spender> <amount>\n";
    std::cout << "  native-deposit <amount>\n";
    std::cout << "\nGovernance:\n";
    std::cout << "  propose-add <caller> <merchant> <name> <quota> [deposit]\n";
    std::cout << "  propose-modify <caller> <merchant> <guardian|-> <freeze> <quota> <rebate> [deposit]\n";
    std::cout << "  propose-param <caller> <majority%> [deposit]\n";
    std::cout << "  propose-withdraw <caller> <asset|native> [beneficiary|-] [deposit]\n";
    std::cout << "  vote <caller> <add|modify|param|withdraw>\n";
    std::cout << "  status [kind]\n";
    std::cout << "\nMerchants:\n";
    std::cout << "  merchants\n";
    std::cout << "  mint <merchant> <user> <amount>\n";
    std::cout << "  pay <merchant> <user> <amount>\n";
    std::cout << "  modify <caller> <merchant> <guardian|-> <freeze> <quota> <rebate>\n";
    std::cout << "  freeze <caller> <merchant>\n";
    std::cout << "  unfreeze <caller> <merchant>\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 QUORUM Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Commands
// ============================================================================

/// Result of a command: an ErrorCode for ledger/engine calls, plus whether
/// the state changed and must be saved.
struct CommandResult {
    ErrorCode code{ErrorCode::Ok};
    bool mutated{false};
};

using CommandHandler = std::function<CommandResult(Runtime&, const std::vector<std::string>&)>;

struct Command {
    std::string usage;
    size_t minArgs;
    CommandHandler handler;
};

CommandResult Mutation(ErrorCode code) {
    return CommandResult{code, code == ErrorCode::Ok};
}

/// Direct token calls report failure as TransferFailed
CommandResult TokenCall(bool ok) {
    return ok ? CommandResult{ErrorCode::Ok, true} : CommandResult{ErrorCode::TransferFailed, false};
}

std::map<std::string, Command> BuildCommands() {
    using governance::ProposalKind;
    std::map<std::string, Command> commands;

    commands["address"] = {"address <label>", 1,
        [](Runtime&, const std::vector<std::string>& a) {
            std::cout << ParseAddress(a[0]).ToString() << "\n";
            return CommandResult{};
        }};

    commands["balance"] = {"balance <account>", 1,
        [](Runtime& rt, const std::vector<std::string>& a) {
            Address account = ParseAddress(a[0]);
            std::cout << account.ToString() << "\n"
                      << "  " << rt.token.GetSymbol() << " " << rt.token.BalanceOf(account) << "\n"
                      << "  " << rt.native.GetSymbol() << " " << rt.native.BalanceOf(account) << "\n";
            return CommandResult{};
        }};

    commands["holders"] = {"holders", 0,
        [](Runtime& rt, const std::vector<std::string>&) {
            Amount supply = rt.token.TotalSupply();
            auto holders = rt.token.GetHolders();
            if (holders.empty()) {
                std::cout << "no holders\n";
            }
            for (const auto& [account, balance] : holders) {
                std::cout << Label(account) << " " << balance << " " << rt.token.GetSymbol()
                          << " (" << PercentOfSupply(balance, supply) << ")\n";
            }
            std::cout << "supply " << supply << ", threshold "
                      << rt.engine.GetThreshold() << "\n";
            return CommandResult{};
        }};

    commands["token-mint"] = {"token-mint <to> <amount>", 2,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return TokenCall(rt.token.Mint(ParseAddress(a[0]), ParseAmountArg(a[1])));
        }};

    commands["token-transfer"] = {"token-transfer <from> <to> <amount>", 3,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return TokenCall(rt.token.Transfer(ParseAddress(a[0]), ParseAddress(a[1]),
                                               ParseAmountArg(a[2])));
        }};

    commands["token-approve"] = {"token-approve <owner> <spender> <amount>", 3,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return TokenCall(rt.token.Approve(ParseAddress(a[0]), ParseAddress(a[1]),
                                              ParseAmountArg(a[2])));
        }};

    commands["native-deposit"] = {"native-deposit <amount>", 1,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return TokenCall(rt.native.Mint(rt.ledger.GetVault(), ParseAmountArg(a[0])));
        }};

    commands["propose-add"] = {"propose-add <caller> <merchant> <name> <quota> [deposit]", 4,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return Mutation(rt.engine.InitiateAddMerchant(ParseAddress(a[0]), ParseAddress(a[1]),
                                                          a[2], ParseAmountArg(a[3]),
                                                          DepositArg(a, 4)));
        }};

    commands["propose-modify"] = {
        "propose-modify <caller> <merchant> <guardian|-> <freeze> <quota> <rebate> [deposit]", 6,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return Mutation(rt.engine.InitiateModifyMerchant(
                ParseAddress(a[0]), ParseAddress(a[1]), ParseOptionalAddressArg(a[2]),
                ParseFlagArg(a[3]), ParseAmountArg(a[4]), ParsePercentArg(a[5]),
                DepositArg(a, 6)));
        }};

    commands["propose-param"] = {"propose-param <caller> <majority%> [deposit]", 2,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return Mutation(rt.engine.InitiateChangeParameter(ParseAddress(a[0]),
                                                              ParsePercentArg(a[1]),
                                                              DepositArg(a, 2)));
        }};

    commands["propose-withdraw"] = {
        "propose-withdraw <caller> <asset|native> [beneficiary|-] [deposit]", 2,
        [](Runtime& rt, const std::vector<std::string>& a) {
            Address beneficiary = a.size() > 2 ? ParseOptionalAddressArg(a[2]) : Address();
            return Mutation(rt.engine.InitiateWithdrawFunds(ParseAddress(a[0]),
                                                            ParseAssetArg(a[1]),
                                                            beneficiary, DepositArg(a, 3)));
        }};

    commands["vote"] = {"vote <caller> <kind>", 2,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return Mutation(rt.engine.Vote(ParseKindArg(a[1]), ParseAddress(a[0])));
        }};

    commands["status"] = {"status [kind]", 0,
        [](Runtime& rt, const std::vector<std::string>& a) {
            Timestamp now = util::GetTime();
            std::cout << "time " << util::FormatISO8601(now)
                      << ", majority " << rt.engine.GetMajorityPercentage() << "%"
                      << ", threshold " << rt.engine.GetThreshold()
                      << " of supply " << rt.token.TotalSupply()
                      << ", window " << util::FormatDuration(rt.engine.GetVotingWindow()) << "\n";
            if (!a.empty()) {
                PrintSlot(rt.engine.GetSlot(ParseKindArg(a[0])), now);
            } else {
                for (ProposalKind kind : governance::ALL_PROPOSAL_KINDS) {
                    PrintSlot(rt.engine.GetSlot(kind), now);
                }
            }
            std::cout << "vault " << Label(rt.ledger.GetVault())
                      << ": " << rt.token.GetSymbol() << " "
                      << rt.ledger.GetVaultBalance(rt.TokenAsset())
                      << ", " << rt.native.GetSymbol() << " "
                      << rt.ledger.GetVaultBalance(Address()) << "\n";
            return CommandResult{};
        }};

    commands["merchants"] = {"merchants", 0,
        [](Runtime& rt, const std::vector<std::string>&) {
            auto merchants = rt.ledger.GetMerchants();
            if (merchants.empty()) {
                std::cout << "no merchants\n";
            }
            for (const auto& m : merchants) {
                std::cout << m.ToString() << "\n";
            }
            return CommandResult{};
        }};

    commands["mint"] = {"mint <merchant> <user> <amount>", 3,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return Mutation(rt.ledger.Mint(ParseAddress(a[0]), ParseAddress(a[1]),
                                           ParseAmountArg(a[2])));
        }};

    commands["pay"] = {"pay <merchant> <user> <amount>", 3,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return Mutation(rt.ledger.Pay(ParseAddress(a[0]), ParseAddress(a[1]),
                                          ParseAmountArg(a[2])));
        }};

    commands["modify"] = {"modify <caller> <merchant> <guardian|-> <freeze> <quota> <rebate>", 6,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return Mutation(rt.ledger.ModifyMerchant(
                ParseAddress(a[0]), ParseAddress(a[1]), ParseOptionalAddressArg(a[2]),
                ParseFlagArg(a[3]), ParseAmountArg(a[4]), ParsePercentArg(a[5])));
        }};

    commands["freeze"] = {"freeze <caller> <merchant>", 2,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return Mutation(rt.ledger.SetFrozen(ParseAddress(a[0]), ParseAddress(a[1]), true));
        }};

    commands["unfreeze"] = {"unfreeze <caller> <merchant>", 2,
        [](Runtime& rt, const std::vector<std::string>& a) {
            return Mutation(rt.ledger.SetFrozen(ParseAddress(a[0]), ParseAddress(a[1]), false));
        }};

    return commands;
}

// ============================================================================
// Main
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager config;
    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
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

    const auto& positional = config.GetArgs();
    if (positional.empty()) {
        PrintHelp();
        return 1;
    }

    std::string dataDir = config.GetDataDir();
    std::string confPath = config.GetPath(util::ConfigKeys::CONF,
        (std::filesystem::path(dataDir) / util::DEFAULT_CONFIG_FILENAME).string());
    if (std::filesystem::exists(confPath)) {
        util::ConfigParseResult fileResult = config.ParseFile(confPath);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.ToString() << "\n";
            return 1;
        }
    } else if (config.HasKey(util::ConfigKeys::CONF)) {
        std::cerr << "Error: config file not found: " << confPath << "\n";
        return 1;
    }

    std::error_code ec;
    std::filesystem::create_directories(dataDir, ec);
    if (ec) {
        std::cerr << "Error: cannot create data directory " << dataDir << ": " << ec.message() << "\n";
        return 1;
    }

    std::string logFile = config.GetPath(util::ConfigKeys::LOGFILE,
        (std::filesystem::path(dataDir) / defaults::LOG_FILENAME).string());
    util::LogLevel level = util::LogLevelFromString(
        config.GetString(util::ConfigKeys::LOGLEVEL, defaults::LOG_LEVEL));
    if (!util::InitLogging(level, config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, false), logFile)) {
        std::cerr << "Warning: cannot open log file " << logFile << "\n";
    }

    if (auto mock = config.TryGetInt(util::ConfigKeys::MOCKTIME)) {
        util::SetMockTime(*mock);
        LOG_DEBUG(util::LogCategory::CLI) << "Mock time " << util::FormatISO8601(*mock);
    }

    const std::string& name = positional[0];
    std::vector<std::string> args(positional.begin() + 1, positional.end());

    auto commands = BuildCommands();
    auto it = commands.find(name);
    if (it == commands.end()) {
        std::cerr << "Error: unknown command '" << name << "'. Try -help.\n";
        return 1;
    }
    const Command& command = it->second;
    if (args.size() < command.minArgs) {
        std::cerr << "Usage: quorum-cli " << command.usage << "\n";
        return 1;
    }

    ledger::LedgerParams ledgerParams = ledger::LedgerParams::FromConfig(config);
    governance::GovernanceParams governanceParams = governance::GovernanceParams::FromConfig(config);
    if (!governanceParams.IsValid()) {
        std::cerr << "Error: invalid governance settings (votingwindow must be positive, "
                  << "majority in 1.." << governance::MAX_MAJORITY_PERCENTAGE << ")\n";
        return 1;
    }

    auto [status, database] = db::OpenLevelDB(std::filesystem::path(dataDir) / defaults::STATE_DIRNAME);
    if (!status.ok()) {
        std::cerr << "Error: cannot open state database: " << status.ToString() << "\n";
        return 1;
    }

    Runtime rt(ledgerParams, governanceParams);
    db::StateStore store(*database);
    status = store.Load(rt.token, rt.native, rt.ledger, rt.engine);
    if (status.IsNotFound()) {
        LOG_INFO(util::LogCategory::CLI) << "Starting with empty state in " << dataDir;
    } else if (status.IsInvalidArgument()) {
        std::cerr << "Error: " << status.message() << "; set -owner to the account "
                  << "that owns the state in " << dataDir << "\n";
        return 1;
    } else if (!status.ok()) {
        std::cerr << "Error: cannot load state: " << status.ToString() << "\n";
        return 1;
    }
    if (!rt.ledger.RegisterAsset(rt.TokenAsset(), rt.token)) {
        std::cerr << "Error: cannot register " << rt.token.GetSymbol() << " as a vault asset\n";
        return 1;
    }

    std::vector<Event> produced;
    size_t handle = rt.events.Subscribe([&produced](const Event& e) { produced.push_back(e); });

    CommandResult result;
    try {
        result = command.handler(rt, args);
    } catch (const UsageError& e) {
        rt.events.Unsubscribe(handle);
        std::cerr << "Error: " << e.what() << "\nUsage: quorum-cli " << command.usage << "\n";
        return 1;
    }
    rt.events.Unsubscribe(handle);

    if (result.code != ErrorCode::Ok) {
        std::cerr << "error: " << ErrorCodeToString(result.code) << "\n";
        return 2;
    }

    for (const auto& event : produced) {
        PrintEvent(event);
    }

    if (result.mutated) {
        status = store.Save(rt.token, rt.native, rt.ledger, rt.engine);
        if (!status.ok()) {
            std::cerr << "Error: cannot save state: " << status.ToString() << "\n";
            return 1;
        }
    }
    return 0;
}

} // namespace cli
} // namespace quorum

int main(int argc, char* argv[]) {
    try {
        return quorum::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
