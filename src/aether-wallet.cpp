// AETHER Wallet Tool
// Copyright (c) 2024 AETHER Developers
// MIT License
//
// Command-line front end for the quantum wallet.
// Supports:
// - Creating new wallets with a 12-word recovery phrase
// - Recovering wallets from a recovery phrase
// - Wallet info and derived address listing
// - Offline transaction signing and verification

#include <aether/core/errors.h>
#include <aether/util/config.h>
#include <aether/util/logging.h>
#include <aether/wallet/address.h>
#include <aether/wallet/api.h>
#include <aether/wallet/settings.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <termios.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace aether;
using namespace aether::wallet;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* UNLOCK_FAILED = "Error: could not unlock wallet\n";

// ============================================================================
// Terminal Utilities
// ============================================================================

/// Read a secret from the terminal without echo
std::string ReadPassword(const std::string& prompt) {
    std::cout << prompt << std::flush;

    termios oldt;
    bool isTerminal = tcgetattr(STDIN_FILENO, &oldt) == 0;
    if (isTerminal) {
        termios newt = oldt;
        newt.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        tcsetattr(STDIN_FILENO, TCSANOW, &newt);
    }

    std::string password;
    std::getline(std::cin, password);

    if (isTerminal) {
        tcsetattr(STDIN_FILENO, TCSANOW, &oldt);
    }
    std::cout << std::endl;

    return password;
}

/// Read a secret twice; empty if the entries differ
std::string ReadPasswordWithConfirm(const std::string& prompt) {
    std::string password1 = ReadPassword(prompt);
    std::string password2 = ReadPassword("Confirm passphrase: ");

    if (password1 != password2) {
        std::cerr << "Error: Passphrases do not match\n";
        std::fill(password1.begin(), password1.end(), '\0');
        std::fill(password2.begin(), password2.end(), '\0');
        return "";
    }

    std::fill(password2.begin(), password2.end(), '\0');
    return password1;
}

std::string ReadLine(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    std::getline(std::cin, line);
    return line;
}

bool AskYesNo(const std::string& question, bool defaultYes = false) {
    std::string prompt = question + (defaultYes ? " [Y/n]: " : " [y/N]: ");
    std::string answer = ReadLine(prompt);

    if (answer.empty()) {
        return defaultYes;
    }

    return (answer[0] == 'y' || answer[0] == 'Y');
}

void PrintLine(char c = '-', int width = 60) {
    std::cout << std::string(width, c) << "\n";
}

void PrintHeader(const std::string& title) {
    std::cout << "\n";
    PrintLine('=');
    std::cout << title << "\n";
    PrintLine('=');
    std::cout << "\n";
}

// ============================================================================
// Wallet File Utilities
// ============================================================================

bool EnsureDataDir(const fs::path& walletPath) {
    fs::path dir = walletPath.parent_path();
    if (!dir.empty() && !fs::exists(dir)) {
        std::error_code ec;
        if (!fs::create_directories(dir, ec)) {
            std::cerr << "Error: Cannot create directory " << dir << ": " << ec.message() << "\n";
            return false;
        }
    }
    return true;
}

bool SaveWallet(const fs::path& path, const QuantumWallet& wallet, const std::string& passphrase) {
    std::string serialized = EncryptWalletForStorage(wallet, passphrase);

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        std::cerr << "Error: Cannot write wallet to " << path << "\n";
        return false;
    }
    file << serialized << "\n";
    file.close();
    if (!file) {
        std::cerr << "Error: Failed to save wallet to " << path << "\n";
        return false;
    }

    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        LOG_WARN(util::LogCategory::CLI) << "Could not restrict permissions on " << path.string()
                                         << ": " << ec.message();
    }
    return true;
}

/// Load and decrypt; prints a generic message on failure
std::optional<QuantumWallet> UnlockWallet(const fs::path& path) {
    if (!fs::exists(path)) {
        std::cerr << "Error: Wallet not found at " << path << "\n";
        std::cerr << "Use 'aether-wallet create' to create a new wallet.\n";
        return std::nullopt;
    }

    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!file) {
        std::cerr << "Error: Cannot read wallet from " << path << "\n";
        return std::nullopt;
    }

    std::string passphrase = ReadPassword("Enter wallet passphrase: ");
    std::optional<QuantumWallet> wallet;
    try {
        wallet = DecryptWalletFromStorage(buffer.str(), passphrase);
    } catch (const WalletError&) {
        std::cerr << UNLOCK_FAILED;
    }
    std::fill(passphrase.begin(), passphrase.end(), '\0');

    return wallet;
}

void PrintMnemonic(const std::string& mnemonic) {
    std::istringstream iss(mnemonic);
    std::string word;
    int i = 1;
    while (iss >> word) {
        std::cout << std::setw(2) << i++ << ". " << word << "\n";
    }
}

// ============================================================================
// Command: Create
// ============================================================================

int CommandCreate(const fs::path& path, const std::string& entropy) {
    if (fs::exists(path)) {
        std::cerr << "Error: Wallet already exists at " << path << "\n";
        std::cerr << "Use -wallet=<name> to choose a different file or remove the existing one.\n";
        return 1;
    }
    if (!EnsureDataDir(path)) {
        return 1;
    }

    std::string passphrase = ReadPasswordWithConfirm("Enter wallet passphrase: ");
    if (passphrase.empty()) {
        std::cerr << "Error: A passphrase is required\n";
        return 1;
    }

    QuantumWallet wallet = CreateWallet(passphrase, entropy);

    PrintHeader("AETHER WALLET CREATION");
    std::cout << "Your wallet recovery phrase (12 words):\n\n";
    PrintLine();
    PrintMnemonic(wallet.baseWallet.mnemonic);
    PrintLine();
    std::cout << "\n";

    std::cout << "!!! CRITICAL WARNING !!!\n";
    std::cout << "Write down these words and store them in a SECURE location.\n";
    std::cout << "The words and your passphrase together recover this wallet.\n";
    std::cout << "NEVER share these words with anyone!\n\n";

    if (!AskYesNo("Have you written down your recovery phrase?", false)) {
        std::cout << "Wallet not saved. Run 'aether-wallet create' again when ready.\n";
        std::fill(passphrase.begin(), passphrase.end(), '\0');
        return 1;
    }

    bool saved = SaveWallet(path, wallet, passphrase);
    std::fill(passphrase.begin(), passphrase.end(), '\0');
    if (!saved) {
        return 1;
    }

    PrintHeader("WALLET CREATED SUCCESSFULLY");
    std::cout << "Wallet file: " << path << "\n";
    std::cout << "Address:     " << wallet.baseWallet.address << "\n";
    std::cout << "Identity:    " << WalletIdentity(wallet) << "\n\n";
    return 0;
}

// ============================================================================
// Command: Recover
// ============================================================================

int CommandRecover(const fs::path& path) {
    if (fs::exists(path)) {
        std::cerr << "Error: Wallet already exists at " << path << "\n";
        return 1;
    }
    if (!EnsureDataDir(path)) {
        return 1;
    }

    std::string mnemonic = ReadPassword("Enter recovery phrase (12 words): ");
    std::string passphrase = ReadPasswordWithConfirm("Enter wallet passphrase: ");
    if (passphrase.empty()) {
        std::fill(mnemonic.begin(), mnemonic.end(), '\0');
        std::cerr << "Error: A passphrase is required\n";
        return 1;
    }

    std::optional<QuantumWallet> wallet;
    try {
        wallet = RecoverWallet(mnemonic, passphrase);
    } catch (const InvalidMnemonicError&) {
        std::cerr << "Error: Invalid recovery phrase\n";
    } catch (const WalletRecoveryError&) {
        std::cerr << "Error: Could not recover wallet\n";
    }
    std::fill(mnemonic.begin(), mnemonic.end(), '\0');

    if (!wallet) {
        std::fill(passphrase.begin(), passphrase.end(), '\0');
        return 1;
    }

    bool saved = SaveWallet(path, *wallet, passphrase);
    std::fill(passphrase.begin(), passphrase.end(), '\0');
    if (!saved) {
        return 1;
    }

    PrintHeader("WALLET RECOVERED SUCCESSFULLY");
    std::cout << "Wallet file: " << path << "\n";
    std::cout << "Address:     " << wallet->baseWallet.address << "\n\n";
    return 0;
}

// ============================================================================
// Command: Info
// ============================================================================

int CommandInfo(const fs::path& path) {
    auto wallet = UnlockWallet(path);
    if (!wallet) {
        return 1;
    }

    const auto& qkp = wallet->quantumKeyPair;

    PrintHeader("AETHER WALLET INFO");
    std::cout << "Wallet file:       " << path << "\n";
    std::cout << "Address:           " << wallet->baseWallet.address << "\n";
    std::cout << "Public key:        " << wallet->baseWallet.publicKey << "\n";
    std::cout << "Identity:          " << WalletIdentity(*wallet) << "\n";
    std::cout << "\n";

    PrintLine();
    std::cout << "QUANTUM KEY PAIR\n";
    PrintLine();
    std::cout << "Fingerprint:       " << qkp.quantumFingerprint << "\n";
    std::cout << "Entanglement hash: " << qkp.entanglementHash << "\n";
    std::cout << "Lattice salt:      " << qkp.latticeSalt << "\n";
    std::cout << "States:            " << qkp.superpositionStates.size() << "\n";
    std::cout << "Proof:             " << wallet->entanglementProof << "\n\n";
    return 0;
}

// ============================================================================
// Command: Addresses
// ============================================================================

int CommandAddresses(const fs::path& path, size_t count) {
    auto wallet = UnlockWallet(path);
    if (!wallet) {
        return 1;
    }

    auto addresses = DeriveAddresses(*wallet, count);

    PrintLine();
    std::cout << "DERIVED ADDRESSES (" << addresses.size() << " total)\n";
    PrintLine();
    for (size_t i = 0; i < addresses.size(); ++i) {
        std::cout << std::setw(4) << i << "  " << addresses[i] << "\n";
    }
    std::cout << "\n";
    return 0;
}

// ============================================================================
// Command: Sign
// ============================================================================

int CommandSign(const fs::path& path, const Transaction& tx) {
    if (!IsValidAddress(tx.to)) {
        std::cerr << "Error: -to must be a 0x-prefixed 40 hex character address\n";
        return 1;
    }

    auto wallet = UnlockWallet(path);
    if (!wallet) {
        return 1;
    }

    std::string signedTx = SignTransaction(*wallet, tx);

    PrintLine();
    std::cout << "SIGNED TRANSACTION\n";
    PrintLine();
    std::cout << "From:     " << wallet->baseWallet.address << "\n";
    std::cout << "To:       " << tx.to << "\n";
    std::cout << "Value:    " << tx.value << "\n";
    std::cout << "Nonce:    " << tx.nonce << "\n";
    std::cout << "Chain ID: " << tx.chainId << "\n\n";
    std::cout << signedTx << "\n\n";
    return 0;
}

// ============================================================================
// Command: Verify
// ============================================================================

int CommandVerify(const fs::path& path, const std::string& signedTx) {
    if (signedTx.empty()) {
        std::cerr << "Error: -tx=<signed transaction> is required\n";
        return 1;
    }

    auto wallet = UnlockWallet(path);
    if (!wallet) {
        return 1;
    }

    bool quantumValid = VerifySignedTransaction(signedTx, *wallet);

    std::string standard = signedTx.substr(0, signedTx.find(':'));
    bool standardValid = Secp256k1Signer::VerifyTransaction(standard,
                                                            wallet->baseWallet.publicKey);

    PrintHeader("TRANSACTION VERIFICATION");
    if (auto tx = Secp256k1Signer::DecodePayload(standard)) {
        std::cout << "To:                 " << tx->to << "\n";
        std::cout << "Value:              " << tx->value << "\n";
        std::cout << "Nonce:              " << tx->nonce << "\n";
        std::cout << "Chain ID:           " << tx->chainId << "\n";
    }
    std::cout << "Standard signature: " << (standardValid ? "VALID" : "INVALID") << "\n";
    std::cout << "Quantum signature:  " << (quantumValid ? "VALID" : "INVALID") << "\n\n";

    return (standardValid && quantumValid) ? 0 : 1;
}

// ============================================================================
// Help and Usage
// ============================================================================

void PrintUsage() {
    std::cout << "AETHER Wallet Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: aether-wallet [options] <command>\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  create          Create a new wallet with a new recovery phrase\n";
    std::cout << "  recover         Rebuild a wallet from its recovery phrase\n";
    std::cout << "  info            Display wallet information\n";
    std::cout << "  addresses       List derived addresses\n";
    std::cout << "  sign            Sign a transaction offline\n";
    std::cout << "  verify          Verify a signed transaction\n";
    std::cout << "  help            Show this help message\n";
    std::cout << "  version         Show version information\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -datadir=<dir>      Data directory (default: ~/.aether)\n";
    std::cout << "  -conf=<file>        Config file (default: <datadir>/aether.conf)\n";
    std::cout << "  -wallet=<name>      Wallet file in datadir (default: wallet.json)\n";
    std::cout << "  -count=<n>          Addresses to list (default: addresscount or 12)\n";
    std::cout << "  -entropy=<text>     Extra entropy mixed into a new wallet\n";
    std::cout << "  -to=<address>       Transaction recipient\n";
    std::cout << "  -value=<amount>     Transaction value (default: 0)\n";
    std::cout << "  -data=<hex>         Transaction data (default: 0x)\n";
    std::cout << "  -nonce=<n>          Transaction nonce (default: 0)\n";
    std::cout << "  -gaslimit=<n>       Gas limit (default: 21000)\n";
    std::cout << "  -gasprice=<amount>  Gas price (default: 0)\n";
    std::cout << "  -chainid=<n>        Chain ID (default: 1)\n";
    std::cout << "  -tx=<signed>        Signed transaction to verify\n";
    std::cout << "  -loglevel=<level>   trace, debug, info, warn, error, fatal or off\n";
    std::cout << "  -printtoconsole=0   Silence log output\n";
    std::cout << "  -debuglog=<file>    Also log to <file> (relative to datadir; 1 for debug.log)\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  aether-wallet create -entropy=\"dice rolls\"\n";
    std::cout << "  aether-wallet -count=5 addresses\n";
    std::cout << "  aether-wallet -to=0x... -value=1000 sign\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << "AETHER Wallet Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 AETHER Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Setup
// ============================================================================

/// Read <datadir>/aether.conf, or -conf; a missing default file is fine
bool LoadConfigFile(util::ConfigManager& config) {
    std::string dataDir = config.GetPath("datadir", util::ConfigManager::GetDefaultDataDir());

    bool explicitConf = config.HasKey("conf");
    fs::path confPath = explicitConf
        ? fs::path(config.GetPath("conf"))
        : fs::path(dataDir) / util::DEFAULT_CONFIG_FILENAME;

    if (!explicitConf && !fs::exists(confPath)) {
        return true;
    }

    auto result = config.ParseFile(confPath.string());
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage;
        if (!result.errorFile.empty()) {
            std::cerr << " (" << result.errorFile;
            if (result.errorLine > 0) {
                std::cerr << ":" << result.errorLine;
            }
            std::cerr << ")";
        }
        std::cerr << "\n";
        return false;
    }
    return true;
}

void SetupLogging(const WalletSettings& settings) {
    auto& logger = util::Logger::Instance();
    logger.SetLevel(settings.logLevel);

    if (settings.printToConsole) {
        util::ConsoleSink::Config sinkConfig;
        sinkConfig.level = settings.logLevel;
        sinkConfig.showTimestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(sinkConfig));
    }

    std::string logPath = settings.DebugLogPath();
    if (logPath.empty() || !EnsureDataDir(logPath)) {
        return;
    }
    auto fileSink = std::make_shared<util::FileSink>(logPath);
    if (!fileSink->IsOpen()) {
        LogWarnF(util::LogCategory::CLI, "Cannot open debug log %s", logPath.c_str());
        return;
    }
    logger.AddSink(fileSink);
    LogDebugF(util::LogCategory::CLI, "Logging to %s", logPath.c_str());
}

std::optional<uint64_t> GetUnsignedOption(const util::ConfigManager& config,
                                          const std::string& key, uint64_t defaultValue) {
    if (!config.HasKey(key)) {
        return defaultValue;
    }
    auto value = config.TryGetInt(key);
    if (!value || *value < 0) {
        std::cerr << "Error: -" << key << " must be a non-negative whole number\n";
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

std::optional<Transaction> TransactionFromOptions(const util::ConfigManager& config) {
    Transaction tx;
    tx.to = config.GetString("to", "");
    tx.value = config.GetString("value", tx.value);
    tx.data = config.GetString("data", tx.data);
    tx.gasPrice = config.GetString("gasprice", tx.gasPrice);

    auto nonce = GetUnsignedOption(config, "nonce", tx.nonce);
    auto gasLimit = GetUnsignedOption(config, "gaslimit", tx.gasLimit);
    auto chainId = GetUnsignedOption(config, "chainid", tx.chainId);
    if (!nonce || !gasLimit || !chainId) {
        return std::nullopt;
    }
    tx.nonce = *nonce;
    tx.gasLimit = *gasLimit;
    tx.chainId = *chainId;
    return tx;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    util::ConfigManager config;

    auto parsed = config.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.errorMessage << "\n";
        return 1;
    }

    const auto& args = config.GetArgs();
    std::string command = args.empty() ? "" : args[0];

    if (config.GetBool("version", false) || command == "version") {
        PrintVersion();
        return 0;
    }
    if (config.GetBool("help", false) || config.GetBool("h", false) || command == "help") {
        PrintUsage();
        return 0;
    }
    if (command.empty()) {
        PrintUsage();
        return 1;
    }

    if (!LoadConfigFile(config)) {
        return 1;
    }

    WalletSettings settings;
    size_t addressCount = 0;
    try {
        settings = WalletSettings::FromConfig(config);
        addressCount = ParseAddressCount(config, "count", settings.addressCount);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    SetupLogging(settings);
    LOG_DEBUG(util::LogCategory::CLI) << "Using wallet file " << settings.WalletPath();

    fs::path walletPath = settings.WalletPath();

    int rc = 1;
    try {
        if (command == "create") {
            rc = CommandCreate(walletPath, config.GetString("entropy", ""));
        } else if (command == "recover") {
            rc = CommandRecover(walletPath);
        } else if (command == "info") {
            rc = CommandInfo(walletPath);
        } else if (command == "addresses") {
            rc = CommandAddresses(walletPath, addressCount);
        } else if (command == "sign") {
            auto tx = TransactionFromOptions(config);
            rc = tx ? CommandSign(walletPath, *tx) : 1;
        } else if (command == "verify") {
            rc = CommandVerify(walletPath, config.GetString("tx", ""));
        } else {
            std::cerr << "Unknown command: " << command << "\n";
            std::cerr << "Run 'aether-wallet help' for usage.\n";
        }
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::CLI) << "Command " << command << " failed: " << e.what();
        std::cerr << "Error: " << command << " failed\n";
        rc = 1;
    }

    util::Logger::Instance().Shutdown();
    return rc;
}
