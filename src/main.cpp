// Asset lock command line tool
//
// Locks coins of a single-key wallet in asset-lock transactions, waits for
// the lock proof and records everything the platform needs to register a new
// identity or top up an existing one. All state lives in the configured
// state directory, so an interrupted command resumes where it stopped when
// run again.
//
// Usage: assetlock <config.json> <command> [args]
//   balance                       print the wallet address and balance
//   refresh                       reload unspent outputs from the node
//   register <amount>             lock amount for a new identity
//   topup <identity-id> <amount>  lock amount for an existing identity
//   split <count>                 split the wallet into count outputs
//   status                        show the in-flight operations

#include "asset_lock_flow.hpp"
#include "config.hpp"
#include "core_cli.hpp"
#include "core_services.hpp"
#include "error.hpp"
#include "file_store.hpp"
#include "hex_utils.hpp"
#include "logging.hpp"
#include "transaction_builder.hpp"
#include "wallet.hpp"
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

using namespace assetlock;

namespace {

void print_usage() {
    std::cerr << "Usage: assetlock <config.json> <command> [args]\n"
              << "Commands:\n"
              << "  balance\n"
              << "  refresh\n"
              << "  register <amount>\n"
              << "  topup <identity-id-hex> <amount>\n"
              << "  split <count>\n"
              << "  status\n";
}

uint64_t parse_count(const std::string& text, const char* what) {
    size_t consumed = 0;
    uint64_t value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != text.size() || text.empty() || text[0] == '-') {
        throw AssetLockError(AssetLockError::ErrorType::ConfigError,
            std::string("Invalid ") + what + ": " + text);
    }
    return value;
}

Hash256 parse_identity_id(const std::string& hex) {
    std::vector<uint8_t> bytes;
    try {
        bytes = HexUtils::decode(hex);
    } catch (const std::invalid_argument&) {
        bytes.clear();
    }
    if (bytes.size() != Hash256{}.size()) {
        throw AssetLockError(AssetLockError::ErrorType::ConfigError, "Identity id must be 64 hex characters");
    }
    Hash256 id;
    std::copy(bytes.begin(), bytes.end(), id.begin());
    return id;
}

// The stored wallet keeps the outputs known from the last run. A stored
// wallet for a different key than the configured one is replaced.
std::unique_ptr<Wallet> open_wallet(const Config& config, DurableStore& store) {
    PrivateKey key = PrivateKey::parse(config.private_key, config.network);
    if (auto record = store.read(AssetLockFlow::WALLET_KEY)) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(*record);
        } catch (const nlohmann::json::parse_error& e) {
            throw AssetLockError(AssetLockError::ErrorType::PersistenceError,
                std::string("Corrupt wallet record: ") + e.what());
        }
        auto wallet = Wallet::from_json(j);
        if (wallet->private_key() == key && wallet->network() == config.network) {
            return wallet;
        }
        std::cerr << "Stored wallet belongs to another key, starting from an empty ledger" << std::endl;
    }
    return std::make_unique<Wallet>(std::move(key), config.network);
}

void print_result(const FlowResult& result, Network network) {
    nlohmann::json out = {
        {"lock_transaction", result.lock.transaction.txid_hex()},
        {"lock_outpoint", result.proof.outpoint.to_string()},
        {"one_time_key", result.lock.one_time_key.to_wif(network)},
        {"identity_id", HexUtils::encode(result.payload.identity_id)},
        {"proof", result.proof},
        {"submitted", result.submitted}
    };
    if (!result.payload.identity_keys.empty()) {
        nlohmann::json keys = nlohmann::json::array();
        for (const auto& key : result.payload.identity_keys) {
            keys.push_back(key.to_wif(network));
        }
        out["identity_keys"] = keys;
    }
    std::cout << out.dump(4) << std::endl;
}

void print_status(AssetLockFlow& flow) {
    for (auto kind : {OperationKind::Registration, OperationKind::TopUp}) {
        ContinuationState state = flow.slot(kind).state();
        std::cout << operation_kind_name(kind) << ": " << state_name(state);
        if (const auto* lock = lock_record(state)) {
            std::cout << " " << lock->transaction.txid_hex();
        }
        std::cout << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage();
        return 1;
    }

    try {
        Config config = Config::load(argv[1]);
        logging::set_level(config.log_level);
        std::string command = argv[2];

        FileStore store(config.state_dir);
        auto wallet = open_wallet(config, store);

        CoreCli cli(config.core_cli, config.core_cli_args);
        CoreChainStatus chain(cli);
        CoreSubmission submission(cli);
        CoreAttestationService attestation(cli, config.network, config.poll_interval);
        CoreUtxoSource primary_utxos(cli);

        CoreCli fallback_cli(config.core_cli, config.fallback_core_cli_args);
        CoreUtxoSource fallback_utxos(fallback_cli);
        FallbackUtxoSource with_fallback(primary_utxos, fallback_utxos);
        UtxoSource& utxos = config.fallback_core_cli_args.empty()
            ? static_cast<UtxoSource&>(primary_utxos) : with_fallback;

        // Platform submission happens outside this tool
        AssetLockFlow flow(*wallet, store, chain, submission, attestation, nullptr,
                           config.fee, config.proof_timeout);
        flow.load();

        if (command == "balance" && argc == 3) {
            std::cout << wallet->address() << " " << wallet->format_balance() << std::endl;
        } else if (command == "refresh" && argc == 3) {
            flow.refresh(utxos);
            std::cout << wallet->address() << " " << wallet->format_balance() << std::endl;
        } else if (command == "register" && argc == 4) {
            auto result = flow.register_identity(parse_count(argv[3], "amount"));
            print_result(result, config.network);
        } else if (command == "topup" && argc == 5) {
            Hash256 identity_id = parse_identity_id(argv[3]);
            auto result = flow.top_up(identity_id, parse_count(argv[4], "amount"));
            print_result(result, config.network);
        } else if (command == "split" && argc == 4) {
            auto built = TransactionBuilder::build_split(*wallet, parse_count(argv[3], "count"), config.fee);
            for (const auto& split : built) {
                SubmitResult result = submission.submit(split.transaction.serialize());
                if (result.status == SubmitStatus::Rejected) {
                    // The ledger already counts the rejected outputs; reload it
                    flow.refresh(utxos);
                    throw AssetLockError(AssetLockError::ErrorType::NetworkError,
                        "Split transaction " + split.transaction.txid_hex() + " rejected: " + result.message);
                }
                std::cout << split.transaction.txid_hex() << std::endl;
            }
            flow.save_wallet();
        } else if (command == "status" && argc == 3) {
            std::cout << wallet->address() << " " << wallet->format_balance() << std::endl;
            print_status(flow);
        } else {
            print_usage();
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
