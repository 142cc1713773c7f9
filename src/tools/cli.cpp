#include "tools/cli.h"
#include "common/base58.h"
#include "common/logging.h"
#include "program/account_guard.h"
#include "program/decoder.h"
#include "program/instruction.h"
#include "program/layout.h"
#include "runtime/input_serializer.h"
#include "runtime/program_host.h"
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>
#include <limits>
#include <random>
#include <stdexcept>

namespace chadbuffer {
namespace tools {

namespace {

bool parse_number(const std::string &text, uint64_t &out) {
    if (text.empty() || text[0] == '-') {
        return false;
    }
    try {
        size_t consumed = 0;
        out = std::stoull(text, &consumed, 0);
        return consumed == text.size();
    } catch (const std::exception &) {
        return false;
    }
}

PublicKey random_key(std::mt19937_64 &rng) {
    PublicKey key(PUBKEY_BYTES);
    for (auto &byte : key) {
        byte = static_cast<uint8_t>(rng());
    }
    return key;
}

void print_offset(std::ostream &out, const char *name, size_t offset) {
    char line[64];
    std::snprintf(line, sizeof(line), "  %-18s 0x%04zx\n", name, offset);
    out << line;
}

std::string key_at(const uint8_t *key) {
    return encode_base58(PublicKey(key, key + PUBKEY_BYTES));
}

bool submit(runtime::BufferProgramHost &host, const std::vector<Instruction> &transaction,
            const std::string &label, std::ostream &err) {
    auto outcome = host.execute_transaction(transaction);
    if (!outcome.is_success()) {
        err << "❌ " << label << " failed: " << runtime::execution_result_name(outcome.result)
            << " " << outcome.error_details << std::endl;
        return false;
    }
    return true;
}

} // namespace

void print_usage(std::ostream &out) {
    out << "ChadBuffer CLI\n";
    out << "Usage: chadbuffer-cli [command] [options]\n\n";
    out << "Commands:\n";
    out << "  layout            Print the input region offset table\n";
    out << "  simulate          Upload random data through the host simulator\n";
    out << "  decode <file>     Decode a raw serialized input region\n\n";
    out << "Options:\n";
    out << "  --log-level <lvl>  trace, debug, info, warn or error (default: info)\n";
    out << "  --json-logs        Emit log lines as JSON\n";
    out << "  --trusted          Run the program on the unchecked input path\n";
    out << "  --size <bytes>     Blob size for simulate (default: 4096)\n";
    out << "  --seed <n>         Random seed for simulate (default: 1)\n";
    out << "  --cu-price <n>     Compute unit price in micro-lamports\n";
    out << "  --cu-limit <n>     Compute unit limit (at most 4294967295)\n";
    out << "  --help             Show this help message\n";
}

Result<CliOptions> parse_options(const std::vector<std::string> &args) {
    CliOptions options;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];
        bool has_value = i + 1 < args.size();
        uint64_t number = 0;

        if (arg == "--json-logs") {
            options.config.json_logs = true;
            continue;
        }
        if (arg == "--trusted") {
            options.config.trusted_input = true;
            continue;
        }
        if (arg == "--log-level") {
            if (!has_value) {
                return Result<CliOptions>("Missing value for --log-level");
            }
            options.config.log_level = args[++i];
            continue;
        }
        if (arg == "--size" || arg == "--seed" || arg == "--cu-price" || arg == "--cu-limit") {
            if (!has_value || !parse_number(args[i + 1], number)) {
                return Result<CliOptions>("Invalid or missing value for " + arg);
            }
            ++i;
            if (arg == "--size") {
                options.size = static_cast<size_t>(number);
            } else if (arg == "--seed") {
                options.seed = number;
            } else if (arg == "--cu-price") {
                options.budget.micro_lamports = number;
            } else {
                if (number > std::numeric_limits<uint32_t>::max()) {
                    return Result<CliOptions>("--cu-limit exceeds u32 range: " +
                                              std::to_string(number));
                }
                options.budget.units = static_cast<uint32_t>(number);
            }
            continue;
        }
        if (arg.rfind("--", 0) == 0) {
            return Result<CliOptions>("Unknown option: " + arg);
        }
        options.positional.push_back(arg);
    }
    return Result<CliOptions>(std::move(options));
}

int run_layout(std::ostream &out) {
    using program::InputLayout;
    out << "Program: " << program::PROGRAM_ADDRESS << "\n";
    out << "Input region offsets:\n";
    print_offset(out, "account count", InputLayout::ACCOUNT_COUNT);
    print_offset(out, "signer header", InputLayout::SIGNER_HEADER);
    print_offset(out, "signer key", InputLayout::SIGNER_KEY);
    print_offset(out, "signer owner", InputLayout::SIGNER_OWNER);
    print_offset(out, "signer lamports", InputLayout::SIGNER_LAMPORTS);
    print_offset(out, "signer data len", InputLayout::SIGNER_DATA_LEN);
    print_offset(out, "buffer header", InputLayout::BUFFER_HEADER);
    print_offset(out, "buffer key", InputLayout::BUFFER_KEY);
    print_offset(out, "buffer owner", InputLayout::BUFFER_OWNER);
    print_offset(out, "buffer lamports", InputLayout::BUFFER_LAMPORTS);
    print_offset(out, "buffer size", InputLayout::BUFFER_SIZE);
    print_offset(out, "buffer authority", InputLayout::BUFFER_AUTH);
    print_offset(out, "buffer data", InputLayout::BUFFER_DATA);
    print_offset(out, "instruction (min)", InputLayout::IX_MIN_OFFSET);

    char line[64];
    std::snprintf(line, sizeof(line), "  %-18s 0x%06x\n", "signer pattern",
                  program::AccountFlags::SIGNER_WRITABLE_NODUP);
    out << line;
    std::snprintf(line, sizeof(line), "  %-18s %zu bytes\n", "min region",
                  InputLayout::MIN_REGION_SIZE);
    out << line;
    return 0;
}

int run_simulate(const CliOptions &options, std::ostream &out, std::ostream &err) {
    std::mt19937_64 rng(options.seed);
    std::vector<uint8_t> data(options.size);
    for (auto &byte : data) {
        byte = static_cast<uint8_t>(rng());
    }
    PublicKey authority = random_key(rng);
    PublicKey buffer_key = random_key(rng);

    auto client_result = sdk::BufferClient::create(data, options.budget, buffer_key);
    if (client_result.is_err()) {
        err << "❌ Failed to build client: " << client_result.error() << std::endl;
        return 1;
    }
    const auto &client = client_result.value();

    runtime::BufferProgramHost host(options.config);
    Lamports rent = runtime::BufferProgramHost::rent_exempt_minimum(client.account_size());
    Lamports starting_balance = rent + 1000000000ULL;

    runtime::AccountState funder;
    funder.key = authority;
    funder.lamports = starting_balance;
    host.set_account(funder);

    out << "Uploading " << data.size() << " bytes to " << encode_base58(buffer_key)
        << " in " << client.shards().size() << " transactions\n";

    if (!submit(host, client.create_initialize_transaction(authority, rent), "Initialize", err)) {
        return 1;
    }
    size_t written = 1;
    for (const auto &transaction : client.create_write_transactions(authority)) {
        if (!submit(host, transaction, "Write " + std::to_string(written), err)) {
            return 1;
        }
        ++written;
    }

    auto account = host.get_account(buffer_key);
    if (!account) {
        err << "❌ Buffer account missing after upload" << std::endl;
        return 1;
    }
    auto verified = client.verify(account->data);
    if (verified.is_err() || !verified.value()) {
        err << "❌ Hash mismatch" << (verified.is_err() ? ": " + verified.error() : "")
            << std::endl;
        return 1;
    }
    out << "✅ Checksum " << to_hex(client.checksum()) << " verified\n";

    if (!submit(host, client.create_close_transaction(authority), "Close", err)) {
        return 1;
    }

    out << "Summary:\n";
    out << "  Transactions: " << host.transactions_processed() << "\n";
    out << "  Failed: " << host.transactions_failed() << "\n";
    out << "  Buffer closed: " << (host.account_exists(buffer_key) ? "no" : "yes") << "\n";
    out << "  Authority balance: " << host.balance(authority) << " (started with "
        << starting_balance << ")\n";
    return 0;
}

int run_decode(const CliOptions &options, std::ostream &out, std::ostream &err) {
    if (options.positional.empty()) {
        err << "❌ Decode command requires a file path\n";
        return 1;
    }

    const std::string &path = options.positional.front();
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        err << "❌ Cannot open " << path << std::endl;
        return 1;
    }
    std::vector<char> bytes((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());

    runtime::AlignedRegion storage(bytes.size());
    if (!bytes.empty()) {
        std::memcpy(storage.data(), bytes.data(), bytes.size());
    }

    auto region_result = program::InputRegion::borrow(storage.data(), storage.size());
    if (region_result.is_err()) {
        err << "❌ " << region_result.error() << std::endl;
        return 1;
    }
    const auto &region = region_result.value();
    using Decoder = program::LayoutDecoder<program::InputRegion>;

    auto header = Decoder::decode_accounts(region);
    out << "Region: " << region.size() << " bytes\n";
    out << "Accounts: " << header.account_count << "\n";
    out << "Signer flags: " << header.signer_flags.describe() << "\n";
    out << "Signer: " << key_at(Decoder::signer_key(region)) << "\n";

    if (auto rejected = program::AccountGuard::check_accounts(header)) {
        out << "Rejected: " << program::error_message(*rejected) << "\n";
        return 0;
    }

    out << "Buffer stored length: " << Decoder::buffer_stored_length(region) << "\n";
    out << "Buffer authority: " << key_at(Decoder::buffer_authority(region)) << "\n";

    auto frame = Decoder::decode_instruction(region);
    if (program::is_error(frame)) {
        out << "Rejected: " << program::error_message(std::get<program::ProgramError>(frame))
            << "\n";
        return 0;
    }
    const auto &ix = std::get<program::InstructionFrame>(frame);
    char line[64];
    std::snprintf(line, sizeof(line), "Instruction block: 0x%zx\n", ix.length_offset);
    out << line;
    out << "Instruction length: " << ix.instruction_length << "\n";
    out << "Discriminator: " << static_cast<int>(ix.discriminator) << "\n";

    auto parsed = program::parse_instruction(region, ix);
    if (program::is_error(parsed)) {
        out << "Rejected: " << program::error_message(std::get<program::ProgramError>(parsed))
            << "\n";
        return 0;
    }
    auto kind = program::kind_of(std::get<program::ParsedInstruction>(parsed));
    out << "Operation: " << program::instruction_name(kind) << "\n";
    if (auto rejected = program::AccountGuard::check_authority(region, ix.discriminator)) {
        out << "Rejected: " << program::error_message(*rejected) << "\n";
    }
    return 0;
}

int run_cli(const std::vector<std::string> &argv, std::ostream &out, std::ostream &err) {
    if (argv.size() < 2) {
        print_usage(out);
        return 1;
    }

    const std::string &command = argv[1];
    if (command == "--help" || command == "help") {
        print_usage(out);
        return 0;
    }

    std::vector<std::string> args(argv.begin() + 2, argv.end());
    for (const auto &arg : args) {
        if (arg == "--help") {
            print_usage(out);
            return 0;
        }
    }

    auto parsed = parse_options(args);
    if (parsed.is_err()) {
        err << "❌ " << parsed.error() << std::endl;
        return 1;
    }
    const CliOptions &options = parsed.value();

    auto &logger = Logger::instance();
    logger.set_level(Logger::parse_level(options.config.log_level));
    logger.set_json_format(options.config.json_logs);

    if (command == "layout") {
        return run_layout(out);
    } else if (command == "simulate") {
        return run_simulate(options, out, err);
    } else if (command == "decode") {
        return run_decode(options, out, err);
    }

    err << "❌ Unknown command: " << command << std::endl;
    print_usage(err);
    return 1;
}

} // namespace tools
} // namespace chadbuffer
