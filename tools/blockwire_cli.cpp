#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/network.hpp"
#include "consensus/block_hash.hpp"
#include "consensus/params.hpp"
#include "nlohmann/json.hpp"
#include "primitives/block.hpp"
#include "primitives/block_codec.hpp"
#include "util/clock.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"

using namespace blockwire;

namespace {

struct CliOptions {
  std::string network{"mainnet"};
  std::optional<std::uint32_t> pver;
  std::string log_level{"warn"};
  std::string log_file;
  std::optional<std::uint32_t> fixed_time;
  std::vector<std::string> args;
};

void PrintUsage() {
  std::cout << "Usage: blockwire-cli [options] <command> [args]\n"
            << "Commands:\n"
            << "  decode <hex>                       decode a header and print it as JSON\n"
            << "  hash <hex>                         print the identifier of a header\n"
            << "  genesis                            print the genesis header of the network\n"
            << "  new <prev> <merkle> <bits> <nonce> build a header for a new block\n"
            << "Options:\n"
            << "  --network <mainnet|testnet|regtest>\n"
            << "  --pver <n>           protocol version passed to the codec\n"
            << "  --time <seconds>     timestamp for 'new' instead of the system clock\n"
            << "  --log-level <level>  debug, info, warn or error\n"
            << "  --log-file <path>\n";
}

std::uint32_t ParseUint32(const std::string& text, const std::string& label) {
  std::size_t consumed = 0;
  unsigned long long value = 0;
  try {
    value = std::stoull(text, &consumed, 0);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid " + label + ": " + text);
  }
  if (consumed != text.size() || value > 0xFFFFFFFFULL) {
    throw std::runtime_error("invalid " + label + ": " + text);
  }
  return static_cast<std::uint32_t>(value);
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--network") {
      if (++i >= argc) throw std::runtime_error("missing value for --network");
      opts.network = argv[i];
    } else if (arg == "--pver") {
      if (++i >= argc) throw std::runtime_error("missing value for --pver");
      opts.pver = ParseUint32(argv[i], "--pver");
    } else if (arg == "--time") {
      if (++i >= argc) throw std::runtime_error("missing value for --time");
      opts.fixed_time = ParseUint32(argv[i], "--time");
    } else if (arg == "--log-level") {
      if (++i >= argc) throw std::runtime_error("missing value for --log-level");
      opts.log_level = argv[i];
    } else if (arg == "--log-file") {
      if (++i >= argc) throw std::runtime_error("missing value for --log-file");
      opts.log_file = argv[i];
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else {
      opts.args.emplace_back(arg);
    }
  }
  return opts;
}

void RequireArgs(const CliOptions& opts, std::size_t count) {
  if (opts.args.size() != count) {
    throw std::runtime_error("'" + opts.args.front() + "' expects " +
                             std::to_string(count - 1) + " argument(s)");
  }
}

void ThrowOnError(primitives::CodecStatus status, const std::string& what) {
  if (status != primitives::CodecStatus::kOk) {
    throw std::runtime_error(what + ": " + std::string(primitives::CodecStatusName(status)));
  }
}

primitives::BlockHeader DecodeHex(const std::string& hex, std::uint32_t pver) {
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(hex, &bytes)) {
    throw std::runtime_error("header is not valid hex");
  }
  std::size_t offset = 0;
  primitives::BlockHeader header;
  ThrowOnError(primitives::DeserializeBlockHeader(bytes, &offset, pver, &header),
               "failed to decode header");
  if (offset != bytes.size()) {
    util::LogWarn("ignoring " + std::to_string(bytes.size() - offset) +
                  " trailing byte(s) after header");
  }
  return header;
}

std::string HashOf(const primitives::BlockHeader& header, std::uint32_t pver) {
  primitives::Hash256 hash{};
  ThrowOnError(consensus::ComputeBlockHash(header, pver, &hash), "failed to hash header");
  return primitives::Hash256ToString(hash);
}

std::string EncodeHex(const primitives::BlockHeader& header, std::uint32_t pver) {
  std::vector<std::uint8_t> bytes;
  ThrowOnError(primitives::SerializeBlockHeader(header, pver, &bytes), "failed to encode header");
  return util::HexEncode(bytes);
}

nlohmann::json HeaderToJson(const primitives::BlockHeader& header, std::uint32_t pver) {
  nlohmann::json out;
  out["hash"] = HashOf(header, pver);
  out["version"] = header.version;
  out["previousblockhash"] = primitives::Hash256ToString(header.previous_block_hash);
  out["merkleroot"] = primitives::Hash256ToString(header.merkle_root);
  out["time"] = primitives::HeaderTimestampSeconds(header);
  out["bits"] = header.bits;
  out["nonce"] = header.nonce;
  out["txcount"] = header.txn_count;
  out["size"] = primitives::HeaderSerializeSize(header);
  out["hex"] = EncodeHex(header, pver);
  return out;
}

primitives::Hash256 ParseHashArg(const std::string& text, const std::string& label) {
  primitives::Hash256 hash{};
  if (!primitives::Hash256FromString(text, &hash)) {
    throw std::runtime_error("invalid " + label + " hash: " + text);
  }
  return hash;
}

nlohmann::json RunCommand(const CliOptions& opts, config::NetworkType network, std::uint32_t pver) {
  const auto& command = opts.args.front();
  if (command == "decode") {
    RequireArgs(opts, 2);
    return HeaderToJson(DecodeHex(opts.args[1], pver), pver);
  }
  if (command == "hash") {
    RequireArgs(opts, 2);
    return HashOf(DecodeHex(opts.args[1], pver), pver);
  }
  if (command == "genesis") {
    RequireArgs(opts, 1);
    const auto& params = consensus::Params(network);
    util::LogInfo("genesis header for " + params.network_id);
    auto out = HeaderToJson(params.genesis_header, pver);
    const auto& cfg = config::GetNetworkConfig();
    out["network"] = params.network_id;
    out["messagestart"] = util::HexEncode(cfg.message_start);
    out["defaultport"] = cfg.default_port;
    return out;
  }
  if (command == "new") {
    RequireArgs(opts, 5);
    const auto prev = ParseHashArg(opts.args[1], "previous block");
    const auto merkle = ParseHashArg(opts.args[2], "merkle root");
    const auto bits = ParseUint32(opts.args[3], "bits");
    const auto nonce = ParseUint32(opts.args[4], "nonce");
    primitives::BlockHeader header;
    if (opts.fixed_time) {
      const util::FixedClock clock(primitives::TimestampFromSeconds(*opts.fixed_time));
      header = primitives::NewBlockHeader(prev, merkle, bits, nonce, clock);
    } else {
      header = primitives::NewBlockHeader(prev, merkle, bits, nonce, util::SystemClock::Instance());
    }
    return HeaderToJson(header, pver);
  }
  throw std::runtime_error("unknown command: " + command);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto opts = ParseOptions(argc, argv);
    auto& logger = util::GlobalLogger();
    logger.SetThreshold(util::ParseLogLevelString(opts.log_level));
    if (!opts.log_file.empty()) {
      logger.EnableFile(opts.log_file);
    }
    if (opts.args.empty()) {
      PrintUsage();
      return 1;
    }

    const auto network = config::NetworkFromString(opts.network);
    if (!network) {
      throw std::runtime_error("unknown network: " + opts.network);
    }
    config::SelectNetwork(*network);
    const auto pver = opts.pver.value_or(config::GetNetworkConfig().protocol_version);
    util::LogDebug("network=" + std::string(config::NetworkName(*network)) +
                   " pver=" + std::to_string(pver) + " command=" + opts.args.front());

    const auto result = RunCommand(opts, *network, pver);
    if (result.is_string()) {
      std::cout << result.get<std::string>() << "\n";
    } else {
      std::cout << result.dump(2) << "\n";
    }
  } catch (const std::exception& ex) {
    std::cerr << "blockwire-cli: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
