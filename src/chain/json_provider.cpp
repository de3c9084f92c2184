#include "chain/json_provider.hpp"

#include <fstream>
#include <utility>

#include "util/hex.hpp"

namespace tidelink::chain {

namespace {

std::string BytesToHex(std::span<const std::uint8_t> bytes) {
  return util::HexEncodePrefixed(bytes);
}

nlohmann::json OptionalAddressToJson(const std::optional<primitives::Address>& address) {
  if (!address) {
    return nullptr;
  }
  return BytesToHex(*address);
}

bool Fail(std::string* error, std::string message) {
  if (error) *error = std::move(message);
  return false;
}

template <std::size_t N>
bool ReadFixed(const nlohmann::json& object, const char* key, std::array<std::uint8_t, N>* out,
               std::string* error) {
  if (!object.contains(key) || !object.at(key).is_string()) {
    return Fail(error, std::string("missing or non-string field '") + key + "'");
  }
  if (!util::HexDecodeFixed(object.at(key).get<std::string>(), out)) {
    return Fail(error, std::string("field '") + key + "' is not " + std::to_string(N) +
                           " hex bytes");
  }
  return true;
}

bool ReadBytes(const nlohmann::json& object, const char* key, std::vector<std::uint8_t>* out,
               std::string* error) {
  out->clear();
  if (!object.contains(key) || object.at(key).is_null()) {
    return true;
  }
  if (!object.at(key).is_string() || !util::HexDecode(object.at(key).get<std::string>(), out)) {
    return Fail(error, std::string("field '") + key + "' is not a hex string");
  }
  return true;
}

bool ReadUint64(const nlohmann::json& object, const char* key, std::uint64_t* out,
                std::string* error, bool required = true) {
  if (!object.contains(key)) {
    if (!required) {
      *out = 0;
      return true;
    }
    return Fail(error, std::string("missing field '") + key + "'");
  }
  const auto& value = object.at(key);
  if (!value.is_number_unsigned()) {
    return Fail(error, std::string("field '") + key + "' is not an unsigned integer");
  }
  *out = value.get<std::uint64_t>();
  return true;
}

bool ReadU256(const nlohmann::json& object, const char* key, primitives::U256* out,
              std::string* error) {
  if (!object.contains(key)) {
    *out = primitives::U256::Zero();
    return true;
  }
  const auto& value = object.at(key);
  if (value.is_number_unsigned()) {
    *out = primitives::U256(value.get<std::uint64_t>());
    return true;
  }
  if (!value.is_string() || !primitives::ParseU256(value.get<std::string>(), out)) {
    return Fail(error, std::string("field '") + key + "' is not a 256-bit integer");
  }
  return true;
}

bool ReadOptionalAddress(const nlohmann::json& object, const char* key,
                         std::optional<primitives::Address>* out, std::string* error) {
  if (!object.contains(key) || object.at(key).is_null()) {
    out->reset();
    return true;
  }
  primitives::Address address{};
  if (!ReadFixed(object, key, &address, error)) {
    return false;
  }
  *out = address;
  return true;
}

}  // namespace

nlohmann::json TransactionToJson(const primitives::Transaction& tx) {
  nlohmann::json out;
  if (const auto* deposit = std::get_if<primitives::TxDeposit>(&tx)) {
    out["type"] = "deposit";
    out["source_hash"] = BytesToHex(deposit->source_hash());
    out["from"] = BytesToHex(deposit->from());
    out["to"] = OptionalAddressToJson(deposit->to());
    out["value"] = deposit->value().ToString();
    out["gas_limit"] = deposit->gas_limit();
    out["system"] = deposit->is_system();
    out["input"] = BytesToHex(deposit->input());
    return out;
  }
  const auto& signed_tx = std::get<primitives::SignedTransaction>(tx);
  out["type"] = "regular";
  out["chain_id"] = signed_tx.chain_id;
  out["nonce"] = signed_tx.nonce;
  out["sender"] = BytesToHex(signed_tx.sender);
  out["to"] = OptionalAddressToJson(signed_tx.to);
  out["value"] = signed_tx.value.ToString();
  out["gas_limit"] = signed_tx.gas_limit;
  out["max_fee_per_gas"] = signed_tx.max_fee_per_gas;
  out["max_priority_fee_per_gas"] = signed_tx.max_priority_fee_per_gas;
  out["input"] = BytesToHex(signed_tx.input);
  out["signature"] = BytesToHex(signed_tx.signature);
  return out;
}

nlohmann::json ReceiptToJson(const primitives::Receipt& receipt) {
  nlohmann::json out;
  out["tx_hash"] = BytesToHex(receipt.tx_hash);
  out["success"] = receipt.success;
  out["gas_used"] = receipt.gas_used;
  nlohmann::json logs = nlohmann::json::array();
  for (const auto& log : receipt.logs) {
    nlohmann::json log_json;
    log_json["address"] = BytesToHex(log.address);
    nlohmann::json topics = nlohmann::json::array();
    for (const auto& topic : log.topics) {
      topics.push_back(BytesToHex(topic));
    }
    log_json["topics"] = topics;
    log_json["data"] = BytesToHex(log.data);
    logs.push_back(log_json);
  }
  out["logs"] = logs;
  return out;
}

nlohmann::json BlockToJson(const primitives::BlockView& block,
                           const std::vector<primitives::Receipt>& receipts) {
  nlohmann::json out;
  out["number"] = block.number;
  out["hash"] = BytesToHex(block.hash);
  out["parent_hash"] = BytesToHex(block.parent_hash);
  out["timestamp"] = block.timestamp;
  out["base_fee"] = block.base_fee;
  nlohmann::json txs = nlohmann::json::array();
  for (const auto& tx : block.transactions) {
    txs.push_back(TransactionToJson(tx));
  }
  out["transactions"] = txs;
  nlohmann::json receipt_list = nlohmann::json::array();
  for (const auto& receipt : receipts) {
    receipt_list.push_back(ReceiptToJson(receipt));
  }
  out["receipts"] = receipt_list;
  return out;
}

bool TransactionFromJson(const nlohmann::json& value, primitives::Transaction* tx,
                         std::string* error) {
  if (!value.is_object() || !value.contains("type") || !value.at("type").is_string()) {
    return Fail(error, "transaction needs a string 'type'");
  }
  const auto type = value.at("type").get<std::string>();
  if (type == "deposit") {
    primitives::DepositFields fields;
    if (!ReadFixed(value, "source_hash", &fields.source_hash, error) ||
        !ReadFixed(value, "from", &fields.from, error) ||
        !ReadOptionalAddress(value, "to", &fields.to, error) ||
        !ReadU256(value, "value", &fields.value, error) ||
        !ReadUint64(value, "gas_limit", &fields.gas_limit, error) ||
        !ReadBytes(value, "input", &fields.input, error)) {
      return false;
    }
    bool is_system = false;
    if (value.contains("system")) {
      if (!value.at("system").is_boolean()) {
        return Fail(error, "field 'system' is not a boolean");
      }
      is_system = value.at("system").get<bool>();
    }
    *tx = primitives::ChainDataDecoder::RestoreDeposit(std::move(fields), is_system);
    return true;
  }
  if (type == "regular") {
    primitives::SignedTransaction signed_tx;
    if (!ReadUint64(value, "chain_id", &signed_tx.chain_id, error) ||
        !ReadUint64(value, "nonce", &signed_tx.nonce, error) ||
        !ReadFixed(value, "sender", &signed_tx.sender, error) ||
        !ReadOptionalAddress(value, "to", &signed_tx.to, error) ||
        !ReadU256(value, "value", &signed_tx.value, error) ||
        !ReadUint64(value, "gas_limit", &signed_tx.gas_limit, error) ||
        !ReadUint64(value, "max_fee_per_gas", &signed_tx.max_fee_per_gas, error, false) ||
        !ReadUint64(value, "max_priority_fee_per_gas", &signed_tx.max_priority_fee_per_gas,
                    error, false) ||
        !ReadBytes(value, "input", &signed_tx.input, error) ||
        !ReadBytes(value, "signature", &signed_tx.signature, error)) {
      return false;
    }
    *tx = std::move(signed_tx);
    return true;
  }
  return Fail(error, "unknown transaction type '" + type + "'");
}

bool ReceiptFromJson(const nlohmann::json& value, primitives::Receipt* receipt,
                     std::string* error) {
  if (!value.is_object()) {
    return Fail(error, "receipt is not an object");
  }
  primitives::Receipt out;
  if (!ReadFixed(value, "tx_hash", &out.tx_hash, error) ||
      !ReadUint64(value, "gas_used", &out.gas_used, error, false)) {
    return false;
  }
  if (value.contains("success")) {
    if (!value.at("success").is_boolean()) {
      return Fail(error, "field 'success' is not a boolean");
    }
    out.success = value.at("success").get<bool>();
  }
  if (value.contains("logs")) {
    if (!value.at("logs").is_array()) {
      return Fail(error, "field 'logs' is not an array");
    }
    for (const auto& log_json : value.at("logs")) {
      primitives::Log log;
      if (!log_json.is_object()) {
        return Fail(error, "log is not an object");
      }
      if (!ReadFixed(log_json, "address", &log.address, error) ||
          !ReadBytes(log_json, "data", &log.data, error)) {
        return false;
      }
      if (log_json.contains("topics")) {
        if (!log_json.at("topics").is_array()) {
          return Fail(error, "field 'topics' is not an array");
        }
        for (const auto& topic_json : log_json.at("topics")) {
          primitives::Hash256 topic{};
          if (!topic_json.is_string() ||
              !util::HexDecodeFixed(topic_json.get<std::string>(), &topic)) {
            return Fail(error, "topic is not 32 hex bytes");
          }
          log.topics.push_back(topic);
        }
      }
      out.logs.push_back(std::move(log));
    }
  }
  *receipt = std::move(out);
  return true;
}

bool BlockFromJson(const nlohmann::json& value, primitives::BlockView* block,
                   std::vector<primitives::Receipt>* receipts, std::string* error) {
  if (!value.is_object()) {
    return Fail(error, "block is not an object");
  }
  primitives::BlockView out;
  if (!ReadUint64(value, "number", &out.number, error) ||
      !ReadFixed(value, "hash", &out.hash, error) ||
      !ReadFixed(value, "parent_hash", &out.parent_hash, error) ||
      !ReadUint64(value, "timestamp", &out.timestamp, error, false) ||
      !ReadUint64(value, "base_fee", &out.base_fee, error, false)) {
    return false;
  }
  if (value.contains("transactions")) {
    if (!value.at("transactions").is_array()) {
      return Fail(error, "field 'transactions' is not an array");
    }
    for (const auto& tx_json : value.at("transactions")) {
      primitives::Transaction tx;
      if (!TransactionFromJson(tx_json, &tx, error)) {
        return false;
      }
      out.transactions.push_back(std::move(tx));
    }
  }
  std::vector<primitives::Receipt> parsed_receipts;
  if (value.contains("receipts")) {
    if (!value.at("receipts").is_array()) {
      return Fail(error, "field 'receipts' is not an array");
    }
    for (const auto& receipt_json : value.at("receipts")) {
      primitives::Receipt receipt;
      if (!ReceiptFromJson(receipt_json, &receipt, error)) {
        return false;
      }
      parsed_receipts.push_back(std::move(receipt));
    }
  }
  *block = std::move(out);
  if (receipts) *receipts = std::move(parsed_receipts);
  return true;
}

JsonChainProvider::JsonChainProvider(std::filesystem::path path) : path_(std::move(path)) {}

bool JsonChainProvider::Reload(std::string* error) {
  std::ifstream in(path_);
  if (!in) {
    return Fail(error, "unable to open chain snapshot " + path_.string());
  }
  nlohmann::json root;
  try {
    in >> root;
  } catch (const nlohmann::json::exception& ex) {
    return Fail(error, "invalid chain snapshot " + path_.string() + ": " + ex.what());
  }
  if (!root.is_object() || !root.contains("blocks") || !root.at("blocks").is_array()) {
    return Fail(error, "chain snapshot " + path_.string() + " has no 'blocks' array");
  }
  std::uint64_t finalized = 0;
  if (!ReadUint64(root, "finalized", &finalized, error, false)) {
    return false;
  }
  std::vector<std::pair<primitives::BlockView, std::vector<primitives::Receipt>>> parsed;
  parsed.reserve(root.at("blocks").size());
  for (const auto& block_json : root.at("blocks")) {
    primitives::BlockView block;
    std::vector<primitives::Receipt> receipts;
    std::string block_error;
    if (!BlockFromJson(block_json, &block, &receipts, &block_error)) {
      return Fail(error, "chain snapshot " + path_.string() + ": " + block_error);
    }
    parsed.emplace_back(std::move(block), std::move(receipts));
  }
  blocks_.ReplaceAll(std::move(parsed), finalized);
  return true;
}

std::optional<primitives::BlockView> JsonChainProvider::BlockByNumber(
    std::uint64_t number) const {
  return blocks_.BlockByNumber(number);
}

bool JsonChainProvider::ReceiptByHash(const primitives::Hash256& tx_hash,
                                      primitives::Receipt* receipt) const {
  return blocks_.ReceiptByHash(tx_hash, receipt);
}

std::uint64_t JsonChainProvider::LatestBlockNumber() const {
  return blocks_.LatestBlockNumber();
}

std::uint64_t JsonChainProvider::FinalizedBlockNumber() const {
  return blocks_.FinalizedBlockNumber();
}

}  // namespace tidelink::chain
