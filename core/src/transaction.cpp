#include "rlk/transaction.h"

#include "rlk/log.h"
#include "rlk/time_util.h"

#include <cstdint>
#include <cstdio>
#include <random>

namespace rlk {

std::string make_transaction_id() {
  std::random_device rd;
  std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
  uint64_t hi = gen();
  uint64_t lo = gen();
  hi = (hi & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
  lo = (lo & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xFFFF),
                static_cast<unsigned>(hi & 0xFFFF),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFull));
  return std::string(buf);
}

Transaction::Transaction(std::string name, bool dry_run)
    : id_(make_transaction_id()), name_(std::move(name)), dry_run_(dry_run), started_at_(now_iso_utc()) {}

bool Transaction::record(TxAction action) {
  if (closed()) {
    log::warn("transaction " + id_ + " closed; dropped action " + action.action + " " + action.subject);
    return false;
  }
  actions_.push_back(std::move(action));
  return true;
}

bool Transaction::record_rollback(TxAction action) {
  if (closed()) {
    log::warn("transaction " + id_ + " closed; dropped rollback for " + action.subject);
    return false;
  }
  rollback_.push_back(std::move(action));
  return true;
}

void Transaction::close() {
  if (!closed()) {
    ended_at_ = now_iso_utc();
  }
}

nlohmann::json to_json(const TxAction& action) {
  nlohmann::json j;
  j["action"] = action.action;
  j["clip"] = action.subject;
  j["target"] = action.target;
  j["dry_run"] = action.dry_run;
  if (!action.detail.empty()) j["detail"] = action.detail;
  return j;
}

nlohmann::json to_json(const Transaction& tx) {
  nlohmann::json j;
  j["transaction_id"] = tx.id();
  j["name"] = tx.name();
  j["dry_run"] = tx.dry_run();
  j["started_at"] = tx.started_at();
  j["ended_at"] = tx.ended_at().empty() ? nlohmann::json(nullptr) : nlohmann::json(tx.ended_at());
  j["actions"] = nlohmann::json::array();
  for (const auto& a : tx.actions()) j["actions"].push_back(to_json(a));
  j["rollback"] = nlohmann::json::array();
  for (const auto& a : tx.rollback()) j["rollback"].push_back(to_json(a));
  return j;
}

} // namespace rlk
