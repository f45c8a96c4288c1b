#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace rlk {

struct TxAction {
  std::string action;
  std::string subject;
  std::string target;
  bool dry_run = false;
  nlohmann::json detail = nlohmann::json::object();
};

// Append-only log of the decisions made by one run. Actions are recorded in
// dry-run mode too; dry_run only says whether the caller performed them.
class Transaction {
 public:
  Transaction(std::string name, bool dry_run);

  const std::string& id() const { return id_; }
  const std::string& name() const { return name_; }
  bool dry_run() const { return dry_run_; }
  const std::string& started_at() const { return started_at_; }
  const std::string& ended_at() const { return ended_at_; }
  bool closed() const { return !ended_at_.empty(); }

  const std::vector<TxAction>& actions() const { return actions_; }
  const std::vector<TxAction>& rollback() const { return rollback_; }

  // Both return false once the transaction is closed.
  bool record(TxAction action);
  bool record_rollback(TxAction action);
  void close();

 private:
  std::string id_;
  std::string name_;
  bool dry_run_ = true;
  std::string started_at_;
  std::string ended_at_;
  std::vector<TxAction> actions_;
  std::vector<TxAction> rollback_;
};

nlohmann::json to_json(const TxAction& action);
nlohmann::json to_json(const Transaction& tx);

// Random RFC 4122 version 4 identifier.
std::string make_transaction_id();

} // namespace rlk
