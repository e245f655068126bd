#ifndef FF_LEDGER_COMMANDS_H
#define FF_LEDGER_COMMANDS_H

#include "../ledger/Ledger.h"
#include "../lib/Utilities.h"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ff {
namespace cli {

// "<sourceId>:<amount>"
Roe<FundingAllocation> parseAllocation(const std::string &str);
// "<name>:<unitPrice>:<qty>[:<category>]"
Roe<LineItem> parseLineItem(const std::string &str);
Roe<Money> parseAmount(const std::string &str);
/** Empty means "not given" and yields 0 */
Roe<int64_t> parseDateOption(const std::string &str);

struct AccountArgs {
  std::string name;
  std::string kind{ "BANK" };
  std::string opening{ "0" };
  std::string creditLimit;
  int statementDay{ 1 };
  int dueDay{ 1 };
};

/**
 * Transaction fields as given on the command line. Empty strings and zero
 * ids mean "not given"; an edit keeps the stored value for those.
 */
struct TxArgs {
  std::string kind;
  std::string amount;
  std::string date;
  std::string description;
  std::string category;
  Id from{ 0 };
  Id to{ 0 };
  std::string source;
  std::string sourceCategory{ "INCOME" };
  std::vector<std::string> allocations;
  std::vector<std::string> items;
  bool untracked{ false };
};

struct DebtArgs {
  std::string direction;
  std::string amount;
  Id account{ 0 };
  Id contactId{ 0 };
  std::string contact;
  std::string description;
  std::string dueDate;
  std::string date;
};

struct PaymentArgs {
  std::string amount;
  Id account{ 0 };
  std::string date;
  std::string description;
};

struct DebtEditArgs {
  std::string amount;
  std::string description;
  bool descriptionGiven{ false };
  std::string dueDate;
  bool clearDueDate{ false };
  Id contactId{ 0 };
  std::string contact;
};

/**
 * Runs front end commands against a ledger for one owner and renders the
 * results as JSON.
 */
class Commands {
public:
  Commands(Ledger &ledger, const OwnerId &owner) : ledger_(ledger), owner_(owner) {}

  Roe<nlohmann::json> accountCreate(const AccountArgs &args);
  Roe<nlohmann::json> accountList();
  Roe<nlohmann::json> accountShow(Id accountId);
  Roe<nlohmann::json> tags(Id accountId);

  Roe<nlohmann::json> txAdd(const TxArgs &args);
  Roe<nlohmann::json> txEdit(Id txId, const TxArgs &args);
  Roe<nlohmann::json> txShow(Id txId);
  // accountId 0 lists every account
  Roe<nlohmann::json> txHistory(Id accountId, size_t limit);
  Roe<nlohmann::json> sourceList();

  Roe<nlohmann::json> debtCreate(const DebtArgs &args);
  Roe<nlohmann::json> debtPay(Id debtId, const PaymentArgs &args);
  Roe<nlohmann::json> debtMarkPaid(Id debtId, Id accountId);
  Roe<nlohmann::json> debtEdit(Id debtId, const DebtEditArgs &args);
  Roe<nlohmann::json> debtDelete(Id debtId);
  Roe<nlohmann::json> debtList(bool includePaid);
  Roe<nlohmann::json> debtShow(Id debtId);
  Roe<nlohmann::json> debtSummary();

  Roe<nlohmann::json> contactAdd(const std::string &name);
  Roe<nlohmann::json> contactList();

private:
  Roe<void> applyTxArgs(const TxArgs &args, TransactionIntent &intent) const;

  Ledger &ledger_;
  OwnerId owner_;
};

} // namespace cli
} // namespace ff

#endif // FF_LEDGER_COMMANDS_H
