#include "AppConfig.h"
#include "Commands.h"
#include "../ledger/Ledger.h"
#include "../lib/Logger.h"

#include <CLI/CLI.hpp>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

int printResult(const ff::Roe<nlohmann::json> &result) {
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }
  std::cout << result.value().dump(2) << "\n";
  return 0;
}

void addTxOptions(CLI::App *cmd, ff::cli::TxArgs &args) {
  cmd->add_option("--date", args.date, "Date as YYYY-MM-DD (default: today)");
  cmd->add_option("-d,--description", args.description, "Description");
  cmd->add_option("-c,--category", args.category, "Category name");
  cmd->add_option("--from", args.from, "Source account id (EXPENSE, LENDING, TRANSFER)");
  cmd->add_option("--to", args.to, "Destination account id (INCOME, REPAYMENT, TRANSFER)");
  cmd->add_option("-s,--source", args.source, "Funding source name (INCOME, REPAYMENT)");
  cmd->add_option("--source-category", args.sourceCategory,
                  "Category of a new funding source")
      ->capture_default_str();
  cmd->add_option("--alloc", args.allocations,
                  "Manual allocation <sourceId>:<amount>, repeatable");
  cmd->add_option("-i,--item", args.items,
                  "Line item <name>:<unitPrice>:<qty>[:<category>], repeatable");
  cmd->add_flag("--untracked", args.untracked, "Record a LENDING without provenance");
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "ff-ledger - Personal ledger with fund provenance and debts" };
  app.require_subcommand(1);

  // Global options
  std::string configPath;
  app.add_option("--config", configPath, "JSON configuration file");
  std::string dbPath;
  app.add_option("--db", dbPath, "SQLite database file (overrides config)");
  std::string owner;
  app.add_option("-u,--owner", owner, "Owner id (overrides config)");
  std::string logLevel;
  app.add_option("--log-level", logLevel, "debug, info, warning, error or critical");
  std::string logFile;
  app.add_option("--log-file", logFile, "Also write log records to this file");

  // account
  auto *account_cmd = app.add_subcommand("account", "Manage accounts");
  account_cmd->require_subcommand(1);
  ff::cli::AccountArgs accountArgs;
  auto *account_create = account_cmd->add_subcommand("create", "Create an account");
  account_create->add_option("name", accountArgs.name, "Account name")->required();
  account_create->add_option("-k,--kind", accountArgs.kind, "CASH, BANK, CREDIT or INVESTMENT")
      ->capture_default_str();
  account_create->add_option("-o,--opening", accountArgs.opening, "Opening balance")
      ->capture_default_str();
  account_create->add_option("--credit-limit", accountArgs.creditLimit,
                             "Credit limit (CREDIT accounts)");
  account_create->add_option("--statement-day", accountArgs.statementDay, "Statement day")
      ->check(CLI::Range(1, 31))
      ->capture_default_str();
  account_create->add_option("--due-day", accountArgs.dueDay, "Payment due day")
      ->check(CLI::Range(1, 31))
      ->capture_default_str();
  auto *account_list = account_cmd->add_subcommand("list", "List accounts");
  ff::Id showAccountId = 0;
  auto *account_show = account_cmd->add_subcommand("show", "Show an account with totals");
  account_show->add_option("accountId", showAccountId, "Account id")->required();

  // tags
  ff::Id tagsAccountId = 0;
  auto *tags_cmd = app.add_subcommand("tags", "Show funding source balances of an account");
  tags_cmd->add_option("accountId", tagsAccountId, "Account id")->required();

  // tx
  auto *tx_cmd = app.add_subcommand("tx", "Manage transactions");
  tx_cmd->require_subcommand(1);
  ff::cli::TxArgs txAddArgs;
  auto *tx_add = tx_cmd->add_subcommand("add", "Record a transaction");
  tx_add->add_option("kind", txAddArgs.kind,
                     "INCOME, EXPENSE, TRANSFER, LENDING or REPAYMENT")
      ->required();
  tx_add->add_option("amount", txAddArgs.amount, "Amount")->required();
  addTxOptions(tx_add, txAddArgs);

  ff::Id txEditId = 0;
  ff::cli::TxArgs txEditArgs;
  auto *tx_edit = tx_cmd->add_subcommand("edit", "Edit a transaction");
  tx_edit->add_option("txId", txEditId, "Transaction id")->required();
  tx_edit->add_option("-k,--kind", txEditArgs.kind, "New kind");
  tx_edit->add_option("--amount", txEditArgs.amount, "New amount");
  addTxOptions(tx_edit, txEditArgs);

  ff::Id txShowId = 0;
  auto *tx_show = tx_cmd->add_subcommand("show", "Show a transaction");
  tx_show->add_option("txId", txShowId, "Transaction id")->required();

  ff::Id historyAccountId = 0;
  size_t historyLimit = 0;
  auto *tx_history = tx_cmd->add_subcommand("history", "List transactions, newest first");
  tx_history->add_option("--account", historyAccountId, "Only this account (0 = all)")
      ->default_val(0);
  tx_history->add_option("-n,--limit", historyLimit, "Maximum count (0 = all)")
      ->default_val(0);

  // source
  auto *source_cmd = app.add_subcommand("source", "Funding sources");
  source_cmd->require_subcommand(1);
  auto *source_list = source_cmd->add_subcommand("list", "List funding sources");

  // debt
  auto *debt_cmd = app.add_subcommand("debt", "Manage debts");
  debt_cmd->require_subcommand(1);
  ff::cli::DebtArgs debtArgs;
  auto *debt_create = debt_cmd->add_subcommand("create", "Lend or borrow money");
  debt_create->add_option("direction", debtArgs.direction, "LENDING or BORROWING")->required();
  debt_create->add_option("amount", debtArgs.amount, "Principal")->required();
  debt_create->add_option("-a,--account", debtArgs.account, "Account the money moves through")
      ->required();
  debt_create->add_option("--contact-id", debtArgs.contactId, "Existing contact id");
  debt_create->add_option("--contact", debtArgs.contact, "Counterparty name");
  debt_create->add_option("-d,--description", debtArgs.description, "Description");
  debt_create->add_option("--due", debtArgs.dueDate, "Due date as YYYY-MM-DD");
  debt_create->add_option("--date", debtArgs.date, "Date as YYYY-MM-DD (default: today)");

  ff::Id payDebtId = 0;
  ff::cli::PaymentArgs paymentArgs;
  auto *debt_pay = debt_cmd->add_subcommand("pay", "Record a payment on a debt");
  debt_pay->add_option("debtId", payDebtId, "Debt id")->required();
  debt_pay->add_option("amount", paymentArgs.amount, "Payment amount")->required();
  debt_pay->add_option("-a,--account", paymentArgs.account, "Account the payment moves through")
      ->required();
  debt_pay->add_option("--date", paymentArgs.date, "Date as YYYY-MM-DD (default: today)");
  debt_pay->add_option("-d,--description", paymentArgs.description, "Description");

  ff::Id markDebtId = 0;
  ff::Id markAccountId = 0;
  auto *debt_mark = debt_cmd->add_subcommand(
      "mark-paid", "Settle a debt; with an account the remainder is paid, else written off");
  debt_mark->add_option("debtId", markDebtId, "Debt id")->required();
  debt_mark->add_option("-a,--account", markAccountId, "Account for the final payment");

  ff::Id editDebtId = 0;
  ff::cli::DebtEditArgs debtEditArgs;
  auto *debt_edit = debt_cmd->add_subcommand("edit", "Edit a debt");
  debt_edit->add_option("debtId", editDebtId, "Debt id")->required();
  debt_edit->add_option("--amount", debtEditArgs.amount, "New principal");
  auto *descOpt = debt_edit->add_option("-d,--description", debtEditArgs.description,
                                        "New description");
  debt_edit->add_option("--due", debtEditArgs.dueDate, "New due date as YYYY-MM-DD");
  debt_edit->add_flag("--clear-due", debtEditArgs.clearDueDate, "Remove the due date");
  debt_edit->add_option("--contact-id", debtEditArgs.contactId, "Existing contact id");
  debt_edit->add_option("--contact", debtEditArgs.contact, "Counterparty name");

  ff::Id deleteDebtId = 0;
  auto *debt_delete = debt_cmd->add_subcommand("delete", "Delete a debt record");
  debt_delete->add_option("debtId", deleteDebtId, "Debt id")->required();

  bool includePaid = false;
  auto *debt_list = debt_cmd->add_subcommand("list", "List debts");
  debt_list->add_flag("--all", includePaid, "Include paid debts");

  ff::Id showDebtId = 0;
  auto *debt_show = debt_cmd->add_subcommand("show", "Show a debt");
  debt_show->add_option("debtId", showDebtId, "Debt id")->required();

  auto *debt_summary = debt_cmd->add_subcommand("summary", "Totals of active debts");

  // contact
  auto *contact_cmd = app.add_subcommand("contact", "Manage contacts");
  contact_cmd->require_subcommand(1);
  std::string contactName;
  auto *contact_add = contact_cmd->add_subcommand("add", "Add a contact");
  contact_add->add_option("name", contactName, "Contact name")->required();
  auto *contact_list = contact_cmd->add_subcommand("list", "List contacts");

  CLI11_PARSE(app, argc, argv);

  ff::AppConfig config;
  if (!configPath.empty()) {
    auto loaded = ff::AppConfig::loadFile(configPath);
    if (!loaded) {
      std::cerr << "Error: " << loaded.error().message << "\n";
      return 1;
    }
    config = loaded.value();
  }
  if (!dbPath.empty()) {
    config.database = dbPath;
  }
  if (!owner.empty()) {
    config.owner = owner;
  }
  if (!logLevel.empty()) {
    config.logLevel = logLevel;
  }
  if (!logFile.empty()) {
    config.logFile = logFile;
  }

  ff::logging::Level level;
  if (!ff::logging::parseLevel(config.logLevel, level)) {
    std::cerr << "Error: Unknown log level: " << config.logLevel << "\n";
    return 1;
  }
  auto rootLogger = ff::logging::getRootLogger();
  rootLogger.setLevel(level);
  if (!config.logFile.empty()) {
    try {
      rootLogger.addFileHandler(config.logFile, level);
    } catch (const std::runtime_error &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return 1;
    }
  }

  if (config.owner.empty()) {
    std::cerr << "Error: An owner is required (--owner or \"owner\" in the config file)\n";
    return 1;
  }

  ff::Ledger ledger;
  ff::Ledger::InitConfig initConfig;
  initConfig.dbPath = config.database;
  initConfig.busyTimeoutMs = config.busyTimeoutMs;
  auto ready = ledger.init(initConfig);
  if (!ready) {
    std::cerr << "Error: " << ready.error().message << "\n";
    return 1;
  }

  ff::cli::Commands commands(ledger, config.owner);

  // Money arithmetic past the int64 range throws
  try {
    if (account_create->parsed()) {
      return printResult(commands.accountCreate(accountArgs));
    } else if (account_list->parsed()) {
      return printResult(commands.accountList());
    } else if (account_show->parsed()) {
      return printResult(commands.accountShow(showAccountId));
    } else if (tags_cmd->parsed()) {
      return printResult(commands.tags(tagsAccountId));
    } else if (tx_add->parsed()) {
      return printResult(commands.txAdd(txAddArgs));
    } else if (tx_edit->parsed()) {
      return printResult(commands.txEdit(txEditId, txEditArgs));
    } else if (tx_show->parsed()) {
      return printResult(commands.txShow(txShowId));
    } else if (tx_history->parsed()) {
      return printResult(commands.txHistory(historyAccountId, historyLimit));
    } else if (source_list->parsed()) {
      return printResult(commands.sourceList());
    } else if (debt_create->parsed()) {
      return printResult(commands.debtCreate(debtArgs));
    } else if (debt_pay->parsed()) {
      return printResult(commands.debtPay(payDebtId, paymentArgs));
    } else if (debt_mark->parsed()) {
      return printResult(commands.debtMarkPaid(markDebtId, markAccountId));
    } else if (debt_edit->parsed()) {
      debtEditArgs.descriptionGiven = descOpt->count() > 0;
      return printResult(commands.debtEdit(editDebtId, debtEditArgs));
    } else if (debt_delete->parsed()) {
      return printResult(commands.debtDelete(deleteDebtId));
    } else if (debt_list->parsed()) {
      return printResult(commands.debtList(includePaid));
    } else if (debt_show->parsed()) {
      return printResult(commands.debtShow(showDebtId));
    } else if (debt_summary->parsed()) {
      return printResult(commands.debtSummary());
    } else if (contact_add->parsed()) {
      return printResult(commands.contactAdd(contactName));
    } else if (contact_list->parsed()) {
      return printResult(commands.contactList());
    }
  } catch (const std::overflow_error &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "Error: No command given\n";
  return 1;
}
