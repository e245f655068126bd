#include "SqliteStore.h"
#include "Utilities.h"

namespace ff {

/**
 * Prepared statement bound to the store's connection. The first failing
 * bind is remembered and reported by step().
 */
class SqliteStore::Statement {
public:
  Statement(sqlite3 *db, const std::string &sql) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
  }

  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  bool ok() const { return rc_ == SQLITE_OK; }
  int rc() const { return rc_; }

  void bind(int index, int64_t value) {
    check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
  }

  void bind(int index, const Money &value) { bind(index, value.minor()); }

  void bindId(int index, Id value) { bind(index, static_cast<int64_t>(value)); }

  void bind(int index, const std::string &value) {
    check(sqlite3_bind_text(stmt_, index, value.data(),
                            static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }

  void bindNull(int index) { check(sqlite3_bind_null(stmt_, index)); }

  void bindOptionalId(int index, const std::optional<Id> &value) {
    if (value) {
      bindId(index, *value);
    } else {
      bindNull(index);
    }
  }

  void bindOptional(int index, const std::optional<int64_t> &value) {
    if (value) {
      bind(index, *value);
    } else {
      bindNull(index);
    }
  }

  /**
   * @return SQLITE_ROW, SQLITE_DONE or an error code
   */
  int step() {
    if (rc_ != SQLITE_OK) {
      return rc_;
    }
    return sqlite3_step(stmt_);
  }

  int64_t getInt(int col) const { return sqlite3_column_int64(stmt_, col); }
  Id getId(int col) const { return static_cast<Id>(getInt(col)); }
  Money getMoney(int col) const { return Money::fromMinor(getInt(col)); }
  bool isNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }

  std::string getText(int col) const {
    auto text = sqlite3_column_text(stmt_, col);
    if (!text) {
      return "";
    }
    return std::string(reinterpret_cast<const char *>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
  }

  std::optional<Id> getOptionalId(int col) const {
    if (isNull(col)) {
      return std::nullopt;
    }
    return getId(col);
  }

private:
  void check(int rc) {
    if (rc_ == SQLITE_OK && rc != SQLITE_OK) {
      rc_ = rc;
    }
  }

  sqlite3_stmt *stmt_{ nullptr };
  int rc_{ SQLITE_OK };
};

namespace {

const char *SCHEMA_SQL = R"SQL(
create table if not exists Accounts (
  Id integer primary key,
  Owner text not null,
  Name text not null,
  Kind text not null,
  Balance integer not null default 0,
  CreatedAt integer not null,
  CreditLimit integer,
  StatementDay integer,
  DueDay integer
);
create index if not exists Accounts_Owner on Accounts (Owner, Name);

create table if not exists Funding_Sources (
  Id integer primary key,
  Owner text not null,
  Name text not null,
  NameKey text not null,
  Category text not null,
  unique (Owner, NameKey)
);

create table if not exists Categories (
  Id integer primary key,
  Owner text not null,
  Name text not null,
  NameKey text not null,
  Kind text not null,
  unique (Owner, NameKey, Kind)
);

create table if not exists Contacts (
  Id integer primary key,
  Owner text not null,
  Name text not null,
  NameKey text not null,
  unique (Owner, NameKey)
);

create table if not exists Debts (
  Id integer primary key,
  Owner text not null,
  Direction text not null,
  Amount integer not null check (Amount > 0),
  Remaining integer not null,
  ContactId integer not null references Contacts (Id),
  Description text not null default '',
  DueDate integer,
  Paid integer not null default 0,
  CreatedAt integer not null,
  check (Remaining >= 0 and Remaining <= Amount)
);
create index if not exists Debts_Owner on Debts (Owner, Paid, CreatedAt);

create table if not exists Transactions (
  Id integer primary key,
  Owner text not null,
  Kind text not null,
  Amount integer not null check (Amount > 0),
  Date integer not null,
  Description text not null default '',
  CategoryId integer references Categories (Id),
  SourceAccountId integer references Accounts (Id),
  DestAccountId integer references Accounts (Id),
  DebtId integer references Debts (Id) on delete set null,
  DebtRole text not null default 'NONE'
);
create index if not exists Transactions_Source on Transactions (SourceAccountId);
create index if not exists Transactions_Dest on Transactions (DestAccountId);
create index if not exists Transactions_Debt on Transactions (DebtId);
create index if not exists Transactions_Owner_Date on Transactions (Owner, Date);

create table if not exists Transaction_Fundings (
  TransactionId integer not null references Transactions (Id) on delete cascade,
  SourceId integer not null references Funding_Sources (Id),
  Amount integer not null check (Amount > 0),
  primary key (TransactionId, SourceId)
);
create index if not exists Transaction_Fundings_Source on Transaction_Fundings (SourceId);

create table if not exists Transaction_Items (
  Id integer primary key,
  TransactionId integer not null references Transactions (Id) on delete cascade,
  Name text not null,
  UnitPrice integer not null check (UnitPrice >= 0),
  Quantity integer not null check (Quantity > 0),
  CategoryId integer references Categories (Id)
);
create index if not exists Transaction_Items_Tx on Transaction_Items (TransactionId);
)SQL";

const std::string ACCOUNT_COLUMNS =
    "select Id, Owner, Name, Kind, Balance, CreatedAt, CreditLimit, "
    "StatementDay, DueDay from Accounts ";

const std::string TX_COLUMNS =
    "select t.Id, t.Owner, t.Kind, t.Amount, t.Date, t.Description, c.Name, "
    "t.SourceAccountId, t.DestAccountId, t.DebtId, t.DebtRole "
    "from Transactions t left join Categories c on c.Id = t.CategoryId ";

const std::string DEBT_COLUMNS =
    "select d.Id, d.Owner, d.Direction, d.Amount, d.Remaining, d.ContactId, "
    "k.Name, d.Description, d.DueDate, d.Paid, d.CreatedAt "
    "from Debts d join Contacts k on k.Id = d.ContactId ";

} // namespace

SqliteStore::SqliteStore() : Store("ledger.store") {}

SqliteStore::~SqliteStore() { close(); }

Store::Error SqliteStore::errorFromCode(int rc, const std::string &context) const {
  std::string msg = context + ": " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
  switch (rc & 0xff) {
  case SQLITE_BUSY:
  case SQLITE_LOCKED:
    log().warning << msg;
    return Error(E_BUSY, msg);
  case SQLITE_CONSTRAINT:
    log().warning << msg;
    return Error(E_CONSTRAINT, msg);
  default:
    log().error << msg;
    return Error(E_IO, msg);
  }
}

Store::Roe<void> SqliteStore::exec(const std::string &sql) const {
  if (!db_) {
    return Error(E_STATE, "Database is not open");
  }
  char *errmsg = nullptr;
  int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
  sqlite3_free(errmsg);
  if (rc != SQLITE_OK) {
    return errorFromCode(rc, "Failed to execute statement");
  }
  return {};
}

Store::Roe<void> SqliteStore::open(const Config &config) {
  if (db_) {
    return Error(E_STATE, "Database already open");
  }
  if (config.path.empty()) {
    return Error(E_STATE, "Database path is empty");
  }

  int rc = sqlite3_open_v2(config.path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  if (rc != SQLITE_OK) {
    auto err = errorFromCode(rc, "Failed to open database " + config.path);
    close();
    return err;
  }

  sqlite3_extended_result_codes(db_, 1);
  rc = sqlite3_busy_timeout(db_, config.busyTimeoutMs);
  if (rc != SQLITE_OK) {
    auto err = errorFromCode(rc, "Failed to set busy timeout");
    close();
    return err;
  }

  auto result = exec("PRAGMA foreign_keys = ON;");
  if (result) {
    result = createSchema();
  }
  if (!result) {
    close();
    return result;
  }

  log().info << "Opened ledger database " << config.path;
  return {};
}

void SqliteStore::close() {
  if (!db_) {
    return;
  }
  if (unitDepth_ > 0) {
    log().warning << "Closing database with " << unitDepth_ << " open unit(s) of work";
    unitDepth_ = 0;
  }
  int rc = sqlite3_close(db_);
  if (rc != SQLITE_OK) {
    log().error << "Failed to close database: " << sqlite3_errstr(rc);
  }
  db_ = nullptr;
}

Store::Roe<void> SqliteStore::createSchema() {
  auto result = exec(std::string("begin immediate;") + SCHEMA_SQL + "commit;");
  if (!result) {
    if (!sqlite3_get_autocommit(db_)) {
      auto rollback = exec("rollback;");
      if (!rollback) {
        log().error << "Schema rollback failed: " << rollback.error().message;
      }
    }
    return Error(result.error().code, "Failed to create schema: " + result.error().message);
  }
  return {};
}

// ---------------------------------------------------------------- units

Store::Roe<void> SqliteStore::beginUnit() {
  std::string sql = unitDepth_ == 0
                        ? std::string("begin immediate;")
                        : "savepoint sp_" + std::to_string(unitDepth_ + 1) + ";";
  auto result = exec(sql);
  if (!result) {
    return result;
  }
  ++unitDepth_;
  return {};
}

Store::Roe<void> SqliteStore::commitUnit() {
  if (unitDepth_ == 0) {
    return Error(E_STATE, "No unit of work to commit");
  }
  std::string sql = unitDepth_ == 1
                        ? std::string("commit;")
                        : "release sp_" + std::to_string(unitDepth_) + ";";
  auto result = exec(sql);
  if (!result) {
    return result;
  }
  --unitDepth_;
  return {};
}

void SqliteStore::rollbackUnit() {
  if (unitDepth_ == 0) {
    return;
  }
  std::string sql;
  if (unitDepth_ == 1) {
    sql = "rollback;";
  } else {
    std::string sp = "sp_" + std::to_string(unitDepth_);
    sql = "rollback to " + sp + "; release " + sp + ";";
  }
  --unitDepth_;
  // SQLite may already have rolled back the whole transaction on some errors
  if (sqlite3_get_autocommit(db_)) {
    unitDepth_ = 0;
    return;
  }
  auto result = exec(sql);
  if (!result) {
    log().error << "Rollback failed: " << result.error().message;
  }
}

// ---------------------------------------------------------------- readers

namespace {

template <typename S> bool readAccountRow(const S &stmt, Account &account) {
  account.id = stmt.getId(0);
  account.owner = stmt.getText(1);
  account.name = stmt.getText(2);
  if (!parseAccountKind(stmt.getText(3), account.kind)) {
    return false;
  }
  account.balance = stmt.getMoney(4);
  account.createdAt = stmt.getInt(5);
  account.credit.reset();
  if (!stmt.isNull(6)) {
    CreditTerms terms;
    terms.limit = stmt.getMoney(6);
    terms.statementDay = static_cast<int>(stmt.getInt(7));
    terms.dueDay = static_cast<int>(stmt.getInt(8));
    account.credit = terms;
  }
  return true;
}

template <typename S> bool readTransactionRow(const S &stmt, Transaction &tx) {
  tx.id = stmt.getId(0);
  tx.owner = stmt.getText(1);
  if (!parseTxKind(stmt.getText(2), tx.kind)) {
    return false;
  }
  tx.amount = stmt.getMoney(3);
  tx.date = stmt.getInt(4);
  tx.description = stmt.getText(5);
  tx.category = stmt.getText(6);
  tx.sourceAccountId = stmt.getOptionalId(7);
  tx.destAccountId = stmt.getOptionalId(8);
  tx.debtId = stmt.getOptionalId(9);
  return parseDebtRole(stmt.getText(10), tx.debtRole);
}

template <typename S> bool readDebtRow(const S &stmt, Debt &debt) {
  debt.id = stmt.getId(0);
  debt.owner = stmt.getText(1);
  if (!parseDebtDirection(stmt.getText(2), debt.direction)) {
    return false;
  }
  debt.amount = stmt.getMoney(3);
  debt.remaining = stmt.getMoney(4);
  debt.contactId = stmt.getId(5);
  debt.contactName = stmt.getText(6);
  debt.description = stmt.getText(7);
  if (stmt.isNull(8)) {
    debt.dueDate.reset();
  } else {
    debt.dueDate = stmt.getInt(8);
  }
  debt.paid = stmt.getInt(9) != 0;
  debt.createdAt = stmt.getInt(10);
  return true;
}

} // namespace

// ---------------------------------------------------------------- accounts

Store::Roe<Id> SqliteStore::insertAccount(const Account &account) {
  Statement stmt(db_, "insert into Accounts (Owner, Name, Kind, Balance, CreatedAt, "
                      "CreditLimit, StatementDay, DueDay) values (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8);");
  stmt.bind(1, account.owner);
  stmt.bind(2, account.name);
  stmt.bind(3, toString(account.kind));
  stmt.bind(4, account.balance);
  stmt.bind(5, account.createdAt);
  if (account.credit) {
    stmt.bind(6, account.credit->limit);
    stmt.bind(7, static_cast<int64_t>(account.credit->statementDay));
    stmt.bind(8, static_cast<int64_t>(account.credit->dueDay));
  } else {
    stmt.bindNull(6);
    stmt.bindNull(7);
    stmt.bindNull(8);
  }
  int rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to insert account");
  }
  return static_cast<Id>(sqlite3_last_insert_rowid(db_));
}

Store::Roe<Account> SqliteStore::getAccount(const OwnerId &owner, Id id) const {
  Statement stmt(db_, ACCOUNT_COLUMNS + "where Owner = ?1 and Id = ?2;");
  stmt.bind(1, owner);
  stmt.bindId(2, id);
  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Error(E_NOT_FOUND, "Account not found: " + std::to_string(id));
  }
  if (rc != SQLITE_ROW) {
    return errorFromCode(rc, "Failed to read account");
  }
  Account account;
  if (!readAccountRow(stmt, account)) {
    return Error(E_STATE, "Corrupt account row: " + std::to_string(id));
  }
  return account;
}

Store::Roe<std::vector<Account>> SqliteStore::listAccounts(const OwnerId &owner) const {
  Statement stmt(db_, ACCOUNT_COLUMNS + "where Owner = ?1 order by Name, Id;");
  stmt.bind(1, owner);
  std::vector<Account> accounts;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    Account account;
    if (!readAccountRow(stmt, account)) {
      return Error(E_STATE, "Corrupt account row");
    }
    accounts.push_back(std::move(account));
  }
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to list accounts");
  }
  return accounts;
}

Store::Roe<Store::AccountStats> SqliteStore::getAccountStats(const OwnerId &owner,
                                                             Id id) const {
  auto account = getAccount(owner, id);
  if (!account) {
    return account.error();
  }
  Statement stmt(db_,
                 "select coalesce(sum(case when DestAccountId = ?2 then Amount else 0 end), 0), "
                 "coalesce(sum(case when SourceAccountId = ?2 then Amount else 0 end), 0), "
                 "count(*) from Transactions "
                 "where Owner = ?1 and (SourceAccountId = ?2 or DestAccountId = ?2);");
  stmt.bind(1, owner);
  stmt.bindId(2, id);
  int rc = stmt.step();
  if (rc != SQLITE_ROW) {
    return errorFromCode(rc, "Failed to read account totals");
  }
  AccountStats stats;
  stats.totalIn = stmt.getMoney(0);
  stats.totalOut = stmt.getMoney(1);
  stats.transactionCount = static_cast<uint64_t>(stmt.getInt(2));
  return stats;
}

Store::Roe<void> SqliteStore::adjustBalance(const OwnerId &owner, Id id,
                                            const Money &delta) {
  // SQLite turns an overflowing integer sum into a REAL, so bound the old
  // balance to the range the delta can be added to
  Money low = delta.isNegative() ? Money::lowest() - delta : Money::lowest();
  Money high = delta.isNegative() ? Money::max() : Money::max() - delta;
  Statement stmt(db_, "update Accounts set Balance = Balance + ?3 "
                      "where Owner = ?1 and Id = ?2 and Balance between ?4 and ?5;");
  stmt.bind(1, owner);
  stmt.bindId(2, id);
  stmt.bind(3, delta);
  stmt.bind(4, low);
  stmt.bind(5, high);
  int rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to adjust balance");
  }
  if (sqlite3_changes(db_) == 0) {
    auto account = getAccount(owner, id);
    if (!account) {
      return account.error();
    }
    return Error(E_RANGE, "Balance of " + account->name + " would leave the range of " +
                              Money::lowest().toString() + " to " + Money::max().toString());
  }
  return {};
}

Store::Roe<bool> SqliteStore::decrementBalanceIfCovered(const OwnerId &owner, Id id,
                                                        const Money &amount,
                                                        const Money &floor) {
  if (amount.isNegative()) {
    return Error(E_STATE, "Decrement must not be negative: " + amount.toString());
  }
  // Balance >= floor + amount, compared without computing Balance - amount
  Money threshold;
  if (!Money::checkedAdd(floor, amount, threshold)) {
    return false;
  }
  Statement stmt(db_, "update Accounts set Balance = Balance - ?3 "
                      "where Owner = ?1 and Id = ?2 and Balance >= ?4;");
  stmt.bind(1, owner);
  stmt.bindId(2, id);
  stmt.bind(3, amount);
  stmt.bind(4, threshold);
  int rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to decrement balance");
  }
  return sqlite3_changes(db_) == 1;
}

// ---------------------------------------------------------------- names

Store::Roe<FundingSource> SqliteStore::resolveFundingSource(const OwnerId &owner,
                                                            const std::string &name,
                                                            SourceCategory category) {
  Statement insert(db_, "insert into Funding_Sources (Owner, Name, NameKey, Category) "
                        "values (?1, ?2, ?3, ?4) on conflict do nothing;");
  insert.bind(1, owner);
  insert.bind(2, name);
  insert.bind(3, utl::toLower(name));
  insert.bind(4, toString(category));
  int rc = insert.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to create funding source");
  }

  Statement stmt(db_, "select Id, Name, Category from Funding_Sources "
                      "where Owner = ?1 and NameKey = ?2;");
  stmt.bind(1, owner);
  stmt.bind(2, utl::toLower(name));
  rc = stmt.step();
  if (rc != SQLITE_ROW) {
    return errorFromCode(rc, "Failed to read funding source");
  }
  FundingSource source;
  source.id = stmt.getId(0);
  source.owner = owner;
  source.name = stmt.getText(1);
  if (!parseSourceCategory(stmt.getText(2), source.category)) {
    return Error(E_STATE, "Corrupt funding source row: " + source.name);
  }
  return source;
}

Store::Roe<FundingSource> SqliteStore::getFundingSource(const OwnerId &owner, Id id) const {
  Statement stmt(db_, "select Id, Name, Category from Funding_Sources "
                      "where Owner = ?1 and Id = ?2;");
  stmt.bind(1, owner);
  stmt.bindId(2, id);
  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Error(E_NOT_FOUND, "Funding source not found: " + std::to_string(id));
  }
  if (rc != SQLITE_ROW) {
    return errorFromCode(rc, "Failed to read funding source");
  }
  FundingSource source;
  source.id = stmt.getId(0);
  source.owner = owner;
  source.name = stmt.getText(1);
  if (!parseSourceCategory(stmt.getText(2), source.category)) {
    return Error(E_STATE, "Corrupt funding source row: " + source.name);
  }
  return source;
}

Store::Roe<std::vector<FundingSource>>
SqliteStore::listFundingSources(const OwnerId &owner) const {
  Statement stmt(db_, "select Id, Name, Category from Funding_Sources "
                      "where Owner = ?1 order by NameKey;");
  stmt.bind(1, owner);
  std::vector<FundingSource> sources;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    FundingSource source;
    source.id = stmt.getId(0);
    source.owner = owner;
    source.name = stmt.getText(1);
    if (!parseSourceCategory(stmt.getText(2), source.category)) {
      return Error(E_STATE, "Corrupt funding source row: " + source.name);
    }
    sources.push_back(std::move(source));
  }
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to list funding sources");
  }
  return sources;
}

Store::Roe<Category> SqliteStore::resolveCategory(const OwnerId &owner,
                                                  const std::string &name, TxKind kind) {
  Statement insert(db_, "insert into Categories (Owner, Name, NameKey, Kind) "
                        "values (?1, ?2, ?3, ?4) on conflict do nothing;");
  insert.bind(1, owner);
  insert.bind(2, name);
  insert.bind(3, utl::toLower(name));
  insert.bind(4, toString(kind));
  int rc = insert.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to create category");
  }

  Statement stmt(db_, "select Id, Name from Categories "
                      "where Owner = ?1 and NameKey = ?2 and Kind = ?3;");
  stmt.bind(1, owner);
  stmt.bind(2, utl::toLower(name));
  stmt.bind(3, toString(kind));
  rc = stmt.step();
  if (rc != SQLITE_ROW) {
    return errorFromCode(rc, "Failed to read category");
  }
  Category category;
  category.id = stmt.getId(0);
  category.owner = owner;
  category.name = stmt.getText(1);
  category.kind = kind;
  return category;
}

Store::Roe<Contact> SqliteStore::resolveContact(const OwnerId &owner,
                                                const std::string &name) {
  Statement insert(db_, "insert into Contacts (Owner, Name, NameKey) "
                        "values (?1, ?2, ?3) on conflict do nothing;");
  insert.bind(1, owner);
  insert.bind(2, name);
  insert.bind(3, utl::toLower(name));
  int rc = insert.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to create contact");
  }

  Statement stmt(db_, "select Id, Name from Contacts where Owner = ?1 and NameKey = ?2;");
  stmt.bind(1, owner);
  stmt.bind(2, utl::toLower(name));
  rc = stmt.step();
  if (rc != SQLITE_ROW) {
    return errorFromCode(rc, "Failed to read contact");
  }
  Contact contact;
  contact.id = stmt.getId(0);
  contact.owner = owner;
  contact.name = stmt.getText(1);
  return contact;
}

Store::Roe<Contact> SqliteStore::insertContact(const OwnerId &owner,
                                               const std::string &name) {
  Statement stmt(db_, "insert into Contacts (Owner, Name, NameKey) values (?1, ?2, ?3);");
  stmt.bind(1, owner);
  stmt.bind(2, name);
  stmt.bind(3, utl::toLower(name));
  int rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to insert contact " + name);
  }
  Contact contact;
  contact.id = static_cast<Id>(sqlite3_last_insert_rowid(db_));
  contact.owner = owner;
  contact.name = name;
  return contact;
}

Store::Roe<Contact> SqliteStore::getContact(const OwnerId &owner, Id id) const {
  Statement stmt(db_, "select Id, Name from Contacts where Owner = ?1 and Id = ?2;");
  stmt.bind(1, owner);
  stmt.bindId(2, id);
  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Error(E_NOT_FOUND, "Contact not found: " + std::to_string(id));
  }
  if (rc != SQLITE_ROW) {
    return errorFromCode(rc, "Failed to read contact");
  }
  Contact contact;
  contact.id = stmt.getId(0);
  contact.owner = owner;
  contact.name = stmt.getText(1);
  return contact;
}

Store::Roe<std::vector<Contact>> SqliteStore::listContacts(const OwnerId &owner) const {
  Statement stmt(db_, "select Id, Name from Contacts where Owner = ?1 order by NameKey;");
  stmt.bind(1, owner);
  std::vector<Contact> contacts;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    Contact contact;
    contact.id = stmt.getId(0);
    contact.owner = owner;
    contact.name = stmt.getText(1);
    contacts.push_back(std::move(contact));
  }
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to list contacts");
  }
  return contacts;
}

// ---------------------------------------------------------------- transactions

Store::Roe<Id> SqliteStore::insertTransaction(const Transaction &tx,
                                              std::optional<Id> categoryId) {
  Statement stmt(db_, "insert into Transactions (Owner, Kind, Amount, Date, Description, "
                      "CategoryId, SourceAccountId, DestAccountId, DebtId, DebtRole) "
                      "values (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10);");
  stmt.bind(1, tx.owner);
  stmt.bind(2, toString(tx.kind));
  stmt.bind(3, tx.amount);
  stmt.bind(4, tx.date);
  stmt.bind(5, tx.description);
  stmt.bindOptionalId(6, categoryId);
  stmt.bindOptionalId(7, tx.sourceAccountId);
  stmt.bindOptionalId(8, tx.destAccountId);
  stmt.bindOptionalId(9, tx.debtId);
  stmt.bind(10, toString(tx.debtRole));
  int rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to insert transaction");
  }
  return static_cast<Id>(sqlite3_last_insert_rowid(db_));
}

Store::Roe<void> SqliteStore::updateTransaction(const Transaction &tx,
                                                std::optional<Id> categoryId) {
  Statement stmt(db_, "update Transactions set Kind = ?3, Amount = ?4, Date = ?5, "
                      "Description = ?6, CategoryId = ?7, SourceAccountId = ?8, "
                      "DestAccountId = ?9, DebtId = ?10, DebtRole = ?11 "
                      "where Owner = ?1 and Id = ?2;");
  stmt.bind(1, tx.owner);
  stmt.bindId(2, tx.id);
  stmt.bind(3, toString(tx.kind));
  stmt.bind(4, tx.amount);
  stmt.bind(5, tx.date);
  stmt.bind(6, tx.description);
  stmt.bindOptionalId(7, categoryId);
  stmt.bindOptionalId(8, tx.sourceAccountId);
  stmt.bindOptionalId(9, tx.destAccountId);
  stmt.bindOptionalId(10, tx.debtId);
  stmt.bind(11, toString(tx.debtRole));
  int rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to update transaction");
  }
  if (sqlite3_changes(db_) == 0) {
    return Error(E_NOT_FOUND, "Transaction not found: " + std::to_string(tx.id));
  }
  return {};
}

Store::Roe<void> SqliteStore::loadChildren(Transaction &tx) const {
  tx.allocations.clear();
  tx.items.clear();

  Statement allocs(db_, "select f.SourceId, s.Name, f.Amount from Transaction_Fundings f "
                        "join Funding_Sources s on s.Id = f.SourceId "
                        "where f.TransactionId = ?1 order by f.rowid;");
  allocs.bindId(1, tx.id);
  int rc;
  while ((rc = allocs.step()) == SQLITE_ROW) {
    FundingAllocation a;
    a.sourceId = allocs.getId(0);
    a.sourceName = allocs.getText(1);
    a.amount = allocs.getMoney(2);
    tx.allocations.push_back(std::move(a));
  }
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to read allocations");
  }

  Statement items(db_, "select i.Name, i.UnitPrice, i.Quantity, c.Name from Transaction_Items i "
                       "left join Categories c on c.Id = i.CategoryId "
                       "where i.TransactionId = ?1 order by i.Id;");
  items.bindId(1, tx.id);
  while ((rc = items.step()) == SQLITE_ROW) {
    LineItem item;
    item.name = items.getText(0);
    item.unitPrice = items.getMoney(1);
    item.quantity = items.getInt(2);
    item.category = items.getText(3);
    tx.items.push_back(std::move(item));
  }
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to read line items");
  }
  return {};
}

Store::Roe<Transaction> SqliteStore::getTransaction(const OwnerId &owner, Id id) const {
  Statement stmt(db_, TX_COLUMNS + "where t.Owner = ?1 and t.Id = ?2;");
  stmt.bind(1, owner);
  stmt.bindId(2, id);
  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Error(E_NOT_FOUND, "Transaction not found: " + std::to_string(id));
  }
  if (rc != SQLITE_ROW) {
    return errorFromCode(rc, "Failed to read transaction");
  }
  Transaction tx;
  if (!readTransactionRow(stmt, tx)) {
    return Error(E_STATE, "Corrupt transaction row: " + std::to_string(id));
  }
  auto children = loadChildren(tx);
  if (!children) {
    return children.error();
  }
  return tx;
}

Store::Roe<std::vector<Transaction>>
SqliteStore::listTransactions(const OwnerId &owner, std::optional<Id> accountId,
                              size_t limit) const {
  std::string sql = TX_COLUMNS + "where t.Owner = ?1 ";
  if (accountId) {
    sql += "and (t.SourceAccountId = ?2 or t.DestAccountId = ?2) ";
  }
  sql += "order by t.Date desc, t.Id desc";
  if (limit > 0) {
    sql += " limit " + std::to_string(limit);
  }
  sql += ";";

  Statement stmt(db_, sql);
  stmt.bind(1, owner);
  if (accountId) {
    stmt.bindId(2, *accountId);
  }
  std::vector<Transaction> txes;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    Transaction tx;
    if (!readTransactionRow(stmt, tx)) {
      return Error(E_STATE, "Corrupt transaction row");
    }
    txes.push_back(std::move(tx));
  }
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to list transactions");
  }
  for (auto &tx : txes) {
    auto children = loadChildren(tx);
    if (!children) {
      return children.error();
    }
  }
  return txes;
}

Store::Roe<Transaction> SqliteStore::findDebtTransaction(const OwnerId &owner, Id debtId,
                                                         DebtRole role) const {
  Statement stmt(db_, TX_COLUMNS + "where t.Owner = ?1 and t.DebtId = ?2 and t.DebtRole = ?3 "
                                   "order by t.Id limit 1;");
  stmt.bind(1, owner);
  stmt.bindId(2, debtId);
  stmt.bind(3, toString(role));
  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Error(E_NOT_FOUND, "No " + toString(role) + " transaction for debt " +
                                  std::to_string(debtId));
  }
  if (rc != SQLITE_ROW) {
    return errorFromCode(rc, "Failed to read debt transaction");
  }
  Transaction tx;
  if (!readTransactionRow(stmt, tx)) {
    return Error(E_STATE, "Corrupt transaction row");
  }
  auto children = loadChildren(tx);
  if (!children) {
    return children.error();
  }
  return tx;
}

Store::Roe<void> SqliteStore::insertAllocations(Id txId,
                                                const std::vector<FundingAllocation> &allocations) {
  for (const auto &a : allocations) {
    Statement stmt(db_, "insert into Transaction_Fundings (TransactionId, SourceId, Amount) "
                        "values (?1, ?2, ?3);");
    stmt.bindId(1, txId);
    stmt.bindId(2, a.sourceId);
    stmt.bind(3, a.amount);
    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
      return errorFromCode(rc, "Failed to insert allocation");
    }
  }
  return {};
}

Store::Roe<size_t> SqliteStore::deleteAllocations(Id txId) {
  Statement stmt(db_, "delete from Transaction_Fundings where TransactionId = ?1;");
  stmt.bindId(1, txId);
  int rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to delete allocations");
  }
  return static_cast<size_t>(sqlite3_changes(db_));
}

Store::Roe<void> SqliteStore::insertLineItems(Id txId, const std::vector<ItemRow> &items) {
  for (const auto &row : items) {
    Statement stmt(db_, "insert into Transaction_Items (TransactionId, Name, UnitPrice, "
                        "Quantity, CategoryId) values (?1, ?2, ?3, ?4, ?5);");
    stmt.bindId(1, txId);
    stmt.bind(2, row.item.name);
    stmt.bind(3, row.item.unitPrice);
    stmt.bind(4, row.item.quantity);
    stmt.bindOptionalId(5, row.categoryId);
    int rc = stmt.step();
    if (rc != SQLITE_DONE) {
      return errorFromCode(rc, "Failed to insert line item");
    }
  }
  return {};
}

Store::Roe<void> SqliteStore::deleteLineItems(Id txId) {
  Statement stmt(db_, "delete from Transaction_Items where TransactionId = ?1;");
  stmt.bindId(1, txId);
  int rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to delete line items");
  }
  return {};
}

Store::Roe<std::vector<TagBalance>> SqliteStore::provenanceTotals(const OwnerId &owner,
                                                                  Id accountId) const {
  Statement stmt(db_,
                 "select f.SourceId, s.Name, "
                 "sum(case when t.DestAccountId = ?2 then f.Amount else 0 end), "
                 "sum(case when t.SourceAccountId = ?2 then f.Amount else 0 end) "
                 "from Transaction_Fundings f "
                 "join Transactions t on t.Id = f.TransactionId "
                 "join Funding_Sources s on s.Id = f.SourceId "
                 "where t.Owner = ?1 and (t.DestAccountId = ?2 or t.SourceAccountId = ?2) "
                 "group by f.SourceId, s.Name;");
  stmt.bind(1, owner);
  stmt.bindId(2, accountId);
  std::vector<TagBalance> totals;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    TagBalance tag;
    tag.sourceId = stmt.getId(0);
    tag.name = stmt.getText(1);
    tag.credit = stmt.getMoney(2);
    tag.debit = stmt.getMoney(3);
    tag.balance = tag.credit - tag.debit;
    totals.push_back(std::move(tag));
  }
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to compute provenance totals");
  }
  return totals;
}

// ---------------------------------------------------------------- debts

Store::Roe<Id> SqliteStore::insertDebt(const Debt &debt) {
  Statement stmt(db_, "insert into Debts (Owner, Direction, Amount, Remaining, ContactId, "
                      "Description, DueDate, Paid, CreatedAt) "
                      "values (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9);");
  stmt.bind(1, debt.owner);
  stmt.bind(2, toString(debt.direction));
  stmt.bind(3, debt.amount);
  stmt.bind(4, debt.remaining);
  stmt.bindId(5, debt.contactId);
  stmt.bind(6, debt.description);
  stmt.bindOptional(7, debt.dueDate);
  stmt.bind(8, static_cast<int64_t>(debt.paid ? 1 : 0));
  stmt.bind(9, debt.createdAt);
  int rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to insert debt");
  }
  return static_cast<Id>(sqlite3_last_insert_rowid(db_));
}

Store::Roe<Debt> SqliteStore::getDebt(const OwnerId &owner, Id id) const {
  Statement stmt(db_, DEBT_COLUMNS + "where d.Owner = ?1 and d.Id = ?2;");
  stmt.bind(1, owner);
  stmt.bindId(2, id);
  int rc = stmt.step();
  if (rc == SQLITE_DONE) {
    return Error(E_NOT_FOUND, "Debt not found: " + std::to_string(id));
  }
  if (rc != SQLITE_ROW) {
    return errorFromCode(rc, "Failed to read debt");
  }
  Debt debt;
  if (!readDebtRow(stmt, debt)) {
    return Error(E_STATE, "Corrupt debt row: " + std::to_string(id));
  }
  return debt;
}

Store::Roe<void> SqliteStore::updateDebt(const Debt &debt) {
  Statement stmt(db_, "update Debts set Amount = ?3, Remaining = ?4, ContactId = ?5, "
                      "Description = ?6, DueDate = ?7, Paid = ?8 "
                      "where Owner = ?1 and Id = ?2;");
  stmt.bind(1, debt.owner);
  stmt.bindId(2, debt.id);
  stmt.bind(3, debt.amount);
  stmt.bind(4, debt.remaining);
  stmt.bindId(5, debt.contactId);
  stmt.bind(6, debt.description);
  stmt.bindOptional(7, debt.dueDate);
  stmt.bind(8, static_cast<int64_t>(debt.paid ? 1 : 0));
  int rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to update debt");
  }
  if (sqlite3_changes(db_) == 0) {
    return Error(E_NOT_FOUND, "Debt not found: " + std::to_string(debt.id));
  }
  return {};
}

Store::Roe<void> SqliteStore::deleteDebt(const OwnerId &owner, Id id) {
  Statement unlink(db_, "update Transactions set DebtId = null, DebtRole = 'NONE' "
                        "where Owner = ?1 and DebtId = ?2;");
  unlink.bind(1, owner);
  unlink.bindId(2, id);
  int rc = unlink.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to unlink debt transactions");
  }

  Statement stmt(db_, "delete from Debts where Owner = ?1 and Id = ?2;");
  stmt.bind(1, owner);
  stmt.bindId(2, id);
  rc = stmt.step();
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to delete debt");
  }
  if (sqlite3_changes(db_) == 0) {
    return Error(E_NOT_FOUND, "Debt not found: " + std::to_string(id));
  }
  return {};
}

Store::Roe<std::vector<Debt>> SqliteStore::listDebts(const OwnerId &owner,
                                                     bool activeOnly) const {
  std::string sql = DEBT_COLUMNS + "where d.Owner = ?1 ";
  if (activeOnly) {
    sql += "and d.Paid = 0 ";
  }
  sql += "order by d.CreatedAt desc, d.Id desc;";
  Statement stmt(db_, sql);
  stmt.bind(1, owner);
  std::vector<Debt> debts;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    Debt debt;
    if (!readDebtRow(stmt, debt)) {
      return Error(E_STATE, "Corrupt debt row");
    }
    debts.push_back(std::move(debt));
  }
  if (rc != SQLITE_DONE) {
    return errorFromCode(rc, "Failed to list debts");
  }
  return debts;
}

} // namespace ff
