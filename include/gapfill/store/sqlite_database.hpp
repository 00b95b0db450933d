#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace gapfill::store {

class Statement;

/**
 * @class Database
 * @brief Owns one SQLite connection shared by the reading store, audit log and artifact repository.
 *
 * Access is serialized through a recursive mutex: a component takes the lock
 * for the duration of a logical operation (possibly several statements in a
 * transaction). Every SQLite failure surfaces as core::StoreUnavailable.
 */
class Database {
public:
	/**
	 * @brief Opens (or creates) the database file; ":memory:" gives a private in-memory database.
	 * @throws core::StoreUnavailable when the file cannot be opened.
	 */
	explicit Database(const std::string &path);
	~Database();

	Database(const Database &) = delete;
	Database &operator=(const Database &) = delete;

	void execute(const std::string &sql);
	Statement prepare(const std::string &sql);

	[[nodiscard]] std::unique_lock<std::recursive_mutex> lock();

	std::int64_t lastInsertRowId() const;
	int changes() const;

	const std::string &path() const noexcept {
		return path_;
	}

private:
	sqlite3 *handle_ = nullptr;
	std::recursive_mutex mutex_;
	std::string path_;
};

/**
 * @class Statement
 * @brief RAII wrapper around a prepared statement. Bind indices are 1-based, column indices 0-based.
 */
class Statement {
public:
	Statement(sqlite3 *db, const std::string &sql);
	~Statement();

	Statement(const Statement &) = delete;
	Statement &operator=(const Statement &) = delete;
	Statement(Statement &&other) noexcept;
	Statement &operator=(Statement &&other) noexcept;

	Statement &bindInt64(int index, std::int64_t value);
	Statement &bindDouble(int index, double value);
	Statement &bindText(int index, const std::string &value);
	Statement &bindBlob(int index, const std::vector<double> &values);
	Statement &bindNull(int index);
	Statement &bindOptionalDouble(int index, const std::optional<double> &value);
	Statement &bindOptionalText(int index, const std::optional<std::string> &value);

	/// Advances the cursor; returns true while a row is available.
	bool step();
	/// Executes a statement that produces no rows.
	void run();
	void reset();

	bool isNull(int column) const;
	std::int64_t columnInt64(int column) const;
	double columnDouble(int column) const;
	std::string columnText(int column) const;
	std::vector<double> columnBlob(int column) const;
	std::optional<double> columnOptionalDouble(int column) const;
	std::optional<std::string> columnOptionalText(int column) const;

private:
	void check(int rc, const char *action) const;

	sqlite3 *db_ = nullptr;
	sqlite3_stmt *stmt_ = nullptr;
};

/**
 * @class Transaction
 * @brief BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless committed.
 */
class Transaction {
public:
	explicit Transaction(Database &db);
	~Transaction();

	Transaction(const Transaction &) = delete;
	Transaction &operator=(const Transaction &) = delete;

	void commit();

private:
	Database &db_;
	bool committed_ = false;
};

} // namespace gapfill::store
