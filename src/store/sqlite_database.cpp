#include "gapfill/store/sqlite_database.hpp"

#include "gapfill/core/errors.hpp"
#include "gapfill/utils/logging.hpp"

#include <sqlite3.h>

#include <cstring>
#include <utility>

namespace gapfill::store {

using core::StoreUnavailable;

// --- Database ---

Database::Database(const std::string &path) : path_(path) {
	const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
	const int rc = sqlite3_open_v2(path.c_str(), &handle_, flags, nullptr);
	if (rc != SQLITE_OK) {
		std::string message = handle_ ? sqlite3_errmsg(handle_) : sqlite3_errstr(rc);
		if (handle_) {
			sqlite3_close(handle_);
			handle_ = nullptr;
		}
		throw StoreUnavailable("Failed to open database at " + path + ": " + message);
	}
	sqlite3_busy_timeout(handle_, 5000);
	execute("PRAGMA foreign_keys = ON;");
	GAPFILL_DEBUG("Opened SQLite database at {}.", path);
}

Database::~Database() {
	if (handle_) {
		sqlite3_close(handle_);
	}
}

void Database::execute(const std::string &sql) {
	auto guard = lock();
	char *err = nullptr;
	if (sqlite3_exec(handle_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
		std::string message = err ? err : "unknown error";
		sqlite3_free(err);
		throw StoreUnavailable("SQL execution failed: " + message);
	}
}

Statement Database::prepare(const std::string &sql) {
	return Statement(handle_, sql);
}

std::unique_lock<std::recursive_mutex> Database::lock() {
	return std::unique_lock<std::recursive_mutex>(mutex_);
}

std::int64_t Database::lastInsertRowId() const {
	return sqlite3_last_insert_rowid(handle_);
}

int Database::changes() const {
	return sqlite3_changes(handle_);
}

// --- Statement ---

Statement::Statement(sqlite3 *db, const std::string &sql) : db_(db) {
	if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
		throw StoreUnavailable(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
	}
}

Statement::~Statement() {
	if (stmt_) {
		sqlite3_finalize(stmt_);
	}
}

Statement::Statement(Statement &&other) noexcept : db_(other.db_), stmt_(other.stmt_) {
	other.stmt_ = nullptr;
}

Statement &Statement::operator=(Statement &&other) noexcept {
	if (this != &other) {
		if (stmt_) {
			sqlite3_finalize(stmt_);
		}
		db_ = other.db_;
		stmt_ = other.stmt_;
		other.stmt_ = nullptr;
	}
	return *this;
}

void Statement::check(int rc, const char *action) const {
	if (rc != SQLITE_OK) {
		throw StoreUnavailable(std::string("Failed to ") + action + ": " + sqlite3_errmsg(db_));
	}
}

Statement &Statement::bindInt64(int index, std::int64_t value) {
	check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)), "bind integer");
	return *this;
}

Statement &Statement::bindDouble(int index, double value) {
	check(sqlite3_bind_double(stmt_, index, value), "bind real");
	return *this;
}

Statement &Statement::bindText(int index, const std::string &value) {
	check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
	      "bind text");
	return *this;
}

Statement &Statement::bindBlob(int index, const std::vector<double> &values) {
	const int bytes = static_cast<int>(values.size() * sizeof(double));
	check(sqlite3_bind_blob(stmt_, index, values.data(), bytes, SQLITE_TRANSIENT), "bind blob");
	return *this;
}

Statement &Statement::bindNull(int index) {
	check(sqlite3_bind_null(stmt_, index), "bind null");
	return *this;
}

Statement &Statement::bindOptionalDouble(int index, const std::optional<double> &value) {
	return value ? bindDouble(index, *value) : bindNull(index);
}

Statement &Statement::bindOptionalText(int index, const std::optional<std::string> &value) {
	return value ? bindText(index, *value) : bindNull(index);
}

bool Statement::step() {
	const int rc = sqlite3_step(stmt_);
	if (rc == SQLITE_ROW) {
		return true;
	}
	if (rc == SQLITE_DONE) {
		return false;
	}
	throw StoreUnavailable(std::string("Statement failed: ") + sqlite3_errmsg(db_));
}

void Statement::run() {
	while (step()) {
	}
}

void Statement::reset() {
	sqlite3_reset(stmt_);
	sqlite3_clear_bindings(stmt_);
}

bool Statement::isNull(int column) const {
	return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

std::int64_t Statement::columnInt64(int column) const {
	return static_cast<std::int64_t>(sqlite3_column_int64(stmt_, column));
}

double Statement::columnDouble(int column) const {
	return sqlite3_column_double(stmt_, column);
}

std::string Statement::columnText(int column) const {
	const auto *text = sqlite3_column_text(stmt_, column);
	if (!text) {
		return {};
	}
	return std::string(reinterpret_cast<const char *>(text),
	                   static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<double> Statement::columnBlob(int column) const {
	const void *data = sqlite3_column_blob(stmt_, column);
	const int bytes = sqlite3_column_bytes(stmt_, column);
	if (!data || bytes <= 0) {
		return {};
	}
	if (bytes % static_cast<int>(sizeof(double)) != 0) {
		throw StoreUnavailable("Stored weight blob has a size that is not a multiple of 8 bytes.");
	}
	std::vector<double> values(static_cast<std::size_t>(bytes) / sizeof(double));
	std::memcpy(values.data(), data, static_cast<std::size_t>(bytes));
	return values;
}

std::optional<double> Statement::columnOptionalDouble(int column) const {
	if (isNull(column)) {
		return std::nullopt;
	}
	return columnDouble(column);
}

std::optional<std::string> Statement::columnOptionalText(int column) const {
	if (isNull(column)) {
		return std::nullopt;
	}
	return columnText(column);
}

// --- Transaction ---

Transaction::Transaction(Database &db) : db_(db) {
	db_.execute("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
	if (!committed_) {
		try {
			db_.execute("ROLLBACK;");
		} catch (const StoreUnavailable &e) {
			GAPFILL_ERROR("Rollback failed on {}: {}", db_.path(), e.what());
		}
	}
}

void Transaction::commit() {
	db_.execute("COMMIT;");
	committed_ = true;
}

} // namespace gapfill::store
