#ifndef QSTORE_SQLITE_EXECUTOR_H
#define QSTORE_SQLITE_EXECUTOR_H


#include <memory>
#include <string>
#include "qstore_executor.h"


struct sqlite3;  // forward declaration
struct sqlite3_stmt;  // forward declaration


namespace qstore
{


struct SQLiteExecutorOptions
{
	// how long to wait for a lock held by another connection
	int busy_timeout_ms = 120000;

	// create the database file and the quadruples table if missing
	bool create_if_missing = true;
};


/*
* Stores quadruples in one table of a SQLite database:
*
* Quadruples(QuadrupleID PRIMARY KEY, TripleFlavor,
*   Context, ContextID, Subject, SubjectID,
*   Predicate, PredicateID, Object, ObjectID)
*
* where the *ID columns hold term keys, and the text columns hold
* string forms. Every object index includes TripleFlavor.
*
* The connection is opened by the constructor and closed by the
* destructor. Opening fails with `ExecutorFailure` if the file is
* not a usable database.
*/
class SQLiteExecutor :
	public IExecutor
{
private:
	struct ConnectionCloser
	{
		void operator()(sqlite3* db) const;
	};

	struct StatementFinalizer
	{
		void operator()(sqlite3_stmt* stmt) const;
	};

	typedef std::unique_ptr<sqlite3_stmt, StatementFinalizer> Statement;

public:
	explicit SQLiteExecutor(const std::string& path,
		SQLiteExecutorOptions options = SQLiteExecutorOptions());

	bool insert_if_absent(const StoredQuadruple& q) override;
	size_t insert_batch_if_absent(const std::vector<StoredQuadruple>& qs) override;
	size_t delete_by_id(QuadrupleId id) override;
	size_t delete_by_predicates(const LookupDescriptor& lookup) override;
	size_t delete_all() override;
	bool exists_by_id(QuadrupleId id) override;
	std::unique_ptr<IRowIterator> select_by_predicates(const LookupDescriptor& lookup) override;
	size_t count() override;
	void optimize() override;

	const std::string& path() const { return m_path; }

private:
	friend class TransactionScope<SQLiteExecutor>;
	void begin_transaction();
	void commit_transaction();
	void rollback_transaction();

	// checks the database is readable, creating the table if needed
	void initialize();
	bool quadruples_table_exists();

	Statement prepare(const std::string& sql);
	void exec(const char* sql);

	// returns true if a row is available, false when done
	bool step(const Statement& stmt, const char* what);

	void bind(const Statement& stmt, int idx, std::int64_t value);
	void bind(const Statement& stmt, int idx, const std::string& value);
	void bind_lookup(const Statement& stmt, const LookupDescriptor& lookup);
	void bind_row(const Statement& stmt, const StoredQuadruple& q);

	[[noreturn]] void fail(const std::string& what, int rc) const;

private:
	const std::string m_path;
	const SQLiteExecutorOptions m_options;
	std::unique_ptr<sqlite3, ConnectionCloser> m_db;
};


}  // namespace qstore


#endif  // QSTORE_SQLITE_EXECUTOR_H
