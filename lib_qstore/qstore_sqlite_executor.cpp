#include <sqlite3.h>
#include <vector>
#include <exception>
#include "qstore_sqlite_executor.h"
#include "qstore_errors.h"
#include "qstore_assert.h"


namespace qstore
{


namespace
{


const char* const CREATE_SCHEMA_SQL =
	"CREATE TABLE Quadruples ("
	"QuadrupleID INTEGER NOT NULL PRIMARY KEY, TripleFlavor INTEGER NOT NULL, "
	"Context VARCHAR(1000) NOT NULL, ContextID INTEGER NOT NULL, "
	"Subject VARCHAR(1000) NOT NULL, SubjectID INTEGER NOT NULL, "
	"Predicate VARCHAR(1000) NOT NULL, PredicateID INTEGER NOT NULL, "
	"Object VARCHAR(1000) NOT NULL, ObjectID INTEGER NOT NULL);"
	"CREATE INDEX IDX_ContextID ON Quadruples (ContextID);"
	"CREATE INDEX IDX_SubjectID ON Quadruples (SubjectID);"
	"CREATE INDEX IDX_PredicateID ON Quadruples (PredicateID);"
	"CREATE INDEX IDX_ObjectID ON Quadruples (ObjectID,TripleFlavor);"
	"CREATE INDEX IDX_SubjectID_PredicateID ON Quadruples (SubjectID,PredicateID);"
	"CREATE INDEX IDX_SubjectID_ObjectID ON Quadruples (SubjectID,ObjectID,TripleFlavor);"
	"CREATE INDEX IDX_PredicateID_ObjectID ON Quadruples (PredicateID,ObjectID,TripleFlavor);";

const char* const INSERT_SQL =
	"INSERT OR IGNORE INTO Quadruples(QuadrupleID, TripleFlavor, Context, ContextID, "
	"Subject, SubjectID, Predicate, PredicateID, Object, ObjectID) "
	"VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)";

const char* const SELECT_SQL =
	"SELECT TripleFlavor, Context, Subject, Predicate, Object FROM Quadruples";


const char* column_name(Column col)
{
	switch (col)
	{
	case Column::CONTEXT:
		return "ContextID";
	case Column::SUBJECT:
		return "SubjectID";
	case Column::PREDICATE:
		return "PredicateID";
	case Column::OBJECT:
		return "ObjectID";
	case Column::FLAVOR:
		return "TripleFlavor";
	}
	QSTORE_CHECK_PRECOND(false);
	return "";
}


/*
* ` WHERE a = ? AND b = ?`, one placeholder per predicate, in
* conjunction order. Empty for an empty conjunction.
* SQLite picks its own index, so `lookup.index` is not used.
*/
std::string where_clause(const LookupDescriptor& lookup)
{
	std::string sql;
	for (const auto& p : lookup.conjunction)
	{
		sql += sql.empty() ? " WHERE " : " AND ";
		sql += column_name(p.column);
		sql += " = ?";
	}
	return sql;
}


std::string column_text(sqlite3_stmt* stmt, int col)
{
	const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
	return (text == nullptr) ? std::string() : std::string(text);
}


// a flavor value outside the enum means the table was written by someone else
ObjectFlavor column_flavor(sqlite3_stmt* stmt, int col)
{
	try
	{
		return flavor_from_int(sqlite3_column_int64(stmt, col));
	}
	catch (const AmbiguousObjectFlavor& e)
	{
		std::throw_with_nested(ExecutorFailure(
			std::string("corrupt stored row: ") + e.what(), SQLITE_CORRUPT));
	}
}


/*
* The rows of a select are read out in full by a single statement
* (hence in one implicit read transaction), so this iterator owns
* them and is unaffected by any later call.
*/
class SnapshotRowIterator :
	public IRowIterator
{
public:
	SnapshotRowIterator(std::vector<QuadrupleRow> rows) :
		m_rows(std::move(rows)), m_idx(m_rows.size())
	{ }

	void start() override { m_idx = 0; }

	bool valid() const override { return m_idx < m_rows.size(); }

	void next() override
	{
		QSTORE_CHECK_PRECOND(valid());
		++m_idx;
	}

	QuadrupleRow current() const override
	{
		QSTORE_CHECK_PRECOND(valid());
		return m_rows[m_idx];
	}

private:
	const std::vector<QuadrupleRow> m_rows;
	size_t m_idx;
};


}  // namespace


void SQLiteExecutor::ConnectionCloser::operator()(sqlite3* db) const
{
	sqlite3_close(db);
}


void SQLiteExecutor::StatementFinalizer::operator()(sqlite3_stmt* stmt) const
{
	sqlite3_finalize(stmt);
}


SQLiteExecutor::SQLiteExecutor(const std::string& path, SQLiteExecutorOptions options) :
	m_path(path), m_options(options)
{
	if (m_path.empty())
		throw InvalidArgument("SQLite database path is empty");

	const int flags = SQLITE_OPEN_READWRITE
		| (m_options.create_if_missing ? SQLITE_OPEN_CREATE : 0);

	sqlite3* db = nullptr;
	const int rc = sqlite3_open_v2(m_path.c_str(), &db, flags, nullptr);

	// a handle is allocated even on failure, and must be closed
	m_db.reset(db);
	if (rc != SQLITE_OK)
		fail("cannot open '" + m_path + "'", rc);

	sqlite3_busy_timeout(m_db.get(), m_options.busy_timeout_ms);

	initialize();
}


bool SQLiteExecutor::insert_if_absent(const StoredQuadruple& q)
{
	TransactionScope<SQLiteExecutor> tx(*this);

	auto stmt = prepare(INSERT_SQL);
	bind_row(stmt, q);
	step(stmt, "insert");
	const bool added = (sqlite3_changes(m_db.get()) == 1);

	tx.commit();
	return added;
}


size_t SQLiteExecutor::insert_batch_if_absent(const std::vector<StoredQuadruple>& qs)
{
	TransactionScope<SQLiteExecutor> tx(*this);

	auto stmt = prepare(INSERT_SQL);
	size_t add_count = 0;
	for (const auto& q : qs)
	{
		sqlite3_reset(stmt.get());
		sqlite3_clear_bindings(stmt.get());
		bind_row(stmt, q);
		step(stmt, "batch insert");
		add_count += static_cast<size_t>(sqlite3_changes(m_db.get()));
	}

	tx.commit();
	return add_count;
}


size_t SQLiteExecutor::delete_by_id(QuadrupleId id)
{
	TransactionScope<SQLiteExecutor> tx(*this);

	auto stmt = prepare("DELETE FROM Quadruples WHERE QuadrupleID = ?");
	bind(stmt, 1, id);
	step(stmt, "delete");
	const auto deleted = static_cast<size_t>(sqlite3_changes(m_db.get()));

	tx.commit();
	return deleted;
}


size_t SQLiteExecutor::delete_by_predicates(const LookupDescriptor& lookup)
{
	check_lookup(lookup);

	TransactionScope<SQLiteExecutor> tx(*this);

	auto stmt = prepare("DELETE FROM Quadruples" + where_clause(lookup));
	bind_lookup(stmt, lookup);
	step(stmt, "delete");
	const auto deleted = static_cast<size_t>(sqlite3_changes(m_db.get()));

	tx.commit();
	return deleted;
}


size_t SQLiteExecutor::delete_all()
{
	TransactionScope<SQLiteExecutor> tx(*this);

	auto stmt = prepare("DELETE FROM Quadruples");
	step(stmt, "clear");
	const auto deleted = static_cast<size_t>(sqlite3_changes(m_db.get()));

	tx.commit();
	return deleted;
}


bool SQLiteExecutor::exists_by_id(QuadrupleId id)
{
	auto stmt = prepare("SELECT EXISTS(SELECT 1 FROM Quadruples WHERE QuadrupleID = ?)");
	bind(stmt, 1, id);
	if (!step(stmt, "exists"))
		fail("exists query returned no row", SQLITE_ERROR);
	return sqlite3_column_int64(stmt.get(), 0) != 0;
}


std::unique_ptr<IRowIterator> SQLiteExecutor::select_by_predicates(const LookupDescriptor& lookup)
{
	check_lookup(lookup);

	auto stmt = prepare(SELECT_SQL + where_clause(lookup));
	bind_lookup(stmt, lookup);

	std::vector<QuadrupleRow> rows;
	while (step(stmt, "select"))
	{
		rows.push_back(QuadrupleRow{
			column_flavor(stmt.get(), 0),
			column_text(stmt.get(), 1),
			column_text(stmt.get(), 2),
			column_text(stmt.get(), 3),
			column_text(stmt.get(), 4)
			});
	}

	return std::make_unique<SnapshotRowIterator>(std::move(rows));
}


size_t SQLiteExecutor::count()
{
	auto stmt = prepare("SELECT COUNT(*) FROM Quadruples");
	if (!step(stmt, "count"))
		fail("count query returned no row", SQLITE_ERROR);
	return static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0));
}


void SQLiteExecutor::optimize()
{
	// VACUUM cannot run inside a transaction
	exec("VACUUM;");
}


void SQLiteExecutor::begin_transaction()
{
	// a transaction left open by a failed rollback is abandoned first
	if (sqlite3_get_autocommit(m_db.get()) == 0)
		exec("ROLLBACK;");

	exec("BEGIN IMMEDIATE;");
}


void SQLiteExecutor::commit_transaction()
{
	exec("COMMIT;");
}


void SQLiteExecutor::rollback_transaction()
{
	// some errors make SQLite roll back by itself
	if (sqlite3_get_autocommit(m_db.get()) != 0)
		return;

	/*
	* This runs while another error unwinds, so a failed ROLLBACK
	* cannot be reported here. The connection is then left inside
	* the open transaction, holding its write lock, until the next
	* `begin_transaction` rolls it back (or fails to, and throws).
	*/
	if (sqlite3_exec(m_db.get(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
		return;
}


void SQLiteExecutor::initialize()
{
	bool exists = false;
	try
	{
		exists = quadruples_table_exists();
	}
	catch (const ExecutorFailure& e)
	{
		// e.g. the file is not a database
		std::throw_with_nested(ExecutorFailure("cannot initialize '" + m_path
			+ "': unable to read the database", e.code()));
	}

	if (exists)
		return;

	if (!m_options.create_if_missing)
		throw ExecutorFailure("cannot initialize '" + m_path
			+ "': table Quadruples not found");

	TransactionScope<SQLiteExecutor> tx(*this);
	exec(CREATE_SCHEMA_SQL);
	tx.commit();
}


bool SQLiteExecutor::quadruples_table_exists()
{
	auto stmt = prepare("SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name='Quadruples'");
	if (!step(stmt, "diagnostics"))
		fail("diagnostics query returned no row", SQLITE_ERROR);
	return sqlite3_column_int64(stmt.get(), 0) > 0;
}


SQLiteExecutor::Statement SQLiteExecutor::prepare(const std::string& sql)
{
	sqlite3_stmt* raw = nullptr;
	const int rc = sqlite3_prepare_v2(m_db.get(), sql.c_str(), -1, &raw, nullptr);
	Statement stmt(raw);
	if (rc != SQLITE_OK)
		fail("cannot prepare '" + sql + "'", rc);
	return stmt;
}


void SQLiteExecutor::exec(const char* sql)
{
	char* err = nullptr;
	const int rc = sqlite3_exec(m_db.get(), sql, nullptr, nullptr, &err);
	if (rc != SQLITE_OK)
	{
		const std::string msg = (err != nullptr) ? err : sqlite3_errstr(rc);
		sqlite3_free(err);
		throw ExecutorFailure(std::string(sql) + " failed: " + msg, rc);
	}
}


bool SQLiteExecutor::step(const Statement& stmt, const char* what)
{
	const int rc = sqlite3_step(stmt.get());
	if (rc == SQLITE_ROW)
		return true;
	if (rc == SQLITE_DONE)
		return false;
	fail(std::string(what) + " failed", rc);
}


void SQLiteExecutor::bind(const Statement& stmt, int idx, std::int64_t value)
{
	const int rc = sqlite3_bind_int64(stmt.get(), idx, static_cast<sqlite3_int64>(value));
	if (rc != SQLITE_OK)
		fail("cannot bind parameter " + std::to_string(idx), rc);
}


void SQLiteExecutor::bind(const Statement& stmt, int idx, const std::string& value)
{
	const int rc = sqlite3_bind_text(stmt.get(), idx, value.c_str(),
		static_cast<int>(value.size()), SQLITE_TRANSIENT);
	if (rc != SQLITE_OK)
		fail("cannot bind parameter " + std::to_string(idx), rc);
}


void SQLiteExecutor::bind_lookup(const Statement& stmt, const LookupDescriptor& lookup)
{
	int idx = 1;
	for (const auto& p : lookup.conjunction)
		bind(stmt, idx++, p.value);
}


void SQLiteExecutor::bind_row(const Statement& stmt, const StoredQuadruple& q)
{
	bind(stmt, 1, q.id);
	bind(stmt, 2, static_cast<std::int64_t>(q.flavor));
	bind(stmt, 3, q.ctx);
	bind(stmt, 4, q.ctx_key);
	bind(stmt, 5, q.sub);
	bind(stmt, 6, q.sub_key);
	bind(stmt, 7, q.pred);
	bind(stmt, 8, q.pred_key);
	bind(stmt, 9, q.obj);
	bind(stmt, 10, q.obj_key);
}


void SQLiteExecutor::fail(const std::string& what, int rc) const
{
	throw ExecutorFailure(what + ": " + sqlite3_errmsg(m_db.get()), rc);
}


}  // namespace qstore
