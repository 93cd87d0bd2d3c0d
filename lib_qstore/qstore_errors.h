#ifndef QSTORE_ERRORS_H
#define QSTORE_ERRORS_H


#include <string>
#include <optional>
#include <stdexcept>


namespace qstore
{


/*
* Base of every error the library reports to its callers.
*/
class QStoreError :
	public std::runtime_error
{
public:
	explicit QStoreError(const std::string& what) :
		std::runtime_error(what)
	{ }
};


/*
* A required term is missing where an operation demands a
* fully-bound quadruple.
*/
class InvalidArgument :
	public QStoreError
{
public:
	explicit InvalidArgument(const std::string& what) :
		QStoreError("Invalid argument: " + what)
	{ }
};


/*
* The kind of an object (resource or literal) could not be
* determined, or a lookup touches the object column without
* constraining the flavor column.
*/
class AmbiguousObjectFlavor :
	public QStoreError
{
public:
	explicit AmbiguousObjectFlavor(const std::string& what) :
		QStoreError("Ambiguous object flavor: " + what)
	{ }
};


/*
* Anything which went wrong inside an executor. When the
* failure came from a foreign exception, that exception is
* available through `std::rethrow_if_nested`.
* The executor has rolled back before this is thrown.
*/
class ExecutorFailure :
	public QStoreError
{
public:
	explicit ExecutorFailure(const std::string& what,
		std::optional<int> code = std::nullopt) :
		QStoreError("Executor failure: " + what),
		m_code(code)
	{ }

	// backend-specific error code, if the backend has one
	std::optional<int> code() const { return m_code; }

private:
	std::optional<int> m_code;
};


}  // namespace qstore


#endif  // QSTORE_ERRORS_H
