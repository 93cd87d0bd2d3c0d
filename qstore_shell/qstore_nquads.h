#ifndef QSTORE_NQUADS_H
#define QSTORE_NQUADS_H


#include <string>
#include <vector>
#include <memory>
#include <istream>
#include <optional>
#include "qstore_iterator.h"
#include "qstore_quadruple_set.h"


namespace qstore
{


/*
* One line of an N-Triples or N-Quads file. `context` is the
* optional fourth term.
*/
struct NQuadsStatement
{
	Triple triple;
	std::optional<IRI> context;
};


/*
* Reads N-Triples / N-Quads statements, one per line, from the
* given input stream. Blank lines and `#` comments are skipped.
* Blank nodes are not supported.
* The stream must be kept alive for the entire lifetime of this
* iterator, must be seekable, and should not be used by anyone
* else in the meantime.
*
* Behaviour on errors:
* If a line cannot be parsed, parsing stops immediately and the
* iterator becomes invalid, with `failed()` returning true and
* `error()` describing the problem. Restarting clears the error.
*/
class NQuadsParser :
	public IIterator<NQuadsStatement>
{
public:
	NQuadsParser(std::istream& in);

	void start() override;
	NQuadsStatement current() const override;
	void next() override;
	bool valid() const override;

	bool failed() const { return !m_error.empty(); }
	const std::string& error() const { return m_error; }

private:
	// reads the next statement, or sets an error, or reaches EOF
	void read_statement();
	void parse_line(std::istream& line);
	void set_error(const char* what_is_invalid);

private:
	// reference must remain valid while this iterator
	// lives
	std::istream& m_in;
	bool m_eof;
	std::string m_error;
	size_t m_line_no;
	NQuadsStatement m_current;
};


/*
* Read every statement of `in`, grouped into one graph per
* context, in order of first appearance. Triples without a
* context go into a graph without one.
* Throws `QStoreError` if any line cannot be parsed, so that a
* corrupt file is never half loaded.
*/
std::vector<Graph> read_nquads_graphs(std::istream& in);


}  // namespace qstore


#endif  // QSTORE_NQUADS_H
