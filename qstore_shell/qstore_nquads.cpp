#include <map>
#include <sstream>
#include "qstore_nquads.h"
#include "qstore_parse_helper.h"
#include "qstore_errors.h"
#include "qstore_assert.h"


namespace qstore
{


NQuadsParser::NQuadsParser(std::istream& in) :
	m_in(in),
	m_eof(true),
	m_line_no(0)
{ }


void NQuadsParser::start()
{
	// seek to beginning
	m_in.clear();
	m_in.seekg(0);

	m_eof = false;
	m_error.clear();
	m_line_no = 0;

	read_statement();
}


NQuadsStatement NQuadsParser::current() const
{
	QSTORE_CHECK_PRECOND(valid());
	return m_current;
}


void NQuadsParser::next()
{
	QSTORE_CHECK_PRECOND(valid());
	read_statement();
}


bool NQuadsParser::valid() const
{
	return !m_eof && !failed();
}


void NQuadsParser::read_statement()
{
	std::string line;
	while (std::getline(m_in, line))
	{
		++m_line_no;

		std::istringstream line_in(line);
		char c;
		if (!next_nonws_char(c, line_in) || c == '#')
			continue;
		line_in.unget();

		parse_line(line_in);
		return;
	}

	m_eof = true;
}


void NQuadsParser::parse_line(std::istream& line)
{
	auto sub = parse_iri(line);
	if (!sub)
	{
		set_error("subject");
		return;
	}

	auto pred = parse_iri(line);
	if (!pred)
	{
		set_error("predicate");
		return;
	}

	auto obj = parse_term(line);
	if (!obj)
	{
		set_error("object");
		return;
	}

	m_current.triple = Triple{ std::move(*sub), std::move(*pred), std::move(*obj) };
	m_current.context.reset();

	char c;
	if (!next_nonws_char(c, line))
	{
		set_error("statement delimiter");
		return;
	}

	if (c == '<')
	{
		line.unget();
		m_current.context = parse_iri(line);
		if (!m_current.context)
		{
			set_error("context");
			return;
		}

		if (!next_nonws_char(c, line))
		{
			set_error("statement delimiter");
			return;
		}
	}

	if (c != '.')
	{
		set_error("statement delimiter");
		return;
	}
}


void NQuadsParser::set_error(const char* what_is_invalid)
{
	m_error = std::string("invalid ") + what_is_invalid
		+ " on line " + std::to_string(m_line_no);
}


std::vector<Graph> read_nquads_graphs(std::istream& in)
{
	std::vector<Graph> graphs;
	std::optional<size_t> unnamed_idx;
	std::map<IRI, size_t> named_idx;

	NQuadsParser parser(in);
	parser.start();
	while (parser.valid())
	{
		NQuadsStatement st = parser.current();

		size_t idx;
		if (!st.context)
		{
			if (!unnamed_idx)
			{
				unnamed_idx = graphs.size();
				graphs.emplace_back();
			}
			idx = *unnamed_idx;
		}
		else
		{
			auto iter = named_idx.find(*st.context);
			if (iter == named_idx.end())
			{
				iter = named_idx.emplace(*st.context, graphs.size()).first;
				graphs.emplace_back(*st.context);
			}
			idx = iter->second;
		}

		graphs[idx].add(std::move(st.triple));
		parser.next();
	}

	if (parser.failed())
		throw QStoreError("cannot load: " + parser.error());

	return graphs;
}


}  // namespace qstore
