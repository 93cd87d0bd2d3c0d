#ifndef QSTORE_COMMAND_H
#define QSTORE_COMMAND_H


#include <string>
#include <variant>
#include <optional>
#include <istream>
#include "qstore_types.h"
#include "qstore_quadruple.h"
#include "qstore_pattern.h"


namespace qstore
{


struct BadCommand
{
	BadCommand(std::string e) :
		error(std::move(e))
	{ }
	std::string error;
};


// commands on one fully bound quadruple
struct AddCommand { Quadruple quad; };
struct RemoveCommand { Quadruple quad; };
struct ContainsCommand { Quadruple quad; };


// commands on a pattern, in which `?x` stands for any term
struct SelectCommand { Pattern pattern; };
struct CountCommand { Pattern pattern; };
struct DeleteCommand { Pattern pattern; };  // never the empty pattern


struct LoadCommand
{
	std::string filename;
	std::optional<IRI> context;  // for triples which carry none
};


struct ClearCommand {};
struct SizeCommand {};
struct OptimizeCommand {};
struct QuitCommand {};
struct EmptyCommand {};


typedef std::variant<
	BadCommand,
	AddCommand, RemoveCommand, ContainsCommand,
	SelectCommand, CountCommand, DeleteCommand,
	LoadCommand, ClearCommand, SizeCommand, OptimizeCommand,
	QuitCommand, EmptyCommand
> AnyCommand;


/*
* Read a single command from the given input stream, which
* may contain zero, one, or multiple commands. In the case
* of any error `BadCommand` is returned. In case of no command
* at all, `EmptyCommand` is returned.
* In all other cases, the foremost command in the stream is
* read and returned.
*/
AnyCommand parse_command(std::istream& in);


}  // namespace qstore


#endif  // QSTORE_COMMAND_H
