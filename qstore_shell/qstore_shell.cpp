#include <iostream>
#include <fstream>
#include <chrono>
#include <sstream>
#include <memory>
#include "qstore_assert.h"
#include "qstore_errors.h"
#include "qstore_store.h"
#include "qstore_planner.h"
#include "qstore_memory_executor.h"
#include "qstore_sqlite_executor.h"
#include "qstore_command.h"
#include "qstore_nquads.h"


using namespace qstore;


namespace
{


typedef std::chrono::system_clock Clock;


long long elapsed_ms(Clock::time_point start_time)
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(
		Clock::now() - start_time).count();
}


// prints `e`, then every exception nested inside it
void report_error(const std::exception& e, int depth = 0)
{
	std::cerr << std::string(depth, '\t') << "Error: " << e.what() << std::endl;
	try
	{
		std::rethrow_if_nested(e);
	}
	catch (const std::exception& nested)
	{
		report_error(nested, depth + 1);
	}
}


}  // namespace


/*
* This class owns the executor and acts as a visitor to the
* std::variant returned by `parse_command`, leading to a simple
* loop in the `main` function below.
* Each command runs against the store in isolation: a failing
* command is reported, and the shell carries on.
*/
class ShellApplication
{
public:
	ShellApplication(std::unique_ptr<IExecutor> p_exec, bool log_plans) :
		m_exec(std::move(p_exec)),
		m_done(false),
		m_log_plans(log_plans)
	{
		QSTORE_CHECK_PRECOND(m_exec != nullptr);
	}

	void run(const AnyCommand& cmd)
	{
		try
		{
			std::visit(*this, cmd);
		}
		catch (const QStoreError& e)
		{
			report_error(e);
		}
	}

	void operator()(const EmptyCommand&) {}

	void operator()(const BadCommand& e)
	{
		std::cerr << "Bad command. Error: " << e.error << std::endl;
	}

	void operator()(const QuitCommand&)
	{
		std::cout << "Exiting..." << std::endl;
		m_done = true;
	}

	void operator()(const AddCommand& c)
	{
		if (add(*m_exec, c.quad))
			std::cout << "Added." << std::endl;
		else
			std::cout << "Already present." << std::endl;
	}

	void operator()(const RemoveCommand& c)
	{
		std::cout << "Removed " << remove(*m_exec, c.quad) << " quadruples." << std::endl;
	}

	void operator()(const ContainsCommand& c)
	{
		std::cout << (contains(*m_exec, c.quad) ? "true" : "false") << std::endl;
	}

	void operator()(const SelectCommand& c)
	{
		log_plan(c.pattern);

		const auto start_time = Clock::now();
		const QuadrupleSet result = select(*m_exec, c.pattern);

		std::cout << "----------" << std::endl;
		for (const auto& q : result)
			std::cout << to_display_string(q) << std::endl;
		std::cout << "----------" << std::endl;

		std::cout << result.size() << " results obtained in "
			<< elapsed_ms(start_time) << "ms." << std::endl;
	}

	void operator()(const CountCommand& c)
	{
		log_plan(c.pattern);

		const auto start_time = Clock::now();
		const size_t n = select(*m_exec, c.pattern).size();

		std::cout << n << " results obtained in "
			<< elapsed_ms(start_time) << "ms." << std::endl;
	}

	void operator()(const DeleteCommand& c)
	{
		log_plan(c.pattern);
		std::cout << "Removed " << remove_matching(*m_exec, c.pattern)
			<< " quadruples." << std::endl;
	}

	void operator()(const LoadCommand& c)
	{
		const auto start_time = Clock::now();

		std::ifstream file(c.filename, std::ios::binary);
		if (!file)
		{
			std::cerr << "Unfortunately the given file '"
				<< c.filename << "' cannot be opened." << std::endl;
			return;
		}

		const std::vector<Graph> graphs = read_nquads_graphs(file);

		size_t read_count = 0, add_count = 0;
		for (const auto& g : graphs)
		{
			read_count += g.size();
			add_count += merge(*m_exec, &g, c.context);
		}

		std::cout << "Loaded " << add_count << " new quadruples (of "
			<< read_count << " read, in " << graphs.size() << " contexts) in "
			<< elapsed_ms(start_time) << "ms." << std::endl;
	}

	void operator()(const ClearCommand&)
	{
		std::cout << "Removed " << clear(*m_exec) << " quadruples." << std::endl;
	}

	void operator()(const SizeCommand&)
	{
		std::cout << count(*m_exec) << " quadruples." << std::endl;
	}

	void operator()(const OptimizeCommand&)
	{
		const auto start_time = Clock::now();
		optimize(*m_exec);
		std::cout << "Optimized in " << elapsed_ms(start_time) << "ms." << std::endl;
	}

	bool done() const
	{
		return m_done;
	}

private:
	void log_plan(const Pattern& pat) const
	{
		if (!m_log_plans)
			return;

		const LookupDescriptor lookup = compile(pat);
		std::cout << "\t--> case '" << lookup.label << "' via index "
			<< index_type_str(lookup.index) << " with";
		for (const auto& p : lookup.conjunction)
			std::cout << ' ' << column_str(p.column);
		std::cout << std::endl;
	}

private:
	std::unique_ptr<IExecutor> m_exec;
	bool m_done;
	const bool m_log_plans;
};


void show_help()
{
	std::cout << "-h : Print help. If using this option, no other options can be used." << std::endl;
	std::cout << "-L : Show the planned lookup of every pattern command. Good for debugging "
		"performance issues. If used, it must appear before any -d, -i or -f options." << std::endl;
	std::cout << "-d path : Store quadruples in the SQLite database at `path`, creating it "
		"if necessary. If used, it must appear before any -i or -f options. Without it, "
		"quadruples are kept in memory and lost on exit." << std::endl;
	std::cout << "-i commands : Execute command(s)." << std::endl;
	std::cout << "-f filename : Execute command(s) from file." << std::endl;
	std::cout << "Using either -i or -f will open the application in non-interactive "
		"mode, and the application will exit automatically after running all "
		"given commands. Not using -i or -f will open the application in interactive "
		"mode, where you can type what you want, and have to manually close with `QUIT`." << std::endl;
}


int main(int argc, char* argv[])
{
	if (argc == 2 && std::string(argv[1]) == "-h")
	{
		show_help();
		return 0;
	}

	int arg_idx = 1;

	const bool log_plans = (arg_idx < argc && std::string(argv[arg_idx]) == "-L");
	if (log_plans)
		++arg_idx;

	std::optional<std::string> db_path;
	if (arg_idx + 1 < argc && std::string(argv[arg_idx]) == "-d")
	{
		db_path = argv[arg_idx + 1];
		arg_idx += 2;
	}

	std::unique_ptr<IExecutor> p_exec;
	try
	{
		if (db_path)
			p_exec = std::make_unique<SQLiteExecutor>(*db_path);
		else
			p_exec = std::make_unique<MemoryExecutor>();
	}
	catch (const QStoreError& e)
	{
		report_error(e);
		return 1;
	}

	ShellApplication app(std::move(p_exec), log_plans);

	if ((argc - arg_idx) % 2 != 0)
	{
		std::cerr << "Option '" << argv[argc - 1] << "' is missing its argument. Showing help."
			<< std::endl;
		show_help();
		return 1;
	}

	const int num_commands = (argc - arg_idx) / 2;

	if (num_commands > 0)  // noninteractive mode
	{
		for (int i = 0; i < num_commands && !app.done(); ++i)
		{
			std::string cmd = argv[2 * i + arg_idx];
			std::string arg = argv[2 * i + arg_idx + 1];
			if (cmd == "-i")
			{
				std::stringstream cmd_in(arg);
				while (!app.done() && cmd_in)
				{
					app.run(parse_command(cmd_in));
				}
			}
			else if (cmd == "-f")
			{
				std::ifstream cmd_in(arg, std::ios::binary);
				if (!cmd_in)
				{
					std::cerr << "Cannot open file '" << arg << "'." << std::endl;
					return 1;
				}
				while (!app.done() && cmd_in)
				{
					app.run(parse_command(cmd_in));
				}
			}
			else
			{
				std::cerr << "Bad option '" << cmd
					<< "', must either be '-i' or '-f'. Showing help."
					<< std::endl;
				show_help();
				return 1;
			}
		}
	}
	else  // interactive mode
	{
		while (!app.done() && std::cin)
		{
			app.run(parse_command(std::cin));
		}
	}

	return 0;
}
