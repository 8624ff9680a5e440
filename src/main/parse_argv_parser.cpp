#include "./parse.h"

namespace hornet
{

namespace parse
{


const std::set<string_t> argv_parser_t::ACCEPTABLE_MODES
{
	"forward", "f",
	"backward", "b",
	"rules", "r",
};


const std::list<argv_parser_t::option_t> argv_parser_t::ACCEPTABLE_OPTS
{
	{ "-f", "PATH", "Path of the rule file for forward diagnosis.",  "built-in rules" },
	{ "-b", "PATH", "Path of the rule file for backward diagnosis.", "built-in rules" },
	{ "-c", "PATH", "Path of the setting file.",                     ""               },
	{ "-o", "PATH", "Path of the output file.",                      "stdout"         },
	{ "-v", "NUM",  "Verbosity of logging, from 0 to 5.",            "0"              },
	{ "-h", "",     "Print help.",                                   ""               },
	{ "--facts", "ATOMS", "Facts separated with commas.",            ""               },
	{ "--goal",  "ATOM",  "The goal of backward diagnosis.",         ""               },
};


string_t argv_parser_t::help()
{
	std::list<string_t> strs
	{
		"hornet MODE [OPTIONS] [INPUTS]",
		"",
		"MODE:",
		"\tforward, f :: Derives every fact reachable from observations and lists faults.",
		"\tbackward, b :: Proves the goal of each problem from its observations.",
		"\trules, r :: Prints rule sets in use.",
		"",
		"INPUTS:",
		"\tFiles of problems. Problems are read from stdin if no file is given",
		"\tand neither --facts nor --goal is given.",
		"",
		"OPTIONS:"
	};

	// GENERATE DESCRIPTIONS OF OPTIONS
	for (const auto &opt : ACCEPTABLE_OPTS)
	{
		string_t s = "\t" + opt.name;
		if (not opt.arg.empty())
		{
			if (opt.name.startswith("--"))
				s += "=" + opt.arg;
			else
				s += " " + opt.arg;
		}

		s += " :: " + opt.help;

		if (not opt.def.empty())
			s += " (default: " + opt.def + ")";

		strs.push_back(s);
	}

	return join(strs.begin(), strs.end(), "\n");
}


const argv_parser_t::option_t* argv_parser_t::find_opt(const string_t &name)
{
	for (const auto &opt : ACCEPTABLE_OPTS)
		if (name == opt.name)
			return &opt;

	throw exception_t(format("unknown option \"%s\"", name.c_str()), true);
}


argv_parser_t::argv_parser_t(int argc, char *argv[])
{
	if (argc <= 1)
		throw exception_t("no mode is given", true);

	m_mode.assign(argv[1]);
	if (ACCEPTABLE_MODES.count(m_mode) == 0)
	{
		if (m_mode == "-h" or m_mode == "--help")
			throw exception_t("", true);
		else
			throw exception_t(format("unknown mode \"%s\"", m_mode.c_str()), true);
	}

	const option_t *prev = nullptr;
	bool do_get_input = false;

	auto parse_short_opt = [&](const string_t &arg)
	{
		bool can_take_arg = (arg.length() == 2);
		for (auto c : arg.substr(1))
		{
			const auto *opt = find_opt(format("-%c", c));
			if (opt->do_take_arg())
			{
				if (not can_take_arg)
					throw exception_t(format("option \"-%c\" takes argument", c), true);
				else
					prev = opt;
			}
			else
				add_opt(format("-%c", c), "");
		}
	};

	auto parse_long_opt = [&](const string_t &arg)
	{
		auto idx = arg.find('=');
		string_t name, value;

		if (idx == std::string::npos)
		{
			name = arg;
			value = "";
		}
		else
		{
			name = arg.substr(0, idx);
			value = arg.substr(idx + 1);
		}

		find_opt(name);
		add_opt(name, value);
	};

	for (int i = 2; i < argc; ++i)
	{
		string_t arg(argv[i]);

		// GET INPUT
		if (do_get_input)
			m_inputs.push_back(arg);

		// GET OPTION
		else if (prev == nullptr)
		{
			// LONG OPTION
			if (arg.startswith("--"))
				parse_long_opt(arg);

			// SHORT OPTION
			else if (arg.startswith("-") and arg.length() > 1)
				parse_short_opt(arg);

			// STARTS GETTING INPUTS
			else
			{
				do_get_input = true;
				m_inputs.push_back(arg);
			}
		}

		// GET ARGUMENT OF PREVIOUS OPTION
		else
		{
			add_opt(prev->name, arg);
			prev = nullptr;
		}
	}

	if (prev != nullptr)
		throw exception_t(format("option \"%s\" takes argument", prev->name.c_str()), true);
}


void argv_parser_t::add_opt(const string_t &n, const string_t &v)
{
	m_opts.push_back(std::make_pair(n, v));
}


}

}
