#include <fstream>
#include <algorithm>

#include "./binary.h"
#include "./parse.h"


namespace hornet
{

namespace bin
{


namespace
{

const std::list<string_t> KNOWN_OPTIONS
{ "-f", "-b", "-c", "-o", "-v", "-h", "--facts", "--goal" };


execution_mode_e str2mode(const string_t &s)
{
	if (s == "forward" or s == "f")  return EXE_MODE_FORWARD;
	if (s == "backward" or s == "b") return EXE_MODE_BACKWARD;
	if (s == "rules" or s == "r")    return EXE_MODE_RULES;
	return EXE_MODE_UNSPECIFIED;
}


string_t mode2str(execution_mode_e m)
{
	switch (m)
	{
	case EXE_MODE_FORWARD:  return "forward";
	case EXE_MODE_BACKWARD: return "backward";
	case EXE_MODE_RULES:    return "rules";
	default:                return "unspecified";
	}
}


kb::rule_set_t load_rules(const filepath_t &path, const string_t &name, kb::rule_set_t (*builtin)())
{
	if (path.empty())
		return builtin();

	console()->print_fmt("Loading %s rules from \"%s\" ...", name.c_str(), path.c_str());

	kb::rule_set_t out = parse::read_rule_set(path, name);

	console()->print_fmt("    # of rules: %lu", static_cast<unsigned long>(out.size()));
	return out;
}

}


execution_configure_t::execution_configure_t()
	: mode(EXE_MODE_UNSPECIFIED), has_inline_problem(false)
{}


void prepare(int argc, char* argv[], execution_configure_t *config, inputs_t *inputs)
{
	parse::argv_parser_t argv_parser(argc, argv);

	config->mode = str2mode(argv_parser.mode());

	// THE SETTING FILE IS READ FIRST, SO THAT THE COMMAND LINE OVERRIDES IT.
	for (const auto &p : argv_parser.opts())
		if (p.first == "-c")
			load_setting_file(p.second, inputs);

	for (const auto &p : argv_parser.opts())
	{
		if (p.first == "-h")
			throw exception_t("", true);

		if (p.first != "-c")
			param()->add(p.first, p.second);
	}

	for (const auto &s : argv_parser.inputs())
		inputs->push_back(s);

	console()->verbosity() = param()->geti("-v", NOT_VERBOSE);
	config->forward_rules_path = param()->get("-f");
	config->backward_rules_path = param()->get("-b");
	config->output_path = param()->get("-o");

	if (param()->has("--facts") or param()->has("--goal"))
	{
		config->has_inline_problem = true;
		config->inline_problem.name() = "_inline";
		config->inline_problem.goal() = param()->get("--goal");

		for (const auto &f : param()->get("--facts").split(","))
			config->inline_problem.facts().push_back(f);
	}
}


void load_setting_file(const filepath_t &path, inputs_t *inputs)
{
	std::ifstream fin(path);

	if (not fin)
		throw exception_t(format("cannot open setting file \"%s\"", path.c_str()));

	console()->print_fmt("Loading setting file \"%s\"", path.c_str());

	std::string line;
	while (std::getline(fin, line))
	{
		string_t sline = string_t(line).strip(" \t\r\n");

		if (sline.empty() or sline.startswith("#")) continue; // COMMENT

		if (not sline.startswith("-"))
		{
			inputs->push_back(sline);
			continue;
		}

		string_t key, value;

		if (sline.startswith("--"))
		{
			auto idx = sline.find('=');
			key = (idx == std::string::npos) ? sline : string_t(sline.substr(0, idx));
			value = (idx == std::string::npos) ? "" : string_t(sline.substr(idx + 1));
		}
		else
		{
			auto spl = sline.split(" \t", 1);
			key = spl.at(0);
			value = (spl.size() <= 1) ? "" : spl.at(1).strip(" \t");
		}

		if (std::find(KNOWN_OPTIONS.begin(), KNOWN_OPTIONS.end(), key) == KNOWN_OPTIONS.end())
		{
			console()->warn_fmt("Unknown option \"%s\" in the setting file was ignored.", key.c_str());
			continue;
		}

		if (key == "-c")
			throw exception_t("setting files cannot be nested");

		param()->add(key, value);
	}
}


void execute(const execution_configure_t &config, const inputs_t &inputs)
{
	kb::rule_set_t forward_rules =
		load_rules(config.forward_rules_path, "forward", kb::sample_forward_rules);
	kb::rule_set_t backward_rules =
		load_rules(config.backward_rules_path, "backward", kb::sample_backward_rules);
	diag::diagnoser_t diagnoser(forward_rules, backward_rules);

	std::unique_ptr<std::ofstream> fout;
	std::ostream *os = &std::cout;

	if (not config.output_path.empty())
	{
		fout.reset(new std::ofstream(config.output_path));
		if (not *fout)
			throw exception_t(format("cannot open \"%s\"", config.output_path.c_str()));
		os = fout.get();
	}

	(*os) << "<hornet mode=\"" << mode2str(config.mode)
		<< "\" time-stamp=\"" << INIT_TIME.string() << "\">" << std::endl;

	if (config.mode == EXE_MODE_RULES)
		diag::to_xml(diagnoser.describe_rules()).print(os);
	else
	{
		std::vector<diag::problem_t> problems;

		console()->print("Loading problems ...");

		if (config.has_inline_problem)
			problems.push_back(config.inline_problem);

		for (const auto &path : inputs)
		{
			if (not path.find_file())
				throw exception_t(format("cannot open \"%s\"", path.c_str()));

			auto probs = parse::read_problems(new std::ifstream(path));
			problems.insert(problems.end(), probs.begin(), probs.end());
		}

		if (inputs.empty() and not config.has_inline_problem)
			problems = parse::read_problems(new std::istream(std::cin.rdbuf()));

		console()->print_fmt("    # of problems: %lu", static_cast<unsigned long>(problems.size()));

		diagnose(diagnoser, config.mode, problems, os);
	}

	(*os) << "</hornet>" << std::endl;
}


void diagnose(
	const diag::diagnoser_t &diagnoser, execution_mode_e mode,
	const std::vector<diag::problem_t> &problems, std::ostream *os)
{
	for (const auto &prob : problems)
	{
		IF_VERBOSE_1(console()->print_fmt("Problem: %s", prob.name().c_str()));
		IF_VERBOSE_1(console()->add_indent());

		time_watcher_t watch;

		try
		{
			xml_element_t elem = (mode == EXE_MODE_BACKWARD) ?
				diag::to_xml(diagnoser.backward_diagnose(prob.facts(), prob.goal())) :
				diag::to_xml(diagnoser.forward_diagnose(prob.facts()));

			elem.add_attribute("name", prob.name());
			elem.add_attribute("time", format("%.3f", watch.duration()));
			elem.print(os);

			PRINT_VERBOSE_1(format("done in %.3f seconds", watch.duration()));
		}
		catch (const exception_t &e)
		{
			console()->warn_fmt(
				"The problem \"%s\" was skipped: %s", prob.name().c_str(), e.what());
		}

		IF_VERBOSE_1(console()->sub_indent());
	}
}


void print_usage()
{
	std::cerr << parse::argv_parser_t::help() << std::endl;
}


}

}
