#include "./parse.h"

namespace hornet
{

namespace parse
{



input_parser_t::input_parser_t(std::istream *is)
	: m_stream(is)
{}


input_parser_t::input_parser_t(const filepath_t &path)
	: m_stream(path)
{}


bool input_parser_t::eof()
{
	m_stream.skip();
	return m_stream.eof();
}


void input_parser_t::read()
{
	m_rule.reset();
	m_problem.reset();

	auto expect = [&](char c)
	{
		if (bad(m_stream.get(is(c))))
			throw m_stream.exception(format("expected \'%c\'", c));
	};

	auto expects = [&](const string_t &s)
	{
		for (auto c : s)
			if (bad(m_stream.get(is(c))))
				throw m_stream.exception(format("expected \"%s\"", s.c_str()));
	};

	auto read_parameter = [&]() -> string_t
	{
		m_stream.skip();

		if (bad(m_stream.get(is(':'))))
			return "";

		m_stream.skip();
		string_t p = m_stream.read(parameter);

		if (p.empty())
			throw m_stream.exception("expected a parameter after \':\'");

		if (quotation_mark(p.front()))
			p = p.slice(1, p.size() - 1);

		return p;
	};

	/** A function to parse conjunctions of atoms, like `a ^ b ^ c`.
	 *  Stops reading before the first token which is neither an atom nor '^'. */
	auto read_atoms = [&]() -> std::vector<atom_t>
	{
		std::vector<atom_t> out;

		m_stream.skip();
		string_t a = m_stream.read(atom);

		while (not a.empty())
		{
			out.push_back(a);
			m_stream.skip();

			if (bad(m_stream.get(is('^'))))
				break;

			m_stream.skip();
			a = m_stream.read(atom);

			if (a.empty())
				throw m_stream.exception("expected an atom after \'^\'");
		}

		return out;
	};

	/** A function to parse definitions of rules. */
	auto read_rule = [&]() -> kb::rule_t
	{
		kb::rule_t out;

		out.name() = m_stream.read(name);
		if (out.name().empty())
			throw m_stream.exception("expected the name of the rule");

		m_stream.skip();
		expect('{');

		out.antecedents() = read_atoms();
		if (out.antecedents().empty())
			throw m_stream.exception("empty conjunction on left-hand-side");

		m_stream.skip();
		expects("=>");
		m_stream.skip();

		std::vector<atom_t> rhs = read_atoms();
		if (rhs.empty())
			throw m_stream.exception("empty conjunction on right-hand-side");
		if (rhs.size() > 1)
			throw m_stream.exception("a rule must have exactly one consequent");

		out.consequent() = rhs.front();

		m_stream.skip();
		expect('}');

		out.description() = read_parameter();

		return out;
	};

	/** A function to parse problems. */
	auto read_problem = [&]() -> diag::problem_t
	{
		diag::problem_t out;
		bool has_observed(false), has_goal(false);

		out.name() = m_stream.read(name);
		m_stream.skip();
		expect('{');
		m_stream.skip();

		while (bad(m_stream.get(is('}'))))
		{
			string_t key = m_stream.read(many(alpha));

			if (key == "observe" and has_observed)
				throw m_stream.exception("multiple observation");
			else if (key == "prove" and has_goal)
				throw m_stream.exception("multiple goal");

			m_stream.skip();
			expect('{');
			std::vector<atom_t> atoms = read_atoms();
			m_stream.skip();
			expect('}');

			if (key == "observe")
			{
				out.facts().assign(atoms.begin(), atoms.end());
				has_observed = true;
			}
			else if (key == "prove")
			{
				if (atoms.size() != 1)
					throw m_stream.exception("a problem must have exactly one goal");

				out.goal() = atoms.front();
				has_goal = true;
			}
			else
				throw m_stream.exception(
					format("unknown keyword \"%s\" was found", key.c_str()));

			m_stream.skip();

			if (m_stream.eof())
				throw m_stream.exception("expected \'}\'");
		}

		return out;
	};

	m_stream.skip();

	string_t key = m_stream.read(many(alpha)).lower();
	m_stream.skip();

	if (key == "rule")
		m_rule.reset(new kb::rule_t(read_rule()));

	else if (key == "problem")
		m_problem.reset(new diag::problem_t(read_problem()));

	else
		throw m_stream.exception(
			format("unknown keyword \"%s\" was found", key.c_str()));
}



kb::rule_set_t read_rule_set(const filepath_t &path, const string_t &name)
{
	input_parser_t parser(path);
	std::vector<kb::rule_t> rules;

	while (not parser.eof())
	{
		parser.read();

		if (parser.rule())
			rules.push_back(*parser.rule());
		else
			console()->warn_fmt(
				"A problem in the rule file \"%s\" was ignored.", path.c_str());
	}

	return kb::rule_set_t(name, rules);
}


std::vector<diag::problem_t> read_problems(std::istream *is)
{
	input_parser_t parser(is);
	std::vector<diag::problem_t> out;

	while (not parser.eof())
	{
		parser.read();

		if (parser.prob())
		{
			out.push_back(*parser.prob());

			if (out.back().name().empty())
				out.back().name() = format("_problem%lu", static_cast<unsigned long>(out.size()));
		}
		else
			console()->warn_fmt(
				"The rule \"%s\" in an input was ignored.", parser.rule()->name().c_str());
	}

	return out;
}


}

}
