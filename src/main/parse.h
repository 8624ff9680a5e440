#pragma once

#include <functional>
#include <list>
#include <memory>
#include <set>

#include "./kb.h"
#include "./diag.h"

namespace hornet
{

namespace parse
{


enum format_result_e
{
	FMT_BAD,
	FMT_READING,
	FMT_GOOD,
};

using condition_t = std::function<bool(char)>;
using formatter_t = std::function<format_result_e(const std::string&)>;

condition_t operator|(const condition_t &c1, const condition_t &c2);
condition_t operator!(const condition_t &c);
condition_t is(char t);
condition_t is(const std::string &ts);

extern const condition_t lower;
extern const condition_t upper;
extern const condition_t alpha;
extern const condition_t space;
extern const condition_t quotation_mark;
extern const condition_t bracket;
extern const condition_t newline;
extern const condition_t bad;
extern const condition_t is_general;

formatter_t operator&(const formatter_t &f1, const formatter_t &f2);
formatter_t operator|(const formatter_t &f1, const formatter_t &f2);
formatter_t many(const condition_t &c);
formatter_t enclosed(char begin, char last);

extern const formatter_t quotation;
extern const formatter_t general;
extern const formatter_t parameter;
extern const formatter_t name;
extern const formatter_t atom;


/** A wrapper class of input-stream. */
class stream_t : public std::unique_ptr<std::istream>
{
public:
	struct position_t
	{
		std::streampos pos;
		size_t row, column;
	};

	/** @param ptr The pointer of an input-stream allocated by `new`. */
	stream_t(std::istream *ptr);
	stream_t(const filepath_t &path);

	/** Reads a character satisfying the condition.
	 *  Returns 0 if the next character does not satisfy it, or -1 on the end of stream. */
	char get(const condition_t&);
	bool peek(const condition_t&) const;

	/** Reads the longest string which the formatter accepts as good.
	 *  If nothing is accepted, returns an empty string and leaves the stream as it was. */
	string_t read(const formatter_t&);

	void ignore(const condition_t&);

	void skip(); /// Skips spaces and comments.

	bool eof() const;

	size_t row() const { return m_row; }
	size_t column() const { return m_column; }

	position_t position() const;
	void restore(const position_t&);

	exception_t exception(const string_t&) const;

private:
	void advance(char c);

	size_t m_row, m_column;
};


/** A class to read definitions of rules and problems.
 *
 *  rule NAME { a1 ^ a2 ^ ... => c } : "description"
 *  problem NAME { observe { f1 ^ f2 ^ ... } prove { goal } }
 */
class input_parser_t
{
public:
	/** @param is The pointer of an input-stream allocated by `new`. */
	input_parser_t(std::istream *is);
	input_parser_t(const filepath_t &path);

	/** Reads one definition. Exactly one of rule() and prob() is set after this. */
	void read();
	bool eof();

	const std::unique_ptr<kb::rule_t>& rule() const { return m_rule; }
	const std::unique_ptr<diag::problem_t>& prob() const { return m_problem; }

private:
	stream_t m_stream;

	std::unique_ptr<kb::rule_t> m_rule;
	std::unique_ptr<diag::problem_t> m_problem;
};


/** Reads every rule in the file into a rule set named `name`.
 *  Problems in the file are ignored with a warning. */
kb::rule_set_t read_rule_set(const filepath_t &path, const string_t &name);

/** Reads every problem in the stream. Rules in the stream are ignored with a warning.
 *  @param is The pointer of an input-stream allocated by `new`. */
std::vector<diag::problem_t> read_problems(std::istream *is);


/** A class to parse command options on LINUX-like way. */
class argv_parser_t
{
public:
	static string_t help();

	argv_parser_t(int argc, char *argv[]);

	const string_t& mode() const { return m_mode; }
	const std::deque<std::pair<string_t, string_t>>& opts() const { return m_opts; }
	const std::deque<string_t>& inputs() const { return m_inputs; }

private:
	struct option_t
	{
		bool do_take_arg() const { return not arg.empty(); }

		string_t name;
		string_t arg;
		string_t help;
		string_t def; /// default value
	};

	static const option_t* find_opt(const string_t &name);

	void add_opt(const string_t &n, const string_t &v);

	static const std::set<string_t> ACCEPTABLE_MODES;
	static const std::list<option_t> ACCEPTABLE_OPTS;

	string_t m_mode;
	std::deque<std::pair<string_t, string_t>> m_opts;
	std::deque<string_t> m_inputs;
};


} // end of parse

} // end of hornet
