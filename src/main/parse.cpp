#include <functional>
#include <algorithm>

#include "./parse.h"


namespace hornet
{

namespace parse
{


condition_t operator|(const condition_t &c1, const condition_t &c2)
{
	return [=](char ch) { return c1(ch) or c2(ch); };
}

condition_t operator!(const condition_t &c)
{
	return [=](char ch) {return not c(ch); };
}

condition_t is(char t)
{
	return [=](char ch) { return ch == t; };
}

condition_t is(const std::string &ts)
{
	return [=](char ch)
	{
		for (auto t : ts)
			if (ch == t) return true;
		return false;
	};
}

const condition_t lower = [](char ch) { return (ch >= 'a') and (ch <= 'z'); };
const condition_t upper = [](char ch) { return (ch >= 'A') and (ch <= 'Z'); };
const condition_t alpha = lower | upper;
const condition_t space = is(" \t\n\r");
const condition_t quotation_mark = is("\'\"");
const condition_t bracket = is("(){}[]<>");
const condition_t newline = is('\n');
const condition_t bad = [](char ch) { return (ch == -1) or (ch == 0); };
const condition_t is_general = not (bad | space | bracket | quotation_mark | is("#^!|=:,"));


formatter_t operator&(const formatter_t &f1, const formatter_t &f2)
{
	return [=](const std::string &s)
	{
		return static_cast<format_result_e>(std::min<int>(f1(s), f2(s)));
	};
}

formatter_t operator|(const formatter_t &f1, const formatter_t &f2)
{
	return [=](const std::string &s)
	{
		return static_cast<format_result_e>(std::max<int>(f1(s), f2(s)));
	};
}


formatter_t many(const condition_t &c)
{
	return [=](const std::string &str)
	{
		if (str.empty()) return FMT_READING;
		else return c(str.back()) ? FMT_GOOD : FMT_BAD;
	};
}


formatter_t enclosed(char begin, char last)
{
	return [=](const std::string &str)
	{
		if (str.empty()) return FMT_READING;

		auto len = str.length();

		if (bad(str.back())) return FMT_BAD;

		if (str.front() != begin) return FMT_BAD;
		else
		{
			auto i = str.find(last, 1);

			if (i == std::string::npos) return FMT_READING;
			else if (i == len - 1)      return FMT_GOOD;
			else                        return FMT_BAD;
		}
	};
}


const formatter_t quotation = many(not newline) & (enclosed('\'', '\'') | enclosed('\"', '\"'));
const formatter_t general = many(is_general);
const formatter_t parameter = general | quotation;
const formatter_t name = general;
const formatter_t atom = general;


}

}
