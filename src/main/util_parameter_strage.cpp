#include "./util.h"

namespace hornet
{


parameter_strage_t* parameter_strage_t::instance()
{
	static parameter_strage_t instance;
	return &instance;
}


void parameter_strage_t::add(const string_t &key, const string_t &value)
{
	// A LATER SOURCE OVERRIDES AN EARLIER ONE.
	(*this)[key] = value;
}


string_t parameter_strage_t::get(const string_t &key, const string_t &def) const
{
	auto it = find(key);
	return (it == end()) ? def : it->second;
}


int parameter_strage_t::geti(const string_t &key, int def) const
{
	auto it = find(key);
	if (it == end()) return def;

	const std::string &value = it->second;
	size_t len = 0;
	int out = def;

	try
	{
		out = std::stoi(value, &len);
	}
	catch (const std::logic_error&)
	{
		len = 0;
	}

	if (len == 0 or len != value.size())
	{
		console()->warn_fmt(
			"Parameter \"%s\" expects an integer, but \"%s\" was given. The default %d is used.",
			key.c_str(), value.c_str(), def);
		return def;
	}

	return out;
}


bool parameter_strage_t::has(const string_t &key) const
{
	return count(key) > 0;
}


}
