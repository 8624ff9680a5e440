#include "./parse.h"

namespace hornet
{

namespace parse
{

stream_t::stream_t(std::istream *is)
	: std::unique_ptr<std::istream>(is), m_row(1), m_column(1)
{}


stream_t::stream_t(const filepath_t &path)
	: m_row(1), m_column(1)
{
	std::unique_ptr<std::ifstream> fin(new std::ifstream(path));

	if (*fin)
		reset(fin.release());
	else
		throw exception_t(format("cannot open \"%s\"", path.c_str()));
}


char stream_t::get(const condition_t &f)
{
	int c = (*this)->peek();

	if (c == std::istream::traits_type::eof())
		return -1;

	if (f(static_cast<char>(c)))
	{
		(*this)->get();
		advance(static_cast<char>(c));
		return static_cast<char>(c);
	}
	else
		return 0;
}


bool stream_t::peek(const condition_t &c) const
{
	int ch = (*this)->peek();
	return (ch != std::istream::traits_type::eof()) and c(static_cast<char>(ch));
}


string_t stream_t::read(const formatter_t &f)
{
	format_result_e past = FMT_READING;
	string_t out;
	position_t pos = position();

	while (true)
	{
		int ch = (*this)->peek();

		if (ch == std::istream::traits_type::eof() or bad(static_cast<char>(ch)))
			break;

		format_result_e res = f(out + static_cast<char>(ch));

		if (res == FMT_BAD)
			break;

		(*this)->get();
		out += static_cast<char>(ch);
		past = res;
	}

	if (past != FMT_GOOD)
	{
		restore(pos);
		return "";
	}

	for (const auto &c : out)
		advance(c);

	return out;
}


void stream_t::ignore(const condition_t &f)
{
	char ch = get(f);

	while (not bad(ch))
		ch = get(f);
}


void stream_t::skip()
{
	while (true)
	{
		ignore(space);

		// A COMMENT CONTINUES TO THE END OF LINE
		if (not bad(get(is('#'))))
			ignore(not newline);
		else
			break;
	}
}


bool stream_t::eof() const
{
	return (*this)->peek() == std::istream::traits_type::eof();
}


stream_t::position_t stream_t::position() const
{
	position_t out;

	// `tellg` FAILS ONCE THE END OF STREAM HAS BEEN REACHED.
	out.pos = (*this)->eof() ? std::streampos(-1) : (*this)->tellg();
	out.row = m_row;
	out.column = m_column;
	return out;
}


void stream_t::restore(const position_t &p)
{
	if (p.pos != std::streampos(-1))
	{
		(*this)->clear();
		(*this)->seekg(p.pos);
	}

	m_row = p.row;
	m_column = p.column;
}


exception_t stream_t::exception(const string_t &str) const
{
	return exception_t(str + format(" at line %lu, column %lu.",
		static_cast<unsigned long>(row()), static_cast<unsigned long>(column())));
}


void stream_t::advance(char c)
{
	if (c == '\n')
	{
		++m_row;
		m_column = 1;
	}
	else
		++m_column;
}


}

}
