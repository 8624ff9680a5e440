/* -*- coding: utf-8 -*- */


#include "./util.h"
#include <cstdarg>
#include <ctime>


namespace hornet
{


duration_time_t time_watcher_t::duration() const
{
	auto now = std::chrono::system_clock::now();
	auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - m_begin);

	return duration.count() / 1000.0f;
}


time_point_t::time_point_t()
{
#ifdef _WIN32
	time_t t;
	struct tm ltm;
	time(&t);
	localtime_s(&ltm, &t);

	year = 1900 + ltm.tm_year;
	month = 1 + ltm.tm_mon;
	day = ltm.tm_mday;
	hour = ltm.tm_hour;
	min = ltm.tm_min;
	sec = ltm.tm_sec;
#else
	time_t t;
	tm ltm;
	time(&t);
	localtime_r(&t, &ltm);

	year = 1900 + ltm.tm_year;
	month = 1 + ltm.tm_mon;
	day = ltm.tm_mday;
	hour = ltm.tm_hour;
	min = ltm.tm_min;
	sec = ltm.tm_sec;
#endif
}


string_t time_point_t::string() const
{
	return format("%04d/%02d/%02d %02d:%02d:%02d", year, month, day, hour, min, sec);
}


const time_point_t INIT_TIME;


xml_element_t& xml_element_t::add_attribute(const std::string &key, const std::string &val)
{
	for (auto &p : m_attr)
	{
		if (p.first == key)
		{
			p.second = val;
			return *this;
		}
	}

	m_attr.push_back(std::make_pair(key, val));
	return *this;
}


xml_element_t& xml_element_t::add_child(const xml_element_t &elem)
{
	m_children.push_back(elem);
	return m_children.back();
}


const std::string* xml_element_t::find_attribute(const std::string &key) const
{
	for (const auto &p : m_attr)
		if (p.first == key)
			return &p.second;

	return nullptr;
}


void xml_element_t::print(std::ostream *os) const
{
	std::function<void(const xml_element_t&, int)>
		elem_to_string = [&](const xml_element_t &e, int depth) -> void
	{
		std::string indent(depth * 2, ' ');

		(*os) << indent << "<" << e.name();
		for (const auto &p : e.attributes())
			(*os) << " " << p.first << "=\"" << escape_xml(p.second) << "\"";

		if (e.text().empty() and e.children().empty())
		{
			(*os) << "/>" << std::endl;
			return;
		}

		(*os) << ">";

		if (e.children().empty())
		{
			(*os) << escape_xml(e.text()) << "</" << e.name() << ">" << std::endl;
			return;
		}

		(*os) << std::endl;

		if (not e.text().empty())
			(*os) << indent << "  " << escape_xml(e.text()) << std::endl;

		for (const auto &c : e.children())
			elem_to_string(c, depth + 1);

		(*os) << indent << "</" << e.name() << ">" << std::endl;
	};

	elem_to_string(*this, 0);
}


std::string format(const char *format, ...)
{
	static const int SIZE = 256 * 256;
	std::vector<char> buffer(SIZE, '\0');

	va_list arg;
	va_start(arg, format);
	vsnprintf(&buffer[0], SIZE, format, arg);
	va_end(arg);

	return std::string(&buffer[0]);
}


std::string escape_xml(const std::string &str)
{
	std::string out;
	out.reserve(str.size());

	for (auto c : str)
	{
		switch (c)
		{
		case '&':  out += "&amp;"; break;
		case '<':  out += "&lt;"; break;
		case '>':  out += "&gt;"; break;
		case '\"': out += "&quot;"; break;
		case '\'': out += "&apos;"; break;
		default:   out += c; break;
		}
	}

	return out;
}


} // end of hornet
