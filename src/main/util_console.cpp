#include "./util.h"
#include <algorithm>
#include <cstdarg>


namespace hornet
{

std::mutex console_t::ms_mutex;
thread_local int console_t::ms_indent = 0;


console_t* console_t::instance()
{
	static console_t instance;
	return &instance;
}


void console_t::print(const std::string &str) const
{
	std::lock_guard<std::mutex> lock(ms_mutex);
	std::cerr << time_stamp() << indent() << str << std::endl;
}


void console_t::error(const std::string &str) const
{
	std::lock_guard<std::mutex> lock(ms_mutex);

#ifdef _WIN32
	std::cerr << " * ERROR * ";
#else
	std::cerr << "\33[0;41m * ERROR * \33[0m";
#endif

	std::cerr << str << std::endl;
}


void console_t::warn(const std::string &str) const
{
	std::lock_guard<std::mutex> lock(ms_mutex);

#ifdef _WIN32
	std::cerr << " * WARNING * ";
#else
	std::cerr << "\33[0;43m * WARNING * \33[0m";
#endif

	std::cerr << str << std::endl;
}


void console_t::print_fmt(const char *format, ...) const
{
	std::vector<char> buffer(BUFFER_SIZE_FOR_FMT, '\0');
	va_list arg;
	va_start(arg, format);
	vsnprintf(&buffer[0], BUFFER_SIZE_FOR_FMT, format, arg);
	va_end(arg);

	print(&buffer[0]);
}


void console_t::error_fmt(const char *format, ...) const
{
	std::vector<char> buffer(BUFFER_SIZE_FOR_FMT, '\0');
	va_list arg;
	va_start(arg, format);
	vsnprintf(&buffer[0], BUFFER_SIZE_FOR_FMT, format, arg);
	va_end(arg);

	error(&buffer[0]);
}


void console_t::warn_fmt(const char *format, ...) const
{
	std::vector<char> buffer(BUFFER_SIZE_FOR_FMT, '\0');
	va_list arg;
	va_start(arg, format);
	vsnprintf(&buffer[0], BUFFER_SIZE_FOR_FMT, format, arg);
	va_end(arg);

	warn(&buffer[0]);
}


void console_t::add_indent()
{
	ms_indent = std::min(5, ms_indent + 1);
}


void console_t::sub_indent()
{
	ms_indent = std::max(0, ms_indent - 1);
}


std::string console_t::time_stamp() const
{
	time_point_t now;

#ifdef _WIN32
	return format(
		"# %02d/%02d/%04d %02d:%02d:%02d | ",
		now.month, now.day, now.year, now.hour, now.min, now.sec);
#else
	return format(
		"\33[0;34m# %02d/%02d/%04d %02d:%02d:%02d\33[0m] ",
		now.month, now.day, now.year, now.hour, now.min, now.sec);
#endif
}


std::string console_t::indent() const
{
	std::string out;

	for (int i = 0; i < ms_indent; ++i)
		out += "    ";

	return out;
}


}
