/* -*- coding: utf-8 -*- */

#pragma once

#include <ciso646>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <chrono>
#include <cstring>

#include <iostream>
#include <fstream>
#include <sstream>
#include <initializer_list>
#include <vector>
#include <deque>
#include <list>
#include <string>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <mutex>
#include <functional>
#include <stdexcept>

#define hash_map std::unordered_map
#define hash_set std::unordered_set


/** A namespace of hornet, the propositional rule-inference engine. */
namespace hornet
{

class string_t;

typedef long int index_t;
typedef float duration_time_t;


/** Verboseness of debug printing */
enum verboseness_e
{
	NOT_VERBOSE,
	VERBOSE_1, VERBOSE_2, VERBOSE_3, VERBOSE_4,
	FULL_VERBOSE
};


/** Wrapper class of std::string. */
class string_t : public std::string
{
public:
	string_t() {}
	string_t(const char *s) : std::string(s) {}
	string_t(const std::string &s) : std::string(s) {}

	inline explicit operator bool() const { return not empty(); }

	string_t lower() const;

	std::vector<string_t> split(const char *delim, const int MAX_NUM = -1) const;
	string_t replace(const std::string &from, const std::string &to) const;
	string_t strip(const char *targets) const;
	string_t slice(int i, int j) const;

	bool startswith(const std::string&) const;
	bool endswith(const std::string&) const;
};


/** A wrapper class of string_t to manage filepaths. */
class filepath_t : public string_t
{
public:
	filepath_t() {}
	filepath_t(const char *s) : string_t(s) { reguralize(); }
	filepath_t(const std::string &s) : string_t(s) { reguralize(); }
	filepath_t(const filepath_t &s) : string_t(s) {}

	bool find_file() const; /// Returns whether a file exists.

	filepath_t filename() const;
	filepath_t dirname() const;

private:
	void reguralize();
};

} // end of hornet


namespace std
{

template <> struct hash<hornet::string_t> : public hash<std::string>
{
	size_t operator() (const hornet::string_t &s) const
	{
		return hash<std::string>::operator()(s);
	}
};

template <> struct hash<hornet::filepath_t> : public hash<std::string>
{
	size_t operator() (const hornet::filepath_t &s) const
	{
		return hash<std::string>::operator()(s);
	}
};

} // end of std


namespace hornet
{

/** The exception which is thrown on invalid inputs and options. */
class exception_t : public std::runtime_error
{
public:
	exception_t(const std::string &what, bool do_print_usage = false)
		: std::runtime_error(what), m_do_print_usage(do_print_usage) {}
	bool do_print_usage() const { return m_do_print_usage; }
private:
	bool m_do_print_usage;
};


/** A class to strage parameters given by command-option. */
class parameter_strage_t : public std::unordered_map<string_t, string_t>
{
public:
	static parameter_strage_t* instance();

	void add(const string_t &key, const string_t &value);

	string_t get(const string_t &key, const string_t &def = "") const;

	/** Returns the value as an integer, or `def` if it is missing or not an integer. */
	int geti(const string_t &key, int def = -1) const;

	bool has(const string_t &key) const;

private:
	parameter_strage_t() {}
};

inline parameter_strage_t* param() { return parameter_strage_t::instance(); }


/** A class to print strings on the console. */
class console_t
{
public:
	static console_t* instance();

	void print(const std::string &str) const;
	void error(const std::string &str) const;
	void warn(const std::string &str) const;

	void print_fmt(const char *format, ...) const;
	void error_fmt(const char *format, ...) const;
	void warn_fmt(const char *format, ...) const;

	/** Indentation is kept per thread. */
	void add_indent();
	void sub_indent();
	int indent_depth() const { return ms_indent; }

	int& verbosity() { return m_verbosity; }
	int verbosity() const { return m_verbosity; }
	bool is(verboseness_e v) const { return m_verbosity >= v; }

private:
	console_t() : m_verbosity(NOT_VERBOSE) {}

	std::string time_stamp() const;
	std::string indent() const;

	static const int BUFFER_SIZE_FOR_FMT = 256 * 256;
	static std::mutex ms_mutex;
	static thread_local int ms_indent;

	int m_verbosity;
};

inline console_t* console() { return console_t::instance(); }

#define PRINT_VERBOSE_1(s) if (console()->verbosity() >= 1) console()->print(s)
#define PRINT_VERBOSE_2(s) if (console()->verbosity() >= 2) console()->print(s)
#define PRINT_VERBOSE_3(s) if (console()->verbosity() >= 3) console()->print(s)

#define IF_VERBOSE_1(s) if (console()->is(VERBOSE_1)) { s; }
#define IF_VERBOSE_2(s) if (console()->is(VERBOSE_2)) { s; }
#define IF_VERBOSE_3(s) if (console()->is(VERBOSE_3)) { s; }


/** A class to see duration-time. */
class time_watcher_t
{
public:
	time_watcher_t() : m_begin(std::chrono::system_clock::now()) {}

	/** Returns duration time from m_begin in seconds. */
	duration_time_t duration() const;

private:
	std::chrono::system_clock::time_point m_begin;
};


struct time_point_t
{
	time_point_t();
	string_t string() const;

	int year;
	int month;
	int day;
	int hour;
	int min;
	int sec;
};

extern const time_point_t INIT_TIME;


/** A class of XML element, which is used to write results. */
class xml_element_t
{
public:
	xml_element_t(const std::string &name, const std::string &text = "")
		: m_name(name), m_text(text) {}

	const std::string& name() const { return m_name; }
	const std::string& text() const { return m_text; }
	const std::list<std::pair<std::string, std::string>>& attributes() const { return m_attr; }
	const std::list<xml_element_t>& children() const { return m_children; }

	xml_element_t& add_attribute(const std::string &key, const std::string &val);
	xml_element_t& add_child(const xml_element_t &elem);

	const std::string* find_attribute(const std::string &key) const;

	void print(std::ostream *os) const;

private:
	std::string m_name;
	std::string m_text;
	std::list<std::pair<std::string, std::string>> m_attr;
	std::list<xml_element_t> m_children;
};


/* -------- Functions -------- */


std::string format(const char *format, ...);

/** Escapes characters which cannot appear in XML as they are. */
std::string escape_xml(const std::string &str);


/** Returns joined string. */
template <class It> std::string join(
	const It &s_begin, const It &s_end, const std::string &delimiter)
{
	std::ostringstream ss;
	for (It it = s_begin; it != s_end; ++it)
		ss << (it == s_begin ? "" : delimiter) << (*it);
	return ss.str();
}


template <class Container, class Element>
inline bool has_element(const Container &c, const Element &e)
{
	return c.find(e) != c.end();
}


} // end of hornet
