#include "./util.h"


namespace hornet
{

bool filepath_t::find_file() const
{
	std::ifstream fin(*this);
	return static_cast<bool>(fin);
}


filepath_t filepath_t::filename() const
{
#ifdef _WIN32
	auto idx = rfind("\\");
#else
	auto idx = rfind("/");
#endif
	return (idx != std::string::npos) ? filepath_t(substr(idx + 1)) : (*this);
}


filepath_t filepath_t::dirname() const
{
#ifdef _WIN32
	auto idx = rfind("\\");
#else
	auto idx = rfind("/");
#endif
	return (idx != std::string::npos) ? filepath_t(substr(0, idx)) : filepath_t("");
}


void filepath_t::reguralize()
{
#ifdef _WIN32
	assign(replace("/", "\\"));
#else
	assign(replace("\\", "/"));
#endif

	if (find("$TIME") != std::string::npos)
	{
		std::string _replace = format(
			"%04d%02d%02d_%02d%02d%02d",
			INIT_TIME.year, INIT_TIME.month, INIT_TIME.day,
			INIT_TIME.hour, INIT_TIME.min, INIT_TIME.sec);
		assign(replace("$TIME", _replace));
	}

	if (find("$DAY") != std::string::npos)
	{
		std::string _replace = format(
			"%04d%02d%02d", INIT_TIME.year, INIT_TIME.month, INIT_TIME.day);
		assign(replace("$DAY", _replace));
	}
}


}
