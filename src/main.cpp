/* -*- coding: utf-8 -*- */


#include "./main/binary.h"


/** The main function.
 *  Problems are read from stdin or text files. */
int main(int argc, char* argv[])
{
	using namespace hornet;

	bin::execution_configure_t config;
	bin::inputs_t inputs;

	try
	{
		bin::prepare(argc, argv, &config, &inputs);
		bin::execute(config, inputs);
	}
	catch (const exception_t &exception)
	{
		if (exception.what()[0] != '\0')
			console()->error(exception.what());
		if (exception.do_print_usage())
			bin::print_usage();
		return 1;
	}
	catch (const std::exception &exception)
	{
		console()->error_fmt("Unexpected error: %s", exception.what());
		return 1;
	}

	return 0;
}
