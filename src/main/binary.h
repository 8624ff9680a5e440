#pragma once

#include <string>
#include <vector>
#include <iostream>

#include "./util.h"
#include "./kb.h"
#include "./diag.h"


namespace hornet
{

/** A namespace about the command line interface. */
namespace bin
{


typedef std::vector<filepath_t> inputs_t;


enum execution_mode_e
{
	EXE_MODE_UNSPECIFIED,
	EXE_MODE_FORWARD,
	EXE_MODE_BACKWARD,
	EXE_MODE_RULES,
};


struct execution_configure_t
{
	execution_configure_t();

	execution_mode_e mode;
	filepath_t forward_rules_path;  /// Empty if the built-in rules are used.
	filepath_t backward_rules_path; /// Empty if the built-in rules are used.
	filepath_t output_path;         /// Empty if the results are written to stdout.

	/** A problem given by --facts and --goal. */
	bool has_inline_problem;
	diag::problem_t inline_problem;
};


/** The preprocess of diagnosis.
 *  This should be called before calling bin::execute.
 *  @param[out] config Options about binary execution.
 *  @param[out] inputs List of input filenames. */
void prepare(int argc, char* argv[], execution_configure_t *config, inputs_t *inputs);


/** The main process, which performs diagnosis on every problem. */
void execute(const execution_configure_t &config, const inputs_t &inputs);


/** Reads a setting file, which has one option per line, into param().
 *  Lines starting with '#' are comments.
 *  Lines without a leading '-' are regarded as inputs. */
void load_setting_file(const filepath_t &path, inputs_t *inputs);


/** Solves problems and writes the results into os. */
void diagnose(
	const diag::diagnoser_t &diagnoser, execution_mode_e mode,
	const std::vector<diag::problem_t> &problems, std::ostream *os);


/** Prints simple usage to stderr. */
void print_usage();


}

}
