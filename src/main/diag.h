#pragma once

/** Fault diagnosis on the inference engines.
 *  This is the layer which takes raw inputs from the outside,
 *  normalizes them and shapes results of inference for outputs.
 *  @file   diag.h
 */

#include <vector>

#include "./util.h"
#include "./kb.h"
#include "./infer.h"


namespace hornet
{

/** A namespace about fault diagnosis. */
namespace diag
{


/** Returns the atom without surrounding white spaces. */
atom_t normalize_atom(const string_t &s);

/** Returns the set of normalized facts. Blank ones are discarded. */
fact_set_t normalize_facts(const std::vector<string_t> &facts);


/** An input of diagnosis. */
class problem_t
{
public:
	problem_t() {}

	inline const string_t& name() const { return m_name; }
	inline       string_t& name()       { return m_name; }

	inline const std::vector<string_t>& facts() const { return m_facts; }
	inline       std::vector<string_t>& facts()       { return m_facts; }

	/** The goal to prove. This is empty if not given. */
	inline const string_t& goal() const { return m_goal; }
	inline       string_t& goal()       { return m_goal; }

private:
	string_t m_name;
	std::vector<string_t> m_facts;
	string_t m_goal;
};


struct forward_result_t
{
	sorted_atoms_t input_facts;
	sorted_atoms_t derived_facts; /// Atoms derived, excluding the input facts.
	std::vector<infer::trace_entry_t> trace;
	sorted_atoms_t faults; /// Known atoms which are fault hypotheses.
	int num_passes;
};


struct backward_result_t
{
	atom_t goal;
	sorted_atoms_t facts;
	bool provable;
	std::vector<infer::proof_step_t> proof;
};


/** A read-only view of the rule sets in use. */
struct rule_catalog_t
{
	const kb::rule_set_t *forward;
	const kb::rule_set_t *backward;
	string_t fault_prefix;
};


/** A class to diagnose faults with two rule sets.
 *  The permissive one is used for forward diagnosis and the strict one for backward diagnosis.
 *  Rule sets must outlive instances of this class. */
class diagnoser_t
{
public:
	diagnoser_t(const kb::rule_set_t &forward, const kb::rule_set_t &backward);

	/** Derives everything reachable from the facts and lists fault hypotheses among them. */
	forward_result_t forward_diagnose(const std::vector<string_t> &facts) const;

	/** Proves the goal from the facts.
	 *  @throw exception_t The goal is blank. */
	backward_result_t backward_diagnose(
		const std::vector<string_t> &facts, const string_t &goal) const;

	rule_catalog_t describe_rules() const;

private:
	infer::forward_chainer_t m_forward;
	infer::backward_chainer_t m_backward;
};


/* -------- Functions to write results -------- */

xml_element_t to_xml(const forward_result_t &res);
xml_element_t to_xml(const backward_result_t &res);
xml_element_t to_xml(const infer::proof_step_t &step);
xml_element_t to_xml(const kb::rule_t &rule, const string_t &tag = "rule");
xml_element_t to_xml(const rule_catalog_t &catalog);


} // end of diag

} // end of hornet
