#include "./diag.h"

namespace hornet
{

namespace diag
{


atom_t normalize_atom(const string_t &s)
{
	return s.strip(" \t\r\n\v\f");
}


fact_set_t normalize_facts(const std::vector<string_t> &facts)
{
	fact_set_t out;

	for (const auto &f : facts)
	{
		atom_t a = normalize_atom(f);
		if (not a.empty())
			out.insert(a);
	}

	return out;
}


diagnoser_t::diagnoser_t(const kb::rule_set_t &forward, const kb::rule_set_t &backward)
	: m_forward(forward), m_backward(backward)
{}


forward_result_t diagnoser_t::forward_diagnose(const std::vector<string_t> &facts) const
{
	fact_set_t input = normalize_facts(facts);
	infer::closure_t closure = m_forward.chain(input);
	forward_result_t out;

	out.input_facts.insert(input.begin(), input.end());
	out.trace = std::move(closure.trace);
	out.num_passes = closure.num_passes;

	for (const auto &a : closure.known)
	{
		if (not has_element(input, a))
			out.derived_facts.insert(a);

		if (kb::is_fault(a))
			out.faults.insert(a);
	}

	return out;
}


backward_result_t diagnoser_t::backward_diagnose(
	const std::vector<string_t> &facts, const string_t &goal) const
{
	backward_result_t out;

	out.goal = normalize_atom(goal);
	if (out.goal.empty())
		throw exception_t("the goal is empty");

	fact_set_t input = normalize_facts(facts);
	infer::proof_t proof = m_backward.prove(out.goal, input);

	out.facts.insert(input.begin(), input.end());
	out.provable = proof.provable;
	out.proof = std::move(proof.steps);

	return out;
}


rule_catalog_t diagnoser_t::describe_rules() const
{
	rule_catalog_t out;

	out.forward = &m_forward.rules();
	out.backward = &m_backward.rules();
	out.fault_prefix = kb::FAULT_PREFIX;

	return out;
}


} // end of diag

} // end of hornet
