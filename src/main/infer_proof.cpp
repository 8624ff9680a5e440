#include "./infer.h"

namespace hornet
{

namespace infer
{


proof_step_t proof_step_t::given(const atom_t &goal)
{
	return proof_step_t(STEP_GIVEN, goal);
}


proof_step_t proof_step_t::cycle(const atom_t &goal)
{
	return proof_step_t(STEP_CYCLE, goal);
}


proof_step_t proof_step_t::inferred(
	const atom_t &goal, rule_id_t rid, const kb::rule_t &rule,
	std::vector<proof_step_t> &&subproof)
{
	proof_step_t out(STEP_INFERRED, goal);
	out.m_rid = rid;
	out.m_rule = rule;
	out.m_subproof = std::move(subproof);
	return out;
}


proof_step_t proof_step_t::not_provable(
	const atom_t &goal, std::vector<attempt_t> &&attempts)
{
	proof_step_t out(STEP_NOT_PROVABLE, goal);
	out.m_attempts = std::move(attempts);
	return out;
}


bool proof_step_t::includes(proof_step_type_e t, bool do_search_attempts) const
{
	if (m_type == t) return true;

	for (const auto &s : m_subproof)
		if (s.includes(t, do_search_attempts))
			return true;

	if (do_search_attempts)
	{
		for (const auto &att : m_attempts)
			for (const auto &s : att.subproof)
				if (s.includes(t, do_search_attempts))
					return true;
	}

	return false;
}


void proof_step_t::collect_rules(std::vector<rule_id_t> *out) const
{
	if (m_type != STEP_INFERRED) return;

	out->push_back(m_rid);

	for (const auto &s : m_subproof)
		s.collect_rules(out);
}


string_t proof_step_t::type_name() const
{
	switch (m_type)
	{
	case STEP_GIVEN:        return "given";
	case STEP_INFERRED:     return "inferred";
	case STEP_CYCLE:        return "cycle";
	case STEP_NOT_PROVABLE: return "not-provable";
	default:                return "unknown";
	}
}


string_t proof_step_t::string() const
{
	string_t out = "[" + type_name() + "] " + m_goal;

	if (m_type == STEP_INFERRED)
		out += " <= " + join(m_rule.antecedents().begin(), m_rule.antecedents().end(), " ^ ");

	return out;
}


} // end of infer

} // end of hornet
