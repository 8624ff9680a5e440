#include "./kb.h"

namespace hornet
{

namespace kb
{


const string_t FAULT_PREFIX = "fault_";


rule_t::rule_t(const std::vector<atom_t> &antecedents, const atom_t &consequent,
	const string_t &description)
	: m_antecedents(antecedents), m_consequent(consequent), m_description(description)
{}


bool rule_t::is_satisfied_by(const fact_set_t &facts) const
{
	for (const auto &a : m_antecedents)
		if (not has_element(facts, a))
			return false;

	return true;
}


bool rule_t::operator==(const rule_t &x) const
{
	return
		(m_consequent == x.m_consequent) and
		(m_antecedents == x.m_antecedents) and
		(m_description == x.m_description);
}


string_t rule_t::string() const
{
	return join(m_antecedents.begin(), m_antecedents.end(), " ^ ") + " => " + m_consequent;
}


std::ostream& operator<<(std::ostream& os, const rule_t& r)
{
	return os << r.string();
}



rule_set_t::rule_set_t(const string_t &name, const std::vector<rule_t> &rules)
	: m_name(name), m_rules(rules)
{
	size_t num_unnamed(0);

	for (rule_id_t i = 0; i < m_rules.size(); ++i)
	{
		rule_t &r = m_rules[i];

		if (r.name().empty())
			r.name() = format("_%s%03lu", m_name.c_str(), static_cast<unsigned long>(num_unnamed++));

		m_consequent2rids[r.consequent()].push_back(i);
	}
}


const std::vector<rule_id_t>& rule_set_t::rules_concluding(const atom_t &a) const
{
	static const std::vector<rule_id_t> EMPTY;

	auto found = m_consequent2rids.find(a);
	return (found == m_consequent2rids.end()) ? EMPTY : found->second;
}


sorted_atoms_t rule_set_t::atoms() const
{
	sorted_atoms_t out;

	for (const auto &r : m_rules)
	{
		out.insert(r.antecedents().begin(), r.antecedents().end());
		out.insert(r.consequent());
	}

	return out;
}


} // end of kb

} // end of hornet
