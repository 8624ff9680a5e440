#include "./infer.h"

namespace hornet
{

namespace infer
{


closure_t forward_chainer_t::chain(const fact_set_t &facts) const
{
	closure_t out;
	bool applied = true;

	out.known = facts;

	IF_VERBOSE_2(
		console()->print_fmt("Forward-chaining on \"%s\" from %lu facts ...",
			m_rules.name().c_str(), static_cast<unsigned long>(facts.size())));

	while (applied)
	{
		applied = false;
		++out.num_passes;

		for (rule_id_t i = 0; i < m_rules.size(); ++i)
		{
			const kb::rule_t &r = m_rules.at(i);

			if (has_element(out.known, r.consequent())) continue;
			if (not r.is_satisfied_by(out.known)) continue;

			out.known.insert(r.consequent());
			out.trace.push_back(trace_entry_t(i, r, out.num_passes));
			applied = true;

			PRINT_VERBOSE_2(format(
				"  pass %d: %s (%s)",
				out.num_passes, r.string().c_str(), r.name().c_str()));
		}
	}

	IF_VERBOSE_2(
		console()->print_fmt("Derived %lu facts in %d passes.",
			static_cast<unsigned long>(out.trace.size()), out.num_passes));

	return out;
}


} // end of infer

} // end of hornet
