#include "./diag.h"

namespace hornet
{

namespace diag
{


namespace
{

xml_element_t atoms_to_xml(
	const string_t &tag, const string_t &child, const sorted_atoms_t &atoms)
{
	xml_element_t out(tag);
	out.add_attribute("num", format("%lu", static_cast<unsigned long>(atoms.size())));

	for (const auto &a : atoms)
		out.add_child(xml_element_t(child, a));

	return out;
}

}


xml_element_t to_xml(const kb::rule_t &rule, const string_t &tag)
{
	xml_element_t out(tag);

	out.add_attribute("name", rule.name());
	out.add_attribute("consequent", rule.consequent());

	if (not rule.description().empty())
		out.add_attribute("description", rule.description());

	for (const auto &a : rule.antecedents())
		out.add_child(xml_element_t("antecedent", a));

	return out;
}


xml_element_t to_xml(const infer::proof_step_t &step)
{
	xml_element_t out("step");

	out.add_attribute("type", step.type_name());
	out.add_attribute("goal", step.goal());

	if (step.type() == infer::STEP_INFERRED)
	{
		out.add_child(to_xml(step.rule(), "using"));

		xml_element_t &sub = out.add_child(xml_element_t("subproof"));
		for (const auto &s : step.subproof())
			sub.add_child(to_xml(s));
	}

	for (const auto &att : step.attempts())
	{
		xml_element_t &e = out.add_child(xml_element_t("attempt"));
		e.add_child(to_xml(att.rule, "using"));

		xml_element_t &sub = e.add_child(xml_element_t("subproof"));
		for (const auto &s : att.subproof)
			sub.add_child(to_xml(s));
	}

	return out;
}


xml_element_t to_xml(const forward_result_t &res)
{
	xml_element_t out("forward");

	out.add_attribute("passes", format("%d", res.num_passes));
	out.add_child(atoms_to_xml("input-facts", "fact", res.input_facts));
	out.add_child(atoms_to_xml("derived-facts", "fact", res.derived_facts));

	xml_element_t &trace = out.add_child(xml_element_t("trace"));
	trace.add_attribute("num", format("%lu", static_cast<unsigned long>(res.trace.size())));

	for (const auto &e : res.trace)
		trace.add_child(to_xml(e.rule, "fire")).add_attribute("pass", format("%d", e.pass));

	out.add_child(atoms_to_xml("faults", "fault", res.faults));

	return out;
}


xml_element_t to_xml(const backward_result_t &res)
{
	xml_element_t out("backward");

	out.add_attribute("goal", res.goal);
	out.add_attribute("provable", res.provable ? "yes" : "no");
	out.add_child(atoms_to_xml("facts", "fact", res.facts));

	xml_element_t &proof = out.add_child(xml_element_t("proof"));
	for (const auto &s : res.proof)
		proof.add_child(to_xml(s));

	return out;
}


xml_element_t to_xml(const rule_catalog_t &catalog)
{
	xml_element_t out("rules");
	out.add_attribute("fault-prefix", catalog.fault_prefix);

	auto add_rule_set = [&](const string_t &role, const kb::rule_set_t *rs)
	{
		xml_element_t &e = out.add_child(xml_element_t("rule-set"));
		e.add_attribute("role", role);
		e.add_attribute("name", rs->name());
		e.add_attribute("num", format("%lu", static_cast<unsigned long>(rs->size())));

		for (const auto &r : *rs)
			e.add_child(to_xml(r));
	};

	add_rule_set("forward", catalog.forward);
	add_rule_set("backward", catalog.backward);

	return out;
}


} // end of diag

} // end of hornet
