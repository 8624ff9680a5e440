#pragma once

#include <set>
#include <vector>
#include <string>

#include "./util.h"


namespace hornet
{

/** Atoms are propositional, so an atom is merely its name. */
typedef string_t atom_t;
typedef size_t rule_id_t;

/** A set of atoms which are known to be true. */
typedef hash_set<atom_t> fact_set_t;

/** A set of atoms in the dictionary order, which is used for outputs. */
typedef std::set<atom_t> sorted_atoms_t;


namespace kb
{

/** Atoms with this prefix are regarded as hypotheses of faults. */
extern const string_t FAULT_PREFIX;

/** Returns whether the atom is a fault hypothesis. */
inline bool is_fault(const atom_t &a) { return a.startswith(FAULT_PREFIX); }


/** A class of Horn clauses, `a1 ^ a2 ^ ... => c`. */
class rule_t
{
public:
	rule_t() {}
	rule_t(const std::vector<atom_t> &antecedents, const atom_t &consequent,
		const string_t &description = "");

	inline const string_t& name() const { return m_name; }
	inline       string_t& name()       { return m_name; }

	inline const std::vector<atom_t>& antecedents() const { return m_antecedents; }
	inline       std::vector<atom_t>& antecedents()       { return m_antecedents; }

	inline const atom_t& consequent() const { return m_consequent; }
	inline       atom_t& consequent()       { return m_consequent; }

	/** Human readable annotation. This has no effect on inference. */
	inline const string_t& description() const { return m_description; }
	inline       string_t& description()       { return m_description; }

	/** Returns whether every antecedent is included in the facts. */
	bool is_satisfied_by(const fact_set_t &facts) const;

	bool operator==(const rule_t &x) const;
	bool operator!=(const rule_t &x) const { return not operator==(x); }

	string_t string() const;

private:
	string_t m_name;
	std::vector<atom_t> m_antecedents;
	atom_t m_consequent;
	string_t m_description;
};

std::ostream& operator<<(std::ostream& os, const rule_t& r);


/** An ordered collection of rules.
 *  Rule sets cannot be modified after construction,
 *  so that an instance can be shared by any number of inferences. */
class rule_set_t
{
public:
	/** @param name  The name of this rule set.
	 *  @param rules Rules in the order of priority.
	 *               Unnamed rules are named automatically. */
	rule_set_t(const string_t &name, const std::vector<rule_t> &rules);

	inline const string_t& name() const { return m_name; }

	inline const std::vector<rule_t>& rules() const { return m_rules; }
	inline const rule_t& at(rule_id_t i) const { return m_rules.at(i); }
	inline size_t size() const { return m_rules.size(); }
	inline bool empty() const { return m_rules.empty(); }

	inline std::vector<rule_t>::const_iterator begin() const { return m_rules.begin(); }
	inline std::vector<rule_t>::const_iterator end() const { return m_rules.end(); }

	/** Returns indices of rules whose consequent is the atom, in the order of the rule set. */
	const std::vector<rule_id_t>& rules_concluding(const atom_t &a) const;

	/** Returns all distinct atoms which appear in this rule set. */
	sorted_atoms_t atoms() const;

private:
	string_t m_name;
	std::vector<rule_t> m_rules;
	hash_map<atom_t, std::vector<rule_id_t>> m_consequent2rids;
};


/** The permissive rule set, which is used for exploratory forward diagnosis. */
rule_set_t sample_forward_rules();

/** The strict rule set, which requires stronger evidence for backward proofs. */
rule_set_t sample_backward_rules();


} // end of kb

} // end of hornet
