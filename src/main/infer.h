#pragma once

/** Definition of the inference engines.
 *  Both engines are pure functions of a rule set and facts,
 *  so any number of inferences can run on one rule set at the same time.
 *  @file   infer.h
 */

#include <memory>
#include <vector>

#include "./util.h"
#include "./kb.h"


namespace hornet
{

/** A namespace about forward-chaining and backward-chaining. */
namespace infer
{


/** A record of a rule-firing in forward-chaining. */
struct trace_entry_t
{
	trace_entry_t(rule_id_t i, const kb::rule_t &r, int p)
		: rid(i), rule(r), pass(p) {}

	rule_id_t rid;   /// The index of the rule in the rule set.
	kb::rule_t rule; /// The rule fired.
	int pass;        /// 1-based index of the pass in which the rule fired.
};


/** The result of forward-chaining. */
struct closure_t
{
	closure_t() : num_passes(0) {}

	/** Given facts and every atom derived from them. */
	fact_set_t known;

	/** Rule-firings in the order they occurred. */
	std::vector<trace_entry_t> trace;

	/** The number of passes including the last one, which adds nothing. */
	int num_passes;
};


/** A class to compute the least fixed point of facts under rules.
 *  The rule set must outlive instances of this class. */
class forward_chainer_t
{
public:
	forward_chainer_t(const kb::rule_set_t &rules) : m_rules(rules) {}

	/** Repeats passes over the rules in order,
	 *  firing every rule whose antecedents are known and whose consequent is not,
	 *  until a pass derives nothing new. */
	closure_t chain(const fact_set_t &facts) const;

	const kb::rule_set_t& rules() const { return m_rules; }

private:
	const kb::rule_set_t &m_rules;
};


enum proof_step_type_e
{
	STEP_GIVEN,        /// The goal is a given fact.
	STEP_INFERRED,     /// The goal was derived with a rule.
	STEP_CYCLE,        /// The goal is already being proven on the current path.
	STEP_NOT_PROVABLE, /// No rule for the goal succeeded.
};


/** A node of proof-trees built by backward-chaining. */
class proof_step_t
{
public:
	/** An application of a rule which failed.
	 *  The subproof ends with the step of the antecedent which failed. */
	struct attempt_t
	{
		rule_id_t rid;
		kb::rule_t rule;
		std::vector<proof_step_t> subproof;
	};

	static proof_step_t given(const atom_t &goal);
	static proof_step_t cycle(const atom_t &goal);
	static proof_step_t inferred(
		const atom_t &goal, rule_id_t rid, const kb::rule_t &rule,
		std::vector<proof_step_t> &&subproof);
	static proof_step_t not_provable(
		const atom_t &goal, std::vector<attempt_t> &&attempts);

	inline proof_step_type_e type() const { return m_type; }
	inline const atom_t& goal() const { return m_goal; }

	/** Returns whether the goal of this step holds. */
	inline bool succeeded() const { return (m_type == STEP_GIVEN) or (m_type == STEP_INFERRED); }

	/** The rule used. Only inferred steps have a meaningful value. */
	inline rule_id_t rid() const { return m_rid; }
	inline const kb::rule_t& rule() const { return m_rule; }

	/** Proofs of the antecedents of the rule used, in the order of antecedents. */
	inline const std::vector<proof_step_t>& subproof() const { return m_subproof; }

	/** Rules tried in vain. Only not-provable steps have them. */
	inline const std::vector<attempt_t>& attempts() const { return m_attempts; }

	/** Returns whether this tree has a step of the type.
	 *  @param do_search_attempts If true, subproofs of failed attempts are also searched. */
	bool includes(proof_step_type_e t, bool do_search_attempts = true) const;

	/** Adds the indices of rules used in this successful tree to out. */
	void collect_rules(std::vector<rule_id_t> *out) const;

	/** Returns the type in the notation of outputs, such as "not-provable". */
	string_t type_name() const;

	string_t string() const;

private:
	proof_step_t(proof_step_type_e type, const atom_t &goal)
		: m_type(type), m_goal(goal), m_rid(0) {}

	proof_step_type_e m_type;
	atom_t m_goal;

	rule_id_t m_rid;
	kb::rule_t m_rule;
	std::vector<proof_step_t> m_subproof;
	std::vector<attempt_t> m_attempts;
};


/** The result of backward-chaining. */
struct proof_t
{
	proof_t() : provable(false) {}

	bool provable;

	/** Steps of the top-level goal. This has always one step. */
	std::vector<proof_step_t> steps;
};


/** A class to prove goals in depth-first search.
 *  The search is done on an explicit stack, so that long chains of rules
 *  never exhaust the call stack. The rule set must outlive instances of this class. */
class backward_chainer_t
{
public:
	backward_chainer_t(const kb::rule_set_t &rules) : m_rules(rules) {}

	/** Proves the goal from the facts.
	 *  Among rules concluding a goal, the first one which succeeds is used.
	 *  A goal which appears again among its own ancestors fails as a cycle. */
	proof_t prove(const atom_t &goal, const fact_set_t &facts) const;

	const kb::rule_set_t& rules() const { return m_rules; }

private:
	const kb::rule_set_t &m_rules;
};


} // end of infer

} // end of hornet
