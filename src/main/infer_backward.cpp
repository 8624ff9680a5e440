#include "./infer.h"

namespace hornet
{

namespace infer
{


namespace
{

/** A goal being proven, which corresponds to a frame of recursive search. */
struct frame_t
{
	frame_t(const atom_t &g, const std::vector<rule_id_t> *c)
		: goal(g), candidates(c), i_rule(0), i_ante(0) {}

	atom_t goal;
	const std::vector<rule_id_t> *candidates; /// Rules concluding the goal.
	size_t i_rule; /// The index of the candidate being tried.
	size_t i_ante; /// The index of the antecedent being proven.

	std::vector<proof_step_t> subproof;
	std::vector<proof_step_t::attempt_t> attempts;
};

}


proof_t backward_chainer_t::prove(const atom_t &goal, const fact_set_t &facts) const
{
	std::vector<frame_t> stack;
	hash_set<atom_t> path; /// Goals of frames in the stack.
	std::unique_ptr<proof_step_t> returned; /// The step of the goal closed last.

	auto open = [&](const atom_t &g)
	{
		if (has_element(facts, g))
			returned.reset(new proof_step_t(proof_step_t::given(g)));

		else if (has_element(path, g))
		{
			PRINT_VERBOSE_3(format("cycle: %s", g.c_str()));
			returned.reset(new proof_step_t(proof_step_t::cycle(g)));
		}

		else
		{
			PRINT_VERBOSE_3(format("open: %s", g.c_str()));
			IF_VERBOSE_3(console()->add_indent());

			path.insert(g);
			stack.push_back(frame_t(g, &m_rules.rules_concluding(g)));
		}
	};

	auto close = [&](proof_step_t &&step)
	{
		IF_VERBOSE_3(console()->sub_indent());
		PRINT_VERBOSE_3(format("close: %s", step.string().c_str()));

		path.erase(stack.back().goal);
		stack.pop_back();
		returned.reset(new proof_step_t(std::move(step)));
	};

	IF_VERBOSE_3(
		console()->print_fmt("Backward-chaining on \"%s\" for \"%s\" ...",
			m_rules.name().c_str(), goal.c_str()));

	open(goal);

	while (not stack.empty())
	{
		frame_t &f = stack.back();

		// RECEIVE THE RESULT OF THE ANTECEDENT CLOSED LAST
		if (returned)
		{
			bool ok = returned->succeeded();
			f.subproof.push_back(std::move(*returned));
			returned.reset();

			if (ok)
				++f.i_ante;
			else
			{
				proof_step_t::attempt_t att;
				att.rid = f.candidates->at(f.i_rule);
				att.rule = m_rules.at(att.rid);
				att.subproof = std::move(f.subproof);
				f.attempts.push_back(std::move(att));

				f.subproof.clear();
				++f.i_rule;
				f.i_ante = 0;
			}
		}

		// NO RULE CAN PROVE THE GOAL
		if (f.i_rule >= f.candidates->size())
		{
			close(proof_step_t::not_provable(f.goal, std::move(f.attempts)));
			continue;
		}

		rule_id_t rid = f.candidates->at(f.i_rule);
		const kb::rule_t &r = m_rules.at(rid);

		// EVERY ANTECEDENT OF THE RULE HOLDS
		if (f.i_ante >= r.antecedents().size())
		{
			close(proof_step_t::inferred(f.goal, rid, r, std::move(f.subproof)));
			continue;
		}

		// `f` MUST NOT BE USED AFTER THIS, SINCE `open` MAY REALLOCATE THE STACK.
		open(r.antecedents().at(f.i_ante));
	}

	proof_t out;
	out.provable = returned->succeeded();
	out.steps.push_back(std::move(*returned));

	return out;
}


} // end of infer

} // end of hornet
