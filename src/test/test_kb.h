#pragma once

#include <gtest/gtest.h>

#include "../main/kb.h"

using namespace hornet;


TEST(KnowledgeBaseTest, Rule)
{
	kb::rule_t r({ "no_wifi", "router_off" }, "network_down", "router is down");

	EXPECT_EQ(r.string(), "no_wifi ^ router_off => network_down");
	EXPECT_TRUE(r.name().empty());

	fact_set_t facts{ "no_wifi" };
	EXPECT_FALSE(r.is_satisfied_by(facts));

	facts.insert("router_off");
	EXPECT_TRUE(r.is_satisfied_by(facts));

	kb::rule_t r2 = r;
	r2.name() = "other";
	EXPECT_TRUE(r == r2);

	r2.description() = "";
	EXPECT_TRUE(r != r2);

	kb::rule_t axiom(std::vector<atom_t>{}, "always");
	EXPECT_TRUE(axiom.is_satisfied_by(fact_set_t()));
}


TEST(KnowledgeBaseTest, RuleSet)
{
	kb::rule_set_t rs("test", {
		kb::rule_t({ "a" }, "c"),
		kb::rule_t({ "b" }, "d"),
		kb::rule_t({ "b" }, "c"),
	});

	EXPECT_EQ(rs.name(), "test");
	EXPECT_EQ(rs.size(), 3);
	EXPECT_FALSE(rs.empty());

	EXPECT_EQ(rs.at(0).name(), "_test000");
	EXPECT_EQ(rs.at(2).name(), "_test002");

	const auto &rids = rs.rules_concluding("c");
	ASSERT_EQ(rids.size(), 2);
	EXPECT_EQ(rids.at(0), 0);
	EXPECT_EQ(rids.at(1), 2);

	EXPECT_TRUE(rs.rules_concluding("a").empty());
	EXPECT_TRUE(rs.rules_concluding("unknown").empty());

	sorted_atoms_t expected{ "a", "b", "c", "d" };
	EXPECT_EQ(rs.atoms(), expected);

	EXPECT_TRUE(kb::rule_set_t("empty", {}).empty());
}


TEST(KnowledgeBaseTest, SampleRules)
{
	kb::rule_set_t fw = kb::sample_forward_rules();
	kb::rule_set_t bw = kb::sample_backward_rules();

	EXPECT_EQ(fw.name(), "forward");
	EXPECT_EQ(fw.size(), 7);
	EXPECT_EQ(bw.name(), "backward");
	EXPECT_EQ(bw.size(), 9);

	for (const auto &r : bw)
	{
		EXPECT_FALSE(r.consequent().empty());
		EXPECT_FALSE(r.antecedents().empty());
	}

	// DESCRIPTIONS KEEP THE NON-BREAKING HYPHEN OF "Wi-Fi".
	EXPECT_EQ(bw.at(3).description(), "Interference and weak signal cause Wi\xe2\x80\x91" "Fi loss");

	// THE STRICT SET HAS TWO WAYS TO UNSTABLE POWER
	EXPECT_EQ(fw.rules_concluding("power_unstable").size(), 1);
	EXPECT_EQ(bw.rules_concluding("power_unstable").size(), 2);
	EXPECT_EQ(bw.rules_concluding("fault_network").size(), 1);
	EXPECT_EQ(bw.at(bw.rules_concluding("fault_network").front()).antecedents().size(), 3);
}


TEST(KnowledgeBaseTest, Fault)
{
	EXPECT_EQ(kb::FAULT_PREFIX, "fault_");
	EXPECT_TRUE(kb::is_fault("fault_battery"));
	EXPECT_FALSE(kb::is_fault("battery_fault"));
	EXPECT_FALSE(kb::is_fault("fault"));
}
