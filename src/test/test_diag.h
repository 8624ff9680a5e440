#pragma once

#include <gtest/gtest.h>
#include <sstream>
#include <list>
#include <iterator>

#include "../main/diag.h"

using namespace hornet;


TEST(DiagnosisTest, Normalize)
{
	EXPECT_EQ(diag::normalize_atom("  battery_low\t"), "battery_low");
	EXPECT_EQ(diag::normalize_atom(" \n "), "");

	fact_set_t facts = diag::normalize_facts({ " a", "a ", "", "  ", "b" });
	EXPECT_EQ(facts.size(), 2);
	EXPECT_TRUE(has_element(facts, "a"));
	EXPECT_TRUE(has_element(facts, "b"));
}


TEST(DiagnosisTest, Forward)
{
	kb::rule_set_t fw = kb::sample_forward_rules();
	kb::rule_set_t bw = kb::sample_backward_rules();
	diag::diagnoser_t d(fw, bw);

	diag::forward_result_t res = d.forward_diagnose({ " battery_low ", "", "battery_low" });

	EXPECT_EQ(res.input_facts, sorted_atoms_t{ "battery_low" });
	EXPECT_EQ(res.derived_facts,
		(sorted_atoms_t{ "fault_power_supply", "power_unstable", "system_restarts" }));
	EXPECT_EQ(res.faults, sorted_atoms_t{ "fault_power_supply" });
	EXPECT_EQ(res.trace.size(), 3);
	EXPECT_EQ(res.num_passes, 2);

	diag::forward_result_t res2 = d.forward_diagnose({});
	EXPECT_TRUE(res2.input_facts.empty());
	EXPECT_TRUE(res2.derived_facts.empty());
	EXPECT_TRUE(res2.faults.empty());
}


TEST(DiagnosisTest, ObservedFault)
{
	kb::rule_set_t fw = kb::sample_forward_rules();
	kb::rule_set_t bw = kb::sample_backward_rules();
	diag::diagnoser_t d(fw, bw);

	// AN OBSERVED FAULT IS LISTED AS A FAULT, BUT NOT AS A DERIVED FACT.
	diag::forward_result_t res = d.forward_diagnose({ "fault_network" });
	EXPECT_EQ(res.faults, sorted_atoms_t{ "fault_network" });
	EXPECT_TRUE(res.derived_facts.empty());
}


TEST(DiagnosisTest, Backward)
{
	kb::rule_set_t fw = kb::sample_forward_rules();
	kb::rule_set_t bw = kb::sample_backward_rules();
	diag::diagnoser_t d(fw, bw);

	// THE PERMISSIVE RULES WOULD DERIVE THIS, BUT THE STRICT ONES DO NOT.
	diag::backward_result_t res = d.backward_diagnose({ "battery_low" }, "fault_battery");
	EXPECT_EQ(res.goal, "fault_battery");
	EXPECT_FALSE(res.provable);
	ASSERT_EQ(res.proof.size(), 1);
	EXPECT_EQ(res.proof.front().type(), infer::STEP_NOT_PROVABLE);

	diag::backward_result_t res2 = d.backward_diagnose(
		{ "power_unstable ", " system_restarts" }, "  fault_power_supply ");
	EXPECT_EQ(res2.goal, "fault_power_supply");
	EXPECT_TRUE(res2.provable);
	EXPECT_EQ(res2.facts, (sorted_atoms_t{ "power_unstable", "system_restarts" }));

	EXPECT_THROW(d.backward_diagnose({ "battery_low" }, ""), exception_t);
	EXPECT_THROW(d.backward_diagnose({ "battery_low" }, " \t"), exception_t);
}


TEST(DiagnosisTest, DescribeRules)
{
	kb::rule_set_t fw = kb::sample_forward_rules();
	kb::rule_set_t bw = kb::sample_backward_rules();
	diag::diagnoser_t d(fw, bw);

	diag::rule_catalog_t cat = d.describe_rules();
	EXPECT_EQ(cat.forward, &fw);
	EXPECT_EQ(cat.backward, &bw);
	EXPECT_EQ(cat.fault_prefix, "fault_");

	xml_element_t xml = diag::to_xml(cat);
	EXPECT_EQ(*xml.find_attribute("fault-prefix"), "fault_");
	ASSERT_EQ(xml.children().size(), 2);
	EXPECT_EQ(*xml.children().front().find_attribute("role"), "forward");
	EXPECT_EQ(*xml.children().front().find_attribute("num"), "7");
	EXPECT_EQ(*xml.children().back().find_attribute("num"), "9");
	EXPECT_EQ(xml.children().back().children().size(), 9);
}


TEST(DiagnosisTest, RuleXML)
{
	kb::rule_t r({ "no_wifi", "router_off" }, "network_down", "Router & Wi-Fi");
	r.name() = "net";

	std::ostringstream ss;
	diag::to_xml(r).print(&ss);

	EXPECT_EQ(ss.str(),
		"<rule name=\"net\" consequent=\"network_down\" description=\"Router &amp; Wi-Fi\">\n"
		"  <antecedent>no_wifi</antecedent>\n"
		"  <antecedent>router_off</antecedent>\n"
		"</rule>\n");
}


TEST(DiagnosisTest, ResultXML)
{
	kb::rule_set_t fw = kb::sample_forward_rules();
	kb::rule_set_t bw = kb::sample_backward_rules();
	diag::diagnoser_t d(fw, bw);

	xml_element_t fxml = diag::to_xml(d.forward_diagnose({ "no_wifi", "router_off" }));
	EXPECT_EQ(fxml.name(), "forward");
	EXPECT_EQ(*fxml.find_attribute("passes"), "2");

	std::list<std::string> names;
	for (const auto &c : fxml.children())
		names.push_back(c.name());
	EXPECT_EQ(names, (std::list<std::string>{ "input-facts", "derived-facts", "trace", "faults" }));

	const xml_element_t &trace = *std::next(fxml.children().begin(), 2);
	EXPECT_EQ(*trace.find_attribute("num"), "3");
	EXPECT_EQ(*trace.children().front().find_attribute("pass"), "1");

	xml_element_t bxml = diag::to_xml(d.backward_diagnose({}, "fault_power_supply"));
	EXPECT_EQ(*bxml.find_attribute("provable"), "no");

	const xml_element_t &proof = bxml.children().back();
	EXPECT_EQ(proof.name(), "proof");
	ASSERT_EQ(proof.children().size(), 1);

	const xml_element_t &step = proof.children().front();
	EXPECT_EQ(*step.find_attribute("type"), "not-provable");
	EXPECT_EQ(*step.find_attribute("goal"), "fault_power_supply");
	ASSERT_EQ(step.children().size(), 1);
	EXPECT_EQ(step.children().front().name(), "attempt");
}
