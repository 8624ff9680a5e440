#include "./kb.h"

namespace hornet
{

namespace kb
{


rule_set_t sample_forward_rules()
{
	std::vector<rule_t> rules
	{
		rule_t({ "battery_low" }, "power_unstable", "Low battery can cause unstable power"),
		rule_t({ "power_unstable" }, "system_restarts", "Unstable power can trigger restarts"),
		rule_t({ "no_wifi", "router_off" }, "network_down", "No WiFi and router off implies network down"),
		rule_t({ "network_down" }, "cannot_sync", "If the network is down, syncing fails"),

		// FAULT HYPOTHESES
		rule_t({ "power_unstable" }, "fault_power_supply", "Unstable power suggests power supply fault"),
		rule_t({ "battery_low", "charging_not_working" }, "fault_battery", "Low battery + charging not working suggests battery fault"),
		rule_t({ "network_down" }, "fault_network", "Network down suggests network fault"),
	};

	return rule_set_t("forward", rules);
}


rule_set_t sample_backward_rules()
{
	std::vector<rule_t> rules
	{
		// DERIVATIONS OF INTERMEDIATE STATES
		rule_t({ "battery_low" }, "power_unstable", "Low battery can cause unstable power"),
		rule_t({ "mains_fluctuation" }, "power_unstable", "Mains fluctuation can cause unstable power"),
		rule_t({ "power_unstable" }, "system_restarts", "Unstable power can trigger restarts"),
		rule_t({ "interference", "weak_signal" }, "no_wifi", "Interference and weak signal cause Wi\xe2\x80\x91" "Fi loss"),
		rule_t({ "no_wifi", "router_off" }, "network_down", "Router off with no Wi\xe2\x80\x91" "Fi implies network is down"),
		rule_t({ "network_down" }, "cannot_sync", "No network means syncing fails"),

		// FAULT HYPOTHESES, WHICH REQUIRE STRONGER ANTECEDENTS
		rule_t({ "power_unstable", "system_restarts" }, "fault_power_supply", "Unstable power AND restarts indicate power supply fault"),
		rule_t({ "battery_low", "charging_not_working", "old_battery" }, "fault_battery", "Low, not charging, and aged battery indicates battery fault"),
		rule_t({ "no_wifi", "router_off", "cannot_sync" }, "fault_network", "No Wi\xe2\x80\x91" "Fi, router off, and cannot sync indicates network fault"),
	};

	return rule_set_t("backward", rules);
}


} // end of kb

} // end of hornet
