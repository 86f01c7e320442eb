#include "../inc/compiler.h"
#include "../inc/errors.h"
#include "../inc/util.h"

/* ******************* mass conservation ******************* */
void ModelCompiler::applyMassConservation()
{
	// flow balance at every node; producers create and consumers absorb hydrogen
	for (int n = 0; n < g.num_nodes(); n++) {
		const std::string id = node_id(n);
		LinExpr xpr = 0;
		for (int a : g.in(n)) xpr += m.x("dist_h", arc_id(a));
		for (int a : g.out(n)) xpr -= m.x("dist_h", arc_id(a));
		if (m.in_set("producers", id)) {
			xpr += m.x("prod_h", id);
		}
		else if (m.in_set("consumers", id)) {
			xpr -= m.x("cons_h", id);
		}
		m.addConstr(var_name("flowBalance", id), xpr, Sense::EQUAL, 0);
	}

	// trucks bought at a depot are the ones sent out on its routes
	for (const auto &depot : m.set("truck_depots").items()) {
		const int n = g.node_id(depot);
		LinExpr in_trucks = 0, out_trucks = 0;
		for (int a : g.in(n)) {
			if (g.node(g.arc(a).start).kind() == NodeKind::Converter) {
				in_trucks += m.x("dist_capacity", arc_id(a));
			}
		}
		for (int a : g.out(n)) {
			const NodeKind kind = g.node(g.arc(a).end).kind();
			if (kind == NodeKind::Converter || is_distributor(kind) || is_demand_hub(kind) || kind == NodeKind::DemandSector) {
				out_trucks += m.x("dist_capacity", arc_id(a));
			}
		}
		m.addConstr(var_name("truckConsistency", depot), in_trucks, Sense::EQUAL, out_trucks);
	}

	for (const auto &c : m.set("consumers").items()) {
		m.addConstr(var_name("consumerSize", c), m.x("cons_h", c), Sense::LESS_EQUAL, m.param("cons_size", c));
	}
}

/* ******************* capacity relationships ******************* */
void ModelCompiler::applyCapacityRelationships()
{
	for (const auto &a : m.set("distribution_arcs").items()) {
		m.addConstr(var_name("flowCapacity", a), m.x("dist_h", a), Sense::LESS_EQUAL,
			m.x("dist_capacity", a, m.param("dist_flowLimit", a)));
	}

	for (const auto &cv : m.set("converters").items()) {
		LinExpr flow_out = 0;
		for (int a : g.out(g.node_id(cv))) flow_out += m.x("dist_h", arc_id(a));
		m.addConstr(var_name("flowCapacityConverters", cv), flow_out, Sense::LESS_EQUAL,
			m.x("conv_capacity", cv, m.param("conv_utilization", cv)));
	}

	for (const auto &p : m.set("producers").items()) {
		m.addConstr(var_name("productionCapacity", p), m.x("prod_h", p), Sense::LESS_EQUAL,
			m.x("prod_capacity", p, m.param("prod_utilization", p)));
	}

	// both bounds collapse to zero when the producer is not built
	for (const auto &p : m.set("new_producers").items()) {
		m.addConstr(var_name("minProductionCapacity", p), m.x("prod_capacity", p), Sense::GREATER_EQUAL,
			m.x("prod_exists", p, m.param("min_h2", p)));
		m.addConstr(var_name("maxProductionCapacity", p), m.x("prod_capacity", p), Sense::LESS_EQUAL,
			m.x("prod_exists", p, m.param("max_h2", p)));
	}
}

/* ******************* existing infrastructure ******************* */
void ModelCompiler::applyExistingInfrastructure()
{
	for (const auto &a : m.set("existing_arcs").items()) {
		m.addConstr(var_name("flowCapacityExisting", a), m.x("dist_capacity", a), Sense::GREATER_EQUAL,
			m.param("dist_existing", a));
	}

	const auto &ccs = m.set("ccs").items();
	for (const auto &p : m.set("existing_producers").items()) {
		const double capacity = m.param("existing_capacity", p);
		const double rate = m.param("co2_emissions_rate", p);
		// largest value prod_h can take
		const double big_m = capacity * m.param("prod_utilization", p);

		m.addConstr(var_name("forceExistingProduction", p), m.x("prod_exists", p), Sense::EQUAL, 1);
		m.addConstr(var_name("productionCapacityExisting", p), m.x("prod_capacity", p), Sense::EQUAL, capacity);

		LinExpr built = 0;
		for (const auto &k : ccs) built += m.x(k + "_built", p);
		m.addConstr(var_name("onlyOneCCS", p), built, Sense::LESS_EQUAL, 1);

		for (const auto &k : ccs) {
			if (m.param("can_" + k, p) == 0) {
				// nothing else bounds the captured carbon of an ineligible retrofit
				m.addConstr(var_name(k + "Ineligible", p), m.x(k + "_co2_captured", p), Sense::EQUAL, 0);
				m.addConstr(var_name(k + "NotBuilt", p), m.x(k + "_built", p), Sense::EQUAL, 0);
			}
			m.addConstr(var_name(k + "CapacityRelationship", p),
				m.x(k + "_co2_captured", p, m.param("can_" + k, p)), Sense::EQUAL,
				m.x(k + "_capacity_h2", p, rate * m.param("ccs_percent_co2_captured", k)));

			// capacity_h2 == built * prod_h
			m.addConstr(var_name(k + "MustBuildAllUpper", p), m.x(k + "_capacity_h2", p), Sense::LESS_EQUAL,
				m.x(k + "_built", p, big_m));
			m.addConstr(var_name(k + "MustBuildAllOutput", p), m.x(k + "_capacity_h2", p), Sense::LESS_EQUAL,
				m.x("prod_h", p));
			m.addConstr(var_name(k + "MustBuildAllLower", p), m.x(k + "_capacity_h2", p), Sense::GREATER_EQUAL,
				m.x("prod_h", p) - LinExpr(big_m) + m.x(k + "_built", p, big_m));
		}
	}
}

/* ******************* clean hydrogen energy credits ******************* */
void ModelCompiler::applyChecs()
{
	LinExpr produced = 0, consumed = 0;

	for (const auto &p : m.set("existing_producers").items()) {
		for (const auto &k : m.set("ccs").items()) {
			const double share = settings.fractional_chec ? m.param("ccs_percent_co2_captured", k) : 1.0;
			m.addConstr(var_name(k + "Checs", p), m.x(k + "_checs", p), Sense::LESS_EQUAL,
				m.x(k + "_capacity_h2", p, share));
			produced += m.x(k + "_checs", p);
		}
	}

	for (const auto &p : m.set("new_producers").items()) {
		m.addConstr(var_name("productionChecs", p), m.x("prod_checs", p), Sense::EQUAL,
			m.x("prod_h", p, m.param("chec_per_ton", p)));
		produced += m.x("prod_checs", p);
	}

	for (const auto &c : m.set("consumers").items()) {
		m.addConstr(var_name("consumerChecs", c), m.x("cons_checs", c), Sense::EQUAL,
			m.x("cons_h", c, m.param("cons_carbonSensitive", c)));
		consumed += m.x("cons_checs", c);
	}

	m.addConstr("checsBalance", consumed, Sense::LESS_EQUAL, produced);
}

/* ******************* subsidies ******************* */
void ModelCompiler::applySubsidies()
{
	// SubsidyBillion is reported only, the budget is not a constraint
	for (const auto &fs : m.set("fuel_stations").items()) {
		const double subsidized = m.param("conv_cost_capital", fs) * (1 - settings.subsidy_cost_share_fraction);
		m.addConstr(var_name("subsidyConverter", fs), m.x("fuelStation_cost_capital_subsidy", fs), Sense::EQUAL,
			m.x("conv_capacity", fs, subsidized));
	}
}
