#include <stdexcept>
#include "../inc/compiler.h"
#include "../inc/errors.h"
#include "../inc/util.h"

ModelCompiler::ModelCompiler(const Network &_g, const Settings &_settings) : g(_g), settings(_settings)
{
	if (!g.is_frozen()) throw std::logic_error("the network must be frozen before it is compiled");
}

std::vector<std::string> ModelCompiler::ccs_names() const
{
	std::vector<std::string> names;
	for (const auto &ccs : g.ccs_technologies()) names.push_back(ccs.name);
	return names;
}

void ModelCompiler::createNodeSets()
{
	std::vector<std::string> nodes, producers, existing, fresh, thermal, new_thermal, new_electric;
	std::vector<std::string> consumers, converters, fuel_stations, trucks;

	for (const auto &node : g.get_nodes()) {
		nodes.push_back(node.name);
		switch (node.kind())
		{
		case NodeKind::Producer:
			producers.push_back(node.name);
			if (node.existing) {
				existing.push_back(node.name);
			}
			else {
				fresh.push_back(node.name);
				if (node.tech_type == TechType::THERMAL) new_thermal.push_back(node.name);
				else new_electric.push_back(node.name);
			}
			if (node.tech_type == TechType::THERMAL) thermal.push_back(node.name);
			break;
		case NodeKind::DemandSector:
		case NodeKind::PriceProbe:
			consumers.push_back(node.name);
			break;
		case NodeKind::Converter:
			converters.push_back(node.name);
			if (node.cls.technology.find("fuelDispenser") != std::string::npos) fuel_stations.push_back(node.name);
			break;
		case NodeKind::TruckDepot:
			if (node.cls.technology.find("truck") != std::string::npos) trucks.push_back(node.name);
			break;
		default:
			break;
		}
	}

	m.addSet("nodes", nodes);
	m.addSet("producers", producers);
	m.addSet("existing_producers", existing);
	m.addSet("new_producers", fresh);
	m.addSet("thermal_producers", thermal);
	m.addSet("new_thermal_producers", new_thermal);
	m.addSet("new_electric_producers", new_electric);
	m.addSet("consumers", consumers);
	m.addSet("converters", converters);
	m.addSet("fuel_stations", fuel_stations);
	m.addSet("truck_depots", trucks);
	m.addSet("ccs", ccs_names());
}

void ModelCompiler::createArcSets()
{
	std::vector<std::string> arcs, distribution, existing, consumer, converter;
	for (int a : g.live_arcs()) {
		const Arc &arc = g.arc(a);
		const std::string id = arc_id(a);
		arcs.push_back(id);
		if (arc.is_distribution()) distribution.push_back(id);
		if (arc.existing >= 1) existing.push_back(id);
		if (arc.kind == ArcKind::FlowToDemandSector) consumer.push_back(id);
		if (g.node(arc.start).kind() == NodeKind::Converter || g.node(arc.end).kind() == NodeKind::Converter) {
			converter.push_back(id);
		}
	}
	m.addSet("arcs", arcs);
	m.addSet("distribution_arcs", distribution);
	m.addSet("existing_arcs", existing);
	m.addSet("consumer_arcs", consumer);
	m.addSet("converter_arcs", converter);
}

void ModelCompiler::createParams()
{
	// distribution
	Parameter &dist_capital = m.addParam("dist_cost_capital", "distribution_arcs");
	Parameter &dist_fixed = m.addParam("dist_cost_fixed", "distribution_arcs");
	Parameter &dist_variable = m.addParam("dist_cost_variable", "distribution_arcs");
	Parameter &dist_limit = m.addParam("dist_flowLimit", "distribution_arcs");
	Parameter &dist_existing = m.addParam("dist_existing", "existing_arcs");
	for (int a : g.live_arcs()) {
		const Arc &arc = g.arc(a);
		const std::string id = arc_id(a);
		if (arc.is_distribution()) {
			dist_capital.set(id, arc.capital_usdPerUnit);
			dist_fixed.set(id, arc.fixed_usdPerUnitPerDay);
			dist_variable.set(id, arc.variable_usdPerTon);
			dist_limit.set(id, arc.flowLimit_tonsPerDay);
		}
		if (arc.existing >= 1) dist_existing.set(id, arc.existing);
	}

	// node attributes, by parameter name, node set and attribute column
	struct NodeParam { const char* name; const char* domain; const char* column; };
	static const NodeParam node_params[] = {
		{ "prod_cost_capital", "producers", "capital_usdPerTonPerDay" },
		{ "prod_cost_fixed", "producers", "fixed_usdPerTon" },
		{ "prod_cost_variable", "producers", "variable_usdPerTon" },
		{ "prod_e_price", "producers", "e_price" },
		{ "prod_ng_price", "producers", "ng_price" },
		{ "co2_emissions_rate", "producers", "co2_emissions_per_h2_tons" },
		{ "prod_utilization", "producers", "utilization" },
		{ "grid_intensity", "new_electric_producers", "grid_intensity_tonsCO2_per_h2" },
		{ "chec_per_ton", "new_producers", "chec_per_ton" },
		{ "h2_tax_credit", "new_producers", "h2_tax_credit" },
		{ "min_h2", "new_producers", "min_h2" },
		{ "max_h2", "new_producers", "max_h2" },
		{ "ccs_capture_rate", "new_thermal_producers", "ccs_capture_rate" },
		{ "existing_capacity", "existing_producers", "capacity_tonPerDay" },
		{ "conv_cost_capital", "converters", "capital_usdPerTonPerDay" },
		{ "conv_cost_fixed", "converters", "fixed_usdPerTonPerDay" },
		{ "conv_cost_variable", "converters", "variable_usdPerTon" },
		{ "conv_e_price", "converters", "e_price" },
		{ "conv_utilization", "converters", "utilization" },
		{ "cons_price", "consumers", "breakevenPrice" },
		{ "cons_size", "consumers", "size" },
		{ "cons_carbonSensitive", "consumers", "carbonSensitive" },
		{ "avoided_emissions", "consumers", "avoided_emissions_tonsCO2_per_H2" },
	};
	for (const auto &np : node_params) {
		Parameter &p = m.addParam(np.name, np.domain);
		for (const auto &id : m.set(np.domain).items()) {
			p.set(id, g.node(id).attr(np.column));
		}
	}

	// retrofit eligibility, one flag per CCS technology
	for (const auto &ccs : ccs_names()) {
		Parameter &p = m.addParam("can_" + ccs, "producers");
		for (const auto &id : m.set("producers").items()) {
			p.set(id, g.node(id).attr("can_" + ccs));
		}
	}

	Parameter &ccs_pct = m.addParam("ccs_percent_co2_captured", "ccs");
	Parameter &ccs_tax = m.addParam("ccs_h2_tax_credit", "ccs");
	Parameter &ccs_var = m.addParam("ccs_variable_usdPerTon", "ccs");
	for (const auto &ccs : g.ccs_technologies()) {
		ccs_pct.set(ccs.name, ccs.percent_co2_captured);
		ccs_tax.set(ccs.name, ccs.h2_tax_credit);
		ccs_var.set(ccs.name, ccs.variable_usdPerTonCO2);
	}
}

void ModelCompiler::createVariables()
{
	// distribution
	m.addVars("dist_capacity", "arcs", VarType::INTEGER);
	m.addVars("dist_h", "arcs", VarType::CONTINUOUS);

	// production
	m.addVars("prod_exists", "producers", VarType::BINARY);
	m.addVars("prod_capacity", "producers", VarType::CONTINUOUS);
	m.addVars("prod_h", "producers", VarType::CONTINUOUS);

	// conversion
	m.addVars("conv_capacity", "converters", VarType::CONTINUOUS);

	// consumption
	m.addVars("cons_h", "consumers", VarType::CONTINUOUS);
	m.addVars("cons_checs", "consumers", VarType::CONTINUOUS);

	// retrofit
	for (const auto &ccs : ccs_names()) {
		m.addVars(ccs + "_built", "existing_producers", VarType::BINARY);
		m.addVars(ccs + "_co2_captured", "existing_producers", VarType::CONTINUOUS);
		m.addVars(ccs + "_capacity_h2", "existing_producers", VarType::CONTINUOUS);
		m.addVars(ccs + "_checs", "existing_producers", VarType::CONTINUOUS);
	}

	m.addVars("prod_checs", "new_producers", VarType::CONTINUOUS);
	m.addVars("fuelStation_cost_capital_subsidy", "fuel_stations", VarType::CONTINUOUS);
}

void ModelCompiler::buildObjective()
{
	const double divisor = settings.capital_divisor();
	if (divisor <= 0) throw std::invalid_argument("the capital annuity divisor must be positive");
	const double markup = 1 + settings.fixedcost_percent;
	LinExpr obj = 0;

	/* ******************* utility ******************* */
	for (const auto &c : m.set("consumers").items()) {
		// hydrogen consumed plus carbon tax avoided by the consumer
		obj += m.x("cons_h", c, m.param("cons_price", c) + m.param("avoided_emissions", c) * settings.carbon_price);
	}
	for (const auto &p : m.set("new_thermal_producers").items()) {
		obj += m.x("prod_h", p, settings.baseSMR_CO2_per_H2_tons * m.param("ccs_capture_rate", p) * settings.carbon_capture_credit);
	}
	for (const auto &p : m.set("new_producers").items()) {
		obj += m.x("prod_h", p, m.param("h2_tax_credit", p));
	}
	for (const auto &p : m.set("existing_producers").items()) {
		for (const auto &k : m.set("ccs").items()) {
			obj += m.x(k + "_co2_captured", p, settings.carbon_capture_credit);
			obj += m.x(k + "_capacity_h2", p, m.param("ccs_h2_tax_credit", k));
		}
	}

	/* ******************* production ******************* */
	for (const auto &p : m.set("producers").items()) {
		const double running = m.param("prod_cost_variable", p) + m.param("prod_e_price", p) + m.param("prod_ng_price", p);
		obj -= m.x("prod_h", p, running);
		obj -= m.x("prod_capacity", p, m.param("prod_cost_capital", p) / divisor * markup);
	}
	for (const auto &p : m.set("new_producers").items()) {
		obj -= m.x("prod_h", p, m.param("co2_emissions_rate", p) * settings.carbon_price);
	}
	for (const auto &p : m.set("existing_producers").items()) {
		const double rate = m.param("co2_emissions_rate", p);
		for (const auto &k : m.set("ccs").items()) {
			const double pct = m.param("ccs_percent_co2_captured", k);
			obj -= m.x(k + "_capacity_h2", p, rate * (1 - pct) * settings.carbon_price);
			obj -= m.x(k + "_co2_captured", p, m.param("ccs_variable_usdPerTon", k));
		}
	}

	/* ******************* distribution ******************* */
	for (const auto &a : m.set("distribution_arcs").items()) {
		obj -= m.x("dist_h", a, m.param("dist_cost_variable", a));
		obj -= m.x("dist_capacity", a, m.param("dist_cost_capital", a) / divisor * markup);
	}

	/* ******************* conversion ******************* */
	for (const auto &cv : m.set("converters").items()) {
		const double util = m.param("conv_utilization", cv);
		const double per_unit = util * (m.param("conv_cost_variable", cv) + m.param("conv_e_price", cv))
			+ m.param("conv_cost_capital", cv) / divisor * markup;
		obj -= m.x("conv_capacity", cv, per_unit);
	}

	m.setObjective(obj, true);
}

OptimizationModel ModelCompiler::compile()
{
	PRINT_SUBSECTION("declaring sets, parameters and variables");
	createNodeSets();
	createArcSets();
	createParams();
	createVariables();

	PRINT_SUBSECTION("initializing objective function");
	buildObjective();

	PRINT_SUBSECTION("initializing constraints");
	applyMassConservation();
	applyExistingInfrastructure();
	applyCapacityRelationships();
	applyChecs();
	applySubsidies();

	std::cout << "Number of variables: " << m.num_vars() << std::endl;
	std::cout << "Number of constraints: " << m.num_constrs() << std::endl;
	return m;
}

OptimizationModel compile(const Network &g, const Settings &settings)
{
	ModelCompiler compiler(g, settings);
	return compiler.compile();
}
