#include <algorithm>

#include "../inc/decomposer.h"
#include "../inc/compiler.h"
#include "../inc/errors.h"
#include "../inc/synthesizer.h"
#include "../inc/util.h"

namespace {

const char* const DEMAND_TYPES[] = { "fuelStation", "lowPurity", "highPurity" };

std::string first_token(const std::string &s)
{
	const auto p = s.find('_');
	return (p == std::string::npos) ? s : s.substr(0, p);
}

std::string rest_tokens(const std::string &s)
{
	const auto p = s.find('_');
	return (p == std::string::npos) ? "" : s.substr(p + 1);
}

std::string last_token(const std::string &s)
{
	const auto p = s.rfind('_');
	return (p == std::string::npos) ? s : s.substr(p + 1);
}

void keep_rows(Table &t, double tol, const std::string &column, double excluded)
{
	std::vector<TableRow> kept;
	for (const auto &row : t.rows) {
		const double v = row.get(column);
		if (v > tol && !isclose(v, excluded)) kept.push_back(row);
	}
	t.rows.swap(kept);
}

SiteEntry make_entry(const TableRow &row)
{
	SiteEntry e;
	e.values = row.values;
	return e;
}

}

double TableRow::get(const std::string &column) const
{
	auto it = values.find(column);
	if (it == values.end()) throw MalformedReferenceError("row " + id + " has no column " + column);
	return it->second;
}

const TableRow *Table::find(const std::string &id) const
{
	for (const auto &row : rows) {
		if (row.id == id) return &row;
	}
	return nullptr;
}

double Table::total(const std::string &column) const
{
	double sum = 0;
	for (const auto &row : rows) sum += row.get(column);
	return sum;
}

// solved value when the column is a variable family, coefficient when it is a
// parameter, zero for identifiers outside the declared set
double SolutionDecomposer::lookup(const std::string &column, const std::string &id) const
{
	if (m.has_family(column)) {
		return m.in_set(m.family_domain(column), id) ? sol.value(column, id) : 0.0;
	}
	if (m.has_param(column)) {
		const Parameter &p = m.get_param(column);
		return m.in_set(p.get_domain(), id) ? p.get(id) : 0.0;
	}
	throw MalformedReferenceError("column " + column + " is neither a variable nor a parameter");
}

Table SolutionDecomposer::join(const std::string &index_name, const std::string &set, const std::vector<std::string> &columns) const
{
	Table t(index_name, columns);
	for (const auto &id : m.set(set).items()) {
		TableRow row;
		row.id = id;
		for (const auto &c : columns) row.set(c, lookup(c, id));
		t.rows.push_back(row);
	}
	return t;
}

void SolutionDecomposer::collectTables()
{
	std::vector<std::string> prod_columns;
	for (const auto &k : m.set("ccs").items()) {
		prod_columns.push_back("can_" + k);
		prod_columns.push_back(k + "_built");
		prod_columns.push_back(k + "_capacity_h2");
		prod_columns.push_back(k + "_checs");
	}
	const std::vector<std::string> prod_common = {
		"prod_capacity", "prod_utilization", "prod_h", "prod_cost_capital", "prod_cost_fixed", "prod_cost_variable",
		"prod_e_price", "prod_ng_price", "h2_tax_credit", "co2_emissions_rate", "ccs_capture_rate", "chec_per_ton", "prod_checs"
	};
	prod_columns.insert(prod_columns.end(), prod_common.begin(), prod_common.end());
	out.production = join("producer", "producers", prod_columns);

	out.conversion = join("converter", "converters", {
		"conv_capacity", "conv_cost_capital", "conv_cost_fixed", "conv_cost_variable", "conv_e_price", "conv_utilization",
		"fuelStation_cost_capital_subsidy" });

	out.consumption = join("consumer", "consumers", { "cons_carbonSensitive", "cons_h", "cons_checs", "cons_price", "cons_size" });

	const std::vector<std::string> dist_columns = {
		"dist_capacity", "dist_cost_capital", "dist_cost_fixed", "dist_cost_variable", "dist_flowLimit", "dist_h" };
	out.distribution = Table("arc", dist_columns);
	for (int a : g.live_arcs()) {
		TableRow row;
		row.id = g.arc_name(a);
		row.arc_start = g.node(g.arc(a).start).name;
		row.arc_end = g.node(g.arc(a).end).name;
		for (const auto &c : dist_columns) row.set(c, lookup(c, row.id));
		out.distribution.rows.push_back(row);
	}
}

std::vector<TableRow> SolutionDecomposer::discoverPrices()
{
	std::vector<TableRow> buying;
	out.prices.clear();
	if (!settings.find_prices) return buying;

	for (const auto &hub : price_hub_list(settings, g.hubs())) {
		for (const char* demand_type : DEMAND_TYPES) {
			std::vector<const TableRow*> candidates;
			for (const auto &row : out.consumption.rows) {
				const Node &node = g.node(row.id);
				if (node.kind() == NodeKind::PriceProbe && node.hub == hub && node.cls.technology == demand_type) candidates.push_back(&row);
			}
			// scanned in increasing price whatever the ladder direction
			std::stable_sort(candidates.begin(), candidates.end(), [](const TableRow *a, const TableRow *b) {
				return a->get("cons_price") < b->get("cons_price");
			});

			const TableRow *chosen = nullptr;
			for (const TableRow *row : candidates) {
				if (!isclose(row->get("cons_h"), settings.price_demand)) continue;
				if (chosen == nullptr) {
					chosen = row;
					if (settings.price_tie_break == PriceTieBreak::FirstMatch) break;
				}
				else if (row->get("cons_price") < chosen->get("cons_price")) {
					chosen = row;
				}
			}
			if (chosen == nullptr) continue;
			DiscoveredPrice p;
			p.hub = hub;
			p.demand_type = demand_type;
			p.probe = chosen->id;
			p.price = chosen->get("cons_price") / PRICE_PER_KG_TO_TON;
			out.prices.push_back(p);
			buying.push_back(*chosen);
		}
	}
	return buying;
}

void SolutionDecomposer::filterNoise()
{
	const double tol = settings.output_tolerance;
	// flows of exactly the probe demand belong to price probes
	const double probe_demand = settings.find_prices ? settings.price_demand : 0.0;
	keep_rows(out.production, tol, "prod_capacity", -1.0);
	keep_rows(out.conversion, tol, "conv_capacity", -1.0);
	keep_rows(out.consumption, tol, "cons_h", probe_demand);
	keep_rows(out.distribution, tol, "dist_h", probe_demand);
}

void SolutionDecomposer::mergeRetrofits()
{
	Table &prod = out.production;
	for (auto &row : prod.rows) row.set("ccs_retrofit_variable_costs", 0.0);

	for (const auto &k : m.set("ccs").items()) {
		const double pct = m.param("ccs_percent_co2_captured", k);
		const double tax = m.param("ccs_h2_tax_credit", k);
		const double variable = m.param("ccs_variable_usdPerTon", k);
		for (auto &row : prod.rows) {
			if (row.get(k + "_built") < 0.5) continue;
			const double rate = row.get("co2_emissions_rate");
			row.set("prod_checs", row.get(k + "_checs"));
			row.set("ccs_retrofit_variable_costs", row.get("prod_h") * rate * pct * variable);
			row.set("co2_emissions_rate", rate * (1 - pct));
			row.set("chec_per_ton", settings.fractional_chec ? pct : 1.0);
			row.set("ccs_capture_rate", pct);
			row.set("h2_tax_credit", tax);
		}
	}

	// the retrofit families are folded into the columns above
	std::vector<std::string> columns;
	for (const auto &c : prod.columns) {
		bool retrofit = starts_with(c, "can_");
		for (const auto &k : m.set("ccs").items()) {
			if (starts_with(c, k + "_")) retrofit = true;
		}
		if (retrofit) {
			for (auto &row : prod.rows) row.values.erase(c);
		}
		else {
			columns.push_back(c);
		}
	}
	columns.push_back("ccs_retrofit_variable_costs");
	prod.columns = columns;
}

void SolutionDecomposer::deriveProductionColumns()
{
	Table &prod = out.production;
	const double divisor = settings.capital_divisor();
	for (auto &row : prod.rows) {
		const double h = row.get("prod_h");
		for (const char* c : { "prod_cost_capital", "prod_cost_fixed", "prod_cost_variable", "prod_e_price", "prod_ng_price", "h2_tax_credit" }) {
			row.set(c, row.get(c) * h);
		}
		row.set("prod_cost_capital", row.get("prod_cost_capital") / divisor);

		const double rate = row.get("co2_emissions_rate");
		const double capture = row.get("ccs_capture_rate");
		row.set("co2_emitted", rate * h);
		row.set("carbon_tax", rate * h * settings.carbon_price);
		// the emission rate of a capturing producer is already net of the captured share
		const double captured = (capture > 0 && capture < 1) ? rate * h * capture / (1 - capture) : capture * h;
		row.set("co2_captured", captured);
		row.set("carbon_capture_tax_credit", captured * settings.carbon_capture_credit);

		const double costs = row.get("prod_cost_capital") + row.get("prod_cost_fixed") + row.get("prod_cost_variable")
			+ row.get("ccs_retrofit_variable_costs") + row.get("prod_e_price") + row.get("prod_ng_price") + row.get("carbon_tax");
		row.set("total_cost", costs - row.get("carbon_capture_tax_credit") - row.get("h2_tax_credit"));
	}
	for (const char* c : { "co2_emitted", "carbon_tax", "co2_captured", "carbon_capture_tax_credit", "total_cost" }) {
		prod.columns.push_back(c);
	}
}

OutputTable SolutionDecomposer::decompose()
{
	if (!sol.is_optimal()) throw std::logic_error("only an optimal solution can be decomposed");
	PRINT_SECTION("Decomposing the solution");
	collectTables();
	const std::vector<TableRow> probes = discoverPrices();
	filterNoise();
	out.consumption.rows.insert(out.consumption.rows.end(), probes.begin(), probes.end());
	mergeRetrofits();
	deriveProductionColumns();

	out.h2_consumed = out.consumption.total("cons_h");
	out.h2_produced = out.production.total("prod_h");
	std::cout << "Summary Results:" << std::endl;
	std::cout << "Hydrogen Consumed (Tonnes/day): " << out.h2_consumed << std::endl;
	std::cout << "Hydrogen Produced (Tonnes/day): " << out.h2_produced << std::endl;
	for (const auto &p : out.prices) {
		std::cout << "Price of " << p.demand_type << " hydrogen at " << p.hub << " (USD/kg): " << p.price << std::endl;
	}
	return out;
}

OutputTable decompose(const Solution &solution, const OptimizationModel &model, const Network &g, const Settings &settings)
{
	SolutionDecomposer decomposer(solution, model, g, settings);
	return decomposer.decompose();
}

OutputTable decompose(const Solution &solution, const Network &g, const Settings &settings)
{
	ModelCompiler compiler(g, settings);
	compiler.createNodeSets();
	compiler.createArcSets();
	compiler.createParams();
	compiler.createVariables();
	return decompose(solution, compiler.model(), g, settings);
}

SiteReport per_site(const OutputTable &table, const std::string &hub)
{
	const std::string prefix = hub + "_";
	SiteReport site;

	for (const auto &row : table.production.rows) {
		if (starts_with(row.id, prefix)) site.production[last_token(row.id)] = make_entry(row);
	}
	for (const auto &row : table.conversion.rows) {
		if (starts_with(row.id, prefix)) site.conversion[last_token(row.id)] = make_entry(row);
	}
	for (const auto &row : table.consumption.rows) {
		if (starts_with(row.id, prefix)) site.consumption[row.id.substr(prefix.size())] = make_entry(row);
	}

	for (const auto &row : table.distribution.rows) {
		const bool from_hub = starts_with(row.arc_start, prefix);
		const bool to_hub = starts_with(row.arc_end, prefix);
		SiteEntry e = make_entry(row);
		if (from_hub && to_hub) {
			const std::string source_class = row.arc_start.substr(prefix.size());
			const std::string destination_class = row.arc_end.substr(prefix.size());
			e.labels["source_class"] = source_class;
			e.labels["destination_class"] = destination_class;
			site.local[source_class + "_TO_" + destination_class] = e;
		}
		else if (from_hub || to_hub) {
			if (row.get("dist_h") <= 0) continue;
			const std::string source_class = from_hub ? row.arc_start.substr(prefix.size()) : row.arc_start;
			e.labels["source"] = first_token(row.arc_start);
			e.labels["source_class"] = source_class;
			e.labels["destination"] = first_token(row.arc_end);
			e.labels["destination_class"] = rest_tokens(row.arc_end);
			SiteEntries &entries = from_hub ? site.outgoing : site.incoming;
			entries[source_class + "_TO_" + row.arc_end] = e;
		}
	}
	return site;
}

std::map<std::string, SiteReport> per_site(const OutputTable &table, const std::vector<std::string> &hubs)
{
	std::map<std::string, SiteReport> sites;
	for (const auto &hub : hubs) sites[hub] = per_site(table, hub);
	return sites;
}
