#include <sstream>
#include "../inc/synthesizer.h"
#include "../inc/errors.h"
#include "../inc/util.h"

namespace {
const char* const PURITIES[] = { "lowPurity", "highPurity" };
const char* const DEMAND_TYPES[] = { "fuelStation", "lowPurity", "highPurity" };
}

std::string price_label(double price)
{
	std::ostringstream ss;
	ss.precision(12);
	ss << price;
	std::string s = ss.str();
	if (s.find('.') == std::string::npos && s.find('e') == std::string::npos) s += ".0";
	return s;
}

std::string price_node_name(const std::string &hub, const std::string &demand_type, double price)
{
	return hub + "_price" + cap_first(demand_type) + "_" + price_label(price);
}

std::vector<std::string> price_hub_list(const Settings &settings, const std::vector<std::string> &all_hubs)
{
	return settings.price_all_hubs ? all_hubs : settings.price_hubs;
}

const Hub &NetworkSynthesizer::find_hub(const std::string &name) const
{
	for (const auto &hub : data.hubs) {
		if (hub.name == name) return hub;
	}
	throw MissingInputError("hub '" + name + "' is not in the hub table");
}

const ProductionTech &NetworkSynthesizer::find_production(const std::string &type) const
{
	for (const auto &tech : data.production) {
		if (tech.type == type) return tech;
	}
	throw MissingInputError("production technology '" + type + "' is not in the production tables");
}

const DistributionTech &NetworkSynthesizer::pipeline() const
{
	for (const auto &d : data.distribution) {
		if (d.is_pipeline()) return d;
	}
	throw MissingInputError("the distribution table has no pipeline row");
}

void NetworkSynthesizer::add_free_arc(const std::string &start, const std::string &end, ArcKind kind, const std::string &tech)
{
	g.add_arc(start, end, Arc::free_flow(kind, tech));
}

void NetworkSynthesizer::initializeHubs()
{
	const auto &pipe = pipeline();
	std::vector<std::string> hub_names;

	for (const auto &hub : data.hubs) {
		const std::string &h = hub.name;
		hub_names.push_back(h);

		// 1) storage/transfer centers, distributors and demand categories
		g.add_node(Node(h + "_center_lowPurity", h, NodeClass(NodeKind::CenterLowPurity)));
		g.add_node(Node(h + "_center_highPurity", h, NodeClass(NodeKind::CenterHighPurity)));
		for (const auto &d : data.distribution) {
			if (d.is_pipeline()) {
				g.add_node(Node(h + "_dist_pipelineLowPurity", h, NodeClass(NodeKind::PipelineLowPurity)));
				g.add_node(Node(h + "_dist_pipelineHighPurity", h, NodeClass(NodeKind::PipelineHighPurity)));
			}
			else {
				// trucks are high purity
				g.add_node(Node(h + "_dist_" + d.name, h, NodeClass(NodeKind::TruckDepot, d.name)));
			}
		}
		g.add_node(Node(h + "_demand_lowPurity", h, NodeClass(NodeKind::DemandLowPurity)));
		g.add_node(Node(h + "_demand_highPurity", h, NodeClass(NodeKind::DemandHighPurity)));
		g.add_node(Node(h + "_demand_fuelStation", h, NodeClass(NodeKind::DemandFuelStation)));

		// 2) center <-> pipeline of the same purity
		for (const char* purity : PURITIES) {
			const std::string center = h + "_center_" + purity;
			const std::string pipe_node = h + "_dist_pipeline" + cap_first(purity);
			add_free_arc(center, pipe_node, ArcKind::FlowWithinHub);
			add_free_arc(pipe_node, center, ArcKind::ReverseFlowWithinHub);
		}

		// 3) the depot arc carries the fleet investment of each truck type
		for (const auto &d : data.distribution) {
			if (!d.is_truck()) continue;
			Arc depot = Arc::free_flow(ArcKind::HubDepot, d.name);
			depot.capital_usdPerUnit = d.capital_usdPerUnit * hub.capital_pm;
			depot.fixed_usdPerUnitPerDay = d.fixed_usdPerUnitPerDay * hub.capital_pm;
			depot.flowLimit_tonsPerDay = d.flowLimit_tonsPerDay;
			g.add_arc(h + "_center_highPurity", h + "_dist_" + d.name, depot);
		}

		// 4) distributors -> demand categories
		for (const auto &d : data.distribution) {
			Arc to_demand = Arc::free_flow(ArcKind::FlowToDemandNode);
			to_demand.flowLimit_tonsPerDay = d.flowLimit_tonsPerDay;
			const std::string dist_node = d.is_pipeline() ? h + "_dist_pipelineHighPurity" : h + "_dist_" + d.name;
			for (const char* demand_type : DEMAND_TYPES) {
				g.add_arc(dist_node, h + "_demand_" + demand_type, to_demand);
			}
		}
		Arc low_purity = Arc::free_flow(ArcKind::FlowToDemandNode);
		low_purity.flowLimit_tonsPerDay = pipe.flowLimit_tonsPerDay;
		g.add_arc(h + "_dist_pipelineLowPurity", h + "_demand_lowPurity", low_purity);

		// 5) a purifier is spliced in here by the converter pass
		add_free_arc(h + "_center_lowPurity", h + "_center_highPurity", ArcKind::FlowThroughPurifier);
	}
	g.set_hubs(hub_names);
	g.set_ccs(data.ccs);
}

void NetworkSynthesizer::addHubArcs()
{
	const auto &pipe = pipeline();

	for (const auto &record : data.arcs) {
		const Hub &a = find_hub(record.start_hub);
		const Hub &b = find_hub(record.end_hub);
		const double pm = (a.capital_pm + b.capital_pm) / 2;
		const double length = record.km_road;
		const std::pair<std::string, std::string> directions[] = {
			std::make_pair(a.name, b.name), std::make_pair(b.name, a.name) };

		for (const auto &dir : directions) {
			for (const char* purity : PURITIES) {
				const bool high = std::string(purity) == "highPurity";
				Arc arc = Arc::free_flow(high ? ArcKind::PipelineHighPurity : ArcKind::PipelineLowPurity);
				arc.km_length = length;
				arc.capital_usdPerUnit = pipe.capital_usdPerUnit * length * pm;
				arc.fixed_usdPerUnitPerDay = pipe.fixed_usdPerUnitPerDay * length;
				arc.variable_usdPerTon = pipe.variable_usdPerKilometerTon * length;
				arc.flowLimit_tonsPerDay = pipe.flowLimit_tonsPerDay;
				// an existing pipeline is a low purity pipeline
				arc.existing = high ? 0 : record.exist_pipeline;
				g.add_arc(dir.first + "_dist_pipeline" + cap_first(purity),
							 dir.second + "_dist_pipeline" + cap_first(purity), arc);
			}

			for (const auto &d : data.distribution) {
				if (!d.is_truck()) continue;
				Arc route = Arc::free_flow(ArcKind::TruckRoute, d.name);
				route.km_length = length;
				route.variable_usdPerTon = d.variable_usdPerKilometerTon * length;
				route.flowLimit_tonsPerDay = d.flowLimit_tonsPerDay;
				g.add_arc(dir.first + "_dist_" + d.name, dir.second + "_dist_" + d.name, route);
			}
		}
	}
}

void NetworkSynthesizer::addConsumers()
{
	for (const auto &hub : data.hubs) {
		for (const auto &sector : data.demand) {
			const double demand = hub.demand_for(sector.sector);
			if (demand == 0) continue;

			const std::string demand_node = hub.name + "_demand_" + sector.demand_type;
			if (!g.has_node(demand_node)) {
				throw MissingInputError("demand sector '" + sector.sector + "' has unknown demand type '" + sector.demand_type + "'");
			}

			Node indifferent(hub.name + "_demandSector_" + sector.sector, hub.name,
								  NodeClass(NodeKind::DemandSector, sector.sector));
			indifferent.attrs = sector.attrs;
			indifferent.attrs.set("breakevenPrice", sector.breakeven_price);
			indifferent.attrs.set("carbonSensitiveFraction", sector.carbon_sensitive_fraction);
			indifferent.attrs.set("size", demand * (1 - sector.carbon_sensitive_fraction));
			indifferent.attrs.set("carbonSensitive", 0);

			Node sensitive(indifferent);
			sensitive.name = indifferent.name + "_carbonSensitive";
			sensitive.attrs.set("size", demand * sector.carbon_sensitive_fraction);
			sensitive.attrs.set("carbonSensitive", 1);

			g.add_node(indifferent);
			g.add_node(sensitive);
			add_free_arc(demand_node, indifferent.name, ArcKind::FlowToDemandSector);
			add_free_arc(demand_node, sensitive.name, ArcKind::FlowToDemandSector);
		}
	}
}

void NetworkSynthesizer::addProducers()
{
	for (const auto &hub : data.hubs) {
		for (const auto &tech : data.production) {
			if (!hub.can_build(tech.type)) continue;

			Node prod(hub.name + "_production_" + tech.type, hub.name, NodeClass(NodeKind::Producer));
			prod.tech_type = tech.tech_type;
			prod.purity = tech.purity;
			prod.existing = false;
			prod.attrs = tech.attrs;
			prod.attrs.scale("capital_usdPerTonPerDay", hub.capital_pm);
			prod.attrs.scale("e_price", hub.e_pm);
			prod.attrs.scale("ng_price", hub.ng_pm);
			g.add_node(prod);

			const std::string center = hub.name + (tech.purity == Purity::Low ? "_center_lowPurity" : "_center_highPurity");
			add_free_arc(prod.name, center, ArcKind::FlowFromProducer);
		}
	}

	for (const auto &existing : data.existing_production) {
		const Hub &hub = find_hub(existing.hub);
		const ProductionTech &tech = find_production(existing.type);

		Node prod(hub.name + "_production_" + existing.type + "Existing", hub.name, NodeClass(NodeKind::Producer));
		prod.tech_type = tech.tech_type;
		prod.purity = tech.purity;
		prod.existing = true;
		prod.attrs = existing.attrs;
		g.add_node(prod);

		const std::string center = hub.name + (tech.purity == Purity::Low ? "_center_lowPurity" : "_center_highPurity");
		add_free_arc(prod.name, center, ArcKind::FlowFromProducer);
	}
}

void NetworkSynthesizer::addConverters()
{
	// start candidates are the nodes present before any converter is spliced in
	const int num_candidates = g.num_nodes();

	for (const auto &cv : data.conversion) {
		if (cv.is_pass()) continue;
		const NodeClass start_class = NodeClass::parse(cv.arc_start_class);
		const NodeClass end_class = NodeClass::parse(cv.arc_end_class);

		for (int n = 0; n < num_candidates; n++) {
			if (g.node(n).cls != start_class) continue;
			const std::string start_name = g.node(n).name;
			const Hub &hub = find_hub(g.node(n).hub);

			Node converter(hub.name + "_converter_" + cv.name, hub.name, NodeClass(NodeKind::Converter, cv.name));
			converter.attrs = cv.attrs;
			converter.attrs.scale("capital_usdPerTonPerDay", hub.capital_pm);
			converter.attrs.scale("e_price", hub.e_pm);
			g.add_node(converter);

			// collect first, then rewrite
			std::vector<int> matches;
			for (int a : g.out(n)) {
				if (g.node(g.arc(a).end).cls == end_class) matches.push_back(a);
			}
			for (int a : matches) {
				const Arc old = g.arc(a);
				const std::string end_name = g.node(old.end).name;

				Arc into = Arc::free_flow(ArcKind::IntoConverter, cv.name);
				into.flowLimit_tonsPerDay = old.flowLimit_tonsPerDay;
				g.remove_arc(a);
				g.add_arc(start_name, converter.name, into);
				g.add_arc(converter.name, end_name, old);
			}
		}
	}
}

void NetworkSynthesizer::addPriceNodes()
{
	if (!settings.find_prices) return;

	const auto prices = settings.price_tracking.values();
	for (const auto &ph : price_hub_list(settings, g.hubs())) {
		find_hub(ph);
		for (double p : prices) {
			for (const char* demand_type : DEMAND_TYPES) {
				Node probe(price_node_name(ph, demand_type, p), ph, NodeClass(NodeKind::PriceProbe, demand_type));
				probe.attrs.set("breakevenPrice", p * PRICE_PER_KG_TO_TON);
				probe.attrs.set("size", settings.price_demand);
				probe.attrs.set("carbonSensitive", 0);
				g.add_node(probe);
				add_free_arc(ph + "_demand_" + demand_type, probe.name, ArcKind::PriceLink);
			}
		}
	}
}

Network NetworkSynthesizer::build()
{
	initializeHubs();
	addHubArcs();
	addConsumers();
	addProducers();
	addConverters();
	addPriceNodes();
	g.freeze();
	PRINT_SUBSECTION("network has " << g.num_nodes() << " nodes and " << g.num_arcs() << " arcs");
	return g;
}

Network synthesize(const InputData &data, const Settings &settings)
{
	NetworkSynthesizer synthesizer(data, settings);
	return synthesizer.build();
}
