#include <algorithm>
#include <stdexcept>
#include "../inc/network.h"
#include "../inc/errors.h"
#include "../inc/util.h"

std::string NodeClass::tag() const
{
	switch (kind)
	{
	case NodeKind::CenterLowPurity: return "center_lowPurity";
	case NodeKind::CenterHighPurity: return "center_highPurity";
	case NodeKind::PipelineLowPurity: return "dist_pipelineLowPurity";
	case NodeKind::PipelineHighPurity: return "dist_pipelineHighPurity";
	case NodeKind::TruckDepot: return "dist_" + technology;
	case NodeKind::DemandLowPurity: return "demand_lowPurity";
	case NodeKind::DemandHighPurity: return "demand_highPurity";
	case NodeKind::DemandFuelStation: return "demand_fuelStation";
	case NodeKind::DemandSector: return "demandSector_" + technology;
	case NodeKind::Producer: return "producer";
	case NodeKind::Converter: return "converter_" + technology;
	case NodeKind::PriceProbe: return technology.empty() ? "price" : "price_" + technology;
	}
	return "";
}

NodeClass NodeClass::parse(const std::string &tag)
{
	if (tag == "center_lowPurity") return NodeClass(NodeKind::CenterLowPurity);
	if (tag == "center_highPurity") return NodeClass(NodeKind::CenterHighPurity);
	if (tag == "dist_pipelineLowPurity") return NodeClass(NodeKind::PipelineLowPurity);
	if (tag == "dist_pipelineHighPurity") return NodeClass(NodeKind::PipelineHighPurity);
	if (tag == "demand_lowPurity") return NodeClass(NodeKind::DemandLowPurity);
	if (tag == "demand_highPurity") return NodeClass(NodeKind::DemandHighPurity);
	if (tag == "demand_fuelStation") return NodeClass(NodeKind::DemandFuelStation);
	if (tag == "producer") return NodeClass(NodeKind::Producer);
	if (tag == "price") return NodeClass(NodeKind::PriceProbe);
	if (starts_with(tag, "price_") && tag.size() > 6) return NodeClass(NodeKind::PriceProbe, tag.substr(6));
	if (starts_with(tag, "dist_") && tag.size() > 5) return NodeClass(NodeKind::TruckDepot, tag.substr(5));
	if (starts_with(tag, "demandSector_") && tag.size() > 13) return NodeClass(NodeKind::DemandSector, tag.substr(13));
	if (starts_with(tag, "converter_") && tag.size() > 10) return NodeClass(NodeKind::Converter, tag.substr(10));
	throw MissingInputError("unknown node class '" + tag + "'");
}

std::string arc_tag(ArcKind kind, const std::string &technology)
{
	switch (kind)
	{
	case ArcKind::FlowWithinHub: return "flow_within_hub";
	case ArcKind::ReverseFlowWithinHub: return "reverse_flow_within_hub";
	case ArcKind::HubDepot: return "hub_depot_" + technology;
	case ArcKind::FlowToDemandNode: return "flow_to_demand_node";
	case ArcKind::FlowThroughPurifier: return "flow_through_purifier";
	case ArcKind::PipelineLowPurity: return "arc_pipelineLowPurity";
	case ArcKind::PipelineHighPurity: return "arc_pipelineHighPurity";
	case ArcKind::TruckRoute: return "arc_" + technology;
	case ArcKind::FlowToDemandSector: return "flow_to_demand_sector";
	case ArcKind::FlowFromProducer: return "flow_from_producer";
	case ArcKind::IntoConverter: return "converter_" + technology;
	case ArcKind::PriceLink: return "";
	}
	return "";
}

bool is_center(NodeKind kind)
{
	return kind == NodeKind::CenterLowPurity || kind == NodeKind::CenterHighPurity;
}

bool is_distributor(NodeKind kind)
{
	return kind == NodeKind::PipelineLowPurity || kind == NodeKind::PipelineHighPurity || kind == NodeKind::TruckDepot;
}

bool is_demand_hub(NodeKind kind)
{
	return kind == NodeKind::DemandLowPurity || kind == NodeKind::DemandHighPurity || kind == NodeKind::DemandFuelStation;
}

bool is_consumer(NodeKind kind)
{
	return kind == NodeKind::DemandSector || kind == NodeKind::PriceProbe;
}

NodeKind demand_kind(const std::string &demand_type)
{
	if (demand_type == "fuelStation") return NodeKind::DemandFuelStation;
	if (demand_type == "lowPurity") return NodeKind::DemandLowPurity;
	if (demand_type == "highPurity") return NodeKind::DemandHighPurity;
	throw MissingInputError("unknown demand type '" + demand_type + "'");
}

std::string demand_type_name(NodeKind kind)
{
	switch (kind)
	{
	case NodeKind::DemandFuelStation: return "fuelStation";
	case NodeKind::DemandLowPurity: return "lowPurity";
	case NodeKind::DemandHighPurity: return "highPurity";
	default: break;
	}
	throw MalformedReferenceError("node kind is not a demand category");
}

Arc Arc::free_flow(ArcKind kind, const std::string &technology)
{
	Arc arc;
	arc.id = -1;
	arc.start = -1;
	arc.end = -1;
	arc.kind = kind;
	arc.technology = technology;
	arc.km_length = 0.0;
	arc.capital_usdPerUnit = 0.0;
	arc.fixed_usdPerUnitPerDay = 0.0;
	arc.variable_usdPerTon = 0.0;
	arc.flowLimit_tonsPerDay = FREE_FLOW_LIMIT;
	arc.existing = 0;
	arc.alive = true;
	return arc;
}

void Network::check_mutable() const
{
	if (frozen) throw std::logic_error("network is frozen");
}

int Network::add_node(const Node &node)
{
	check_mutable();
	auto it = node_ids.find(node.name);
	if (it != node_ids.end()) {
		// re-adding a node replaces its attributes
		const int id = it->second;
		nodes[id] = node;
		nodes[id].id = id;
		return id;
	}
	const int id = static_cast<int>(nodes.size());
	nodes.push_back(node);
	nodes.back().id = id;
	node_ids[node.name] = id;
	out_arcs.emplace_back();
	in_arcs.emplace_back();
	return id;
}

int Network::add_arc(const std::string &start, const std::string &end, Arc arc)
{
	check_mutable();
	if (!has_node(start)) throw MissingInputError("arc start node '" + start + "' is not in the network");
	if (!has_node(end)) throw MissingInputError("arc end node '" + end + "' is not in the network");
	arc.start = node_ids[start];
	arc.end = node_ids[end];
	arc.alive = true;

	const auto key = std::make_pair(arc.start, arc.end);
	auto it = arc_ids.find(key);
	if (it != arc_ids.end()) {
		arc.id = it->second;
		arcs[arc.id] = arc;
		return arc.id;
	}
	arc.id = static_cast<int>(arcs.size());
	arcs.push_back(arc);
	arc_ids[key] = arc.id;
	out_arcs[arc.start].push_back(arc.id);
	in_arcs[arc.end].push_back(arc.id);
	return arc.id;
}

void Network::remove_arc(int id)
{
	check_mutable();
	if (id < 0 || id >= static_cast<int>(arcs.size()) || !arcs[id].alive) {
		throw MalformedReferenceError("cannot remove unknown arc");
	}
	Arc &a = arcs[id];
	a.alive = false;
	arc_ids.erase(std::make_pair(a.start, a.end));
	auto &outs = out_arcs[a.start];
	outs.erase(std::remove(outs.begin(), outs.end(), id), outs.end());
	auto &ins = in_arcs[a.end];
	ins.erase(std::remove(ins.begin(), ins.end(), id), ins.end());
}

void Network::freeze()
{
	if (frozen) return;
	std::vector<Arc> live;
	live.reserve(arc_ids.size());
	for (const auto &a : arcs) {
		if (!a.alive) continue;
		live.push_back(a);
		live.back().id = static_cast<int>(live.size()) - 1;
	}
	arcs.swap(live);
	arc_ids.clear();
	for (auto &v : out_arcs) v.clear();
	for (auto &v : in_arcs) v.clear();
	for (const auto &a : arcs) {
		arc_ids[std::make_pair(a.start, a.end)] = a.id;
		out_arcs[a.start].push_back(a.id);
		in_arcs[a.end].push_back(a.id);
	}
	frozen = true;
}

int Network::node_id(const std::string &name) const
{
	auto it = node_ids.find(name);
	if (it == node_ids.end()) throw MalformedReferenceError("node '" + name + "' is not in the network");
	return it->second;
}

int Network::find_arc(const std::string &start, const std::string &end) const
{
	if (!has_node(start) || !has_node(end)) return -1;
	auto it = arc_ids.find(std::make_pair(node_ids.at(start), node_ids.at(end)));
	return (it == arc_ids.end()) ? -1 : it->second;
}

std::vector<int> Network::live_arcs() const
{
	std::vector<int> ids;
	ids.reserve(arc_ids.size());
	for (const auto &a : arcs) {
		if (a.alive) ids.push_back(a.id);
	}
	return ids;
}

std::string Network::arc_name(int id) const
{
	const Arc &a = arcs[id];
	return nodes[a.start].name + "," + nodes[a.end].name;
}
