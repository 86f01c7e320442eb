#pragma once
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "tables.h"

enum class NodeKind {
   CenterLowPurity,
   CenterHighPurity,
   PipelineLowPurity,
   PipelineHighPurity,
   TruckDepot,				// any non-pipeline distributor, technology holds its name
   DemandLowPurity,
   DemandHighPurity,
   DemandFuelStation,
   DemandSector,			// technology holds the sector
   Producer,
   Converter,				// technology holds the converter name
   PriceProbe				// technology holds the demand type it probes
};

struct NodeClass
{
   NodeKind kind;
   std::string technology;

   NodeClass() : kind(NodeKind::CenterLowPurity) {}
   NodeClass(NodeKind _kind, const std::string &_tech = "") : kind(_kind), technology(_tech) {}

   std::string tag() const;
   static NodeClass parse(const std::string &tag);

   bool operator==(const NodeClass &other) const { return kind == other.kind && technology == other.technology; }
   bool operator!=(const NodeClass &other) const { return !(*this == other); }
};

enum class ArcKind {
   FlowWithinHub,
   ReverseFlowWithinHub,
   HubDepot,				// center -> truck depot, carries the fleet investment
   FlowToDemandNode,
   FlowThroughPurifier,
   PipelineLowPurity,
   PipelineHighPurity,
   TruckRoute,
   FlowToDemandSector,
   FlowFromProducer,
   IntoConverter,
   PriceLink				// no distribution class
};

std::string arc_tag(ArcKind kind, const std::string &technology);

bool is_center(NodeKind kind);
bool is_distributor(NodeKind kind);
bool is_demand_hub(NodeKind kind);
bool is_consumer(NodeKind kind);
NodeKind demand_kind(const std::string &demand_type);		// fuelStation/lowPurity/highPurity
std::string demand_type_name(NodeKind kind);

struct Node
{
   int id;
   std::string name;
   std::string hub;
   NodeClass cls;
   TechType tech_type;
   Purity purity;
   bool existing;
   AttributeBag attrs;

   Node() : id(-1), tech_type(TechType::NONE), purity(Purity::High), existing(false) {}
   Node(const std::string &_name, const std::string &_hub, const NodeClass &_cls)
      : id(-1), name(_name), hub(_hub), cls(_cls), tech_type(TechType::NONE), purity(Purity::High), existing(false) {}

   NodeKind kind() const { return cls.kind; }
   double attr(const std::string &key) const { return attrs.get(key); }
};

struct Arc
{
   int id;
   int start;
   int end;
   ArcKind kind;
   std::string technology;
   double km_length;
   double capital_usdPerUnit;
   double fixed_usdPerUnitPerDay;
   double variable_usdPerTon;
   double flowLimit_tonsPerDay;
   int existing;
   bool alive;

   // zero-cost, effectively unlimited arc
   static Arc free_flow(ArcKind kind, const std::string &technology = "");

   bool is_distribution() const { return kind != ArcKind::PriceLink; }
   std::string tag() const { return arc_tag(kind, technology); }
};

// Arena-indexed directed flow graph. Nodes are never removed; removed arcs are
// tombstoned until freeze() compacts them, after which the network is immutable.
class Network
{
private:
   std::vector<Node> nodes;
   std::vector<Arc> arcs;
   std::map<std::string, int> node_ids;
   std::map<std::pair<int, int>, int> arc_ids;
   std::vector< std::vector<int> > out_arcs;
   std::vector< std::vector<int> > in_arcs;
   std::vector<std::string> hub_names;
   std::vector<CcsTech> ccs;
   bool frozen;

   void check_mutable() const;

public:
   Network() : frozen(false) {}

   int add_node(const Node &node);
   int add_arc(const std::string &start, const std::string &end, Arc arc);
   void remove_arc(int id);
   void freeze();
   bool is_frozen() const { return frozen; }

   bool has_node(const std::string &name) const { return node_ids.count(name) > 0; }
   int node_id(const std::string &name) const;
   const Node &node(int id) const { return nodes[id]; }
   const Node &node(const std::string &name) const { return nodes[node_id(name)]; }
   const std::vector<Node> &get_nodes() const { return nodes; }
   int num_nodes() const { return static_cast<int>(nodes.size()); }

   const Arc &arc(int id) const { return arcs[id]; }
   int find_arc(const std::string &start, const std::string &end) const;
   std::vector<int> live_arcs() const;
   int num_arcs() const { return static_cast<int>(arc_ids.size()); }
   const std::vector<int> &out(int node) const { return out_arcs[node]; }
   const std::vector<int> &in(int node) const { return in_arcs[node]; }
   std::string arc_name(int id) const;

   void set_hubs(const std::vector<std::string> &_hubs) { check_mutable(); hub_names = _hubs; }
   const std::vector<std::string> &hubs() const { return hub_names; }
   void set_ccs(const std::vector<CcsTech> &_ccs) { check_mutable(); ccs = _ccs; }
   const std::vector<CcsTech> &ccs_technologies() const { return ccs; }
};
