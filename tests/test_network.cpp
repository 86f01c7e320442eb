#include <stdexcept>

#include "test_util.h"
#include "../inc/network.h"
#include "../inc/errors.h"
#include "../inc/util.h"

static Network small_network(void)
{
   Network g;
   g.add_node(Node("A_center_highPurity", "A", NodeClass(NodeKind::CenterHighPurity)));
   g.add_node(Node("A_dist_pipelineHighPurity", "A", NodeClass(NodeKind::PipelineHighPurity)));
   g.add_node(Node("A_demand_highPurity", "A", NodeClass(NodeKind::DemandHighPurity)));
   g.add_arc("A_center_highPurity", "A_dist_pipelineHighPurity", Arc::free_flow(ArcKind::FlowWithinHub));
   g.add_arc("A_dist_pipelineHighPurity", "A_center_highPurity", Arc::free_flow(ArcKind::ReverseFlowWithinHub));
   g.add_arc("A_dist_pipelineHighPurity", "A_demand_highPurity", Arc::free_flow(ArcKind::FlowToDemandNode));
   return g;
}

static int test_class_tags(void)
{
   EXPECT(NodeClass(NodeKind::CenterLowPurity).tag() == "center_lowPurity", "center tag");
   EXPECT(NodeClass(NodeKind::TruckDepot, "truckLiquid").tag() == "dist_truckLiquid", "depot tag");
   EXPECT(NodeClass(NodeKind::DemandSector, "industry").tag() == "demandSector_industry", "sector tag");
   EXPECT(NodeClass(NodeKind::PriceProbe, "fuelStation").tag() == "price_fuelStation", "probe tag");

   EXPECT(NodeClass::parse("dist_pipelineLowPurity") == NodeClass(NodeKind::PipelineLowPurity), "pipeline is not a truck depot");
   EXPECT(NodeClass::parse("dist_truckGas") == NodeClass(NodeKind::TruckDepot, "truckGas"), "depot parse");
   EXPECT(NodeClass::parse("converter_fuelDispenser") == NodeClass(NodeKind::Converter, "fuelDispenser"), "converter parse");
   EXPECT(NodeClass::parse("demand_fuelStation") == NodeClass(NodeKind::DemandFuelStation), "demand parse");
   EXPECT_THROW(NodeClass::parse("warehouse"), MissingInputError, "unknown class tag");

   EXPECT(arc_tag(ArcKind::HubDepot, "truckLiquid") == "hub_depot_truckLiquid", "depot arc tag");
   EXPECT(arc_tag(ArcKind::TruckRoute, "truckLiquid") == "arc_truckLiquid", "route arc tag");
   EXPECT(arc_tag(ArcKind::PriceLink, "") == "", "price links have no class");
   return 0;
}

static int test_demand_kinds(void)
{
   EXPECT(demand_kind("lowPurity") == NodeKind::DemandLowPurity, "low purity demand");
   EXPECT(demand_type_name(NodeKind::DemandFuelStation) == "fuelStation", "fuel station name");
   EXPECT_THROW(demand_kind("ammonia"), MissingInputError, "unknown demand type");
   EXPECT_THROW(demand_type_name(NodeKind::Producer), MalformedReferenceError, "producer is no demand");
   EXPECT(is_consumer(NodeKind::PriceProbe) && is_consumer(NodeKind::DemandSector), "consumers");
   EXPECT(!is_consumer(NodeKind::DemandHighPurity), "demand hub is not a consumer");
   EXPECT(is_distributor(NodeKind::TruckDepot) && !is_distributor(NodeKind::CenterHighPurity), "distributors");
   return 0;
}

static int test_add_and_replace(void)
{
   Network g = small_network();
   EXPECT(g.num_nodes() == 3, "three nodes");
   EXPECT(g.num_arcs() == 3, "three arcs");
   EXPECT(g.out(g.node_id("A_dist_pipelineHighPurity")).size() == 2, "pipeline fans out twice");

   // same pair again replaces the arc
   Arc limited = Arc::free_flow(ArcKind::FlowToDemandNode);
   limited.flowLimit_tonsPerDay = 100;
   const int id = g.add_arc("A_dist_pipelineHighPurity", "A_demand_highPurity", limited);
   EXPECT(g.num_arcs() == 3, "replacement keeps the arc count");
   EXPECT(g.arc(id).flowLimit_tonsPerDay == 100, "replacement overwrites attributes");

   // same name again replaces the node
   Node center("A_center_highPurity", "A", NodeClass(NodeKind::CenterHighPurity));
   center.attrs.set("marker", 7);
   g.add_node(center);
   EXPECT(g.num_nodes() == 3, "replacement keeps the node count");
   EXPECT(g.node("A_center_highPurity").attr("marker") == 7, "replacement overwrites node attributes");

   EXPECT(g.arc_name(id) == "A_dist_pipelineHighPurity,A_demand_highPurity", "arc identifier");
   EXPECT(g.find_arc("A_demand_highPurity", "A_center_highPurity") == -1, "no reverse arc");
   return 0;
}

static int test_missing_endpoints(void)
{
   Network g = small_network();
   EXPECT_THROW(g.add_arc("A_center_highPurity", "B_center_highPurity", Arc::free_flow(ArcKind::PipelineHighPurity)),
      MissingInputError, "arc to a missing node");
   EXPECT_THROW(g.node_id("B_center_highPurity"), MalformedReferenceError, "lookup of a missing node");
   EXPECT_THROW(g.remove_arc(42), MalformedReferenceError, "removing an unknown arc");
   return 0;
}

static int test_remove_and_freeze(void)
{
   Network g = small_network();
   const int removed = g.find_arc("A_dist_pipelineHighPurity", "A_center_highPurity");
   g.remove_arc(removed);
   EXPECT(g.num_arcs() == 2, "tombstoned arc is not counted");
   EXPECT(g.find_arc("A_dist_pipelineHighPurity", "A_center_highPurity") == -1, "removed arc is gone");
   EXPECT_THROW(g.remove_arc(removed), MalformedReferenceError, "arc removed twice");

   g.freeze();
   EXPECT(g.is_frozen(), "frozen");
   EXPECT(g.live_arcs().size() == 2, "compacted arcs");
   for (int a : g.live_arcs()) {
      EXPECT(g.arc(a).id == a, "compacted ids are dense");
   }
   const int n = g.node_id("A_dist_pipelineHighPurity");
   EXPECT(g.out(n).size() == 1, "adjacency rebuilt after compaction");
   EXPECT(g.in(g.node_id("A_center_highPurity")).empty(), "no arc enters the center");

   EXPECT_THROW(g.add_node(Node("A_demand_lowPurity", "A", NodeClass(NodeKind::DemandLowPurity))), std::logic_error, "frozen add_node");
   EXPECT_THROW(g.add_arc("A_center_highPurity", "A_demand_highPurity", Arc::free_flow(ArcKind::FlowToDemandNode)),
      std::logic_error, "frozen add_arc");
   EXPECT_THROW(g.remove_arc(0), std::logic_error, "frozen remove_arc");
   return 0;
}

static int test_free_flow(void)
{
   const Arc a = Arc::free_flow(ArcKind::FlowWithinHub);
   EXPECT(a.capital_usdPerUnit == 0 && a.fixed_usdPerUnitPerDay == 0 && a.variable_usdPerTon == 0, "free arcs cost nothing");
   EXPECT(a.flowLimit_tonsPerDay == FREE_FLOW_LIMIT, "free arcs are effectively unlimited");
   EXPECT(a.existing == 0 && a.is_distribution(), "free arcs are new distribution arcs");
   EXPECT(!Arc::free_flow(ArcKind::PriceLink).is_distribution(), "price links are not distribution");
   return 0;
}

int main(void)
{
   RUN(test_class_tags);
   RUN(test_demand_kinds);
   RUN(test_add_and_replace);
   RUN(test_missing_endpoints);
   RUN(test_remove_and_freeze);
   RUN(test_free_flow);
   return 0;
}
