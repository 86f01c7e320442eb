#include "test_util.h"
#include "../inc/synthesizer.h"
#include "../inc/errors.h"
#include "../inc/util.h"

static ConversionTech fuel_dispenser(void)
{
   ConversionTech cv;
   cv.name = "fuelDispenserLiquid";
   cv.arc_start_class = "dist_truckLiquid";
   cv.arc_end_class = "demand_fuelStation";
   cv.attrs.set("capital_usdPerTonPerDay", 200000);
   cv.attrs.set("variable_usdPerTon", 30);
   cv.attrs.set("e_price", 10);
   cv.attrs.set("utilization", 0.8);
   return cv;
}

static int test_hub_scaffold(void)
{
   Settings settings;
   const Network g = synthesize(two_hub_data(), settings);
   EXPECT(g.is_frozen(), "synthesized network is frozen");
   // 7 scaffold nodes per hub, two sector halves at B, one producer at A
   EXPECT(g.num_nodes() == 17, "node count");
   // 9 scaffold arcs per hub, 4 pipelines, 2 sector arcs, 1 producer arc
   EXPECT(g.num_arcs() == 25, "arc count");

   EXPECT(g.node("A_center_lowPurity").kind() == NodeKind::CenterLowPurity, "low purity center");
   EXPECT(g.find_arc("A_center_highPurity", "A_dist_pipelineHighPurity") >= 0, "center feeds the pipeline");
   EXPECT(g.find_arc("A_dist_pipelineHighPurity", "A_center_highPurity") >= 0, "pipeline feeds back to the center");
   EXPECT(g.find_arc("A_center_lowPurity", "A_center_highPurity") >= 0, "purifier arc");
   EXPECT(g.find_arc("A_center_highPurity", "A_center_lowPurity") == -1, "no arc degrades purity");

   const int low = g.find_arc("A_dist_pipelineLowPurity", "A_demand_lowPurity");
   EXPECT(low >= 0, "low purity pipeline serves low purity demand");
   EXPECT(g.arc(low).flowLimit_tonsPerDay == 100, "low purity delivery takes the pipeline flow limit");
   EXPECT(g.find_arc("A_dist_pipelineLowPurity", "A_demand_highPurity") == -1, "low purity never reaches high purity demand");
   for (const char* demand : { "A_demand_fuelStation", "A_demand_lowPurity", "A_demand_highPurity" }) {
      EXPECT(g.find_arc("A_dist_pipelineHighPurity", demand) >= 0, "high purity pipeline serves every demand type");
   }

   EXPECT(g.hubs().size() == 2 && g.hubs()[0] == "A", "hub order follows the hub table");
   EXPECT(g.ccs_technologies().size() == 2, "ccs technologies carried on the network");
   return 0;
}

static int test_hub_arcs(void)
{
   InputData data = two_hub_data();
   data.arcs[0].exist_pipeline = 1;
   Settings settings;
   const Network g = synthesize(data, settings);

   const int high = g.find_arc("A_dist_pipelineHighPurity", "B_dist_pipelineHighPurity");
   const int back = g.find_arc("B_dist_pipelineHighPurity", "A_dist_pipelineHighPurity");
   EXPECT(high >= 0 && back >= 0, "pipelines in both directions");
   const Arc &a = g.arc(high);
   EXPECT(a.kind == ArcKind::PipelineHighPurity, "pipeline class");
   EXPECT(near(a.km_length, 100), "road length");
   EXPECT(near(a.capital_usdPerUnit, 10000 * 100), "capital per unit scales with length");
   EXPECT(near(a.fixed_usdPerUnitPerDay, 100), "fixed cost scales with length");
   EXPECT(near(a.variable_usdPerTon, 1), "variable cost scales with length");
   EXPECT(a.existing == 0, "high purity pipelines are never existing");

   const int low = g.find_arc("B_dist_pipelineLowPurity", "A_dist_pipelineLowPurity");
   EXPECT(low >= 0 && g.arc(low).existing == 1, "existing pipelines are low purity");
   return 0;
}

static int test_trucks(void)
{
   InputData data = two_hub_data();
   data.hubs[0].capital_pm = 2;
   data.distribution.push_back(make_truck());
   Settings settings;
   const Network g = synthesize(data, settings);

   EXPECT(g.node("A_dist_truckLiquid").cls == NodeClass(NodeKind::TruckDepot, "truckLiquid"), "depot node");
   const int depot = g.find_arc("A_center_highPurity", "A_dist_truckLiquid");
   EXPECT(depot >= 0, "depot arc from the high purity center");
   EXPECT(g.arc(depot).kind == ArcKind::HubDepot, "depot arc class");
   EXPECT(near(g.arc(depot).capital_usdPerUnit, 1000000), "fleet capital scaled by the hub");
   EXPECT(near(g.arc(depot).fixed_usdPerUnitPerDay, 100), "fleet fixed cost scaled by the hub");
   EXPECT(g.find_arc("A_center_lowPurity", "A_dist_truckLiquid") == -1, "trucks carry high purity only");

   const int route = g.find_arc("B_dist_truckLiquid", "A_dist_truckLiquid");
   EXPECT(route >= 0, "truck route");
   EXPECT(near(g.arc(route).variable_usdPerTon, 200), "truck variable cost per ton");
   EXPECT(g.arc(route).capital_usdPerUnit == 0, "routes carry no capital");
   EXPECT(g.arc(route).flowLimit_tonsPerDay == 4, "route flow limit");

   const int delivery = g.find_arc("A_dist_truckLiquid", "A_demand_fuelStation");
   EXPECT(delivery >= 0 && g.arc(delivery).flowLimit_tonsPerDay == 4, "truck delivery flow limit");
   return 0;
}

static int test_consumers(void)
{
   InputData data = two_hub_data();
   data.demand[0].carbon_sensitive_fraction = 0.25;
   Settings settings;
   const Network g = synthesize(data, settings);

   const Node &plain = g.node("B_demandSector_industry");
   const Node &sensitive = g.node("B_demandSector_industry_carbonSensitive");
   EXPECT(plain.kind() == NodeKind::DemandSector && plain.cls.technology == "industry", "sector node");
   EXPECT(near(plain.attr("size"), 15), "carbon indifferent share");
   EXPECT(near(sensitive.attr("size"), 5), "carbon sensitive share");
   EXPECT(plain.attr("carbonSensitive") == 0 && sensitive.attr("carbonSensitive") == 1, "sensitivity flags");
   EXPECT(near(plain.attr("breakevenPrice"), 10000), "breakeven price");
   EXPECT(g.find_arc("B_demand_highPurity", plain.name) >= 0, "demand category feeds the sector");
   EXPECT(g.find_arc("B_demand_highPurity", sensitive.name) >= 0, "demand category feeds the sensitive half");
   EXPECT(!g.has_node("A_demandSector_industry"), "no sector without demand");

   data.demand[0].demand_type = "ammonia";
   EXPECT_THROW(synthesize(data, settings), MissingInputError, "unknown demand type");
   return 0;
}

static int test_producers(void)
{
   InputData data = two_hub_data();
   data.hubs[0].capital_pm = 2;
   data.hubs[0].e_pm = 3;
   data.hubs[0].ng_pm = 0.5;
   ExistingProducer old;
   old.hub = "B";
   old.type = "smr";
   old.attrs.set("capacity_tonPerDay", 30);
   old.attrs.set("co2_emissions_per_h2_tons", 9);
   old.attrs.set("utilization", 0.9);
   old.attrs.set("can_ccs1", 1);
   data.existing_production.push_back(old);
   Settings settings;
   const Network g = synthesize(data, settings);

   const Node &fresh = g.node("A_production_smr");
   EXPECT(fresh.kind() == NodeKind::Producer && !fresh.existing, "new producer");
   EXPECT(fresh.tech_type == TechType::THERMAL, "thermal producer");
   EXPECT(near(fresh.attr("capital_usdPerTonPerDay"), 2000000), "capital scaled by the hub");
   EXPECT(near(fresh.attr("e_price"), 60), "electricity scaled by the hub");
   EXPECT(near(fresh.attr("ng_price"), 150), "gas scaled by the hub");
   EXPECT(near(fresh.attr("variable_usdPerTon"), 500), "unscaled column kept");
   EXPECT(g.find_arc("A_production_smr", "A_center_highPurity") >= 0, "high purity producer feeds the high purity center");
   EXPECT(!g.has_node("B_production_smr"), "no producer where it cannot be built");

   const Node &existing = g.node("B_production_smrExisting");
   EXPECT(existing.existing, "existing producer");
   EXPECT(existing.purity == Purity::High && existing.tech_type == TechType::THERMAL, "purity and type from the technology");
   EXPECT(near(existing.attr("capacity_tonPerDay"), 30), "existing capacity");
   EXPECT(g.find_arc("B_production_smrExisting", "B_center_highPurity") >= 0, "existing producer arc");

   data.existing_production[0].type = "coal";
   EXPECT_THROW(synthesize(data, settings), MissingInputError, "existing producer of an unknown technology");
   data.existing_production[0].type = "smr";
   data.existing_production[0].hub = "C";
   EXPECT_THROW(synthesize(data, settings), MissingInputError, "existing producer at an unknown hub");
   return 0;
}

static int test_low_purity_producer(void)
{
   InputData data = two_hub_data();
   data.production[0].purity = Purity::Low;
   Settings settings;
   const Network g = synthesize(data, settings);
   EXPECT(g.find_arc("A_production_smr", "A_center_lowPurity") >= 0, "low purity producer feeds the low purity center");
   EXPECT(g.find_arc("A_production_smr", "A_center_highPurity") == -1, "low purity producer skips the high purity center");
   return 0;
}

static int test_converters(void)
{
   InputData data = two_hub_data();
   data.distribution.push_back(make_truck());
   data.conversion.push_back(fuel_dispenser());
   ConversionTech pass;
   pass.name = "none";
   pass.arc_start_class = "pass";
   pass.arc_end_class = "pass";
   data.conversion.push_back(pass);
   Settings settings;
   const Network g = synthesize(data, settings);

   const std::string conv = "A_converter_fuelDispenserLiquid";
   EXPECT(g.has_node(conv), "converter spliced in");
   EXPECT(g.node(conv).cls == NodeClass(NodeKind::Converter, "fuelDispenserLiquid"), "converter class");
   EXPECT(!g.has_node("A_converter_none"), "pass rows add nothing");
   EXPECT(g.find_arc("A_dist_truckLiquid", "A_demand_fuelStation") == -1, "matched arc removed");

   const int into = g.find_arc("A_dist_truckLiquid", conv);
   EXPECT(into >= 0, "arc into the converter");
   EXPECT(g.arc(into).kind == ArcKind::IntoConverter && g.arc(into).flowLimit_tonsPerDay == 4, "into arc keeps the flow limit");
   const int onward = g.find_arc(conv, "A_demand_fuelStation");
   EXPECT(onward >= 0 && g.arc(onward).kind == ArcKind::FlowToDemandNode, "onward arc keeps its class");
   EXPECT(g.find_arc("A_dist_truckLiquid", "A_demand_highPurity") >= 0, "other demand arcs untouched");

   data.conversion[0].arc_end_class = "warehouse";
   EXPECT_THROW(synthesize(data, settings), MissingInputError, "unknown end class");
   return 0;
}

static int test_price_probes(void)
{
   Settings settings;
   settings.find_prices = true;
   settings.price_all_hubs = false;
   settings.price_hubs.push_back("B");
   settings.price_tracking.start = 1;
   settings.price_tracking.stop = 3;
   settings.price_tracking.step = 1;
   const Network g = synthesize(two_hub_data(), settings);

   EXPECT(price_label(1) == "1.0" && price_label(2.5) == "2.5", "price labels");
   const std::string probe = price_node_name("B", "highPurity", 2);
   EXPECT(probe == "B_priceHighPurity_2.0", "probe name");
   EXPECT(g.has_node(probe), "probe node");
   EXPECT(g.node(probe).cls == NodeClass(NodeKind::PriceProbe, "highPurity"), "probe class names its demand type");
   EXPECT(near(g.node(probe).attr("breakevenPrice"), 2000), "probe price in USD/ton");
   EXPECT(near(g.node(probe).attr("size"), settings.price_demand), "probe size");
   const int link = g.find_arc("B_demand_highPurity", probe);
   EXPECT(link >= 0 && !g.arc(link).is_distribution(), "probe linked without a distribution class");
   EXPECT(g.has_node("B_priceFuelStation_1.0") && g.has_node("B_priceLowPurity_1.0"), "one probe per demand type");
   EXPECT(!g.has_node("B_priceHighPurity_3.0"), "ladder stop excluded");
   EXPECT(!g.has_node("A_priceHighPurity_1.0"), "only the listed hubs are probed");

   settings.price_hubs[0] = "C";
   EXPECT_THROW(synthesize(two_hub_data(), settings), MissingInputError, "probe at an unknown hub");

   settings.find_prices = false;
   const Network quiet = synthesize(two_hub_data(), settings);
   EXPECT(quiet.num_nodes() == 17, "no probes unless prices are searched");
   return 0;
}

static int test_missing_inputs(void)
{
   Settings settings;
   InputData no_pipeline = two_hub_data();
   no_pipeline.distribution.clear();
   no_pipeline.distribution.push_back(make_truck());
   EXPECT_THROW(synthesize(no_pipeline, settings), MissingInputError, "missing pipeline row");

   InputData bad_arc = two_hub_data();
   bad_arc.arcs[0].end_hub = "C";
   EXPECT_THROW(synthesize(bad_arc, settings), MissingInputError, "arc to an unknown hub");
   return 0;
}

int main(void)
{
   RUN(test_hub_scaffold);
   RUN(test_hub_arcs);
   RUN(test_trucks);
   RUN(test_consumers);
   RUN(test_producers);
   RUN(test_low_purity_producer);
   RUN(test_converters);
   RUN(test_price_probes);
   RUN(test_missing_inputs);
   return 0;
}
