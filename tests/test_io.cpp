#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "test_util.h"
#include "../inc/rw.h"
#include "../inc/montecarlo.h"
#include "../inc/decomposer.h"
#include "../inc/synthesizer.h"
#include "../inc/errors.h"

namespace fs = std::filesystem;

static std::string scratch(const std::string &name)
{
   const fs::path dir = fs::temp_directory_path() / ("h2plan_" + name);
   fs::remove_all(dir);
   fs::create_directories(dir);
   return dir.string();
}

static void write_file(const std::string &file, const std::string &text)
{
   std::ofstream out(file.c_str());
   out << text;
}

static void write_scenario(const std::string &dir)
{
   write_file(dir + "/hubs.csv",
      "hub,status,capital_pm,e_pm,ng_pm,latitude,longitude,build_smr,industry_tonnesperday\n"
      "\"A\",1,1.5,1,1,30.0,-97.0,1,0\n"
      "B,0,1,1,1,29.7,-95.3,0,20\n");
   write_file(dir + "/production_thermal.csv",
      "type,purity,capital_usdPerTonPerDay,variable_usdPerTon,utilization,max_h2,can_ccs1\n"
      "smr,high,1000000,500,1,50,1\n");
   write_file(dir + "/production_electric.csv",
      "type,purity,capital_usdPerTonPerDay,variable_usdPerTon,utilization,max_h2\n");
   write_file(dir + "/distribution.csv",
      "distribution,capital_usdPerUnit,fixed_usdPerUnitPerDay,variable_usdPerKilometerTon,flowLimit_tonsPerDay\r\n"
      "pipeline,10000,1,0.01,100\r\n"
      "truckLiquid,500000,50,2,4\r\n");
   write_file(dir + "/conversion.csv",
      "converter,arc_start_class,arc_end_class,capital_usdPerTonPerDay,utilization\n"
      "none,pass,pass,0,1\n");
   write_file(dir + "/demand.csv",
      "sector,demandType,carbonSensitiveFraction,breakevenPrice,avoided_emissions_tonsCO2_per_H2\n"
      "industry,highPurity,0.25,10000,2\n");
   write_file(dir + "/ccs.csv",
      "ccs,percent_CO2_captured,h2_tax_credit,variable_usdPerTonCO2\n"
      "ccs1,0.7,0,10\n");
   write_file(dir + "/arcs.csv",
      "startHub,endHub,kmLength_euclid,kmLength_road,exist_pipeline\n"
      "A,B,90,100,1\n");
}

static int test_parameters(void)
{
   const std::string dir = scratch("parameters");
   write_file(dir + "/Parameters.dat",
      "CarbonPrice 50\n"
      "PriceHubs 2 A B\n"
      "PriceTieBreak first\n"
      "Solver gurobi\n"
      "FindPrices 1\n"
      "Bogus 3 4\n"
      "MipGap 0.05\n"
      "END\n"
      "CarbonCaptureCredit 99\n");
   ReadWrite rw;
   rw.set_inputDirectory(dir);
   Settings settings;
   rw.readParameters(settings);

   EXPECT(settings.carbon_price == 50, "numeric parameter");
   EXPECT(!settings.price_all_hubs && settings.price_hubs.size() == 2 && settings.price_hubs[1] == "B", "price hubs");
   EXPECT(settings.price_tie_break == PriceTieBreak::FirstMatch, "tie break");
   EXPECT(settings.solver.name == "gurobi", "solver name");
   EXPECT(settings.find_prices, "flag parameter");
   EXPECT(settings.solver.mip_gap == 0.05, "unknown parameters are skipped");
   EXPECT(settings.carbon_capture_credit == 0, "nothing read after END");

   Settings defaults;
   rw.set_inputDirectory(scratch("no_parameters"));
   rw.readParameters(defaults);
   EXPECT(defaults.price_all_hubs && defaults.carbon_price == 0, "defaults without a parameter file");

   EXPECT(settings.has_numeric("TimeSlices") && !settings.has_numeric("Solver"), "numeric keys");
   EXPECT(settings.get_numeric("CarbonPrice") == 50, "numeric lookup");
   EXPECT_THROW(settings.get_numeric("Bogus"), MissingInputError, "unknown numeric key");
   return 0;
}

static int test_tables(void)
{
   const std::string dir = scratch("tables");
   write_scenario(dir);
   ReadWrite rw;
   rw.set_inputDirectory(dir);
   const TableSet tables = rw.readTables();

   EXPECT(tables.count("arcs") == 1 && tables.count("production_existing") == 0, "optional tables");
   EXPECT(tables.at("hubs").key(0) == "A", "quotes trimmed");
   EXPECT(tables.at("distribution").key(1) == "truckLiquid", "carriage returns trimmed");

   const InputData data = to_input_data(tables);
   EXPECT(data.hubs.size() == 2, "hubs");
   EXPECT(data.hubs[0].status == HubStatus::MAJOR && near(data.hubs[0].capital_pm, 1.5), "hub status and multiplier");
   EXPECT(data.hubs[0].has_coordinates && near(data.hubs[0].longitude, -97), "hub coordinates");
   EXPECT(data.hubs[0].can_build("smr") && !data.hubs[1].can_build("smr"), "build columns");
   EXPECT(near(data.hubs[1].demand_for("industry"), 20), "demand columns");

   EXPECT(data.production.size() == 1, "production rows");
   const ProductionTech &smr = data.production[0];
   EXPECT(smr.type == "smr" && smr.purity == Purity::High && smr.tech_type == TechType::THERMAL, "production type");
   EXPECT(near(smr.attrs.get("max_h2"), 50) && near(smr.attrs.get("can_ccs1"), 1), "production attributes");
   EXPECT(!smr.attrs.has("purity"), "text columns are not attributes");

   EXPECT(data.distribution.size() == 2 && data.distribution[0].is_pipeline(), "distribution rows");
   EXPECT(data.distribution[1].is_truck() && data.distribution[1].flowLimit_tonsPerDay == 4, "truck row");
   EXPECT(data.conversion.size() == 1 && data.conversion[0].is_pass(), "conversion rows");
   EXPECT(data.demand[0].demand_type == "highPurity" && near(data.demand[0].carbon_sensitive_fraction, 0.25), "demand rows");
   EXPECT(near(data.demand[0].attrs.get("avoided_emissions_tonsCO2_per_H2"), 2), "demand attributes");
   EXPECT(!data.demand[0].attrs.has("breakevenPrice"), "typed demand columns are not attributes");
   EXPECT(data.arcs.size() == 1 && data.arcs[0].exist_pipeline == 1 && near(data.arcs[0].km_road, 100), "arc rows");
   EXPECT(data.ccs.size() == 1 && near(data.ccs[0].percent_co2_captured, 0.7), "ccs rows");

   TableSet empty_ccs = tables;
   empty_ccs["ccs"].rows.clear();
   EXPECT_THROW(to_input_data(empty_ccs), MissingInputError, "ccs table without rows");

   TableSet no_demand = tables;
   no_demand.erase("demand");
   EXPECT_THROW(to_input_data(no_demand), MissingInputError, "missing table");

   write_file(dir + "/production_existing.csv",
      "hub,type,capacity_tonPerDay,utilization,can_ccs1\n"
      "B,smr,30,0.9,1\n");
   const InputData with_existing = to_input_data(rw.readTables());
   EXPECT(with_existing.existing_production.size() == 1 && with_existing.existing_production[0].hub == "B", "existing producers");
   EXPECT(near(with_existing.existing_production[0].attrs.get("capacity_tonPerDay"), 30), "existing capacity");

   fs::remove(dir + "/ccs.csv");
   EXPECT_THROW(rw.readTables(), MissingInputError, "missing required file");
   return 0;
}

static int test_cells(void)
{
   CsvTable t;
   t.name = "demand";
   t.header = { "sector", "breakevenPrice", "note" };
   t.rows.push_back({ "industry", "10000", "n/a" });

   EXPECT(t.get_number("industry", "breakevenPrice") == 10000, "numeric cell");
   EXPECT(t.number_or(0, "note", -1) == -1, "non numeric cell falls back");
   EXPECT(t.number_or(0, "missing", 3) == 3, "missing column falls back");
   EXPECT_THROW(t.number(0, "note"), MissingInputError, "non numeric cell");
   EXPECT_THROW(t.get_number("mobility", "breakevenPrice"), MissingInputError, "missing row");

   t.set_number("industry", "breakevenPrice", 12345.5);
   EXPECT(t.get_number("industry", "breakevenPrice") == 12345.5, "cell overwritten");
   EXPECT_THROW(t.set_number("industry", "size", 1), MissingInputError, "missing column");
   return 0;
}

static int test_monte_carlo(void)
{
   const std::string dir = scratch("montecarlo");
   write_scenario(dir);
   write_file(dir + "/MonteCarlo.dat",
      "Trials 4\n"
      "Seed 7\n"
      "Param settings CarbonPrice - uniform 10 20\n"
      "Param production_thermal smr capital_usdPerTonPerDay uniform 900000 1100000\n"
      "END\n");
   ReadWrite rw;
   rw.set_inputDirectory(dir);
   const TableSet tables = rw.readTables();
   const MonteCarloPlan plan = rw.readMonteCarlo();
   EXPECT(plan.trials == 4 && plan.seed == 7 && plan.params.size() == 2, "plan read");
   EXPECT(plan.params[1].label() == "production_thermal:smr:capital_usdPerTonPerDay", "parameter label");

   Settings settings;
   const std::vector<double> samples = draw_samples(plan, tables, settings);
   EXPECT(samples.size() == 8, "one sample per trial and parameter");
   for (int t = 0; t < plan.trials; t++) {
      EXPECT(samples[2 * t] >= 10 && samples[2 * t] < 20, "settings sample range");
      EXPECT(samples[2 * t + 1] >= 900000 && samples[2 * t + 1] < 1100000, "table sample range");
   }
   EXPECT(draw_samples(plan, tables, settings) == samples, "same seed, same samples");

   TableSet trial_tables = tables;
   Settings trial_settings = settings;
   apply_trial(plan, samples, 1, trial_tables, trial_settings);
   EXPECT(trial_settings.carbon_price == samples[2], "settings sample applied");
   EXPECT(near(trial_tables.at("production_thermal").get_number("smr", "capital_usdPerTonPerDay"), samples[3]), "table sample applied");
   EXPECT(tables.at("production_thermal").get_number("smr", "capital_usdPerTonPerDay") == 1000000, "base tables untouched");
   EXPECT(settings.carbon_price == 0, "base settings untouched");
   EXPECT_THROW(apply_trial(plan, samples, 4, trial_tables, trial_settings), std::out_of_range, "trial without samples");

   const std::vector<int> mine = trials_of_rank(5, 1, 2);
   EXPECT(mine.size() == 2 && mine[0] == 1 && mine[1] == 3, "round robin trials");

   McParam around;
   around.file = "settings";
   around.row = "CarbonPrice";
   around.column = "-";
   around.distribution = "uniform";
   around.p1 = "default";
   around.p2 = "6";
   std::mt19937 generator(1);
   const double v = draw(around, 5, generator);
   EXPECT(v >= 5 && v < 6, "default takes the base value");
   around.distribution = "cauchy";
   EXPECT_THROW(draw(around, 5, generator), MissingInputError, "unknown distribution");
   around.distribution = "uniform";
   around.p2 = "six";
   EXPECT_THROW(draw(around, 5, generator), MissingInputError, "non numeric parameter");
   return 0;
}

static int test_writers(void)
{
   const std::string dir = scratch("writers");
   ReadWrite rw;
   rw.set_inputDirectory(dir);
   rw.set_outputDirectory(dir);

   HubArc arc;
   arc.start_hub = "A";
   arc.end_hub = "B";
   arc.km_euclid = 90;
   arc.km_road = 108;
   arc.exist_pipeline = 1;
   rw.writeArcs(std::vector<HubArc>(1, arc));
   std::ifstream written((dir + "/arcs.csv").c_str());
   EXPECT(written.good(), "arcs written");
   std::string header, line;
   std::getline(written, header);
   std::getline(written, line);
   EXPECT(rw.split_csv(line).size() == 5 && rw.split_csv(line)[3] == "108", "arc row");

   OutputTable out;
   out.production = Table("producer", { "prod_h" });
   TableRow prod;
   prod.id = "A_production_smr";
   prod.set("prod_h", 10);
   out.production.rows.push_back(prod);
   out.conversion = Table("converter", { "conv_capacity" });
   out.consumption = Table("consumer", { "cons_h" });
   out.distribution = Table("arc", { "dist_h" });
   TableRow pipe;
   pipe.id = "A_dist_pipelineHighPurity,B_dist_pipelineHighPurity";
   pipe.arc_start = "A_dist_pipelineHighPurity";
   pipe.arc_end = "B_dist_pipelineHighPurity";
   pipe.set("dist_h", 10);
   out.distribution.rows.push_back(pipe);
   DiscoveredPrice price;
   price.hub = "B";
   price.demand_type = "highPurity";
   price.probe = "B_priceHighPurity_2.0";
   price.price = 2;
   out.prices.push_back(price);

   rw.printSolution(out, { "A", "B" });
   for (const char* file : { "production.csv", "conversion.csv", "consumption.csv", "distribution.csv", "prices.csv" }) {
      EXPECT(fs::exists(dir + "/" + file), "table written");
   }
   std::ifstream json_file((dir + "/outputs.json").c_str());
   const nlohmann::json doc = nlohmann::json::parse(json_file);
   EXPECT(doc.at("A").at("production").at("smr").at("prod_h") == 10, "production by site");
   const auto &outgoing = doc.at("A").at("distribution").at("outgoing").at("dist_pipelineHighPurity_TO_B_dist_pipelineHighPurity");
   EXPECT(outgoing.at("destination") == "B" && outgoing.at("dist_h") == 10, "outgoing flow by site");
   EXPECT(doc.at("B").at("distribution").at("incoming").size() == 1, "incoming flow by site");

   MonteCarloPlan plan;
   plan.trials = 1;
   McParam p;
   p.file = "settings";
   p.row = "CarbonPrice";
   p.column = "-";
   plan.params.push_back(p);
   TrialResult r;
   r.trial = 0;
   r.status = Result::INFEASIBLE;
   r.samples.push_back(12.5);
   rw.printMonteCarlo(plan, std::vector<TrialResult>(1, r));
   std::ifstream mc((dir + "/montecarlo.csv").c_str());
   std::getline(mc, header);
   std::getline(mc, line);
   EXPECT(header == "trial,status,objective,h2_consumed,h2_produced,settings:CarbonPrice:-", "Monte Carlo header");
   EXPECT(line == "0,infeasible,0,0,0,12.5", "Monte Carlo row");
   return 0;
}

static int test_required_hub_columns(void)
{
   const std::string dir = scratch("hub_columns");
   write_scenario(dir);
   ReadWrite rw;
   rw.set_inputDirectory(dir);

   write_file(dir + "/hubs.csv", "hub,status\nA,1\nB,0\n");
   EXPECT_THROW(rw.readHubs(), MissingInputError, "hub without regional multipliers");

   write_file(dir + "/hubs.csv",
      "hub,status,capital_pm,e_pm,ng_pm,build_smr,industry_tonnesperday\n"
      "A,1,1,1,1,,0\n"
      "B,0,1,1,1,0,20\n");
   EXPECT_THROW(rw.readHubs(), MissingInputError, "empty build cell");

   // the columns are read but nothing says whether smr may be built or how much industry demand there is
   write_file(dir + "/hubs.csv",
      "hub,status,capital_pm,e_pm,ng_pm\n"
      "A,1,1,1,1\n"
      "B,0,1,1,1\n");
   const InputData data = to_input_data(rw.readTables());
   EXPECT_THROW(data.hubs[0].can_build("smr"), MissingInputError, "missing build column");
   EXPECT_THROW(data.hubs[1].demand_for("industry"), MissingInputError, "missing demand column");
   Settings settings;
   EXPECT_THROW(synthesize(data, settings), MissingInputError, "network from hubs without build or demand columns");

   write_file(dir + "/hubs.csv",
      "hub,status,capital_pm,e_pm,ng_pm,build_smr,industry_tonnesperday\n"
      "A,1,1,1,1,0,0\n"
      "B,0,1,1,1,0,0\n");
   const Network g = synthesize(to_input_data(rw.readTables()), settings);
   EXPECT(!g.has_node("A_production_smr") && !g.has_node("B_demandSector_industry"), "explicit zeros disable producers and consumers");
   return 0;
}

static int test_split_csv(void)
{
   ReadWrite rw;
   std::vector<std::string> v = rw.split_csv("\"A,B\",12, x ,\"say \"\"hi\"\"\",");
   EXPECT(v.size() == 5, "field count");
   EXPECT(v[0] == "A,B", "comma inside quotes");
   EXPECT(v[1] == "12" && v[2] == "x", "unquoted fields trimmed");
   EXPECT(v[3] == "say \"hi\"", "doubled quote");
   EXPECT(v[4].empty(), "trailing empty field");

   // a quoted comma does not shift the columns of a file row
   const std::string dir = scratch("quoted_ids");
   write_scenario(dir);
   write_file(dir + "/arcs_whitelist.csv", "startHub,endHub,note\nA,B,\"existing, 2019\"\n");
   rw.set_inputDirectory(dir);
   const std::vector<HubPair> pairs = rw.readArcList("arcs_whitelist");
   EXPECT(pairs.size() == 1 && pairs[0].start_hub == "A" && pairs[0].end_hub == "B", "quoted note kept in one cell");
   return 0;
}

int main(void)
{
   RUN(test_parameters);
   RUN(test_tables);
   RUN(test_cells);
   RUN(test_required_hub_columns);
   RUN(test_split_csv);
   RUN(test_monte_carlo);
   RUN(test_writers);
   return 0;
}
