#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>

#include "../inc/rw.h"
#include "../inc/decomposer.h"
#include "../inc/montecarlo.h"
#include "../inc/errors.h"
#include "../inc/util.h"

using json = nlohmann::json;

namespace {

std::ofstream open_output(const std::string &file)
{
	std::ofstream output(file.c_str());
	if (!output.good()) throw std::runtime_error("CANNOT OPEN THE OUTPUT FILE " + file);
	output << std::setprecision(12);
	return output;
}

void write_table(const Table &t, const std::string &file, bool with_arc)
{
	std::ofstream output = open_output(file);
	output << t.index_name;
	if (with_arc) output << ",arc_start,arc_end";
	for (const auto &c : t.columns) output << "," << c;
	output << std::endl;
	for (const auto &row : t.rows) {
		output << "\"" << row.id << "\"";
		if (with_arc) output << "," << row.arc_start << "," << row.arc_end;
		for (const auto &c : t.columns) output << "," << row.get(c);
		output << std::endl;
	}
}

json to_json(const SiteEntries &entries)
{
	json j = json::object();
	for (const auto &e : entries) {
		json item = json::object();
		for (const auto &l : e.second.labels) item[l.first] = l.second;
		for (const auto &v : e.second.values) item[v.first] = v.second;
		j[e.first] = item;
	}
	return j;
}

}

void ReadWrite::writeArcs(const std::vector<HubArc> &arcs) const
{
	const std::string file = inputDirectory + "/arcs.csv";
	std::ofstream output = open_output(file);
	output << "startHub,endHub,kmLength_euclid,kmLength_road,exist_pipeline" << std::endl;
	for (const auto &arc : arcs) {
		output << arc.start_hub << "," << arc.end_hub << "," << arc.km_euclid << "," << arc.km_road << "," << arc.exist_pipeline << std::endl;
	}
	PRINT_SUBSECTION("wrote " << arcs.size() << " arcs to " << file);
}

void ReadWrite::printSolution(const OutputTable &table, const std::vector<std::string> &hubs, const std::string &directory) const
{
	PRINT_SECTION("Writing the solution to " << directory);
	write_table(table.production, directory + "/production.csv", false);
	write_table(table.conversion, directory + "/conversion.csv", false);
	write_table(table.consumption, directory + "/consumption.csv", false);
	write_table(table.distribution, directory + "/distribution.csv", true);

	std::ofstream prices = open_output(directory + "/prices.csv");
	prices << "hub,demandType,probe,price_usdPerKg" << std::endl;
	for (const auto &p : table.prices) {
		prices << p.hub << "," << p.demand_type << "," << p.probe << "," << p.price << std::endl;
	}

	json doc = json::object();
	for (const auto &site : per_site(table, hubs)) {
		const SiteReport &r = site.second;
		json hub = json::object();
		hub["production"] = to_json(r.production);
		hub["conversion"] = to_json(r.conversion);
		hub["consumption"] = to_json(r.consumption);
		hub["distribution"] = {
			{ "local", to_json(r.local) },
			{ "outgoing", to_json(r.outgoing) },
			{ "incoming", to_json(r.incoming) }
		};
		doc[site.first] = hub;
	}
	std::ofstream output = open_output(directory + "/outputs.json");
	output << doc.dump(4) << std::endl;
}

void ReadWrite::printMonteCarlo(const MonteCarloPlan &plan, const std::vector<TrialResult> &results) const
{
	std::ofstream output = open_output(outputDirectory + "/montecarlo.csv");
	output << "trial,status,objective,h2_consumed,h2_produced";
	for (const auto &p : plan.params) output << "," << p.label();
	output << std::endl;
	for (const auto &r : results) {
		output << r.trial << "," << result_name(r.status) << "," << r.objective << "," << r.h2_consumed << "," << r.h2_produced;
		for (double s : r.samples) output << "," << s;
		output << std::endl;
	}
}
