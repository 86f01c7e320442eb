#include "../inc/rw.h"
#include "../inc/montecarlo.h"
#include "../inc/errors.h"
#include "../inc/util.h"
#include <cstdlib>
#include <fstream>
#include <sstream>

using namespace std;

namespace {

bool parse_number(const string &s, double &value)
{
	if (s.empty()) return false;
	char* end = nullptr;
	value = strtod(s.c_str(), &end);
	return end != s.c_str() && *end == '\0';
}

const CsvTable &table(const TableSet &tables, const string &stem)
{
	auto it = tables.find(stem);
	if (it == tables.end()) throw MissingInputError("input table " + stem + ".csv is missing");
	return it->second;
}

// every numeric cell of a row except the listed columns
AttributeBag numeric_attributes(const CsvTable &t, int r, const set<string> &skip)
{
	AttributeBag bag;
	for (size_t c = 1; c < t.header.size() && c < t.rows[r].size(); c++) {
		if (skip.count(t.header[c])) continue;
		double v = 0;
		if (parse_number(t.rows[r][c], v)) bag.set(t.header[c], v);
	}
	return bag;
}

Purity parse_purity(const string &s)
{
	if (s == "low" || s == "lowPurity") return Purity::Low;
	if (s == "high" || s == "highPurity") return Purity::High;
	throw MissingInputError("unknown purity '" + s + "'");
}

void read_production(const CsvTable &t, TechType tech_type, vector<ProductionTech> &production)
{
	for (size_t r = 0; r < t.rows.size(); r++) {
		ProductionTech tech;
		tech.type = t.key(r);
		tech.tech_type = tech_type;
		tech.purity = parse_purity(t.cell(r, "purity"));
		tech.attrs = numeric_attributes(t, r, set<string>());
		production.push_back(tech);
	}
}

}

/* ******************* CsvTable ******************* */
int CsvTable::column(const string &col) const
{
	for (size_t c = 0; c < header.size(); c++) {
		if (header[c] == col) return static_cast<int>(c);
	}
	return -1;
}

int CsvTable::row(const string &key) const
{
	for (size_t r = 0; r < rows.size(); r++) {
		if (!rows[r].empty() && rows[r][0] == key) return static_cast<int>(r);
	}
	return -1;
}

string CsvTable::cell(int r, const string &col) const
{
	const int c = column(col);
	if (c < 0) throw MissingInputError(name + ".csv has no column " + col);
	return (c < static_cast<int>(rows[r].size())) ? rows[r][c] : "";
}

double CsvTable::number(int r, const string &col) const
{
	const string s = cell(r, col);
	double v = 0;
	if (!parse_number(s, v)) throw MissingInputError(name + ".csv: '" + s + "' in column " + col + " of row " + key(r) + " is not a number");
	return v;
}

double CsvTable::number_or(int r, const string &col, double fallback) const
{
	if (!has_column(col)) return fallback;
	const string s = cell(r, col);
	double v = 0;
	return parse_number(s, v) ? v : fallback;
}

double CsvTable::get_number(const string &row_key, const string &col) const
{
	const int r = row(row_key);
	if (r < 0) throw MissingInputError(name + ".csv has no row " + row_key);
	return number(r, col);
}

void CsvTable::set_number(const string &row_key, const string &col, double value)
{
	const int r = row(row_key);
	if (r < 0) throw MissingInputError(name + ".csv has no row " + row_key);
	const int c = column(col);
	if (c < 0) throw MissingInputError(name + ".csv has no column " + col);
	if (c >= static_cast<int>(rows[r].size())) rows[r].resize(c + 1);
	ostringstream ss;
	ss.precision(17);
	ss << value;
	rows[r][c] = ss.str();
}

/* ******************* typed rows ******************* */
std::vector<Hub> to_hubs(const CsvTable &hubs)
{
	std::vector<Hub> result;
	for (size_t r = 0; r < hubs.rows.size(); r++) {
		Hub hub;
		hub.name = hubs.key(r);
		const int status = static_cast<int>(hubs.number(r, "status"));
		hub.status = (status > 0) ? HubStatus::MAJOR : (status < 0) ? HubStatus::MINOR : HubStatus::REGULAR;
		hub.capital_pm = hubs.number(r, "capital_pm");
		hub.e_pm = hubs.number(r, "e_pm");
		hub.ng_pm = hubs.number(r, "ng_pm");
		double lat = 0, lon = 0;
		if (hubs.has_column("latitude") && hubs.has_column("longitude")
			 && parse_number(hubs.cell(r, "latitude"), lat) && parse_number(hubs.cell(r, "longitude"), lon)) {
			hub.has_coordinates = true;
			hub.latitude = lat;
			hub.longitude = lon;
		}
		for (size_t c = 1; c < hubs.header.size(); c++) {
			const string &col = hubs.header[c];
			if (starts_with(col, "build_")) {
				hub.build[col.substr(6)] = hubs.number(r, col);
			}
			else if (col.size() > 13 && col.compare(col.size() - 13, 13, "_tonnesperday") == 0) {
				hub.demand[col.substr(0, col.size() - 13)] = hubs.number(r, col);
			}
		}
		result.push_back(hub);
	}
	return result;
}

InputData to_input_data(const TableSet &tables)
{
	InputData data;

	data.hubs = to_hubs(table(tables, "hubs"));

	read_production(table(tables, "production_thermal"), TechType::THERMAL, data.production);
	read_production(table(tables, "production_electric"), TechType::ELECTRIC, data.production);

	auto existing = tables.find("production_existing");
	if (existing != tables.end()) {
		const CsvTable &t = existing->second;
		for (size_t r = 0; r < t.rows.size(); r++) {
			ExistingProducer p;
			p.hub = t.cell(r, "hub");
			p.type = t.cell(r, "type");
			p.attrs = numeric_attributes(t, r, set<string>());
			data.existing_production.push_back(p);
		}
	}

	const CsvTable &dist = table(tables, "distribution");
	for (size_t r = 0; r < dist.rows.size(); r++) {
		DistributionTech d;
		d.name = dist.key(r);
		d.capital_usdPerUnit = dist.number(r, "capital_usdPerUnit");
		d.fixed_usdPerUnitPerDay = dist.number(r, "fixed_usdPerUnitPerDay");
		d.variable_usdPerKilometerTon = dist.number(r, "variable_usdPerKilometerTon");
		d.flowLimit_tonsPerDay = dist.number(r, "flowLimit_tonsPerDay");
		data.distribution.push_back(d);
	}

	const CsvTable &conv = table(tables, "conversion");
	for (size_t r = 0; r < conv.rows.size(); r++) {
		ConversionTech cv;
		cv.name = conv.key(r);
		cv.arc_start_class = conv.cell(r, "arc_start_class");
		cv.arc_end_class = conv.cell(r, "arc_end_class");
		cv.attrs = numeric_attributes(conv, r, set<string>());
		data.conversion.push_back(cv);
	}

	const CsvTable &demand = table(tables, "demand");
	for (size_t r = 0; r < demand.rows.size(); r++) {
		DemandSector s;
		s.sector = demand.key(r);
		s.demand_type = demand.cell(r, "demandType");
		s.carbon_sensitive_fraction = demand.number(r, "carbonSensitiveFraction");
		s.breakeven_price = demand.number(r, "breakevenPrice");
		s.attrs = numeric_attributes(demand, r, { "carbonSensitiveFraction", "breakevenPrice" });
		data.demand.push_back(s);
	}

	auto arcs = tables.find("arcs");
	if (arcs != tables.end()) {
		const CsvTable &t = arcs->second;
		for (size_t r = 0; r < t.rows.size(); r++) {
			HubArc arc;
			arc.start_hub = t.key(r);
			arc.end_hub = t.cell(r, "endHub");
			arc.km_road = t.number(r, "kmLength_road");
			arc.km_euclid = t.number_or(r, "kmLength_euclid", arc.km_road);
			arc.exist_pipeline = static_cast<int>(t.number_or(r, "exist_pipeline", 0));
			data.arcs.push_back(arc);
		}
	}

	const CsvTable &ccs = table(tables, "ccs");
	if (ccs.rows.empty()) throw MissingInputError("ccs.csv has no rows");
	for (size_t r = 0; r < ccs.rows.size(); r++) {
		CcsTech k;
		k.name = ccs.key(r);
		k.percent_co2_captured = ccs.number(r, "percent_CO2_captured");
		k.h2_tax_credit = ccs.number(r, "h2_tax_credit");
		k.variable_usdPerTonCO2 = ccs.number(r, "variable_usdPerTonCO2");
		data.ccs.push_back(k);
	}
	return data;
}

std::vector<HubPair> to_hub_pairs(const CsvTable &t)
{
	std::vector<HubPair> pairs;
	for (size_t r = 0; r < t.rows.size(); r++) {
		HubPair p;
		p.start_hub = t.key(r);
		p.end_hub = t.cell(r, "endHub");
		pairs.push_back(p);
	}
	return pairs;
}

/* ******************* files ******************* */
void ReadWrite::readParameters(Settings &settings) const
{
	const string file = inputDirectory + paramFile;
	ifstream inputFile(file.c_str());
	if (!inputFile)
	{
		std::cout << "Couldn't find the parameter file. Will use the default values!" << std::endl;
		return;
	}
	while (!inputFile.eof())
	{
		string fieldName;
		if (!(inputFile >> fieldName)) break;
		if (fieldName == "END")
			break;
		else if (fieldName == "PriceHubs")
		{
			string first;
			inputFile >> first;
			if (first == "all") {
				settings.price_all_hubs = true;
				settings.price_hubs.clear();
			}
			else {
				settings.price_all_hubs = false;
				settings.price_hubs.clear();
				const int count = atoi(first.c_str());
				for (int i = 0; i < count; i++) {
					string hub;
					inputFile >> hub;
					settings.price_hubs.push_back(hub);
				}
			}
			continue;
		}
		else if (fieldName == "PriceTieBreak")
		{
			string rule;
			inputFile >> rule;
			if (rule == "lowest") settings.price_tie_break = PriceTieBreak::LowestPrice;
			else if (rule == "first") settings.price_tie_break = PriceTieBreak::FirstMatch;
			else std::cout << "Unknown price tie break '" << rule << "', keeping the default" << std::endl;
			continue;
		}
		else if (fieldName == "Solver")
		{
			inputFile >> settings.solver.name;
			continue;
		}
		else if (settings.has_numeric(fieldName))
		{
			double value = 0;
			if (!(inputFile >> value)) throw MissingInputError("parameter " + fieldName + " has no numeric value");
			settings.set_numeric(fieldName, value);
			continue;
		}
		else {
			string rest;
			getline(inputFile, rest);
			std::cout << "Unknown parameter " << fieldName << " is skipped" << std::endl;
			continue;
		}
	}
}

CsvTable ReadWrite::readCsv(const string &stem, bool required) const
{
	CsvTable t;
	t.name = stem;
	const string file = inputDirectory + "/" + stem + ".csv";
	ifstream f(file.c_str());
	if (!f.good())
	{
		if (required) throw MissingInputError("could not find required file " + file);
		return t;
	}
	string s;
	while (getline(f, s)) {
		if (!s.empty() && s.back() == '\r') s.pop_back();
		if (s.empty()) continue;
		if (t.header.empty()) t.header = split_csv(s);
		else t.rows.push_back(split_csv(s));
	}
	return t;
}

TableSet ReadWrite::readTables() const
{
	TableSet tables;
	for (const char* stem : { "hubs", "production_thermal", "production_electric", "distribution", "conversion", "demand", "ccs" }) {
		tables[stem] = readCsv(stem, true);
	}
	for (const char* stem : { "production_existing", "arcs" }) {
		CsvTable t = readCsv(stem, false);
		if (!t.header.empty()) tables[stem] = t;
	}
	return tables;
}

std::vector<Hub> ReadWrite::readHubs() const
{
	return to_hubs(readCsv("hubs", true));
}

std::vector<HubPair> ReadWrite::readArcList(const string &stem) const
{
	const CsvTable t = readCsv(stem, false);
	if (t.header.empty()) return std::vector<HubPair>();
	return to_hub_pairs(t);
}

MonteCarloPlan ReadWrite::readMonteCarlo() const
{
	MonteCarloPlan plan;
	const string file = inputDirectory + monteCarloFile;
	ifstream inputFile(file.c_str());
	if (!inputFile) throw MissingInputError("could not find the Monte Carlo file " + file);
	while (!inputFile.eof())
	{
		string fieldName;
		if (!(inputFile >> fieldName)) break;
		if (fieldName == "END")
			break;
		else if (fieldName == "Trials")
		{
			inputFile >> plan.trials;
			continue;
		}
		else if (fieldName == "Seed")
		{
			inputFile >> plan.seed;
			continue;
		}
		else if (fieldName == "Param")
		{
			McParam p;
			inputFile >> p.file >> p.row >> p.column >> p.distribution >> p.p1 >> p.p2;
			if (!inputFile) throw MissingInputError("incomplete Param line in " + file);
			plan.params.push_back(p);
			continue;
		}
		else {
			string rest;
			getline(inputFile, rest);
			std::cout << "Unknown Monte Carlo entry " << fieldName << " is skipped" << std::endl;
			continue;
		}
	}
	return plan;
}

/* Utility Functions */
std::vector<std::string> ReadWrite::split(const std::string &s) const
{
	std::vector<std::string> v;
	std::istringstream iss(s);
	std::string x;
	while (iss >> x) {
		v.push_back(x);
	}
	return v;
}

static std::string trim(const std::string &s)
{
	const auto first = s.find_first_not_of(" \t");
	if (first == std::string::npos) return "";
	return s.substr(first, s.find_last_not_of(" \t") - first + 1);
}

std::vector<std::string> ReadWrite::split_csv(const std::string &s) const
{
	// commas inside double quotes belong to the field, "" is a literal quote
	std::vector<std::string> v;
	std::string value;
	bool quoted = false, was_quoted = false;
	for (size_t i = 0; i < s.size(); i++) {
		const char c = s[i];
		if (quoted) {
			if (c != '"') value += c;
			else if (i + 1 < s.size() && s[i + 1] == '"') value += s[++i];
			else quoted = false;
		}
		else if (c == '"') {
			quoted = was_quoted = true;
			value.clear();
		}
		else if (c == ',') {
			v.push_back(was_quoted ? value : trim(value));
			value.clear();
			was_quoted = false;
		}
		else if (!was_quoted) {
			value += c;
		}
	}
	v.push_back(was_quoted ? value : trim(value));
	return v;
}
