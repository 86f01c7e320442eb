#include <cmath>
#include "../inc/settings.h"
#include "../inc/errors.h"

Settings::Settings()
{
	price_tracking.start = 0.0;
	price_tracking.stop = 10.0;
	price_tracking.step = 1.0;
	price_all_hubs = true;
	price_demand = 0.01;
	find_prices = false;
	price_tie_break = PriceTieBreak::LowestPrice;

	carbon_price = 0.0;
	carbon_capture_credit = 0.0;
	baseSMR_CO2_per_H2_tons = 9.0;

	time_slices = 365;
	investment_interest = 0.08;
	investment_period = 20;
	fixedcost_percent = 0.02;

	subsidy_dollar_billion = 0.0;
	subsidy_cost_share_fraction = 1.0;

	fractional_chec = true;
	output_tolerance = 1e-3;

	solver.name = "gurobi";
	solver.algorithm = -1;
	solver.mip_gap = 0.01;
	solver.time_limit = 3600;
	solver.verbose = false;

	arcs.min_hubs = 3;
	arcs.minor_length_factor = 5.0;
	arcs.major_length_factor = 0.8;
	arcs.regular_length_factor = 0.9;
	arcs.road_detour_factor = 1.2;
}

std::vector<double> PriceLadder::values() const
{
	std::vector<double> prices;
	if (step == 0.0) return prices;
	const int n = static_cast<int>(std::ceil((stop - start) / step));
	for (int i = 0; i < n; i++) {
		prices.push_back(start + i * step);
	}
	return prices;
}

double Settings::annuity_factor() const
{
	const double i = investment_interest;
	const double n = investment_period;
	if (i == 0.0) return n;
	return (std::pow(1 + i, n) - 1) / (i * std::pow(1 + i, n));
}

bool Settings::set_numeric(const std::string &key, double value)
{
	if (key == "PriceStart") price_tracking.start = value;
	else if (key == "PriceStop") price_tracking.stop = value;
	else if (key == "PriceStep") price_tracking.step = value;
	else if (key == "PriceDemand") price_demand = value;
	else if (key == "FindPrices") find_prices = (value != 0.0);
	else if (key == "CarbonPrice") carbon_price = value;
	else if (key == "CarbonCaptureCredit") carbon_capture_credit = value;
	else if (key == "BaseSmrCo2PerH2") baseSMR_CO2_per_H2_tons = value;
	else if (key == "TimeSlices") time_slices = value;
	else if (key == "InvestmentInterest") investment_interest = value;
	else if (key == "InvestmentPeriod") investment_period = value;
	else if (key == "FixedCostPercent") fixedcost_percent = value;
	else if (key == "SubsidyBillion") subsidy_dollar_billion = value;
	else if (key == "SubsidyCostShare") subsidy_cost_share_fraction = value;
	else if (key == "FractionalChec") fractional_chec = (value != 0.0);
	else if (key == "OutputTolerance") output_tolerance = value;
	else if (key == "MipGap") solver.mip_gap = value;
	else if (key == "TimeLimit") solver.time_limit = value;
	else if (key == "SolverAlgorithm") solver.algorithm = static_cast<int>(value);
	else if (key == "SolverVerbose") solver.verbose = (value != 0.0);
	else if (key == "MinHubs") arcs.min_hubs = static_cast<int>(value);
	else if (key == "MinorLengthFactor") arcs.minor_length_factor = value;
	else if (key == "MajorLengthFactor") arcs.major_length_factor = value;
	else if (key == "RegularLengthFactor") arcs.regular_length_factor = value;
	else if (key == "RoadDetourFactor") arcs.road_detour_factor = value;
	else return false;
	return true;
}

bool Settings::has_numeric(const std::string &key) const
{
	Settings probe(*this);
	return probe.set_numeric(key, 0.0);
}

double Settings::get_numeric(const std::string &key) const
{
	if (key == "PriceStart") return price_tracking.start;
	if (key == "PriceStop") return price_tracking.stop;
	if (key == "PriceStep") return price_tracking.step;
	if (key == "PriceDemand") return price_demand;
	if (key == "FindPrices") return find_prices ? 1.0 : 0.0;
	if (key == "CarbonPrice") return carbon_price;
	if (key == "CarbonCaptureCredit") return carbon_capture_credit;
	if (key == "BaseSmrCo2PerH2") return baseSMR_CO2_per_H2_tons;
	if (key == "TimeSlices") return time_slices;
	if (key == "InvestmentInterest") return investment_interest;
	if (key == "InvestmentPeriod") return investment_period;
	if (key == "FixedCostPercent") return fixedcost_percent;
	if (key == "SubsidyBillion") return subsidy_dollar_billion;
	if (key == "SubsidyCostShare") return subsidy_cost_share_fraction;
	if (key == "FractionalChec") return fractional_chec ? 1.0 : 0.0;
	if (key == "OutputTolerance") return output_tolerance;
	if (key == "MipGap") return solver.mip_gap;
	if (key == "TimeLimit") return solver.time_limit;
	if (key == "SolverAlgorithm") return solver.algorithm;
	if (key == "SolverVerbose") return solver.verbose ? 1.0 : 0.0;
	if (key == "MinHubs") return arcs.min_hubs;
	if (key == "MinorLengthFactor") return arcs.minor_length_factor;
	if (key == "MajorLengthFactor") return arcs.major_length_factor;
	if (key == "RegularLengthFactor") return arcs.regular_length_factor;
	if (key == "RoadDetourFactor") return arcs.road_detour_factor;
	throw MissingInputError("unknown numeric setting " + key);
}
