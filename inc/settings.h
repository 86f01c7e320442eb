#pragma once
#include <string>
#include <vector>

enum class PriceTieBreak {
   LowestPrice = 0,
   FirstMatch = 1
};

struct SolverConfig
{
   std::string name;
   int algorithm;			// -1 lets the solver choose, otherwise the solver's LP method code
   double mip_gap;
   double time_limit;		// seconds
   bool verbose;
};

// arange-style ladder of probe prices in USD/kg, stop excluded
struct PriceLadder
{
   double start;
   double stop;
   double step;

   std::vector<double> values() const;
};

struct ArcSettings
{
   int min_hubs;
   double minor_length_factor;
   double major_length_factor;
   double regular_length_factor;
   double road_detour_factor;
};

class Settings
{
public:
   Settings();

   // price discovery
   PriceLadder price_tracking;
   bool price_all_hubs;
   std::vector<std::string> price_hubs;
   double price_demand;
   bool find_prices;
   PriceTieBreak price_tie_break;

   // carbon
   double carbon_price;					// USD per ton CO2 emitted
   double carbon_capture_credit;		// USD per ton CO2 captured
   double baseSMR_CO2_per_H2_tons;

   // investment
   double time_slices;
   double investment_interest;
   double investment_period;
   double fixedcost_percent;

   double subsidy_dollar_billion;
   double subsidy_cost_share_fraction;

   bool fractional_chec;
   double output_tolerance;

   SolverConfig solver;
   ArcSettings arcs;

   double annuity_factor() const;
   // one-time capital outlay -> daily equivalent
   double capital_divisor() const { return annuity_factor() * time_slices; }

   bool set_numeric(const std::string &key, double value);
   double get_numeric(const std::string &key) const;
   bool has_numeric(const std::string &key) const;
};
