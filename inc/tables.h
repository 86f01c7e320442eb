#pragma once
#include <map>
#include <string>
#include <vector>

#include "errors.h"

enum class Purity {
   Low = 0,
   High = 1
};

enum class TechType {
   NONE = 0,
   THERMAL = 1,
   ELECTRIC = 2
};

enum HubStatus {
   MINOR = -1,
   REGULAR = 0,
   MAJOR = 1
};

// technology specific numeric columns; absent entries read as zero
class AttributeBag
{
private:
   std::map<std::string, double> values;

public:
   double get(const std::string &key) const {
      auto it = values.find(key);
      return (it == values.end()) ? 0.0 : it->second;
   }
   bool has(const std::string &key) const { return values.count(key) > 0; }
   void set(const std::string &key, double value) { values[key] = value; }
   void scale(const std::string &key, double factor) {
      auto it = values.find(key);
      if (it != values.end()) it->second *= factor;
   }
   const std::map<std::string, double> &all() const { return values; }
};

struct Hub
{
   std::string name;
   HubStatus status;
   double capital_pm;
   double e_pm;
   double ng_pm;
   bool has_coordinates;
   double latitude;
   double longitude;
   std::map<std::string, double> build;			// build_<production type>
   std::map<std::string, double> demand;		// <sector>_tonnesperday

   Hub() : status(HubStatus::REGULAR), capital_pm(1), e_pm(1), ng_pm(1), has_coordinates(false), latitude(0), longitude(0) {}

   // an absent column is an input error, only an explicit 0 disables the entry
   bool can_build(const std::string &type) const {
      auto it = build.find(type);
      if (it == build.end()) throw MissingInputError("hub " + name + " has no build_" + type + " column");
      return it->second != 0.0;
   }
   double demand_for(const std::string &sector) const {
      auto it = demand.find(sector);
      if (it == demand.end()) throw MissingInputError("hub " + name + " has no " + sector + "_tonnesperday column");
      return it->second;
   }
};

struct ProductionTech
{
   std::string type;
   Purity purity;
   TechType tech_type;
   AttributeBag attrs;
};

struct ExistingProducer
{
   std::string hub;
   std::string type;
   AttributeBag attrs;				// capacity_tonPerDay and the producer's own cost/carbon columns
};

struct DistributionTech
{
   std::string name;
   double capital_usdPerUnit;
   double fixed_usdPerUnitPerDay;
   double variable_usdPerKilometerTon;
   double flowLimit_tonsPerDay;

   bool is_pipeline() const { return name == "pipeline"; }
   bool is_truck() const { return name.find("truck") != std::string::npos; }
};

struct ConversionTech
{
   std::string name;
   std::string arc_start_class;		// class tag, or "pass" to disable the rule
   std::string arc_end_class;
   AttributeBag attrs;

   bool is_pass() const { return arc_start_class == "pass"; }
};

struct DemandSector
{
   std::string sector;
   std::string demand_type;			// fuelStation, lowPurity or highPurity
   double carbon_sensitive_fraction;
   double breakeven_price;
   AttributeBag attrs;
};

// inter-hub distance record
struct HubArc
{
   std::string start_hub;
   std::string end_hub;
   double km_euclid;
   double km_road;
   int exist_pipeline;
};

struct CcsTech
{
   std::string name;
   double percent_co2_captured;
   double h2_tax_credit;
   double variable_usdPerTonCO2;
};

struct InputData
{
   std::vector<Hub> hubs;
   std::vector<ProductionTech> production;
   std::vector<ExistingProducer> existing_production;
   std::vector<DistributionTech> distribution;
   std::vector<ConversionTech> conversion;
   std::vector<DemandSector> demand;
   std::vector<HubArc> arcs;
   std::vector<CcsTech> ccs;
};
