#pragma once
#include <map>
#include <string>
#include <vector>

#include "network.h"
#include "optmodel.h"
#include "settings.h"
#include "solver.h"

struct TableRow
{
   std::string id;
   std::string arc_start;			// distribution rows only
   std::string arc_end;
   std::map<std::string, double> values;

   double get(const std::string &column) const;
   void set(const std::string &column, double value) { values[column] = value; }
};

class Table
{
public:
   std::string index_name;
   std::vector<std::string> columns;
   std::vector<TableRow> rows;

   Table() {}
   Table(const std::string &_index_name, const std::vector<std::string> &_columns) : index_name(_index_name), columns(_columns) {}

   const TableRow *find(const std::string &id) const;
   double total(const std::string &column) const;
   size_t size() const { return rows.size(); }
};

// breakeven price of the cheapest probe that still buys its full demand
struct DiscoveredPrice
{
   std::string hub;
   std::string demand_type;
   std::string probe;
   double price;			// USD/kg
};

struct OutputTable
{
   Table production;
   Table conversion;
   Table consumption;
   Table distribution;
   std::vector<DiscoveredPrice> prices;
   double h2_consumed;
   double h2_produced;

   OutputTable() : h2_consumed(0), h2_produced(0) {}
};

// one reported facility or arc of a site
struct SiteEntry
{
   std::map<std::string, std::string> labels;
   std::map<std::string, double> values;

   bool operator==(const SiteEntry &other) const { return labels == other.labels && values == other.values; }
};

typedef std::map<std::string, SiteEntry> SiteEntries;

struct SiteReport
{
   SiteEntries production;
   SiteEntries conversion;
   SiteEntries consumption;
   SiteEntries local;				// distribution inside the hub
   SiteEntries outgoing;
   SiteEntries incoming;

   bool operator==(const SiteReport &other) const {
      return production == other.production && conversion == other.conversion && consumption == other.consumption
         && local == other.local && outgoing == other.outgoing && incoming == other.incoming;
   }
   bool operator!=(const SiteReport &other) const { return !(*this == other); }
};

// Joins the solved variable families and their coefficients into the four
// reporting tables, then filters solver noise, discovers probe prices, merges
// the retrofit families into the new-producer columns and derives cost columns.
class SolutionDecomposer
{
private:
   const Solution &sol;
   const OptimizationModel &m;
   const Network &g;
   const Settings &settings;
   OutputTable out;

   double lookup(const std::string &column, const std::string &id) const;
   Table join(const std::string &index_name, const std::string &set, const std::vector<std::string> &columns) const;

public:
   SolutionDecomposer(const Solution &_sol, const OptimizationModel &_m, const Network &_g, const Settings &_settings)
      : sol(_sol), m(_m), g(_g), settings(_settings) {}

   void collectTables();
   std::vector<TableRow> discoverPrices();
   void filterNoise();
   void mergeRetrofits();
   void deriveProductionColumns();

   OutputTable decompose();
};

OutputTable decompose(const Solution &solution, const OptimizationModel &model, const Network &g, const Settings &settings);
// recovers the model coefficients from the network
OutputTable decompose(const Solution &solution, const Network &g, const Settings &settings);

SiteReport per_site(const OutputTable &table, const std::string &hub);
std::map<std::string, SiteReport> per_site(const OutputTable &table, const std::vector<std::string> &hubs);
