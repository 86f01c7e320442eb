#pragma once
#include <string>
#include <vector>

#include "network.h"
#include "settings.h"

// Builds the hydrogen flow network of one scenario from its input tables.
// Every stage throws MissingInputError when a required hub, technology or
// table row is absent; build() returns only a complete, frozen network.
class NetworkSynthesizer
{
private:
   const InputData &data;
   const Settings &settings;
   Network g;

   const Hub &find_hub(const std::string &name) const;
   const ProductionTech &find_production(const std::string &type) const;
   const DistributionTech &pipeline() const;
   void add_free_arc(const std::string &start, const std::string &end, ArcKind kind, const std::string &tech = "");

public:
   NetworkSynthesizer(const InputData &_data, const Settings &_settings) : data(_data), settings(_settings) {}

   void initializeHubs();				// intra-hub scaffold
   void addHubArcs();					// pipelines and truck routes between hubs
   void addConsumers();
   void addProducers();
   void addConverters();
   void addPriceNodes();

   Network build();
};

Network synthesize(const InputData &data, const Settings &settings);

// probe price as it appears in node names, e.g. 1.0 or 2.5
std::string price_label(double price);
std::string price_node_name(const std::string &hub, const std::string &demand_type, double price);
std::vector<std::string> price_hub_list(const Settings &settings, const std::vector<std::string> &all_hubs);
