#pragma once
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "tables.h"
#include "settings.h"

struct Route
{
   double euclidean_km;
   double road_km;
};

// source of inter-hub distances, injected into the arc builder
class DistanceClient
{
public:
   virtual ~DistanceClient() {}
   virtual Route route(const Hub &a, const Hub &b) = 0;
};

// offline client: haversine distance, roads longer by a constant detour factor
class GreatCircleClient : public DistanceClient
{
private:
   double detour;

public:
   explicit GreatCircleClient(double _detour) : detour(_detour) {}
   Route route(const Hub &a, const Hub &b) override;
};

double great_circle_km(const Hub &a, const Hub &b);

struct HubPair
{
   std::string start_hub;
   std::string end_hub;
};

// Selects the hub pairs worth connecting and asks the client for their distances.
class ArcBuilder
{
private:
   std::vector<Hub> hubs;							// sorted by status, minor hubs first
   const ArcSettings &settings;
   DistanceClient &client;

   std::vector< std::map<int, double> > lengths;		// remaining connections of each hub
   std::set< std::pair<int, int> > connections;

   int position(const std::string &hub) const;
   std::pair<int, int> ordered(int a, int b) const { return (a < b) ? std::make_pair(a, b) : std::make_pair(b, a); }
   void remove_connection(int a, int b);
   bool has_remaining_valid_connections(int hub, double current_length, double length_factor) const;

public:
   ArcBuilder(const std::vector<Hub> &_hubs, const ArcSettings &_settings, DistanceClient &_client);

   // pruned pairs as (start, end) hub names
   std::vector<HubPair> prune(const std::vector<HubPair> &blacklist);
   std::vector<HubArc> build(const std::vector<HubPair> &whitelist, const std::vector<HubPair> &blacklist);
};
