#include <cmath>
#include <iostream>
#include "../inc/arcs.h"
#include "../inc/errors.h"
#include "../inc/util.h"

double great_circle_km(const Hub &a, const Hub &b)
{
	if (!a.has_coordinates || !b.has_coordinates) {
		throw MissingInputError("hub '" + (a.has_coordinates ? b.name : a.name) + "' has no coordinates");
	}
	const double to_rad = PI / 180.0;
	const double dlat = (b.latitude - a.latitude) * to_rad;
	const double dlon = (b.longitude - a.longitude) * to_rad;
	const double h = std::sin(dlat / 2) * std::sin(dlat / 2)
		+ std::cos(a.latitude * to_rad) * std::cos(b.latitude * to_rad) * std::sin(dlon / 2) * std::sin(dlon / 2);
	return 2 * EARTH_RADIUS_KM * std::asin(std::min(1.0, std::sqrt(h)));
}

Route GreatCircleClient::route(const Hub &a, const Hub &b)
{
	Route r;
	r.euclidean_km = great_circle_km(a, b);
	r.road_km = r.euclidean_km * detour;
	return r;
}

ArcBuilder::ArcBuilder(const std::vector<Hub> &_hubs, const ArcSettings &_settings, DistanceClient &_client)
	: hubs(_hubs), settings(_settings), client(_client)
{
	std::stable_sort(hubs.begin(), hubs.end(), [](const Hub &a, const Hub &b) { return a.status < b.status; });
}

int ArcBuilder::position(const std::string &hub) const
{
	for (size_t i = 0; i < hubs.size(); i++) {
		if (hubs[i].name == hub) return static_cast<int>(i);
	}
	throw MissingInputError("hub '" + hub + "' in the arc lists is not in the hub table");
}

void ArcBuilder::remove_connection(int a, int b)
{
	if (connections.erase(ordered(a, b)) == 0) {
		std::cout << "Tried to remove connection '" << hubs[a].name << " to " << hubs[b].name
					 << "', but this connection was not created in the first place!" << std::endl;
		return;
	}
	lengths[a].erase(b);
	lengths[b].erase(a);
}

bool ArcBuilder::has_remaining_valid_connections(int hub, double current_length, double length_factor) const
{
	int count = 0;
	for (const auto &l : lengths[hub]) {
		if (l.second < length_factor * current_length) count++;
	}
	return count >= settings.min_hubs;
}

std::vector<HubPair> ArcBuilder::prune(const std::vector<HubPair> &blacklist)
{
	const int n = static_cast<int>(hubs.size());
	lengths.assign(n, std::map<int, double>());
	connections.clear();
	for (int a = 0; a < n; a++) {
		for (int b = a + 1; b < n; b++) {
			const double d = great_circle_km(hubs[a], hubs[b]);
			lengths[a][b] = d;
			lengths[b][a] = d;
			connections.insert(std::make_pair(a, b));
		}
	}

	// drop a pair when both ends keep enough shorter connections
	for (int a = 0; a < n; a++) {
		std::vector<int> dests;
		for (const auto &l : lengths[a]) dests.push_back(l.first);
		for (int b : dests) {
			if (!connections.count(ordered(a, b))) continue;
			const double current_length = lengths[a][b];
			const double lf = (hubs[a].status == HubStatus::MAJOR || hubs[b].status == HubStatus::MAJOR)
				? settings.major_length_factor : settings.regular_length_factor;
			if (has_remaining_valid_connections(b, current_length, lf) && has_remaining_valid_connections(a, current_length, lf)) {
				remove_connection(a, b);
			}
		}
	}

	// minor hubs only keep connections close to their shortest one
	for (int a = 0; a < n; a++) {
		if (hubs[a].status != HubStatus::MINOR || lengths[a].empty()) continue;
		double shortest = lengths[a].begin()->second;
		for (const auto &l : lengths[a]) shortest = std::min(shortest, l.second);
		const double max_length = settings.minor_length_factor * shortest;
		const std::map<int, double> snapshot = lengths[a];
		for (const auto &l : snapshot) {
			if (l.second > max_length) remove_connection(a, l.first);
		}
	}

	for (const auto &pair : blacklist) {
		remove_connection(position(pair.start_hub), position(pair.end_hub));
	}

	std::vector<HubPair> kept;
	for (const auto &c : connections) {
		HubPair p;
		p.start_hub = hubs[c.first].name;
		p.end_hub = hubs[c.second].name;
		kept.push_back(p);
	}
	return kept;
}

std::vector<HubArc> ArcBuilder::build(const std::vector<HubPair> &whitelist, const std::vector<HubPair> &blacklist)
{
	prune(blacklist);

	std::set< std::pair<int, int> > existing;
	for (const auto &pair : whitelist) {
		const auto c = ordered(position(pair.start_hub), position(pair.end_hub));
		existing.insert(c);
		connections.insert(c);
	}

	std::vector<HubArc> arcs;
	for (const auto &c : connections) {
		const Route r = client.route(hubs[c.first], hubs[c.second]);
		HubArc arc;
		arc.start_hub = hubs[c.first].name;
		arc.end_hub = hubs[c.second].name;
		arc.km_euclid = r.euclidean_km;
		arc.km_road = r.road_km;
		arc.exist_pipeline = existing.count(c) ? 1 : 0;
		arcs.push_back(arc);
	}
	PRINT_SUBSECTION("kept " << arcs.size() << " of " << hubs.size() * (hubs.size() - 1) / 2 << " hub pairs");
	return arcs;
}
