#include <cstdlib>
#include "../inc/montecarlo.h"
#include "../inc/errors.h"

namespace {

double param_value(const std::string &p, double base)
{
	if (p == "default") return base;
	char* end = nullptr;
	const double v = std::strtod(p.c_str(), &end);
	if (end == p.c_str() || *end != '\0') throw MissingInputError("Monte Carlo parameter '" + p + "' is not a number");
	return v;
}

}

double base_value(const McParam &param, const TableSet &tables, const Settings &settings)
{
	if (param.file == "settings") return settings.get_numeric(param.row);
	auto it = tables.find(param.file);
	if (it == tables.end()) throw MissingInputError("Monte Carlo table '" + param.file + "' is not an input table");
	return it->second.get_number(param.row, param.column);
}

double draw(const McParam &param, double base, std::mt19937 &generator)
{
	const double p1 = param_value(param.p1, base);
	const double p2 = param_value(param.p2, base);
	if (param.distribution == "normal") {
		std::normal_distribution<double> distribution(p1, p2);
		return distribution(generator);
	}
	else if (param.distribution == "uniform") {
		std::uniform_real_distribution<double> distribution(p1, p2);
		return distribution(generator);
	}
	else if (param.distribution == "lognormal") {
		std::lognormal_distribution<double> distribution(p1, p2);
		return distribution(generator);
	}
	else if (param.distribution == "weibull") {
		std::weibull_distribution<double> distribution(p1, p2);
		return distribution(generator);
	}
	throw MissingInputError("unknown distribution '" + param.distribution + "' for " + param.label());
}

std::vector<double> draw_samples(const MonteCarloPlan &plan, const TableSet &tables, const Settings &settings)
{
	std::vector<double> bases;
	for (const auto &p : plan.params) bases.push_back(base_value(p, tables, settings));

	std::mt19937 generator(plan.seed);
	std::vector<double> samples;
	samples.reserve(plan.trials * plan.params.size());
	for (int t = 0; t < plan.trials; t++) {
		for (size_t i = 0; i < plan.params.size(); i++) {
			samples.push_back(draw(plan.params[i], bases[i], generator));
		}
	}
	return samples;
}

void apply_trial(const MonteCarloPlan &plan, const std::vector<double> &samples, int trial, TableSet &tables, Settings &settings)
{
	const size_t offset = trial * plan.params.size();
	if (offset + plan.params.size() > samples.size()) {
		throw std::out_of_range("no samples were drawn for trial " + std::to_string(trial));
	}
	for (size_t i = 0; i < plan.params.size(); i++) {
		const McParam &p = plan.params[i];
		if (p.file == "settings") {
			if (!settings.set_numeric(p.row, samples[offset + i])) throw MissingInputError("unknown setting " + p.row);
			continue;
		}
		auto it = tables.find(p.file);
		if (it == tables.end()) throw MissingInputError("Monte Carlo table '" + p.file + "' is not an input table");
		it->second.set_number(p.row, p.column, samples[offset + i]);
	}
}

std::vector<int> trials_of_rank(int trials, int rank, int num_ranks)
{
	std::vector<int> mine;
	for (int t = 0; t < trials; t++) {
		if (t % num_ranks == rank) mine.push_back(t);
	}
	return mine;
}
