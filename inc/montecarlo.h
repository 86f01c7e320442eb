#pragma once
#include <random>
#include <string>
#include <vector>

#include "util.h"
#include "rw.h"
#include "settings.h"

// one perturbed input cell; parameters given as "default" take the base value of the cell
struct McParam
{
   std::string file;					// table stem, or "settings"
   std::string row;					// row key, or the settings key
   std::string column;				// "-" for settings
   std::string distribution;		// normal, uniform, lognormal or weibull
   std::string p1;
   std::string p2;

   std::string label() const { return file + ":" + row + ":" + column; }
};

struct MonteCarloPlan
{
   int trials;
   unsigned int seed;
   std::vector<McParam> params;

   MonteCarloPlan() : trials(0), seed(0) {}
};

struct TrialResult
{
   int trial;
   Result status;
   double objective;
   double h2_consumed;
   double h2_produced;
   std::vector<double> samples;

   TrialResult() : trial(-1), status(Result::NOT_SOLVED), objective(0), h2_consumed(0), h2_produced(0) {}
};

double base_value(const McParam &param, const TableSet &tables, const Settings &settings);
double draw(const McParam &param, double base, std::mt19937 &generator);

// samples of every trial, row-major by trial
std::vector<double> draw_samples(const MonteCarloPlan &plan, const TableSet &tables, const Settings &settings);

// writes the samples of one trial into the trial's own copies of the tables and settings
void apply_trial(const MonteCarloPlan &plan, const std::vector<double> &samples, int trial, TableSet &tables, Settings &settings);

// trials of one rank, round-robin
std::vector<int> trials_of_rank(int trials, int rank, int num_ranks);
