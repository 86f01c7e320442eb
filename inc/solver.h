#pragma once
#include <map>
#include <string>

#include "util.h"
#include "optmodel.h"
#include "settings.h"

// flat variable assignment returned by a solver, keyed by family(identifier)
class Solution
{
private:
   Result status;
   double objective;
   std::map<std::string, double> values;

public:
   Solution() : status(Result::NOT_SOLVED), objective(0.0) {}

   void set_status(Result _status) { status = _status; }
   Result get_status() const { return status; }
   bool is_optimal() const { return status == Result::OPTIMAL; }
   void set_objective(double _objective) { objective = _objective; }
   double get_objective() const { return objective; }

   void set_value(const std::string &name, double value) { values[name] = value; }
   bool has(const std::string &name) const { return values.count(name) > 0; }
   double value(const std::string &name) const;
   double value(const std::string &family, const std::string &id) const { return value(var_name(family, id)); }
   const std::map<std::string, double> &all() const { return values; }
};

// Blocking MILP backend. Non-optimal outcomes are returned as their status and
// leave the solution without values.
class MilpSolver
{
public:
   virtual ~MilpSolver() {}
   virtual Result solve(const OptimizationModel &model, const SolverConfig &config, Solution &solution) = 0;
};
