#pragma once
#include <string>

#include "solver.h"

class GurobiSolver : public MilpSolver
{
private:
   std::string lp_file;			// written under LPMODEL after an optimal solve

public:
   GurobiSolver() {}
   explicit GurobiSolver(const std::string &_lp_file) : lp_file(_lp_file) {}

   Result solve(const OptimizationModel &model, const SolverConfig &config, Solution &solution) override;

   // true when a Gurobi environment (and licence) can be started
   static bool available();
};
