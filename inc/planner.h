#pragma once
#include <string>
#include <vector>

#include "util.h"
#include "rw.h"
#include "settings.h"
#include "montecarlo.h"

class Planner
{
private:
   Algorithm alg;
   int rank, master, num_ranks;
   std::string output_directory;

   ReadWrite &rw;
   Settings settings;
   TableSet tables;

public:
   explicit Planner(ReadWrite &_rw) : alg(Algorithm::DIRECT), rank(0), master(0), num_ranks(1), rw(_rw) {}

   void readInputs();
   int optimize();

   Result direct();
   Result monteCarlo();
   Result buildArcs();

   // full pipeline of one scenario, outputs written to directory when optimal
   Result runScenario(const TableSet &_tables, const Settings &_settings, const std::string &directory, TrialResult &result) const;

   void set_rank(int _r) { rank = _r; }
   void set_num_ranks(int _c) { num_ranks = _c; }
   void set_master(int _m) { master = _m; }
   bool is_master_proc() const { return rank == master; }
   void set_algorithm(Algorithm _alg) { alg = _alg; }
   void set_output_directory(std::string _s) { output_directory = _s; }
   const Settings &get_settings() const { return settings; }
};
