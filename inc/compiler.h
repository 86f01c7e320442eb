#pragma once
#include <string>
#include <vector>

#include "network.h"
#include "optmodel.h"
#include "settings.h"

// Compiles a frozen network and the scenario settings into a MILP.
// Stages may be run one by one; each constraint family only needs the sets,
// parameters and variables to be declared.
class ModelCompiler
{
private:
   const Network &g;
   const Settings &settings;
   OptimizationModel m;

   std::vector<std::string> ccs_names() const;
   std::string node_id(int n) const { return g.node(n).name; }
   std::string arc_id(int a) const { return g.arc_name(a); }

public:
   ModelCompiler(const Network &_g, const Settings &_settings);

   // declarations
   void createNodeSets();
   void createArcSets();
   void createParams();
   void createVariables();

   // constraint families
   void applyMassConservation();
   void applyCapacityRelationships();
   void applyExistingInfrastructure();
   void applyChecs();
   void applySubsidies();

   void buildObjective();

   OptimizationModel compile();
   const OptimizationModel &model() const { return m; }
};

OptimizationModel compile(const Network &g, const Settings &settings);
