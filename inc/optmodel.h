#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>

constexpr auto VAR_INFINITY = 1e100;

enum class VarType {
   CONTINUOUS,
   INTEGER,
   BINARY
};

enum class Sense {
   LESS_EQUAL,
   EQUAL,
   GREATER_EQUAL
};

struct Variable
{
   std::string name;			// family(identifier)
   VarType type;
   double lb;
   double ub;
};

// sparse linear expression over variable indices
class LinExpr
{
private:
   std::map<int, double> coefs;
   double constant;

public:
   LinExpr(double _constant = 0.0) : constant(_constant) {}
   static LinExpr term(int var, double coef = 1.0);

   LinExpr &add(int var, double coef);
   LinExpr &operator+=(const LinExpr &other);
   LinExpr &operator-=(const LinExpr &other);
   LinExpr &operator*=(double factor);

   double coef(int var) const;
   double get_constant() const { return constant; }
   const std::map<int, double> &terms() const { return coefs; }
   bool empty() const { return coefs.empty(); }
};

LinExpr operator+(LinExpr a, const LinExpr &b);
LinExpr operator-(LinExpr a, const LinExpr &b);
LinExpr operator*(LinExpr a, double factor);
LinExpr operator*(double factor, LinExpr a);

// constants of the expression are moved to the right hand side when added
struct Constraint
{
   std::string name;
   LinExpr lhs;
   Sense sense;
   double rhs;
};

class IndexSet
{
private:
   std::vector<std::string> members;
   std::set<std::string> lookup;

public:
   IndexSet() {}
   explicit IndexSet(const std::vector<std::string> &_members);

   bool contains(const std::string &id) const { return lookup.count(id) > 0; }
   const std::vector<std::string> &items() const { return members; }
   size_t size() const { return members.size(); }
};

// coefficients over one declared set; identifiers of the set without a value read as zero
class Parameter
{
private:
   std::string name;
   std::string domain;
   std::map<std::string, double> values;

public:
   Parameter() {}
   Parameter(const std::string &_name, const std::string &_domain) : name(_name), domain(_domain) {}

   void set(const std::string &id, double value) { values[id] = value; }
   double get(const std::string &id) const {
      auto it = values.find(id);
      return (it == values.end()) ? 0.0 : it->second;
   }
   const std::string &get_domain() const { return domain; }
   const std::string &get_name() const { return name; }
};

// Solver-neutral MILP: named sets and parameters over network identifiers,
// variable families indexed by those identifiers, linear constraints and a
// linear objective.
class OptimizationModel
{
private:
   std::map<std::string, IndexSet> sets;
   std::map<std::string, Parameter> params;
   std::vector<Variable> vars;
   std::map<std::string, std::map<std::string, int> > families;
   std::map<std::string, std::string> family_domains;
   std::vector<Constraint> constrs;
   LinExpr objective;
   bool maximize;

public:
   OptimizationModel() : maximize(true) {}

   void addSet(const std::string &name, const std::vector<std::string> &members);
   const IndexSet &set(const std::string &name) const;
   bool has_set(const std::string &name) const { return sets.count(name) > 0; }
   bool in_set(const std::string &name, const std::string &id) const { return set(name).contains(id); }

   Parameter &addParam(const std::string &name, const std::string &domain);
   double param(const std::string &name, const std::string &id) const;
   bool has_param(const std::string &name) const { return params.count(name) > 0; }
   const Parameter &get_param(const std::string &name) const;

   void addVars(const std::string &family, const std::string &domain, VarType type,
                double lb = 0.0, double ub = VAR_INFINITY);
   int var(const std::string &family, const std::string &id) const;
   LinExpr x(const std::string &family, const std::string &id, double coef = 1.0) const { return LinExpr::term(var(family, id), coef); }
   bool has_family(const std::string &family) const { return families.count(family) > 0; }
   const std::string &family_domain(const std::string &family) const;
   const std::vector<Variable> &get_vars() const { return vars; }
   int num_vars() const { return static_cast<int>(vars.size()); }

   void addConstr(const std::string &name, const LinExpr &lhs, Sense sense, const LinExpr &rhs);
   const std::vector<Constraint> &get_constrs() const { return constrs; }
   int num_constrs() const { return static_cast<int>(constrs.size()); }
   std::vector<const Constraint*> find_constrs(const std::string &prefix) const;

   void setObjective(const LinExpr &expr, bool _maximize = true) { objective = expr; maximize = _maximize; }
   const LinExpr &get_objective() const { return objective; }
   bool is_maximize() const { return maximize; }
};

std::string var_name(const std::string &family, const std::string &id);
