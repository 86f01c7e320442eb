#include "../inc/optmodel.h"
#include "../inc/errors.h"
#include "../inc/util.h"

std::string var_name(const std::string &family, const std::string &id)
{
	return family + "(" + id + ")";
}

LinExpr LinExpr::term(int var, double coef)
{
	LinExpr e;
	e.add(var, coef);
	return e;
}

LinExpr &LinExpr::add(int var, double coef)
{
	if (coef == 0.0) return *this;
	coefs[var] += coef;
	return *this;
}

LinExpr &LinExpr::operator+=(const LinExpr &other)
{
	for (const auto &t : other.coefs) add(t.first, t.second);
	constant += other.constant;
	return *this;
}

LinExpr &LinExpr::operator-=(const LinExpr &other)
{
	for (const auto &t : other.coefs) add(t.first, -t.second);
	constant -= other.constant;
	return *this;
}

LinExpr &LinExpr::operator*=(double factor)
{
	if (factor == 0.0) {
		coefs.clear();
		constant = 0.0;
		return *this;
	}
	for (auto &t : coefs) t.second *= factor;
	constant *= factor;
	return *this;
}

double LinExpr::coef(int var) const
{
	auto it = coefs.find(var);
	return (it == coefs.end()) ? 0.0 : it->second;
}

LinExpr operator+(LinExpr a, const LinExpr &b) { a += b; return a; }
LinExpr operator-(LinExpr a, const LinExpr &b) { a -= b; return a; }
LinExpr operator*(LinExpr a, double factor) { a *= factor; return a; }
LinExpr operator*(double factor, LinExpr a) { a *= factor; return a; }

IndexSet::IndexSet(const std::vector<std::string> &_members)
{
	for (const auto &m : _members) {
		if (lookup.insert(m).second) members.push_back(m);
	}
}

void OptimizationModel::addSet(const std::string &name, const std::vector<std::string> &members)
{
	sets[name] = IndexSet(members);
}

const IndexSet &OptimizationModel::set(const std::string &name) const
{
	auto it = sets.find(name);
	if (it == sets.end()) throw MalformedReferenceError("set '" + name + "' is not declared");
	return it->second;
}

Parameter &OptimizationModel::addParam(const std::string &name, const std::string &domain)
{
	set(domain);
	params[name] = Parameter(name, domain);
	return params[name];
}

const Parameter &OptimizationModel::get_param(const std::string &name) const
{
	auto it = params.find(name);
	if (it == params.end()) throw MalformedReferenceError("parameter '" + name + "' is not declared");
	return it->second;
}

double OptimizationModel::param(const std::string &name, const std::string &id) const
{
	const Parameter &p = get_param(name);
	if (!in_set(p.get_domain(), id)) {
		throw MalformedReferenceError("parameter " + name + " has no index '" + id + "' in set " + p.get_domain());
	}
	return p.get(id);
}

void OptimizationModel::addVars(const std::string &family, const std::string &domain, VarType type, double lb, double ub)
{
	if (families.count(family)) throw MalformedReferenceError("variable family '" + family + "' is declared twice");
	const IndexSet &members = set(domain);
	if (type == VarType::BINARY) {
		lb = 0.0;
		ub = 1.0;
	}
	auto &index = families[family];
	family_domains[family] = domain;
	for (const auto &id : members.items()) {
		Variable v;
		v.name = var_name(family, id);
		v.type = type;
		v.lb = lb;
		v.ub = ub;
		index[id] = static_cast<int>(vars.size());
		vars.push_back(v);
	}
}

int OptimizationModel::var(const std::string &family, const std::string &id) const
{
	auto f = families.find(family);
	if (f == families.end()) throw MalformedReferenceError("variable family '" + family + "' is not declared");
	auto it = f->second.find(id);
	if (it == f->second.end()) {
		throw MalformedReferenceError("variable " + family + " has no index '" + id + "' in set " + family_domains.at(family));
	}
	return it->second;
}

const std::string &OptimizationModel::family_domain(const std::string &family) const
{
	auto it = family_domains.find(family);
	if (it == family_domains.end()) throw MalformedReferenceError("variable family '" + family + "' is not declared");
	return it->second;
}

void OptimizationModel::addConstr(const std::string &name, const LinExpr &lhs, Sense sense, const LinExpr &rhs)
{
	Constraint c;
	c.name = name;
	c.lhs = lhs - rhs;
	c.rhs = -c.lhs.get_constant();
	c.lhs -= LinExpr(c.lhs.get_constant());
	c.sense = sense;
	constrs.push_back(c);
}

std::vector<const Constraint*> OptimizationModel::find_constrs(const std::string &prefix) const
{
	std::vector<const Constraint*> found;
	for (const auto &c : constrs) {
		if (starts_with(c.name, prefix)) found.push_back(&c);
	}
	return found;
}
