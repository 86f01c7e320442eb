#include "../inc/solver.h"
#include "../inc/errors.h"

double Solution::value(const std::string &name) const
{
	auto it = values.find(name);
	if (it == values.end()) throw MalformedReferenceError("variable " + name + " is not in the solution");
	return it->second;
}
