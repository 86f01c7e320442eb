#include <ctime>
#include <filesystem>
#include <vector>
#include "gurobi_c++.h"
#include "../inc/gurobi_solver.h"

namespace {

char grb_type(VarType type)
{
	switch (type)
	{
	case VarType::INTEGER: return GRB_INTEGER;
	case VarType::BINARY: return GRB_BINARY;
	default: return GRB_CONTINUOUS;
	}
}

char grb_sense(Sense sense)
{
	switch (sense)
	{
	case Sense::LESS_EQUAL: return GRB_LESS_EQUAL;
	case Sense::GREATER_EQUAL: return GRB_GREATER_EQUAL;
	default: return GRB_EQUAL;
	}
}

GRBLinExpr grb_expr(const LinExpr &expr, const std::vector<GRBVar> &vars)
{
	GRBLinExpr xpr = expr.get_constant();
	for (const auto &t : expr.terms()) xpr += t.second * vars[t.first];
	return xpr;
}

}

bool GurobiSolver::available()
{
	try {
		GRBEnv env(true);
		env.set(GRB_IntParam_OutputFlag, 0);
		env.start();
	}
	catch (GRBException e) {
		std::cerr << "Gurobi is not available: " << e.getMessage() << std::endl;
		return false;
	}
	return true;
}

Result GurobiSolver::solve(const OptimizationModel &model, const SolverConfig &config, Solution &solution)
{
	PRINT_SECTION("Solving the problem directly with GUROBI");
	solution = Solution();
	try {
		GRBEnv env(true);
#ifdef SolverStreamOff
		env.set(GRB_IntParam_OutputFlag, config.verbose ? 1 : 0);
#endif
		env.start();
		GRBModel grb(env);
		grb.set(GRB_DoubleParam_MIPGap, config.mip_gap);
		grb.set(GRB_DoubleParam_TimeLimit, config.time_limit);
		if (config.algorithm >= 0) grb.set(GRB_IntParam_Method, config.algorithm);

		PRINT_SUBSECTION("initializing decision variables");
		std::vector<GRBVar> vars;
		vars.reserve(model.get_vars().size());
		for (const auto &v : model.get_vars()) {
			const double ub = (v.ub >= VAR_INFINITY) ? GRB_INFINITY : v.ub;
			vars.push_back(grb.addVar(v.lb, ub, 0.0, grb_type(v.type), v.name));
		}

		PRINT_SUBSECTION("initializing objective function");
		grb.setObjective(grb_expr(model.get_objective(), vars), model.is_maximize() ? GRB_MAXIMIZE : GRB_MINIMIZE);

		PRINT_SUBSECTION("initializing constraints");
		for (const auto &c : model.get_constrs()) {
			grb.addConstr(grb_expr(c.lhs, vars), grb_sense(c.sense), c.rhs, c.name);
		}

		PRINT_SUBSECTION("optimizing");
		clock_t _start = clock();
		grb.optimize();
		clock_t _end = clock();
		std::cout << "Solution time: " << double(_end - _start) / CLOCKS_PER_SEC << " s" << std::endl;

		const int status = grb.get(GRB_IntAttr_Status);
		if (status != GRB_OPTIMAL) {
			// a time limit with an incumbent is still reported as a time limit
			Result r = Result::SOLVER_ERROR;
			switch (status)
			{
			case GRB_INFEASIBLE: r = Result::INFEASIBLE; break;
			case GRB_INF_OR_UNBD: r = Result::INF_OR_UNBD; break;
			case GRB_UNBOUNDED: r = Result::UNBOUNDED; break;
			case GRB_TIME_LIMIT: r = Result::TIME_LIMIT; break;
			default: break;
			}
			solution.set_status(r);
			std::cerr << "Gurobi finished without an optimal solution: " << result_name(r) << std::endl;
			return r;
		}

#ifdef LPMODEL
		// only optimal runs leave files behind
		if (!lp_file.empty()) {
			std::filesystem::create_directories(std::filesystem::path(lp_file).parent_path());
			grb.write(lp_file);
		}
#endif

		solution.set_objective(grb.get(GRB_DoubleAttr_ObjVal));
		for (size_t i = 0; i < vars.size(); i++) {
			solution.set_value(model.get_vars()[i].name, vars[i].get(GRB_DoubleAttr_X));
		}
		solution.set_status(Result::OPTIMAL);
	}
	catch (GRBException e) {
		std::cerr << e.getMessage() << std::endl;
		solution.set_status(Result::SOLVER_ERROR);
		return Result::SOLVER_ERROR;
	}
	std::cout << "Objective value: " << solution.get_objective() << std::endl;
	return Result::OPTIMAL;
}
