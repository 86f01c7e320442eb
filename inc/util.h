#pragma once
#include <iostream>
#include <string>
#include <sstream>
#include <fstream>
#include <cmath>
#include <vector>
#include <map>
#include <algorithm>
#include <set>
#include <cctype>

//#define LPMODEL
#define SolverStreamOff

constexpr auto FREE_FLOW_LIMIT = 99999999.9;		// flow limit of arcs that model free movement inside a hub
constexpr auto OUTPUT_TOL = 1e-3;
constexpr auto ISCLOSE_RTOL = 1e-5;
constexpr auto ISCLOSE_ATOL = 1e-8;
constexpr auto PRICE_PER_KG_TO_TON = 1000.0;
constexpr auto EARTH_RADIUS_KM = 6371.0;
constexpr double PI = 3.14159265358979323846;

#define PRINT_SECTION(log) {std::cout << "=============" << log << "==============" << std::endl;}
#define PRINT_SUBSECTION(log) {std::cout << "--" << log << "--" << std::endl;}

enum Algorithm
{
   DIRECT = 1,
   MONTECARLO = 2,
   ARCS = 3
};

// status codes follow Gurobi's numbering
enum Result {
   NOT_SOLVED = 1,
   OPTIMAL = 2,
   INFEASIBLE = 3,
   INF_OR_UNBD = 4,
   UNBOUNDED = 5,
   TIME_LIMIT = 9,
   SOLVER_ERROR = 12
};

inline const char* result_name(Result r)
{
   switch (r) {
   case Result::OPTIMAL: return "optimal";
   case Result::INFEASIBLE: return "infeasible";
   case Result::INF_OR_UNBD: return "infeasible or unbounded";
   case Result::UNBOUNDED: return "unbounded";
   case Result::TIME_LIMIT: return "time limit reached";
   case Result::SOLVER_ERROR: return "solver error";
   default: return "not solved";
   }
}

// approximate equality, absolute plus relative tolerance on b
inline bool isclose(double a, double b)
{
   return std::fabs(a - b) <= ISCLOSE_ATOL + ISCLOSE_RTOL * std::fabs(b);
}

inline bool starts_with(const std::string &s, const std::string &prefix)
{
   return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline std::string cap_first(std::string s)
{
   if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
   return s;
}
