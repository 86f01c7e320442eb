#pragma once
#include <map>
#include <string>
#include <vector>

#include "tables.h"
#include "settings.h"
#include "arcs.h"

struct OutputTable;
struct MonteCarloPlan;
struct TrialResult;

// CSV table as read from disk; the first column is the row key
class CsvTable
{
public:
   std::string name;
   std::vector<std::string> header;
   std::vector< std::vector<std::string> > rows;

   int column(const std::string &col) const;			// -1 when absent
   bool has_column(const std::string &col) const { return column(col) >= 0; }
   int row(const std::string &key) const;				// -1 when absent
   const std::string &key(int r) const { return rows[r][0]; }

   std::string cell(int r, const std::string &col) const;
   double number(int r, const std::string &col) const;
   double number_or(int r, const std::string &col, double fallback) const;

   // cell addressed by row key and column name
   double get_number(const std::string &row_key, const std::string &col) const;
   void set_number(const std::string &row_key, const std::string &col, double value);
};

// input tables of a scenario keyed by file stem
typedef std::map<std::string, CsvTable> TableSet;

// converts the raw tables into typed rows
std::vector<Hub> to_hubs(const CsvTable &hubs);
InputData to_input_data(const TableSet &tables);
std::vector<HubPair> to_hub_pairs(const CsvTable &table);

class ReadWrite
{
private:
   std::string paramFile, monteCarloFile;
   std::string inputDirectory, outputDirectory;

   CsvTable readCsv(const std::string &stem, bool required) const;

public:
   ReadWrite() {
      paramFile = "/Parameters.dat";
      monteCarloFile = "/MonteCarlo.dat";
   };

   void readParameters(Settings &settings) const;
   TableSet readTables() const;
   std::vector<Hub> readHubs() const;
   std::vector<HubPair> readArcList(const std::string &stem) const;
   MonteCarloPlan readMonteCarlo() const;

   void writeArcs(const std::vector<HubArc> &arcs) const;
   void printSolution(const OutputTable &table, const std::vector<std::string> &hubs, const std::string &directory) const;
   void printSolution(const OutputTable &table, const std::vector<std::string> &hubs) const { printSolution(table, hubs, outputDirectory); }
   void printMonteCarlo(const MonteCarloPlan &plan, const std::vector<TrialResult> &results) const;

   std::vector<std::string> split(const std::string &s) const;
   std::vector<std::string> split_csv(const std::string &s) const;

   void set_inputDirectory(const std::string &_inputDir) { inputDirectory = _inputDir; }
   void set_outputDirectory(const std::string &_outputDir) { outputDirectory = _outputDir; }
   std::string get_inputDirectory() const { return inputDirectory; }
   std::string get_outputDirectory() const { return outputDirectory; }
};
