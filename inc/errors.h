#pragma once
#include <stdexcept>
#include <string>

// a required input file, table row, technology or hub is absent
class MissingInputError : public std::runtime_error
{
public:
   explicit MissingInputError(const std::string &what) : std::runtime_error(what) {}
};

// a set, parameter or variable rule points at an identifier outside its declared set
class MalformedReferenceError : public std::runtime_error
{
public:
   explicit MalformedReferenceError(const std::string &what) : std::runtime_error(what) {}
};
