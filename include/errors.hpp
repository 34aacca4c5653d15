#pragma once
#include <stdexcept>
#include <string>

namespace vb
{
class Error : public std::runtime_error
{
public:
  explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// malformed setter input, raised before anything is mutated
class ValidationError : public Error
{
public:
  using Error::Error;
};

// an edit needs a selection in the weight list
class NoSelectionError : public Error
{
public:
  using Error::Error;
};

// an edit needs a selected row in the influence list
class NoActiveInfluenceError : public Error
{
public:
  using Error::Error;
};

// the host object could not be bound, never surfaced past set_envelope()
class BindingFailure : public Error
{
public:
  using Error::Error;
};
} // namespace vb
